/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDSTATION_CELESTRAK_HPP
#define __GROUNDSTATION_CELESTRAK_HPP

#include <chrono>
#include <stdexcept>
#include <string>

namespace groundstation {

/**
 * Thrown when a download fails because the network is unavailable: DNS
 * failure, refused connection, timeout or a dropped connection. Other
 * download failures are reported as std::runtime_error.
 */
class NetworkException : public std::runtime_error {
public:
    explicit NetworkException(const std::string &message)
        : std::runtime_error(message) {}
};

/**
 * A place TLE text can be downloaded from.
 */
class TleSource {
public:
    virtual ~TleSource() = default;

    /**
     * @return The raw TLE text
     * @throws NetworkException for network failures
     * @throws std::runtime_error for any other failure
     */
    virtual std::string fetch() = 0;
};

/**
 * Downloads TLE text over HTTP(S), by default from Celestrak's GP service.
 * Documentation: https://celestrak.org/NORAD/documentation/gp-data-formats.php
 */
class CelestrakSource : public TleSource {
public:
    CelestrakSource(std::string url, std::chrono::seconds timeout)
        : url(std::move(url)), timeout(timeout) {}

    std::string fetch() override;

    const std::string& getUrl() const { return url; }

private:
    std::string url;
    std::chrono::seconds timeout;
};

/**
 * Whether a libcurl result code means the network could not be reached.
 */
bool isNetworkError(int curlCode);

}

#endif
