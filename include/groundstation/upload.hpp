/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDSTATION_UPLOAD_HPP
#define __GROUNDSTATION_UPLOAD_HPP

#include <groundstation/clock.hpp>

#include <chrono>
#include <filesystem>
#include <functional>
#include <string>

namespace groundstation {

class Config;

/**
 * Information sent along with a recording.
 */
struct UploadMetadata {
    int stationId = 0;
    std::string satellite;
    double latitude = 0.0;
    double longitude = 0.0;
    double gain = 0.0;
    time_point timestamp;
};

/**
 * Sends finished recordings somewhere. Implementations handle their own
 * retries; the caller only learns the final outcome.
 */
class UploadClient {
public:
    virtual ~UploadClient() = default;
    virtual bool upload(const std::filesystem::path &file, const UploadMetadata &metadata) = 0;
};

/**
 * Outcome of a single upload attempt.
 */
struct UploadAttempt {
    bool success = false;
    bool networkError = false;   ///< Could not reach the server
    long httpStatus = 0;         ///< 0 if no response was received
    std::string message;
};

struct RetryPolicy {
    int maxAttempts = 5;
    std::chrono::milliseconds delay{10000};
    int maxBackoffFactor = 4;    ///< Cap on the delay multiplier after repeated network errors
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

/**
 * Run an upload until it succeeds, the attempts run out, or the server
 * rejects it with a 4xx status. After two or more network errors in a row
 * the delay grows with the number of errors, up to maxBackoffFactor times.
 * @param attempt Called with the 1-based attempt number
 * @return true once an attempt succeeds
 */
bool uploadWithRetries(const std::function<UploadAttempt(int)> &attempt,
                       const RetryPolicy &policy,
                       const Sleeper &sleep);

/**
 * Uploads recordings as a multipart form POST with a Bearer token.
 */
class HttpUploadClient : public UploadClient {
public:
    HttpUploadClient(std::string url, std::string authToken, RetryPolicy policy = {});

    bool upload(const std::filesystem::path &file, const UploadMetadata &metadata) override;

private:
    std::string url;
    std::string authToken;
    RetryPolicy policy;

    UploadAttempt attempt(const std::filesystem::path &file, const UploadMetadata &metadata);
};

}

#endif
