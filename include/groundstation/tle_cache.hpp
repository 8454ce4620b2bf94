/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDSTATION_TLE_CACHE_HPP
#define __GROUNDSTATION_TLE_CACHE_HPP

#include <groundstation/celestrak.hpp>
#include <groundstation/clock.hpp>
#include <groundstation/elements.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace groundstation {

/** Cached elements older than this are never used. */
constexpr std::chrono::days TLE_CACHE_MAX_AGE{7};

/**
 * Thrown when TLE data can be neither downloaded nor loaded from the cache.
 */
class TleUnavailableException : public std::runtime_error {
public:
    explicit TleUnavailableException(const std::string &message)
        : std::runtime_error(message) {}
};

/**
 * Cached TLE text and when it was downloaded.
 */
struct TleCacheEntry {
    time_point timestamp;
    std::string data;
};

/**
 * Downloads orbital elements, falling back to the last download when the
 * network is unavailable.
 *
 * The cache file is a JSON object {"timestamp": "<ISO-8601>", "data": "<TLE text>"}.
 */
class TleCache {
public:
    TleCache(TleSource &source, std::filesystem::path cachePath, Clock clock = systemNow)
        : source(source), cachePath(std::move(cachePath)), clock(std::move(clock)) {}

    /**
     * Download the current elements, or load them from the cache if the
     * network is down.
     * @param networkAvailable false to skip the download and go straight to the cache
     * @throws TleUnavailableException if there is no network and no usable cache
     * @throws InvalidElementsException if a download holds no valid elements
     * @throws std::runtime_error if the download fails for a non-network reason
     */
    ElementSet fetchElements(bool networkAvailable = true);

    /**
     * Load the cache if it is present, valid and fresh. Corrupt caches are
     * deleted.
     */
    std::optional<TleCacheEntry> load();

    /**
     * Write the cache. Failures are logged, not thrown.
     * @return true if the cache was written
     */
    bool save(const std::string &data);

    const std::filesystem::path& getPath() const { return cachePath; }

private:
    TleSource &source;
    std::filesystem::path cachePath;
    Clock clock;

    ElementSet loadFallback();
    void discard(const std::string &reason);
};

}

#endif
