/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDSTATION_PASS_HPP
#define __GROUNDSTATION_PASS_HPP

#include <groundstation/clock.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace groundstation {

/**
 * Identifies a pass: the satellite and the UTC date and minute it starts.
 */
struct PassKey {
    std::string satellite;
    std::string date;   ///< "19 Oct 2026"
    std::string time;   ///< "14:03"

    bool operator==(const PassKey&) const = default;
};

/**
 * A window during which an object is in view of the ground station.
 */
struct Pass {
    std::string satellite;          ///< Catalog name used to look up the elements
    std::string frequency;          ///< Downlink frequency as passed to the demodulator, e.g. "137.1M"
    time_point start;               ///< Buffered start time (UTC, minute aligned)
    int durationInMinutes = 0;      ///< Buffered duration
    double maxElevation = 0.0;      ///< Degrees
    double avgElevation = 0.0;      ///< Degrees
    double minDistance = 0.0;       ///< Metres from sub-point to observer
    double avgDistance = 0.0;       ///< Metres from sub-point to observer
    bool recorded = false;

    time_point end() const {
        return start + std::chrono::minutes(durationInMinutes);
    }

    PassKey key() const;
};

// Date and time fields as stored in the pass file
std::string formatPassDate(time_point tp);
std::string formatPassTime(time_point tp);

/**
 * Combines stored date and time fields back into a time_point.
 */
std::optional<time_point> parsePassStart(const std::string &date, const std::string &time);

}

#endif
