/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDSTATION_CLOCK_HPP
#define __GROUNDSTATION_CLOCK_HPP

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace groundstation {

using time_point = std::chrono::system_clock::time_point;

/**
 * Source of the current wall-clock time. Components take one of these so tests
 * can run them against a simulated clock.
 */
using Clock = std::function<time_point()>;

inline time_point systemNow() {
    return std::chrono::system_clock::now();
}

/**
 * Formats a time as ISO-8601 UTC with millisecond precision.
 * Example: 2026-10-19T14:03:00.000Z
 */
std::string formatTimestamp(time_point tp);

/**
 * Parses a timestamp written by formatTimestamp(). Seconds may omit the
 * fractional part.
 */
std::optional<time_point> parseTimestamp(std::string_view text);

/**
 * Formats a time for use inside a file name (no colons).
 * Example: 2026-10-19T14-03-00Z
 */
std::string formatFileTimestamp(time_point tp);

}

#endif
