/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundstation/clock.hpp>

#include <sstream>

#include <date/date.h>

namespace groundstation {

std::string formatTimestamp(time_point tp) {
    using namespace std::chrono;
    return date::format("%FT%TZ", floor<milliseconds>(tp));
}

std::optional<time_point> parseTimestamp(std::string_view text) {
    using namespace std::chrono;

    std::istringstream in{std::string(text)};
    date::sys_time<milliseconds> tp;
    in >> date::parse("%FT%TZ", tp);
    if (in.fail()) {
        return std::nullopt;
    }

    // Reject trailing garbage
    in.peek();
    if (!in.eof()) {
        return std::nullopt;
    }
    return time_point_cast<system_clock::duration>(tp);
}

std::string formatFileTimestamp(time_point tp) {
    using namespace std::chrono;
    return date::format("%Y-%m-%dT%H-%M-%SZ", floor<seconds>(tp));
}

}
