/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundstation/pass.hpp>

#include <sstream>

#include <date/date.h>

namespace groundstation {

PassKey Pass::key() const {
    return PassKey{
        .satellite = satellite,
        .date = formatPassDate(start),
        .time = formatPassTime(start)
    };
}

std::string formatPassDate(time_point tp) {
    return date::format("%d %b %Y", std::chrono::floor<date::days>(tp));
}

std::string formatPassTime(time_point tp) {
    return date::format("%H:%M", std::chrono::floor<std::chrono::minutes>(tp));
}

std::optional<time_point> parsePassStart(const std::string &dateText, const std::string &timeText) {
    std::istringstream in(dateText + " " + timeText);
    date::sys_time<std::chrono::minutes> tp;
    in >> date::parse("%d %b %Y %H:%M", tp);
    if (in.fail()) {
        return std::nullopt;
    }
    return tp;
}

}
