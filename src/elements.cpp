/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundstation/elements.hpp>

#include <sstream>

#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::warn;

namespace groundstation {

constexpr std::size_t TLE_LINE_LENGTH = 69;

// Helper function to trim whitespace from both ends of a string
static std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

int calculateChecksum(std::string_view line) {
    int sum = 0;
    for (char c : line.substr(0, TLE_LINE_LENGTH - 1)) {
        if (c >= '0' && c <= '9') {
            sum += (c - '0');
        } else if (c == '-') {
            sum += 1;
        }
    }
    return sum % 10;
}

bool isValidElementLine(std::string_view line, char lineNumber) {
    if (line.size() != TLE_LINE_LENGTH) {
        return false;
    }
    if (line[0] != lineNumber || line[1] != ' ') {
        return false;
    }
    char last = line[TLE_LINE_LENGTH - 1];
    if (last < '0' || last > '9') {
        return false;
    }
    return calculateChecksum(line) == last - '0';
}

ElementSet ElementSet::parse(std::string_view text) {
    ElementSet set;
    set.raw_ = std::string(text);

    // Collect all non-empty lines
    std::vector<std::string> lines;
    std::istringstream stream(set.raw_);
    std::string line;
    while (std::getline(stream, line)) {
        std::string trimmed = trim(line);
        if (!trimmed.empty()) {
            lines.push_back(std::move(trimmed));
        }
    }

    // Each entry is a name line followed by line 1 and line 2. Walking by
    // element lines rather than by threes keeps one bad entry from shifting
    // every entry after it.
    for (std::size_t i = 1; i + 1 < lines.size(); ++i) {
        const auto &line1 = lines[i];
        const auto &line2 = lines[i + 1];
        if (!line1.starts_with("1 ") || !line2.starts_with("2 ")) {
            continue;
        }
        const auto &name = lines[i - 1];
        if (!isValidElementLine(line1, '1') || !isValidElementLine(line2, '2')) {
            warn("Skipping invalid TLE entry for {}", name);
            i++;
            continue;
        }
        set.entries_.push_back(TLEEntry{
            .name = name,
            .line1 = line1,
            .line2 = line2
        });
        i++;
    }

    if (set.entries_.empty()) {
        throw InvalidElementsException("No valid TLE entries found");
    }

    debug("Parsed {} TLE entries", set.entries_.size());
    return set;
}

std::optional<TLEEntry> ElementSet::find(std::string_view name) const {
    for (const auto &entry : entries_) {
        if (entry.name.starts_with(name)) {
            return entry;
        }
    }
    return std::nullopt;
}

}
