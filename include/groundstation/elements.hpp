/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDSTATION_ELEMENTS_HPP
#define __GROUNDSTATION_ELEMENTS_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace groundstation {

/**
 * Thrown when TLE text holds no usable element set.
 */
class InvalidElementsException : public std::runtime_error {
public:
    explicit InvalidElementsException(const std::string &message)
        : std::runtime_error(message) {}
};

/**
 * A single TLE entry containing the satellite name and two-line elements
 */
struct TLEEntry {
    std::string name;
    std::string line1;
    std::string line2;
};

/**
 * The orbital elements for every object in one TLE download.
 *
 * The raw text is kept alongside the parsed entries so that it can be written
 * to the cache exactly as it was received.
 */
class ElementSet {
public:
    ElementSet() = default;

    /**
     * Parse TLE text in three-line format (name, line 1, line 2).
     * Entries whose element lines are malformed or fail their checksum are
     * skipped.
     * @throws InvalidElementsException if no valid entry is found
     */
    static ElementSet parse(std::string_view text);

    const std::string& raw() const { return raw_; }
    const std::vector<TLEEntry>& entries() const { return entries_; }
    bool empty() const { return entries_.empty(); }
    std::size_t size() const { return entries_.size(); }

    /**
     * Find the first entry whose name starts with the given key.
     * Celestrak appends status markers to names (e.g. "NOAA 19 [+]"), so an
     * exact match would be too strict.
     */
    std::optional<TLEEntry> find(std::string_view name) const;

private:
    std::string raw_;
    std::vector<TLEEntry> entries_;
};

/**
 * Modulo-10 checksum of the first 68 characters of a TLE line.
 * Digits count their value, minus signs count 1.
 */
int calculateChecksum(std::string_view line);

/**
 * Checks the length, line number and checksum of an element line.
 * @param lineNumber '1' or '2'
 */
bool isValidElementLine(std::string_view line, char lineNumber);

}

#endif
