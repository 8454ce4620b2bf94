/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDSTATION_PASS_STORE_HPP
#define __GROUNDSTATION_PASS_STORE_HPP

#include <groundstation/pass.hpp>

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace groundstation {

/**
 * Thrown when the pass file cannot be read or is corrupt. A corrupt file has
 * already been moved aside when this is thrown.
 */
class PassStoreException : public std::runtime_error {
public:
    explicit PassStoreException(const std::string &message)
        : std::runtime_error(message) {}
};

/**
 * The persistent pass schedule: a JSON array of passes ordered by start time,
 * with at most one pass per (satellite, date, time) key.
 *
 * Every mutation rewrites the file through writeFileAtomically(), keeping the
 * previous version as "<file>.bak".
 */
class PassStore {
public:
    explicit PassStore(std::filesystem::path path) : path(std::move(path)) {}

    /**
     * Read every stored pass. A missing or blank file holds no passes.
     * @throws PassStoreException if the file is unreadable or corrupt
     */
    std::vector<Pass> loadAll() const;

    /**
     * Add passes whose key is not already stored. Stored passes win, so their
     * recorded flag survives a refresh.
     * @return The number of passes added
     */
    std::size_t merge(const std::vector<Pass> &newPasses);

    /**
     * Set the recorded flag of the pass with the given key.
     * @return false if no such pass is stored
     */
    bool markRecorded(const PassKey &key);

    /**
     * Remove every pass.
     */
    void clear();

    /**
     * Replace the stored passes, sorting them by start time.
     */
    void save(std::vector<Pass> passes);

    const std::filesystem::path& getPath() const { return path; }

private:
    std::filesystem::path path;

    [[noreturn]] void quarantine(const std::string &reason) const;
};

// JSON conversion of the pass file
std::string passesToJSON(const std::vector<Pass> &passes);

/**
 * @throws std::invalid_argument describing the first structural problem found
 */
std::vector<Pass> passesFromJSON(const std::string &json);

}

#endif
