/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDSTATION_FILEUTIL_HPP
#define __GROUNDSTATION_FILEUTIL_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace groundstation {

/**
 * Read a whole file into a string.
 * @throws std::system_error if the file cannot be opened or read
 */
std::string readFile(const std::filesystem::path &path);

/**
 * Replace a file so that a crash at any point leaves either the old or the new
 * content in place.
 *
 * The content is written to "<path>.tmp" and synced to disk. If keepBackup is
 * set, the current file is copied to "<path>.bak" first. Finally the temporary
 * file is renamed over the original.
 *
 * @throws std::system_error or std::filesystem::filesystem_error on failure
 */
void writeFileAtomically(const std::filesystem::path &path, std::string_view content, bool keepBackup = false);

/**
 * Append a suffix to the full file name, e.g. passes.json -> passes.json.bak
 */
std::filesystem::path withSuffix(const std::filesystem::path &path, const std::string &suffix);

}

#endif
