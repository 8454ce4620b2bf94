/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDSTATION_LOGGING_HPP
#define __GROUNDSTATION_LOGGING_HPP

#include <cstddef>
#include <filesystem>
#include <optional>

namespace groundstation {

class Config;

constexpr std::size_t LOG_FILE_MAX_SIZE = 5 * 1024 * 1024;
constexpr std::size_t LOG_FILE_MAX_FILES = 3;

/**
 * Install the default logger: colored console output plus a rotating log
 * file. If the configured log file cannot be opened, ~/.groundstation is
 * tried instead, and if that fails too only the console is used.
 * @return The log file in use, if any
 */
std::optional<std::filesystem::path> initLogging(const Config &config);

}

#endif
