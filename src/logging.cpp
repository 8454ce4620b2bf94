/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundstation/logging.hpp>
#include <groundstation/config.hpp>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace fs = std::filesystem;

namespace groundstation {

static std::shared_ptr<spdlog::sinks::sink> openLogFile(const fs::path &path) {
    try {
        fs::create_directories(path.parent_path());
        return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            path.string(), LOG_FILE_MAX_SIZE, LOG_FILE_MAX_FILES);
    } catch (const spdlog::spdlog_ex &e) {
        std::cerr << "Cannot open log file " << path << ": " << e.what() << std::endl;
    } catch (const fs::filesystem_error &e) {
        std::cerr << "Cannot create log directory " << path.parent_path() << ": " << e.what() << std::endl;
    }
    return nullptr;
}

std::optional<fs::path> initLogging(const Config &config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    std::optional<fs::path> logFile;
    fs::path primary = config.getLogFile();
    if (auto sink = openLogFile(primary)) {
        sinks.push_back(sink);
        logFile = primary;
    } else if (const char *home = std::getenv("HOME")) {
        fs::path fallback = fs::path(home) / ".groundstation" / primary.filename();
        if (auto fallbackSink = openLogFile(fallback)) {
            sinks.push_back(fallbackSink);
            logFile = fallback;
        }
    }

    auto logger = std::make_shared<spdlog::logger>("groundstation", sinks.begin(), sinks.end());
    logger->set_level(config.getVerbose() ? spdlog::level::debug : spdlog::level::info);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
    spdlog::flush_every(std::chrono::seconds(5));

    if (logFile) {
        spdlog::info("Logging to {}", logFile->string());
    } else {
        spdlog::warn("No writable log file, logging to the console only");
    }
    return logFile;
}

}
