/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundstation/disk.hpp>

#include <algorithm>
#include <system_error>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

using spdlog::error;
using spdlog::info;

namespace fs = std::filesystem;

namespace groundstation {

std::size_t DiskJanitor::check() {
    std::error_code ec;
    if (!fs::exists(directory, ec)) {
        return 0;
    }

    auto space = fs::space(directory, ec);
    if (ec) {
        error("Error checking disk space on {}: {}", directory.string(), ec.message());
        return 0;
    }
    if (space.capacity == 0) {
        return 0;
    }

    double percentFree = static_cast<double>(space.available) / static_cast<double>(space.capacity) * 100.0;
    info("Disk space on {}: {} bytes free, or {:.2f}%", directory.string(), space.available, percentFree);

    if (percentFree >= minimumFreePercent) {
        return 0;
    }

    info("Less than {}% free space on {}. Deleting oldest {} recordings...",
         minimumFreePercent, directory.string(), deleteCount);
    return deleteOldestRecordings(deleteCount);
}

std::size_t DiskJanitor::deleteOldestRecordings(std::size_t count) {
    std::vector<std::pair<fs::file_time_type, fs::path>> recordings;

    std::error_code ec;
    fs::directory_iterator files(directory, ec);
    if (ec) {
        error("Error listing {}: {}", directory.string(), ec.message());
        return 0;
    }
    for (; files != fs::directory_iterator(); files.increment(ec)) {
        const auto &entry = *files;
        std::error_code entryError;
        if (entry.is_regular_file(entryError) && entry.path().extension() == ".wav") {
            auto modified = entry.last_write_time(entryError);
            if (!entryError) {
                recordings.emplace_back(modified, entry.path());
            }
        }
    }
    if (ec) {
        error("Error listing {}: {}", directory.string(), ec.message());
    }

    std::sort(recordings.begin(), recordings.end());

    std::size_t deleted = 0;
    for (const auto &[modified, path] : recordings) {
        if (deleted >= count) {
            break;
        }
        if (fs::remove(path, ec)) {
            info("Deleted file: {}", path.string());
            deleted++;
        } else if (ec) {
            error("Error deleting {}: {}", path.string(), ec.message());
        }
    }
    return deleted;
}

}
