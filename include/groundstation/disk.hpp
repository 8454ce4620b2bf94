/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDSTATION_DISK_HPP
#define __GROUNDSTATION_DISK_HPP

#include <cstddef>
#include <filesystem>

namespace groundstation {

/**
 * Keeps the recordings volume from filling up by deleting the oldest
 * recordings when free space runs low.
 */
class DiskJanitor {
public:
    explicit DiskJanitor(std::filesystem::path directory,
                         double minimumFreePercent = 10.0,
                         std::size_t deleteCount = 2)
        : directory(std::move(directory)),
          minimumFreePercent(minimumFreePercent),
          deleteCount(deleteCount) {}

    /**
     * Check free space and delete old recordings if it is below the limit.
     * @return The number of files deleted
     */
    std::size_t check();

    /**
     * Delete the oldest .wav files in the directory.
     * @return The number of files deleted
     */
    std::size_t deleteOldestRecordings(std::size_t count);

private:
    std::filesystem::path directory;
    double minimumFreePercent;
    std::size_t deleteCount;
};

}

#endif
