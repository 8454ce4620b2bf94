/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <groundstation/disk.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

namespace groundstation {
namespace {

namespace fs = std::filesystem;
using namespace std::chrono;

class DiskJanitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() /
            ("groundstation-disk-" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir);
        fs::create_directories(dir);
    }

    void TearDown() override {
        fs::remove_all(dir);
    }

    // Create a file that was last written the given number of hours ago
    fs::path touch(const std::string &name, int hoursAgo) {
        auto path = dir / name;
        std::ofstream(path) << "RIFF";
        fs::last_write_time(path, fs::file_time_type::clock::now() - hours(hoursAgo));
        return path;
    }

    fs::path dir;
};

TEST_F(DiskJanitorTest, DeletesOldestRecordings) {
    auto oldest = touch("NOAA_19-2026-10-16T14-03-00Z.wav", 72);
    auto older = touch("NOAA_18-2026-10-17T09-41-00Z.wav", 48);
    auto newer = touch("NOAA_15-2026-10-18T20-12-00Z.wav", 24);
    auto newest = touch("NOAA_19-2026-10-19T13-55-00Z.wav", 1);

    DiskJanitor janitor(dir);
    EXPECT_EQ(janitor.deleteOldestRecordings(2), 2);

    EXPECT_FALSE(fs::exists(oldest));
    EXPECT_FALSE(fs::exists(older));
    EXPECT_TRUE(fs::exists(newer));
    EXPECT_TRUE(fs::exists(newest));
}

TEST_F(DiskJanitorTest, OnlyRecordingsAreDeleted) {
    auto passes = touch("passes.json", 100);
    auto log = touch("groundstation.log", 90);
    auto recording = touch("NOAA_19-2026-10-19T13-55-00Z.wav", 1);

    DiskJanitor janitor(dir);
    EXPECT_EQ(janitor.deleteOldestRecordings(2), 1);

    EXPECT_TRUE(fs::exists(passes));
    EXPECT_TRUE(fs::exists(log));
    EXPECT_FALSE(fs::exists(recording));
}

TEST_F(DiskJanitorTest, MissingDirectory) {
    DiskJanitor janitor(dir / "missing");
    EXPECT_EQ(janitor.check(), 0);
    EXPECT_EQ(janitor.deleteOldestRecordings(2), 0);
}

TEST_F(DiskJanitorTest, EnoughFreeSpace) {
    auto recording = touch("NOAA_19-2026-10-19T13-55-00Z.wav", 1);

    // No volume is ever less than 0% free
    DiskJanitor janitor(dir, 0.0);
    EXPECT_EQ(janitor.check(), 0);
    EXPECT_TRUE(fs::exists(recording));
}

TEST_F(DiskJanitorTest, LowFreeSpace) {
    touch("a.wav", 3);
    touch("b.wav", 2);
    touch("c.wav", 1);

    // Every volume is less than 101% free
    DiskJanitor janitor(dir, 101.0, 2);
    EXPECT_EQ(janitor.check(), 2);
    EXPECT_TRUE(fs::exists(dir / "c.wav"));
}

}
}
