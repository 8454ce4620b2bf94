/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <groundstation/config.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include <CLI/CLI.hpp>

namespace groundstation {
namespace {

namespace fs = std::filesystem;

Config validConfig() {
    Config config;
    config.setStationId(42);
    config.setLatitude(35.2);
    config.setLongitude(-80.8);
    config.setGain(38.0);
    config.addFrequency("NOAA 19", "137.1M");
    config.setSaveDirectory("/var/lib/groundstation");
    return config;
}

// ============================================================================
// Frequency Setting Tests
// ============================================================================

TEST(ParseFrequencyTest, NameWithSpaces) {
    auto [name, frequency] = parseFrequency("NOAA 19=137.1M");
    EXPECT_EQ(name, "NOAA 19");
    EXPECT_EQ(frequency, "137.1M");
}

TEST(ParseFrequencyTest, TrimsWhitespace) {
    auto [name, frequency] = parseFrequency("  METEOR-M 2 = 137.9M ");
    EXPECT_EQ(name, "METEOR-M 2");
    EXPECT_EQ(frequency, "137.9M");
}

TEST(ParseFrequencyTest, SplitsOnLastEquals) {
    auto [name, frequency] = parseFrequency("A=B=137.5M");
    EXPECT_EQ(name, "A=B");
    EXPECT_EQ(frequency, "137.5M");
}

TEST(ParseFrequencyTest, Invalid) {
    EXPECT_THROW(parseFrequency("NOAA 19"), std::invalid_argument);
    EXPECT_THROW(parseFrequency("=137.1M"), std::invalid_argument);
    EXPECT_THROW(parseFrequency("NOAA 19="), std::invalid_argument);
}

// ============================================================================
// Validation Tests
// ============================================================================

TEST(ConfigValidationTest, ValidConfig) {
    EXPECT_NO_THROW(validConfig().validate());
}

TEST(ConfigValidationTest, EmptyConfigListsEveryProblem) {
    Config config;
    try {
        config.validate();
        FAIL() << "Expected ConfigException";
    } catch (const ConfigException &e) {
        std::string message = e.what();
        EXPECT_NE(message.find("station_id"), std::string::npos);
        EXPECT_NE(message.find("lat"), std::string::npos);
        EXPECT_NE(message.find("long"), std::string::npos);
        EXPECT_NE(message.find("gain"), std::string::npos);
        EXPECT_NE(message.find("frequency"), std::string::npos);
        EXPECT_NE(message.find("save_dir"), std::string::npos);
    }
}

TEST(ConfigValidationTest, StationIdRange) {
    auto config = validConfig();
    config.setStationId(10000);
    EXPECT_THROW(config.validate(), ConfigException);
    config.setStationId(9999);
    EXPECT_NO_THROW(config.validate());
}

TEST(ConfigValidationTest, GainRange) {
    auto config = validConfig();
    config.setGain(50.1);
    EXPECT_THROW(config.validate(), ConfigException);
    config.setGain(0.0);
    EXPECT_NO_THROW(config.validate());
}

TEST(ConfigValidationTest, MaxDistanceRange) {
    auto config = validConfig();
    config.setMaxDistance(99999.0);
    EXPECT_THROW(config.validate(), ConfigException);
    config.setMaxDistance(5000001.0);
    EXPECT_THROW(config.validate(), ConfigException);
    config.setMaxDistance(5000000.0);
    EXPECT_NO_THROW(config.validate());
}

TEST(ConfigValidationTest, LatitudeRange) {
    auto config = validConfig();
    config.setLatitude(-91.0);
    EXPECT_THROW(config.validate(), ConfigException);
}

TEST(ConfigValidationTest, UploadNeedsToken) {
    auto config = validConfig();
    config.setUploadUrl("https://example.org/upload");
    EXPECT_THROW(config.validate(), ConfigException);
    config.setAuthToken("secret");
    EXPECT_NO_THROW(config.validate());
    EXPECT_TRUE(config.hasUpload());
}

// ============================================================================
// Default and Derived Value Tests
// ============================================================================

TEST(ConfigTest, Defaults) {
    Config config;
    EXPECT_DOUBLE_EQ(config.getMaxDistance(), 2200000.0);
    EXPECT_EQ(config.getDays(), 1);
    EXPECT_DOUBLE_EQ(config.getMinimumElevation(), 30.0);
    EXPECT_EQ(config.getBufferMinutes(), 0);
    EXPECT_EQ(config.getTLEUrl(), DEFAULT_TLE_URL);
    EXPECT_EQ(config.getTLETimeout(), std::chrono::seconds(10));
    EXPECT_EQ(config.getSampleRate(), "48k");
    EXPECT_EQ(config.getDownsampleRate(), 11025);
    EXPECT_TRUE(config.getDownsample());
    EXPECT_EQ(config.getRefreshHour(), 17);
    EXPECT_FALSE(config.getBestPassTimer());
    EXPECT_FALSE(config.hasUpload());
}

TEST(ConfigTest, DaysAreClamped) {
    Config config;
    config.setDays(30);
    EXPECT_EQ(config.getDays(), 10);
    config.setDays(0);
    EXPECT_EQ(config.getDays(), 1);
    config.setDays(3);
    EXPECT_EQ(config.getDays(), 3);
}

TEST(ConfigTest, FilesResolveAgainstSaveDirectory) {
    auto config = validConfig();
    EXPECT_EQ(config.getPassesFile(), fs::path("/var/lib/groundstation/passes.json"));
    EXPECT_EQ(config.getTLECacheFile(), fs::path("/var/lib/groundstation/tle_cache.json"));
    EXPECT_EQ(config.getLogFile(), fs::path("/var/lib/groundstation/groundstation.log"));
    EXPECT_EQ(config.getRecordingsDirectory(), fs::path("/var/lib/groundstation/recordings"));

    config.setPassesFile("/tmp/passes.json");
    EXPECT_EQ(config.getPassesFile(), fs::path("/tmp/passes.json"));
}

TEST(ConfigTest, ExpandTilde) {
    const char *home = std::getenv("HOME");
    if (home) {
        EXPECT_EQ(expandTilde("~/recordings"), std::string(home) + "/recordings");
    }
    EXPECT_EQ(expandTilde("/srv/recordings"), "/srv/recordings");
    EXPECT_EQ(expandTilde(""), "");
}

// ============================================================================
// Command Line and Config File Tests
// ============================================================================

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() /
            ("groundstation-config-" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir);
        fs::create_directories(dir);
        addConfigOptions(app, config, (dir / "missing.toml").string());
    }

    void TearDown() override {
        fs::remove_all(dir);
    }

    fs::path writeConfig(const std::string &content) {
        auto file = dir / "groundstation.toml";
        std::ofstream out(file);
        out << content;
        return file;
    }

    fs::path dir;
    Config config;
    CLI::App app{"Groundstation"};
};

TEST_F(ConfigFileTest, CommandLine) {
    app.parse("--station_id 7 --lat 35.2 --long -80.8 --gain 40 --save_dir /srv/gs "
              "--frequency \"NOAA 19=137.1M\" --frequency \"NOAA 18=137.9125M\" "
              "--buffer_minutes 2 -v", false);

    EXPECT_EQ(config.getStationId(), 7);
    EXPECT_DOUBLE_EQ(config.getLatitude(), 35.2);
    EXPECT_DOUBLE_EQ(config.getLongitude(), -80.8);
    EXPECT_DOUBLE_EQ(config.getGain(), 40.0);
    EXPECT_EQ(config.getSaveDirectory(), fs::path("/srv/gs"));
    EXPECT_EQ(config.getBufferMinutes(), 2);
    EXPECT_TRUE(config.getVerbose());

    auto &frequencies = config.getFrequencies();
    ASSERT_EQ(frequencies.size(), 2);
    EXPECT_EQ(frequencies.at("NOAA 19"), "137.1M");
    EXPECT_EQ(frequencies.at("NOAA 18"), "137.9125M");
    EXPECT_NO_THROW(config.validate());
}

TEST_F(ConfigFileTest, TomlFile) {
    auto file = writeConfig(
        "station_id = 12\n"
        "lat = 51.5\n"
        "long = -0.12\n"
        "alt = 35\n"
        "gain = 38.6\n"
        "save_dir = \"/srv/groundstation\"\n"
        "frequency = [\"NOAA 15=137.62M\", \"NOAA 19=137.1M\"]\n"
        "min_elevation = 25\n"
        "days = 2\n"
        "downsample = false\n"
        "upload_url = \"https://example.org/upload\"\n"
        "auth_token = \"secret\"\n");

    app.parse("--config " + file.string(), false);

    EXPECT_EQ(config.getStationId(), 12);
    EXPECT_DOUBLE_EQ(config.getLatitude(), 51.5);
    EXPECT_DOUBLE_EQ(config.getAltitude(), 35.0);
    EXPECT_DOUBLE_EQ(config.getMinimumElevation(), 25.0);
    EXPECT_EQ(config.getDays(), 2);
    EXPECT_FALSE(config.getDownsample());
    EXPECT_EQ(config.getFrequencies().size(), 2);
    EXPECT_EQ(config.getAuthToken(), "secret");
    EXPECT_TRUE(config.hasUpload());
    EXPECT_NO_THROW(config.validate());
}

TEST_F(ConfigFileTest, CommandLineOverridesFile) {
    auto file = writeConfig("station_id = 12\n");
    app.parse("--config " + file.string() + " --station_id 99", false);
    EXPECT_EQ(config.getStationId(), 99);
}

TEST_F(ConfigFileTest, BadFrequencyIsRejected) {
    EXPECT_THROW(app.parse("--frequency NOAA19", false), CLI::ParseError);
}

TEST_F(ConfigFileTest, MissingDefaultFileIsIgnored) {
    EXPECT_NO_THROW(app.parse("--station_id 1", false));
    EXPECT_EQ(config.getStationId(), 1);
}

}
}
