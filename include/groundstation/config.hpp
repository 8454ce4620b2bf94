/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDSTATION_CONFIG_HPP
#define __GROUNDSTATION_CONFIG_HPP

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace CLI {
class App;
}

namespace groundstation {

// Validation ranges
constexpr int MIN_STATION_ID = 0;
constexpr int MAX_STATION_ID = 9999;
constexpr double MIN_GAIN = 0.0;
constexpr double MAX_GAIN = 50.0;
constexpr double MIN_MAX_DISTANCE = 100000.0;     // metres
constexpr double MAX_MAX_DISTANCE = 5000000.0;    // metres

constexpr auto DEFAULT_TLE_URL = "https://celestrak.org/NORAD/elements/gp.php?GROUP=noaa&FORMAT=tle";

/**
 * Thrown when the configuration is missing a required setting or a setting is
 * out of range.
 */
class ConfigException : public std::runtime_error {
public:
    explicit ConfigException(const std::string &message)
        : std::runtime_error(message) {}
};

/**
 * Ground station settings.
 *
 * Settings without a sensible default are held as std::optional and must be
 * supplied before validate() succeeds. Relative file names are resolved
 * against the save directory.
 */
class Config {
public:
    Config() = default;
    ~Config() = default;

    int getStationId() const;
    void setStationId(const int id);

    double getLatitude() const;
    void setLatitude(const double l);

    double getLongitude() const;
    void setLongitude(const double l);

    /** Altitude above sea level in metres */
    double getAltitude() const;
    void setAltitude(const double a);

    double getGain() const;
    void setGain(const double g);

    /** Satellite name to downlink frequency */
    const std::map<std::string, std::string>& getFrequencies() const;
    void addFrequency(const std::string &satellite, const std::string &frequency);
    void clearFrequencies();

    std::filesystem::path getSaveDirectory() const;
    void setSaveDirectory(const std::filesystem::path &dir);

    double getMaxDistance() const;
    void setMaxDistance(const double meters);

    int getDays() const;
    void setDays(const int days);

    double getMinimumElevation() const;
    void setMinimumElevation(const double degrees);

    int getBufferMinutes() const;
    void setBufferMinutes(const int minutes);

    std::filesystem::path getPassesFile() const;
    void setPassesFile(const std::filesystem::path &file);

    std::filesystem::path getTLECacheFile() const;
    void setTLECacheFile(const std::filesystem::path &file);

    std::string getTLEUrl() const;
    void setTLEUrl(const std::string &url);

    std::chrono::seconds getTLETimeout() const;
    void setTLETimeout(const int seconds);

    std::filesystem::path getLogFile() const;
    void setLogFile(const std::filesystem::path &file);

    std::filesystem::path getRecordingsDirectory() const;

    std::string getRtlFmPath() const;
    void setRtlFmPath(const std::string &path);

    std::string getSoxPath() const;
    void setSoxPath(const std::string &path);

    std::string getSampleRate() const;
    void setSampleRate(const std::string &rate);

    int getDownsampleRate() const;
    void setDownsampleRate(const int rate);

    bool getDownsample() const;
    void setDownsample(const bool enabled);

    bool hasUpload() const;
    std::string getUploadUrl() const;
    void setUploadUrl(const std::string &url);
    std::string getAuthToken() const;
    void setAuthToken(const std::string &token);

    int getRefreshHour() const;
    void setRefreshHour(const int hour);

    bool getBestPassTimer() const;
    void setBestPassTimer(const bool enabled);

    int getStatusIntervalSeconds() const;
    void setStatusIntervalSeconds(const int seconds);

    bool getVerbose() const;
    void setVerbose(bool);

    /**
     * Check that every required setting is present and in range.
     * @throws ConfigException listing every problem found
     */
    void validate() const;

private:
    std::optional<int> stationId;
    std::optional<double> latitude;
    std::optional<double> longitude;
    double altitude = 0.0;
    std::optional<double> gain;
    std::map<std::string, std::string> frequencies;
    std::optional<std::filesystem::path> saveDirectory;
    double maxDistance = 2200000.0;
    int days = 1;
    double minimumElevation = 30.0;
    int bufferMinutes = 0;
    std::filesystem::path passesFile = "passes.json";
    std::filesystem::path tleCacheFile = "tle_cache.json";
    std::string tleUrl = DEFAULT_TLE_URL;
    int tleTimeoutSeconds = 10;
    std::filesystem::path logFile = "groundstation.log";
    std::string rtlFmPath = "rtl_fm";
    std::string soxPath = "sox";
    std::string sampleRate = "48k";
    int downsampleRate = 11025;
    bool downsample = true;
    std::optional<std::string> uploadUrl;
    std::optional<std::string> authToken;
    int refreshHour = 17;
    bool bestPassTimer = false;
    int statusIntervalSeconds = 300;
    bool verbose = false;

    std::filesystem::path resolve(const std::filesystem::path &file) const;
};

/** Replace ~ with HOME directory */
std::string expandTilde(const std::string &path);

/**
 * Parse a "NAME=FREQUENCY" setting, e.g. "NOAA 19=137.1M".
 * @throws std::invalid_argument if either side is empty
 */
std::pair<std::string, std::string> parseFrequency(const std::string_view &setting);

/**
 * Register every configuration option, and the --config file option, on a
 * CLI11 application. Parsed values are written into the given Config.
 */
void addConfigOptions(CLI::App &app, Config &config, const std::string &defaultConfigFile);

}

#endif
