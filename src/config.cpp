/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundstation/config.hpp>

#include <cstdlib>
#include <vector>

#include <CLI/CLI.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

namespace groundstation {

std::string expandTilde(const std::string &path) {
    if (!path.empty() && path[0] == '~') {
        const char *home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

int Config::getStationId() const {
    return stationId.value_or(0);
}

void Config::setStationId(const int id) {
    stationId = id;
}

double Config::getLatitude() const {
    return latitude.value_or(0.0);
}

void Config::setLatitude(const double l) {
    latitude = l;
}

double Config::getLongitude() const {
    return longitude.value_or(0.0);
}

void Config::setLongitude(const double l) {
    longitude = l;
}

double Config::getAltitude() const {
    return altitude;
}

void Config::setAltitude(const double a) {
    altitude = a;
}

double Config::getGain() const {
    return gain.value_or(0.0);
}

void Config::setGain(const double g) {
    gain = g;
}

const std::map<std::string, std::string>& Config::getFrequencies() const {
    return frequencies;
}

void Config::addFrequency(const std::string &satellite, const std::string &frequency) {
    frequencies[satellite] = frequency;
}

void Config::clearFrequencies() {
    frequencies.clear();
}

std::filesystem::path Config::getSaveDirectory() const {
    return saveDirectory.value_or(".");
}

void Config::setSaveDirectory(const std::filesystem::path &dir) {
    saveDirectory = dir;
}

double Config::getMaxDistance() const {
    return maxDistance;
}

void Config::setMaxDistance(const double meters) {
    maxDistance = meters;
}

int Config::getDays() const {
    return days;
}

void Config::setDays(const int d) {
    if (d > 0 && d <= 10) {
        days = d;
    } else if (d > 10) {
        days = 10;
    } else {
        days = 1;
    }
}

double Config::getMinimumElevation() const {
    return minimumElevation;
}

void Config::setMinimumElevation(const double degrees) {
    minimumElevation = degrees;
}

int Config::getBufferMinutes() const {
    return bufferMinutes;
}

void Config::setBufferMinutes(const int minutes) {
    bufferMinutes = minutes;
}

std::filesystem::path Config::resolve(const std::filesystem::path &file) const {
    if (file.is_absolute()) {
        return file;
    }
    return getSaveDirectory() / file;
}

std::filesystem::path Config::getPassesFile() const {
    return resolve(passesFile);
}

void Config::setPassesFile(const std::filesystem::path &file) {
    passesFile = file;
}

std::filesystem::path Config::getTLECacheFile() const {
    return resolve(tleCacheFile);
}

void Config::setTLECacheFile(const std::filesystem::path &file) {
    tleCacheFile = file;
}

std::string Config::getTLEUrl() const {
    return tleUrl;
}

void Config::setTLEUrl(const std::string &url) {
    tleUrl = url;
}

std::chrono::seconds Config::getTLETimeout() const {
    return std::chrono::seconds(tleTimeoutSeconds);
}

void Config::setTLETimeout(const int seconds) {
    tleTimeoutSeconds = seconds;
}

std::filesystem::path Config::getLogFile() const {
    return resolve(logFile);
}

void Config::setLogFile(const std::filesystem::path &file) {
    logFile = file;
}

std::filesystem::path Config::getRecordingsDirectory() const {
    return getSaveDirectory() / "recordings";
}

std::string Config::getRtlFmPath() const {
    return rtlFmPath;
}

void Config::setRtlFmPath(const std::string &path) {
    rtlFmPath = path;
}

std::string Config::getSoxPath() const {
    return soxPath;
}

void Config::setSoxPath(const std::string &path) {
    soxPath = path;
}

std::string Config::getSampleRate() const {
    return sampleRate;
}

void Config::setSampleRate(const std::string &rate) {
    sampleRate = rate;
}

int Config::getDownsampleRate() const {
    return downsampleRate;
}

void Config::setDownsampleRate(const int rate) {
    downsampleRate = rate;
}

bool Config::getDownsample() const {
    return downsample;
}

void Config::setDownsample(const bool enabled) {
    downsample = enabled;
}

bool Config::hasUpload() const {
    return uploadUrl.has_value() && !uploadUrl->empty();
}

std::string Config::getUploadUrl() const {
    return uploadUrl.value_or("");
}

void Config::setUploadUrl(const std::string &url) {
    uploadUrl = url;
}

std::string Config::getAuthToken() const {
    return authToken.value_or("");
}

void Config::setAuthToken(const std::string &token) {
    authToken = token;
}

int Config::getRefreshHour() const {
    return refreshHour;
}

void Config::setRefreshHour(const int hour) {
    refreshHour = hour;
}

bool Config::getBestPassTimer() const {
    return bestPassTimer;
}

void Config::setBestPassTimer(const bool enabled) {
    bestPassTimer = enabled;
}

int Config::getStatusIntervalSeconds() const {
    return statusIntervalSeconds;
}

void Config::setStatusIntervalSeconds(const int seconds) {
    statusIntervalSeconds = seconds;
}

bool Config::getVerbose() const {
    return verbose;
}

void Config::setVerbose(bool v) {
    verbose = v;
}

void Config::validate() const {
    std::vector<std::string> problems;

    auto checkRange = [&problems](const char *name, double value, double min, double max) {
        if (value < min || value > max) {
            problems.push_back(fmt::format("{} must be between {} and {} (got {})", name, min, max, value));
        }
    };

    if (!stationId) {
        problems.emplace_back("station_id is required");
    } else {
        checkRange("station_id", *stationId, MIN_STATION_ID, MAX_STATION_ID);
    }

    if (!latitude) {
        problems.emplace_back("lat is required");
    } else {
        checkRange("lat", *latitude, -90.0, 90.0);
    }

    if (!longitude) {
        problems.emplace_back("long is required");
    } else {
        checkRange("long", *longitude, -180.0, 180.0);
    }

    if (!gain) {
        problems.emplace_back("gain is required");
    } else {
        checkRange("gain", *gain, MIN_GAIN, MAX_GAIN);
    }

    if (frequencies.empty()) {
        problems.emplace_back("at least one frequency is required");
    }

    if (!saveDirectory || saveDirectory->empty()) {
        problems.emplace_back("save_dir is required");
    }

    checkRange("max_distance", maxDistance, MIN_MAX_DISTANCE, MAX_MAX_DISTANCE);
    checkRange("min_elevation", minimumElevation, 0.0, 90.0);
    checkRange("refresh_hour", refreshHour, 0, 23);

    if (bufferMinutes < 0) {
        problems.emplace_back("buffer_minutes must not be negative");
    }
    if (tleTimeoutSeconds <= 0) {
        problems.emplace_back("tle_timeout must be positive");
    }
    if (downsampleRate <= 0) {
        problems.emplace_back("downsample_rate must be positive");
    }
    if (statusIntervalSeconds <= 0) {
        problems.emplace_back("status_interval must be positive");
    }
    if (uploadUrl && !uploadUrl->empty() && !authToken) {
        problems.emplace_back("auth_token is required when upload_url is set");
    }

    if (!problems.empty()) {
        throw ConfigException("Invalid configuration: " + fmt::format("{}", fmt::join(problems, "; ")));
    }
}

std::pair<std::string, std::string> parseFrequency(const std::string_view &setting) {
    auto pos = setting.rfind('=');
    if (pos == std::string_view::npos) {
        throw std::invalid_argument("Frequency must be NAME=FREQUENCY: " + std::string(setting));
    }

    auto trim = [](std::string_view s) {
        auto start = s.find_first_not_of(" \t");
        if (start == std::string_view::npos) {
            return std::string();
        }
        auto end = s.find_last_not_of(" \t");
        return std::string(s.substr(start, end - start + 1));
    };

    auto name = trim(setting.substr(0, pos));
    auto frequency = trim(setting.substr(pos + 1));
    if (name.empty() || frequency.empty()) {
        throw std::invalid_argument("Frequency must be NAME=FREQUENCY: " + std::string(setting));
    }
    return {name, frequency};
}

void addConfigOptions(CLI::App &app, Config &config, const std::string &defaultConfigFile) {
    app.set_config("--config", defaultConfigFile,
        "Read configuration from this file (default: " + defaultConfigFile + ").");

    app.add_option_function<int>("--station_id",
        [&config](const int id) { config.setStationId(id); },
        "Identifier of this ground station (0-9999)");
    app.add_option_function<double>("--lat",
        [&config](const double l) { config.setLatitude(l); },
        "The latitude of the ground station (in decimal format)");
    app.add_option_function<double>("--long",
        [&config](const double l) { config.setLongitude(l); },
        "The longitude of the ground station (in decimal format)");
    app.add_option_function<double>("--alt",
        [&config](const double a) { config.setAltitude(a); },
        "Altitude above sea level in meters");
    app.add_option_function<double>("--gain",
        [&config](const double g) { config.setGain(g); },
        "Receiver gain in dB (0-50)");
    app.add_option_function<std::vector<std::string>>("--frequency",
        [&config](const std::vector<std::string> &settings) {
            for (const auto &setting : settings) {
                try {
                    auto [name, frequency] = parseFrequency(setting);
                    config.addFrequency(name, frequency);
                } catch (const std::invalid_argument &e) {
                    throw CLI::ValidationError("--frequency", e.what());
                }
            }
        },
        "Satellite to record and its frequency, as NAME=FREQUENCY (ie. \"NOAA 19=137.1M\")");
    app.add_option_function<std::string>("--save_dir",
        [&config](const std::string &dir) { config.setSaveDirectory(expandTilde(dir)); },
        "Directory for recordings, pass data, caches and logs");
    app.add_option_function<double>("--max_distance",
        [&config](const double d) { config.setMaxDistance(d); },
        "Maximum ground distance to the satellite in meters (default 2200000)");
    app.add_option_function<int>("--days",
        [&config](const int d) { config.setDays(d); },
        "Number of days of passes to predict (default 1)");
    app.add_option_function<double>("--min_elevation",
        [&config](const double e) { config.setMinimumElevation(e); },
        "Minimum elevation in degrees for a pass to be recorded (default 30)");
    app.add_option_function<int>("--buffer_minutes",
        [&config](const int m) { config.setBufferMinutes(m); },
        "Minutes added before and after each pass (default 0)");
    app.add_option_function<std::string>("--passes_file",
        [&config](const std::string &f) { config.setPassesFile(f); },
        "Pass schedule file (default passes.json)");
    app.add_option_function<std::string>("--tle_cache_file",
        [&config](const std::string &f) { config.setTLECacheFile(f); },
        "TLE cache file (default tle_cache.json)");
    app.add_option_function<std::string>("--tle_url",
        [&config](const std::string &u) { config.setTLEUrl(u); },
        "URL to download TLE data from");
    app.add_option_function<int>("--tle_timeout",
        [&config](const int s) { config.setTLETimeout(s); },
        "TLE download timeout in seconds (default 10)");
    app.add_option_function<std::string>("--log_file",
        [&config](const std::string &f) { config.setLogFile(f); },
        "Log file (default groundstation.log)");
    app.add_option_function<std::string>("--rtl_fm",
        [&config](const std::string &p) { config.setRtlFmPath(p); },
        "Path to rtl_fm");
    app.add_option_function<std::string>("--sox",
        [&config](const std::string &p) { config.setSoxPath(p); },
        "Path to sox");
    app.add_option_function<std::string>("--sample_rate",
        [&config](const std::string &r) { config.setSampleRate(r); },
        "Capture sample rate (default 48k)");
    app.add_option_function<int>("--downsample_rate",
        [&config](const int r) { config.setDownsampleRate(r); },
        "Sample rate of the final recording in Hz (default 11025)");
    app.add_option_function<bool>("--downsample",
        [&config](const bool d) { config.setDownsample(d); },
        "Downsample recordings after capture (default true)");
    app.add_option_function<std::string>("--upload_url",
        [&config](const std::string &u) { config.setUploadUrl(u); },
        "URL to upload finished recordings to");
    app.add_option_function<std::string>("--auth_token",
        [&config](const std::string &t) { config.setAuthToken(t); },
        "Bearer token for uploads");
    app.add_option_function<int>("--refresh_hour",
        [&config](const int h) { config.setRefreshHour(h); },
        "Hour of the day (UTC) to refresh pass predictions (default 17)");
    app.add_option_function<bool>("--best_pass_timer",
        [&config](const bool b) { config.setBestPassTimer(b); },
        "Also start the best pass of the day from a precise timer (default false)");
    app.add_option_function<int>("--status_interval",
        [&config](const int s) { config.setStatusIntervalSeconds(s); },
        "Seconds between status log messages (default 300)");
    app.add_flag_function("-v,--verbose",
        [&config](const int64_t v) { config.setVerbose(v > 0); },
        "Display debugging information");
}

}
