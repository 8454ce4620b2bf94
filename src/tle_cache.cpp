/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundstation/tle_cache.hpp>
#include <groundstation/fileutil.hpp>

#include <system_error>

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::error;
using spdlog::info;
using spdlog::warn;

namespace fs = std::filesystem;

namespace groundstation {

ElementSet TleCache::fetchElements(bool networkAvailable) {
    if (!networkAvailable) {
        warn("Network unavailable, using cached TLE data");
        return loadFallback();
    }

    std::string data;
    try {
        data = source.fetch();
    } catch (const NetworkException &e) {
        warn("{}. Falling back to cached TLE data.", e.what());
        return loadFallback();
    }

    ElementSet elements = ElementSet::parse(data);
    save(data);
    return elements;
}

ElementSet TleCache::loadFallback() {
    auto entry = load();
    if (!entry) {
        throw TleUnavailableException("Cannot fetch TLE data: network unavailable and no usable cache");
    }

    auto age = std::chrono::duration_cast<std::chrono::hours>(clock() - entry->timestamp);
    info("Using cached TLE data from {} ({} hours old)", formatTimestamp(entry->timestamp), age.count());
    return ElementSet::parse(entry->data);
}

void TleCache::discard(const std::string &reason) {
    warn("Discarding corrupt TLE cache {}: {}", cachePath.string(), reason);
    std::error_code ec;
    fs::remove(cachePath, ec);
    if (ec) {
        error("Failed to delete TLE cache {}: {}", cachePath.string(), ec.message());
    }
}

std::optional<TleCacheEntry> TleCache::load() {
    if (!fs::exists(cachePath)) {
        info("No TLE cache at {}", cachePath.string());
        return std::nullopt;
    }

    std::string content;
    try {
        content = readFile(cachePath);
    } catch (const std::system_error &e) {
        error("Failed to read TLE cache: {}", e.what());
        return std::nullopt;
    }

    if (content.find_first_not_of(" \t\r\n") == std::string::npos) {
        discard("file is empty");
        return std::nullopt;
    }
    if (content.find('\0') != std::string::npos) {
        discard("file contains null bytes");
        return std::nullopt;
    }

    rapidjson::Document doc;
    doc.Parse(content.c_str(), content.size());
    if (doc.HasParseError()) {
        discard("invalid JSON");
        return std::nullopt;
    }
    if (!doc.IsObject()
            || !doc.HasMember("timestamp") || !doc["timestamp"].IsString()
            || !doc.HasMember("data") || !doc["data"].IsString()) {
        discard("missing timestamp or data");
        return std::nullopt;
    }

    auto timestamp = parseTimestamp(doc["timestamp"].GetString());
    if (!timestamp) {
        discard("invalid timestamp");
        return std::nullopt;
    }

    TleCacheEntry entry{
        .timestamp = *timestamp,
        .data = std::string(doc["data"].GetString(), doc["data"].GetStringLength())
    };

    try {
        ElementSet::parse(entry.data);
    } catch (const InvalidElementsException &e) {
        discard(e.what());
        return std::nullopt;
    }

    auto age = clock() - entry.timestamp;
    if (age > TLE_CACHE_MAX_AGE) {
        warn("TLE cache is too old ({} days)",
             std::chrono::duration_cast<std::chrono::days>(age).count());
        return std::nullopt;
    }

    return entry;
}

bool TleCache::save(const std::string &data) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    writer.Key("timestamp");
    writer.String(formatTimestamp(clock()).c_str());
    writer.Key("data");
    writer.String(data.c_str(), static_cast<rapidjson::SizeType>(data.size()));
    writer.EndObject();

    try {
        writeFileAtomically(cachePath, std::string_view(buffer.GetString(), buffer.GetSize()));
    } catch (const std::exception &e) {
        error("Failed to save TLE cache: {}", e.what());
        return false;
    }
    debug("Saved TLE cache to {}", cachePath.string());
    return true;
}

}
