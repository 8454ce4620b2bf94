/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundstation/pass_store.hpp>
#include <groundstation/fileutil.hpp>

#include <algorithm>
#include <system_error>

#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/error/en.h>
#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::error;
using spdlog::info;
using spdlog::warn;

namespace fs = std::filesystem;

namespace groundstation {

// ============================================================================
// JSON Conversion
// ============================================================================

std::string passesToJSON(const std::vector<Pass> &passes) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);

    writer.StartArray();
    for (const auto &pass : passes) {
        writer.StartObject();
        writer.Key("frequency");
        writer.String(pass.frequency.c_str());
        writer.Key("satellite");
        writer.String(pass.satellite.c_str());
        writer.Key("date");
        writer.String(formatPassDate(pass.start).c_str());
        writer.Key("time");
        writer.String(formatPassTime(pass.start).c_str());
        writer.Key("duration");
        writer.Int(pass.durationInMinutes);
        writer.Key("avgElevation");
        writer.Double(pass.avgElevation);
        writer.Key("maxElevation");
        writer.Double(pass.maxElevation);
        writer.Key("avgDistance");
        writer.Double(pass.avgDistance);
        writer.Key("minDistance");
        writer.Double(pass.minDistance);
        writer.Key("recorded");
        writer.Bool(pass.recorded);
        writer.EndObject();
    }
    writer.EndArray();

    return std::string(buffer.GetString(), buffer.GetSize()) + "\n";
}

static const rapidjson::Value& requireMember(const rapidjson::Value &obj, const char *name, std::size_t index) {
    if (!obj.HasMember(name)) {
        throw std::invalid_argument("pass " + std::to_string(index) + " has no " + name);
    }
    return obj[name];
}

static std::string requireString(const rapidjson::Value &obj, const char *name, std::size_t index) {
    const auto &value = requireMember(obj, name, index);
    if (!value.IsString()) {
        throw std::invalid_argument("pass " + std::to_string(index) + " has a non-string " + name);
    }
    return std::string(value.GetString(), value.GetStringLength());
}

static double requireNumber(const rapidjson::Value &obj, const char *name, std::size_t index) {
    const auto &value = requireMember(obj, name, index);
    if (!value.IsNumber()) {
        throw std::invalid_argument("pass " + std::to_string(index) + " has a non-numeric " + name);
    }
    return value.GetDouble();
}

std::vector<Pass> passesFromJSON(const std::string &json) {
    rapidjson::Document doc;
    doc.Parse(json.c_str(), json.size());

    if (doc.HasParseError()) {
        throw std::invalid_argument(std::string("JSON parse error at offset ")
            + std::to_string(doc.GetErrorOffset()) + ": "
            + rapidjson::GetParseError_En(doc.GetParseError()));
    }
    if (!doc.IsArray()) {
        throw std::invalid_argument("expected an array of passes");
    }

    std::vector<Pass> passes;
    passes.reserve(doc.Size());

    std::size_t index = 0;
    for (const auto &item : doc.GetArray()) {
        if (!item.IsObject()) {
            throw std::invalid_argument("pass " + std::to_string(index) + " is not an object");
        }

        auto date = requireString(item, "date", index);
        auto time = requireString(item, "time", index);
        auto start = parsePassStart(date, time);
        if (!start) {
            throw std::invalid_argument("pass " + std::to_string(index) + " has an invalid date or time");
        }

        const auto &recorded = requireMember(item, "recorded", index);
        if (!recorded.IsBool()) {
            throw std::invalid_argument("pass " + std::to_string(index) + " has a non-boolean recorded");
        }

        double duration = requireNumber(item, "duration", index);
        if (duration < 0) {
            throw std::invalid_argument("pass " + std::to_string(index) + " has a negative duration");
        }

        passes.push_back(Pass{
            .satellite = requireString(item, "satellite", index),
            .frequency = requireString(item, "frequency", index),
            .start = *start,
            .durationInMinutes = static_cast<int>(duration),
            .maxElevation = requireNumber(item, "maxElevation", index),
            .avgElevation = requireNumber(item, "avgElevation", index),
            .minDistance = requireNumber(item, "minDistance", index),
            .avgDistance = requireNumber(item, "avgDistance", index),
            .recorded = recorded.GetBool()
        });
        index++;
    }

    return passes;
}

// ============================================================================
// PassStore
// ============================================================================

void PassStore::quarantine(const std::string &reason) const {
    fs::path corrupt = withSuffix(path, ".corrupt");
    std::error_code ec;
    fs::rename(path, corrupt, ec);
    if (ec) {
        error("Failed to move corrupt pass file {} aside: {}", path.string(), ec.message());
    } else {
        warn("Moved corrupt pass file to {}", corrupt.string());
    }
    throw PassStoreException("Corrupt pass file " + path.string() + ": " + reason);
}

std::vector<Pass> PassStore::loadAll() const {
    std::error_code ec;
    bool exists = fs::exists(path, ec);
    if (ec) {
        throw PassStoreException("Cannot access pass file " + path.string() + ": " + ec.message());
    }
    if (!exists) {
        debug("Pass file {} does not exist yet", path.string());
        return {};
    }

    std::string content;
    try {
        content = readFile(path);
    } catch (const std::system_error &e) {
        throw PassStoreException(e.what());
    }

    if (content.find('\0') != std::string::npos) {
        quarantine("file contains null bytes");
    }
    if (content.find_first_not_of(" \t\r\n") == std::string::npos) {
        return {};
    }

    try {
        return passesFromJSON(content);
    } catch (const std::invalid_argument &e) {
        quarantine(e.what());
    }
}

void PassStore::save(std::vector<Pass> passes) {
    std::stable_sort(passes.begin(), passes.end(), [](const Pass &a, const Pass &b) {
        return a.start < b.start;
    });
    writeFileAtomically(path, passesToJSON(passes), true);
    debug("Saved {} passes to {}", passes.size(), path.string());
}

std::size_t PassStore::merge(const std::vector<Pass> &newPasses) {
    std::vector<Pass> passes;
    try {
        passes = loadAll();
    } catch (const PassStoreException &e) {
        warn("Starting a new pass file: {}", e.what());
    }

    std::size_t added = 0;
    for (const auto &pass : newPasses) {
        auto key = pass.key();
        bool exists = std::any_of(passes.begin(), passes.end(), [&key](const Pass &p) {
            return p.key() == key;
        });
        if (!exists) {
            passes.push_back(pass);
            added++;
        }
    }

    save(std::move(passes));
    info("Merged {} of {} passes into {}", added, newPasses.size(), path.string());
    return added;
}

bool PassStore::markRecorded(const PassKey &key) {
    auto passes = loadAll();
    auto it = std::find_if(passes.begin(), passes.end(), [&key](const Pass &p) {
        return p.key() == key;
    });
    if (it == passes.end()) {
        return false;
    }
    it->recorded = true;
    save(std::move(passes));
    return true;
}

void PassStore::clear() {
    save({});
    info("Cleared pass file {}", path.string());
}

}
