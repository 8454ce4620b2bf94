/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundstation/segmenter.hpp>
#include <groundstation/config.hpp>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <optional>

#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::info;
using spdlog::warn;

namespace groundstation {

SegmenterOptions SegmenterOptions::fromConfig(const Config &config) {
    return SegmenterOptions{
        .observer = Geodetic::fromDegrees(
            config.getLatitude(),
            config.getLongitude(),
            config.getAltitude() / 1000.0),
        .horizonDays = config.getDays(),
        .minElevationInDegrees = config.getMinimumElevation(),
        .maxDistanceInMeters = config.getMaxDistance(),
        .bufferMinutes = config.getBufferMinutes()
    };
}

std::vector<Pass> PassSegmenter::segment(const ElementSet &elements,
                                         const std::map<std::string, std::string> &frequencies,
                                         time_point start) const {
    std::vector<Pass> passes;

    for (const auto &[satellite, frequency] : frequencies) {
        auto entry = elements.find(satellite);
        if (!entry) {
            warn("No TLE data found for {}", satellite);
            continue;
        }

        try {
            Sgp4Propagator propagator(*entry);
            OrbitSampler sampler(propagator, options.observer);
            auto found = segmentObject(sampler, satellite, frequency, start);
            info("Found {} passes for {}", found.size(), satellite);
            passes.insert(passes.end(), found.begin(), found.end());
        } catch (const PropagationException &e) {
            warn("Skipping {}: {}", satellite, e.what());
        }
    }

    return passes;
}

std::vector<Pass> PassSegmenter::segmentObject(const Sampler &sampler,
                                               const std::string &satellite,
                                               const std::string &frequency,
                                               time_point start) const {
    using namespace std::chrono;

    std::vector<Pass> passes;

    auto t = floor<minutes>(start);
    const auto end = t + days(options.horizonDays);
    const minutes buffer{options.bufferMinutes};

    std::optional<time_point> passStart;
    std::vector<double> elevations;
    std::vector<double> distances;

    auto closePass = [&](time_point passEnd) {
        double maxElevation = *std::max_element(elevations.begin(), elevations.end());
        if (maxElevation >= options.minElevationInDegrees) {
            double count = static_cast<double>(elevations.size());

            auto bufferedStart = *passStart - buffer;
            auto bufferedEnd = passEnd + buffer;
            auto rounded = static_cast<int>(std::lround(
                duration_cast<duration<double, minutes::period>>(bufferedEnd - bufferedStart).count()));

            Pass pass{
                .satellite = satellite,
                .frequency = frequency,
                .start = bufferedStart,
                .durationInMinutes = std::max(rounded, static_cast<int>(MINIMUM_PASS_DURATION.count())),
                .maxElevation = maxElevation,
                .avgElevation = std::accumulate(elevations.begin(), elevations.end(), 0.0) / count,
                .minDistance = *std::min_element(distances.begin(), distances.end()),
                .avgDistance = std::accumulate(distances.begin(), distances.end(), 0.0) / count,
                .recorded = false
            };
            debug("Pass of {} at {} {} for {} minutes, max elevation {:.1f}",
                  satellite, formatPassDate(pass.start), formatPassTime(pass.start),
                  pass.durationInMinutes, pass.maxElevation);
            passes.push_back(std::move(pass));
        }
        passStart.reset();
        elevations.clear();
        distances.clear();
    };

    for (; t < end; t += SAMPLE_STEP) {
        auto sample = sampler.sampleAt(t);
        if (!sample) {
            continue;
        }

        bool inView = sample->distanceInMeters <= options.maxDistanceInMeters
                   && sample->elevationInDegrees >= options.minElevationInDegrees;

        if (inView) {
            if (!passStart) {
                passStart = t;
            }
            elevations.push_back(sample->elevationInDegrees);
            distances.push_back(sample->distanceInMeters);
        } else if (passStart) {
            closePass(t);
        }
    }

    // A pass still open at the end of the window closes at the boundary
    if (passStart) {
        closePass(end);
    }

    return passes;
}

}
