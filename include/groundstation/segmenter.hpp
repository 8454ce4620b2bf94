/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDSTATION_SEGMENTER_HPP
#define __GROUNDSTATION_SEGMENTER_HPP

#include <groundstation/clock.hpp>
#include <groundstation/elements.hpp>
#include <groundstation/geometry.hpp>
#include <groundstation/pass.hpp>
#include <groundstation/sampler.hpp>

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace groundstation {

class Config;

/** Shortest duration a pass is scheduled for, after buffering. */
constexpr std::chrono::minutes MINIMUM_PASS_DURATION{2};

/** Spacing between samples along the track. */
constexpr std::chrono::minutes SAMPLE_STEP{1};

/**
 * Visibility thresholds and search window for pass segmentation.
 */
struct SegmenterOptions {
    Geodetic observer{0.0, 0.0, 0.0};
    int horizonDays = 1;
    double minElevationInDegrees = 30.0;
    double maxDistanceInMeters = 2200000.0;
    int bufferMinutes = 0;

    static SegmenterOptions fromConfig(const Config &config);
};

/**
 * Splits an object's track into passes over the ground station.
 *
 * The track is sampled once a minute. A sample is in view when the sub-point
 * lies within maxDistanceInMeters of the observer and the elevation is at least
 * minElevationInDegrees. A pass opens at the first in-view sample and closes at
 * the first sample that is out of view, or at the end of the search window.
 */
class PassSegmenter {
public:
    explicit PassSegmenter(SegmenterOptions options) : options(options) {}

    /**
     * Find passes for every object in the frequency table.
     * @param elements Orbital elements to search
     * @param frequencies Object name (lookup key) to downlink frequency
     * @param start Beginning of the search window; floored to the minute
     * @return Passes ordered by object, then time
     */
    std::vector<Pass> segment(const ElementSet &elements,
                              const std::map<std::string, std::string> &frequencies,
                              time_point start) const;

    /**
     * Find passes for one object.
     */
    std::vector<Pass> segmentObject(const Sampler &sampler,
                                    const std::string &satellite,
                                    const std::string &frequency,
                                    time_point start) const;

    const SegmenterOptions& getOptions() const { return options; }

private:
    SegmenterOptions options;
};

}

#endif
