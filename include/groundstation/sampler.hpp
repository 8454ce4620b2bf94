/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDSTATION_SAMPLER_HPP
#define __GROUNDSTATION_SAMPLER_HPP

#include <groundstation/clock.hpp>
#include <groundstation/geometry.hpp>
#include <groundstation/propagator.hpp>

#include <optional>

namespace groundstation {

/**
 * Where an object is, as seen from the ground station, at one instant.
 */
struct Sample {
    Geodetic subPoint;            ///< Point on the ground directly below the object
    double elevationInDegrees;    ///< Elevation above the observer's horizon
    double distanceInMeters;      ///< Great-circle distance from sub-point to observer
};

/**
 * Produces observer-relative samples of a single object's track.
 */
class Sampler {
public:
    virtual ~Sampler() = default;

    /**
     * @return The sample at the given time, or std::nullopt if the object
     *         cannot be propagated to that time.
     */
    virtual std::optional<Sample> sampleAt(time_point tp) const = 0;
};

/**
 * Samples an object's orbit from a propagator.
 */
class OrbitSampler : public Sampler {
public:
    OrbitSampler(const Propagator &propagator, const Geodetic &observer)
        : propagator(propagator), observer(observer) {}

    std::optional<Sample> sampleAt(time_point tp) const override;

private:
    const Propagator &propagator;
    Geodetic observer;
};

}

#endif
