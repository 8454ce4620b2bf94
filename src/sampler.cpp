/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundstation/sampler.hpp>

#include <spdlog/spdlog.h>

using spdlog::debug;

namespace groundstation {

std::optional<Sample> OrbitSampler::sampleAt(time_point tp) const {
    Vec3 eci;
    try {
        eci = propagator.getECI(tp);
    } catch (const PropagationException &e) {
        debug("Skipping sample: {}", e.what());
        return std::nullopt;
    }

    double jd = toJulianDate(tp);
    Vec3 ecef = eciToECEF(eci, gmst(jd));

    Geodetic subPoint = ecefToGeodetic(ecef);
    LookAngles angles = getLookAngles(ecef, observer);

    return Sample{
        .subPoint = subPoint,
        .elevationInDegrees = angles.elevationInRadians * RADIANS_TO_DEGREES,
        .distanceInMeters = greatCircleDistance(subPoint, observer)
    };
}

}
