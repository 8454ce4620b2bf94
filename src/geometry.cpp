/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundstation/geometry.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <numbers>

namespace groundstation {

// Convert a time_point to Julian Date
double toJulianDate(time_point tp) {
    using namespace std::chrono;

    auto daysSinceEpoch = duration_cast<duration<double, days::period>>(
        tp.time_since_epoch()
    ).count();

    return UNIX_EPOCH_JD + daysSinceEpoch;
}

// Greenwich Mean Sidereal Time in radians
double gmst(double julianDate) {
    // Julian centuries since J2000.0
    double T = (julianDate - J2000_JD) / DAYS_PER_JULIAN_CENTURY;

    double gmstInDegrees = GMST_AT_J2000
                    + EARTH_SIDEREAL_RATE * (julianDate - J2000_JD)
                    + GMST_T2_COEFF * T * T
                    - T * T * T / GMST_T3_DIVISOR;

    // Normalize to [0, 360)
    gmstInDegrees = std::fmod(gmstInDegrees, 360.0);
    if (gmstInDegrees < 0) gmstInDegrees += 360.0;

    return gmstInDegrees * DEGREES_TO_RADIANS;
}

// Rotate an inertial position about Z by the Greenwich sidereal angle
Vec3 eciToECEF(const Vec3 &eci, double gst) {
    double cosGST = std::cos(gst);
    double sinGST = std::sin(gst);

    return {
         eci.x * cosGST + eci.y * sinGST,
        -eci.x * sinGST + eci.y * cosGST,
         eci.z
    };
}

// ECEF to geodetic latitude, longitude and altitude (Bowring's iteration)
Geodetic ecefToGeodetic(const Vec3 &ecef) {
    double x = ecef.x, y = ecef.y, z = ecef.z;
    double lon = std::atan2(y, x);
    double p = std::sqrt(x*x + y*y);

    double lat = std::atan2(z, p * (1 - WGS84_E2));
    for (int i = 0; i < 10; ++i) {
        double sinLat = std::sin(lat);
        double N = WGS84_A / std::sqrt(1 - WGS84_E2 * sinLat * sinLat);
        lat = std::atan2(z + WGS84_E2 * N * sinLat, p);
    }

    double sinLat = std::sin(lat);
    double N = WGS84_A / std::sqrt(1 - WGS84_E2 * sinLat * sinLat);

    // Near the poles p/cos(lat) is unstable, use the Z form instead
    double alt;
    if (std::abs(std::cos(lat)) > 1e-9) {
        alt = p / std::cos(lat) - N;
    } else {
        alt = std::abs(z) - N * (1 - WGS84_E2);
    }

    return {lat, lon, alt};
}

Vec3 Geodetic::toECEF() const {
    double sinLat = std::sin(latInRadians);
    double cosLat = std::cos(latInRadians);
    double sinLon = std::sin(lonInRadians);
    double cosLon = std::cos(lonInRadians);

    // Radius of curvature in the prime vertical
    double N = WGS84_A / std::sqrt(1.0 - WGS84_E2 * sinLat * sinLat);

    return {
        (N + altInKilometers) * cosLat * cosLon,
        (N + altInKilometers) * cosLat * sinLon,
        (N * (1.0 - WGS84_E2) + altInKilometers) * sinLat
    };
}

Vec3 ecefToENU(const Vec3& targetECEF, const Geodetic& observer) {
    Vec3 diff = targetECEF - observer.toECEF();

    double sinLat = std::sin(observer.latInRadians);
    double cosLat = std::cos(observer.latInRadians);
    double sinLon = std::sin(observer.lonInRadians);
    double cosLon = std::cos(observer.lonInRadians);

    // Rotate the difference vector into the observer's local tangent plane
    double east  = -sinLon * diff.x + cosLon * diff.y;
    double north = -sinLat * cosLon * diff.x - sinLat * sinLon * diff.y + cosLat * diff.z;
    double up    =  cosLat * cosLon * diff.x + cosLat * sinLon * diff.y + sinLat * diff.z;

    return {east, north, up};
}

LookAngles getLookAngles(const Vec3& satECEF, const Geodetic& observer) {
    Vec3 enu = ecefToENU(satECEF, observer);

    double range = enu.magnitude();

    // elevation = arcsin(Up / range)
    double elevation = std::asin(std::clamp(enu.z / range, -1.0, 1.0));

    // azimuth = arctan2(East, North), 0 = North
    double azimuth = std::atan2(enu.x, enu.y);
    if (azimuth < 0) {
        azimuth += 2.0 * std::numbers::pi;
    }

    return {azimuth, elevation, range};
}

// Haversine form, stable for short distances
double greatCircleDistance(const Geodetic& from, const Geodetic& to) {
    double dLat = to.latInRadians - from.latInRadians;
    double dLon = to.lonInRadians - from.lonInRadians;

    double sinHalfLat = std::sin(dLat / 2.0);
    double sinHalfLon = std::sin(dLon / 2.0);

    double a = sinHalfLat * sinHalfLat
             + std::cos(from.latInRadians) * std::cos(to.latInRadians) * sinHalfLon * sinHalfLon;
    double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(std::max(0.0, 1.0 - a)));

    return EARTH_RADIUS_IN_METERS * c;
}

}
