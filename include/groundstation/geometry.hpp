/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDSTATION_GEOMETRY_HPP
#define __GROUNDSTATION_GEOMETRY_HPP

#include <groundstation/clock.hpp>

#include <cmath>
#include <numbers>

namespace groundstation {

// Astronomical constants
constexpr double J2000_JD = 2451545.0;                      // Julian Date of J2000.0 epoch
constexpr double UNIX_EPOCH_JD = 2440587.5;                 // Julian Date of 1970-01-01T00:00:00Z
constexpr double DAYS_PER_JULIAN_CENTURY = 36525.0;         // Days in a Julian century
constexpr double GMST_AT_J2000 = 280.46061837;              // GMST at J2000.0 epoch (degrees)
constexpr double EARTH_SIDEREAL_RATE = 360.98564736629;     // Earth's rotation rate (deg/day)

// IAU polynomial correction coefficients for long-term variations in Earth's rotation
constexpr double GMST_T2_COEFF = 0.000387933;   // Quadratic correction for precession (T² term)
constexpr double GMST_T3_DIVISOR = 38710000.0;  // Cubic correction divisor (T³ term)

// WGS84 ellipsoid
constexpr double WGS84_A = 6378.137;                  // Semi-major axis (km)
constexpr double WGS84_F = 1.0 / 298.257223563;       // Flattening
constexpr double WGS84_E2 = WGS84_F * (2 - WGS84_F);  // Eccentricity squared

// Radius of the sphere used for ground-track distances (metres)
constexpr double EARTH_RADIUS_IN_METERS = 6378137.0;

// Degree-radian conversion factors
constexpr double DEGREES_TO_RADIANS = std::numbers::pi / 180.0;
constexpr double RADIANS_TO_DEGREES = 180.0 / std::numbers::pi;

// ============================================================================
// Basic Data Types
// ============================================================================

/**
 * 3D vector in Cartesian coordinates.
 */
struct Vec3 {
    double x, y, z;

    Vec3 operator+(const Vec3& other) const {
        return {x + other.x, y + other.y, z + other.z};
    }

    Vec3 operator-(const Vec3& other) const {
        return {x - other.x, y - other.y, z - other.z};
    }

    Vec3 operator*(double scalar) const {
        return {x * scalar, y * scalar, z * scalar};
    }

    double magnitude() const {
        return std::sqrt(x*x + y*y + z*z);
    }

    double dot(const Vec3& other) const {
        return x * other.x + y * other.y + z * other.z;
    }
};

/**
 * Geodetic coordinates representing a position on or above Earth's surface.
 */
struct Geodetic {
    double latInRadians;      ///< Geodetic latitude (-π/2 to +π/2, positive = North)
    double lonInRadians;      ///< Longitude (-π to +π, positive = East)
    double altInKilometers;   ///< Altitude above the WGS84 ellipsoid surface

    Vec3 toECEF() const;

    double latInDegrees() const { return latInRadians * RADIANS_TO_DEGREES; }
    double lonInDegrees() const { return lonInRadians * RADIANS_TO_DEGREES; }

    static Geodetic fromDegrees(double lat, double lon, double altInKilometers = 0.0) {
        return {lat * DEGREES_TO_RADIANS, lon * DEGREES_TO_RADIANS, altInKilometers};
    }
};

/**
 * Look angles from an observer to a target (typically a satellite).
 */
struct LookAngles {
    double azimuthInRadians;      ///< Compass direction (0 = North, π/2 = East, etc.)
    double elevationInRadians;    ///< Angle above horizon (0 = horizon, π/2 = overhead)
    double rangeInKilometers;     ///< Slant range (straight-line distance) to the target
};

// ============================================================================
// Coordinate System Transformations and Time Functions
// ============================================================================

/**
 * Converts a time_point to Julian Date.
 */
double toJulianDate(time_point tp);

/**
 * Computes Greenwich Mean Sidereal Time (GMST) for a given Julian Date.
 * @return GMST in radians, normalized to [0, 2π)
 */
double gmst(double julianDate);

/**
 * Converts Earth-Centered Inertial (ECI) to Earth-Centered Earth-Fixed (ECEF).
 */
Vec3 eciToECEF(const Vec3 &eci, double gst);

/**
 * Converts ECEF coordinates to geodetic.
 */
Geodetic ecefToGeodetic(const Vec3 &ecef);

/**
 * Transforms a position from ECEF to ENU (East-North-Up) coordinates.
 */
Vec3 ecefToENU(const Vec3& targetECEF, const Geodetic& observer);

/**
 * Computes look angles from an observer to a target given in ECEF coordinates.
 */
LookAngles getLookAngles(const Vec3& satECEF, const Geodetic& observer);

/**
 * Great-circle distance between two points on a sphere of radius
 * EARTH_RADIUS_IN_METERS, ignoring altitude.
 * @return Distance in metres
 */
double greatCircleDistance(const Geodetic& from, const Geodetic& to);

}

#endif
