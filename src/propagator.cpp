/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundstation/propagator.hpp>

#include <chrono>

#include <date/date.h>

#include <DateTime.h>
#include <DecayedException.h>
#include <Eci.h>
#include <SatelliteException.h>
#include <SGP4.h>
#include <Tle.h>
#include <TleException.h>

namespace groundstation {

Sgp4Propagator::Sgp4Propagator(const TLEEntry &entry) : name(entry.name) {
    try {
        tle = std::make_unique<libsgp4::Tle>(entry.name, entry.line1, entry.line2);
        sgp4 = std::make_unique<libsgp4::SGP4>(*tle);
    } catch (const libsgp4::TleException &e) {
        throw PropagationException("Invalid elements for " + entry.name + ": " + e.what());
    } catch (const libsgp4::SatelliteException &e) {
        throw PropagationException("Cannot propagate " + entry.name + ": " + e.what());
    }
}

Sgp4Propagator::~Sgp4Propagator() = default;

Vec3 Sgp4Propagator::getECI(time_point tp) const {
    using namespace std::chrono;

    auto day = floor<date::days>(tp);
    date::year_month_day ymd{day};
    date::hh_mm_ss hms{floor<seconds>(tp - day)};

    libsgp4::DateTime dt(
        static_cast<int>(ymd.year()),
        static_cast<int>(static_cast<unsigned>(ymd.month())),
        static_cast<int>(static_cast<unsigned>(ymd.day())),
        static_cast<int>(hms.hours().count()),
        static_cast<int>(hms.minutes().count()),
        static_cast<int>(hms.seconds().count()));

    try {
        libsgp4::Eci eci = sgp4->FindPosition(dt);
        libsgp4::Vector pos = eci.Position();
        return {pos.x, pos.y, pos.z};
    } catch (const libsgp4::DecayedException &e) {
        throw PropagationException(name + " has decayed: " + e.what());
    } catch (const libsgp4::SatelliteException &e) {
        throw PropagationException("Cannot propagate " + name + ": " + e.what());
    }
}

}
