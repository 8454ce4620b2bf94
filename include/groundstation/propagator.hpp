/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDSTATION_PROPAGATOR_HPP
#define __GROUNDSTATION_PROPAGATOR_HPP

#include <groundstation/clock.hpp>
#include <groundstation/elements.hpp>
#include <groundstation/geometry.hpp>

#include <memory>
#include <stdexcept>
#include <string>

namespace libsgp4 {
class Tle;
class SGP4;
}

namespace groundstation {

/**
 * Thrown when orbital elements cannot be propagated, either because they are
 * rejected outright or because the object has decayed by the requested time.
 */
class PropagationException : public std::runtime_error {
public:
    explicit PropagationException(const std::string &message)
        : std::runtime_error(message) {}
};

/**
 * Computes an object's inertial position at a given time.
 */
class Propagator {
public:
    virtual ~Propagator() = default;

    /**
     * @return Position in TEME coordinates (km)
     * @throws PropagationException
     */
    virtual Vec3 getECI(time_point tp) const = 0;
};

/**
 * SGP4/SDP4 propagation backed by libsgp4.
 */
class Sgp4Propagator : public Propagator {
public:
    /**
     * @throws PropagationException if libsgp4 rejects the elements
     */
    explicit Sgp4Propagator(const TLEEntry &entry);
    ~Sgp4Propagator() override;

    Sgp4Propagator(const Sgp4Propagator&) = delete;
    Sgp4Propagator& operator=(const Sgp4Propagator&) = delete;

    Vec3 getECI(time_point tp) const override;

    const std::string& getName() const { return name; }

private:
    std::string name;
    std::unique_ptr<libsgp4::Tle> tle;
    std::unique_ptr<libsgp4::SGP4> sgp4;
};

}

#endif
