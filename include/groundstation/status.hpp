/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDSTATION_STATUS_HPP
#define __GROUNDSTATION_STATUS_HPP

#include <filesystem>
#include <string>

namespace groundstation {

/**
 * Receives short human readable status messages ("updating passes",
 * "recording NOAA 19", "idle"). Messages are fire-and-forget.
 */
class StatusSink {
public:
    virtual ~StatusSink() = default;
    virtual void show(const std::string &status) = 0;
};

/**
 * Writes status messages to the log.
 */
class LogStatusSink : public StatusSink {
public:
    void show(const std::string &status) override;
};

/**
 * Reports whether the internet can be reached.
 */
class NetworkMonitor {
public:
    virtual ~NetworkMonitor() = default;
    virtual bool isInternetReachable() = 0;
};

/**
 * Treats the network as reachable when the kernel routing table has a default
 * route that is up.
 */
class RouteTableMonitor : public NetworkMonitor {
public:
    explicit RouteTableMonitor(std::filesystem::path routeTable = "/proc/net/route")
        : routeTable(std::move(routeTable)) {}

    bool isInternetReachable() override;

private:
    std::filesystem::path routeTable;
};

}

#endif
