/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundstation/status.hpp>

#include <fstream>
#include <sstream>

#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::info;
using spdlog::warn;

namespace groundstation {

void LogStatusSink::show(const std::string &status) {
    info("Status: {}", status);
}

// /proc/net/route columns: Iface Destination Gateway Flags ...
// Destination 00000000 is the default route, flag 0x1 is RTF_UP.
bool RouteTableMonitor::isInternetReachable() {
    std::ifstream in(routeTable);
    if (!in) {
        warn("Cannot read {}, assuming the network is reachable", routeTable.string());
        return true;
    }

    std::string line;
    std::getline(in, line); // header

    while (std::getline(in, line)) {
        std::istringstream fields(line);
        std::string iface, destination, gateway, flags;
        if (!(fields >> iface >> destination >> gateway >> flags)) {
            continue;
        }
        if (destination != "00000000") {
            continue;
        }
        unsigned long value = 0;
        try {
            value = std::stoul(flags, nullptr, 16);
        } catch (const std::logic_error &) {
            continue;
        }
        if (value & 0x1) {
            debug("Default route via {}", iface);
            return true;
        }
    }

    return false;
}

}
