/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundstation/updater.hpp>

#include <spdlog/spdlog.h>

using spdlog::info;
using spdlog::warn;

namespace groundstation {

std::size_t PassUpdater::update() {
    bool online = network.isInternetReachable();
    if (!online) {
        warn("No default route, using cached TLE data");
    }

    ElementSet elements = tleCache.fetchElements(online);
    info("Loaded {} element sets", elements.size());

    auto now = clock();
    auto passes = segmenter.segment(elements, frequencies, now);

    store.clear();
    auto added = store.merge(passes);
    info("Stored {} upcoming passes in {}", added, store.getPath().string());
    return added;
}

}
