/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDSTATION_UPDATER_HPP
#define __GROUNDSTATION_UPDATER_HPP

#include <groundstation/clock.hpp>
#include <groundstation/pass_store.hpp>
#include <groundstation/segmenter.hpp>
#include <groundstation/status.hpp>
#include <groundstation/tle_cache.hpp>

#include <cstddef>
#include <map>
#include <string>

namespace groundstation {

/**
 * Rebuilds the pass file from fresh orbital elements.
 */
class PassUpdater {
public:
    PassUpdater(TleCache &tleCache,
                const PassSegmenter &segmenter,
                PassStore &store,
                NetworkMonitor &network,
                std::map<std::string, std::string> frequencies,
                Clock clock = systemNow)
        : tleCache(tleCache),
          segmenter(segmenter),
          store(store),
          network(network),
          frequencies(std::move(frequencies)),
          clock(std::move(clock)) {}

    /**
     * Fetch elements, predict passes from now until the end of the search
     * window and replace the contents of the pass file with them. The pass
     * file is left alone if no elements can be obtained.
     * @return The number of passes stored
     * @throws TleUnavailableException if there is no network and no usable cache
     */
    std::size_t update();

private:
    TleCache &tleCache;
    const PassSegmenter &segmenter;
    PassStore &store;
    NetworkMonitor &network;
    std::map<std::string, std::string> frequencies;
    Clock clock;
};

}

#endif
