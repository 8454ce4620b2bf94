/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDSTATION_HPP
#define __GROUNDSTATION_HPP

#include <groundstation/clock.hpp>
#include <groundstation/geometry.hpp>
#include <groundstation/elements.hpp>
#include <groundstation/propagator.hpp>
#include <groundstation/sampler.hpp>
#include <groundstation/pass.hpp>
#include <groundstation/segmenter.hpp>
#include <groundstation/fileutil.hpp>
#include <groundstation/pass_store.hpp>
#include <groundstation/celestrak.hpp>
#include <groundstation/tle_cache.hpp>
#include <groundstation/process.hpp>
#include <groundstation/pipeline.hpp>
#include <groundstation/recorder.hpp>
#include <groundstation/status.hpp>
#include <groundstation/disk.hpp>
#include <groundstation/upload.hpp>
#include <groundstation/scheduler.hpp>
#include <groundstation/updater.hpp>
#include <groundstation/config.hpp>
#include <groundstation/logging.hpp>
#include <groundstation/daemon.hpp>

#endif
