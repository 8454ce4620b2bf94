/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundstation/scheduler.hpp>

#include <algorithm>

#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::error;
using spdlog::info;
using spdlog::warn;

namespace groundstation {

std::ostream& operator<<(std::ostream &os, const SchedulerState &state) {
    switch (state) {
        case SchedulerState::IDLE:
            os << "idle";
            break;
        case SchedulerState::ARMED:
            os << "armed";
            break;
        case SchedulerState::RECORDING:
            os << "recording";
            break;
    }
    return os;
}

std::optional<Pass> findBestPass(const std::vector<Pass> &passes, time_point now) {
    using namespace std::chrono;

    auto today = floor<days>(now);
    std::optional<Pass> best;
    for (const auto &pass : passes) {
        if (pass.recorded || pass.start <= now || floor<days>(pass.start) != today) {
            continue;
        }
        if (!best || pass.maxElevation > best->maxElevation) {
            best = pass;
        }
    }
    return best;
}

std::optional<std::chrono::minutes> captureDuration(const Pass &pass, time_point now) {
    using namespace std::chrono;

    if (now - pass.start <= minutes(1)) {
        return minutes(pass.durationInMinutes);
    }

    auto remaining = floor<minutes>(pass.end() - now);
    if (remaining < minutes(1)) {
        return std::nullopt;
    }
    return remaining;
}

Scheduler::Scheduler(PassStore &store, Recorder &recorder, StatusSink &status,
                     RefreshFunction refreshPasses, Clock clock)
    : store(store),
      recorder(recorder),
      status(status),
      refreshPasses(std::move(refreshPasses)),
      clock(std::move(clock)) {}

SchedulerState Scheduler::getState() const {
    std::scoped_lock lock(mutex);
    return state;
}

std::optional<Pass> Scheduler::getArmedPass() const {
    std::scoped_lock lock(mutex);
    return armed;
}

std::optional<Pass> Scheduler::getActivePass() const {
    std::scoped_lock lock(mutex);
    return active;
}

std::vector<PassKey> Scheduler::getLostPasses() const {
    std::scoped_lock lock(mutex);
    return lost;
}

std::optional<std::chrono::milliseconds> Scheduler::armedDelay() const {
    using namespace std::chrono;

    std::scoped_lock lock(mutex);
    if (!armed) {
        return std::nullopt;
    }
    auto delay = duration_cast<milliseconds>(armed->start - clock());
    return std::max(delay, milliseconds(0));
}

void Scheduler::markLost(const PassKey &key) {
    if (!isLost(key)) {
        lost.push_back(key);
    }
}

bool Scheduler::isLost(const PassKey &key) const {
    return std::find(lost.begin(), lost.end(), key) != lost.end();
}

// ============================================================================
// Dispatch
// ============================================================================

void Scheduler::tick() {
    {
        std::scoped_lock lock(mutex);
        if (auto passes = loadPasses()) {
            dispatchDue(*passes);
            return;
        }
    }

    refresh();

    std::scoped_lock lock(mutex);
    auto passes = loadPasses();
    if (!passes || passes->empty()) {
        warn("No passes available until the next refresh");
        return;
    }
    dispatchDue(*passes);
}

// Called with the lock held
void Scheduler::dispatchDue(const std::vector<Pass> &passes) {
    auto now = clock();
    for (const auto &pass : passes) {
        if (pass.recorded || now < pass.start || now >= pass.end()) {
            continue;
        }
        if (isLost(pass.key())) {
            continue;
        }
        dispatch(pass, now);
    }
}

std::optional<std::vector<Pass>> Scheduler::loadPasses() const {
    try {
        return store.loadAll();
    } catch (const PassStoreException &e) {
        error("Cannot read passes: {}", e.what());
    }
    return std::nullopt;
}

bool Scheduler::fireArmedPass() {
    std::scoped_lock lock(mutex);

    if (!armed) {
        return false;
    }
    auto key = armed->key();

    std::vector<Pass> passes;
    try {
        passes = store.loadAll();
    } catch (const PassStoreException &e) {
        error("Cannot read passes: {}", e.what());
        return false;
    }

    auto it = std::find_if(passes.begin(), passes.end(), [&key](const Pass &p) {
        return p.key() == key;
    });
    if (it == passes.end() || it->recorded) {
        info("Pass of {} at {} {} was already started", key.satellite, key.date, key.time);
        armed.reset();
        if (state == SchedulerState::ARMED) {
            state = SchedulerState::IDLE;
        }
        return false;
    }

    auto now = clock();
    if (now < it->start || now >= it->end()) {
        warn("Timer for pass of {} fired outside its window", key.satellite);
        return false;
    }
    return dispatch(*it, now);
}

bool Scheduler::dispatch(const Pass &pass, time_point now) {
    auto key = pass.key();

    if (recorder.isRecording()) {
        if (!isLost(key)) {
            warn("Recording in progress, skipping pass of {} at {} {}",
                 pass.satellite, key.date, key.time);
            markLost(key);
        }
        return false;
    }

    auto duration = captureDuration(pass, now);
    if (!duration) {
        info("Less than a minute of the pass of {} at {} {} is left, skipping it",
             pass.satellite, key.date, key.time);
        markLost(key);
        return false;
    }
    if (duration->count() != pass.durationInMinutes) {
        info("Pass of {} started at {}, recording the remaining {} minutes",
             pass.satellite, key.time, duration->count());
    }

    CaptureRequest request{
        .satellite = pass.satellite,
        .frequency = pass.frequency,
        .duration = *duration,
        .timestamp = now
    };
    if (!recorder.startCapture(request)) {
        error("Could not start recording pass of {} at {} {}", pass.satellite, key.date, key.time);
        markLost(key);
        return false;
    }

    try {
        if (!store.markRecorded(key)) {
            warn("Pass of {} at {} {} is no longer in the pass file", pass.satellite, key.date, key.time);
        }
    } catch (const std::exception &e) {
        error("Failed to mark pass as recorded: {}", e.what());
    }

    active = pass;
    active->recorded = true;
    activeSince = request.timestamp;
    if (armed && armed->key() == key) {
        armed.reset();
    }
    state = SchedulerState::RECORDING;
    status.show("recording " + pass.satellite);
    return true;
}

void Scheduler::captureFinished(const CaptureRequest &request, bool success) {
    std::scoped_lock lock(mutex);

    if (!active || active->satellite != request.satellite || activeSince != request.timestamp) {
        debug("Ignoring end of recording of {}, it is not the active recording", request.satellite);
        return;
    }

    if (success) {
        info("Recording of {} complete", request.satellite);
    } else {
        warn("Recording of {} failed, waiting for the next pass", request.satellite);
    }

    active.reset();
    state = armed ? SchedulerState::ARMED : SchedulerState::IDLE;
    status.show("idle");
}

// ============================================================================
// Refresh
// ============================================================================

// refreshPasses() runs without the lock held, captureFinished() on the io
// thread must never wait on a download
void Scheduler::refresh() {
    {
        std::scoped_lock lock(mutex);
        lost.clear();
    }
    status.show("updating passes");

    try {
        refreshPasses();
    } catch (const std::exception &e) {
        error("Failed to update passes: {}", e.what());
    }

    auto passes = loadPasses();

    std::scoped_lock lock(mutex);
    armBestPass(passes.value_or(std::vector<Pass>{}), clock());

    if (state != SchedulerState::RECORDING) {
        status.show(armed ? "pass found: " + armed->satellite + " at " + formatPassTime(armed->start) : "idle");
    }
}

void Scheduler::armBestPass(const std::vector<Pass> &passes, time_point now) {
    armed = findBestPass(passes, now);

    if (armed) {
        info("Best pass today: {} at {} {}, max elevation {:.1f}",
             armed->satellite, formatPassDate(armed->start), formatPassTime(armed->start),
             armed->maxElevation);
        if (state == SchedulerState::IDLE) {
            state = SchedulerState::ARMED;
        }
    } else {
        debug("No pass left to arm today");
        if (state == SchedulerState::ARMED) {
            state = SchedulerState::IDLE;
        }
    }
}

}
