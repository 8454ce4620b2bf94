/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDSTATION_SCHEDULER_HPP
#define __GROUNDSTATION_SCHEDULER_HPP

#include <groundstation/clock.hpp>
#include <groundstation/pass.hpp>
#include <groundstation/pass_store.hpp>
#include <groundstation/recorder.hpp>
#include <groundstation/status.hpp>

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <ostream>
#include <vector>

namespace groundstation {

enum class SchedulerState {
    IDLE,
    ARMED,
    RECORDING
};

std::ostream& operator<<(std::ostream &os, const SchedulerState &state);

/**
 * The highest pass of the day: the unrecorded pass with the greatest maximum
 * elevation that starts later today (UTC). Ties go to the earlier pass.
 */
std::optional<Pass> findBestPass(const std::vector<Pass> &passes, time_point now);

/**
 * How long to record a pass that is due now. A pass that started more than a
 * minute ago is only recorded for the whole minutes left before it ends.
 * @return std::nullopt if less than a minute is left
 */
std::optional<std::chrono::minutes> captureDuration(const Pass &pass, time_point now);

/**
 * Decides when to record.
 *
 * tick() is called once a minute and starts any unrecorded pass whose window
 * contains the current time. After each refresh the best pass of the day is
 * armed; if the daemon runs a precise timer for it, fireArmedPass() goes
 * through the same checks as tick(), so the two can never start the same pass
 * twice or start two recordings at once.
 *
 * A pass is marked recorded as soon as its recording starts.
 */
class Scheduler {
public:
    using RefreshFunction = std::function<void()>;

    Scheduler(PassStore &store, Recorder &recorder, StatusSink &status,
              RefreshFunction refreshPasses, Clock clock = systemNow);

    /**
     * Start any pass that is due. If the pass file is unreadable, the passes
     * are refreshed first.
     */
    void tick();

    /**
     * Rebuild the pass file and arm the best pass of the day. Must only be
     * called from the thread that calls tick().
     */
    void refresh();

    /**
     * Start the armed pass if it is due and not yet recorded.
     * @return true if a recording was started
     */
    bool fireArmedPass();

    /**
     * Report that a recording has ended. Ignored unless it is the active
     * recording.
     */
    void captureFinished(const CaptureRequest &request, bool success);

    SchedulerState getState() const;
    std::optional<Pass> getArmedPass() const;
    std::optional<Pass> getActivePass() const;

    /**
     * Time until the armed pass starts, zero if it already has.
     */
    std::optional<std::chrono::milliseconds> armedDelay() const;

    /**
     * Passes that were due but could not be recorded since the last refresh.
     */
    std::vector<PassKey> getLostPasses() const;

private:
    PassStore &store;
    Recorder &recorder;
    StatusSink &status;
    RefreshFunction refreshPasses;
    Clock clock;

    mutable std::mutex mutex;
    SchedulerState state = SchedulerState::IDLE;
    std::optional<Pass> armed;
    std::optional<Pass> active;
    time_point activeSince;
    std::vector<PassKey> lost;

    std::optional<std::vector<Pass>> loadPasses() const;
    void armBestPass(const std::vector<Pass> &passes, time_point now);
    void dispatchDue(const std::vector<Pass> &passes);
    bool dispatch(const Pass &pass, time_point now);
    void markLost(const PassKey &key);
    bool isLost(const PassKey &key) const;
};

}

#endif
