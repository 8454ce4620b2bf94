/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDSTATION_DAEMON_HPP
#define __GROUNDSTATION_DAEMON_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <queue>
#include <condition_variable>
#include <asio.hpp>
#include <groundstation/celestrak.hpp>
#include <groundstation/config.hpp>
#include <groundstation/disk.hpp>
#include <groundstation/pass_store.hpp>
#include <groundstation/recorder.hpp>
#include <groundstation/scheduler.hpp>
#include <groundstation/segmenter.hpp>
#include <groundstation/status.hpp>
#include <groundstation/tle_cache.hpp>
#include <groundstation/updater.hpp>
#include <groundstation/upload.hpp>

namespace groundstation {

// The current status of the daemon
enum class DaemonStatus {
    STOPPED,
    STARTING,
    RUNNING,
    STOPPING
};

enum class DaemonEvent {
    STOP,
    TICK,
    REFRESH_PASSES,
    BEST_PASS_DUE
};

/**
 * Time until the next refresh, which happens every day at refreshHour UTC.
 */
std::chrono::milliseconds timeUntilRefresh(time_point now, int refreshHour);

/**
 * Time until the start of the next minute.
 */
std::chrono::milliseconds timeUntilNextMinute(time_point now);

/**
 * Runs the ground station.
 *
 * Timers run on the io thread and post events to the event loop thread,
 * which does the scheduling work. Pass refreshes can take a while, so they
 * run on the event loop thread without the scheduler lock held, and the io
 * thread, where the recording processes are watched, only ever waits for
 * short scheduler updates. An event that throws is logged and the loop
 * carries on.
 */
class Daemon {
public:
    explicit Daemon(Config config);
    ~Daemon();

    DaemonStatus status();
    void start();
    void stop();
    void send(DaemonEvent event);
    void wait();

private:
    Config config;
    std::atomic<DaemonStatus> _status = DaemonStatus::STOPPED;
    std::thread eventLoopThread;
    std::mutex eventMutex;
    std::queue<DaemonEvent> eventQueue;
    std::condition_variable eventCV;
    std::thread ioThread;
    asio::io_context io;
    asio::signal_set signals{io, SIGINT, SIGTERM};
    asio::thread_pool uploadPool{1};

    CelestrakSource celestrak;
    TleCache tleCache;
    PassSegmenter segmenter;
    PassStore store;
    RouteTableMonitor network;
    LogStatusSink statusSink;
    PassUpdater updater;
    RecordingEngine engine;
    Scheduler scheduler;
    DiskJanitor janitor;
    std::unique_ptr<UploadClient> uploader;

    std::unique_ptr<asio::steady_timer> tickTimer;
    std::unique_ptr<asio::steady_timer> refreshTimer;
    std::unique_ptr<asio::steady_timer> bestPassTimer;
    std::unique_ptr<asio::steady_timer> statusTimer;

    void initSignals();
    void scheduleTick();
    void scheduleRefresh();
    void scheduleBestPass();
    void scheduleStatusTimer();
    void artifactReady(const Artifact &artifact);
    void eventLoop();
    void handle(DaemonEvent event);
};

}

#endif
