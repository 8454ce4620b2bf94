/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundstation/daemon.hpp>
#include <spdlog/spdlog.h>
#include <sstream>

using spdlog::debug;
using spdlog::info;
using spdlog::warn;
using spdlog::error;

namespace groundstation {

std::chrono::milliseconds timeUntilRefresh(time_point now, int refreshHour) {
    using namespace std::chrono;
    auto next = floor<days>(now) + hours(refreshHour);
    if (next <= now) {
        next += days(1);
    }
    return duration_cast<milliseconds>(next - now);
}

std::chrono::milliseconds timeUntilNextMinute(time_point now) {
    using namespace std::chrono;
    auto next = floor<minutes>(now) + minutes(1);
    return duration_cast<milliseconds>(next - now);
}

Daemon::Daemon(Config config)
    : config(std::move(config)),
      celestrak(this->config.getTLEUrl(), this->config.getTLETimeout()),
      tleCache(celestrak, this->config.getTLECacheFile()),
      segmenter(SegmenterOptions::fromConfig(this->config)),
      store(this->config.getPassesFile()),
      updater(tleCache, segmenter, store, network, this->config.getFrequencies()),
      engine(io, RecordingOptions::fromConfig(this->config)),
      scheduler(store, engine, statusSink, [this]{ updater.update(); }),
      janitor(this->config.getRecordingsDirectory()) {
    if (this->config.hasUpload()) {
        uploader = std::make_unique<HttpUploadClient>(this->config.getUploadUrl(), this->config.getAuthToken());
    }
    engine.onCaptureFinished([this](const CaptureRequest &request, bool success) {
        scheduler.captureFinished(request, success);
    });
    engine.onArtifact([this](const Artifact &artifact) {
        artifactReady(artifact);
    });
}

Daemon::~Daemon() {
    stop();
    if (eventLoopThread.joinable()) {
        info("Waiting for event loop thread to finish...");
        eventLoopThread.join();
    }
    if (ioThread.joinable()) {
        info("Waiting for IO thread to finish...");
        ioThread.join();
    }
    engine.abort();
    uploadPool.join();
    info("Daemon destroyed.");
}

DaemonStatus Daemon::status() {
    return _status.load();
}

void Daemon::start() {
    DaemonStatus expected = DaemonStatus::STOPPED;
    if (!_status.compare_exchange_strong(expected, DaemonStatus::STARTING)) {
        return;
    }
    info("Starting daemon for station {} at {:.4f}, {:.4f}",
         config.getStationId(), config.getLatitude(), config.getLongitude());
    for (const auto &[satellite, frequency] : config.getFrequencies()) {
        info("- Tracking {} on {}", satellite, frequency);
    }
    if (!uploader) {
        info("No upload URL configured, recordings will be kept locally");
    }

    eventLoopThread = std::thread([this]{ eventLoop(); });

    initSignals();

    // Build the pass file before the first tick
    send(DaemonEvent::REFRESH_PASSES);

    tickTimer = std::make_unique<asio::steady_timer>(io);
    scheduleTick();

    refreshTimer = std::make_unique<asio::steady_timer>(io);
    scheduleRefresh();

    bestPassTimer = std::make_unique<asio::steady_timer>(io);

    statusTimer = std::make_unique<asio::steady_timer>(io);
    scheduleStatusTimer();

    ioThread = std::thread([this]{ io.run(); });
}

void Daemon::initSignals() {
    signals.async_wait([this](auto ec, int sig) {
        if (ec) {
            error("Error receiving signal: {}", ec.message());
        } else {
            info("Received signal {}.", sig);
        }
        stop();
    });
}

// ============================================================================
// Timers
// ============================================================================

void Daemon::scheduleTick() {
    tickTimer->expires_after(timeUntilNextMinute(systemNow()));
    tickTimer->async_wait([this](const asio::error_code& ec) {
        if (!ec) {
            send(DaemonEvent::TICK);
            scheduleTick();
        } else if (ec != asio::error::operation_aborted) {
            error("Tick timer error: {}", ec.message());
        }
    });
}

void Daemon::scheduleRefresh() {
    auto delay = timeUntilRefresh(systemNow(), config.getRefreshHour());
    debug("Next pass refresh in {} minutes", std::chrono::duration_cast<std::chrono::minutes>(delay).count());
    refreshTimer->expires_after(delay);
    refreshTimer->async_wait([this](const asio::error_code& ec) {
        if (!ec) {
            send(DaemonEvent::REFRESH_PASSES);
            scheduleRefresh();
        } else if (ec != asio::error::operation_aborted) {
            error("Refresh timer error: {}", ec.message());
        }
    });
}

// Runs on the io thread after each refresh
void Daemon::scheduleBestPass() {
    auto delay = scheduler.armedDelay();
    if (!delay) {
        bestPassTimer->cancel();
        return;
    }
    info("Best pass timer set for {} seconds from now",
         std::chrono::duration_cast<std::chrono::seconds>(*delay).count());
    bestPassTimer->expires_after(*delay);
    bestPassTimer->async_wait([this](const asio::error_code& ec) {
        if (!ec) {
            send(DaemonEvent::BEST_PASS_DUE);
        } else if (ec != asio::error::operation_aborted) {
            error("Best pass timer error: {}", ec.message());
        }
    });
}

void Daemon::scheduleStatusTimer() {
    statusTimer->expires_after(std::chrono::seconds(config.getStatusIntervalSeconds()));
    statusTimer->async_wait([this](const asio::error_code& ec) {
        if (!ec) {
            std::ostringstream state;
            state << scheduler.getState();

            info("--- Groundstation Status ---");
            info("- Scheduler: {}", state.str());
            auto active = scheduler.getActivePass();
            if (active) {
                info("- Recording: {} until {}", active->satellite, formatPassTime(active->end()));
            }
            auto armed = scheduler.getArmedPass();
            if (armed) {
                info("- Best pass: {} at {} ({:.1f} degrees)",
                     armed->satellite, formatPassTime(armed->start), armed->maxElevation);
            }
            auto lost = scheduler.getLostPasses();
            if (!lost.empty()) {
                info("- Missed passes since last refresh: {}", lost.size());
            }
            info("----------------------------");
            scheduleStatusTimer(); // Reschedule the timer
        } else if (ec != asio::error::operation_aborted) {
            error("Status logging timer error: {}", ec.message());
        }
    });
}

// ============================================================================
// Recordings
// ============================================================================

void Daemon::artifactReady(const Artifact &artifact) {
    janitor.check();

    if (!uploader) {
        return;
    }

    UploadMetadata metadata{
        .stationId = config.getStationId(),
        .satellite = artifact.request.satellite,
        .latitude = config.getLatitude(),
        .longitude = config.getLongitude(),
        .gain = config.getGain(),
        .timestamp = artifact.request.timestamp
    };
    asio::post(uploadPool, [this, file = artifact.file, metadata]{
        try {
            if (!uploader->upload(file, metadata)) {
                error("Giving up on uploading {}", file.string());
            }
        } catch (const std::exception &e) {
            error("Error uploading {}: {}", file.string(), e.what());
        }
    });
}

// ============================================================================
// Event Loop
// ============================================================================

void Daemon::stop() {
    DaemonStatus expected = DaemonStatus::RUNNING;
    if (!_status.compare_exchange_strong(expected, DaemonStatus::STOPPING)) {
        return;
    }
    info("Stopping daemon...");
    eventCV.notify_all();  // Wake up event loop so it sees the status change
    io.stop();
}

void Daemon::send(DaemonEvent event) {
    {
        std::scoped_lock lock(eventMutex);
        eventQueue.push(event);
    }
    eventCV.notify_one();
}

void Daemon::eventLoop() {
    // Update status to RUNNING
    _status.store(DaemonStatus::RUNNING);
    info("Daemon started.");

    while (status() == DaemonStatus::RUNNING) {
        std::unique_lock eventLock(eventMutex);
        eventCV.wait(eventLock, [this]{
            return !eventQueue.empty() || status() != DaemonStatus::RUNNING;
        });
        if (status() != DaemonStatus::RUNNING) {
            break;
        }
        while (!eventQueue.empty()) {
            DaemonEvent event = eventQueue.front();
            eventQueue.pop();
            eventLock.unlock();

            try {
                handle(event);
            } catch (const std::exception &e) {
                error("Error handling event: {}", e.what());
            }

            eventLock.lock();
        }
    }

    // Update status to STOPPED when exiting loop
    _status.store(DaemonStatus::STOPPED);
    info("Daemon stopped.");
}

void Daemon::handle(DaemonEvent event) {
    switch (event) {
        case DaemonEvent::STOP:
            info("Received STOP event.");
            stop();
            break;
        case DaemonEvent::TICK:
            scheduler.tick();
            break;
        case DaemonEvent::REFRESH_PASSES:
            info("Refreshing passes.");
            scheduler.refresh();
            janitor.check();
            if (config.getBestPassTimer()) {
                asio::post(io, [this]{ scheduleBestPass(); });
            }
            break;
        case DaemonEvent::BEST_PASS_DUE:
            scheduler.fireArmedPass();
            break;
    }
}

void Daemon::wait() {
    if (eventLoopThread.joinable()) {
        eventLoopThread.join();
    }
    if (ioThread.joinable()) {
        ioThread.join();
    }
}

}
