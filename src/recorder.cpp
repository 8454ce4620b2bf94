/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundstation/recorder.hpp>
#include <groundstation/config.hpp>

#include <algorithm>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

using spdlog::debug;
using spdlog::error;
using spdlog::info;
using spdlog::warn;

namespace fs = std::filesystem;

namespace groundstation {

RecordingOptions RecordingOptions::fromConfig(const Config &config) {
    return RecordingOptions{
        .demodulatorPath = config.getRtlFmPath(),
        .encoderPath = config.getSoxPath(),
        .sampleRate = config.getSampleRate(),
        .gain = config.getGain(),
        .downsample = config.getDownsample(),
        .downsampleRate = config.getDownsampleRate(),
        .recordingsDirectory = config.getRecordingsDirectory()
    };
}

// ============================================================================
// File Names and Command Lines
// ============================================================================

// Satellite names contain spaces ("NOAA 19"), keep them out of file names
static std::string fileLabel(const std::string &satellite) {
    std::string label = satellite;
    std::replace_if(label.begin(), label.end(), [](char c) {
        return c == ' ' || c == '/';
    }, '_');
    return label;
}

fs::path rawArtifactPath(const RecordingOptions &options, const CaptureRequest &request) {
    return options.recordingsDirectory /
        (fileLabel(request.satellite) + "-" + formatFileTimestamp(request.timestamp) + "-raw.wav");
}

fs::path artifactPath(const RecordingOptions &options, const CaptureRequest &request) {
    return options.recordingsDirectory /
        (fileLabel(request.satellite) + "-" + formatFileTimestamp(request.timestamp) + ".wav");
}

std::vector<std::string> demodulatorCommand(const RecordingOptions &options, const CaptureRequest &request) {
    return {
        options.demodulatorPath,
        "-f", request.frequency,
        "-M", "fm",
        "-s", options.sampleRate,
        "-l", "0",
        "-g", fmt::format("{}", options.gain),
        "-E", "deemp",
        "-F", "9",
        "-"
    };
}

std::vector<std::string> encoderCommand(const RecordingOptions &options, const fs::path &rawFile) {
    return {
        options.encoderPath,
        "-t", "raw",
        "-r", options.sampleRate,
        "-e", "signed",
        "-b", "16",
        "-c", "1",
        "-",
        "-t", "wav",
        rawFile.string()
    };
}

std::vector<std::string> downsampleCommand(const RecordingOptions &options,
                                           const fs::path &rawFile,
                                           const fs::path &outFile) {
    return {
        options.encoderPath,
        rawFile.string(),
        "-t", "wav",
        outFile.string(),
        "rate", "-v", std::to_string(options.downsampleRate)
    };
}

// ============================================================================
// RecordingEngine
// ============================================================================

RecordingEngine::RecordingEngine(asio::io_context &io, RecordingOptions options)
    : options(std::move(options)),
      durationTimer(io),
      graceTimer(io),
      childSignals(io, SIGCHLD) {
    waitForChildren();
}

RecordingEngine::~RecordingEngine() {
    abort();
}

bool RecordingEngine::isRecording() const {
    return recording.load();
}

bool RecordingEngine::startCapture(const CaptureRequest &request) {
    bool expected = false;
    if (!recording.compare_exchange_strong(expected, true)) {
        warn("Already recording, refusing to record {}", request.satellite);
        return false;
    }

    std::scoped_lock lock(mutex);

    auto rawFile = rawArtifactPath(options, request);
    try {
        fs::create_directories(options.recordingsDirectory);
        auto p = std::make_unique<CapturePipeline>();
        p->start(demodulatorCommand(options, request), encoderCommand(options, rawFile));
        pipeline = std::move(p);
    } catch (const ProcessException &e) {
        error("Failed to start recording of {}: {}", request.satellite, e.what());
        recording.store(false);
        return false;
    } catch (const fs::filesystem_error &e) {
        error("Failed to create recordings directory: {}", e.what());
        recording.store(false);
        return false;
    }

    current = request;
    info("Recording {} on {} for {} seconds to {}",
         request.satellite, request.frequency, request.duration.count(), rawFile.string());

    durationTimer.expires_after(request.duration);
    durationTimer.async_wait([this](const asio::error_code &ec) {
        if (!ec) {
            durationElapsed();
        }
    });
    return true;
}

void RecordingEngine::waitForChildren() {
    childSignals.async_wait([this](const asio::error_code &ec, int) {
        if (ec) {
            if (ec != asio::error::operation_aborted) {
                error("Error waiting for child processes: {}", ec.message());
            }
            return;
        }
        checkChildren();
        waitForChildren();
    });
}

void RecordingEngine::checkChildren() {
    std::optional<Completion> completion;
    std::vector<Artifact> ready;

    {
        std::scoped_lock lock(mutex);

        if (pipeline) {
            switch (pipeline->poll()) {
                case PipelineState::FAILED:
                    durationTimer.cancel();
                    graceTimer.cancel();
                    completion = finishCapture(false);
                    break;
                case PipelineState::FINISHED:
                    durationTimer.cancel();
                    graceTimer.cancel();
                    completion = finishCapture(true);
                    break;
                default:
                    break;
            }
        }

        for (auto it = downsampling.begin(); it != downsampling.end();) {
            auto status = it->process.poll();
            if (!status) {
                ++it;
                continue;
            }
            if (*status == 0) {
                info("Recording saved to {}", it->artifact.file.string());
                ready.push_back(it->artifact);
            } else {
                error("Downsampling {} failed with status {}", it->artifact.rawFile.string(), *status);
            }
            it = downsampling.erase(it);
        }
    }

    publish(completion, ready);
}

void RecordingEngine::durationElapsed() {
    {
        std::scoped_lock lock(mutex);
        if (!pipeline) {
            return;
        }
        info("Stopping recording of {}", current->satellite);
        pipeline->stop();

        graceTimer.expires_after(options.stopGracePeriod);
        graceTimer.async_wait([this](const asio::error_code &ec) {
            if (!ec) {
                gracePeriodElapsed();
            }
        });
    }

    // The processes may already be gone
    checkChildren();
}

void RecordingEngine::gracePeriodElapsed() {
    std::optional<Completion> completion;
    {
        std::scoped_lock lock(mutex);
        if (!pipeline) {
            return;
        }
        warn("Recording processes still running after {} seconds, killing them",
             options.stopGracePeriod.count());
        pipeline->kill();
        completion = finishCapture(true);
    }
    publish(completion, {});
}

// Called with the lock held
RecordingEngine::Completion RecordingEngine::finishCapture(bool success) {
    CaptureRequest request = *current;
    fs::path rawFile = rawArtifactPath(options, request);

    pipeline.reset();
    current.reset();
    recording.store(false);

    Completion completion{
        .request = request,
        .success = success,
        .artifact = std::nullopt
    };

    if (!success) {
        error("Recording of {} failed", request.satellite);
        return completion;
    }
    info("Finished recording {}", request.satellite);

    Artifact artifact{
        .request = request,
        .rawFile = rawFile,
        .file = rawFile
    };
    if (options.downsample) {
        startDownsample(std::move(artifact));
    } else {
        completion.artifact = std::move(artifact);
    }
    return completion;
}

// Called with the lock held
void RecordingEngine::startDownsample(Artifact artifact) {
    artifact.file = artifactPath(options, artifact.request);

    auto &job = downsampling.emplace_back();
    job.artifact = std::move(artifact);
    try {
        job.process.spawn(downsampleCommand(options, job.artifact.rawFile, job.artifact.file));
        info("Downsampling {} to {} Hz", job.artifact.rawFile.string(), options.downsampleRate);
    } catch (const ProcessException &e) {
        error("Failed to start downsampling: {}", e.what());
        downsampling.pop_back();
    }
}

void RecordingEngine::publish(const std::optional<Completion> &completion, const std::vector<Artifact> &ready) {
    if (completion) {
        if (captureFinished) {
            captureFinished(completion->request, completion->success);
        }
        if (completion->artifact && artifactReady) {
            artifactReady(*completion->artifact);
        }
    }
    if (artifactReady) {
        for (const auto &artifact : ready) {
            artifactReady(artifact);
        }
    }
}

void RecordingEngine::abort() {
    std::scoped_lock lock(mutex);

    durationTimer.cancel();
    graceTimer.cancel();

    if (pipeline) {
        warn("Aborting recording of {}", current->satellite);
        pipeline->kill();
        pipeline.reset();
        current.reset();
        recording.store(false);
    }

    for (auto &job : downsampling) {
        job.process.signal(SIGKILL);
        job.process.wait();
    }
    downsampling.clear();
}

}
