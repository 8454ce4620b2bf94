/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDSTATION_RECORDER_HPP
#define __GROUNDSTATION_RECORDER_HPP

#include <groundstation/clock.hpp>
#include <groundstation/pipeline.hpp>
#include <groundstation/process.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <asio.hpp>

namespace groundstation {

class Config;

/**
 * A request to record one satellite pass.
 */
struct CaptureRequest {
    std::string satellite;          ///< Label used in file names and upload metadata
    std::string frequency;          ///< Passed to the demodulator, e.g. "137.1M"
    std::chrono::seconds duration;
    time_point timestamp;           ///< Start of the recording
};

/**
 * A finished recording.
 */
struct Artifact {
    CaptureRequest request;
    std::filesystem::path rawFile;  ///< Capture-rate file, kept for troubleshooting
    std::filesystem::path file;     ///< Final file: downsampled, or the raw file if downsampling is disabled
};

/**
 * Something that can record a pass. Only one recording runs at a time.
 */
class Recorder {
public:
    virtual ~Recorder() = default;

    virtual bool isRecording() const = 0;

    /**
     * Begin recording.
     * @return false if a recording is already running or the capture could not start
     */
    virtual bool startCapture(const CaptureRequest &request) = 0;
};

/**
 * Settings for the recording pipeline.
 */
struct RecordingOptions {
    std::string demodulatorPath = "rtl_fm";
    std::string encoderPath = "sox";
    std::string sampleRate = "48k";
    double gain = 38.0;
    bool downsample = true;
    int downsampleRate = 11025;
    std::filesystem::path recordingsDirectory = "recordings";
    std::chrono::seconds stopGracePeriod{10};

    static RecordingOptions fromConfig(const Config &config);
};

// File names for a capture
std::filesystem::path rawArtifactPath(const RecordingOptions &options, const CaptureRequest &request);
std::filesystem::path artifactPath(const RecordingOptions &options, const CaptureRequest &request);

// Command lines for each stage
std::vector<std::string> demodulatorCommand(const RecordingOptions &options, const CaptureRequest &request);
std::vector<std::string> encoderCommand(const RecordingOptions &options, const std::filesystem::path &rawFile);
std::vector<std::string> downsampleCommand(const RecordingOptions &options,
                                           const std::filesystem::path &rawFile,
                                           const std::filesystem::path &outFile);

/**
 * Records passes with rtl_fm piped into sox, then downsamples the result.
 *
 * Process exits are picked up through SIGCHLD and the recording length is
 * measured with a steady timer, both on the io_context. startCapture() and
 * abort() may be called from other threads. Handlers are called on the
 * io_context thread with no internal lock held, so they may call back into
 * the engine.
 */
class RecordingEngine : public Recorder {
public:
    using CaptureFinishedHandler = std::function<void(const CaptureRequest&, bool success)>;
    using ArtifactHandler = std::function<void(const Artifact&)>;

    RecordingEngine(asio::io_context &io, RecordingOptions options);
    ~RecordingEngine() override;

    RecordingEngine(const RecordingEngine&) = delete;
    RecordingEngine& operator=(const RecordingEngine&) = delete;

    bool isRecording() const override;
    bool startCapture(const CaptureRequest &request) override;

    /**
     * Kill any running capture or downsampling process.
     */
    void abort();

    /** Called when the capture pipeline ends and the recording flag clears. */
    void onCaptureFinished(CaptureFinishedHandler handler) { captureFinished = std::move(handler); }

    /** Called when the final file is ready. */
    void onArtifact(ArtifactHandler handler) { artifactReady = std::move(handler); }

private:
    struct DownsampleJob {
        Artifact artifact;
        ChildProcess process;
    };

    struct Completion {
        CaptureRequest request;
        bool success;
        std::optional<Artifact> artifact;   ///< Set when there is nothing left to do with the file
    };

    RecordingOptions options;
    std::atomic<bool> recording{false};
    std::mutex mutex;

    std::optional<CaptureRequest> current;
    std::unique_ptr<CapturePipeline> pipeline;
    std::list<DownsampleJob> downsampling;

    asio::steady_timer durationTimer;
    asio::steady_timer graceTimer;
    asio::signal_set childSignals;

    CaptureFinishedHandler captureFinished;
    ArtifactHandler artifactReady;

    void waitForChildren();
    void checkChildren();
    void durationElapsed();
    void gracePeriodElapsed();
    Completion finishCapture(bool success);
    void startDownsample(Artifact artifact);
    void publish(const std::optional<Completion> &completion, const std::vector<Artifact> &ready);
};

}

#endif
