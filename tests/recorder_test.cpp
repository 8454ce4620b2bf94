/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <groundstation/recorder.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include <asio.hpp>
#include <date/date.h>

namespace groundstation {
namespace {

namespace fs = std::filesystem;
using namespace std::chrono;

const time_point PASS_START = date::sys_days{date::year{2026}/10/19} + hours(14) + minutes(3);

CaptureRequest noaa19() {
    return CaptureRequest{
        .satellite = "NOAA 19",
        .frequency = "137.1M",
        .duration = minutes(12),
        .timestamp = PASS_START
    };
}

// ============================================================================
// Command Line Tests
// ============================================================================

TEST(RecordingCommandTest, Demodulator) {
    RecordingOptions options;
    options.gain = 40.2;
    auto command = demodulatorCommand(options, noaa19());

    std::vector<std::string> expected{
        "rtl_fm", "-f", "137.1M", "-M", "fm", "-s", "48k", "-l", "0",
        "-g", "40.2", "-E", "deemp", "-F", "9", "-"
    };
    EXPECT_EQ(command, expected);
}

TEST(RecordingCommandTest, Encoder) {
    RecordingOptions options;
    options.encoderPath = "/usr/bin/sox";
    auto command = encoderCommand(options, "/srv/recordings/raw.wav");

    std::vector<std::string> expected{
        "/usr/bin/sox", "-t", "raw", "-r", "48k", "-e", "signed", "-b", "16", "-c", "1",
        "-", "-t", "wav", "/srv/recordings/raw.wav"
    };
    EXPECT_EQ(command, expected);
}

TEST(RecordingCommandTest, Downsample) {
    RecordingOptions options;
    auto command = downsampleCommand(options, "in.wav", "out.wav");

    std::vector<std::string> expected{
        "sox", "in.wav", "-t", "wav", "out.wav", "rate", "-v", "11025"
    };
    EXPECT_EQ(command, expected);
}

TEST(RecordingCommandTest, FileNames) {
    RecordingOptions options;
    options.recordingsDirectory = "/srv/recordings";

    EXPECT_EQ(rawArtifactPath(options, noaa19()),
              fs::path("/srv/recordings/NOAA_19-2026-10-19T14-03-00Z-raw.wav"));
    EXPECT_EQ(artifactPath(options, noaa19()),
              fs::path("/srv/recordings/NOAA_19-2026-10-19T14-03-00Z.wav"));

    auto request = noaa19();
    request.satellite = "METEOR-M 2/3";
    EXPECT_EQ(artifactPath(options, request).filename(),
              fs::path("METEOR-M_2_3-2026-10-19T14-03-00Z.wav"));
}

// ============================================================================
// RecordingEngine Tests
// ============================================================================

class RecordingEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() /
            ("groundstation-recorder-" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir);
        fs::create_directories(dir);

        options.recordingsDirectory = dir / "recordings";
        options.demodulatorPath = writeScript("demodulator", "exec sleep 30");
        options.encoderPath = writeScript("encoder", "exec cat > /dev/null");
        options.downsample = false;
    }

    void TearDown() override {
        fs::remove_all(dir);
    }

    // A stand-in for rtl_fm or sox that ignores its arguments
    std::string writeScript(const std::string &name, const std::string &body) {
        auto path = dir / name;
        {
            std::ofstream out(path);
            out << "#!/bin/sh\n" << body << "\n";
        }
        fs::permissions(path, fs::perms::owner_all);
        return path.string();
    }

    // A sox stand-in: encodes stdin to the last argument, or copies the
    // first argument to the fourth when downsampling
    std::string writeSox() {
        return writeScript("sox",
            "if [ \"$1\" = \"-t\" ]; then\n"
            "    for arg; do out=\"$arg\"; done\n"
            "    exec cat > \"$out\"\n"
            "fi\n"
            "exec cp \"$1\" \"$4\"");
    }

    // Run handlers until the predicate holds or the deadline passes
    template <typename Predicate>
    void runUntil(Predicate done, milliseconds timeout = milliseconds(10000)) {
        auto deadline = steady_clock::now() + timeout;
        while (!done() && steady_clock::now() < deadline) {
            io.run_one_for(milliseconds(50));
        }
    }

    void runUntilFinished() {
        runUntil([this]{ return finished.has_value(); });
    }

    fs::path dir;
    asio::io_context io;
    RecordingOptions options;
    std::optional<bool> finished;
};

TEST_F(RecordingEngineTest, MissingDemodulator) {
    options.demodulatorPath = (dir / "missing").string();
    RecordingEngine engine(io, options);

    EXPECT_FALSE(engine.startCapture(noaa19()));
    EXPECT_FALSE(engine.isRecording());
}

TEST_F(RecordingEngineTest, OnlyOneCaptureAtATime) {
    RecordingEngine engine(io, options);

    EXPECT_TRUE(engine.startCapture(noaa19()));
    EXPECT_TRUE(engine.isRecording());
    EXPECT_TRUE(fs::is_directory(options.recordingsDirectory));

    auto other = noaa19();
    other.satellite = "NOAA 18";
    EXPECT_FALSE(engine.startCapture(other));

    engine.abort();
    EXPECT_FALSE(engine.isRecording());
}

TEST_F(RecordingEngineTest, DemodulatorFailureEndsCapture) {
    options.demodulatorPath = writeScript("demodulator", "exit 3");
    RecordingEngine engine(io, options);

    std::optional<std::string> satellite;
    int artifacts = 0;
    engine.onCaptureFinished([&](const CaptureRequest &request, bool success) {
        satellite = request.satellite;
        finished = success;
    });
    engine.onArtifact([&](const Artifact&) { artifacts++; });

    ASSERT_TRUE(engine.startCapture(noaa19()));
    runUntilFinished();

    ASSERT_TRUE(finished.has_value());
    EXPECT_FALSE(*finished);
    EXPECT_EQ(satellite.value_or(""), "NOAA 19");
    EXPECT_EQ(artifacts, 0);
    EXPECT_FALSE(engine.isRecording());

    // The engine accepts the next pass
    options.demodulatorPath = writeScript("demodulator", "exec sleep 30");
    EXPECT_TRUE(engine.startCapture(noaa19()));
    engine.abort();
}

TEST_F(RecordingEngineTest, CaptureIsStoppedAndDownsampled) {
    options.demodulatorPath = writeScript("demodulator",
        "while true; do printf 'RIFFdata'; sleep 0.1; done");
    options.encoderPath = writeSox();
    options.downsample = true;
    RecordingEngine engine(io, options);

    std::optional<Artifact> artifact;
    engine.onCaptureFinished([&](const CaptureRequest&, bool success) { finished = success; });
    engine.onArtifact([&](const Artifact &a) { artifact = a; });

    auto request = noaa19();
    request.duration = seconds(1);
    ASSERT_TRUE(engine.startCapture(request));
    runUntil([&]{ return artifact.has_value(); });

    ASSERT_TRUE(finished.has_value());
    EXPECT_TRUE(*finished);
    EXPECT_FALSE(engine.isRecording());

    ASSERT_TRUE(artifact.has_value());
    EXPECT_EQ(artifact->request.satellite, "NOAA 19");
    EXPECT_EQ(artifact->rawFile, rawArtifactPath(options, request));
    EXPECT_EQ(artifact->file, artifactPath(options, request));
    EXPECT_TRUE(fs::exists(artifact->rawFile));
    ASSERT_TRUE(fs::exists(artifact->file));
    EXPECT_GT(fs::file_size(artifact->file), 0);
}

TEST_F(RecordingEngineTest, StubbornDemodulatorIsKilled) {
    options.demodulatorPath = writeScript("demodulator",
        "trap '' TERM\n"
        "while true; do printf 'RIFFdata'; sleep 0.1; done");
    options.encoderPath = writeSox();
    options.stopGracePeriod = seconds(1);
    RecordingEngine engine(io, options);

    std::optional<Artifact> artifact;
    engine.onCaptureFinished([&](const CaptureRequest&, bool success) { finished = success; });
    engine.onArtifact([&](const Artifact &a) { artifact = a; });

    auto request = noaa19();
    request.duration = seconds(1);
    auto started = steady_clock::now();
    ASSERT_TRUE(engine.startCapture(request));
    runUntil([&]{ return artifact.has_value(); });

    // The recording is kept even though it had to be killed
    ASSERT_TRUE(finished.has_value());
    EXPECT_TRUE(*finished);
    EXPECT_GE(steady_clock::now() - started, seconds(2));
    EXPECT_FALSE(engine.isRecording());

    ASSERT_TRUE(artifact.has_value());
    EXPECT_EQ(artifact->file, rawArtifactPath(options, request));
    EXPECT_TRUE(fs::exists(artifact->file));
}

}
}
