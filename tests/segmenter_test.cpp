/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <groundstation/segmenter.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <string>

#include <date/date.h>

namespace groundstation {
namespace {

using namespace std::chrono;

const time_point BASE = date::sys_days{date::year{2026}/10/19} + hours(14);

const std::string NOAA19_TLE =
    "NOAA 19\n"
    "1 33591U 09005A   25333.78204194  .00000054  00000+0  52635-4 0  9999\n"
    "2 33591  98.9785  39.2910 0013037 231.6546 128.3455 14.13431889866318\n";

// Scripted track: minute offset from BASE to sample. Minutes that are not
// scripted are far out of view.
class ScriptedSampler : public Sampler {
public:
    using Script = std::function<std::optional<Sample>(int minute)>;

    explicit ScriptedSampler(Script script) : script(std::move(script)) {}

    std::optional<Sample> sampleAt(time_point tp) const override {
        calls++;
        int minute = static_cast<int>(duration_cast<minutes>(tp - BASE).count());
        return script(minute);
    }

    mutable int calls = 0;

private:
    Script script;
};

Sample visible(double elevation, double distance = 500000.0) {
    return Sample{
        .subPoint = Geodetic::fromDegrees(0.0, 0.0, 850.0),
        .elevationInDegrees = elevation,
        .distanceInMeters = distance
    };
}

Sample hidden() {
    return visible(-20.0, 5000000.0);
}

class SegmenterTest : public ::testing::Test {
protected:
    SegmenterOptions options{
        .observer = Geodetic::fromDegrees(35.0, -80.0, 0.0),
        .horizonDays = 1,
        .minElevationInDegrees = 30.0,
        .maxDistanceInMeters = 2200000.0,
        .bufferMinutes = 0
    };
};

// ============================================================================
// Pass Boundary Tests
// ============================================================================

TEST_F(SegmenterTest, BufferedPass) {
    options.bufferMinutes = 2;
    PassSegmenter segmenter(options);
    ScriptedSampler sampler([](int m) -> std::optional<Sample> {
        if (m >= 10 && m <= 22) {
            return visible(m == 16 ? 75.0 : 40.0);
        }
        return hidden();
    });

    auto passes = segmenter.segmentObject(sampler, "NOAA 19", "137.1M", BASE);
    ASSERT_EQ(passes.size(), 1);
    EXPECT_EQ(passes[0].satellite, "NOAA 19");
    EXPECT_EQ(passes[0].frequency, "137.1M");
    EXPECT_EQ(passes[0].start, BASE + minutes(8));
    // In view 10..22, closed by the first hidden sample at 23, plus 2 minutes each side
    EXPECT_EQ(passes[0].durationInMinutes, 17);
    EXPECT_GE(passes[0].durationInMinutes, 16);
    EXPECT_DOUBLE_EQ(passes[0].maxElevation, 75.0);
    EXPECT_FALSE(passes[0].recorded);
}

TEST_F(SegmenterTest, StatisticsFromInViewSamples) {
    PassSegmenter segmenter(options);
    ScriptedSampler sampler([](int m) -> std::optional<Sample> {
        switch (m) {
            case 100: return visible(40.0, 900000.0);
            case 101: return visible(60.0, 300000.0);
            case 102: return visible(50.0, 600000.0);
            default: return hidden();
        }
    });

    auto passes = segmenter.segmentObject(sampler, "NOAA 18", "137.9125M", BASE);
    ASSERT_EQ(passes.size(), 1);
    EXPECT_EQ(passes[0].start, BASE + minutes(100));
    EXPECT_EQ(passes[0].durationInMinutes, 3);
    EXPECT_DOUBLE_EQ(passes[0].maxElevation, 60.0);
    EXPECT_DOUBLE_EQ(passes[0].avgElevation, 50.0);
    EXPECT_DOUBLE_EQ(passes[0].minDistance, 300000.0);
    EXPECT_DOUBLE_EQ(passes[0].avgDistance, 600000.0);
}

TEST_F(SegmenterTest, ShortPassExtendedToMinimum) {
    PassSegmenter segmenter(options);
    ScriptedSampler sampler([](int m) -> std::optional<Sample> {
        return m == 5 ? visible(35.0) : hidden();
    });

    auto passes = segmenter.segmentObject(sampler, "NOAA 15", "137.62M", BASE);
    ASSERT_EQ(passes.size(), 1);
    EXPECT_EQ(passes[0].start, BASE + minutes(5));
    EXPECT_EQ(passes[0].durationInMinutes, MINIMUM_PASS_DURATION.count());
}

TEST_F(SegmenterTest, MultiplePassesInOrder) {
    PassSegmenter segmenter(options);
    ScriptedSampler sampler([](int m) -> std::optional<Sample> {
        if ((m >= 50 && m < 60) || (m >= 150 && m < 158) || (m >= 250 && m < 254)) {
            return visible(45.0);
        }
        return hidden();
    });

    auto passes = segmenter.segmentObject(sampler, "NOAA 19", "137.1M", BASE);
    ASSERT_EQ(passes.size(), 3);
    EXPECT_EQ(passes[0].start, BASE + minutes(50));
    EXPECT_EQ(passes[0].durationInMinutes, 10);
    EXPECT_EQ(passes[1].start, BASE + minutes(150));
    EXPECT_EQ(passes[1].durationInMinutes, 8);
    EXPECT_EQ(passes[2].start, BASE + minutes(250));
    EXPECT_EQ(passes[2].durationInMinutes, 4);
}

TEST_F(SegmenterTest, PassOpenAtHorizonClosesAtBoundary) {
    PassSegmenter segmenter(options);
    ScriptedSampler sampler([](int m) -> std::optional<Sample> {
        return m >= 1435 ? visible(50.0) : hidden();
    });

    auto passes = segmenter.segmentObject(sampler, "NOAA 19", "137.1M", BASE);
    ASSERT_EQ(passes.size(), 1);
    EXPECT_EQ(passes[0].start, BASE + minutes(1435));
    EXPECT_EQ(passes[0].end(), BASE + days(1));
    EXPECT_EQ(sampler.calls, 1440);
}

// ============================================================================
// Visibility Criteria Tests
// ============================================================================

TEST_F(SegmenterTest, TooFarAwayIsNotInView) {
    PassSegmenter segmenter(options);
    ScriptedSampler sampler([](int m) -> std::optional<Sample> {
        return (m >= 10 && m < 20) ? visible(70.0, 2500000.0) : hidden();
    });

    EXPECT_TRUE(segmenter.segmentObject(sampler, "NOAA 19", "137.1M", BASE).empty());
}

TEST_F(SegmenterTest, TooLowIsNotInView) {
    PassSegmenter segmenter(options);
    ScriptedSampler sampler([](int m) -> std::optional<Sample> {
        return (m >= 10 && m < 20) ? visible(29.9, 100000.0) : hidden();
    });

    EXPECT_TRUE(segmenter.segmentObject(sampler, "NOAA 19", "137.1M", BASE).empty());
}

TEST_F(SegmenterTest, EitherCriterionClosesPass) {
    PassSegmenter segmenter(options);
    ScriptedSampler sampler([](int m) -> std::optional<Sample> {
        if (m >= 10 && m < 15) {
            return visible(45.0);
        }
        if (m >= 15 && m < 20) {
            // Still high, but the sub-point has moved out of range
            return visible(45.0, 3000000.0);
        }
        return hidden();
    });

    auto passes = segmenter.segmentObject(sampler, "NOAA 19", "137.1M", BASE);
    ASSERT_EQ(passes.size(), 1);
    EXPECT_EQ(passes[0].durationInMinutes, 5);
}

TEST_F(SegmenterTest, FailedSamplesAreSkipped) {
    PassSegmenter segmenter(options);
    ScriptedSampler sampler([](int m) -> std::optional<Sample> {
        if (m == 13) {
            return std::nullopt;
        }
        return (m >= 10 && m < 16) ? visible(45.0) : hidden();
    });

    auto passes = segmenter.segmentObject(sampler, "NOAA 19", "137.1M", BASE);
    ASSERT_EQ(passes.size(), 1);
    EXPECT_EQ(passes[0].start, BASE + minutes(10));
    EXPECT_EQ(passes[0].durationInMinutes, 6);
}

TEST_F(SegmenterTest, StartIsFlooredToTheMinute) {
    PassSegmenter segmenter(options);
    ScriptedSampler sampler([](int m) -> std::optional<Sample> {
        return m == 0 ? visible(45.0) : hidden();
    });

    auto passes = segmenter.segmentObject(sampler, "NOAA 19", "137.1M", BASE + seconds(42));
    ASSERT_EQ(passes.size(), 1);
    EXPECT_EQ(passes[0].start, BASE);
}

TEST_F(SegmenterTest, HorizonDaysExtendsSearch) {
    options.horizonDays = 3;
    PassSegmenter segmenter(options);
    ScriptedSampler sampler([](int) -> std::optional<Sample> {
        return hidden();
    });

    EXPECT_TRUE(segmenter.segmentObject(sampler, "NOAA 19", "137.1M", BASE).empty());
    EXPECT_EQ(sampler.calls, 3 * 1440);
}

// ============================================================================
// Orbit Tests
// ============================================================================

TEST_F(SegmenterTest, RealOrbitProducesPasses) {
    options.minElevationInDegrees = 10.0;
    options.maxDistanceInMeters = 3000000.0;
    options.bufferMinutes = 1;
    PassSegmenter segmenter(options);

    auto elements = ElementSet::parse(NOAA19_TLE);
    std::map<std::string, std::string> frequencies{
        {"NOAA 19", "137.1M"},
        {"NOAA 15", "137.62M"}  // Not in the element set
    };

    time_point start = date::sys_days{date::year{2025}/12/1};
    auto passes = segmenter.segment(elements, frequencies, start);

    ASSERT_FALSE(passes.empty());
    for (std::size_t i = 0; i < passes.size(); i++) {
        EXPECT_EQ(passes[i].satellite, "NOAA 19");
        EXPECT_EQ(passes[i].frequency, "137.1M");
        EXPECT_GE(passes[i].durationInMinutes, MINIMUM_PASS_DURATION.count());
        EXPECT_LT(passes[i].durationInMinutes, 30);
        EXPECT_GE(passes[i].maxElevation, 10.0);
        EXPECT_LE(passes[i].minDistance, 3000000.0);
        EXPECT_GE(passes[i].start, start - minutes(1));
        if (i > 0) {
            EXPECT_GT(passes[i].start, passes[i - 1].start);
        }
    }
}

TEST_F(SegmenterTest, SameInputsGiveSamePasses) {
    options.minElevationInDegrees = 10.0;
    options.maxDistanceInMeters = 3000000.0;
    PassSegmenter segmenter(options);

    auto elements = ElementSet::parse(NOAA19_TLE);
    std::map<std::string, std::string> frequencies{{"NOAA 19", "137.1M"}};
    time_point start = date::sys_days{date::year{2025}/12/1};

    auto first = segmenter.segment(elements, frequencies, start);
    auto second = segmenter.segment(elements, frequencies, start);
    ASSERT_EQ(first.size(), second.size());
    for (std::size_t i = 0; i < first.size(); i++) {
        EXPECT_EQ(first[i].key(), second[i].key());
        EXPECT_EQ(first[i].durationInMinutes, second[i].durationInMinutes);
        EXPECT_DOUBLE_EQ(first[i].maxElevation, second[i].maxElevation);
    }
}

}
}
