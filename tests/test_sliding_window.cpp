#include "test_support.h"
#include "vigil/errors.h"
#include "vigil/stream/sliding_window.h"
#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <random>

using vigil::Reading;
using vigil::WindowConfig;
using vigil::WindowSummary;
using vigil::stream::SlidingWindow;
using vigil::testutil::make_reading;

namespace {

WindowConfig every_reading(int64_t span_ms, size_t max_count) {
    WindowConfig config;
    config.span_ms = span_ms;
    config.max_count = max_count;
    config.min_samples = 1;
    config.emit_every = 1;
    return config;
}

std::vector<WindowSummary> feed(SlidingWindow& window, const std::vector<Reading>& readings) {
    std::vector<WindowSummary> out;
    for (const auto& reading : readings) {
        auto emitted = window.ingest(reading);
        out.insert(out.end(), emitted.begin(), emitted.end());
    }
    auto tail = window.flush();
    out.insert(out.end(), tail.begin(), tail.end());
    return out;
}

} // namespace

TEST(SlidingWindowTest, RetainsReadingsWithinSpanAndCount) {
    SlidingWindow window("m1", every_reading(300000, 100));

    for (int i = 0; i < 150; ++i) {
        window.ingest(make_reading("m1", i * 4000, {{"temp", static_cast<double>(i)}}));
    }
    window.flush();

    // Newest reading is at 596000; everything older than 296000 is gone
    EXPECT_EQ(window.size(), 76u);
    EXPECT_GE(window.readings().front().timestamp, 296000);
    EXPECT_EQ(window.readings().back().timestamp, 596000);
}

TEST(SlidingWindowTest, CountBoundWinsWhenTighter) {
    SlidingWindow window("m1", every_reading(300000, 10));

    for (int i = 0; i < 50; ++i) {
        window.ingest(make_reading("m1", i * 1000, {{"temp", 1.0}}));
    }
    window.flush();

    EXPECT_EQ(window.size(), 10u);
    EXPECT_EQ(window.readings().front().timestamp, 40000);
}

TEST(SlidingWindowTest, EverySummaryRespectsBothBounds) {
    WindowConfig config = every_reading(20000, 8);
    SlidingWindow window("m1", config);

    std::mt19937 rng(7);
    std::uniform_int_distribution<int> step(500, 6000);
    std::vector<Reading> readings;
    int64_t ts = 0;
    for (int i = 0; i < 200; ++i) {
        ts += step(rng);
        readings.push_back(make_reading("m1", ts, {{"temp", static_cast<double>(i % 11)}}));
    }

    auto summaries = feed(window, readings);
    ASSERT_FALSE(summaries.empty());
    for (const auto& summary : summaries) {
        EXPECT_LE(summary.sample_count, config.max_count);
        EXPECT_LE(summary.window_end - summary.window_start, config.span_ms);
        EXPECT_GE(summary.sample_count, config.min_samples);
    }
}

TEST(SlidingWindowTest, ComputesStatisticsPerSensor) {
    SlidingWindow window("m1", every_reading(60000, 10));

    window.ingest(make_reading("m1", 1000, {{"temp", 1.0}, {"pressure", 10.0}}));
    window.ingest(make_reading("m1", 2000, {{"temp", 2.0}, {"pressure", 20.0}}));
    window.ingest(make_reading("m1", 3000, {{"temp", 3.0}, {"pressure", 30.0}}));
    auto summaries = window.flush();

    ASSERT_EQ(summaries.size(), 1u);
    const WindowSummary& summary = summaries.front();
    EXPECT_EQ(summary.sensors, (std::vector<std::string>{"pressure", "temp"}));
    EXPECT_EQ(summary.sample_count, 3u);
    EXPECT_EQ(summary.window_start, 1000);
    EXPECT_EQ(summary.window_end, 3000);
    EXPECT_EQ(summary.feature_names.size(), 10u);
    EXPECT_EQ(summary.feature_names.front(), "pressure:mean");

    EXPECT_DOUBLE_EQ(summary.feature("temp:mean"), 2.0);
    EXPECT_NEAR(summary.feature("temp:std"), std::sqrt(2.0 / 3.0), 1e-12);
    EXPECT_DOUBLE_EQ(summary.feature("temp:min"), 1.0);
    EXPECT_DOUBLE_EQ(summary.feature("temp:max"), 3.0);
    EXPECT_DOUBLE_EQ(summary.feature("temp:last"), 3.0);
    EXPECT_DOUBLE_EQ(summary.feature("pressure:mean"), 20.0);
}

TEST(SlidingWindowTest, MissingSensorValuesAreExcludedFromThatSensor) {
    SlidingWindow window("m1", every_reading(60000, 10));

    window.ingest(make_reading("m1", 1000, {{"temp", 4.0}, {"flow", 1.0}}));
    window.ingest(make_reading("m1", 2000, {{"temp", 6.0}}));
    window.ingest(make_reading("m1", 3000, {{"temp", 8.0}}));
    auto summaries = window.flush();

    ASSERT_EQ(summaries.size(), 1u);
    const WindowSummary& summary = summaries.front();
    EXPECT_EQ(summary.sensors, (std::vector<std::string>{"flow", "temp"}));
    EXPECT_DOUBLE_EQ(summary.feature("flow:mean"), 1.0);
    EXPECT_DOUBLE_EQ(summary.feature("flow:last"), 1.0);
    EXPECT_DOUBLE_EQ(summary.feature("temp:mean"), 6.0);
}

TEST(SlidingWindowTest, NoSummaryBelowMinimumSamples) {
    WindowConfig config = every_reading(60000, 10);
    config.min_samples = 3;
    SlidingWindow window("m1", config);

    EXPECT_TRUE(window.ingest(make_reading("m1", 1000, {{"temp", 1.0}})).empty());
    EXPECT_TRUE(window.ingest(make_reading("m1", 2000, {{"temp", 1.0}})).empty());
    EXPECT_TRUE(window.ingest(make_reading("m1", 3000, {{"temp", 1.0}})).empty());
    // The 3000 reading commits with the next newer timestamp
    auto summaries = window.ingest(make_reading("m1", 4000, {{"temp", 1.0}}));
    ASSERT_EQ(summaries.size(), 1u);
    EXPECT_EQ(summaries.front().window_end, 3000);
    EXPECT_EQ(summaries.front().sample_count, 3u);
}

TEST(SlidingWindowTest, EmitsEveryNCommittedReadings) {
    WindowConfig config = every_reading(600000, 100);
    config.emit_every = 3;
    SlidingWindow window("m1", config);

    size_t emitted = 0;
    for (int i = 0; i < 12; ++i) {
        emitted += window.ingest(make_reading("m1", i * 1000, {{"temp", 1.0}})).size();
    }
    emitted += window.flush().size();
    EXPECT_EQ(emitted, 4u);
}

TEST(SlidingWindowTest, TickModeEmitsOncePerBoundaryCrossed) {
    WindowConfig config = every_reading(600000, 100);
    config.tick_ms = 10000;
    SlidingWindow window("m1", config);

    std::vector<int64_t> emitted_at;
    for (int i = 0; i < 40; ++i) {
        for (const auto& summary : window.ingest(make_reading("m1", i * 1000, {{"temp", 1.0}}))) {
            emitted_at.push_back(summary.window_end);
        }
    }
    EXPECT_EQ(emitted_at, (std::vector<int64_t>{10000, 20000, 30000}));
}

TEST(SlidingWindowTest, ReadingBehindWatermarkIsDropped) {
    WindowConfig config = every_reading(60000, 100);
    config.lateness_ms = 5000;
    SlidingWindow window("m1", config);

    window.ingest(make_reading("m1", 10000, {{"temp", 1.0}}));
    window.ingest(make_reading("m1", 20000, {{"temp", 1.0}}));
    EXPECT_EQ(window.watermark(), 15000);

    EXPECT_TRUE(window.ingest(make_reading("m1", 14000, {{"temp", 9.0}})).empty());
    EXPECT_EQ(window.late_drops(), 1u);

    // Inside the lateness bound: held, then committed in order
    window.ingest(make_reading("m1", 17000, {{"temp", 1.0}}));
    EXPECT_EQ(window.late_drops(), 1u);
    window.flush();
    std::vector<int64_t> order;
    for (const auto& reading : window.readings()) order.push_back(reading.timestamp);
    EXPECT_EQ(order, (std::vector<int64_t>{10000, 17000, 20000}));
}

TEST(SlidingWindowTest, ImmediateModeDropsAnyRegression) {
    SlidingWindow window("m1", every_reading(60000, 100));

    window.ingest(make_reading("m1", 10000, {{"temp", 1.0}}));
    window.ingest(make_reading("m1", 9999, {{"temp", 1.0}}));
    EXPECT_EQ(window.late_drops(), 1u);

    // Equal timestamps are not late
    window.ingest(make_reading("m1", 10000, {{"temp", 2.0}}));
    EXPECT_EQ(window.late_drops(), 1u);
    EXPECT_EQ(window.pending(), 2u);
    window.flush();
    EXPECT_EQ(window.size(), 2u);
}

TEST(SlidingWindowTest, EqualTimestampsCommitInCanonicalOrder) {
    WindowConfig config = every_reading(60000, 2);

    std::vector<Reading> ordered = {
        make_reading("m1", 1000, {{"temp", 1.0}}),
        make_reading("m1", 2000, {{"temp", 5.0}}),
        make_reading("m1", 2000, {{"temp", 3.0}}),
        make_reading("m1", 2000, {{"temp", 4.0}}),
        make_reading("m1", 3000, {{"temp", 2.0}}),
    };
    std::vector<Reading> reversed = {ordered[0], ordered[3], ordered[2], ordered[1], ordered[4]};

    SlidingWindow first("m1", config);
    SlidingWindow second("m1", config);
    auto a = feed(first, ordered);
    auto b = feed(second, reversed);

    EXPECT_EQ(first.late_drops(), 0u);
    EXPECT_EQ(second.late_drops(), 0u);
    ASSERT_EQ(a.size(), 5u);
    ASSERT_EQ(b.size(), a.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].window_end, b[i].window_end) << "summary " << i;
        EXPECT_EQ(a[i].features, b[i].features) << "summary " << i;
    }
    // Ties sort by value: the last 2000 reading committed is temp 5
    EXPECT_DOUBLE_EQ(a[3].feature("temp:last"), 5.0);
    EXPECT_DOUBLE_EQ(a[3].feature("temp:min"), 4.0);
}

TEST(SlidingWindowTest, OutputIndependentOfArrivalOrderWithinLateness) {
    WindowConfig config = every_reading(30000, 12);
    config.lateness_ms = 5000;
    config.emit_every = 2;

    std::vector<Reading> ordered;
    for (int i = 0; i < 120; ++i) {
        ordered.push_back(make_reading("m1", i * 1000, {{"temp", std::sin(i * 0.3)}, {"flow", i % 7 * 1.0}}));
    }

    SlidingWindow reference_window("m1", config);
    auto reference = feed(reference_window, ordered);
    ASSERT_FALSE(reference.empty());

    for (uint32_t seed : {1u, 2u, 3u, 4u, 5u}) {
        // Shuffle inside blocks of 5 readings (spans 4000ms, under the lateness bound)
        std::vector<Reading> shuffled = ordered;
        std::mt19937 rng(seed);
        for (size_t start = 0; start < shuffled.size(); start += 5) {
            auto end = shuffled.begin() + static_cast<std::ptrdiff_t>(std::min(start + 5, shuffled.size()));
            std::shuffle(shuffled.begin() + static_cast<std::ptrdiff_t>(start), end, rng);
        }

        SlidingWindow window("m1", config);
        auto summaries = feed(window, shuffled);
        EXPECT_EQ(window.late_drops(), 0u) << "seed " << seed;
        ASSERT_EQ(summaries.size(), reference.size()) << "seed " << seed;
        for (size_t i = 0; i < summaries.size(); ++i) {
            EXPECT_EQ(summaries[i].window_start, reference[i].window_start);
            EXPECT_EQ(summaries[i].window_end, reference[i].window_end);
            EXPECT_EQ(summaries[i].features, reference[i].features);
        }
    }
}

TEST(SlidingWindowTest, RejectsReadingForAnotherMonitor) {
    SlidingWindow window("m1", every_reading(60000, 10));
    EXPECT_THROW(window.ingest(make_reading("m2", 1000, {{"temp", 1.0}})), vigil::ValidationError);
}
