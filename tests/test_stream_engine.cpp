#include "test_support.h"
#include "vigil/stream/stream_engine.h"
#include <gtest/gtest.h>
#include <map>

using namespace vigil;
using namespace vigil::testutil;
using stream::AnomalyVerdict;
using stream::StreamEngine;

namespace {

EngineConfig engine_config() {
    EngineConfig config;
    config.window.min_samples = 1;
    config.window.emit_every = 1;
    config.window.max_count = 10;
    config.detector.default_threshold = 0.8;
    config.detector.breach_count = 1;
    config.cache.max_load_retries = 0;
    config.publish.max_attempts = 2;
    config.publish.retry_backoff_ms = 1;
    config.lanes.worker_threads = 3;
    config.lanes.batch_size = 4;
    return config;
}

class StreamEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = std::make_shared<FakeModelStore>();
        builder = std::make_shared<FakeModelBuilder>();
        trends = std::make_shared<FakeTrendSource>();
        transport = std::make_shared<RecordingTransport>();
    }

    std::unique_ptr<StreamEngine> make_engine(const EngineConfig& config) {
        cache = std::make_shared<ai::ModelCache>(config.cache, store, builder, trends);
        auto engine = std::make_unique<StreamEngine>(config, cache, transport);
        engine->start();
        return engine;
    }

    std::shared_ptr<FakeModelStore> store;
    std::shared_ptr<FakeModelBuilder> builder;
    std::shared_ptr<FakeTrendSource> trends;
    std::shared_ptr<RecordingTransport> transport;
    std::shared_ptr<ai::ModelCache> cache;
};

} // namespace

TEST_F(StreamEngineTest, PublishesAlertWhenScoreCrossesThreshold) {
    store->set("m1", constant_artifact_bytes("m1", 0.95));
    auto engine = make_engine(engine_config());

    EXPECT_TRUE(engine->submit(make_reading("m1", 1000, {{"temp", 71.5}})));
    engine->stop();

    auto records = transport->snapshot();
    ASSERT_EQ(records.size(), 1u);
    auto alert = nlohmann::json::parse(records.front());
    EXPECT_EQ(alert["monitorId"].get<std::string>(), "m1");
    EXPECT_EQ(alert["timestamp"].get<int64_t>(), 1000);
    EXPECT_DOUBLE_EQ(alert["score"].get<double>(), 0.95);
    EXPECT_TRUE(alert["isAnomaly"].get<bool>());
    EXPECT_FALSE(alert["degraded"].get<bool>());
    EXPECT_EQ(alert["modelVersion"].get<uint64_t>(), 1u);
    EXPECT_EQ(alert["topFeatures"].size(), 2u);

    auto stats = engine->stats();
    EXPECT_EQ(stats.received, 1u);
    EXPECT_EQ(stats.scored, 1u);
    EXPECT_EQ(stats.anomalies, 1u);
    EXPECT_EQ(stats.published, 1u);
}

TEST_F(StreamEngineTest, ScoreBelowThresholdPublishesNothing) {
    store->set("m1", constant_artifact_bytes("m1", 0.4));
    auto engine = make_engine(engine_config());

    for (int i = 0; i < 5; ++i) {
        engine->submit(make_reading("m1", i * 1000, {{"temp", 20.0}}));
    }
    engine->stop();

    EXPECT_TRUE(transport->snapshot().empty());
    EXPECT_EQ(engine->stats().scored, 5u);
    EXPECT_EQ(engine->stats().anomalies, 0u);
}

TEST_F(StreamEngineTest, NoModelMeansNoAlerts) {
    builder->fail = true;
    auto engine = make_engine(engine_config());

    for (int i = 0; i < 3; ++i) {
        engine->submit(make_reading("m2", i * 1000, {{"temp", 99.0}}));
    }
    engine->stop();

    EXPECT_TRUE(transport->snapshot().empty());
    auto stats = engine->stats();
    EXPECT_GT(stats.unavailable, 0u);
    EXPECT_EQ(stats.scored, 0u);
    EXPECT_EQ(stats.published, 0u);
}

TEST_F(StreamEngineTest, SchemaMismatchSkipsScoringWithoutRebuild) {
    store->set("m1", constant_artifact_bytes("m1", 0.95, {"temp"}));
    auto engine = make_engine(engine_config());

    engine->submit(make_reading("m1", 1000, {{"temp", 20.0}, {"pressure", 1.2}}));
    engine->submit(make_reading("m1", 2000, {{"temp", 21.0}, {"pressure", 1.3}}));
    engine->stop();

    EXPECT_TRUE(transport->snapshot().empty());
    EXPECT_EQ(engine->stats().schema_mismatches, 2u);
    EXPECT_EQ(engine->stats().scored, 0u);
    EXPECT_EQ(builder->calls.load(), 0);
}

TEST_F(StreamEngineTest, HysteresisAndOrderingPerMonitor) {
    EngineConfig config = engine_config();
    config.detector.breach_count = 3;

    const std::vector<std::string> monitors = {"m1", "m2", "m3", "m4", "m5"};
    for (const auto& id : monitors) {
        store->set(id, constant_artifact_bytes(id, 0.95));
    }
    auto engine = make_engine(config);

    std::mutex seen_mutex;
    std::map<std::string, std::vector<AnomalyVerdict>> seen;
    engine->set_verdict_listener([&](const AnomalyVerdict& verdict) {
        std::lock_guard<std::mutex> lock(seen_mutex);
        seen[verdict.monitor_id].push_back(verdict);
    });

    const int per_monitor = 30;
    for (int i = 0; i < per_monitor; ++i) {
        for (const auto& id : monitors) {
            engine->submit(make_reading(id, i * 1000, {{"temp", 50.0 + i}}));
        }
    }
    engine->stop();

    EXPECT_EQ(engine->lane_count(), monitors.size());
    EXPECT_EQ(transport->snapshot().size(), monitors.size() * (per_monitor - 2));

    for (const auto& id : monitors) {
        const auto& verdicts = seen[id];
        ASSERT_EQ(verdicts.size(), static_cast<size_t>(per_monitor)) << id;
        for (size_t i = 0; i < verdicts.size(); ++i) {
            EXPECT_EQ(verdicts[i].timestamp, static_cast<Timestamp>(i) * 1000) << id;
            EXPECT_EQ(verdicts[i].consecutive_breaches, i + 1) << id;
            EXPECT_EQ(verdicts[i].is_anomaly, i >= 2) << id;
        }
    }
}

TEST_F(StreamEngineTest, PublishFailuresAreCountedAndProcessingContinues) {
    store->set("m1", constant_artifact_bytes("m1", 0.95));
    transport->failures_remaining = 4;
    auto engine = make_engine(engine_config());

    for (int i = 0; i < 3; ++i) {
        engine->submit(make_reading("m1", i * 1000, {{"temp", 20.0}}));
    }
    engine->stop();

    // Two attempts each: the first two alerts exhaust the injected failures
    auto stats = engine->stats();
    EXPECT_EQ(stats.anomalies, 3u);
    EXPECT_EQ(stats.publish_failures, 2u);
    EXPECT_EQ(stats.published, 1u);
    EXPECT_EQ(transport->snapshot().size(), 1u);
}

TEST_F(StreamEngineTest, RejectsMalformedPayloads) {
    store->set("m1", constant_artifact_bytes("m1", 0.95));
    auto engine = make_engine(engine_config());

    EXPECT_FALSE(engine->submit_raw("not json"));
    EXPECT_FALSE(engine->submit_raw(R"({"monitor_id": "m1", "values": {"temp": 1}})"));
    EXPECT_TRUE(engine->submit_raw(R"({"monitor_id": "m1", "timestamp": 5, "values": {"temp": "1.5"}})"));
    engine->stop();

    auto stats = engine->stats();
    EXPECT_EQ(stats.received, 3u);
    EXPECT_EQ(stats.rejected, 2u);
    EXPECT_EQ(stats.scored, 1u);
}

TEST_F(StreamEngineTest, FlushOnStopScoresHeldReadings) {
    EngineConfig config = engine_config();
    config.window.lateness_ms = 60000;
    store->set("m1", constant_artifact_bytes("m1", 0.95));
    auto engine = make_engine(config);

    engine->submit(make_reading("m1", 3000, {{"temp", 1.0}}));
    engine->submit(make_reading("m1", 1000, {{"temp", 1.0}}));
    engine->submit(make_reading("m1", 2000, {{"temp", 1.0}}));
    engine->drain();
    EXPECT_EQ(engine->stats().scored, 0u);

    engine->stop();
    EXPECT_EQ(engine->stats().scored, 3u);
    EXPECT_EQ(transport->snapshot().size(), 3u);
}

TEST_F(StreamEngineTest, SubmitAfterStopIsRefused) {
    auto engine = make_engine(engine_config());
    engine->stop();
    EXPECT_FALSE(engine->submit(make_reading("m1", 1000, {{"temp", 1.0}})));
}
