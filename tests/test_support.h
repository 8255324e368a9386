#pragma once
#ifndef VIGIL_TESTS_TEST_SUPPORT_H
#define VIGIL_TESTS_TEST_SUPPORT_H

#include "vigil/ai/model_artifact.h"
#include "vigil/ai/model_builder.h"
#include "vigil/ai/model_cache.h"
#include "vigil/ai/model_store.h"
#include "vigil/ai/trend_source.h"
#include "vigil/errors.h"
#include "vigil/stream/alert_emitter.h"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace vigil {
namespace testutil {

// Scores every input with the same value
class ConstantModel : public ai::IScoringModel {
public:
    ConstantModel(double score, size_t num_features, double threshold = 0.5)
        : score_(score), num_features_(num_features), threshold_(threshold) {}

    double score(const FeatureVector&) const override { return score_; }
    size_t num_features() const override { return num_features_; }
    std::string algorithm() const override { return "constant"; }
    double threshold() const override { return threshold_; }

    nlohmann::json to_json() const override {
        return {{"score", score_}, {"num_features", num_features_}, {"threshold", threshold_}};
    }

    static void register_decoder() {
        static std::once_flag once;
        std::call_once(once, [] {
            ai::ScoringModelRegistry::instance().register_decoder(
                "constant", [](const nlohmann::json& j) -> std::shared_ptr<const ai::IScoringModel> {
                    return std::make_shared<ConstantModel>(j.at("score").get<double>(),
                                                           j.at("num_features").get<size_t>(),
                                                           j.value("threshold", 0.5));
                });
        });
    }

private:
    double score_;
    size_t num_features_;
    double threshold_;
};

inline std::vector<std::string> default_statistics() {
    return {"mean", "std", "min", "max", "last"};
}

// Identity-scaled artifact around a ConstantModel
inline std::shared_ptr<ai::ModelArtifact> make_constant_artifact(
    const std::string& monitor_id,
    double score,
    std::vector<std::string> sensors = {"temp"},
    uint64_t version = 1,
    std::vector<std::string> statistics = default_statistics()) {

    ConstantModel::register_decoder();

    std::vector<std::string> names;
    for (const auto& sensor : sensors) {
        for (const auto& stat : statistics) {
            names.push_back(sensor + ":" + stat);
        }
    }

    auto artifact = std::make_shared<ai::ModelArtifact>();
    artifact->monitor_id = monitor_id;
    artifact->version = version;
    artifact->built_at = std::chrono::system_clock::now();
    artifact->valid = true;
    artifact->sensors = std::move(sensors);
    artifact->statistics = std::move(statistics);
    artifact->scaler = ai::RobustScaler(names,
                                        std::vector<double>(names.size(), 0.0),
                                        std::vector<double>(names.size(), 1.0));
    artifact->model = std::make_shared<ConstantModel>(score, names.size());
    artifact->metadata["source"] = "test";
    return artifact;
}

inline ai::ArtifactBytes constant_artifact_bytes(const std::string& monitor_id, double score,
                                                 std::vector<std::string> sensors = {"temp"},
                                                 uint64_t version = 1) {
    return ai::ArtifactCodec::encode(*make_constant_artifact(monitor_id, score, std::move(sensors), version));
}

inline Reading make_reading(const std::string& monitor_id, Timestamp ts,
                            std::map<std::string, double> values) {
    Reading reading;
    reading.monitor_id = monitor_id;
    reading.timestamp = ts;
    reading.values = std::move(values);
    return reading;
}

// In-memory store with failure injection
class FakeModelStore : public ai::IModelStore {
public:
    std::optional<ai::ArtifactBytes> get(const std::string& monitor_id) override {
        ++get_calls;
        if (fail_gets) {
            throw StorageError("injected get failure");
        }
        if (drop_connection) {
            throw std::runtime_error("connection reset");
        }
        std::lock_guard<std::mutex> lock(mutex);
        auto it = artifacts.find(monitor_id);
        if (it == artifacts.end()) return std::nullopt;
        return it->second;
    }

    void put(const std::string& monitor_id, const ai::ArtifactBytes& bytes) override {
        ++put_calls;
        if (fail_puts) {
            throw StorageError("injected put failure");
        }
        std::lock_guard<std::mutex> lock(mutex);
        artifacts[monitor_id] = bytes;
    }

    void set(const std::string& monitor_id, const ai::ArtifactBytes& bytes) {
        std::lock_guard<std::mutex> lock(mutex);
        artifacts[monitor_id] = bytes;
    }

    bool has(const std::string& monitor_id) {
        std::lock_guard<std::mutex> lock(mutex);
        return artifacts.count(monitor_id) > 0;
    }

    std::mutex mutex;
    std::map<std::string, ai::ArtifactBytes> artifacts;
    std::atomic<bool> fail_gets{false};
    std::atomic<bool> drop_connection{false};
    std::atomic<bool> fail_puts{false};
    std::atomic<int> get_calls{0};
    std::atomic<int> put_calls{0};
};

// Builder that returns a constant artifact, fails, or blocks on a gate
class FakeModelBuilder : public ai::IModelBuilder {
public:
    ai::ArtifactBytes build(const std::string& monitor_id, const std::vector<Reading>&) override {
        ++calls;
        int now_running = ++running;
        int seen = max_running.load();
        while (now_running > seen && !max_running.compare_exchange_weak(seen, now_running)) {
        }
        try {
            ai::ArtifactBytes bytes = build_once(monitor_id);
            --running;
            return bytes;
        } catch (...) {
            --running;
            throw;
        }
    }

    void open_gate() { gate_promise.set_value(); }

    std::atomic<int> calls{0};
    std::atomic<int> running{0};
    std::atomic<int> max_running{0};
    std::atomic<bool> entered{false};
    std::atomic<bool> fail{false};
    bool gated = false;
    std::promise<void> gate_promise;
    std::shared_future<void> gate = gate_promise.get_future().share();
    std::chrono::milliseconds delay{0};
    double score = 0.5;
    std::vector<std::string> sensors = {"temp"};
    std::atomic<uint64_t> version{100};

private:
    ai::ArtifactBytes build_once(const std::string& monitor_id) {
        entered.store(true);
        if (gated) {
            gate.wait();
        }
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        if (fail) {
            throw BuildError("injected build failure");
        }
        return constant_artifact_bytes(monitor_id, score, sensors, ++version);
    }
};

class FakeTrendSource : public ai::ITrendSource {
public:
    std::vector<Reading> history(const std::string& monitor_id, size_t) override {
        ++calls;
        std::vector<Reading> readings;
        for (int i = 0; i < 20; ++i) {
            readings.push_back(make_reading(monitor_id, i * 1000, {{"temp", 20.0 + i % 3}}));
        }
        return readings;
    }

    std::atomic<int> calls{0};
};

// Transport that records or fails a configurable number of sends
class RecordingTransport : public stream::IAlertTransport {
public:
    void send(const std::string& record) override {
        std::lock_guard<std::mutex> lock(mutex);
        ++attempts;
        if (failures_remaining > 0) {
            --failures_remaining;
            throw TransportError("injected send failure");
        }
        records.push_back(record);
    }

    std::vector<std::string> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return records;
    }

    std::mutex mutex;
    std::vector<std::string> records;
    int failures_remaining = 0;
    int attempts = 0;
};

// Steady clock the test advances by hand
class ManualClock {
public:
    ai::ModelCache::Clock::time_point now() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void advance(std::chrono::milliseconds delta) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += delta;
    }

    ai::ModelCache::ClockFn fn() {
        return [this]() { return now(); };
    }

private:
    mutable std::mutex mutex_;
    ai::ModelCache::Clock::time_point now_ = ai::ModelCache::Clock::time_point(std::chrono::hours(1));
};

// Fresh directory under the system temp dir, removed on destruction
class TempDir {
public:
    explicit TempDir(const std::string& prefix) {
        static std::atomic<int> counter{0};
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                (prefix + "-" + std::to_string(rd()) + "-" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace testutil
} // namespace vigil

#endif // VIGIL_TESTS_TEST_SUPPORT_H
