#pragma once
#ifndef VIGIL_CONFIG_H
#define VIGIL_CONFIG_H

#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace vigil {

struct WindowConfig {
    int64_t span_ms = 300000;          // time bound
    size_t max_count = 10;             // count bound, 0 = unbounded
    size_t min_samples = 3;            // fewer retained readings -> no summary
    int64_t lateness_ms = 0;           // out-of-order tolerance
    size_t emit_every = 3;             // emit after every N committed readings
    int64_t tick_ms = 0;               // event-time tick, replaces emit_every when > 0
    std::vector<std::string> statistics = {"mean", "std", "min", "max", "last"};

    nlohmann::json to_json() const;
    static WindowConfig from_json(const nlohmann::json& j);
};

struct MonitorPolicy {
    double threshold = 0.65;
    size_t breach_count = 1;

    nlohmann::json to_json() const;
    static MonitorPolicy from_json(const nlohmann::json& j, const MonitorPolicy& defaults);
};

struct DetectorConfig {
    double default_threshold = 0.65;
    size_t breach_count = 1;
    bool use_model_threshold = false;
    size_t top_features = 2;
    std::map<std::string, MonitorPolicy> overrides;

    // Effective policy for one monitor
    MonitorPolicy policy_for(const std::string& monitor_id) const;
    bool has_override(const std::string& monitor_id) const;

    nlohmann::json to_json() const;
    static DetectorConfig from_json(const nlohmann::json& j);
};

struct CacheConfig {
    size_t capacity = 32;
    size_t shards = 16;
    int64_t freshness_ms = 3600000;
    int64_t backoff_base_ms = 1000;
    int64_t backoff_max_ms = 300000;
    size_t max_load_retries = 2;
    int64_t load_timeout_ms = 10000;
    int64_t build_timeout_ms = 300000;
    int64_t persist_timeout_ms = 10000;
    size_t history_limit = 5000;       // records handed to the builder

    nlohmann::json to_json() const;
    static CacheConfig from_json(const nlohmann::json& j);
};

struct BuilderConfig {
    std::string algorithm = "isolation_forest";   // isolation_forest | lightgbm | auto
    size_t num_trees = 200;
    size_t max_samples = 256;
    size_t max_depth = 10;
    double contamination = 0.05;
    size_t min_training_samples = 10;
    uint32_t seed = 42;
    size_t boosting_rounds = 50;

    nlohmann::json to_json() const;
    static BuilderConfig from_json(const nlohmann::json& j);
};

struct PublishConfig {
    size_t max_attempts = 3;
    int64_t retry_backoff_ms = 100;

    nlohmann::json to_json() const;
    static PublishConfig from_json(const nlohmann::json& j);
};

struct StoreConfig {
    std::string directory = "./models";
    int compression_level = 3;

    nlohmann::json to_json() const;
    static StoreConfig from_json(const nlohmann::json& j);
};

struct TrendConfig {
    std::string directory = "./trend";

    nlohmann::json to_json() const;
    static TrendConfig from_json(const nlohmann::json& j);
};

struct FeedConfig {
    std::vector<std::string> sensors;                     // empty = keep all
    std::map<std::string, std::string> sensor_labels;     // code -> readable name

    std::string label_for(const std::string& sensor) const;

    nlohmann::json to_json() const;
    static FeedConfig from_json(const nlohmann::json& j);
};

struct LaneConfig {
    size_t worker_threads = 4;
    size_t batch_size = 32;            // readings drained per scheduling turn

    nlohmann::json to_json() const;
    static LaneConfig from_json(const nlohmann::json& j);
};

struct EngineConfig {
    WindowConfig window;
    DetectorConfig detector;
    CacheConfig cache;
    BuilderConfig builder;
    PublishConfig publish;
    StoreConfig store;
    TrendConfig trend;
    FeedConfig feed;
    LaneConfig lanes;
    bool debug = false;

    nlohmann::json to_json() const;
    static EngineConfig from_json(const nlohmann::json& j);

    // Throws ConfigError when the file cannot be read or parsed
    static EngineConfig load_file(const std::string& path);

    // Overlay MODEL_CACHE_SIZE, WINDOW_COUNT, SLIDE_COUNT and friends
    void apply_environment();

    // Throws ConfigError on contradictory settings
    void validate() const;
};

} // namespace vigil

#endif // VIGIL_CONFIG_H
