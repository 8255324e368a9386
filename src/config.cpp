#include "vigil/config.h"
#include "vigil/errors.h"
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <algorithm>

namespace vigil {

namespace {

const char* env_value(const char* name) {
    const char* value = std::getenv(name);
    if (!value || !*value) return nullptr;
    return value;
}

template <typename T>
void env_integer(const char* name, T& target) {
    const char* value = env_value(name);
    if (!value) return;
    try {
        long long parsed = std::stoll(value);
        if (parsed < 0) {
            throw ConfigError(std::string(name) + " must not be negative");
        }
        target = static_cast<T>(parsed);
    } catch (const std::invalid_argument&) {
        throw ConfigError(std::string(name) + " is not an integer: " + value);
    } catch (const std::out_of_range&) {
        throw ConfigError(std::string(name) + " is out of range: " + value);
    }
}

void env_double(const char* name, double& target) {
    const char* value = env_value(name);
    if (!value) return;
    try {
        target = std::stod(value);
    } catch (const std::exception&) {
        throw ConfigError(std::string(name) + " is not a number: " + value);
    }
}

void env_string(const char* name, std::string& target) {
    const char* value = env_value(name);
    if (value) target = value;
}

void env_flag(const char* name, bool& target) {
    const char* value = env_value(name);
    if (!value) return;
    std::string flag(value);
    std::transform(flag.begin(), flag.end(), flag.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    target = (flag == "1" || flag == "true" || flag == "yes" || flag == "on");
}

} // anonymous namespace

// ============================================
// Section configs
// ============================================

nlohmann::json WindowConfig::to_json() const {
    nlohmann::json j;
    j["span_ms"] = span_ms;
    j["max_count"] = max_count;
    j["min_samples"] = min_samples;
    j["lateness_ms"] = lateness_ms;
    j["emit_every"] = emit_every;
    j["tick_ms"] = tick_ms;
    j["statistics"] = statistics;
    return j;
}

WindowConfig WindowConfig::from_json(const nlohmann::json& j) {
    WindowConfig config;
    config.span_ms = j.value("span_ms", config.span_ms);
    config.max_count = j.value("max_count", config.max_count);
    config.min_samples = j.value("min_samples", config.min_samples);
    config.lateness_ms = j.value("lateness_ms", config.lateness_ms);
    config.emit_every = j.value("emit_every", config.emit_every);
    config.tick_ms = j.value("tick_ms", config.tick_ms);
    config.statistics = j.value("statistics", config.statistics);
    return config;
}

nlohmann::json MonitorPolicy::to_json() const {
    nlohmann::json j;
    j["threshold"] = threshold;
    j["breach_count"] = breach_count;
    return j;
}

MonitorPolicy MonitorPolicy::from_json(const nlohmann::json& j, const MonitorPolicy& defaults) {
    MonitorPolicy policy = defaults;
    policy.threshold = j.value("threshold", defaults.threshold);
    policy.breach_count = j.value("breach_count", defaults.breach_count);
    return policy;
}

MonitorPolicy DetectorConfig::policy_for(const std::string& monitor_id) const {
    auto it = overrides.find(monitor_id);
    if (it != overrides.end()) {
        return it->second;
    }
    MonitorPolicy policy;
    policy.threshold = default_threshold;
    policy.breach_count = breach_count;
    return policy;
}

bool DetectorConfig::has_override(const std::string& monitor_id) const {
    return overrides.find(monitor_id) != overrides.end();
}

nlohmann::json DetectorConfig::to_json() const {
    nlohmann::json j;
    j["default_threshold"] = default_threshold;
    j["breach_count"] = breach_count;
    j["use_model_threshold"] = use_model_threshold;
    j["top_features"] = top_features;
    nlohmann::json overrides_json = nlohmann::json::object();
    for (const auto& [monitor_id, policy] : overrides) {
        overrides_json[monitor_id] = policy.to_json();
    }
    j["overrides"] = overrides_json;
    return j;
}

DetectorConfig DetectorConfig::from_json(const nlohmann::json& j) {
    DetectorConfig config;
    config.default_threshold = j.value("default_threshold", config.default_threshold);
    config.breach_count = j.value("breach_count", config.breach_count);
    config.use_model_threshold = j.value("use_model_threshold", config.use_model_threshold);
    config.top_features = j.value("top_features", config.top_features);

    MonitorPolicy defaults;
    defaults.threshold = config.default_threshold;
    defaults.breach_count = config.breach_count;

    if (j.contains("overrides") && j["overrides"].is_object()) {
        for (const auto& [monitor_id, policy_json] : j["overrides"].items()) {
            config.overrides[monitor_id] = MonitorPolicy::from_json(policy_json, defaults);
        }
    }
    return config;
}

nlohmann::json CacheConfig::to_json() const {
    nlohmann::json j;
    j["capacity"] = capacity;
    j["shards"] = shards;
    j["freshness_ms"] = freshness_ms;
    j["backoff_base_ms"] = backoff_base_ms;
    j["backoff_max_ms"] = backoff_max_ms;
    j["max_load_retries"] = max_load_retries;
    j["load_timeout_ms"] = load_timeout_ms;
    j["build_timeout_ms"] = build_timeout_ms;
    j["persist_timeout_ms"] = persist_timeout_ms;
    j["history_limit"] = history_limit;
    return j;
}

CacheConfig CacheConfig::from_json(const nlohmann::json& j) {
    CacheConfig config;
    config.capacity = j.value("capacity", config.capacity);
    config.shards = j.value("shards", config.shards);
    config.freshness_ms = j.value("freshness_ms", config.freshness_ms);
    config.backoff_base_ms = j.value("backoff_base_ms", config.backoff_base_ms);
    config.backoff_max_ms = j.value("backoff_max_ms", config.backoff_max_ms);
    config.max_load_retries = j.value("max_load_retries", config.max_load_retries);
    config.load_timeout_ms = j.value("load_timeout_ms", config.load_timeout_ms);
    config.build_timeout_ms = j.value("build_timeout_ms", config.build_timeout_ms);
    config.persist_timeout_ms = j.value("persist_timeout_ms", config.persist_timeout_ms);
    config.history_limit = j.value("history_limit", config.history_limit);
    return config;
}

nlohmann::json BuilderConfig::to_json() const {
    nlohmann::json j;
    j["algorithm"] = algorithm;
    j["num_trees"] = num_trees;
    j["max_samples"] = max_samples;
    j["max_depth"] = max_depth;
    j["contamination"] = contamination;
    j["min_training_samples"] = min_training_samples;
    j["seed"] = seed;
    j["boosting_rounds"] = boosting_rounds;
    return j;
}

BuilderConfig BuilderConfig::from_json(const nlohmann::json& j) {
    BuilderConfig config;
    config.algorithm = j.value("algorithm", config.algorithm);
    config.num_trees = j.value("num_trees", config.num_trees);
    config.max_samples = j.value("max_samples", config.max_samples);
    config.max_depth = j.value("max_depth", config.max_depth);
    config.contamination = j.value("contamination", config.contamination);
    config.min_training_samples = j.value("min_training_samples", config.min_training_samples);
    config.seed = j.value("seed", config.seed);
    config.boosting_rounds = j.value("boosting_rounds", config.boosting_rounds);
    return config;
}

nlohmann::json PublishConfig::to_json() const {
    nlohmann::json j;
    j["max_attempts"] = max_attempts;
    j["retry_backoff_ms"] = retry_backoff_ms;
    return j;
}

PublishConfig PublishConfig::from_json(const nlohmann::json& j) {
    PublishConfig config;
    config.max_attempts = j.value("max_attempts", config.max_attempts);
    config.retry_backoff_ms = j.value("retry_backoff_ms", config.retry_backoff_ms);
    return config;
}

nlohmann::json StoreConfig::to_json() const {
    nlohmann::json j;
    j["directory"] = directory;
    j["compression_level"] = compression_level;
    return j;
}

StoreConfig StoreConfig::from_json(const nlohmann::json& j) {
    StoreConfig config;
    config.directory = j.value("directory", config.directory);
    config.compression_level = j.value("compression_level", config.compression_level);
    return config;
}

nlohmann::json TrendConfig::to_json() const {
    nlohmann::json j;
    j["directory"] = directory;
    return j;
}

TrendConfig TrendConfig::from_json(const nlohmann::json& j) {
    TrendConfig config;
    config.directory = j.value("directory", config.directory);
    return config;
}

std::string FeedConfig::label_for(const std::string& sensor) const {
    auto it = sensor_labels.find(sensor);
    return it != sensor_labels.end() ? it->second : sensor;
}

nlohmann::json FeedConfig::to_json() const {
    nlohmann::json j;
    j["sensors"] = sensors;
    j["sensor_labels"] = sensor_labels;
    return j;
}

FeedConfig FeedConfig::from_json(const nlohmann::json& j) {
    FeedConfig config;
    config.sensors = j.value("sensors", config.sensors);
    config.sensor_labels = j.value("sensor_labels", config.sensor_labels);
    return config;
}

nlohmann::json LaneConfig::to_json() const {
    nlohmann::json j;
    j["worker_threads"] = worker_threads;
    j["batch_size"] = batch_size;
    return j;
}

LaneConfig LaneConfig::from_json(const nlohmann::json& j) {
    LaneConfig config;
    config.worker_threads = j.value("worker_threads", config.worker_threads);
    config.batch_size = j.value("batch_size", config.batch_size);
    return config;
}

// ============================================
// EngineConfig
// ============================================

nlohmann::json EngineConfig::to_json() const {
    nlohmann::json j;
    j["window"] = window.to_json();
    j["detector"] = detector.to_json();
    j["cache"] = cache.to_json();
    j["builder"] = builder.to_json();
    j["publish"] = publish.to_json();
    j["store"] = store.to_json();
    j["trend"] = trend.to_json();
    j["feed"] = feed.to_json();
    j["lanes"] = lanes.to_json();
    j["debug"] = debug;
    return j;
}

EngineConfig EngineConfig::from_json(const nlohmann::json& j) {
    EngineConfig config;
    const nlohmann::json empty = nlohmann::json::object();
    auto section = [&](const char* name) -> const nlohmann::json& {
        auto it = j.find(name);
        return (it != j.end() && it->is_object()) ? *it : empty;
    };

    config.window = WindowConfig::from_json(section("window"));
    config.detector = DetectorConfig::from_json(section("detector"));
    config.cache = CacheConfig::from_json(section("cache"));
    config.builder = BuilderConfig::from_json(section("builder"));
    config.publish = PublishConfig::from_json(section("publish"));
    config.store = StoreConfig::from_json(section("store"));
    config.trend = TrendConfig::from_json(section("trend"));
    config.feed = FeedConfig::from_json(section("feed"));
    config.lanes = LaneConfig::from_json(section("lanes"));
    config.debug = j.value("debug", config.debug);
    return config;
}

EngineConfig EngineConfig::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("cannot open config file: " + path);
    }

    try {
        nlohmann::json j;
        file >> j;
        std::cout << "[Config] Loaded configuration from " << path << std::endl;
        return from_json(j);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("invalid config file " + path + ": " + e.what());
    }
}

void EngineConfig::apply_environment() {
    env_integer("MODEL_CACHE_SIZE", cache.capacity);
    env_integer("WINDOW_COUNT", window.max_count);
    env_integer("SLIDE_COUNT", window.emit_every);
    env_integer("WINDOW_SPAN_MS", window.span_ms);
    env_integer("MIN_SAMPLES", window.min_samples);
    env_integer("LATENESS_MS", window.lateness_ms);
    env_double("TRAINING_CONTAMINATION", builder.contamination);
    env_integer("MODEL_TREES", builder.num_trees);
    env_string("MODEL_BASE_PATH", store.directory);
    env_string("TREND_DATA_PATH", trend.directory);
    env_double("ANOMALY_THRESHOLD", detector.default_threshold);
    env_integer("HYSTERESIS_K", detector.breach_count);
    env_integer("PUBLISH_RETRIES", publish.max_attempts);
    env_integer("WORKER_THREADS", lanes.worker_threads);
    env_flag("DEBUG", debug);
}

void EngineConfig::validate() const {
    if (window.span_ms <= 0) {
        throw ConfigError("window.span_ms must be positive");
    }
    if (window.lateness_ms < 0 || window.tick_ms < 0) {
        throw ConfigError("window.lateness_ms and window.tick_ms must not be negative");
    }
    if (window.min_samples == 0) {
        throw ConfigError("window.min_samples must be at least 1");
    }
    if (window.max_count > 0 && window.min_samples > window.max_count) {
        throw ConfigError("window.min_samples exceeds window.max_count");
    }
    if (window.emit_every == 0) {
        throw ConfigError("window.emit_every must be at least 1");
    }
    if (window.statistics.empty()) {
        throw ConfigError("window.statistics must name at least one statistic");
    }
    static const std::vector<std::string> known = {"mean", "std", "min", "max", "last"};
    for (const auto& stat : window.statistics) {
        if (std::find(known.begin(), known.end(), stat) == known.end()) {
            throw ConfigError("unknown window statistic: " + stat);
        }
    }

    auto check_threshold = [](const std::string& who, double threshold) {
        if (threshold < 0.0 || threshold > 1.0) {
            throw ConfigError(who + " threshold must lie in [0, 1]");
        }
    };
    check_threshold("default", detector.default_threshold);
    if (detector.breach_count == 0) {
        throw ConfigError("detector.breach_count must be at least 1");
    }
    for (const auto& [monitor_id, policy] : detector.overrides) {
        check_threshold("monitor " + monitor_id, policy.threshold);
        if (policy.breach_count == 0) {
            throw ConfigError("monitor " + monitor_id + " breach_count must be at least 1");
        }
    }

    if (cache.capacity == 0 || cache.shards == 0) {
        throw ConfigError("cache.capacity and cache.shards must be positive");
    }
    if (cache.backoff_base_ms <= 0 || cache.backoff_max_ms < cache.backoff_base_ms) {
        throw ConfigError("cache backoff must satisfy 0 < backoff_base_ms <= backoff_max_ms");
    }
    if (cache.load_timeout_ms <= 0 || cache.build_timeout_ms <= 0 || cache.persist_timeout_ms <= 0) {
        throw ConfigError("cache timeouts must be positive");
    }

    if (builder.algorithm != "isolation_forest" && builder.algorithm != "lightgbm" &&
        builder.algorithm != "auto") {
        throw ConfigError("unknown builder.algorithm: " + builder.algorithm);
    }
    if (builder.contamination <= 0.0 || builder.contamination >= 0.5) {
        throw ConfigError("builder.contamination must lie in (0, 0.5)");
    }
    if (builder.num_trees == 0 || builder.max_samples < 2) {
        throw ConfigError("builder needs at least one tree and two samples per tree");
    }

    if (publish.max_attempts == 0) {
        throw ConfigError("publish.max_attempts must be at least 1");
    }
    if (lanes.worker_threads == 0 || lanes.batch_size == 0) {
        throw ConfigError("lanes.worker_threads and lanes.batch_size must be positive");
    }
}

} // namespace vigil
