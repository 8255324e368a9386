#include "vigil/ai/model_builder.h"
#include "vigil/ai/isolation_forest.h"
#include "vigil/ai/lightgbm_model.h"
#include "vigil/errors.h"
#include "vigil/stream/sliding_window.h"
#include <Eigen/Dense>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <iostream>
#include <limits>
#include <set>

namespace vigil {
namespace ai {

TrendModelBuilder::TrendModelBuilder(WindowConfig window, BuilderConfig config)
    : window_(std::move(window)), config_(std::move(config)) {
    // Training takes every summary the history can produce
    window_.emit_every = 1;
    window_.tick_ms = 0;
    window_.lateness_ms = 0;
}

uint64_t TrendModelBuilder::next_version() {
    static std::atomic<uint64_t> last{0};
    uint64_t now = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());

    uint64_t previous = last.load();
    uint64_t candidate;
    do {
        candidate = std::max(now, previous + 1);
    } while (!last.compare_exchange_weak(previous, candidate));
    return candidate;
}

std::vector<WindowSummary> TrendModelBuilder::replay(const std::string& monitor_id,
                                                     const std::vector<Reading>& history) const {
    std::vector<Reading> ordered;
    ordered.reserve(history.size());
    for (const auto& reading : history) {
        if (reading.monitor_id == monitor_id) {
            ordered.push_back(reading);
        }
    }
    std::sort(ordered.begin(), ordered.end(), reading_before);

    stream::SlidingWindow window(monitor_id, window_);
    std::vector<WindowSummary> summaries;
    for (const auto& reading : ordered) {
        auto emitted = window.ingest(reading);
        summaries.insert(summaries.end(),
                         std::make_move_iterator(emitted.begin()),
                         std::make_move_iterator(emitted.end()));
    }
    auto tail = window.flush();
    summaries.insert(summaries.end(),
                     std::make_move_iterator(tail.begin()),
                     std::make_move_iterator(tail.end()));
    return summaries;
}

bool TrendModelBuilder::use_lightgbm(const std::vector<WindowSummary>& summaries) const {
    if (config_.algorithm == "isolation_forest") {
        return false;
    }

    size_t positives = 0;
    size_t negatives = 0;
    for (const auto& summary : summaries) {
        if (summary.label == 1) ++positives;
        else if (summary.label == 0) ++negatives;
    }
    bool trainable = positives > 0 && negatives > 0 &&
                     positives + negatives >= config_.min_training_samples;

    if (config_.algorithm == "lightgbm" && !trainable) {
        throw BuildError("lightgbm requires labeled history with both classes (got " +
                         std::to_string(positives) + " anomalous, " +
                         std::to_string(negatives) + " normal)");
    }
    return trainable;
}

std::shared_ptr<ModelArtifact> TrendModelBuilder::train(const std::string& monitor_id,
                                                        const std::vector<Reading>& history) const {
    if (history.empty()) {
        throw BuildError("no historical data for monitor " + monitor_id);
    }

    std::vector<WindowSummary> summaries = replay(monitor_id, history);
    if (summaries.size() < config_.min_training_samples) {
        throw BuildError("monitor " + monitor_id + " produced " + std::to_string(summaries.size()) +
                         " training summaries, need " + std::to_string(config_.min_training_samples));
    }

    // Feature layout: union of sensors, configured statistics
    std::set<std::string> sensor_set;
    for (const auto& summary : summaries) {
        sensor_set.insert(summary.sensors.begin(), summary.sensors.end());
    }
    std::vector<std::string> sensors(sensor_set.begin(), sensor_set.end());

    std::vector<std::string> feature_names;
    for (const auto& sensor : sensors) {
        for (const auto& stat : window_.statistics) {
            feature_names.push_back(sensor + ":" + stat);
        }
    }

    const Eigen::Index rows = static_cast<Eigen::Index>(summaries.size());
    const Eigen::Index cols = static_cast<Eigen::Index>(feature_names.size());
    const double nan = std::numeric_limits<double>::quiet_NaN();
    Eigen::MatrixXd data = Eigen::MatrixXd::Constant(rows, cols, nan);

    for (Eigen::Index r = 0; r < rows; ++r) {
        const auto& summary = summaries[static_cast<size_t>(r)];
        for (size_t i = 0; i < summary.feature_names.size(); ++i) {
            auto it = std::find(feature_names.begin(), feature_names.end(), summary.feature_names[i]);
            if (it != feature_names.end()) {
                data(r, static_cast<Eigen::Index>(it - feature_names.begin())) = summary.features[i];
            }
        }
    }

    // Fill gaps with the column median
    for (Eigen::Index c = 0; c < cols; ++c) {
        std::vector<double> present;
        for (Eigen::Index r = 0; r < rows; ++r) {
            if (!std::isnan(data(r, c))) present.push_back(data(r, c));
        }
        double median = RobustScaler::percentile(present, 0.5);
        for (Eigen::Index r = 0; r < rows; ++r) {
            if (std::isnan(data(r, c))) data(r, c) = median;
        }
    }

    auto artifact = std::make_shared<ModelArtifact>();
    artifact->monitor_id = monitor_id;
    artifact->sensors = sensors;
    artifact->statistics = window_.statistics;
    artifact->scaler.fit(feature_names, data);

    std::vector<FeatureVector> samples;
    samples.reserve(summaries.size());
    for (Eigen::Index r = 0; r < rows; ++r) {
        std::vector<double> row(static_cast<size_t>(cols));
        for (Eigen::Index c = 0; c < cols; ++c) {
            row[static_cast<size_t>(c)] = data(r, c);
        }
        samples.push_back(artifact->scaler.transform(row));
    }

    if (use_lightgbm(summaries)) {
        std::vector<FeatureVector> labeled;
        std::vector<int> labels;
        for (size_t i = 0; i < summaries.size(); ++i) {
            if (summaries[i].label >= 0) {
                labeled.push_back(samples[i]);
                labels.push_back(summaries[i].label);
            }
        }
        auto model = std::make_shared<LightGBMModel>();
        model->train(labeled, labels, config_.boosting_rounds, config_.seed);
        artifact->model = model;
        artifact->metadata["labeled_samples"] = labeled.size();
    } else {
        IsolationForestParams params;
        params.num_trees = config_.num_trees;
        params.max_samples = config_.max_samples;
        params.max_depth = config_.max_depth;
        params.contamination = config_.contamination;
        params.seed = config_.seed;

        auto forest = std::make_shared<IsolationForest>(params);
        forest->train(samples);
        artifact->model = forest;
    }

    artifact->version = next_version();
    artifact->built_at = std::chrono::system_clock::now();
    artifact->valid = true;
    artifact->metadata["source"] = "builder";
    artifact->metadata["training_samples"] = summaries.size();
    artifact->metadata["history_records"] = history.size();
    artifact->metadata["contamination"] = config_.contamination;
    artifact->metadata["threshold"] = artifact->model->threshold();

    std::cout << "[ModelBuilder] Trained " << artifact->algorithm() << " for " << monitor_id
              << " on " << summaries.size() << " summaries, " << sensors.size()
              << " sensors, version " << artifact->version << std::endl;
    return artifact;
}

ArtifactBytes TrendModelBuilder::build(const std::string& monitor_id,
                                       const std::vector<Reading>& history) {
    auto artifact = train(monitor_id, history);
    return ArtifactCodec::encode(*artifact);
}

} // namespace ai
} // namespace vigil
