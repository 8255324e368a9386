#include "vigil/ai/isolation_forest.h"
#include "vigil/errors.h"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <iterator>
#include <limits>
#include <numeric>

namespace vigil {
namespace ai {

using namespace std::chrono;

nlohmann::json IsolationForestParams::to_json() const {
    nlohmann::json j;
    j["num_trees"] = num_trees;
    j["max_samples"] = max_samples;
    j["max_depth"] = max_depth;
    j["contamination"] = contamination;
    j["seed"] = seed;
    return j;
}

IsolationForestParams IsolationForestParams::from_json(const nlohmann::json& j) {
    IsolationForestParams params;
    params.num_trees = j.value("num_trees", params.num_trees);
    params.max_samples = j.value("max_samples", params.max_samples);
    params.max_depth = j.value("max_depth", params.max_depth);
    params.contamination = j.value("contamination", params.contamination);
    params.seed = j.value("seed", params.seed);
    return params;
}

IsolationForest::IsolationForest(IsolationForestParams params)
    : params_(params) {}

double IsolationForest::average_path_length(size_t n) {
    if (n <= 1) {
        return 0.0;
    }
    if (n == 2) {
        return 1.0;
    }
    double nd = static_cast<double>(n);
    return 2.0 * (std::log(nd - 1.0) + 0.5772156649) - (2.0 * (nd - 1.0) / nd);
}

// ============================================
// Training
// ============================================

void IsolationForest::train(const std::vector<FeatureVector>& samples) {
    if (samples.empty()) {
        throw BuildError("no training data provided");
    }

    auto start_time = high_resolution_clock::now();

    const size_t n_samples = samples.size();
    const size_t n_features = samples[0].size();
    if (n_features == 0) {
        throw BuildError("training samples have no features");
    }
    for (const auto& sample : samples) {
        if (sample.size() != n_features) {
            throw BuildError("inconsistent feature size in training data");
        }
    }

    std::cout << "[IsolationForest] Training with " << n_samples
              << " samples, " << n_features << " features" << std::endl;

    num_features_ = n_features;
    subsample_size_ = std::min(params_.max_samples, n_samples);
    trees_.clear();
    trees_.reserve(params_.num_trees);

    std::mt19937 rng(params_.seed);

    std::vector<size_t> all_indices(n_samples);
    std::iota(all_indices.begin(), all_indices.end(), 0);

    for (size_t i = 0; i < params_.num_trees; ++i) {
        std::vector<size_t> indices;
        if (subsample_size_ < n_samples) {
            indices.reserve(subsample_size_);
            std::sample(all_indices.begin(), all_indices.end(),
                        std::back_inserter(indices),
                        subsample_size_, rng);
        } else {
            indices = all_indices;
        }

        trees_.push_back(build_tree(samples, indices, 0, rng));
    }

    // Threshold at the (1 - contamination) quantile of training scores
    std::vector<double> training_scores;
    training_scores.reserve(n_samples);
    for (const auto& sample : samples) {
        training_scores.push_back(score(sample));
    }
    std::sort(training_scores.begin(), training_scores.end());

    size_t threshold_idx = static_cast<size_t>((1.0 - params_.contamination) * training_scores.size());
    threshold_idx = std::min(threshold_idx, training_scores.size() - 1);
    threshold_ = training_scores[threshold_idx];

    auto duration = duration_cast<milliseconds>(high_resolution_clock::now() - start_time);
    std::cout << "[IsolationForest] Built " << trees_.size() << " trees, threshold "
              << threshold_ << " (contamination " << params_.contamination << ") in "
              << duration.count() << "ms" << std::endl;
}

std::unique_ptr<IsolationForest::IsolationTree> IsolationForest::build_tree(
    const std::vector<FeatureVector>& samples,
    const std::vector<size_t>& indices,
    size_t depth,
    std::mt19937& rng) const {

    auto node = std::make_unique<IsolationTree>();
    node->node_size = indices.size();

    if (depth >= params_.max_depth || indices.size() <= 1) {
        return node;
    }

    // Pick a random feature that still has spread among these samples
    std::vector<size_t> feature_candidates(num_features_);
    std::iota(feature_candidates.begin(), feature_candidates.end(), 0);
    std::shuffle(feature_candidates.begin(), feature_candidates.end(), rng);

    for (size_t feature : feature_candidates) {
        float min_val = std::numeric_limits<float>::max();
        float max_val = std::numeric_limits<float>::lowest();
        for (size_t idx : indices) {
            float val = samples[idx][feature];
            min_val = std::min(min_val, val);
            max_val = std::max(max_val, val);
        }
        if (min_val >= max_val) {
            continue;
        }

        std::uniform_real_distribution<float> dist(min_val, max_val);
        float split_value = dist(rng);

        std::vector<size_t> left_indices, right_indices;
        for (size_t idx : indices) {
            if (samples[idx][feature] < split_value) {
                left_indices.push_back(idx);
            } else {
                right_indices.push_back(idx);
            }
        }
        if (left_indices.empty() || right_indices.empty()) {
            continue;
        }

        node->is_external = false;
        node->split_feature = feature;
        node->split_value = split_value;
        node->left = build_tree(samples, left_indices, depth + 1, rng);
        node->right = build_tree(samples, right_indices, depth + 1, rng);
        return node;
    }

    // All candidate features constant: leaf
    return node;
}

// ============================================
// Scoring
// ============================================

double IsolationForest::IsolationTree::path_length(
    const FeatureVector& sample, size_t current_depth) const {

    if (is_external) {
        return static_cast<double>(current_depth) + average_path_length(node_size);
    }

    const IsolationTree* next = sample[split_feature] < split_value ? left.get() : right.get();
    if (!next) {
        return static_cast<double>(current_depth);
    }
    return next->path_length(sample, current_depth + 1);
}

size_t IsolationForest::IsolationTree::node_count() const {
    size_t count = 1;
    if (left) count += left->node_count();
    if (right) count += right->node_count();
    return count;
}

double IsolationForest::score(const FeatureVector& features) const {
    if (trees_.empty()) {
        throw std::logic_error("IsolationForest: model has not been trained");
    }
    if (features.size() != num_features_) {
        throw std::invalid_argument("IsolationForest: expected " + std::to_string(num_features_) +
                                    " features, got " + std::to_string(features.size()));
    }

    double total_path_length = 0.0;
    for (const auto& tree : trees_) {
        total_path_length += tree->path_length(features, 0);
    }
    double avg_path_length = total_path_length / static_cast<double>(trees_.size());

    double c_n = average_path_length(subsample_size_);
    if (c_n <= 0.0) {
        c_n = 1.0;
    }

    // 2^(-E(h(x))/c(n))
    double score = std::pow(2.0, -avg_path_length / c_n);
    return std::clamp(score, 0.0, 1.0);
}

size_t IsolationForest::memory_usage() const {
    size_t nodes = 0;
    for (const auto& tree : trees_) {
        nodes += tree->node_count();
    }
    return sizeof(*this) + nodes * sizeof(IsolationTree);
}

// ============================================
// Serialization
// ============================================

nlohmann::json IsolationForest::serialize_tree(const IsolationTree* tree) {
    if (!tree) return nlohmann::json();

    nlohmann::json j;
    j["is_external"] = tree->is_external;
    j["node_size"] = tree->node_size;

    if (!tree->is_external) {
        j["split_feature"] = tree->split_feature;
        j["split_value"] = tree->split_value;
        j["left"] = serialize_tree(tree->left.get());
        j["right"] = serialize_tree(tree->right.get());
    }

    return j;
}

std::unique_ptr<IsolationForest::IsolationTree> IsolationForest::deserialize_tree(const nlohmann::json& j,
                                                                                 size_t num_features) {
    auto tree = std::make_unique<IsolationTree>();
    tree->is_external = j.at("is_external").get<bool>();
    tree->node_size = j.at("node_size").get<size_t>();

    if (!tree->is_external) {
        tree->split_feature = j.at("split_feature").get<size_t>();
        tree->split_value = j.at("split_value").get<float>();
        if (tree->split_feature >= num_features) {
            throw StorageError("isolation tree splits on feature " +
                               std::to_string(tree->split_feature) + " beyond feature count " +
                               std::to_string(num_features));
        }

        // Training always gives an internal node both children
        if (j.at("left").is_null() || j.at("right").is_null()) {
            throw StorageError("isolation tree has an internal node without both children");
        }
        tree->left = deserialize_tree(j["left"], num_features);
        tree->right = deserialize_tree(j["right"], num_features);
    }

    return tree;
}

nlohmann::json IsolationForest::to_json() const {
    nlohmann::json j;
    j["parameters"] = params_.to_json();
    j["num_features"] = num_features_;
    j["subsample_size"] = subsample_size_;
    j["threshold"] = threshold_;

    nlohmann::json trees_json = nlohmann::json::array();
    for (const auto& tree : trees_) {
        trees_json.push_back(serialize_tree(tree.get()));
    }
    j["trees"] = trees_json;
    return j;
}

std::shared_ptr<IsolationForest> IsolationForest::from_json(const nlohmann::json& j) {
    auto forest = std::make_shared<IsolationForest>(
        IsolationForestParams::from_json(j.at("parameters")));

    forest->num_features_ = j.at("num_features").get<size_t>();
    forest->subsample_size_ = j.at("subsample_size").get<size_t>();
    forest->threshold_ = j.at("threshold").get<double>();

    for (const auto& tree_json : j.at("trees")) {
        forest->trees_.push_back(deserialize_tree(tree_json, forest->num_features_));
    }
    if (forest->trees_.empty()) {
        throw StorageError("isolation forest document has no trees");
    }
    return forest;
}

} // namespace ai
} // namespace vigil
