#pragma once
#ifndef VIGIL_AI_ISOLATION_FOREST_H
#define VIGIL_AI_ISOLATION_FOREST_H

#include "vigil/ai/scoring_model.h"
#include <cstdint>
#include <memory>
#include <random>
#include <vector>

namespace vigil {
namespace ai {

struct IsolationForestParams {
    size_t num_trees = 200;
    size_t max_samples = 256;
    size_t max_depth = 10;
    double contamination = 0.05;
    uint32_t seed = 42;

    nlohmann::json to_json() const;
    static IsolationForestParams from_json(const nlohmann::json& j);
};

class IsolationForest : public IScoringModel {
private:
    struct IsolationTree {
        size_t split_feature = 0;
        float split_value = 0.0f;
        std::unique_ptr<IsolationTree> left;
        std::unique_ptr<IsolationTree> right;
        size_t node_size = 0;
        bool is_external = true;

        double path_length(const FeatureVector& sample, size_t current_depth = 0) const;
        size_t node_count() const;
    };

    IsolationForestParams params_;
    std::vector<std::unique_ptr<IsolationTree>> trees_;
    size_t num_features_ = 0;
    size_t subsample_size_ = 0;   // samples each tree was grown on
    double threshold_ = 0.5;

public:
    explicit IsolationForest(IsolationForestParams params = {});
    ~IsolationForest() override = default;

    // Throws BuildError on empty or ragged input
    void train(const std::vector<FeatureVector>& samples);

    double score(const FeatureVector& features) const override;
    size_t num_features() const override { return num_features_; }
    std::string algorithm() const override { return "isolation_forest"; }
    double threshold() const override { return threshold_; }
    nlohmann::json to_json() const override;
    size_t memory_usage() const override;

    size_t tree_count() const { return trees_.size(); }
    const IsolationForestParams& params() const { return params_; }

    static std::shared_ptr<IsolationForest> from_json(const nlohmann::json& j);

    // c(n): average path length of an unsuccessful BST search
    static double average_path_length(size_t n);

private:
    std::unique_ptr<IsolationTree> build_tree(
        const std::vector<FeatureVector>& samples,
        const std::vector<size_t>& indices,
        size_t depth,
        std::mt19937& rng) const;

    static nlohmann::json serialize_tree(const IsolationTree* tree);
    static std::unique_ptr<IsolationTree> deserialize_tree(const nlohmann::json& j, size_t num_features);
};

} // namespace ai
} // namespace vigil

#endif // VIGIL_AI_ISOLATION_FOREST_H
