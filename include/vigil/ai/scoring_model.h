#pragma once
#ifndef VIGIL_AI_SCORING_MODEL_H
#define VIGIL_AI_SCORING_MODEL_H

#include "vigil/telemetry.h"
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace vigil {
namespace ai {

// Scoring function of an artifact: scaled features -> anomaly score in [0, 1].
// Implementations are immutable after training and safe to share across lanes.
class IScoringModel {
public:
    virtual ~IScoringModel() = default;

    virtual double score(const FeatureVector& features) const = 0;
    virtual size_t num_features() const = 0;
    virtual std::string algorithm() const = 0;

    // Decision threshold derived during training
    virtual double threshold() const = 0;

    virtual nlohmann::json to_json() const = 0;
    virtual size_t memory_usage() const { return 0; }
};

// Maps algorithm names to decoders for persisted models
class ScoringModelRegistry {
public:
    using Decoder = std::function<std::shared_ptr<const IScoringModel>(const nlohmann::json&)>;

    static ScoringModelRegistry& instance();

    ScoringModelRegistry(const ScoringModelRegistry&) = delete;
    ScoringModelRegistry& operator=(const ScoringModelRegistry&) = delete;

    bool register_decoder(const std::string& algorithm, Decoder decoder);
    bool is_supported(const std::string& algorithm) const;
    std::vector<std::string> algorithms() const;

    // Throws StorageError for unknown algorithms or malformed documents
    std::shared_ptr<const IScoringModel> decode(const std::string& algorithm,
                                                const nlohmann::json& document) const;

private:
    ScoringModelRegistry();

    std::unordered_map<std::string, Decoder> decoders_;
    mutable std::shared_mutex mutex_;
};

} // namespace ai
} // namespace vigil

#endif // VIGIL_AI_SCORING_MODEL_H
