#pragma once
#ifndef VIGIL_AI_MODEL_ARTIFACT_H
#define VIGIL_AI_MODEL_ARTIFACT_H

#include "vigil/ai/robust_scaler.h"
#include "vigil/ai/scoring_model.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace vigil {
namespace ai {

// Opaque persisted form of an artifact
using ArtifactBytes = std::string;

// A trained scoring function bundled with the scaler it was fitted with
struct ModelArtifact {
    std::string monitor_id;
    uint64_t version = 0;
    std::chrono::system_clock::time_point built_at;
    bool valid = false;

    std::vector<std::string> sensors;      // sorted sensor codes the scaler expects
    std::vector<std::string> statistics;   // per-sensor statistic layout
    RobustScaler scaler;
    std::shared_ptr<const IScoringModel> model;

    // training_samples, contamination, source, ...
    nlohmann::json metadata = nlohmann::json::object();

    bool usable_for(const std::string& requested_monitor) const {
        return valid && model && monitor_id == requested_monitor;
    }

    std::string algorithm() const { return model ? model->algorithm() : "none"; }
};

class ArtifactCodec {
public:
    static constexpr int kFormatVersion = 1;

    static ArtifactBytes encode(const ModelArtifact& artifact);

    // Throws StorageError on malformed or unsupported documents
    static std::shared_ptr<const ModelArtifact> decode(const ArtifactBytes& bytes);
};

} // namespace ai
} // namespace vigil

#endif // VIGIL_AI_MODEL_ARTIFACT_H
