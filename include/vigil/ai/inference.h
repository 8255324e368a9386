#pragma once
#ifndef VIGIL_AI_INFERENCE_H
#define VIGIL_AI_INFERENCE_H

#include "vigil/ai/model_artifact.h"
#include "vigil/telemetry.h"
#include <string>
#include <vector>

namespace vigil {
namespace ai {

// Window summary -> scaled feature vector, using the artifact's own scaler
class Preprocessor {
public:
    // Throws SchemaMismatch when the summary layout differs from the artifact's
    static FeatureVector transform(const ModelArtifact& artifact, const WindowSummary& summary);
};

struct FeatureContribution {
    std::string feature;   // "sensor:stat"
    std::string sensor;
    double raw_value = 0.0;
    double deviation = 0.0;   // scaled distance from the training median
};

// Stateless; safe to call concurrently on a shared artifact
class Predictor {
public:
    static double score(const ModelArtifact& artifact, const FeatureVector& features);

    // Features furthest from the training median, largest first
    static std::vector<FeatureContribution> explain(const ModelArtifact& artifact,
                                                    const WindowSummary& summary,
                                                    const FeatureVector& features,
                                                    size_t top_k);
};

} // namespace ai
} // namespace vigil

#endif // VIGIL_AI_INFERENCE_H
