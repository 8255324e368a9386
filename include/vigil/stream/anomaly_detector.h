#pragma once
#ifndef VIGIL_STREAM_ANOMALY_DETECTOR_H
#define VIGIL_STREAM_ANOMALY_DETECTOR_H

#include "vigil/ai/inference.h"
#include "vigil/config.h"
#include "vigil/telemetry.h"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace vigil {
namespace stream {

// Consecutive-breach counter, one per monitor, owned by its lane
struct HysteresisState {
    size_t consecutive_breaches = 0;
};

struct AnomalyVerdict {
    std::string monitor_id;
    Timestamp timestamp = 0;
    double score = 0.0;
    bool is_anomaly = false;
    bool degraded = false;

    double threshold = 0.0;
    size_t consecutive_breaches = 0;
    size_t breach_count = 1;

    uint64_t model_version = 0;
    std::string algorithm;
    std::vector<ai::FeatureContribution> top_features;
    WindowSummary summary;
};

class AnomalyDetector {
public:
    explicit AnomalyDetector(DetectorConfig config);

    // Monitor override, else the artifact's trained threshold when enabled,
    // else the configured default
    MonitorPolicy policy_for(const std::string& monitor_id, const ai::ModelArtifact* artifact) const;

    // Flags only after breach_count consecutive scores >= threshold; any
    // score below threshold resets the counter
    AnomalyVerdict decide(double score,
                          const MonitorPolicy& policy,
                          HysteresisState& state,
                          const WindowSummary& summary) const;

    const DetectorConfig& config() const { return config_; }

private:
    DetectorConfig config_;
};

} // namespace stream
} // namespace vigil

#endif // VIGIL_STREAM_ANOMALY_DETECTOR_H
