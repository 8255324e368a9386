#include "vigil/stream/anomaly_detector.h"

namespace vigil {
namespace stream {

AnomalyDetector::AnomalyDetector(DetectorConfig config)
    : config_(std::move(config)) {}

MonitorPolicy AnomalyDetector::policy_for(const std::string& monitor_id,
                                          const ai::ModelArtifact* artifact) const {
    MonitorPolicy policy = config_.policy_for(monitor_id);
    if (config_.use_model_threshold && !config_.has_override(monitor_id) &&
        artifact && artifact->model) {
        policy.threshold = artifact->model->threshold();
    }
    return policy;
}

AnomalyVerdict AnomalyDetector::decide(double score,
                                       const MonitorPolicy& policy,
                                       HysteresisState& state,
                                       const WindowSummary& summary) const {
    if (score >= policy.threshold) {
        ++state.consecutive_breaches;
    } else {
        state.consecutive_breaches = 0;
    }

    AnomalyVerdict verdict;
    verdict.monitor_id = summary.monitor_id;
    verdict.timestamp = summary.window_end;
    verdict.score = score;
    verdict.threshold = policy.threshold;
    verdict.breach_count = policy.breach_count;
    verdict.consecutive_breaches = state.consecutive_breaches;
    verdict.is_anomaly = state.consecutive_breaches >= policy.breach_count;
    verdict.summary = summary;
    return verdict;
}

} // namespace stream
} // namespace vigil
