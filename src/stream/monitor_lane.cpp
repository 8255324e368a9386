#include "vigil/stream/monitor_lane.h"
#include "vigil/errors.h"
#include <iostream>

namespace vigil {
namespace stream {

MonitorLane::MonitorLane(std::string monitor_id,
                         const EngineConfig& config,
                         ai::ModelCache& cache,
                         const AnomalyDetector& detector,
                         AlertEmitter& emitter)
    : monitor_id_(monitor_id),
      cache_(cache),
      detector_(detector),
      emitter_(emitter),
      top_features_(config.detector.top_features),
      debug_(config.debug),
      window_(std::move(monitor_id), config.window) {}

LaneReport MonitorLane::process(const Reading& reading) {
    LaneReport report;

    const size_t late_before = window_.late_drops();
    std::vector<WindowSummary> summaries = window_.ingest(reading);
    report.late_drops = window_.late_drops() - late_before;

    if (report.late_drops > 0 && debug_) {
        std::cout << "[Lane " << monitor_id_ << "] Late reading at " << reading.timestamp
                  << " dropped (watermark " << window_.watermark() << ")" << std::endl;
    }

    if (summaries.empty() && report.late_drops == 0) {
        report.insufficient_data = 1;
    }
    for (const auto& summary : summaries) {
        evaluate(summary, report);
    }
    return report;
}

LaneReport MonitorLane::flush() {
    LaneReport report;
    for (const auto& summary : window_.flush()) {
        evaluate(summary, report);
    }
    return report;
}

void MonitorLane::evaluate(const WindowSummary& summary, LaneReport& report) {
    ++report.summaries;

    ai::Resolution resolution = cache_.resolve(monitor_id_);
    if (!resolution.usable()) {
        ++report.unavailable;
        if (!model_unavailable_) {
            std::cerr << "[Lane " << monitor_id_ << "] Model unavailable, holding readings unscored: "
                      << resolution.reason << std::endl;
            model_unavailable_ = true;
        }
        return;
    }
    if (model_unavailable_) {
        std::cout << "[Lane " << monitor_id_ << "] Model available again ("
                  << ai::to_string(resolution.status) << ")" << std::endl;
        model_unavailable_ = false;
    }

    const ai::ModelArtifact& artifact = *resolution.artifact;

    try {
        FeatureVector features = ai::Preprocessor::transform(artifact, summary);
        double score = ai::Predictor::score(artifact, features);

        MonitorPolicy policy = detector_.policy_for(monitor_id_, &artifact);
        AnomalyVerdict verdict = detector_.decide(score, policy, hysteresis_, summary);
        verdict.degraded = resolution.degraded();
        verdict.model_version = artifact.version;
        verdict.algorithm = artifact.algorithm();
        verdict.top_features = ai::Predictor::explain(artifact, summary, features, top_features_);

        ++report.scored;
        if (verdict.degraded) {
            ++report.degraded;
        }

        if (debug_) {
            std::cout << "[Lane " << monitor_id_ << "] t=" << verdict.timestamp
                      << " score=" << score << " threshold=" << policy.threshold
                      << " breaches=" << verdict.consecutive_breaches
                      << (verdict.degraded ? " (degraded)" : "") << std::endl;
        }

        if (verdict.is_anomaly) {
            ++report.anomalies;
            if (emitter_.publish(verdict)) {
                ++report.published;
            } else {
                ++report.publish_failures;
            }
        }
        report.verdicts.push_back(std::move(verdict));

    } catch (const SchemaMismatch& e) {
        ++report.schema_mismatches;
        std::cerr << "[Lane " << monitor_id_ << "] " << e.what() << std::endl;
    } catch (const std::invalid_argument& e) {
        ++report.scoring_errors;
        std::cerr << "[Lane " << monitor_id_ << "] Scoring failed: " << e.what() << std::endl;
    } catch (const std::runtime_error& e) {
        ++report.scoring_errors;
        std::cerr << "[Lane " << monitor_id_ << "] Scoring failed: " << e.what() << std::endl;
    }
}

} // namespace stream
} // namespace vigil
