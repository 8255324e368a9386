#pragma once
#ifndef VIGIL_STREAM_MONITOR_LANE_H
#define VIGIL_STREAM_MONITOR_LANE_H

#include "vigil/ai/model_cache.h"
#include "vigil/config.h"
#include "vigil/stream/alert_emitter.h"
#include "vigil/stream/anomaly_detector.h"
#include "vigil/stream/sliding_window.h"
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace vigil {
namespace stream {

// Outcome of pushing one reading (or a flush) through a lane
struct LaneReport {
    size_t late_drops = 0;
    size_t summaries = 0;
    size_t insufficient_data = 0;
    size_t scored = 0;
    size_t degraded = 0;
    size_t anomalies = 0;
    size_t published = 0;
    size_t publish_failures = 0;
    size_t schema_mismatches = 0;
    size_t unavailable = 0;
    size_t scoring_errors = 0;
    std::vector<AnomalyVerdict> verdicts;
};

// All per-monitor state: window, hysteresis and the pending-reading mailbox.
// process() and flush() must never run concurrently for one lane; the engine
// guarantees that by scheduling a lane on at most one worker at a time.
class MonitorLane {
public:
    MonitorLane(std::string monitor_id,
                const EngineConfig& config,
                ai::ModelCache& cache,
                const AnomalyDetector& detector,
                AlertEmitter& emitter);

    // window ingest -> resolve -> transform -> score -> decide -> publish
    LaneReport process(const Reading& reading);

    // Commit and evaluate readings still held for lateness
    LaneReport flush();

    const std::string& monitor_id() const { return monitor_id_; }
    const SlidingWindow& window() const { return window_; }
    const HysteresisState& hysteresis() const { return hysteresis_; }

private:
    friend class StreamEngine;

    void evaluate(const WindowSummary& summary, LaneReport& report);

    std::string monitor_id_;
    ai::ModelCache& cache_;
    const AnomalyDetector& detector_;
    AlertEmitter& emitter_;
    size_t top_features_;
    bool debug_;

    SlidingWindow window_;
    HysteresisState hysteresis_;
    bool model_unavailable_ = false;

    // Mailbox, guarded by mailbox_mutex_
    std::mutex mailbox_mutex_;
    std::deque<Reading> mailbox_;
    bool scheduled_ = false;
};

} // namespace stream
} // namespace vigil

#endif // VIGIL_STREAM_MONITOR_LANE_H
