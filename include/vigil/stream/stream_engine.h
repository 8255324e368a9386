#pragma once
#ifndef VIGIL_STREAM_STREAM_ENGINE_H
#define VIGIL_STREAM_STREAM_ENGINE_H

#include "vigil/ai/model_cache.h"
#include "vigil/config.h"
#include "vigil/stream/alert_emitter.h"
#include "vigil/stream/anomaly_detector.h"
#include "vigil/stream/monitor_lane.h"
#include "vigil/stream/reading_parser.h"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace vigil {
namespace stream {

struct EngineStats {
    uint64_t received = 0;
    uint64_t rejected = 0;
    uint64_t late_drops = 0;
    uint64_t summaries = 0;
    uint64_t insufficient_data = 0;
    uint64_t scored = 0;
    uint64_t degraded = 0;
    uint64_t anomalies = 0;
    uint64_t published = 0;
    uint64_t publish_failures = 0;
    uint64_t schema_mismatches = 0;
    uint64_t unavailable = 0;
    uint64_t scoring_errors = 0;
    size_t lanes = 0;

    nlohmann::json to_json() const;
};

// Routes readings to per-monitor lanes and runs them on a fixed worker pool.
// A lane is queued on the pool at most once at a time, so each monitor's
// readings are processed strictly in submission order while different
// monitors run in parallel.
class StreamEngine {
public:
    using VerdictListener = std::function<void(const AnomalyVerdict&)>;

    StreamEngine(EngineConfig config,
                 std::shared_ptr<ai::ModelCache> cache,
                 std::shared_ptr<IAlertTransport> transport);
    ~StreamEngine();

    StreamEngine(const StreamEngine&) = delete;
    StreamEngine& operator=(const StreamEngine&) = delete;

    void start();

    // false once the engine is stopping
    bool submit(Reading reading);

    // Parses and submits; false when the payload is rejected
    bool submit_raw(const std::string& payload);

    // Blocks until every accepted reading has been processed
    void drain();

    // Flushes windows, drains lanes and joins the workers
    void stop();

    // Called from worker threads for every verdict, positive or not
    void set_verdict_listener(VerdictListener listener);

    EngineStats stats() const;
    size_t lane_count() const;
    const AlertEmitter& emitter() const { return emitter_; }

private:
    std::shared_ptr<MonitorLane> lane_for(const std::string& monitor_id);
    void schedule(const std::shared_ptr<MonitorLane>& lane);
    void run_lane(const std::shared_ptr<MonitorLane>& lane);
    void record(const LaneReport& report);
    void finish_one();

    void initialize_workers(size_t num_threads);
    void stop_workers();
    void add_task(std::function<void()> task);

    EngineConfig config_;
    std::shared_ptr<ai::ModelCache> cache_;
    ReadingParser parser_;
    AnomalyDetector detector_;
    AlertEmitter emitter_;
    VerdictListener listener_;

    std::unordered_map<std::string, std::shared_ptr<MonitorLane>> lanes_;
    mutable std::shared_mutex lanes_mutex_;

    std::vector<std::thread> worker_threads_;
    std::queue<std::function<void()>> task_queue_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    bool stop_workers_ = false;

    std::mutex idle_mutex_;
    std::condition_variable idle_cv_;
    size_t outstanding_ = 0;

    // Held shared by submitters, exclusively when intake closes
    std::shared_mutex submit_mutex_;
    std::atomic<bool> running_{false};
    std::atomic<bool> accepting_{false};

    std::atomic<uint64_t> received_{0};
    std::atomic<uint64_t> rejected_{0};
    std::atomic<uint64_t> late_drops_{0};
    std::atomic<uint64_t> summaries_{0};
    std::atomic<uint64_t> insufficient_data_{0};
    std::atomic<uint64_t> scored_{0};
    std::atomic<uint64_t> degraded_{0};
    std::atomic<uint64_t> anomalies_{0};
    std::atomic<uint64_t> published_{0};
    std::atomic<uint64_t> publish_failures_{0};
    std::atomic<uint64_t> schema_mismatches_{0};
    std::atomic<uint64_t> unavailable_{0};
    std::atomic<uint64_t> scoring_errors_{0};
};

} // namespace stream
} // namespace vigil

#endif // VIGIL_STREAM_STREAM_ENGINE_H
