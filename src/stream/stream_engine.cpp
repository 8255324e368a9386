#include "vigil/stream/stream_engine.h"
#include "vigil/errors.h"
#include <iostream>

namespace vigil {
namespace stream {

nlohmann::json EngineStats::to_json() const {
    nlohmann::json j;
    j["received"] = received;
    j["rejected"] = rejected;
    j["late_drops"] = late_drops;
    j["summaries"] = summaries;
    j["insufficient_data"] = insufficient_data;
    j["scored"] = scored;
    j["degraded"] = degraded;
    j["anomalies"] = anomalies;
    j["published"] = published;
    j["publish_failures"] = publish_failures;
    j["schema_mismatches"] = schema_mismatches;
    j["unavailable"] = unavailable;
    j["scoring_errors"] = scoring_errors;
    j["lanes"] = lanes;
    return j;
}

StreamEngine::StreamEngine(EngineConfig config,
                           std::shared_ptr<ai::ModelCache> cache,
                           std::shared_ptr<IAlertTransport> transport)
    : config_(std::move(config)),
      cache_(std::move(cache)),
      parser_(config_.feed),
      detector_(config_.detector),
      emitter_(std::move(transport), config_.publish, config_.feed) {
    if (!cache_) {
        throw std::invalid_argument("StreamEngine requires a model cache");
    }
}

StreamEngine::~StreamEngine() {
    stop();
}

void StreamEngine::start() {
    if (running_.exchange(true)) {
        return;
    }
    initialize_workers(config_.lanes.worker_threads);
    accepting_.store(true);
    std::cout << "[StreamEngine] Started with " << config_.lanes.worker_threads
              << " worker threads" << std::endl;
}

void StreamEngine::set_verdict_listener(VerdictListener listener) {
    listener_ = std::move(listener);
}

// ============================================
// Worker pool
// ============================================

void StreamEngine::initialize_workers(size_t num_threads) {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stop_workers_ = false;
    }
    for (size_t i = 0; i < num_threads; ++i) {
        worker_threads_.emplace_back([this]() {
            while (true) {
                std::function<void()> task;

                {
                    std::unique_lock<std::mutex> lock(queue_mutex_);
                    cv_.wait(lock, [this]() {
                        return !task_queue_.empty() || stop_workers_;
                    });

                    if (stop_workers_ && task_queue_.empty()) {
                        return;
                    }

                    task = std::move(task_queue_.front());
                    task_queue_.pop();
                }

                task();
            }
        });
    }
}

void StreamEngine::stop_workers() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stop_workers_ = true;
    }

    cv_.notify_all();

    for (auto& thread : worker_threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    worker_threads_.clear();
}

void StreamEngine::add_task(std::function<void()> task) {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        task_queue_.push(std::move(task));
    }
    cv_.notify_one();
}

// ============================================
// Lanes
// ============================================

std::shared_ptr<MonitorLane> StreamEngine::lane_for(const std::string& monitor_id) {
    {
        std::shared_lock<std::shared_mutex> lock(lanes_mutex_);
        auto it = lanes_.find(monitor_id);
        if (it != lanes_.end()) {
            return it->second;
        }
    }

    std::unique_lock<std::shared_mutex> lock(lanes_mutex_);
    auto it = lanes_.find(monitor_id);
    if (it == lanes_.end()) {
        auto lane = std::make_shared<MonitorLane>(monitor_id, config_, *cache_, detector_, emitter_);
        it = lanes_.emplace(monitor_id, std::move(lane)).first;
    }
    return it->second;
}

size_t StreamEngine::lane_count() const {
    std::shared_lock<std::shared_mutex> lock(lanes_mutex_);
    return lanes_.size();
}

bool StreamEngine::submit(Reading reading) {
    std::shared_lock<std::shared_mutex> gate(submit_mutex_);
    if (!accepting_.load()) {
        return false;
    }
    ++received_;

    auto lane = lane_for(reading.monitor_id);
    {
        std::lock_guard<std::mutex> lock(idle_mutex_);
        ++outstanding_;
    }

    bool needs_schedule = false;
    {
        std::lock_guard<std::mutex> lock(lane->mailbox_mutex_);
        lane->mailbox_.push_back(std::move(reading));
        if (!lane->scheduled_) {
            lane->scheduled_ = true;
            needs_schedule = true;
        }
    }
    if (needs_schedule) {
        schedule(lane);
    }
    return true;
}

bool StreamEngine::submit_raw(const std::string& payload) {
    if (!accepting_.load()) {
        return false;
    }
    try {
        return submit(parser_.parse(payload));
    } catch (const ValidationError& e) {
        ++received_;
        ++rejected_;
        if (config_.debug) {
            std::cerr << "[StreamEngine] Rejected reading: " << e.what() << std::endl;
        }
        return false;
    }
}

void StreamEngine::schedule(const std::shared_ptr<MonitorLane>& lane) {
    add_task([this, lane]() { run_lane(lane); });
}

void StreamEngine::run_lane(const std::shared_ptr<MonitorLane>& lane) {
    for (size_t processed = 0; processed < config_.lanes.batch_size; ++processed) {
        Reading reading;
        {
            std::lock_guard<std::mutex> lock(lane->mailbox_mutex_);
            if (lane->mailbox_.empty()) {
                lane->scheduled_ = false;
                return;
            }
            reading = std::move(lane->mailbox_.front());
            lane->mailbox_.pop_front();
        }

        try {
            record(lane->process(reading));
        } catch (const std::exception& e) {
            ++scoring_errors_;
            std::cerr << "[StreamEngine] Reading for " << lane->monitor_id()
                      << " at " << reading.timestamp << " failed: " << e.what() << std::endl;
        }
        finish_one();
    }

    // Batch used up: yield the worker to other lanes
    {
        std::lock_guard<std::mutex> lock(lane->mailbox_mutex_);
        if (lane->mailbox_.empty()) {
            lane->scheduled_ = false;
            return;
        }
    }
    schedule(lane);
}

void StreamEngine::record(const LaneReport& report) {
    late_drops_ += report.late_drops;
    summaries_ += report.summaries;
    insufficient_data_ += report.insufficient_data;
    scored_ += report.scored;
    degraded_ += report.degraded;
    anomalies_ += report.anomalies;
    published_ += report.published;
    publish_failures_ += report.publish_failures;
    schema_mismatches_ += report.schema_mismatches;
    unavailable_ += report.unavailable;
    scoring_errors_ += report.scoring_errors;

    if (listener_) {
        for (const auto& verdict : report.verdicts) {
            listener_(verdict);
        }
    }
}

void StreamEngine::finish_one() {
    std::lock_guard<std::mutex> lock(idle_mutex_);
    if (outstanding_ > 0) {
        --outstanding_;
    }
    if (outstanding_ == 0) {
        idle_cv_.notify_all();
    }
}

void StreamEngine::drain() {
    std::unique_lock<std::mutex> lock(idle_mutex_);
    idle_cv_.wait(lock, [this]() { return outstanding_ == 0; });
}

void StreamEngine::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    {
        std::unique_lock<std::shared_mutex> gate(submit_mutex_);
        accepting_.store(false);
    }
    drain();

    // Nothing is scheduled after drain, so flushing here keeps per-lane order
    std::vector<std::shared_ptr<MonitorLane>> lanes;
    {
        std::shared_lock<std::shared_mutex> lock(lanes_mutex_);
        lanes.reserve(lanes_.size());
        for (const auto& [id, lane] : lanes_) {
            lanes.push_back(lane);
        }
    }
    for (const auto& lane : lanes) {
        try {
            record(lane->flush());
        } catch (const std::exception& e) {
            std::cerr << "[StreamEngine] Flush for " << lane->monitor_id() << " failed: "
                      << e.what() << std::endl;
        }
    }

    stop_workers();
    std::cout << "[StreamEngine] Stopped: " << stats().to_json().dump() << std::endl;
}

EngineStats StreamEngine::stats() const {
    EngineStats stats;
    stats.received = received_.load();
    stats.rejected = rejected_.load();
    stats.late_drops = late_drops_.load();
    stats.summaries = summaries_.load();
    stats.insufficient_data = insufficient_data_.load();
    stats.scored = scored_.load();
    stats.degraded = degraded_.load();
    stats.anomalies = anomalies_.load();
    stats.published = published_.load();
    stats.publish_failures = publish_failures_.load();
    stats.schema_mismatches = schema_mismatches_.load();
    stats.unavailable = unavailable_.load();
    stats.scoring_errors = scoring_errors_.load();
    stats.lanes = lane_count();
    return stats;
}

} // namespace stream
} // namespace vigil
