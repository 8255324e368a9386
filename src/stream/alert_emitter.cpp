#include "vigil/stream/alert_emitter.h"
#include "vigil/errors.h"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <thread>

namespace vigil {
namespace stream {

StreamAlertTransport::StreamAlertTransport(std::ostream& out)
    : out_(out) {}

void StreamAlertTransport::send(const std::string& record) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    out_ << record << '\n';
    out_.flush();
    if (!out_) {
        out_.clear();
        throw TransportError("alert stream rejected write");
    }
}

AlertEmitter::AlertEmitter(std::shared_ptr<IAlertTransport> transport, PublishConfig config, FeedConfig feed)
    : transport_(std::move(transport)), config_(config), feed_(std::move(feed)) {
    if (!transport_) {
        throw std::invalid_argument("AlertEmitter requires a transport");
    }
}

nlohmann::json AlertEmitter::to_record(const AnomalyVerdict& verdict) const {
    nlohmann::json record;
    record["monitorId"] = verdict.monitor_id;
    record["timestamp"] = verdict.timestamp;
    record["score"] = verdict.score;
    record["isAnomaly"] = verdict.is_anomaly;
    record["degraded"] = verdict.degraded;
    record["threshold"] = verdict.threshold;
    record["consecutiveBreaches"] = verdict.consecutive_breaches;
    record["modelVersion"] = verdict.model_version;
    record["algorithm"] = verdict.algorithm;

    nlohmann::json top = nlohmann::json::array();
    for (const auto& contribution : verdict.top_features) {
        nlohmann::json item;
        item["feature"] = contribution.feature;
        item["sensor"] = contribution.sensor;
        item["label"] = feed_.label_for(contribution.sensor);
        item["value"] = contribution.raw_value;
        item["deviation"] = contribution.deviation;
        top.push_back(item);
    }
    record["topFeatures"] = top;

    nlohmann::json summary;
    summary["windowStart"] = verdict.summary.window_start;
    summary["windowEnd"] = verdict.summary.window_end;
    summary["samples"] = verdict.summary.sample_count;
    nlohmann::json features = nlohmann::json::object();
    for (size_t i = 0; i < verdict.summary.feature_names.size(); ++i) {
        features[verdict.summary.feature_names[i]] = verdict.summary.features[i];
    }
    summary["features"] = features;
    record["summary"] = summary;
    return record;
}

bool AlertEmitter::publish(const AnomalyVerdict& verdict) {
    if (!verdict.is_anomaly) {
        return true;
    }

    const std::string record = to_record(verdict).dump();
    const size_t attempts = std::max<size_t>(1, config_.max_attempts);

    for (size_t attempt = 1; attempt <= attempts; ++attempt) {
        try {
            transport_->send(record);
            ++published_;
            return true;
        } catch (const TransportError& e) {
            std::cerr << "[AlertEmitter] Publish for " << verdict.monitor_id << " failed (attempt "
                      << attempt << "/" << attempts << "): " << e.what() << std::endl;
            if (attempt < attempts) {
                ++retries_;
                std::this_thread::sleep_for(
                    std::chrono::milliseconds(config_.retry_backoff_ms * static_cast<int64_t>(attempt)));
            }
        }
    }

    ++failures_;
    std::cerr << "[AlertEmitter] Dropping alert for " << verdict.monitor_id << " at "
              << verdict.timestamp << " after " << attempts << " attempts" << std::endl;
    return false;
}

} // namespace stream
} // namespace vigil
