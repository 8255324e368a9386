#pragma once
#ifndef VIGIL_STREAM_ALERT_EMITTER_H
#define VIGIL_STREAM_ALERT_EMITTER_H

#include "vigil/config.h"
#include "vigil/stream/anomaly_detector.h"
#include <nlohmann/json.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>

namespace vigil {
namespace stream {

// Outbound alert channel. send() throws TransportError.
class IAlertTransport {
public:
    virtual ~IAlertTransport() = default;
    virtual void send(const std::string& record) = 0;
};

// One JSON record per line on a stream (stdout or an append-mode file)
class StreamAlertTransport : public IAlertTransport {
public:
    explicit StreamAlertTransport(std::ostream& out);

    void send(const std::string& record) override;

private:
    std::ostream& out_;
    std::mutex write_mutex_;
};

class AlertEmitter {
public:
    AlertEmitter(std::shared_ptr<IAlertTransport> transport, PublishConfig config, FeedConfig feed = {});

    // Negative verdicts are ignored. Retries TransportError up to
    // max_attempts; returns false when the record could not be delivered.
    bool publish(const AnomalyVerdict& verdict);

    nlohmann::json to_record(const AnomalyVerdict& verdict) const;

    uint64_t published() const { return published_.load(); }
    uint64_t failures() const { return failures_.load(); }
    uint64_t retries() const { return retries_.load(); }

private:
    std::shared_ptr<IAlertTransport> transport_;
    PublishConfig config_;
    FeedConfig feed_;

    std::atomic<uint64_t> published_{0};
    std::atomic<uint64_t> failures_{0};
    std::atomic<uint64_t> retries_{0};
};

} // namespace stream
} // namespace vigil

#endif // VIGIL_STREAM_ALERT_EMITTER_H
