#include "vigil/stream/sliding_window.h"
#include "vigil/errors.h"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <limits>
#include <set>

namespace vigil {
namespace stream {

namespace {

Timestamp floor_to_tick(Timestamp ts, Timestamp tick) {
    Timestamp q = ts / tick;
    if (ts % tick != 0 && ts < 0) --q;
    return q * tick;
}

} // anonymous namespace

SlidingWindow::SlidingWindow(std::string monitor_id, WindowConfig config)
    : monitor_id_(std::move(monitor_id)), config_(std::move(config)) {}

Timestamp SlidingWindow::watermark() const {
    if (!seen_any_) {
        return std::numeric_limits<Timestamp>::min();
    }
    return max_seen_ - config_.lateness_ms;
}

std::vector<WindowSummary> SlidingWindow::ingest(const Reading& reading) {
    if (reading.monitor_id != monitor_id_) {
        throw ValidationError("monitor_id", "reading for " + reading.monitor_id +
                              " routed to window of " + monitor_id_);
    }

    if (seen_any_ && reading.timestamp < watermark()) {
        ++late_drops_;
        return {};
    }

    auto pos = std::upper_bound(pending_.begin(), pending_.end(), reading, reading_before);
    pending_.insert(pos, reading);

    if (!seen_any_ || reading.timestamp > max_seen_) {
        max_seen_ = reading.timestamp;
        seen_any_ = true;
    }

    // Commit strictly below the watermark. A reading at the watermark can
    // still be joined by another with the same timestamp, which must commit
    // first if it sorts first; with lateness_ms == 0 this holds back the
    // newest timestamp until a later one arrives.
    const Timestamp mark = watermark();
    size_t ready = 0;
    while (ready < pending_.size() && pending_[ready].timestamp < mark) {
        ++ready;
    }

    std::vector<WindowSummary> summaries;
    for (size_t i = 0; i < ready; ++i) {
        if (auto summary = commit(pending_[i])) {
            summaries.push_back(std::move(*summary));
        }
    }
    pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(ready));
    return summaries;
}

std::vector<WindowSummary> SlidingWindow::flush() {
    std::vector<WindowSummary> summaries;
    for (const auto& reading : pending_) {
        if (auto summary = commit(reading)) {
            summaries.push_back(std::move(*summary));
        }
    }
    pending_.clear();
    return summaries;
}

std::optional<WindowSummary> SlidingWindow::commit(const Reading& reading) {
    retained_.push_back(reading);
    evict(reading.timestamp);
    ++commits_since_emit_;

    if (retained_.size() < config_.min_samples) {
        return std::nullopt;
    }
    if (!should_emit(reading.timestamp)) {
        return std::nullopt;
    }
    return summarize(reading);
}

void SlidingWindow::evict(Timestamp now) {
    const Timestamp oldest_allowed = now - config_.span_ms;
    while (!retained_.empty() && retained_.front().timestamp < oldest_allowed) {
        retained_.pop_front();
    }
    if (config_.max_count > 0) {
        while (retained_.size() > config_.max_count) {
            retained_.pop_front();
        }
    }
}

bool SlidingWindow::should_emit(Timestamp now) {
    if (config_.tick_ms > 0) {
        if (!tick_started_) {
            tick_started_ = true;
            next_tick_ = floor_to_tick(now, config_.tick_ms) + config_.tick_ms;
            return false;
        }
        if (now < next_tick_) {
            return false;
        }
        next_tick_ = floor_to_tick(now, config_.tick_ms) + config_.tick_ms;
        return true;
    }

    if (commits_since_emit_ < config_.emit_every) {
        return false;
    }
    commits_since_emit_ = 0;
    return true;
}

WindowSummary SlidingWindow::summarize(const Reading& newest) const {
    WindowSummary summary;
    summary.monitor_id = monitor_id_;
    summary.window_start = retained_.front().timestamp;
    summary.window_end = newest.timestamp;
    summary.sample_count = retained_.size();
    summary.label = newest.label;
    summary.statistics = config_.statistics;

    std::set<std::string> sensor_set;
    for (const auto& reading : retained_) {
        for (const auto& [sensor, value] : reading.values) {
            sensor_set.insert(sensor);
        }
    }
    summary.sensors.assign(sensor_set.begin(), sensor_set.end());

    const Eigen::Index rows = static_cast<Eigen::Index>(retained_.size());
    const Eigen::Index cols = static_cast<Eigen::Index>(summary.sensors.size());
    const double nan = std::numeric_limits<double>::quiet_NaN();

    // Missing sensor values are NaN and excluded per column
    Eigen::MatrixXd data = Eigen::MatrixXd::Constant(rows, cols, nan);
    for (Eigen::Index r = 0; r < rows; ++r) {
        const auto& values = retained_[static_cast<size_t>(r)].values;
        for (Eigen::Index c = 0; c < cols; ++c) {
            auto it = values.find(summary.sensors[static_cast<size_t>(c)]);
            if (it != values.end()) {
                data(r, c) = it->second;
            }
        }
    }

    summary.features.reserve(static_cast<size_t>(cols) * summary.statistics.size());
    summary.feature_names.reserve(summary.features.capacity());

    for (Eigen::Index c = 0; c < cols; ++c) {
        Eigen::ArrayXd column = data.col(c).array();
        Eigen::Array<bool, Eigen::Dynamic, 1> present = !column.isNaN();
        const double count = static_cast<double>(present.count());

        const double mean = present.select(column, 0.0).sum() / count;
        const double variance = present.select(column - mean, 0.0).square().sum() / count;
        const double min = present.select(column, std::numeric_limits<double>::infinity()).minCoeff();
        const double max = present.select(column, -std::numeric_limits<double>::infinity()).maxCoeff();

        double last = mean;
        for (Eigen::Index r = rows - 1; r >= 0; --r) {
            if (present(r)) {
                last = column(r);
                break;
            }
        }

        const std::string& sensor = summary.sensors[static_cast<size_t>(c)];
        for (const auto& stat : summary.statistics) {
            double value = 0.0;
            if (stat == "mean") value = mean;
            else if (stat == "std") value = std::sqrt(variance);
            else if (stat == "min") value = min;
            else if (stat == "max") value = max;
            else if (stat == "last") value = last;
            summary.feature_names.push_back(sensor + ":" + stat);
            summary.features.push_back(value);
        }
    }

    return summary;
}

} // namespace stream
} // namespace vigil
