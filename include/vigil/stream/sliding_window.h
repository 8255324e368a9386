#pragma once
#ifndef VIGIL_STREAM_SLIDING_WINDOW_H
#define VIGIL_STREAM_SLIDING_WINDOW_H

#include "vigil/config.h"
#include "vigil/telemetry.h"
#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace vigil {
namespace stream {

// Per-monitor ordered buffer of recent readings.
//
// Arrivals are held in a pending buffer until the watermark
// (max seen timestamp - lateness) strictly passes them, then committed in canonical
// (timestamp, values) order. Summaries are computed at commit time against
// the committed reading's timestamp, so the emitted sequence depends only on
// the set of readings, not on their arrival order within the tolerance.
// Not thread-safe; owned by exactly one lane.
class SlidingWindow {
public:
    SlidingWindow(std::string monitor_id, WindowConfig config);

    // Zero or more summaries, one per committed reading that qualifies
    std::vector<WindowSummary> ingest(const Reading& reading);

    // Commit everything still pending (end of stream / shutdown)
    std::vector<WindowSummary> flush();

    const std::string& monitor_id() const { return monitor_id_; }
    const std::deque<Reading>& readings() const { return retained_; }
    size_t size() const { return retained_.size(); }
    size_t pending() const { return pending_.size(); }
    size_t late_drops() const { return late_drops_; }
    Timestamp watermark() const;

private:
    std::optional<WindowSummary> commit(const Reading& reading);
    void evict(Timestamp now);
    bool should_emit(Timestamp now);
    WindowSummary summarize(const Reading& newest) const;

    std::string monitor_id_;
    WindowConfig config_;

    std::deque<Reading> retained_;
    std::vector<Reading> pending_;   // sorted by reading_before

    bool seen_any_ = false;
    Timestamp max_seen_ = 0;
    size_t commits_since_emit_ = 0;
    bool tick_started_ = false;
    Timestamp next_tick_ = 0;
    size_t late_drops_ = 0;
};

} // namespace stream
} // namespace vigil

#endif // VIGIL_STREAM_SLIDING_WINDOW_H
