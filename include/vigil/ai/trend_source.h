#pragma once
#ifndef VIGIL_AI_TREND_SOURCE_H
#define VIGIL_AI_TREND_SOURCE_H

#include "vigil/stream/reading_parser.h"
#include "vigil/telemetry.h"
#include <atomic>
#include <filesystem>
#include <string>
#include <vector>

namespace vigil {
namespace ai {

// Historical readings used to train new artifacts. Throws StorageError.
class ITrendSource {
public:
    virtual ~ITrendSource() = default;

    // Up to `limit` most recent readings, oldest first
    virtual std::vector<Reading> history(const std::string& monitor_id, size_t limit) = 0;
};

// Reads <directory>/<monitor_id>.json ({"records": [...]}) or
// <directory>/<monitor_id>.jsonl (one record per line)
class FileTrendSource : public ITrendSource {
public:
    FileTrendSource(std::filesystem::path directory, FeedConfig feed = {});

    std::vector<Reading> history(const std::string& monitor_id, size_t limit) override;

    size_t skipped_records() const { return skipped_records_.load(); }

private:
    void accept(const nlohmann::json& record, const std::string& monitor_id,
                std::vector<Reading>& out);

    std::filesystem::path directory_;
    stream::ReadingParser parser_;
    std::atomic<size_t> skipped_records_{0};
};

} // namespace ai
} // namespace vigil

#endif // VIGIL_AI_TREND_SOURCE_H
