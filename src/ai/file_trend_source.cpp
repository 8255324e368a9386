#include "vigil/ai/trend_source.h"
#include "vigil/errors.h"
#include <algorithm>
#include <fstream>
#include <iostream>

namespace vigil {
namespace ai {

FileTrendSource::FileTrendSource(std::filesystem::path directory, FeedConfig feed)
    : directory_(std::move(directory)), parser_(std::move(feed)) {}

void FileTrendSource::accept(const nlohmann::json& record, const std::string& monitor_id,
                             std::vector<Reading>& out) {
    try {
        nlohmann::json normalized = record;
        // Trend records often omit the monitor id
        if (normalized.is_object() && !normalized.contains("monitor_id") &&
            !normalized.contains("MONITORID")) {
            normalized["monitor_id"] = monitor_id;
        }
        Reading reading = parser_.parse(normalized);
        if (reading.monitor_id != monitor_id) {
            ++skipped_records_;
            return;
        }
        out.push_back(std::move(reading));
    } catch (const ValidationError&) {
        ++skipped_records_;
    }
}

std::vector<Reading> FileTrendSource::history(const std::string& monitor_id, size_t limit) {
    std::vector<Reading> readings;

    const auto json_path = directory_ / (monitor_id + ".json");
    const auto lines_path = directory_ / (monitor_id + ".jsonl");
    std::error_code ec;

    if (std::filesystem::exists(json_path, ec)) {
        std::ifstream file(json_path);
        if (!file.is_open()) {
            throw StorageError("cannot open trend file " + json_path.string());
        }
        nlohmann::json document;
        try {
            file >> document;
        } catch (const nlohmann::json::exception& e) {
            throw StorageError("invalid trend file " + json_path.string() + ": " + e.what());
        }

        const nlohmann::json* records = &document;
        if (document.is_object()) {
            auto it = document.find("records");
            if (it == document.end() || !it->is_array()) {
                throw StorageError("trend file " + json_path.string() + " has no records array");
            }
            records = &*it;
        }
        if (!records->is_array()) {
            throw StorageError("trend file " + json_path.string() + " is not a record list");
        }
        for (const auto& record : *records) {
            accept(record, monitor_id, readings);
        }
    } else if (std::filesystem::exists(lines_path, ec)) {
        std::ifstream file(lines_path);
        if (!file.is_open()) {
            throw StorageError("cannot open trend file " + lines_path.string());
        }
        std::string line;
        while (std::getline(file, line)) {
            if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
            try {
                accept(nlohmann::json::parse(line), monitor_id, readings);
            } catch (const nlohmann::json::parse_error&) {
                ++skipped_records_;
            }
        }
    } else {
        std::cout << "[TrendSource] No history for monitor " << monitor_id << std::endl;
        return readings;
    }

    std::sort(readings.begin(), readings.end(), reading_before);
    if (limit > 0 && readings.size() > limit) {
        readings.erase(readings.begin(), readings.end() - static_cast<std::ptrdiff_t>(limit));
    }

    std::cout << "[TrendSource] Loaded " << readings.size() << " historical readings for "
              << monitor_id << std::endl;
    return readings;
}

} // namespace ai
} // namespace vigil
