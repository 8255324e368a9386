#pragma once
#ifndef VIGIL_TELEMETRY_H
#define VIGIL_TELEMETRY_H

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace vigil {

// Source-assigned event time in milliseconds
using Timestamp = int64_t;

struct Reading {
    std::string monitor_id;
    std::string device_id;
    Timestamp timestamp = 0;
    std::map<std::string, double> values;   // sensor code -> value

    // Optional training label carried by historical trend records (-1 = none)
    int label = -1;

    bool has_label() const { return label >= 0; }
};

// Canonical ordering used to commit readings deterministically
inline bool reading_before(const Reading& a, const Reading& b) {
    if (a.timestamp != b.timestamp) return a.timestamp < b.timestamp;
    return a.values < b.values;
}

// Fixed-layout feature vector derived from one window
struct WindowSummary {
    std::string monitor_id;
    Timestamp window_start = 0;
    Timestamp window_end = 0;
    size_t sample_count = 0;
    int label = -1;                          // label of the newest reading, if any

    std::vector<std::string> sensors;        // sorted
    std::vector<std::string> statistics;     // per-sensor statistic order
    std::vector<std::string> feature_names;  // "sensor:stat", sensor-major
    std::vector<double> features;

    // Value of a feature by name, or fallback when absent
    double feature(const std::string& name, double fallback = 0.0) const {
        for (size_t i = 0; i < feature_names.size(); ++i) {
            if (feature_names[i] == name) return features[i];
        }
        return fallback;
    }
};

using FeatureVector = std::vector<float>;

} // namespace vigil

#endif // VIGIL_TELEMETRY_H
