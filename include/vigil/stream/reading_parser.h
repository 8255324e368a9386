#pragma once
#ifndef VIGIL_STREAM_READING_PARSER_H
#define VIGIL_STREAM_READING_PARSER_H

#include "vigil/config.h"
#include "vigil/telemetry.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace vigil {
namespace stream {

// Turns inbound JSON records into Readings. Accepts the device wire format
// (MONITORID / TIMESTAMP / PROCESS_PARAMETER) and the canonical
// (monitor_id / timestamp / values) layout. Throws ValidationError.
class ReadingParser {
public:
    ReadingParser() = default;
    explicit ReadingParser(FeedConfig feed);

    Reading parse(const std::string& payload) const;
    Reading parse(const nlohmann::json& record) const;

    // Numeric coercion: numbers and numeric strings, finite only
    static std::optional<double> clean_numeric(const nlohmann::json& value);

private:
    bool keep_sensor(const std::string& sensor) const;

    FeedConfig feed_;
};

} // namespace stream
} // namespace vigil

#endif // VIGIL_STREAM_READING_PARSER_H
