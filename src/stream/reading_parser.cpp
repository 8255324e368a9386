#include "vigil/stream/reading_parser.h"
#include "vigil/errors.h"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace vigil {
namespace stream {

namespace {

const nlohmann::json* find_first(const nlohmann::json& record,
                                 std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = record.find(key);
        if (it != record.end() && !it->is_null()) {
            return &*it;
        }
    }
    return nullptr;
}

} // anonymous namespace

ReadingParser::ReadingParser(FeedConfig feed)
    : feed_(std::move(feed)) {}

std::optional<double> ReadingParser::clean_numeric(const nlohmann::json& value) {
    double parsed = 0.0;

    if (value.is_number()) {
        parsed = value.get<double>();
    } else if (value.is_string()) {
        const std::string& text = value.get_ref<const std::string&>();
        if (text.empty()) {
            return std::nullopt;
        }
        try {
            size_t consumed = 0;
            parsed = std::stod(text, &consumed);
            // Allow trailing whitespace only
            while (consumed < text.size() && std::isspace(static_cast<unsigned char>(text[consumed]))) {
                ++consumed;
            }
            if (consumed != text.size()) {
                return std::nullopt;
            }
        } catch (const std::exception&) {
            return std::nullopt;
        }
    } else {
        return std::nullopt;
    }

    if (!std::isfinite(parsed)) {
        return std::nullopt;
    }
    return parsed;
}

bool ReadingParser::keep_sensor(const std::string& sensor) const {
    if (feed_.sensors.empty()) return true;
    return std::find(feed_.sensors.begin(), feed_.sensors.end(), sensor) != feed_.sensors.end();
}

Reading ReadingParser::parse(const std::string& payload) const {
    nlohmann::json record;
    try {
        record = nlohmann::json::parse(payload);
    } catch (const nlohmann::json::parse_error& e) {
        throw ValidationError("payload", std::string("not valid JSON: ") + e.what());
    }
    return parse(record);
}

Reading ReadingParser::parse(const nlohmann::json& record) const {
    if (!record.is_object()) {
        throw ValidationError("payload", "expected a JSON object");
    }

    Reading reading;

    // Monitor id
    const nlohmann::json* monitor = find_first(record, {"monitor_id", "MONITORID", "monitorId"});
    if (!monitor) {
        throw ValidationError("monitor_id", "missing");
    }
    if (monitor->is_string()) {
        reading.monitor_id = monitor->get<std::string>();
    } else if (monitor->is_number_integer()) {
        reading.monitor_id = std::to_string(monitor->get<long long>());
    } else {
        throw ValidationError("monitor_id", "must be a string or integer");
    }
    if (reading.monitor_id.empty()) {
        throw ValidationError("monitor_id", "empty");
    }

    if (const nlohmann::json* device = find_first(record, {"device_id", "DEVICEID"})) {
        reading.device_id = device->is_string() ? device->get<std::string>() : device->dump();
    }

    // Timestamp (milliseconds)
    const nlohmann::json* ts = find_first(record, {"timestamp", "TIMESTAMP"});
    if (!ts) {
        throw ValidationError("timestamp", "missing");
    }
    if (ts->is_number_integer()) {
        reading.timestamp = ts->get<Timestamp>();
    } else {
        auto numeric = clean_numeric(*ts);
        if (!numeric || std::floor(*numeric) != *numeric) {
            throw ValidationError("timestamp", "must be an integral millisecond value");
        }
        reading.timestamp = static_cast<Timestamp>(*numeric);
    }

    // Sensor values
    const nlohmann::json* values = find_first(record, {"values", "PROCESS_PARAMETER"});
    if (!values || !values->is_object()) {
        throw ValidationError("values", "missing sensor mapping");
    }
    for (const auto& [sensor, raw] : values->items()) {
        if (!keep_sensor(sensor)) {
            continue;
        }
        auto numeric = clean_numeric(raw);
        if (!numeric) {
            throw ValidationError(sensor, "unparsable value " + raw.dump());
        }
        reading.values[sensor] = *numeric;
    }
    if (reading.values.empty()) {
        throw ValidationError("values", "no usable sensor values");
    }

    // Historical trend records may carry a label
    if (const nlohmann::json* label = find_first(record, {"label", "is_anomaly"})) {
        if (label->is_boolean()) {
            reading.label = label->get<bool>() ? 1 : 0;
        } else if (label->is_number()) {
            reading.label = label->get<double>() != 0.0 ? 1 : 0;
        }
    }

    return reading;
}

} // namespace stream
} // namespace vigil
