#pragma once
#ifndef VIGIL_ERRORS_H
#define VIGIL_ERRORS_H

#include <stdexcept>
#include <string>
#include <vector>

namespace vigil {

// Base of every error raised inside the pipeline
class PipelineError : public std::runtime_error {
public:
    explicit PipelineError(const std::string& message)
        : std::runtime_error(message) {}
};

// Malformed inbound reading. Dropped and counted, never fatal.
class ValidationError : public PipelineError {
public:
    ValidationError(const std::string& field, const std::string& message)
        : PipelineError("Validation error on '" + field + "': " + message),
          field_(field) {}

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

// Artifact expects a different sensor/feature set than the window produced
class SchemaMismatch : public PipelineError {
public:
    SchemaMismatch(const std::string& monitor_id,
                   std::vector<std::string> expected,
                   std::vector<std::string> actual)
        : PipelineError(describe(monitor_id, expected, actual)),
          monitor_id_(monitor_id),
          expected_(std::move(expected)),
          actual_(std::move(actual)) {}

    const std::string& monitor_id() const { return monitor_id_; }
    const std::vector<std::string>& expected() const { return expected_; }
    const std::vector<std::string>& actual() const { return actual_; }

private:
    static std::string describe(const std::string& monitor_id,
                                const std::vector<std::string>& expected,
                                const std::vector<std::string>& actual) {
        std::string msg = "Schema mismatch for monitor " + monitor_id + ": expected [";
        for (size_t i = 0; i < expected.size(); ++i) {
            if (i > 0) msg += ", ";
            msg += expected[i];
        }
        msg += "], got [";
        for (size_t i = 0; i < actual.size(); ++i) {
            if (i > 0) msg += ", ";
            msg += actual[i];
        }
        return msg + "]";
    }

    std::string monitor_id_;
    std::vector<std::string> expected_;
    std::vector<std::string> actual_;
};

class StorageError : public PipelineError {
public:
    explicit StorageError(const std::string& message)
        : PipelineError("Storage error: " + message) {}
};

class BuildError : public PipelineError {
public:
    explicit BuildError(const std::string& message)
        : PipelineError("Build error: " + message) {}
};

class TransportError : public PipelineError {
public:
    explicit TransportError(const std::string& message)
        : PipelineError("Transport error: " + message) {}
};

class TimeoutError : public PipelineError {
public:
    TimeoutError(const std::string& operation, long long timeout_ms)
        : PipelineError(operation + " timed out after " + std::to_string(timeout_ms) + "ms"),
          operation_(operation) {}

    const std::string& operation() const { return operation_; }

private:
    std::string operation_;
};

class ConfigError : public PipelineError {
public:
    explicit ConfigError(const std::string& message)
        : PipelineError("Configuration error: " + message) {}
};

} // namespace vigil

#endif // VIGIL_ERRORS_H
