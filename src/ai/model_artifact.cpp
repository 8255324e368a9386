#include "vigil/ai/model_artifact.h"
#include "vigil/errors.h"
#include <iostream>

namespace vigil {
namespace ai {

namespace {

int64_t to_epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_epoch_ms(int64_t ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

} // anonymous namespace

ArtifactBytes ArtifactCodec::encode(const ModelArtifact& artifact) {
    if (!artifact.model) {
        throw std::invalid_argument("ArtifactCodec: artifact for " + artifact.monitor_id +
                                    " has no model");
    }

    nlohmann::json j;
    j["format_version"] = kFormatVersion;
    j["monitor_id"] = artifact.monitor_id;
    j["version"] = artifact.version;
    j["built_at"] = to_epoch_ms(artifact.built_at);
    j["valid"] = artifact.valid;
    j["algorithm"] = artifact.model->algorithm();
    j["sensors"] = artifact.sensors;
    j["statistics"] = artifact.statistics;
    j["scaler"] = artifact.scaler.to_json();
    j["model"] = artifact.model->to_json();
    j["metadata"] = artifact.metadata;
    return j.dump();
}

std::shared_ptr<const ModelArtifact> ArtifactCodec::decode(const ArtifactBytes& bytes) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(bytes);
    } catch (const nlohmann::json::parse_error& e) {
        throw StorageError(std::string("artifact is not valid JSON: ") + e.what());
    }

    try {
        int format = j.at("format_version").get<int>();
        if (format != kFormatVersion) {
            throw StorageError("unsupported artifact format version " + std::to_string(format));
        }

        auto artifact = std::make_shared<ModelArtifact>();
        artifact->monitor_id = j.at("monitor_id").get<std::string>();
        artifact->version = j.at("version").get<uint64_t>();
        artifact->built_at = from_epoch_ms(j.at("built_at").get<int64_t>());
        artifact->valid = j.at("valid").get<bool>();
        artifact->sensors = j.at("sensors").get<std::vector<std::string>>();
        artifact->statistics = j.at("statistics").get<std::vector<std::string>>();
        artifact->metadata = j.value("metadata", nlohmann::json::object());

        try {
            artifact->scaler = RobustScaler::from_json(j.at("scaler"));
        } catch (const std::invalid_argument& e) {
            throw StorageError(std::string("artifact scaler is inconsistent: ") + e.what());
        }

        const std::string algorithm = j.at("algorithm").get<std::string>();
        artifact->model = ScoringModelRegistry::instance().decode(algorithm, j.at("model"));

        if (artifact->scaler.size() != artifact->sensors.size() * artifact->statistics.size()) {
            throw StorageError("artifact scaler covers " + std::to_string(artifact->scaler.size()) +
                               " features but the sensor layout needs " +
                               std::to_string(artifact->sensors.size() * artifact->statistics.size()));
        }
        if (artifact->model->num_features() != artifact->scaler.size()) {
            throw StorageError("artifact model expects " + std::to_string(artifact->model->num_features()) +
                               " features but the scaler produces " + std::to_string(artifact->scaler.size()));
        }

        return artifact;
    } catch (const nlohmann::json::exception& e) {
        throw StorageError(std::string("malformed artifact document: ") + e.what());
    }
}

} // namespace ai
} // namespace vigil
