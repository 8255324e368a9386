#include "vigil/ai/scoring_model.h"
#include "vigil/ai/isolation_forest.h"
#include "vigil/ai/lightgbm_model.h"
#include "vigil/errors.h"
#include <algorithm>
#include <iostream>
#include <mutex>

namespace vigil {
namespace ai {

ScoringModelRegistry::ScoringModelRegistry() {
    decoders_["isolation_forest"] = [](const nlohmann::json& j) -> std::shared_ptr<const IScoringModel> {
        return IsolationForest::from_json(j);
    };
    decoders_["lightgbm"] = [](const nlohmann::json& j) -> std::shared_ptr<const IScoringModel> {
        return LightGBMModel::from_json(j);
    };
}

ScoringModelRegistry& ScoringModelRegistry::instance() {
    static ScoringModelRegistry instance;
    return instance;
}

bool ScoringModelRegistry::register_decoder(const std::string& algorithm, Decoder decoder) {
    std::unique_lock lock(mutex_);
    if (decoders_.find(algorithm) != decoders_.end()) {
        std::cerr << "[ScoringModelRegistry] Decoder already registered: " << algorithm << std::endl;
        return false;
    }
    decoders_[algorithm] = std::move(decoder);
    return true;
}

bool ScoringModelRegistry::is_supported(const std::string& algorithm) const {
    std::shared_lock lock(mutex_);
    return decoders_.find(algorithm) != decoders_.end();
}

std::vector<std::string> ScoringModelRegistry::algorithms() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> names;
    names.reserve(decoders_.size());
    for (const auto& [name, _] : decoders_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::shared_ptr<const IScoringModel> ScoringModelRegistry::decode(
    const std::string& algorithm, const nlohmann::json& document) const {

    Decoder decoder;
    {
        std::shared_lock lock(mutex_);
        auto it = decoders_.find(algorithm);
        if (it == decoders_.end()) {
            throw StorageError("unsupported model algorithm: " + algorithm);
        }
        decoder = it->second;
    }

    try {
        auto model = decoder(document);
        if (!model) {
            throw StorageError("decoder for " + algorithm + " returned no model");
        }
        return model;
    } catch (const nlohmann::json::exception& e) {
        throw StorageError("malformed " + algorithm + " model: " + e.what());
    }
}

} // namespace ai
} // namespace vigil
