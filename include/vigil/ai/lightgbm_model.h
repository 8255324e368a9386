#pragma once
#ifndef VIGIL_AI_LIGHTGBM_MODEL_H
#define VIGIL_AI_LIGHTGBM_MODEL_H

#include "vigil/ai/scoring_model.h"
#include <LightGBM/c_api.h>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace vigil {
namespace ai {

// Binary LightGBM booster scoring P(anomaly). The booster text is embedded in
// the artifact so a model travels as a single document.
class LightGBMModel : public IScoringModel {
private:
    BoosterHandle booster_ = nullptr;
    size_t num_features_ = 0;
    double threshold_ = 0.5;
    size_t training_samples_ = 0;
    mutable std::mutex booster_mutex_;

public:
    LightGBMModel() = default;
    ~LightGBMModel() override;

    LightGBMModel(const LightGBMModel&) = delete;
    LightGBMModel& operator=(const LightGBMModel&) = delete;

    // labels are 0 (normal) / 1 (anomaly). Throws BuildError.
    void train(const std::vector<FeatureVector>& samples,
               const std::vector<int>& labels,
               size_t rounds,
               uint32_t seed);

    // Throws StorageError
    void load_from_string(const std::string& model_text);
    std::string model_string() const;

    double score(const FeatureVector& features) const override;
    size_t num_features() const override { return num_features_; }
    std::string algorithm() const override { return "lightgbm"; }
    double threshold() const override { return threshold_; }
    nlohmann::json to_json() const override;

    bool is_loaded() const { return booster_ != nullptr; }

    static std::shared_ptr<LightGBMModel> from_json(const nlohmann::json& j);
};

} // namespace ai
} // namespace vigil

#endif // VIGIL_AI_LIGHTGBM_MODEL_H
