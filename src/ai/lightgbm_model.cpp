#include "vigil/ai/lightgbm_model.h"
#include "vigil/errors.h"
#include <algorithm>
#include <iostream>
#include <sstream>

namespace vigil {
namespace ai {

LightGBMModel::~LightGBMModel() {
    std::lock_guard<std::mutex> lock(booster_mutex_);
    if (booster_) {
        LGBM_BoosterFree(booster_);
        booster_ = nullptr;
    }
}

void LightGBMModel::train(const std::vector<FeatureVector>& samples,
                          const std::vector<int>& labels,
                          size_t rounds,
                          uint32_t seed) {
    if (samples.empty() || samples.size() != labels.size()) {
        throw BuildError("LightGBM training needs one label per sample");
    }

    const size_t num_samples = samples.size();
    const size_t num_features = samples[0].size();

    std::vector<float> flat_features;
    flat_features.reserve(num_samples * num_features);
    for (const auto& sample : samples) {
        if (sample.size() != num_features) {
            throw BuildError("inconsistent feature size in training data");
        }
        flat_features.insert(flat_features.end(), sample.begin(), sample.end());
    }

    std::cout << "[LightGBM] Creating dataset with " << num_samples
              << " rows and " << num_features << " columns" << std::endl;

    std::ostringstream params;
    params << "objective=binary"
           << " boosting=gbdt"
           << " num_leaves=15"
           << " learning_rate=0.1"
           << " min_data_in_leaf=" << std::max<size_t>(1, std::min<size_t>(20, num_samples / 10))
           << " seed=" << seed
           << " deterministic=true"
           << " num_threads=1"
           << " verbose=-1";
    const std::string param_str = params.str();

    DatasetHandle dataset = nullptr;
    int result = LGBM_DatasetCreateFromMat(
        flat_features.data(),
        C_API_DTYPE_FLOAT32,
        static_cast<int32_t>(num_samples),
        static_cast<int32_t>(num_features),
        1,  // row major
        param_str.c_str(),
        nullptr,
        &dataset
    );
    if (result != 0 || !dataset) {
        throw BuildError(std::string("failed to create LightGBM dataset: ") + LGBM_GetLastError());
    }

    std::vector<float> labels_float(labels.begin(), labels.end());
    result = LGBM_DatasetSetField(
        dataset,
        "label",
        labels_float.data(),
        static_cast<int>(labels_float.size()),
        C_API_DTYPE_FLOAT32
    );
    if (result != 0) {
        std::string error = LGBM_GetLastError();
        LGBM_DatasetFree(dataset);
        throw BuildError("failed to set LightGBM labels: " + error);
    }

    BoosterHandle new_booster = nullptr;
    result = LGBM_BoosterCreate(dataset, param_str.c_str(), &new_booster);
    if (result != 0 || !new_booster) {
        std::string error = LGBM_GetLastError();
        LGBM_DatasetFree(dataset);
        throw BuildError("failed to create LightGBM booster: " + error);
    }

    for (size_t i = 0; i < rounds; ++i) {
        int is_finished = 0;
        result = LGBM_BoosterUpdateOneIter(new_booster, &is_finished);
        if (result != 0) {
            std::string error = LGBM_GetLastError();
            LGBM_BoosterFree(new_booster);
            LGBM_DatasetFree(dataset);
            throw BuildError("LightGBM iteration " + std::to_string(i + 1) + " failed: " + error);
        }
        if (is_finished) {
            std::cout << "[LightGBM] Early stopping at iteration " << i + 1 << std::endl;
            break;
        }
    }

    LGBM_DatasetFree(dataset);

    std::lock_guard<std::mutex> lock(booster_mutex_);
    if (booster_) {
        LGBM_BoosterFree(booster_);
    }
    booster_ = new_booster;
    num_features_ = num_features;
    training_samples_ = num_samples;

    std::cout << "[LightGBM] Training completed on " << num_samples << " samples" << std::endl;
}

void LightGBMModel::load_from_string(const std::string& model_text) {
    BoosterHandle loaded = nullptr;
    int num_iterations = 0;
    int result = LGBM_BoosterLoadModelFromString(model_text.c_str(), &num_iterations, &loaded);
    if (result != 0 || !loaded) {
        throw StorageError(std::string("failed to load LightGBM booster: ") + LGBM_GetLastError());
    }

    int num_features = 0;
    if (LGBM_BoosterGetNumFeature(loaded, &num_features) != 0) {
        std::string error = LGBM_GetLastError();
        LGBM_BoosterFree(loaded);
        throw StorageError("failed to read LightGBM feature count: " + error);
    }

    std::lock_guard<std::mutex> lock(booster_mutex_);
    if (booster_) {
        LGBM_BoosterFree(booster_);
    }
    booster_ = loaded;
    num_features_ = static_cast<size_t>(num_features);
}

std::string LightGBMModel::model_string() const {
    std::lock_guard<std::mutex> lock(booster_mutex_);
    if (!booster_) {
        throw std::logic_error("LightGBMModel: no booster loaded");
    }

    // First call reports the required buffer size
    int64_t out_len = 0;
    std::string buffer(1 << 16, '\0');
    int result = LGBM_BoosterSaveModelToString(booster_, 0, -1, 0,
                                               static_cast<int64_t>(buffer.size()),
                                               &out_len, &buffer[0]);
    if (result != 0) {
        throw std::runtime_error(std::string("[LightGBM] Failed to save model: ") + LGBM_GetLastError());
    }
    if (out_len > static_cast<int64_t>(buffer.size())) {
        buffer.assign(static_cast<size_t>(out_len), '\0');
        result = LGBM_BoosterSaveModelToString(booster_, 0, -1, 0,
                                               static_cast<int64_t>(buffer.size()),
                                               &out_len, &buffer[0]);
        if (result != 0) {
            throw std::runtime_error(std::string("[LightGBM] Failed to save model: ") + LGBM_GetLastError());
        }
    }

    // out_len includes the terminating null
    buffer.resize(out_len > 0 ? static_cast<size_t>(out_len - 1) : 0);
    return buffer;
}

double LightGBMModel::score(const FeatureVector& features) const {
    std::lock_guard<std::mutex> lock(booster_mutex_);
    if (!booster_) {
        throw std::logic_error("LightGBMModel: no booster loaded");
    }
    if (features.size() != num_features_) {
        throw std::invalid_argument("LightGBMModel: expected " + std::to_string(num_features_) +
                                    " features, got " + std::to_string(features.size()));
    }

    int64_t out_len = 0;
    double out_result = 0.0;
    int result = LGBM_BoosterPredictForMatSingleRow(
        booster_,
        features.data(),
        C_API_DTYPE_FLOAT32,
        static_cast<int>(features.size()),
        1,  // row major
        C_API_PREDICT_NORMAL,
        0,  // start iteration
        -1, // all iterations
        "",
        &out_len,
        &out_result
    );
    if (result != 0 || out_len < 1) {
        throw std::runtime_error(std::string("[LightGBM] Prediction failed: ") + LGBM_GetLastError());
    }

    return std::clamp(out_result, 0.0, 1.0);
}

nlohmann::json LightGBMModel::to_json() const {
    nlohmann::json j;
    j["booster"] = model_string();
    j["num_features"] = num_features_;
    j["threshold"] = threshold_;
    j["training_samples"] = training_samples_;
    return j;
}

std::shared_ptr<LightGBMModel> LightGBMModel::from_json(const nlohmann::json& j) {
    auto model = std::make_shared<LightGBMModel>();
    model->load_from_string(j.at("booster").get<std::string>());

    size_t declared = j.value("num_features", model->num_features_);
    if (declared != model->num_features_) {
        throw StorageError("LightGBM booster has " + std::to_string(model->num_features_) +
                           " features, document declares " + std::to_string(declared));
    }
    model->threshold_ = j.value("threshold", 0.5);
    model->training_samples_ = j.value("training_samples", size_t{0});
    return model;
}

} // namespace ai
} // namespace vigil
