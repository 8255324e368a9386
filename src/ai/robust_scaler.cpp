#include "vigil/ai/robust_scaler.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace vigil {
namespace ai {

RobustScaler::RobustScaler(std::vector<std::string> feature_names,
                           std::vector<double> center,
                           std::vector<double> scale)
    : feature_names_(std::move(feature_names)),
      center_(std::move(center)),
      scale_(std::move(scale)) {
    if (center_.size() != feature_names_.size() || scale_.size() != feature_names_.size()) {
        throw std::invalid_argument("RobustScaler: parameter sizes do not match feature count");
    }
}

double RobustScaler::percentile(std::vector<double> values, double q) {
    if (values.empty()) {
        return 0.0;
    }
    std::sort(values.begin(), values.end());

    double position = q * static_cast<double>(values.size() - 1);
    size_t lower = static_cast<size_t>(std::floor(position));
    size_t upper = static_cast<size_t>(std::ceil(position));
    if (upper >= values.size()) {
        return values.back();
    }
    double weight = position - static_cast<double>(lower);
    return values[lower] * (1.0 - weight) + values[upper] * weight;
}

void RobustScaler::fit(const std::vector<std::string>& feature_names, const Eigen::MatrixXd& data) {
    if (static_cast<size_t>(data.cols()) != feature_names.size()) {
        throw std::invalid_argument("RobustScaler: column count does not match feature names");
    }
    if (data.rows() == 0) {
        throw std::invalid_argument("RobustScaler: no samples to fit");
    }

    feature_names_ = feature_names;
    center_.assign(feature_names.size(), 0.0);
    scale_.assign(feature_names.size(), 1.0);

    for (Eigen::Index c = 0; c < data.cols(); ++c) {
        std::vector<double> column(data.col(c).data(), data.col(c).data() + data.rows());

        double q1 = percentile(column, 0.25);
        double median = percentile(column, 0.5);
        double q3 = percentile(column, 0.75);
        double iqr = q3 - q1;

        center_[static_cast<size_t>(c)] = median;
        scale_[static_cast<size_t>(c)] = (iqr > 1e-12) ? iqr : 1.0;
    }
}

FeatureVector RobustScaler::transform(const std::vector<double>& features) const {
    if (features.size() != feature_names_.size()) {
        throw std::invalid_argument("RobustScaler: expected " + std::to_string(feature_names_.size()) +
                                    " features, got " + std::to_string(features.size()));
    }

    FeatureVector scaled(features.size());
    for (size_t i = 0; i < features.size(); ++i) {
        scaled[i] = static_cast<float>((features[i] - center_[i]) / scale_[i]);
    }
    return scaled;
}

nlohmann::json RobustScaler::to_json() const {
    nlohmann::json j;
    j["method"] = "robust";
    j["features"] = feature_names_;
    j["center"] = center_;
    j["scale"] = scale_;
    return j;
}

RobustScaler RobustScaler::from_json(const nlohmann::json& j) {
    return RobustScaler(j.at("features").get<std::vector<std::string>>(),
                        j.at("center").get<std::vector<double>>(),
                        j.at("scale").get<std::vector<double>>());
}

} // namespace ai
} // namespace vigil
