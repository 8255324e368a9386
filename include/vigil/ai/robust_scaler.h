#pragma once
#ifndef VIGIL_AI_ROBUST_SCALER_H
#define VIGIL_AI_ROBUST_SCALER_H

#include "vigil/telemetry.h"
#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace vigil {
namespace ai {

// Median / IQR scaling, fitted jointly with the model it feeds
class RobustScaler {
public:
    RobustScaler() = default;
    RobustScaler(std::vector<std::string> feature_names,
                 std::vector<double> center,
                 std::vector<double> scale);

    // Rows are samples, columns follow feature_names. No NaN allowed.
    void fit(const std::vector<std::string>& feature_names, const Eigen::MatrixXd& data);

    FeatureVector transform(const std::vector<double>& features) const;

    const std::vector<std::string>& feature_names() const { return feature_names_; }
    const std::vector<double>& center() const { return center_; }
    const std::vector<double>& scale() const { return scale_; }
    size_t size() const { return feature_names_.size(); }
    bool is_fitted() const { return !feature_names_.empty(); }

    nlohmann::json to_json() const;
    static RobustScaler from_json(const nlohmann::json& j);

    // Linear-interpolated percentile, q in [0, 1]
    static double percentile(std::vector<double> values, double q);

private:
    std::vector<std::string> feature_names_;
    std::vector<double> center_;
    std::vector<double> scale_;
};

} // namespace ai
} // namespace vigil

#endif // VIGIL_AI_ROBUST_SCALER_H
