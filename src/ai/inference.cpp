#include "vigil/ai/inference.h"
#include "vigil/errors.h"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace vigil {
namespace ai {

FeatureVector Preprocessor::transform(const ModelArtifact& artifact, const WindowSummary& summary) {
    if (summary.sensors != artifact.sensors) {
        throw SchemaMismatch(artifact.monitor_id, artifact.sensors, summary.sensors);
    }
    if (summary.statistics != artifact.statistics ||
        summary.feature_names != artifact.scaler.feature_names()) {
        throw SchemaMismatch(artifact.monitor_id, artifact.scaler.feature_names(), summary.feature_names);
    }
    return artifact.scaler.transform(summary.features);
}

double Predictor::score(const ModelArtifact& artifact, const FeatureVector& features) {
    if (!artifact.model) {
        throw std::logic_error("Predictor: artifact for " + artifact.monitor_id + " has no model");
    }
    if (features.size() != artifact.model->num_features()) {
        throw std::invalid_argument("Predictor: model for " + artifact.monitor_id + " expects " +
                                    std::to_string(artifact.model->num_features()) +
                                    " features, got " + std::to_string(features.size()));
    }
    return artifact.model->score(features);
}

std::vector<FeatureContribution> Predictor::explain(const ModelArtifact& artifact,
                                                    const WindowSummary& summary,
                                                    const FeatureVector& features,
                                                    size_t top_k) {
    std::vector<size_t> order(features.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return std::fabs(features[a]) > std::fabs(features[b]);
    });

    const size_t stats_per_sensor = std::max<size_t>(1, artifact.statistics.size());
    std::vector<FeatureContribution> contributions;
    for (size_t i = 0; i < order.size() && contributions.size() < top_k; ++i) {
        size_t idx = order[i];
        FeatureContribution contribution;
        contribution.feature = artifact.scaler.feature_names()[idx];
        contribution.sensor = artifact.sensors[idx / stats_per_sensor];
        contribution.raw_value = summary.features[idx];
        contribution.deviation = features[idx];
        contributions.push_back(std::move(contribution));
    }
    return contributions;
}

} // namespace ai
} // namespace vigil
