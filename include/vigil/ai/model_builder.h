#pragma once
#ifndef VIGIL_AI_MODEL_BUILDER_H
#define VIGIL_AI_MODEL_BUILDER_H

#include "vigil/ai/model_artifact.h"
#include "vigil/config.h"
#include "vigil/telemetry.h"
#include <memory>
#include <string>
#include <vector>

namespace vigil {
namespace ai {

// Trains a fresh artifact from historical readings. May be slow; callers
// bound it with a timeout. Throws BuildError.
class IModelBuilder {
public:
    virtual ~IModelBuilder() = default;

    virtual ArtifactBytes build(const std::string& monitor_id,
                                const std::vector<Reading>& history) = 0;
};

// Replays history through the engine's window policy so that training and
// inference see identically shaped summaries, then fits a robust scaler and
// an isolation forest (or a LightGBM classifier when labels allow).
class TrendModelBuilder : public IModelBuilder {
public:
    TrendModelBuilder(WindowConfig window, BuilderConfig config);

    ArtifactBytes build(const std::string& monitor_id,
                        const std::vector<Reading>& history) override;

    std::shared_ptr<ModelArtifact> train(const std::string& monitor_id,
                                         const std::vector<Reading>& history) const;

private:
    std::vector<WindowSummary> replay(const std::string& monitor_id,
                                      const std::vector<Reading>& history) const;
    bool use_lightgbm(const std::vector<WindowSummary>& summaries) const;
    static uint64_t next_version();

    WindowConfig window_;
    BuilderConfig config_;
};

} // namespace ai
} // namespace vigil

#endif // VIGIL_AI_MODEL_BUILDER_H
