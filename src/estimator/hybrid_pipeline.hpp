#pragma once

#include "frontend/slot_frontend.hpp"
#include "model/fusion.hpp"
#include "model/hybrid_model.hpp"
#include <optional>
#include <span>

namespace tagsense {
namespace estimator {

// Everything the learned stages produce for one batch
struct PipelineOutput {
    model::Activations output;     // (T + R*T x B): [x_hat, |H| row-major]
    model::Activations lambda;     // (T x B) regularization used for x_ls
    model::Activations x_ls;       // (T x B)
    model::Activations x_base;     // (T x B) after gated fusion
    std::optional<Eigen::RowVectorXf> gate;  // set only on the corrected path
};

// Feature blocks, one column per observation
model::Activations diagnosticFeatures(std::span<const frontend::ChannelObservation> batch);
model::Activations channelFeatures(std::span<const frontend::ChannelObservation> batch);

// Stage 10 on (T x B): softplus if configured, then clamp if configured
void applyOutputStage(model::Activations& x_hat, const EstimatorConfig& config);

/**
 * Hybrid pipeline (stages 5-10)
 *
 * Regularization predictor, Tikhonov solve, optional channel residual
 * re-solve with gated fusion, residual refinement and output stage, over a
 * batch of channel observations. Holds only a reference to the model.
 */
class HybridPipeline {
public:
    explicit HybridPipeline(const model::HybridModel& model) : model_(model) {}

    PipelineOutput run(std::span<const frontend::ChannelObservation> batch) const;

private:
    model::SolverOutcome solve(std::span<const frontend::ChannelObservation> batch,
                               const model::Activations& diagnostics,
                               const model::Activations& channel_feats,
                               const model::Activations& lambda) const;

    const model::HybridModel& model_;
};

} // namespace estimator
} // namespace tagsense
