#include "hybrid_pipeline.hpp"
#include "solver/tikhonov.hpp"
#include "tagsense/logging.hpp"
#include <cmath>

namespace tagsense {
namespace estimator {

using model::Activations;
using frontend::ChannelObservation;

// =============================================================================
// FEATURE ASSEMBLY
// =============================================================================

namespace {

float logCondition(float condition) {
    return std::log(condition + model::CONDITION_LOG_EPS);
}

// (R x T) view of a row-major vec() stored inside an activation column
using RowMajorMap = Eigen::Map<Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>>;
using ConstRowMajorMap =
    Eigen::Map<const Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>>;

// Write [vec(Re H), vec(Im H), Re y, Im y] of one observation into column b
void writeChannelColumn(Activations& out, Eigen::Index b,
                        const Eigen::MatrixXcf& H, const Eigen::VectorXcf& y) {
    const Eigen::Index R = H.rows();
    const Eigen::Index T = H.cols();
    const Eigen::Index RT = R * T;
    float* col = out.col(b).data();

    RowMajorMap re(col, R, T);
    RowMajorMap im(col + RT, R, T);
    re = H.real();
    im = H.imag();
    out.col(b).segment(2 * RT, R) = y.real();
    out.col(b).segment(2 * RT + R, R) = y.imag();
}

// dH column (2RT) -> complex (R x T), first half real part, second half imaginary
Eigen::MatrixXcf unpackDeltaH(const Activations& dh, Eigen::Index b,
                              Eigen::Index R, Eigen::Index T) {
    const float* col = dh.col(b).data();
    Eigen::MatrixXcf out(R, T);
    out.real() = ConstRowMajorMap(col, R, T);
    out.imag() = ConstRowMajorMap(col + R * T, R, T);
    return out;
}

} // namespace

Activations diagnosticFeatures(std::span<const ChannelObservation> batch) {
    Activations out(3, static_cast<Eigen::Index>(batch.size()));
    for (size_t b = 0; b < batch.size(); ++b) {
        const auto col = static_cast<Eigen::Index>(b);
        out(0, col) = logCondition(batch[b].condition);
        out(1, col) = batch[b].observation_norm;
        out(2, col) = batch[b].log_snr;
    }
    return out;
}

Activations channelFeatures(std::span<const ChannelObservation> batch) {
    if (batch.empty()) {
        return Activations(0, 0);
    }
    const Eigen::Index R = batch[0].H.rows();
    const Eigen::Index T = batch[0].H.cols();

    Activations out(2 * R * T + 2 * R, static_cast<Eigen::Index>(batch.size()));
    for (size_t b = 0; b < batch.size(); ++b) {
        writeChannelColumn(out, static_cast<Eigen::Index>(b), batch[b].H, batch[b].y);
    }
    return out;
}

void applyOutputStage(Activations& x_hat, const EstimatorConfig& config) {
    if (config.softplus_output) {
        x_hat = model::softplus(x_hat);
    }
    if (config.output_clip) {
        x_hat = x_hat.cwiseMax(config.output_clip->low).cwiseMin(config.output_clip->high);
    }
}

// =============================================================================
// SOLVE + OPTIONAL CHANNEL CORRECTION
// =============================================================================

model::SolverOutcome HybridPipeline::solve(std::span<const ChannelObservation> batch,
                                           const Activations& diagnostics,
                                           const Activations& channel_feats,
                                           const Activations& lambda) const {
    const EstimatorConfig& cfg = model_.config();
    const auto B = static_cast<Eigen::Index>(batch.size());
    const Eigen::Index T = cfg.num_tags;

    Activations x_ls(T, B);
    for (Eigen::Index b = 0; b < B; ++b) {
        const ChannelObservation& obs = batch[b];
        x_ls.col(b) = solver::solveRegularized(obs.H, obs.y, lambda.col(b), cfg.solution_limit);
    }

    if (!model_.correction()) {
        return model::BaselineSolution{std::move(x_ls)};
    }
    const model::CorrectionNets& nets = *model_.correction();

    // H~ = H + dH, then lambda is predicted again from H~'s conditioning
    Activations dh = nets.delta_h(channel_feats);
    std::vector<Eigen::MatrixXcf> corrected(batch.size());
    Activations diagnostics_tilde = diagnostics;
    for (Eigen::Index b = 0; b < B; ++b) {
        corrected[b] = batch[b].H + unpackDeltaH(dh, b, cfg.num_rx, T);
        float cond = solver::clampCondition(solver::conditionProxy(corrected[b]),
                                            cfg.condition_min, cfg.condition_max);
        diagnostics_tilde(0, b) = logCondition(cond);
    }
    Activations lambda_tilde = model_.lambdaNet()(diagnostics_tilde, cfg.base_lambda);

    Activations x_tilde(T, B);
    for (Eigen::Index b = 0; b < B; ++b) {
        x_tilde.col(b) = solver::solveRegularized(corrected[b], batch[b].y, lambda_tilde.col(b),
                                                  cfg.solution_limit);
    }

    // Gate is driven by the uncorrected channel's diagnostics
    Eigen::RowVectorXf gate = nets.gate(diagnostics);

    return model::CorrectedSolution{std::move(x_ls), std::move(x_tilde), std::move(gate)};
}

// =============================================================================
// FULL PIPELINE
// =============================================================================

PipelineOutput HybridPipeline::run(std::span<const ChannelObservation> batch) const {
    const EstimatorConfig& cfg = model_.config();
    const auto B = static_cast<Eigen::Index>(batch.size());
    const Eigen::Index T = cfg.num_tags;
    const Eigen::Index R = cfg.num_rx;

    PipelineOutput result;
    if (B == 0) {
        result.output = Activations(static_cast<Eigen::Index>(cfg.outputSize()), 0);
        return result;
    }

    Activations diagnostics = diagnosticFeatures(batch);
    Activations channel_feats = channelFeatures(batch);

    // Stage 5: per-tag regularization
    result.lambda = model_.lambdaNet()(diagnostics, cfg.base_lambda);

    // Stages 6-8: solve, optional correction, gated fusion
    model::SolverOutcome outcome = solve(batch, diagnostics, channel_feats, result.lambda);
    result.x_base = model::fuse(outcome);
    if (auto* corrected = std::get_if<model::CorrectedSolution>(&outcome)) {
        result.x_ls = corrected->x_ls;
        result.gate = corrected->gate;
    } else {
        result.x_ls = std::get<model::BaselineSolution>(outcome).x_ls;
    }

    // Stage 9: refinement on [channel, x_base, diagnostics]
    Activations features(static_cast<Eigen::Index>(cfg.refineFeatureSize()), B);
    features << channel_feats, result.x_base, diagnostics;
    Activations x_hat = result.x_base + model_.refiner()(features);

    // Stage 10
    applyOutputStage(x_hat, cfg);

    result.output.resize(static_cast<Eigen::Index>(cfg.outputSize()), B);
    result.output.topRows(T) = x_hat;
    for (Eigen::Index b = 0; b < B; ++b) {
        RowMajorMap magnitude(result.output.col(b).data() + T, R, T);
        magnitude = batch[b].H.cwiseAbs();
    }

    LOG_MODEL(TRACE, "Pipeline ran on %lld samples (%s path)", static_cast<long long>(B),
              result.gate ? "corrected" : "baseline");
    return result;
}

} // namespace estimator
} // namespace tagsense
