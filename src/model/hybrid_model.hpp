#pragma once

#include "layers.hpp"
#include "tagsense/snapshot.hpp"
#include "tagsense/types.hpp"
#include <optional>
#include <vector>

namespace tagsense {
namespace model {

// Small floors used by the learned stages
constexpr float LAMBDA_FLOOR = 1e-6f;
constexpr float CONDITION_LOG_EPS = 1e-8f;

/**
 * Regularization predictor
 *
 * [log(cond+eps), |y|, log_snr] (3 x B) -> lambda (T x B),
 * lambda = (softplus(net) + 1e-6) * base_lambda, strictly positive.
 */
struct LambdaNet {
    Linear in;       // 3 -> hidden
    Linear hidden;   // hidden -> hidden
    Linear out;      // hidden -> T

    Activations operator()(const Activations& diagnostics, float base_lambda) const;
};

/**
 * Channel residual head
 *
 * [vec(Re H), vec(Im H), Re y, Im y] (2RT+2R x B) -> [vec(Re dH), vec(Im dH)] (2RT x B)
 */
struct DeltaHHead {
    Linear in;
    Linear hidden;
    Linear out;

    Activations operator()(const Activations& channel_features) const;
};

// Diagnostics (3 x B) -> gate in [0,1] (1 x B)
struct GateNet {
    Linear in;
    Linear out;

    Eigen::RowVectorXf operator()(const Activations& diagnostics) const;
};

// Parameter groups that only exist when the channel residual path is enabled
struct CorrectionNets {
    DeltaHHead delta_h;
    GateNet gate;
};

/**
 * Residual refinement network
 *
 * stem (Linear + GELU) -> N residual blocks -> head (Linear to T)
 */
struct Refiner {
    Linear stem;
    std::vector<ResidualBlock> blocks;
    Linear head;

    Activations operator()(const Activations& features) const;
};

/**
 * Hybrid model
 *
 * Immutable set of named parameter groups bound from a snapshot. Evaluation
 * is pure; one instance can serve concurrent callers.
 */
class HybridModel {
public:
    // Strict binding: every expected tensor must be present with the
    // configured shape and nothing else may be in the snapshot.
    // Throws ArchitectureMismatchError.
    static HybridModel bind(const ParameterSnapshot& snapshot, const EstimatorConfig& config);

    const EstimatorConfig& config() const { return config_; }
    const LambdaNet& lambdaNet() const { return lambda_net_; }
    const std::optional<CorrectionNets>& correction() const { return correction_; }
    const Refiner& refiner() const { return refiner_; }

private:
    HybridModel() = default;

    EstimatorConfig config_;
    LambdaNet lambda_net_;
    std::optional<CorrectionNets> correction_;
    Refiner refiner_;
};

} // namespace model
} // namespace tagsense
