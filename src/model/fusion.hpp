#pragma once

#include "layers.hpp"
#include <variant>

namespace tagsense {
namespace model {

// Solver result when the channel residual path is disabled
struct BaselineSolution {
    Activations x_ls;            // (T x B)
};

// Solver result with the residual path: both candidates and the gate
struct CorrectedSolution {
    Activations x_ls;            // (T x B) solve on H
    Activations x_tilde;         // (T x B) solve on H + dH
    Eigen::RowVectorXf gate;     // (B) in [0,1]
};

using SolverOutcome = std::variant<BaselineSolution, CorrectedSolution>;

// (1 - g) * x_ls + g * x_tilde, column-wise gate
Activations blend(const Activations& x_ls, const Activations& x_tilde,
                  const Eigen::RowVectorXf& gate);

// x_base for either variant: x_ls when baseline, gated blend when corrected
Activations fuse(const SolverOutcome& outcome);

} // namespace model
} // namespace tagsense
