#pragma once

#include "tagsense/types.hpp"
#include <Eigen/Dense>

namespace tagsense {
namespace solver {

// Singular values of H^H H are floored here before taking the ratio
constexpr double SINGULAR_VALUE_FLOOR = 1e-9;

/**
 * Condition proxy of a channel matrix
 *
 * Ratio of the largest to the smallest singular value of the Hermitian
 * form H^H H (eigenvalue magnitudes, floored). Unclamped; may be huge for
 * rank-deficient H and NaN when H holds non-finite entries.
 */
float conditionProxy(const Eigen::MatrixXcf& H);

// Clamp to [lo, hi]; NaN and +Inf map to hi
float clampCondition(float condition, float lo, float hi);

/**
 * Tikhonov-regularized least squares
 *
 *   x = argmin ||H x - y||^2 + sum_t lambda_t x_t^2
 *     = Re{ (H^H H + diag(lambda))^-1 H^H y }
 *
 * H: (R x T), y: (R), lambda: (T), all lambda > 0 for a non-singular system.
 * Solved in double precision. The imaginary part is dropped. The result is
 * returned as computed and may be non-finite for degenerate input.
 */
Eigen::VectorXf solveTikhonov(const Eigen::MatrixXcf& H,
                              const Eigen::VectorXcf& y,
                              const Eigen::VectorXf& lambda);

// Replace NaN/Inf with 0 and clamp to [-limit, limit].
// Returns the number of non-finite entries that were replaced.
size_t sanitizeSolution(Eigen::VectorXf& x, float limit);

// solveTikhonov followed by sanitizeSolution; logs recoveries
Eigen::VectorXf solveRegularized(const Eigen::MatrixXcf& H,
                                 const Eigen::VectorXcf& y,
                                 const Eigen::VectorXf& lambda,
                                 float solution_limit);

} // namespace solver
} // namespace tagsense
