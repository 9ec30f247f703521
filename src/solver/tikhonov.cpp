#include "tikhonov.hpp"
#include "tagsense/logging.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace tagsense {
namespace solver {

float conditionProxy(const Eigen::MatrixXcf& H) {
    if (H.size() == 0) {
        return 1.0f;
    }
    if (!H.allFinite()) {
        return std::numeric_limits<float>::quiet_NaN();
    }

    Eigen::MatrixXcd Hd = H.cast<std::complex<double>>();
    Eigen::MatrixXcd gram = Hd.adjoint() * Hd;

    // Gram matrix is Hermitian PSD: singular values = |eigenvalues|
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXcd> eig(gram, Eigen::EigenvaluesOnly);
    Eigen::VectorXd s = eig.eigenvalues().cwiseAbs().cwiseMax(SINGULAR_VALUE_FLOOR);

    return static_cast<float>(s.maxCoeff() / s.minCoeff());
}

float clampCondition(float condition, float lo, float hi) {
    if (std::isnan(condition)) {
        return hi;
    }
    return std::clamp(condition, lo, hi);
}

Eigen::VectorXf solveTikhonov(const Eigen::MatrixXcf& H,
                              const Eigen::VectorXcf& y,
                              const Eigen::VectorXf& lambda) {
    Eigen::MatrixXcd Hd = H.cast<std::complex<double>>();
    Eigen::MatrixXcd Hh = Hd.adjoint();

    Eigen::MatrixXcd A = Hh * Hd;
    A.diagonal() += lambda.cast<double>().cast<std::complex<double>>();
    Eigen::VectorXcd b = Hh * y.cast<std::complex<double>>();

    // A is Hermitian positive definite whenever every lambda > 0
    Eigen::VectorXcd x = A.ldlt().solve(b);
    return x.real().cast<float>();
}

size_t sanitizeSolution(Eigen::VectorXf& x, float limit) {
    size_t replaced = 0;
    for (Eigen::Index i = 0; i < x.size(); ++i) {
        if (!std::isfinite(x[i])) {
            x[i] = 0.0f;
            ++replaced;
        }
        x[i] = std::clamp(x[i], -limit, limit);
    }
    return replaced;
}

Eigen::VectorXf solveRegularized(const Eigen::MatrixXcf& H,
                                 const Eigen::VectorXcf& y,
                                 const Eigen::VectorXf& lambda,
                                 float solution_limit) {
    Eigen::VectorXf x = solveTikhonov(H, y, lambda);
    size_t replaced = sanitizeSolution(x, solution_limit);
    if (replaced > 0) {
        LOG_SOLVE(DEBUG, "Degenerate solve: %zu of %lld entries non-finite, replaced with 0",
                  replaced, static_cast<long long>(x.size()));
    }
    return x;
}

} // namespace solver
} // namespace tagsense
