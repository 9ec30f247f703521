#pragma once

#include <Eigen/Dense>
#include <vector>

namespace tagsense {
namespace model {

// Activations are laid out (features x batch): one column per sample
using Activations = Eigen::MatrixXf;

/**
 * Dense layer y = W x + b
 *
 * W is (out x in), matching the exported weight layout, so a whole batch
 * goes through in one matrix product.
 */
struct Linear {
    Eigen::MatrixXf weight;   // (out x in)
    Eigen::VectorXf bias;     // (out)

    Eigen::Index inFeatures() const { return weight.cols(); }
    Eigen::Index outFeatures() const { return weight.rows(); }

    Activations operator()(const Activations& x) const {
        return (weight * x).colwise() + bias;
    }
};

// Exact (erf) GELU
Activations gelu(const Activations& x);

// log(1 + e^x), linear above 20
Activations softplus(const Activations& x);

Activations sigmoid(const Activations& x);

/**
 * Constant-width residual block
 *
 *   act(x + fc2(act(fc1(x))))
 *
 * Dropout sits after the inner activation and after fc2 during training;
 * at inference it is the identity and is not modeled.
 */
struct ResidualBlock {
    Linear fc1;
    Linear fc2;

    Activations operator()(const Activations& x) const {
        return gelu(x + fc2(gelu(fc1(x))));
    }
};

} // namespace model
} // namespace tagsense
