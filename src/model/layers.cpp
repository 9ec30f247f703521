#include "layers.hpp"
#include <cmath>

namespace tagsense {
namespace model {

namespace {
constexpr float INV_SQRT2 = 0.70710678118654752f;
constexpr float SOFTPLUS_THRESHOLD = 20.0f;
}

Activations gelu(const Activations& x) {
    return x.unaryExpr([](float v) {
        return 0.5f * v * (1.0f + std::erf(v * INV_SQRT2));
    });
}

Activations softplus(const Activations& x) {
    return x.unaryExpr([](float v) {
        return v > SOFTPLUS_THRESHOLD ? v : std::log1p(std::exp(v));
    });
}

Activations sigmoid(const Activations& x) {
    return x.unaryExpr([](float v) {
        return 1.0f / (1.0f + std::exp(-v));
    });
}

} // namespace model
} // namespace tagsense
