#include "fusion.hpp"

namespace tagsense {
namespace model {

namespace {
template <class... Ts>
struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;
}

Activations blend(const Activations& x_ls, const Activations& x_tilde,
                  const Eigen::RowVectorXf& gate) {
    Activations out(x_ls.rows(), x_ls.cols());
    for (Eigen::Index b = 0; b < x_ls.cols(); ++b) {
        const float g = gate[b];
        out.col(b) = (1.0f - g) * x_ls.col(b) + g * x_tilde.col(b);
    }
    return out;
}

Activations fuse(const SolverOutcome& outcome) {
    return std::visit(Overloaded{
        [](const BaselineSolution& s) -> Activations { return s.x_ls; },
        [](const CorrectedSolution& s) -> Activations { return blend(s.x_ls, s.x_tilde, s.gate); },
    }, outcome);
}

} // namespace model
} // namespace tagsense
