#include "hybrid_model.hpp"
#include "tagsense/errors.hpp"
#include "tagsense/logging.hpp"
#include <set>
#include <string>

namespace tagsense {

// =============================================================================
// ARCHITECTURE LAYOUT
// =============================================================================
//
// Tensor names follow the trained model's state dict:
//   lambda_net.{0,2,4}          Linear(3,H)  GELU Linear(H,H) GELU Linear(H,T)
//   delta_h_head.{0,3,6}        Linear(Cin,D) GELU Drop Linear(D,D) GELU Drop Linear(D,2RT)
//   gate_mlp.{0,2}              Linear(3,H)  GELU Linear(H,1) Sigmoid
//   refine_stem.0               Linear(F,H)  GELU Drop
//   refine_blocks.{i}.fc{1,2}   Linear(H,H)
//   refine_head                 Linear(H,T)

namespace {

void addLinear(std::vector<TensorSpec>& layout, const std::string& prefix,
               uint32_t in, uint32_t out) {
    layout.push_back({prefix + ".weight", {out, in}});
    layout.push_back({prefix + ".bias", {out}});
}

} // namespace

std::vector<TensorSpec> expectedTensorLayout(const EstimatorConfig& config) {
    const uint32_t T = config.num_tags;
    const uint32_t H = config.hidden_width;
    const uint32_t D = config.delta_h_width;
    const uint32_t RT = config.num_rx * config.num_tags;

    std::vector<TensorSpec> layout;

    addLinear(layout, "lambda_net.0", 3, H);
    addLinear(layout, "lambda_net.2", H, H);
    addLinear(layout, "lambda_net.4", H, T);

    if (config.enable_delta_h) {
        const auto channel_in = static_cast<uint32_t>(config.channelFeatureSize());
        addLinear(layout, "delta_h_head.0", channel_in, D);
        addLinear(layout, "delta_h_head.3", D, D);
        addLinear(layout, "delta_h_head.6", D, 2 * RT);

        addLinear(layout, "gate_mlp.0", 3, H);
        addLinear(layout, "gate_mlp.2", H, 1);
    }

    addLinear(layout, "refine_stem.0", static_cast<uint32_t>(config.refineFeatureSize()), H);
    for (uint32_t i = 0; i < config.refine_blocks; ++i) {
        const std::string block = "refine_blocks." + std::to_string(i);
        addLinear(layout, block + ".fc1", H, H);
        addLinear(layout, block + ".fc2", H, H);
    }
    addLinear(layout, "refine_head", H, T);

    return layout;
}

ParameterSnapshot zeroSnapshot(const EstimatorConfig& config) {
    ParameterSnapshot snap;
    for (const TensorSpec& spec : expectedTensorLayout(config)) {
        Tensor shaped{spec.shape, {}};
        snap.add(spec.name, spec.shape, std::vector<float>(shaped.elementCount(), 0.0f));
    }
    return snap;
}

namespace model {

// =============================================================================
// SNAPSHOT BINDING
// =============================================================================

namespace {

std::string shapeToString(const std::vector<uint32_t>& shape) {
    std::string s = "(";
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i) s += ",";
        s += std::to_string(shape[i]);
    }
    return s + ")";
}

// Pulls tensors out of a snapshot by name and remembers which were used
class Binder {
public:
    explicit Binder(const ParameterSnapshot& snapshot) : snapshot_(snapshot) {}

    const Tensor& take(const std::string& name, const std::vector<uint32_t>& shape) {
        const Tensor* t = snapshot_.find(name);
        if (!t) {
            throw ArchitectureMismatchError("Snapshot is missing tensor '" + name + "'");
        }
        if (t->shape != shape) {
            throw ArchitectureMismatchError("Tensor '" + name + "' has shape " +
                                            shapeToString(t->shape) + ", model expects " +
                                            shapeToString(shape));
        }
        used_.insert(name);
        return *t;
    }

    Linear linear(const std::string& prefix, uint32_t in, uint32_t out) {
        const Tensor& w = take(prefix + ".weight", {out, in});
        const Tensor& b = take(prefix + ".bias", {out});

        Linear layer;
        // Exported weights are row-major (out x in)
        layer.weight = Eigen::Map<const Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic,
                                                      Eigen::RowMajor>>(w.values.data(), out, in);
        layer.bias = Eigen::Map<const Eigen::VectorXf>(b.values.data(), out);
        return layer;
    }

    // Anything in the snapshot the architecture did not ask for is an error
    void requireAllUsed() const {
        for (const auto& [name, tensor] : snapshot_.tensors()) {
            if (!used_.count(name)) {
                throw ArchitectureMismatchError("Unexpected tensor '" + name + "' in snapshot");
            }
        }
    }

private:
    const ParameterSnapshot& snapshot_;
    std::set<std::string> used_;
};

} // namespace

HybridModel HybridModel::bind(const ParameterSnapshot& snapshot, const EstimatorConfig& config) {
    config.validate();

    const uint32_t T = config.num_tags;
    const uint32_t H = config.hidden_width;
    const uint32_t D = config.delta_h_width;
    const uint32_t RT = config.num_rx * config.num_tags;

    Binder binder(snapshot);
    HybridModel model;
    model.config_ = config;

    model.lambda_net_.in = binder.linear("lambda_net.0", 3, H);
    model.lambda_net_.hidden = binder.linear("lambda_net.2", H, H);
    model.lambda_net_.out = binder.linear("lambda_net.4", H, T);

    if (config.enable_delta_h) {
        CorrectionNets nets;
        const auto channel_in = static_cast<uint32_t>(config.channelFeatureSize());
        nets.delta_h.in = binder.linear("delta_h_head.0", channel_in, D);
        nets.delta_h.hidden = binder.linear("delta_h_head.3", D, D);
        nets.delta_h.out = binder.linear("delta_h_head.6", D, 2 * RT);
        nets.gate.in = binder.linear("gate_mlp.0", 3, H);
        nets.gate.out = binder.linear("gate_mlp.2", H, 1);
        model.correction_ = std::move(nets);
    }

    model.refiner_.stem = binder.linear("refine_stem.0",
                                        static_cast<uint32_t>(config.refineFeatureSize()), H);
    for (uint32_t i = 0; i < config.refine_blocks; ++i) {
        const std::string block = "refine_blocks." + std::to_string(i);
        model.refiner_.blocks.push_back({binder.linear(block + ".fc1", H, H),
                                         binder.linear(block + ".fc2", H, H)});
    }
    model.refiner_.head = binder.linear("refine_head", H, T);

    binder.requireAllUsed();

    LOG_MODEL(INFO, "Bound hybrid model: T=%u R=%u hidden=%u blocks=%u delta-H=%s",
              config.num_tags, config.num_rx, H, config.refine_blocks,
              config.enable_delta_h ? "on" : "off");
    return model;
}

// =============================================================================
// FORWARD PASSES
// =============================================================================

Activations LambdaNet::operator()(const Activations& diagnostics, float base_lambda) const {
    Activations h = gelu(in(diagnostics));
    h = gelu(hidden(h));
    Activations raw = out(h);
    return (softplus(raw).array() + LAMBDA_FLOOR).matrix() * base_lambda;
}

Activations DeltaHHead::operator()(const Activations& channel_features) const {
    Activations h = gelu(in(channel_features));
    h = gelu(hidden(h));
    return out(h);
}

Eigen::RowVectorXf GateNet::operator()(const Activations& diagnostics) const {
    Activations g = sigmoid(out(gelu(in(diagnostics))));
    return g.row(0);
}

Activations Refiner::operator()(const Activations& features) const {
    Activations h = gelu(stem(features));
    for (const ResidualBlock& block : blocks) {
        h = block(h);
    }
    return head(h);
}

} // namespace model
} // namespace tagsense
