#include "tagsense/estimator.hpp"
#include "tagsense/errors.hpp"
#include "tagsense/logging.hpp"
#include "frontend/slot_frontend.hpp"
#include "hybrid_pipeline.hpp"
#include "model/hybrid_model.hpp"
#include <algorithm>

namespace tagsense {

size_t EstimateResult::validCount() const {
    return static_cast<size_t>(std::count(valid.begin(), valid.end(), true));
}

struct InferenceEngine::Impl {
    EstimatorConfig config;
    ThermistorModel thermistor;
    std::unique_ptr<const model::HybridModel> model;

    struct BatchRun {
        std::vector<frontend::ChannelObservation> observations;
        estimator::PipelineOutput pipeline;
    };

    BatchRun run(std::span<const ObservationFrame> batch) const {
        if (!model) {
            throw NotLoadedError("Inference requested before a parameter snapshot was loaded");
        }

        for (size_t i = 0; i < batch.size(); ++i) {
            try {
                frontend::checkFrameShape(batch[i], config);
            } catch (const ShapeError& e) {
                throw ShapeError("Frame " + std::to_string(i) + ": " + e.what());
            }
        }

        BatchRun out;
        out.observations = frontend::observeBatch(batch, config);

        estimator::HybridPipeline pipeline(*model);
        out.pipeline = pipeline.run(out.observations);
        return out;
    }
};

InferenceEngine::InferenceEngine(const EstimatorConfig& config, const ThermistorModel& thermistor)
    : impl_(std::make_unique<Impl>()) {
    config.validate();
    impl_->config = config;
    impl_->thermistor = thermistor;
}

InferenceEngine::~InferenceEngine() = default;
InferenceEngine::InferenceEngine(InferenceEngine&&) noexcept = default;
InferenceEngine& InferenceEngine::operator=(InferenceEngine&&) noexcept = default;

void InferenceEngine::loadSnapshot(const std::string& path) {
    loadSnapshot(ParameterSnapshot::load(path));
}

void InferenceEngine::loadSnapshot(const ParameterSnapshot& snapshot) {
    impl_->model = std::make_unique<const model::HybridModel>(
        model::HybridModel::bind(snapshot, impl_->config));
}

bool InferenceEngine::isLoaded() const {
    return impl_->model != nullptr;
}

const EstimatorConfig& InferenceEngine::config() const {
    return impl_->config;
}

const ThermistorModel& InferenceEngine::thermistor() const {
    return impl_->thermistor;
}

std::vector<std::vector<float>> InferenceEngine::forward(std::span<const ObservationFrame> batch) const {
    Impl::BatchRun run = impl_->run(batch);
    const model::Activations& output = run.pipeline.output;

    std::vector<std::vector<float>> rows(batch.size());
    for (size_t b = 0; b < batch.size(); ++b) {
        const auto col = output.col(static_cast<Eigen::Index>(b));
        rows[b].assign(col.data(), col.data() + col.size());
    }
    return rows;
}

std::vector<EstimateResult> InferenceEngine::infer(std::span<const ObservationFrame> batch) const {
    Impl::BatchRun run = impl_->run(batch);
    const EstimatorConfig& cfg = impl_->config;
    const size_t T = cfg.num_tags;
    const estimator::PipelineOutput& p = run.pipeline;

    std::vector<EstimateResult> results(batch.size());
    for (size_t b = 0; b < batch.size(); ++b) {
        const auto col = static_cast<Eigen::Index>(b);
        EstimateResult& res = results[b];
        res.num_tags = cfg.num_tags;
        res.num_rx = cfg.num_rx;

        const auto out = p.output.col(col);
        res.raw_output.assign(out.data(), out.data() + out.size());
        res.gamma.assign(res.raw_output.begin(), res.raw_output.begin() + T);
        res.channel_magnitude.assign(res.raw_output.begin() + T, res.raw_output.end());

        // The estimate is taken as gamma directly; no scaling is applied here.
        res.temperatures_c.reserve(T);
        res.valid.reserve(T);
        for (float g : res.gamma) {
            TemperatureReading reading = gammaToTemperature(g, impl_->thermistor);
            res.temperatures_c.push_back(reading.celsius);
            res.valid.push_back(reading.valid);
        }

        const frontend::ChannelObservation& obs = run.observations[b];
        res.diagnostics.condition = obs.condition;
        res.diagnostics.observation_norm = obs.observation_norm;
        res.diagnostics.log_snr = obs.log_snr;
        const auto lam = p.lambda.col(col);
        res.diagnostics.lambda.assign(lam.data(), lam.data() + lam.size());
        if (p.gate) {
            res.diagnostics.gate = (*p.gate)[col];
        }
    }

    LOG_MODEL(DEBUG, "Inferred %zu frame(s)", batch.size());
    return results;
}

EstimateResult InferenceEngine::infer(const ObservationFrame& frame) const {
    std::vector<EstimateResult> results = infer(std::span<const ObservationFrame>(&frame, 1));
    return std::move(results.front());
}

} // namespace tagsense
