#include "slot_frontend.hpp"
#include "solver/tikhonov.hpp"
#include "tagsense/errors.hpp"
#include "tagsense/logging.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace tagsense {
namespace frontend {

namespace {

std::string shapeString(uint32_t a, uint32_t b, uint32_t c, uint32_t d) {
    return "(" + std::to_string(a) + "," + std::to_string(b) + "," +
           std::to_string(c) + "," + std::to_string(d) + ")";
}

} // namespace

void checkFrameShape(const ObservationFrame& frame, const EstimatorConfig& config) {
    bool dims_ok = frame.slots == config.slotCount() &&
                   frame.channels == IQ_CHANNELS &&
                   frame.antennas == config.num_rx &&
                   frame.samples == config.samples_per_slot;
    if (!dims_ok) {
        throw ShapeError("Frame shape mismatch: expected " +
                         shapeString(config.slotCount(), IQ_CHANNELS, config.num_rx,
                                     config.samples_per_slot) +
                         ", got " +
                         shapeString(frame.slots, frame.channels, frame.antennas, frame.samples));
    }
    if (frame.data.size() != frame.expectedValues()) {
        throw ShapeError("Frame holds " + std::to_string(frame.data.size()) +
                         " values, shape requires " + std::to_string(frame.expectedValues()));
    }
}

// =============================================================================
// STAGE 1: COHERENT SLOT AVERAGING + NOISE
// =============================================================================

SlotStatistics slotStatistics(std::span<const ObservationFrame> frames) {
    SlotStatistics stats;
    if (frames.empty()) {
        return stats;
    }

    const Eigen::Index S = frames[0].slots;
    const Eigen::Index R = frames[0].antennas;
    const Eigen::Index W = frames[0].samples;
    const Eigen::Index cols = S * static_cast<Eigen::Index>(IQ_CHANNELS) * R;  // column (slot*2 + iq)*R + antenna
    const auto B = static_cast<Eigen::Index>(frames.size());

    // Each frame buffer is already a column-major (W x cols) matrix
    Eigen::MatrixXf X(W, B * cols);
    for (Eigen::Index b = 0; b < B; ++b) {
        X.middleCols(b * cols, cols) = Eigen::Map<const Eigen::MatrixXf>(frames[b].data.data(), W, cols);
    }

    const Eigen::Index finite = X.array().isFinite().count();
    stats.non_finite = static_cast<size_t>(X.size() - finite);
    if (stats.non_finite > 0) {
        X = X.array().isFinite().select(X.array(), 0.0f).matrix();
    }

    const Eigen::RowVectorXf means = X.colwise().mean();
    const Eigen::RowVectorXf variances =
        (X.rowwise() - means).colwise().squaredNorm() / static_cast<float>(W);

    stats.averaged.reserve(frames.size());
    stats.noise_power.reserve(frames.size());
    for (Eigen::Index b = 0; b < B; ++b) {
        const Eigen::Index base = b * cols;
        SlotMatrix Y(S, R);
        for (Eigen::Index s = 0; s < S; ++s) {
            for (Eigen::Index r = 0; r < R; ++r) {
                Y(s, r) = Complex(means[base + (2 * s) * R + r], means[base + (2 * s + 1) * R + r]);
            }
        }
        stats.averaged.push_back(std::move(Y));

        // I and Q variances add up to the complex variance of each slot
        const float noise = variances.segment(base, cols).sum() / static_cast<float>(S * R);
        stats.noise_power.push_back(std::max(noise, NOISE_POWER_FLOOR));
    }
    return stats;
}

// =============================================================================
// STAGE 2: PER-ANTENNA PILOT NORMALIZATION
// =============================================================================

SlotMatrix normalizePilots(const SlotMatrix& slots, uint32_t num_pilots) {
    SlotMatrix out = slots;
    for (Eigen::Index r = 0; r < slots.cols(); ++r) {
        float power = slots.col(r).head(num_pilots).cwiseAbs2().mean();
        float scale = std::max(std::sqrt(power), PILOT_SCALE_FLOOR);
        out.col(r) /= scale;
    }
    return out;
}

// =============================================================================
// STAGE 3: NOISE / SNR
// =============================================================================

float meanPilotPower(const SlotMatrix& slots, uint32_t num_pilots) {
    return slots.topRows(num_pilots).cwiseAbs2().mean();
}

float logSnr(float pilot_power, float noise_power) {
    return std::log(pilot_power / (noise_power + LOG_EPS) + LOG_EPS);
}

// =============================================================================
// STAGE 4: CHANNEL BUILDER
// =============================================================================

ChannelObservation buildChannel(const SlotMatrix& normalized, const EstimatorConfig& config) {
    const uint32_t T = config.num_tags;

    ChannelObservation obs;
    // Pilot slot t is row t of the slot matrix -> column t of H
    obs.H = normalized.topRows(T).transpose();
    obs.y = normalized.row(T).transpose();

    float raw_condition = solver::conditionProxy(obs.H);
    obs.condition = solver::clampCondition(raw_condition, config.condition_min, config.condition_max);
    obs.observation_norm = obs.y.norm();

    LOG_FRONT(TRACE, "cond=%.3g (raw %.3g) |y|=%.4f", obs.condition, raw_condition,
              obs.observation_norm);
    return obs;
}

std::vector<ChannelObservation> observeBatch(std::span<const ObservationFrame> frames,
                                             const EstimatorConfig& config) {
    SlotStatistics stats = slotStatistics(frames);
    if (stats.non_finite > 0) {
        LOG_FRONT(DEBUG, "Zeroed %zu non-finite sample(s) in %zu frame(s)", stats.non_finite,
                  frames.size());
    }

    std::vector<ChannelObservation> out;
    out.reserve(frames.size());
    for (size_t b = 0; b < frames.size(); ++b) {
        SlotMatrix normalized = normalizePilots(stats.averaged[b], config.num_tags);
        float pilot = meanPilotPower(normalized, config.num_tags);

        ChannelObservation obs = buildChannel(normalized, config);
        obs.log_snr = logSnr(pilot, stats.noise_power[b]);
        if (!std::isfinite(obs.log_snr)) {
            LOG_FRONT(DEBUG, "Non-finite SNR proxy (pilot=%g noise=%g), using 0", pilot,
                      stats.noise_power[b]);
            obs.log_snr = 0.0f;
        }
        out.push_back(std::move(obs));
    }
    return out;
}

ChannelObservation observe(const ObservationFrame& frame, const EstimatorConfig& config) {
    return std::move(observeBatch(std::span<const ObservationFrame>(&frame, 1), config).front());
}

} // namespace frontend
} // namespace tagsense
