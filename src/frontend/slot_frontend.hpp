#pragma once

#include "tagsense/frame.hpp"
#include "tagsense/types.hpp"
#include <Eigen/Dense>
#include <span>
#include <vector>

namespace tagsense {
namespace frontend {

// Floors guarding the divisions of the front end
constexpr float PILOT_SCALE_FLOOR = 1e-8f;
constexpr float NOISE_POWER_FLOOR = 1e-12f;
constexpr float LOG_EPS = 1e-12f;

// (slots x R) complex slot observations
using SlotMatrix = Eigen::MatrixXcf;

/**
 * Channel observation of one frame
 *
 * Everything downstream of the front end needs: channel matrix, data
 * vector and the three diagnostics used as network features.
 */
struct ChannelObservation {
    Eigen::MatrixXcf H;       // (R x T), column t = normalized pilot slot t
    Eigen::VectorXcf y;       // (R), normalized data slot
    float condition = 1.0f;   // Clamped condition proxy of H^H H
    float observation_norm = 0.0f;  // ||y||_2
    float log_snr = 0.0f;     // log(pilot power / noise power)
};

// Throws ShapeError unless frame is (slots, 2, R, W) for this configuration
void checkFrameShape(const ObservationFrame& frame, const EstimatorConfig& config);

/**
 * Per-frame slot statistics of a batch
 *
 * All frames are stacked into one (W x B*slots*2*R) sample matrix, so the
 * coherent means and the within-slot variances of the whole batch come
 * from single column-wise reductions. NaN/Inf samples are read as zero.
 */
struct SlotStatistics {
    std::vector<SlotMatrix> averaged;   // (slots x R) mean of I + jQ over W, per frame
    std::vector<float> noise_power;     // Within-slot variance, averaged over slots and antennas
    size_t non_finite = 0;              // Samples that were replaced by zero
};

// Frames must share one (already checked) shape
SlotStatistics slotStatistics(std::span<const ObservationFrame> frames);

// Divide every slot of antenna r by sqrt(mean pilot power of antenna r)
SlotMatrix normalizePilots(const SlotMatrix& slots, uint32_t num_pilots);

// Mean |Y|^2 over the pilot slots and all antennas
float meanPilotPower(const SlotMatrix& slots, uint32_t num_pilots);

// log(pilot / (noise + eps) + eps)
float logSnr(float pilot_power, float noise_power);

// H from the first T slots, y from slot T, plus condition and ||y||
ChannelObservation buildChannel(const SlotMatrix& normalized, const EstimatorConfig& config);

// Stages 1-4 for a batch (shapes must already be checked)
std::vector<ChannelObservation> observeBatch(std::span<const ObservationFrame> frames,
                                             const EstimatorConfig& config);

ChannelObservation observe(const ObservationFrame& frame, const EstimatorConfig& config);

} // namespace frontend
} // namespace tagsense
