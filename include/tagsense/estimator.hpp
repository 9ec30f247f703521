#pragma once

#include "frame.hpp"
#include "snapshot.hpp"
#include "thermistor.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace tagsense {

// Per-sample values the estimator computed on the way to its output
struct EstimateDiagnostics {
    float condition = 0.0f;          // Clamped condition proxy of H
    float observation_norm = 0.0f;   // ||y||
    float log_snr = 0.0f;
    std::vector<float> lambda;       // Per-tag regularization of the baseline solve
    std::optional<float> gate;       // Fusion gate, only on the corrected path
};

/**
 * Result record for one frame
 *
 * Field order is the contract with the transmission side:
 * gamma (T), channel magnitude (R x T), temperatures (T), validity (T).
 */
struct EstimateResult {
    uint32_t num_tags = 0;
    uint32_t num_rx = 0;

    std::vector<float> gamma;               // First T outputs, passed to the converter as-is
    std::vector<float> channel_magnitude;   // |H|, row-major (R x T)
    std::vector<double> temperatures_c;     // NaN where no temperature could be derived
    std::vector<bool> valid;

    std::vector<float> raw_output;          // [gamma, |H|], length T + R*T
    EstimateDiagnostics diagnostics;

    float channelMagnitude(uint32_t rx, uint32_t tag) const {
        return channel_magnitude[static_cast<size_t>(rx) * num_tags + tag];
    }

    size_t validCount() const;
};

/**
 * Inference Engine
 *
 * Owns the configuration and, once loaded, the immutable model. All
 * inference entry points are const and share no mutable state, so one
 * loaded engine may be used from several threads at once. Loading must
 * happen before any concurrent use.
 */
class InferenceEngine {
public:
    explicit InferenceEngine(const EstimatorConfig& config, const ThermistorModel& thermistor = {});
    ~InferenceEngine();

    InferenceEngine(InferenceEngine&&) noexcept;
    InferenceEngine& operator=(InferenceEngine&&) noexcept;

    // Throws MissingSnapshotError, SnapshotFormatError, ArchitectureMismatchError
    void loadSnapshot(const std::string& path);
    void loadSnapshot(const ParameterSnapshot& snapshot);

    bool isLoaded() const;
    const EstimatorConfig& config() const;
    const ThermistorModel& thermistor() const;

    // Raw model output per frame: [x_hat (T), |H| (R*T)].
    // Throws NotLoadedError, ShapeError.
    std::vector<std::vector<float>> forward(std::span<const ObservationFrame> batch) const;

    // Full result records including temperatures. Throws NotLoadedError, ShapeError.
    std::vector<EstimateResult> infer(std::span<const ObservationFrame> batch) const;
    EstimateResult infer(const ObservationFrame& frame) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tagsense
