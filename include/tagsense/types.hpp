#pragma once

#include <complex>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace tagsense {

// Core types
using Sample = float;                          // Raw I or Q sample
using Complex = std::complex<float>;           // Coherently averaged slot value
using Samples = std::vector<Sample>;           // Flat frame buffer
using Bytes = std::vector<uint8_t>;            // Encoded result packet

using SampleSpan = std::span<const Sample>;
using ByteSpan = std::span<const uint8_t>;

// Number of real channels per raw sample (in-phase, quadrature)
constexpr size_t IQ_CHANNELS = 2;

// Output clamp [low, high] applied after the optional softplus
struct OutputBounds {
    float low = 0.0f;
    float high = 1.0f;
};

// Estimator configuration
//
// Passed by value into the inference engine. Every dimension and
// hyperparameter of the hybrid estimator lives here.
struct EstimatorConfig {
    // Receiver geometry
    uint32_t num_tags = 4;             // T: tags, also number of pilot slots
    uint32_t num_rx = 4;               // R: receive antennas
    uint32_t samples_per_slot = 64;    // W: raw samples per slot

    // Network widths (must match the trained snapshot)
    uint32_t hidden_width = 256;       // lambda net, gate, refinement blocks
    uint32_t delta_h_width = 384;      // channel residual head
    uint32_t refine_blocks = 3;        // residual blocks in the refinement network

    // Regularized solver
    float base_lambda = 1e-3f;         // Scales the predicted per-tag lambda
    float condition_min = 1.0f;        // Condition proxy clamp range
    float condition_max = 1e4f;
    float solution_limit = 1e4f;       // |x| clamp applied after sanitizing solver output

    // Optional channel residual path (delta-H head + gated fusion)
    bool enable_delta_h = true;

    // Output stage: softplus first, then clamp; neither = linear output
    bool softplus_output = false;
    std::optional<OutputBounds> output_clip;

    // Slots per frame: one pilot per tag plus one data slot
    uint32_t slotCount() const { return num_tags + 1; }

    // Raw values in one frame (slot, iq, antenna, sample)
    size_t frameValues() const {
        return static_cast<size_t>(slotCount()) * IQ_CHANNELS * num_rx * samples_per_slot;
    }

    // Final output: [x_hat (T), |H| row-major (R*T)]
    size_t outputSize() const {
        return num_tags + static_cast<size_t>(num_rx) * num_tags;
    }

    // [vec(Re H), vec(Im H), Re y, Im y]
    size_t channelFeatureSize() const {
        return 2 * static_cast<size_t>(num_rx) * num_tags + 2 * num_rx;
    }

    // Channel features + x_base + [log cond, |y|, log snr]
    size_t refineFeatureSize() const {
        return channelFeatureSize() + num_tags + 3;
    }

    // Throws ConfigError on inconsistent values
    void validate() const;

    // INI persistence. load() returns false if the file cannot be opened
    // and throws ConfigError on malformed values.
    bool save(const std::string& path) const;
    bool load(const std::string& path);
};

namespace presets {

// Full hybrid estimator with the channel residual path and linear output
inline EstimatorConfig standard() {
    return EstimatorConfig{};
}

// Regularized solve plus refinement only (no delta-H head, no gate)
inline EstimatorConfig baselineOnly() {
    EstimatorConfig cfg;
    cfg.enable_delta_h = false;
    return cfg;
}

// Outputs bounded to the unit interval
inline EstimatorConfig unitInterval() {
    EstimatorConfig cfg;
    cfg.output_clip = OutputBounds{0.0f, 1.0f};
    return cfg;
}

} // namespace presets

} // namespace tagsense
