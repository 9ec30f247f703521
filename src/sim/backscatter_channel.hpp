#pragma once

#include "tagsense/frame.hpp"
#include "tagsense/types.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <random>
#include <stdexcept>
#include <vector>

namespace tagsense {
namespace sim {

/**
 * Backscatter frame generator
 *
 * Produces observation frames for a known channel and tag state:
 * - Pilot slot t carries column t of H (one tag answering at a time)
 * - The data slot carries H * x (all tags reflecting together)
 * - Per-antenna gain applied to every slot
 * - Complex AWGN on each raw sample
 *
 * Used by the frame generator tool and the tests. Deterministic per seed.
 */
class BackscatterChannel {
public:
    struct Config {
        uint32_t num_tags = 4;
        uint32_t num_rx = 4;
        uint32_t samples_per_slot = 64;

        // SNR in dB relative to unit signal power per sample
        float snr_db = 20.0f;

        // Enable/disable effects for testing
        bool noise_enabled = true;
    };

    explicit BackscatterChannel(const Config& config, uint32_t seed = 42)
        : config_(config)
        , rng_(seed)
        , gaussian_(0.0f, 1.0f)
    {
        // Per real component, so the complex noise power is 10^(-SNR/10)
        noise_std_ = std::pow(10.0f, -config.snr_db / 20.0f) / std::sqrt(2.0f);
    }

    static Config fromEstimator(const EstimatorConfig& cfg, float snr_db = 20.0f) {
        Config c;
        c.num_tags = cfg.num_tags;
        c.num_rx = cfg.num_rx;
        c.samples_per_slot = cfg.samples_per_slot;
        c.snr_db = snr_db;
        return c;
    }

    // H: (R x T), x: (T), gains: (R) or empty for unit gain
    ObservationFrame generate(const Eigen::MatrixXcf& H, const Eigen::VectorXf& x,
                              const std::vector<float>& gains = {}) {
        const uint32_t T = config_.num_tags;
        const uint32_t R = config_.num_rx;
        if (H.rows() != R || H.cols() != T || x.size() != T ||
            (!gains.empty() && gains.size() != R)) {
            throw std::invalid_argument("BackscatterChannel: H, x or gains do not match the configuration");
        }

        Eigen::MatrixXcf slots(T + 1, R);
        slots.topRows(T) = H.transpose();
        slots.row(T) = (H * x.cast<Complex>()).transpose();

        ObservationFrame frame(T + 1, R, config_.samples_per_slot);
        for (uint32_t s = 0; s <= T; ++s) {
            for (uint32_t r = 0; r < R; ++r) {
                float gain = gains.empty() ? 1.0f : gains[r];
                Complex clean = slots(s, r) * gain;
                for (uint32_t w = 0; w < config_.samples_per_slot; ++w) {
                    frame.setSample(s, r, w, clean + noise());
                }
            }
        }
        return frame;
    }

    // Random complex Gaussian channel with unit average power per entry
    Eigen::MatrixXcf randomChannel() {
        Eigen::MatrixXcf H(config_.num_rx, config_.num_tags);
        const float scale = 1.0f / std::sqrt(2.0f);
        for (Eigen::Index r = 0; r < H.rows(); ++r) {
            for (Eigen::Index t = 0; t < H.cols(); ++t) {
                H(r, t) = Complex(gaussian_(rng_), gaussian_(rng_)) * scale;
            }
        }
        return H;
    }

    const Config& config() const { return config_; }

private:
    Complex noise() {
        if (!config_.noise_enabled) {
            return Complex(0.0f, 0.0f);
        }
        return Complex(gaussian_(rng_), gaussian_(rng_)) * noise_std_;
    }

    Config config_;
    std::mt19937 rng_;
    std::normal_distribution<float> gaussian_;
    float noise_std_ = 0.0f;
};

} // namespace sim
} // namespace tagsense
