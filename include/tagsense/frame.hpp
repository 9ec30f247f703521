#pragma once

#include "types.hpp"

namespace tagsense {

/**
 * Observation Frame
 *
 * One acquisition cycle: for every slot (pilot 0..T-1, then data), the raw
 * in-phase and quadrature samples of every receive antenna.
 *
 * Stored row-major as (slot, iq, antenna, sample) float32, the layout the
 * acquisition side hands over. The declared shape is kept alongside the
 * buffer so a mismatching frame can be rejected instead of reinterpreted.
 */
struct ObservationFrame {
    uint32_t slots = 0;
    uint32_t channels = 0;
    uint32_t antennas = 0;
    uint32_t samples = 0;
    Samples data;

    ObservationFrame() = default;

    // Zero-filled frame with two I/Q channels
    ObservationFrame(uint32_t num_slots, uint32_t num_antennas, uint32_t num_samples)
        : slots(num_slots)
        , channels(IQ_CHANNELS)
        , antennas(num_antennas)
        , samples(num_samples)
        , data(static_cast<size_t>(num_slots) * IQ_CHANNELS * num_antennas * num_samples, 0.0f)
    {}

    // Zero-filled frame shaped for the given configuration
    static ObservationFrame forConfig(const EstimatorConfig& config) {
        return ObservationFrame(config.slotCount(), config.num_rx, config.samples_per_slot);
    }

    size_t index(uint32_t slot, uint32_t iq, uint32_t antenna, uint32_t sample) const {
        return ((static_cast<size_t>(slot) * channels + iq) * antennas + antenna) * samples + sample;
    }

    Sample& at(uint32_t slot, uint32_t iq, uint32_t antenna, uint32_t sample) {
        return data[index(slot, iq, antenna, sample)];
    }

    Sample at(uint32_t slot, uint32_t iq, uint32_t antenna, uint32_t sample) const {
        return data[index(slot, iq, antenna, sample)];
    }

    // I + jQ of one raw sample
    Complex sample(uint32_t slot, uint32_t antenna, uint32_t w) const {
        return Complex(at(slot, 0, antenna, w), at(slot, 1, antenna, w));
    }

    void setSample(uint32_t slot, uint32_t antenna, uint32_t w, Complex value) {
        at(slot, 0, antenna, w) = value.real();
        at(slot, 1, antenna, w) = value.imag();
    }

    size_t expectedValues() const {
        return static_cast<size_t>(slots) * channels * antennas * samples;
    }
};

} // namespace tagsense
