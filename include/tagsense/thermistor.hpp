#pragma once

namespace tagsense {

// Tag load: a Beta-model NTC thermistor seen through a Z0 reference.
struct ThermistorModel {
    double z0_ohm = 50.0;             // Reference impedance
    double r25_ohm = 330.0;           // Resistance at T0
    double beta_kelvin = 3500.0;      // B constant
    double t0_kelvin = 298.15;        // 25 C
    double gamma_limit = 0.999;       // |gamma| clamp, keeps away from the poles at +-1
    double min_valid_celsius = -40.0;
    double max_valid_celsius = 150.0;
};

struct TemperatureReading {
    double celsius;   // NaN when no resistance could be derived
    bool valid;       // false outside [min_valid, max_valid] or when NaN
};

// R = Z0 (1 - gamma) / (1 + gamma), gamma clamped to +-gamma_limit.
// Returns NaN for non-finite gamma.
double gammaToResistance(double gamma, const ThermistorModel& model = {});

// Reflection coefficient -> temperature with validity flag. Never throws.
TemperatureReading gammaToTemperature(double gamma, const ThermistorModel& model = {});

} // namespace tagsense
