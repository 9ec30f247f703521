#include "tagsense/thermistor.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace tagsense {

namespace {
constexpr double KELVIN_OFFSET = 273.15;
constexpr double NaN = std::numeric_limits<double>::quiet_NaN();
}

double gammaToResistance(double gamma, const ThermistorModel& model) {
    if (!std::isfinite(gamma)) {
        return NaN;
    }
    gamma = std::clamp(gamma, -model.gamma_limit, model.gamma_limit);
    return model.z0_ohm * (1.0 - gamma) / (1.0 + gamma);
}

TemperatureReading gammaToTemperature(double gamma, const ThermistorModel& model) {
    double r = gammaToResistance(gamma, model);
    if (!std::isfinite(r) || r <= 0.0) {
        return {NaN, false};
    }

    // Simplified Beta equation: 1/T = 1/T0 + ln(R/R25)/B
    double inv_t = 1.0 / model.t0_kelvin + std::log(r / model.r25_ohm) / model.beta_kelvin;
    double celsius = 1.0 / inv_t - KELVIN_OFFSET;

    if (!std::isfinite(celsius)) {
        return {NaN, false};
    }

    bool valid = celsius >= model.min_valid_celsius && celsius <= model.max_valid_celsius;
    return {celsius, valid};
}

} // namespace tagsense
