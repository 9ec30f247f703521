#include "tagsense/types.hpp"
#include "tagsense/errors.hpp"
#include "tagsense/logging.hpp"
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <string>

namespace tagsense {

namespace {

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r");
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(begin, end - begin + 1);
}

uint32_t parseUnsigned(const std::string& key, const std::string& value) {
    char* end = nullptr;
    long v = std::strtol(value.c_str(), &end, 10);
    if (value.empty() || *end != '\0' || v < 0) {
        throw ConfigError("Invalid integer for '" + key + "': " + value);
    }
    return static_cast<uint32_t>(v);
}

float parseFloat(const std::string& key, const std::string& value) {
    char* end = nullptr;
    float v = std::strtof(value.c_str(), &end);
    if (value.empty() || *end != '\0') {
        throw ConfigError("Invalid number for '" + key + "': " + value);
    }
    return v;
}

bool parseBool(const std::string& key, const std::string& value) {
    if (value == "1" || value == "true") return true;
    if (value == "0" || value == "false") return false;
    throw ConfigError("Invalid boolean for '" + key + "': " + value);
}

} // namespace

void EstimatorConfig::validate() const {
    if (num_tags == 0 || num_rx == 0 || samples_per_slot == 0) {
        throw ConfigError("Tag, antenna and sample counts must be non-zero");
    }
    if (hidden_width == 0 || (enable_delta_h && delta_h_width == 0)) {
        throw ConfigError("Network widths must be non-zero");
    }
    if (!(base_lambda > 0.0f) || !std::isfinite(base_lambda)) {
        throw ConfigError("base_lambda must be a positive finite value");
    }
    if (!(condition_min >= 1.0f) || !(condition_max >= condition_min) || !std::isfinite(condition_max)) {
        throw ConfigError("Condition range must satisfy 1 <= min <= max < inf");
    }
    if (!(solution_limit > 0.0f)) {
        throw ConfigError("solution_limit must be positive");
    }
    if (output_clip && !(output_clip->low <= output_clip->high)) {
        throw ConfigError("Output clip bounds must satisfy low <= high");
    }
}

// Save configuration to INI file
bool EstimatorConfig::save(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        return false;
    }
    file.precision(9);

    file << "[Dimensions]\n";
    file << "num_tags=" << num_tags << "\n";
    file << "num_rx=" << num_rx << "\n";
    file << "samples_per_slot=" << samples_per_slot << "\n";

    file << "\n[Network]\n";
    file << "hidden_width=" << hidden_width << "\n";
    file << "delta_h_width=" << delta_h_width << "\n";
    file << "refine_blocks=" << refine_blocks << "\n";
    file << "enable_delta_h=" << (enable_delta_h ? "1" : "0") << "\n";

    file << "\n[Solver]\n";
    file << "base_lambda=" << base_lambda << "\n";
    file << "condition_min=" << condition_min << "\n";
    file << "condition_max=" << condition_max << "\n";
    file << "solution_limit=" << solution_limit << "\n";

    file << "\n[Output]\n";
    file << "softplus=" << (softplus_output ? "1" : "0") << "\n";
    if (output_clip) {
        file << "clip_low=" << output_clip->low << "\n";
        file << "clip_high=" << output_clip->high << "\n";
    }

    return static_cast<bool>(file);
}

// Load configuration from INI file. Keys not present keep their current value.
bool EstimatorConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    std::optional<float> clip_low;
    std::optional<float> clip_high;

    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        line = trim(line);
        // Skip empty lines, comments and section headers
        if (line.empty() || line[0] == '#' || line[0] == ';' || line[0] == '[') {
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            throw ConfigError(path + ":" + std::to_string(line_no) + ": expected key=value");
        }

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        if (key == "num_tags") {
            num_tags = parseUnsigned(key, value);
        } else if (key == "num_rx") {
            num_rx = parseUnsigned(key, value);
        } else if (key == "samples_per_slot") {
            samples_per_slot = parseUnsigned(key, value);
        } else if (key == "hidden_width") {
            hidden_width = parseUnsigned(key, value);
        } else if (key == "delta_h_width") {
            delta_h_width = parseUnsigned(key, value);
        } else if (key == "refine_blocks") {
            refine_blocks = parseUnsigned(key, value);
        } else if (key == "enable_delta_h") {
            enable_delta_h = parseBool(key, value);
        } else if (key == "base_lambda") {
            base_lambda = parseFloat(key, value);
        } else if (key == "condition_min") {
            condition_min = parseFloat(key, value);
        } else if (key == "condition_max") {
            condition_max = parseFloat(key, value);
        } else if (key == "solution_limit") {
            solution_limit = parseFloat(key, value);
        } else if (key == "softplus") {
            softplus_output = parseBool(key, value);
        } else if (key == "clip_low") {
            clip_low = parseFloat(key, value);
        } else if (key == "clip_high") {
            clip_high = parseFloat(key, value);
        } else {
            LOG_IO(WARN, "%s:%d: unknown key '%s' ignored", path.c_str(), line_no, key.c_str());
        }
    }

    if (clip_low.has_value() != clip_high.has_value()) {
        throw ConfigError("clip_low and clip_high must be given together");
    }
    if (clip_low) {
        output_clip = OutputBounds{*clip_low, *clip_high};
    }

    validate();
    return true;
}

} // namespace tagsense
