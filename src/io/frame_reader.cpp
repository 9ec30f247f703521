#include "frame_reader.hpp"
#include "tagsense/errors.hpp"
#include "tagsense/logging.hpp"
#include <cstring>
#include <string>
#include <vector>

namespace tagsense {
namespace io {

namespace {

// Fill buf completely. False on clean EOF before the first byte.
bool readExact(std::istream& in, char* buf, size_t size, const char* what) {
    in.read(buf, static_cast<std::streamsize>(size));
    size_t got = static_cast<size_t>(in.gcount());
    if (got == size) {
        return true;
    }
    if (got == 0) {
        return false;
    }
    throw FrameReadError(std::string("Truncated ") + what + " frame: got " +
                         std::to_string(got) + " of " + std::to_string(size) + " bytes");
}

} // namespace

const char* frameFormatToString(FrameFormat format) {
    switch (format) {
        case FrameFormat::TENSOR:  return "tensor";
        case FrameFormat::CAPTURE: return "capture";
    }
    return "unknown";
}

std::optional<FrameFormat> parseFrameFormat(const std::string& name) {
    if (name == "tensor") return FrameFormat::TENSOR;
    if (name == "capture") return FrameFormat::CAPTURE;
    return std::nullopt;
}

size_t frameBytes(FrameFormat format, const EstimatorConfig& config) {
    // Both formats carry SLOTS * R * W complex samples
    size_t complex_samples = static_cast<size_t>(config.slotCount()) * config.num_rx *
                             config.samples_per_slot;
    if (format == FrameFormat::CAPTURE) {
        return complex_samples * 2 * sizeof(int16_t);
    }
    return complex_samples * 2 * sizeof(float);
}

std::optional<ObservationFrame> readTensorFrame(std::istream& in, const EstimatorConfig& config) {
    ObservationFrame frame = ObservationFrame::forConfig(config);
    if (!readExact(in, reinterpret_cast<char*>(frame.data.data()),
                   frame.data.size() * sizeof(float), "tensor")) {
        return std::nullopt;
    }
    return frame;
}

std::optional<ObservationFrame> readCaptureFrame(std::istream& in, const EstimatorConfig& config) {
    const size_t bytes = frameBytes(FrameFormat::CAPTURE, config);
    std::vector<int16_t> raw(bytes / sizeof(int16_t));
    if (!readExact(in, reinterpret_cast<char*>(raw.data()), bytes, "capture")) {
        return std::nullopt;
    }

    ObservationFrame frame = ObservationFrame::forConfig(config);
    size_t k = 0;
    for (uint32_t s = 0; s < frame.slots; ++s) {
        for (uint32_t r = 0; r < frame.antennas; ++r) {
            for (uint32_t w = 0; w < frame.samples; ++w) {
                float i = raw[k++] / CAPTURE_FULL_SCALE;
                float q = raw[k++] / CAPTURE_FULL_SCALE;
                frame.setSample(s, r, w, Complex(i, q));
            }
        }
    }
    return frame;
}

FrameReader::FrameReader(std::istream& in, const EstimatorConfig& config, FrameFormat format)
    : in_(in), config_(config), format_(format) {
    LOG_IO(DEBUG, "Frame reader: %s format, %zu bytes/frame",
           frameFormatToString(format_), frameBytes(format_, config_));
}

std::optional<ObservationFrame> FrameReader::next() {
    std::optional<ObservationFrame> frame = (format_ == FrameFormat::CAPTURE)
        ? readCaptureFrame(in_, config_)
        : readTensorFrame(in_, config_);
    if (frame) {
        ++frames_read_;
    } else {
        LOG_IO(DEBUG, "End of stream after %llu frame(s)",
               static_cast<unsigned long long>(frames_read_));
    }
    return frame;
}

} // namespace io
} // namespace tagsense
