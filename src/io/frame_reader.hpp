#pragma once

#include "tagsense/frame.hpp"
#include "tagsense/types.hpp"
#include <cstdint>
#include <istream>
#include <optional>
#include <string>

namespace tagsense {
namespace io {

// Fixed-point scale of the receiver's 12-bit I/Q capture
constexpr float CAPTURE_FULL_SCALE = 2048.0f;

enum class FrameFormat : uint8_t {
    TENSOR  = 0,   // float32 (slot, iq, antenna, sample)
    CAPTURE = 1,   // int16 interleaved I/Q pairs, (slot, antenna, sample)
};

const char* frameFormatToString(FrameFormat format);

// Inverse of frameFormatToString; nothing for an unknown name
std::optional<FrameFormat> parseFrameFormat(const std::string& name);

// Bytes one frame of the given format occupies on the stream
size_t frameBytes(FrameFormat format, const EstimatorConfig& config);

// Read one frame. Return nothing on a clean end of stream and throw
// FrameReadError when the stream ends inside a frame.
std::optional<ObservationFrame> readTensorFrame(std::istream& in, const EstimatorConfig& config);
std::optional<ObservationFrame> readCaptureFrame(std::istream& in, const EstimatorConfig& config);

/**
 * Frame Reader
 *
 * Pulls consecutive frames of one format from a binary stream. The stream
 * must outlive the reader.
 */
class FrameReader {
public:
    FrameReader(std::istream& in, const EstimatorConfig& config,
                FrameFormat format = FrameFormat::TENSOR);

    std::optional<ObservationFrame> next();

    FrameFormat format() const { return format_; }
    uint64_t framesRead() const { return frames_read_; }

private:
    std::istream& in_;
    EstimatorConfig config_;
    FrameFormat format_;
    uint64_t frames_read_ = 0;
};

} // namespace io
} // namespace tagsense
