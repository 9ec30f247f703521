#pragma once

#include "tagsense/estimator.hpp"
#include "tagsense/types.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace tagsense {
namespace protocol {

// ============================================================================
// Result packets sent to the display/telemetry side
// ============================================================================

constexpr uint8_t FRAME_HEADER[2] = {0xAA, 0x55};

// Full packet type byte following the header
constexpr uint8_t PACKET_TYPE_FULL = 0x01;

// Compact temperature field: tenths of a degree, big-endian two's complement
constexpr int TEMP_SCALE = 10;
constexpr int16_t TEMP_FIELD_MIN = -400;    // -40.0 C
constexpr int16_t TEMP_FIELD_MAX = 1500;    // 150.0 C
constexpr uint16_t INVALID_TEMP = 0xFFFF;

enum class PacketEncoding : uint8_t {
    COMPACT = 0,
    FULL    = 1,
};

const char* packetEncodingToString(PacketEncoding encoding);
std::optional<PacketEncoding> parsePacketEncoding(const std::string& name);

// Sizes for T tags
constexpr size_t compactPacketSize(size_t num_tags) { return 2 + 2 * num_tags + 1; }
constexpr size_t fullPacketSize(size_t num_tags) { return 3 + 9 * num_tags + 1; }

uint8_t xorChecksum(const uint8_t* data, size_t len);
uint8_t sumChecksum(const uint8_t* data, size_t len);

// One 16-bit field per tag. Invalid or non-finite temperatures become INVALID_TEMP.
uint16_t encodeTemperatureField(double celsius, bool valid);

/**
 * Compact packet
 *
 *   AA 55 | T x int16 BE (C * 10, truncated, clamped) | XOR checksum
 *
 * temperatures and valid must have the same length.
 */
Bytes encodeCompactPacket(std::span<const double> temperatures, const std::vector<bool>& valid);

/**
 * Full packet
 *
 *   AA 55 01 | T x f32 LE gamma | T x f32 LE temperature | T x valid byte | sum checksum
 */
Bytes encodeFullPacket(const EstimateResult& result);

Bytes encodePacket(const EstimateResult& result, PacketEncoding encoding);

} // namespace protocol
} // namespace tagsense
