#include "result_packet.hpp"
#include "tagsense/errors.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>

namespace tagsense {
namespace protocol {

namespace {

void appendFloatLE(Bytes& out, float value) {
    uint32_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    out.push_back(bits & 0xFF);
    out.push_back((bits >> 8) & 0xFF);
    out.push_back((bits >> 16) & 0xFF);
    out.push_back((bits >> 24) & 0xFF);
}

} // namespace

const char* packetEncodingToString(PacketEncoding encoding) {
    switch (encoding) {
        case PacketEncoding::COMPACT: return "compact";
        case PacketEncoding::FULL:    return "full";
    }
    return "unknown";
}

std::optional<PacketEncoding> parsePacketEncoding(const std::string& name) {
    if (name == "compact") return PacketEncoding::COMPACT;
    if (name == "full") return PacketEncoding::FULL;
    return std::nullopt;
}

uint8_t xorChecksum(const uint8_t* data, size_t len) {
    uint8_t c = 0;
    for (size_t i = 0; i < len; ++i) {
        c ^= data[i];
    }
    return c;
}

uint8_t sumChecksum(const uint8_t* data, size_t len) {
    uint32_t sum = 0;
    for (size_t i = 0; i < len; ++i) {
        sum += data[i];
    }
    return static_cast<uint8_t>(sum & 0xFF);
}

uint16_t encodeTemperatureField(double celsius, bool valid) {
    if (!valid || !std::isfinite(celsius)) {
        return INVALID_TEMP;
    }
    // Truncate toward zero, then clamp to the display range
    double tenths = std::trunc(celsius * TEMP_SCALE);
    tenths = std::clamp(tenths, static_cast<double>(TEMP_FIELD_MIN),
                        static_cast<double>(TEMP_FIELD_MAX));
    return static_cast<uint16_t>(static_cast<int16_t>(tenths));
}

Bytes encodeCompactPacket(std::span<const double> temperatures, const std::vector<bool>& valid) {
    if (temperatures.size() != valid.size()) {
        throw ShapeError("Compact packet: " + std::to_string(temperatures.size()) +
                         " temperatures but " + std::to_string(valid.size()) + " validity flags");
    }

    Bytes out;
    out.reserve(compactPacketSize(temperatures.size()));
    out.push_back(FRAME_HEADER[0]);
    out.push_back(FRAME_HEADER[1]);

    for (size_t t = 0; t < temperatures.size(); ++t) {
        uint16_t field = encodeTemperatureField(temperatures[t], valid[t]);
        out.push_back((field >> 8) & 0xFF);
        out.push_back(field & 0xFF);
    }

    out.push_back(xorChecksum(out.data(), out.size()));
    return out;
}

Bytes encodeFullPacket(const EstimateResult& result) {
    const size_t T = result.num_tags;
    if (result.gamma.size() != T || result.temperatures_c.size() != T || result.valid.size() != T) {
        throw ShapeError("Full packet: result fields do not match " + std::to_string(T) + " tags");
    }

    Bytes out;
    out.reserve(fullPacketSize(T));
    out.push_back(FRAME_HEADER[0]);
    out.push_back(FRAME_HEADER[1]);
    out.push_back(PACKET_TYPE_FULL);

    for (float g : result.gamma) {
        appendFloatLE(out, g);
    }
    for (double c : result.temperatures_c) {
        appendFloatLE(out, static_cast<float>(c));
    }
    for (bool v : result.valid) {
        out.push_back(v ? 0x01 : 0x00);
    }

    out.push_back(sumChecksum(out.data(), out.size()));
    return out;
}

Bytes encodePacket(const EstimateResult& result, PacketEncoding encoding) {
    if (encoding == PacketEncoding::FULL) {
        return encodeFullPacket(result);
    }
    return encodeCompactPacket(result.temperatures_c, result.valid);
}

} // namespace protocol
} // namespace tagsense
