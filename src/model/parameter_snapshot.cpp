#include "tagsense/snapshot.hpp"
#include "tagsense/errors.hpp"
#include "tagsense/logging.hpp"
#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace tagsense {

// ============================================================================
// Little-endian helpers
// ============================================================================

namespace {

void putU16(Bytes& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

void putU32(Bytes& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
    }
}

void putF32(Bytes& out, float f) {
    uint32_t bits;
    std::memcpy(&bits, &f, sizeof(bits));
    putU32(out, bits);
}

// Bounds-checked cursor over the snapshot bytes
class Cursor {
public:
    explicit Cursor(ByteSpan bytes) : bytes_(bytes) {}

    void need(size_t n, const char* what) const {
        if (pos_ + n > bytes_.size()) {
            throw SnapshotFormatError(std::string("Snapshot truncated while reading ") + what);
        }
    }

    uint8_t u8(const char* what) {
        need(1, what);
        return bytes_[pos_++];
    }

    uint16_t u16(const char* what) {
        need(2, what);
        uint16_t v = static_cast<uint16_t>(bytes_[pos_] | (bytes_[pos_ + 1] << 8));
        pos_ += 2;
        return v;
    }

    uint32_t u32(const char* what) {
        need(4, what);
        uint32_t v = 0;
        for (int i = 0; i < 4; ++i) {
            v |= static_cast<uint32_t>(bytes_[pos_ + i]) << (8 * i);
        }
        pos_ += 4;
        return v;
    }

    float f32(const char* what) {
        uint32_t bits = u32(what);
        float f;
        std::memcpy(&f, &bits, sizeof(f));
        return f;
    }

    std::string str(size_t n, const char* what) {
        need(n, what);
        std::string s(reinterpret_cast<const char*>(bytes_.data() + pos_), n);
        pos_ += n;
        return s;
    }

    size_t remaining() const { return bytes_.size() - pos_; }
    bool atEnd() const { return pos_ == bytes_.size(); }

private:
    ByteSpan bytes_;
    size_t pos_ = 0;
};

} // namespace

// ============================================================================
// Tensor / ParameterSnapshot
// ============================================================================

size_t Tensor::elementCount() const {
    size_t n = 1;
    for (uint32_t d : shape) n *= d;
    return n;
}

void ParameterSnapshot::add(const std::string& name, std::vector<uint32_t> shape,
                            std::vector<float> values) {
    Tensor t{std::move(shape), std::move(values)};
    if (t.elementCount() != t.values.size()) {
        throw SnapshotFormatError("Tensor '" + name + "' has " + std::to_string(t.values.size()) +
                                  " values but its shape holds " +
                                  std::to_string(t.elementCount()));
    }
    tensors_[name] = std::move(t);
}

const Tensor* ParameterSnapshot::find(const std::string& name) const {
    auto it = tensors_.find(name);
    return it == tensors_.end() ? nullptr : &it->second;
}

ParameterSnapshot ParameterSnapshot::parse(ByteSpan bytes) {
    Cursor cur(bytes);

    std::string magic = cur.str(sizeof(MAGIC), "magic");
    if (std::memcmp(magic.data(), MAGIC, sizeof(MAGIC)) != 0) {
        throw SnapshotFormatError("Not a parameter snapshot (bad magic)");
    }

    ParameterSnapshot snap;
    uint32_t count = cur.u32("tensor count");
    for (uint32_t i = 0; i < count; ++i) {
        uint16_t name_len = cur.u16("name length");
        std::string name = cur.str(name_len, "tensor name");
        if (snap.contains(name)) {
            throw SnapshotFormatError("Duplicate tensor '" + name + "'");
        }

        uint8_t rank = cur.u8("rank");
        std::vector<uint32_t> shape(rank);
        for (uint8_t d = 0; d < rank; ++d) {
            shape[d] = cur.u32("dimension");
        }

        // Element count bounded by the bytes left, so no product can wrap
        const size_t max_elements = cur.remaining() / sizeof(float);
        const bool has_zero_dim = std::find(shape.begin(), shape.end(), 0u) != shape.end();
        size_t n = has_zero_dim ? 0 : 1;
        for (uint32_t d : shape) {
            if (n != 0 && n > max_elements / d) {
                throw SnapshotFormatError("Tensor '" + name + "' shape exceeds the snapshot size");
            }
            n *= d;
        }
        cur.need(n * sizeof(float), "tensor data");
        std::vector<float> values(n);
        for (size_t k = 0; k < n; ++k) {
            values[k] = cur.f32("tensor data");
        }
        snap.add(name, std::move(shape), std::move(values));
    }

    if (!cur.atEnd()) {
        throw SnapshotFormatError("Trailing bytes after last tensor");
    }
    return snap;
}

ParameterSnapshot ParameterSnapshot::load(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        throw MissingSnapshotError("Parameter snapshot not found: " + path);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw SnapshotFormatError("Cannot open parameter snapshot: " + path);
    }

    Bytes bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    ParameterSnapshot snap = parse(bytes);

    LOG_MODEL(INFO, "Loaded snapshot %s (%zu tensors, %zu bytes)",
              path.c_str(), snap.size(), bytes.size());
    return snap;
}

Bytes ParameterSnapshot::serialize() const {
    Bytes out(MAGIC, MAGIC + sizeof(MAGIC));
    putU32(out, static_cast<uint32_t>(tensors_.size()));

    for (const auto& [name, tensor] : tensors_) {
        putU16(out, static_cast<uint16_t>(name.size()));
        out.insert(out.end(), name.begin(), name.end());
        out.push_back(static_cast<uint8_t>(tensor.shape.size()));
        for (uint32_t d : tensor.shape) {
            putU32(out, d);
        }
        for (float v : tensor.values) {
            putF32(out, v);
        }
    }
    return out;
}

bool ParameterSnapshot::save(const std::string& path) const {
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }
    Bytes bytes = serialize();
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    return static_cast<bool>(file);
}

} // namespace tagsense
