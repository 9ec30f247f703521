#pragma once

#include "types.hpp"
#include <map>
#include <string>
#include <vector>

namespace tagsense {

// One named parameter tensor (row-major float32)
struct Tensor {
    std::vector<uint32_t> shape;
    std::vector<float> values;

    size_t elementCount() const;
};

/**
 * Parameter Snapshot
 *
 * Flat, versionless mapping from tensor name to values, as exported from a
 * trained model. Loaded wholesale; never modified after the engine binds it.
 *
 * File layout (little-endian):
 *   "TSNP" | u32 count | count x { u16 name_len | name | u8 rank | u32 dims[rank] | f32 data }
 */
class ParameterSnapshot {
public:
    static constexpr char MAGIC[4] = {'T', 'S', 'N', 'P'};

    // Add or replace a tensor. Throws SnapshotFormatError if values and
    // shape disagree.
    void add(const std::string& name, std::vector<uint32_t> shape, std::vector<float> values);

    // nullptr if absent
    const Tensor* find(const std::string& name) const;

    bool contains(const std::string& name) const { return find(name) != nullptr; }
    size_t size() const { return tensors_.size(); }
    bool empty() const { return tensors_.empty(); }

    const std::map<std::string, Tensor>& tensors() const { return tensors_; }

    // Throws MissingSnapshotError if the file does not exist,
    // SnapshotFormatError if it cannot be parsed.
    static ParameterSnapshot load(const std::string& path);

    // Throws SnapshotFormatError
    static ParameterSnapshot parse(ByteSpan bytes);

    Bytes serialize() const;
    bool save(const std::string& path) const;

private:
    std::map<std::string, Tensor> tensors_;
};

// Name and shape of one tensor the configured architecture requires
struct TensorSpec {
    std::string name;
    std::vector<uint32_t> shape;
};

// Every tensor the hybrid model needs for this configuration, in binding order
std::vector<TensorSpec> expectedTensorLayout(const EstimatorConfig& config);

// Snapshot with every expected tensor present and all values zero.
// With it the learned corrections vanish: lambda = softplus(0)+1e-6 scaled,
// delta-H = 0, gate = 0.5, dx = 0.
ParameterSnapshot zeroSnapshot(const EstimatorConfig& config);

} // namespace tagsense
