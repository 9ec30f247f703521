#include <iostream>
#include <cassert>
#include <filesystem>
#include <algorithm>
#include <cmath>
#include <cstring>
#include <fstream>
#include "tagsense/errors.hpp"
#include "tagsense/estimator.hpp"
#include "tagsense/snapshot.hpp"

using namespace tagsense;

int tests_passed = 0;
int tests_failed = 0;

#define TEST(name) \
    std::cout << "Testing " << name << "... "; \
    try

#define PASS() \
    std::cout << "PASS\n"; \
    tests_passed++;

#define FAIL(msg) \
    std::cout << "FAIL: " << msg << "\n"; \
    tests_failed++;

std::string tempPath(const char* name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

ParameterSnapshot smallSnapshot() {
    ParameterSnapshot snap;
    snap.add("a.weight", {2, 3}, {1, 2, 3, 4, 5, 6});
    snap.add("a.bias", {2}, {-0.5f, 0.25f});
    snap.add("b", {1, 1, 4}, {0.0f, 1e-7f, -1e7f, 3.14159f});
    return snap;
}

// Expect a specific exception type from a callable
template <class E, class F>
bool throws(F&& f) {
    try {
        f();
    } catch (const E&) {
        return true;
    }
    return false;
}

void test_serialize_parse() {
    TEST("serialize/parse preserves tensors") {
        ParameterSnapshot snap = smallSnapshot();
        Bytes bytes = snap.serialize();
        assert(bytes.size() > 8);
        assert(bytes[0] == 'T' && bytes[1] == 'S' && bytes[2] == 'N' && bytes[3] == 'P');

        ParameterSnapshot back = ParameterSnapshot::parse(bytes);
        assert(back.size() == 3);
        for (const auto& [name, tensor] : snap.tensors()) {
            const Tensor* t = back.find(name);
            assert(t != nullptr);
            assert(t->shape == tensor.shape);
            assert(t->values == tensor.values);
        }

        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

void test_save_load_file() {
    TEST("save/load through a file") {
        std::string path = tempPath("tagsense_test_snapshot.tsnp");
        ParameterSnapshot snap = smallSnapshot();
        assert(snap.save(path));

        ParameterSnapshot back = ParameterSnapshot::load(path);
        assert(back.size() == snap.size());
        assert(back.find("a.bias")->values[1] == 0.25f);

        std::filesystem::remove(path);
        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

void test_missing_file() {
    TEST("missing file -> MissingSnapshotError") {
        std::string path = tempPath("tagsense_does_not_exist.tsnp");
        std::filesystem::remove(path);
        assert(throws<MissingSnapshotError>([&] { ParameterSnapshot::load(path); }));

        // Through the engine as well
        InferenceEngine engine(presets::standard());
        assert(throws<MissingSnapshotError>([&] { engine.loadSnapshot(path); }));
        assert(!engine.isLoaded());

        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

void test_corrupt_bytes() {
    TEST("corrupt snapshots rejected") {
        Bytes good = smallSnapshot().serialize();

        Bytes bad_magic = good;
        bad_magic[0] = 'X';
        assert(throws<SnapshotFormatError>([&] { ParameterSnapshot::parse(bad_magic); }));

        Bytes truncated(good.begin(), good.end() - 3);
        assert(throws<SnapshotFormatError>([&] { ParameterSnapshot::parse(truncated); }));

        Bytes trailing = good;
        trailing.push_back(0);
        assert(throws<SnapshotFormatError>([&] { ParameterSnapshot::parse(trailing); }));

        Bytes empty;
        assert(throws<SnapshotFormatError>([&] { ParameterSnapshot::parse(empty); }));

        // Dimensions whose product overflows size_t arithmetic
        Bytes huge = {'T', 'S', 'N', 'P', 1, 0, 0, 0, 1, 0, 'w', 2,
                      0, 0, 0, 0x80, 0, 0, 0, 0x80};
        assert(throws<SnapshotFormatError>([&] { ParameterSnapshot::parse(huge); }));

        // Plausible shape but far more data than the file holds
        Bytes oversized = {'T', 'S', 'N', 'P', 1, 0, 0, 0, 1, 0, 'w', 1,
                           0, 0, 0, 0x10, 0, 0, 0, 0};
        assert(throws<SnapshotFormatError>([&] { ParameterSnapshot::parse(oversized); }));

        // Shape and value count disagree
        ParameterSnapshot snap;
        assert(throws<SnapshotFormatError>([&] { snap.add("x", {2, 2}, {1, 2, 3}); }));

        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

void test_scalar_and_empty_tensors() {
    TEST("rank-0 tensor holds one value") {
        Tensor scalar{{}, {2.5f}};
        assert(scalar.elementCount() == 1);
        Tensor empty{{3, 0}, {}};
        assert(empty.elementCount() == 0);

        ParameterSnapshot snap;
        snap.add("scale", {}, {2.5f});
        snap.add("none", {4, 0}, {});
        assert(throws<SnapshotFormatError>([&] { snap.add("bad_scalar", {}, {}); }));

        ParameterSnapshot back = ParameterSnapshot::parse(snap.serialize());
        const Tensor* t = back.find("scale");
        assert(t != nullptr);
        assert(t->shape.empty());
        assert(t->values.size() == 1 && t->values[0] == 2.5f);
        assert(back.find("none")->values.empty());
        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

void test_expected_layout() {
    TEST("expected tensor layout follows configuration") {
        EstimatorConfig full = presets::standard();
        EstimatorConfig base = presets::baselineOnly();

        auto full_layout = expectedTensorLayout(full);
        auto base_layout = expectedTensorLayout(base);
        // lambda (3) + delta-H (3) + gate (2) + stem (1) + 3 blocks x 2 + head (1), weight+bias each
        assert(full_layout.size() == 2 * (3 + 3 + 2 + 1 + 6 + 1));
        assert(base_layout.size() == 2 * (3 + 1 + 6 + 1));

        bool found_stem = false;
        for (const TensorSpec& spec : full_layout) {
            if (spec.name == "refine_stem.0.weight") {
                found_stem = true;
                assert(spec.shape.size() == 2);
                assert(spec.shape[0] == full.hidden_width);
                assert(spec.shape[1] == full.refineFeatureSize());
            }
        }
        assert(found_stem);

        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

// Little-endian TSNP bytes written field by field, tensors in name order,
// the way a checkpoint exporter lays them out
Bytes exporterBytes(const std::vector<std::pair<std::string, Tensor>>& tensors) {
    Bytes out = {'T', 'S', 'N', 'P'};
    auto u32 = [&](uint32_t v) {
        for (int i = 0; i < 4; ++i) out.push_back(static_cast<uint8_t>(v >> (8 * i)));
    };
    u32(static_cast<uint32_t>(tensors.size()));
    for (const auto& [name, t] : tensors) {
        out.push_back(static_cast<uint8_t>(name.size() & 0xFF));
        out.push_back(static_cast<uint8_t>(name.size() >> 8));
        out.insert(out.end(), name.begin(), name.end());
        out.push_back(static_cast<uint8_t>(t.shape.size()));
        for (uint32_t d : t.shape) u32(d);
        for (float v : t.values) {
            uint32_t bits;
            std::memcpy(&bits, &v, sizeof(bits));
            u32(bits);
        }
    }
    return out;
}

void test_exported_checkpoint_loads() {
    TEST("exported state dict file binds and runs") {
        EstimatorConfig cfg;
        cfg.num_tags = 2;
        cfg.num_rx = 3;
        cfg.samples_per_slot = 4;
        cfg.hidden_width = 6;
        cfg.delta_h_width = 5;
        cfg.refine_blocks = 1;

        std::vector<std::pair<std::string, Tensor>> tensors;
        ParameterSnapshot in_memory;
        size_t k = 0;
        for (const TensorSpec& spec : expectedTensorLayout(cfg)) {
            Tensor t{spec.shape, {}};
            t.values.resize(t.elementCount());
            for (float& v : t.values) v = 0.01f * static_cast<float>(k++ % 17) - 0.08f;
            in_memory.add(spec.name, t.shape, t.values);
            tensors.emplace_back(spec.name, std::move(t));
        }
        std::sort(tensors.begin(), tensors.end(),
                  [](const auto& a, const auto& b) { return a.first < b.first; });

        std::string path = tempPath("tagsense_exported.tsnp");
        {
            Bytes bytes = exporterBytes(tensors);
            std::ofstream f(path, std::ios::binary);
            f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        }

        // Row-major weight: element (row 1, col 2) of lambda_net.0 sits at 1*3+2
        ParameterSnapshot loaded = ParameterSnapshot::load(path);
        const Tensor* w = loaded.find("lambda_net.0.weight");
        assert(w != nullptr && w->shape == std::vector<uint32_t>({6, 3}));
        assert(w->values[5] == in_memory.find("lambda_net.0.weight")->values[5]);

        InferenceEngine from_file(cfg);
        from_file.loadSnapshot(path);
        InferenceEngine from_memory(cfg);
        from_memory.loadSnapshot(in_memory);

        ObservationFrame frame = ObservationFrame::forConfig(cfg);
        for (size_t i = 0; i < frame.data.size(); ++i) {
            frame.data[i] = std::sin(0.37f * static_cast<float>(i)) + 0.5f;
        }
        std::vector<ObservationFrame> batch = {frame};
        auto a = from_file.forward(batch);
        auto b = from_memory.forward(batch);
        assert(a == b);
        for (float v : a[0]) {
            assert(std::isfinite(v));
        }

        std::filesystem::remove(path);
        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

void test_architecture_mismatch() {
    TEST("binding rejects missing, extra and mis-shaped tensors") {
        EstimatorConfig cfg = presets::standard();
        InferenceEngine engine(cfg);

        // Complete snapshot binds
        engine.loadSnapshot(zeroSnapshot(cfg));
        assert(engine.isLoaded());

        InferenceEngine fresh(cfg);

        // Missing tensor
        ParameterSnapshot full = zeroSnapshot(cfg);
        ParameterSnapshot missing;
        for (const auto& [name, t] : full.tensors()) {
            if (name != "gate_mlp.2.bias") missing.add(name, t.shape, t.values);
        }
        assert(throws<ArchitectureMismatchError>([&] { fresh.loadSnapshot(missing); }));

        // Extra tensor
        ParameterSnapshot extra = zeroSnapshot(cfg);
        extra.add("unused.weight", {1}, {0.0f});
        assert(throws<ArchitectureMismatchError>([&] { fresh.loadSnapshot(extra); }));

        // Mis-shaped tensor (transposed weight)
        ParameterSnapshot shaped = zeroSnapshot(cfg);
        const Tensor* w = shaped.find("lambda_net.0.weight");
        std::vector<uint32_t> transposed = {w->shape[1], w->shape[0]};
        shaped.add("lambda_net.0.weight", transposed, std::vector<float>(w->values.size(), 0.0f));
        assert(throws<ArchitectureMismatchError>([&] { fresh.loadSnapshot(shaped); }));

        // Snapshot for the full model does not fit the baseline architecture
        InferenceEngine baseline(presets::baselineOnly());
        assert(throws<ArchitectureMismatchError>([&] { baseline.loadSnapshot(full); }));

        // Mismatch is a kind of format error
        assert(throws<SnapshotFormatError>([&] { fresh.loadSnapshot(extra); }));
        assert(!fresh.isLoaded());

        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

int main() {
    std::cout << "=== Parameter Snapshot Tests ===\n\n";

    test_serialize_parse();
    test_save_load_file();
    test_missing_file();
    test_corrupt_bytes();
    test_scalar_and_empty_tensors();
    test_expected_layout();
    test_architecture_mismatch();
    test_exported_checkpoint_loads();

    std::cout << "\n=== Results ===\n";
    std::cout << "Passed: " << tests_passed << "\n";
    std::cout << "Failed: " << tests_failed << "\n";

    return tests_failed > 0 ? 1 : 0;
}
