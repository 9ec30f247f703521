#include <iostream>
#include <cassert>
#include <cmath>
#include "model/fusion.hpp"
#include "model/layers.hpp"

using namespace tagsense::model;

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

Activations makeCandidates(float base, float step) {
    Activations a(4, 3);
    for (Eigen::Index b = 0; b < a.cols(); ++b) {
        for (Eigen::Index t = 0; t < a.rows(); ++t) {
            a(t, b) = base + step * static_cast<float>(t + 4 * b);
        }
    }
    return a;
}

void test_gate_extremes() {
    TEST("gate 0 gives x_ls, gate 1 gives x_tilde exactly") {
        Activations x_ls = makeCandidates(0.1f, 0.03f);
        Activations x_tilde = makeCandidates(-0.5f, 0.07f);

        Eigen::RowVectorXf zeros = Eigen::RowVectorXf::Zero(3);
        Eigen::RowVectorXf ones = Eigen::RowVectorXf::Ones(3);

        assert(blend(x_ls, x_tilde, zeros) == x_ls);
        assert(blend(x_ls, x_tilde, ones) == x_tilde);

        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

void test_gate_convex() {
    TEST("intermediate gate stays between candidates") {
        Activations x_ls = makeCandidates(0.1f, 0.03f);
        Activations x_tilde = makeCandidates(-0.5f, 0.07f);
        Eigen::RowVectorXf gate(3);
        gate << 0.3f, 0.5f, 0.9f;

        Activations fused = blend(x_ls, x_tilde, gate);
        for (Eigen::Index b = 0; b < fused.cols(); ++b) {
            for (Eigen::Index t = 0; t < fused.rows(); ++t) {
                float lo = std::min(x_ls(t, b), x_tilde(t, b));
                float hi = std::max(x_ls(t, b), x_tilde(t, b));
                assert(fused(t, b) >= lo - 1e-6f && fused(t, b) <= hi + 1e-6f);
                float expect = (1.0f - gate[b]) * x_ls(t, b) + gate[b] * x_tilde(t, b);
                assert(std::abs(fused(t, b) - expect) < 1e-6f);
            }
        }

        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

void test_fuse_variants() {
    TEST("fuse over both solver outcomes") {
        Activations x_ls = makeCandidates(1.0f, 0.1f);
        Activations x_tilde = makeCandidates(2.0f, 0.1f);

        SolverOutcome baseline = BaselineSolution{x_ls};
        assert(fuse(baseline) == x_ls);

        Eigen::RowVectorXf half = Eigen::RowVectorXf::Constant(3, 0.5f);
        SolverOutcome corrected = CorrectedSolution{x_ls, x_tilde, half};
        Activations fused = fuse(corrected);
        assert(((fused.array() - (x_ls.array() + 0.5f)).abs() < 1e-5f).all());

        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

void test_activations() {
    TEST("activation functions") {
        Activations x(5, 1);
        x << -3.0f, -1.0f, 0.0f, 1.0f, 30.0f;

        Activations g = gelu(x);
        assert(g(2, 0) == 0.0f);
        assert(std::abs(g(3, 0) - 0.841345f) < 1e-5f);
        assert(std::abs(g(1, 0) - (-0.158655f)) < 1e-5f);

        Activations sp = softplus(x);
        assert(std::abs(sp(2, 0) - std::log(2.0f)) < 1e-6f);
        assert(sp(4, 0) == 30.0f);  // linear above the threshold
        assert((sp.array() > 0.0f).all());

        Activations s = sigmoid(x);
        assert(s(2, 0) == 0.5f);
        assert((s.array() > 0.0f).all() && (s.array() <= 1.0f).all());

        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

void test_linear_and_residual() {
    TEST("dense layer and residual block on a batch") {
        Linear layer;
        layer.weight.resize(2, 3);
        layer.weight << 1, 0, -1,
                        0.5f, 2, 0;
        layer.bias.resize(2);
        layer.bias << 0.1f, -0.2f;

        Activations x(3, 2);
        x << 1, 4,
             2, 5,
             3, 6;
        Activations y = layer(x);
        assert(y.rows() == 2 && y.cols() == 2);
        assert(std::abs(y(0, 0) - (-1.9f)) < 1e-6f);
        assert(std::abs(y(1, 0) - 4.3f) < 1e-6f);
        assert(std::abs(y(0, 1) - (-1.9f)) < 1e-6f);
        assert(std::abs(y(1, 1) - 11.8f) < 1e-5f);

        // Zero inner layers reduce the block to GELU(x)
        ResidualBlock block;
        block.fc1.weight = Eigen::MatrixXf::Zero(3, 3);
        block.fc1.bias = Eigen::VectorXf::Zero(3);
        block.fc2.weight = Eigen::MatrixXf::Zero(3, 3);
        block.fc2.bias = Eigen::VectorXf::Zero(3);
        assert(((block(x) - gelu(x)).array().abs() < 1e-7f).all());

        // Non-zero inner layers against a scalar evaluation of
        // gelu(x + W2 gelu(W1 x + b1) + b2)
        auto g = [](double v) { return 0.5 * v * (1.0 + std::erf(v / std::sqrt(2.0))); };
        ResidualBlock learned;
        learned.fc1.weight.resize(2, 2);
        learned.fc1.weight << 1.0f, -1.0f,
                              0.5f, 2.0f;
        learned.fc1.bias.resize(2);
        learned.fc1.bias << 0.1f, 0.0f;
        learned.fc2.weight.resize(2, 2);
        learned.fc2.weight << 0.0f, 1.0f,
                              -1.0f, 0.5f;
        learned.fc2.bias.resize(2);
        learned.fc2.bias << 0.2f, -0.1f;

        Activations in(2, 1);
        in << 0.3f, -0.7f;
        const double a0 = g(1.0 * 0.3 - 1.0 * -0.7 + 0.1);
        const double a1 = g(0.5 * 0.3 + 2.0 * -0.7 + 0.0);
        const double want0 = g(0.3 + (0.0 * a0 + 1.0 * a1 + 0.2));
        const double want1 = g(-0.7 + (-1.0 * a0 + 0.5 * a1 - 0.1));
        Activations got = learned(in);
        assert(std::abs(got(0, 0) - want0) < 1e-6);
        assert(std::abs(got(1, 0) - want1) < 1e-6);
        // Swapping the layers changes the result
        ResidualBlock swapped{learned.fc2, learned.fc1};
        assert(std::abs(swapped(in)(0, 0) - want0) > 1e-3 || std::abs(swapped(in)(1, 0) - want1) > 1e-3);

        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

int main() {
    std::cout << "=== Fusion and Layer Tests ===\n\n";

    test_gate_extremes();
    test_gate_convex();
    test_fuse_variants();
    test_activations();
    test_linear_and_residual();

    std::cout << "\n=== Results ===\n";
    std::cout << "Passed: " << tests_passed << "\n";
    std::cout << "Failed: " << tests_failed << "\n";

    return tests_failed > 0 ? 1 : 0;
}
