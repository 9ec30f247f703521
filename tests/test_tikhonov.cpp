#include <iostream>
#include <cassert>
#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include "solver/tikhonov.hpp"

using namespace tagsense;
using namespace tagsense::solver;

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

// Random complex channel, diagonally loaded so it is well conditioned
Eigen::MatrixXcf wellConditionedChannel(int rows, int cols, uint32_t seed) {
    std::mt19937 rng(seed);
    std::normal_distribution<float> n(0.0f, 0.3f);
    Eigen::MatrixXcf H(rows, cols);
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            H(r, c) = Complex(n(rng), n(rng));
        }
    }
    for (int i = 0; i < std::min(rows, cols); ++i) {
        H(i, i) += Complex(2.0f, 0.0f);
    }
    return H;
}

void test_small_lambda_converges_to_ls() {
    TEST("lambda -> 0 converges to exact least squares") {
        Eigen::MatrixXcf H = wellConditionedChannel(4, 4, 7);
        Eigen::VectorXf x_true(4);
        x_true << 0.3f, -0.2f, 0.1f, -0.45f;
        Eigen::VectorXcf y = H * x_true.cast<Complex>();

        float prev_err = std::numeric_limits<float>::infinity();
        for (float lam : {1e-1f, 1e-3f, 1e-6f}) {
            Eigen::VectorXf x = solveTikhonov(H, y, Eigen::VectorXf::Constant(4, lam));
            float err = (x - x_true).norm();
            assert(err <= prev_err);
            prev_err = err;
        }
        assert(prev_err < 1e-4f);

        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

void test_tall_channel() {
    TEST("more antennas than tags (R=6, T=3)") {
        Eigen::MatrixXcf H = wellConditionedChannel(6, 3, 11);
        Eigen::VectorXf x_true(3);
        x_true << -0.7f, 0.05f, 0.6f;
        Eigen::VectorXcf y = H * x_true.cast<Complex>();

        Eigen::VectorXf x = solveTikhonov(H, y, Eigen::VectorXf::Constant(3, 1e-7f));
        assert(x.size() == 3);
        assert((x - x_true).cwiseAbs().maxCoeff() < 1e-4f);

        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

void test_per_tag_lambda() {
    TEST("per-tag lambda shrinks only its own component") {
        Eigen::MatrixXcf H = Eigen::MatrixXcf::Identity(3, 3);
        Eigen::VectorXcf y(3);
        y << Complex(1, 0), Complex(1, 0), Complex(1, 0);

        Eigen::VectorXf lambda(3);
        lambda << 1e-6f, 1.0f, 1e-6f;
        Eigen::VectorXf x = solveTikhonov(H, y, lambda);

        // Identity channel: x_t = 1 / (1 + lambda_t)
        assert(std::abs(x[0] - 1.0f) < 1e-5f);
        assert(std::abs(x[1] - 0.5f) < 1e-5f);
        assert(std::abs(x[2] - 1.0f) < 1e-5f);

        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

void test_zero_channel() {
    TEST("all-zero H and y give finite zero output") {
        Eigen::MatrixXcf H = Eigen::MatrixXcf::Zero(4, 4);
        Eigen::VectorXcf y = Eigen::VectorXcf::Zero(4);

        Eigen::VectorXf x = solveRegularized(H, y, Eigen::VectorXf::Constant(4, 1e-3f), 1e4f);
        assert(x.size() == 4);
        assert(x.allFinite());
        assert(x.cwiseAbs().maxCoeff() == 0.0f);

        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

void test_sanitize() {
    TEST("non-finite entries replaced, magnitude clamped") {
        Eigen::VectorXf x(5);
        x << std::numeric_limits<float>::quiet_NaN(),
             std::numeric_limits<float>::infinity(),
             2e5f, -3.0f, -2e5f;

        size_t replaced = sanitizeSolution(x, 1e4f);
        assert(replaced == 2);
        assert(x[0] == 0.0f);
        assert(x[1] == 0.0f);
        assert(x[2] == 1e4f);
        assert(x[3] == -3.0f);
        assert(x[4] == -1e4f);

        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

void test_condition_proxy() {
    TEST("condition proxy") {
        assert(std::abs(conditionProxy(Eigen::MatrixXcf::Identity(4, 4)) - 1.0f) < 1e-5f);

        // Singular values 1 and 0.1 -> eigenvalues of H^H H are 1 and 0.01
        Eigen::MatrixXcf D = Eigen::MatrixXcf::Zero(2, 2);
        D(0, 0) = Complex(1.0f, 0.0f);
        D(1, 1) = Complex(0.0f, 0.1f);
        assert(std::abs(conditionProxy(D) - 100.0f) < 1e-2f);

        // Scale invariant
        Eigen::MatrixXcf H = wellConditionedChannel(4, 4, 3);
        float c1 = conditionProxy(H);
        Eigen::MatrixXcf H5 = H * Complex(5.0f, 0.0f);
        float c2 = conditionProxy(H5);
        assert(std::abs(c1 - c2) / c1 < 1e-3f);

        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

void test_condition_clamp() {
    TEST("condition clamp") {
        // Rank-deficient: a zero column makes the proxy explode
        Eigen::MatrixXcf H = wellConditionedChannel(4, 4, 5);
        H.col(2).setZero();
        float raw = conditionProxy(H);
        assert(raw > 1e4f);
        assert(clampCondition(raw, 1.0f, 1e4f) == 1e4f);

        assert(clampCondition(0.5f, 1.0f, 1e4f) == 1.0f);
        assert(clampCondition(42.0f, 1.0f, 1e4f) == 42.0f);
        assert(clampCondition(std::numeric_limits<float>::quiet_NaN(), 1.0f, 1e4f) == 1e4f);
        assert(clampCondition(std::numeric_limits<float>::infinity(), 1.0f, 1e4f) == 1e4f);

        Eigen::MatrixXcf bad = Eigen::MatrixXcf::Identity(2, 2);
        bad(0, 1) = Complex(std::numeric_limits<float>::quiet_NaN(), 0.0f);
        assert(std::isnan(conditionProxy(bad)));

        PASS();
    } catch (const std::exception& e) {
        FAIL(e.what());
    }
}

int main() {
    std::cout << "=== Tikhonov Solver Tests ===\n\n";

    test_small_lambda_converges_to_ls();
    test_tall_channel();
    test_per_tag_lambda();
    test_zero_channel();
    test_sanitize();
    test_condition_proxy();
    test_condition_clamp();

    std::cout << "\n=== Results ===\n";
    std::cout << "Passed: " << tests_passed << "\n";
    std::cout << "Failed: " << tests_failed << "\n";

    return tests_failed > 0 ? 1 : 0;
}
