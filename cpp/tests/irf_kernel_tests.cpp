#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include "libcdr/basis_irf.hpp"
#include "libcdr/errors.hpp"
#include "libcdr/irf_kernel_factory.hpp"

namespace {
std::shared_ptr<const libcdr::IrfKernel> make_kernel(const std::string& family) {
    return libcdr::IrfKernelFactory::create(family, {0.0, 1.0, 2.5, 5.0});
}

// Central differences of the weight with respect to each constrained parameter.
std::vector<double> numeric_gradient(const libcdr::IrfKernel& kernel, std::vector<double> params, double lag) {
    const double h = 1e-6;
    std::vector<double> grad(params.size());
    for (std::size_t k = 0; k < params.size(); ++k) {
        const double saved = params[k];
        params[k] = saved + h;
        const double plus = kernel.evaluate(params, lag, false).weight;
        params[k] = saved - h;
        const double minus = kernel.evaluate(params, lag, false).weight;
        params[k] = saved;
        grad[k] = (plus - minus) / (2.0 * h);
    }
    return grad;
}
}  // namespace

TEST_CASE("Exponential kernel matches closed form", "[irf_kernel]") {
    auto kernel = make_kernel("exponential");
    REQUIRE(kernel->name() == "exponential");
    REQUIRE(kernel->parameter_count() == 1);

    const auto eval = kernel->evaluate({1.0}, 2.0);
    REQUIRE(eval.weight == Catch::Approx(std::exp(-2.0)));
    REQUIRE(eval.log_weight == Catch::Approx(-2.0));
    // d/d beta (beta e^{-beta t}) = e^{-beta t} (1 - beta t)
    REQUIRE(eval.gradient[0] == Catch::Approx(std::exp(-2.0) * (1.0 - 2.0)));

    REQUIRE(kernel->evaluate({0.5}, 0.0).weight == Catch::Approx(0.5));
}

TEST_CASE("Gamma kernels match closed form", "[irf_kernel]") {
    auto gamma = make_kernel("gamma");
    // shape 2, rate 3: 9 t e^{-3t}
    REQUIRE(gamma->evaluate({2.0, 3.0}, 0.5).weight == Catch::Approx(9.0 * 0.5 * std::exp(-1.5)));

    auto shifted = make_kernel("shifted_gamma");
    REQUIRE(shifted->evaluate({2.0, 3.0, 0.25}, 0.25).weight == Catch::Approx(9.0 * 0.5 * std::exp(-1.5)));

    auto kgt1 = make_kernel("gamma_kgt1");
    const auto at_zero = kgt1->evaluate({1.5, 1.0}, 0.0);
    REQUIRE(std::isfinite(at_zero.weight));
    REQUIRE(at_zero.weight >= 0.0);
    REQUIRE(at_zero.weight < 1e-3);
    REQUIRE_FALSE(kgt1->is_valid({0.5, 1.0}));
}

TEST_CASE("Normal kernel matches closed form", "[irf_kernel]") {
    auto kernel = make_kernel("normal");
    const double expected = std::exp(-0.5) / std::sqrt(2.0 * 3.14159265358979323846);
    REQUIRE(kernel->evaluate({1.0, 1.0}, 2.0).weight == Catch::Approx(expected));
}

TEST_CASE("Double gamma kernel mixes its components", "[irf_kernel]") {
    auto mixture = make_kernel("double_gamma");
    auto gamma = make_kernel("gamma");
    const double lag = 3.0;
    const double expected = 0.25 * gamma->evaluate({6.0, 1.0}, lag).weight +
                            0.75 * gamma->evaluate({16.0, 1.0}, lag).weight;
    REQUIRE(mixture->evaluate({6.0, 1.0, 16.0, 1.0, 0.25}, lag).weight == Catch::Approx(expected));
    REQUIRE_FALSE(mixture->is_valid({6.0, 1.0, 16.0, 1.0, 1.0}));
}

TEST_CASE("Basis kernel interpolates heights", "[irf_kernel]") {
    libcdr::BasisIrf kernel({0.0, 1.0, 3.0});
    REQUIRE(kernel.parameter_count() == 3);
    const std::vector<double> heights{2.0, 1.0, 0.5};
    REQUIRE(kernel.evaluate(heights, 0.0).weight == Catch::Approx(2.0));
    REQUIRE(kernel.evaluate(heights, 0.5).weight == Catch::Approx(1.5));
    REQUIRE(kernel.evaluate(heights, 2.0).weight == Catch::Approx(0.75));
    const auto beyond = kernel.evaluate(heights, 3.5);
    REQUIRE(beyond.weight == 0.0);
    REQUIRE(beyond.gradient == std::vector<double>{0.0, 0.0, 0.0});

    const auto mid = kernel.evaluate(heights, 2.0);
    REQUIRE(mid.gradient[1] == Catch::Approx(0.5));
    REQUIRE(mid.gradient[2] == Catch::Approx(0.5));

    REQUIRE_THROWS_AS(libcdr::BasisIrf({1.0}), libcdr::ConfigurationError);
    REQUIRE_THROWS_AS(libcdr::BasisIrf({0.0, 2.0, 1.0}), libcdr::ConfigurationError);
}

TEST_CASE("Kernel gradients agree with finite differences", "[irf_kernel][gradient]") {
    struct Case {
        std::string family;
        std::vector<double> params;
        double lag;
    };
    const std::vector<Case> cases{
        {"exponential", {1.3}, 0.7},
        {"gamma", {2.5, 1.5}, 1.2},
        {"gamma_kgt1", {2.5, 1.5}, 0.4},
        {"shifted_gamma", {2.0, 1.0, 0.3}, 1.0},
        {"normal", {0.5, 0.8}, 1.1},
        {"double_gamma", {3.0, 1.0, 6.0, 1.5, 0.4}, 2.5},
        {"basis", {1.0, 0.8, 0.4, 0.1}, 1.7},
    };
    for (const auto& c : cases) {
        auto kernel = make_kernel(c.family);
        const auto eval = kernel->evaluate(c.params, c.lag);
        const auto numeric = numeric_gradient(*kernel, c.params, c.lag);
        REQUIRE(eval.gradient.size() == c.params.size());
        for (std::size_t k = 0; k < numeric.size(); ++k) {
            INFO(c.family << " parameter " << k);
            REQUIRE(eval.gradient[k] == Catch::Approx(numeric[k]).margin(1e-6).epsilon(1e-4));
        }
    }
}

TEST_CASE("Sampled parameters stay in the kernel domain", "[irf_kernel]") {
    std::mt19937 rng(1234);
    std::uniform_real_distribution<double> uniform(-5.0, 5.0);
    for (const auto& family : libcdr::IrfKernelFactory::families()) {
        auto kernel = make_kernel(family);
        for (int draw = 0; draw < 200; ++draw) {
            std::vector<double> unconstrained(kernel->parameter_count());
            for (auto& value : unconstrained) {
                value = uniform(rng);
            }
            const auto params = kernel->constrain(unconstrained);
            REQUIRE(kernel->is_valid(params));
            for (double lag : {0.0, 0.05, 0.5, 1.0, 4.0, 12.0}) {
                const auto eval = kernel->evaluate(params, lag);
                INFO(family << " at lag " << lag);
                REQUIRE(std::isfinite(eval.weight));
                REQUIRE(eval.weight >= 0.0);
            }
        }
    }
}

TEST_CASE("Kernel constrain rejects non-finite inputs", "[irf_kernel]") {
    auto kernel = make_kernel("exponential");
    REQUIRE_THROWS_AS(kernel->constrain({std::nan("")}), libcdr::NumericInstabilityError);
    REQUIRE_THROWS_AS(kernel->evaluate({1.0, 2.0}, 0.0), std::invalid_argument);
}

TEST_CASE("Kernel factory rejects unknown families", "[irf_kernel]") {
    REQUIRE_THROWS_AS(libcdr::IrfKernelFactory::create("hrf"), libcdr::ConfigurationError);
    REQUIRE_THROWS_AS(libcdr::IrfKernelFactory::create("basis"), libcdr::ConfigurationError);
    for (const auto& family : libcdr::IrfKernelFactory::families()) {
        REQUIRE(make_kernel(family)->name() == family);
    }
}
