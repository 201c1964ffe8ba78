#include "libcdr/gamma_irf.hpp"

#include "libcdr/parameter_transform.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace libcdr {

namespace {
constexpr double kMinLag = 1e-8;

double digamma(double x) {
    double result = 0, xx, xx2, xx4;
    for ( ; x < 7; ++x)
        result -= 1.0/x;
    x -= 1.0/2.0;
    xx = 1.0/x;
    xx2 = xx*xx;
    xx4 = xx2*xx2;
    result += std::log(x) + (1.0/24.0)*xx2 - (7.0/960.0)*xx4 + (31.0/8064.0)*xx4*xx2 - (127.0/30720.0)*xx4*xx4;
    return result;
}

// log Gamma(t; shape, rate) and its partials in (shape, rate, t).
struct GammaLogDensity {
    double value;
    double d_shape;
    double d_rate;
    double d_t;
};

GammaLogDensity gamma_log_density(double shape, double rate, double t) {
    const double log_t = std::log(t);
    GammaLogDensity out;
    out.value = shape * std::log(rate) + (shape - 1.0) * log_t - rate * t - std::lgamma(shape);
    out.d_shape = std::log(rate) + log_t - digamma(shape);
    out.d_rate = shape / rate - t;
    out.d_t = (shape - 1.0) / t - rate;
    return out;
}

double log_sum_exp(double a, double b) {
    const double hi = std::max(a, b);
    if (hi == -std::numeric_limits<double>::infinity()) {
        return hi;
    }
    return hi + std::log(std::exp(a - hi) + std::exp(b - hi));
}
}  // namespace

GammaIrf::GammaIrf(bool shape_greater_than_one)
    : shape_greater_than_one_(shape_greater_than_one) {}

std::string GammaIrf::name() const {
    return shape_greater_than_one_ ? "gamma_kgt1" : "gamma";
}

std::vector<std::string> GammaIrf::parameter_names() const {
    return {"shape", "rate"};
}

std::vector<double> GammaIrf::default_values() const {
    return {2.0, 2.0};
}

std::vector<std::shared_ptr<const ParameterTransform>> GammaIrf::transforms() const {
    if (shape_greater_than_one_) {
        return {make_bounded_softplus_transform(1.0), make_softplus_transform()};
    }
    return {make_softplus_transform(), make_softplus_transform()};
}

double GammaIrf::log_evaluate(const std::vector<double>& params, double lag, std::vector<double>* d_log) const {
    check_arity(params);
    const double t = std::max(lag, kMinLag);
    const auto g = gamma_log_density(params[0], params[1], t);
    if (d_log) {
        *d_log = {g.d_shape, g.d_rate};
    }
    return g.value;
}

std::string ShiftedGammaIrf::name() const {
    return "shifted_gamma";
}

std::vector<std::string> ShiftedGammaIrf::parameter_names() const {
    return {"shape", "rate", "shift"};
}

std::vector<double> ShiftedGammaIrf::default_values() const {
    return {2.0, 2.0, 0.1};
}

std::vector<std::shared_ptr<const ParameterTransform>> ShiftedGammaIrf::transforms() const {
    return {make_softplus_transform(), make_softplus_transform(), make_softplus_transform()};
}

double ShiftedGammaIrf::log_evaluate(const std::vector<double>& params, double lag, std::vector<double>* d_log) const {
    check_arity(params);
    const double t = std::max(lag + params[2], kMinLag);
    const auto g = gamma_log_density(params[0], params[1], t);
    if (d_log) {
        *d_log = {g.d_shape, g.d_rate, g.d_t};
    }
    return g.value;
}

std::string DoubleGammaIrf::name() const {
    return "double_gamma";
}

std::vector<std::string> DoubleGammaIrf::parameter_names() const {
    return {"shape1", "rate1", "shape2", "rate2", "weight"};
}

std::vector<double> DoubleGammaIrf::default_values() const {
    return {6.0, 1.0, 16.0, 1.0, 5.0 / 6.0};
}

std::vector<std::shared_ptr<const ParameterTransform>> DoubleGammaIrf::transforms() const {
    return {make_softplus_transform(), make_softplus_transform(), make_softplus_transform(),
            make_softplus_transform(), make_logistic_transform(0.0, 1.0)};
}

double DoubleGammaIrf::log_evaluate(const std::vector<double>& params, double lag, std::vector<double>* d_log) const {
    check_arity(params);
    const double t = std::max(lag, kMinLag);
    const double weight = params[4];
    const auto g1 = gamma_log_density(params[0], params[1], t);
    const auto g2 = gamma_log_density(params[2], params[3], t);
    const double l1 = std::log(weight) + g1.value;
    const double l2 = std::log1p(-weight) + g2.value;
    const double total = log_sum_exp(l1, l2);
    if (d_log && total == -std::numeric_limits<double>::infinity()) {
        d_log->assign(5, 0.0);
    } else if (d_log) {
        const double r1 = std::exp(l1 - total);
        const double r2 = std::exp(l2 - total);
        *d_log = {r1 * g1.d_shape, r1 * g1.d_rate, r2 * g2.d_shape, r2 * g2.d_rate,
                  r1 / weight - r2 / (1.0 - weight)};
    }
    return total;
}

}  // namespace libcdr
