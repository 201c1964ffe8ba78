#include "libcdr/basis_irf.hpp"

#include "libcdr/errors.hpp"
#include "libcdr/parameter_transform.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace libcdr {

BasisIrf::BasisIrf(std::vector<double> knots)
    : knots_(std::move(knots)) {
    if (knots_.size() < 2) {
        throw ConfigurationError("basis IRF requires at least two knots");
    }
    if (knots_.front() < 0.0) {
        throw ConfigurationError("basis IRF knots must be non-negative");
    }
    for (std::size_t k = 1; k < knots_.size(); ++k) {
        if (!(knots_[k] > knots_[k - 1])) {
            throw ConfigurationError("basis IRF knots must be strictly increasing");
        }
    }
}

std::string BasisIrf::name() const {
    return "basis";
}

std::vector<std::string> BasisIrf::parameter_names() const {
    std::vector<std::string> names;
    names.reserve(knots_.size());
    for (std::size_t k = 0; k < knots_.size(); ++k) {
        names.push_back("height" + std::to_string(k));
    }
    return names;
}

std::vector<double> BasisIrf::default_values() const {
    return std::vector<double>(knots_.size(), 1.0);
}

std::vector<std::shared_ptr<const ParameterTransform>> BasisIrf::transforms() const {
    return std::vector<std::shared_ptr<const ParameterTransform>>(knots_.size(), make_softplus_transform());
}

double BasisIrf::interpolate(const std::vector<double>& heights, double lag, std::vector<double>* d_heights) const {
    if (d_heights) {
        d_heights->assign(heights.size(), 0.0);
    }
    if (lag > knots_.back()) {
        return 0.0;
    }
    if (lag <= knots_.front()) {
        if (d_heights) {
            (*d_heights)[0] = 1.0;
        }
        return heights[0];
    }
    const auto upper = std::upper_bound(knots_.begin(), knots_.end(), lag);
    std::size_t hi = static_cast<std::size_t>(upper - knots_.begin());
    if (hi >= knots_.size()) {
        hi = knots_.size() - 1;
    }
    const std::size_t lo = hi - 1;
    const double a = (lag - knots_[lo]) / (knots_[hi] - knots_[lo]);
    if (d_heights) {
        (*d_heights)[lo] = 1.0 - a;
        (*d_heights)[hi] = a;
    }
    return (1.0 - a) * heights[lo] + a * heights[hi];
}

double BasisIrf::log_evaluate(const std::vector<double>& params, double lag, std::vector<double>* d_log) const {
    check_arity(params);
    std::vector<double> d_heights;
    const double value = interpolate(params, lag, &d_heights);
    if (d_log) {
        d_log->assign(params.size(), 0.0);
        if (value > 0.0) {
            for (std::size_t k = 0; k < params.size(); ++k) {
                (*d_log)[k] = d_heights[k] / value;
            }
        }
    }
    if (value <= 0.0) {
        return -std::numeric_limits<double>::infinity();
    }
    return std::log(value);
}

KernelEvaluation BasisIrf::evaluate(const std::vector<double>& params, double lag, bool with_gradient) const {
    check_arity(params);
    KernelEvaluation eval;
    std::vector<double> d_heights;
    eval.weight = interpolate(params, lag, with_gradient ? &d_heights : nullptr);
    require_finite(eval.weight, "basis kernel weight");
    eval.log_weight = eval.weight > 0.0 ? std::log(eval.weight) : -std::numeric_limits<double>::infinity();
    if (with_gradient) {
        eval.gradient = std::move(d_heights);
    }
    return eval;
}

const std::vector<double>& BasisIrf::knots() const noexcept {
    return knots_;
}

}  // namespace libcdr
