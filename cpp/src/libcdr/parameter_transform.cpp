#include "libcdr/parameter_transform.hpp"

#include <cmath>
#include <memory>
#include <stdexcept>

namespace libcdr {

namespace {
constexpr double kSoftplusLinearThreshold = 30.0;
}

double softplus(double x) noexcept {
    if (x > kSoftplusLinearThreshold) {
        return x;
    }
    return std::log1p(std::exp(x));
}

double inverse_softplus(double y) {
    if (!(y > 0.0)) {
        throw std::domain_error("softplus inverse input must be positive");
    }
    if (y > kSoftplusLinearThreshold) {
        return y + std::log1p(-std::exp(-y));
    }
    return std::log(std::expm1(y));
}

double sigmoid(double x) noexcept {
    if (x >= 0.0) {
        return 1.0 / (1.0 + std::exp(-x));
    }
    const double e = std::exp(x);
    return e / (1.0 + e);
}

double IdentityTransform::to_constrained(double unconstrained) const {
    return unconstrained;
}

double IdentityTransform::to_unconstrained(double constrained) const {
    return constrained;
}

bool IdentityTransform::is_valid_constrained(double constrained) const noexcept {
    return std::isfinite(constrained);
}

double IdentityTransform::constrained_derivative(double /*unconstrained*/) const noexcept {
    return 1.0;
}

double SoftplusTransform::to_constrained(double unconstrained) const {
    return softplus(unconstrained);
}

double SoftplusTransform::to_unconstrained(double constrained) const {
    return inverse_softplus(constrained);
}

bool SoftplusTransform::is_valid_constrained(double constrained) const noexcept {
    return constrained > 0.0 && std::isfinite(constrained);
}

double SoftplusTransform::constrained_derivative(double unconstrained) const noexcept {
    return sigmoid(unconstrained);
}

BoundedSoftplusTransform::BoundedSoftplusTransform(double min_value)
    : min_value_(min_value) {
    if (!std::isfinite(min_value_)) {
        throw std::invalid_argument("bounded softplus transform requires a finite minimum");
    }
}

double BoundedSoftplusTransform::to_constrained(double unconstrained) const {
    return min_value_ + softplus(unconstrained);
}

double BoundedSoftplusTransform::to_unconstrained(double constrained) const {
    if (constrained <= min_value_) {
        throw std::domain_error("bounded softplus transform input must be greater than minimum");
    }
    return inverse_softplus(constrained - min_value_);
}

bool BoundedSoftplusTransform::is_valid_constrained(double constrained) const noexcept {
    return constrained > min_value_ && std::isfinite(constrained);
}

double BoundedSoftplusTransform::constrained_derivative(double unconstrained) const noexcept {
    return sigmoid(unconstrained);
}

double BoundedSoftplusTransform::min_value() const noexcept {
    return min_value_;
}

LogisticTransform::LogisticTransform(double lower_bound, double upper_bound)
    : lower_(lower_bound), upper_(upper_bound) {
    if (!(upper_ > lower_)) {
        throw std::invalid_argument("logistic transform requires upper > lower");
    }
}

double LogisticTransform::to_constrained(double unconstrained) const {
    return lower_ + (upper_ - lower_) * sigmoid(unconstrained);
}

double LogisticTransform::to_unconstrained(double constrained) const {
    if (!is_valid_constrained(constrained)) {
        throw std::domain_error("logistic transform input outside open interval");
    }
    const double scaled = (constrained - lower_) / (upper_ - lower_);
    return std::log(scaled / (1.0 - scaled));
}

bool LogisticTransform::is_valid_constrained(double constrained) const noexcept {
    return (constrained > lower_) && (constrained < upper_);
}

double LogisticTransform::constrained_derivative(double unconstrained) const noexcept {
    const double logistic = sigmoid(unconstrained);
    return (upper_ - lower_) * logistic * (1.0 - logistic);
}

double LogisticTransform::lower() const noexcept {
    return lower_;
}

double LogisticTransform::upper() const noexcept {
    return upper_;
}

std::shared_ptr<const ParameterTransform> make_identity_transform() {
    static const std::shared_ptr<const ParameterTransform> kIdentity = std::make_shared<IdentityTransform>();
    return kIdentity;
}

std::shared_ptr<const ParameterTransform> make_softplus_transform() {
    static const std::shared_ptr<const ParameterTransform> kSoftplus = std::make_shared<SoftplusTransform>();
    return kSoftplus;
}

std::shared_ptr<const ParameterTransform> make_bounded_softplus_transform(double min_value) {
    return std::make_shared<BoundedSoftplusTransform>(min_value);
}

std::shared_ptr<const ParameterTransform> make_logistic_transform(double lower_bound, double upper_bound) {
    return std::make_shared<LogisticTransform>(lower_bound, upper_bound);
}

}  // namespace libcdr
