#include "libcdr/parameter.hpp"

#include "libcdr/parameter_transform.hpp"

#include <stdexcept>
#include <utility>

namespace libcdr {

const char* to_string(ParameterGroup group) noexcept {
    switch (group) {
        case ParameterGroup::Intercept:
            return "intercept";
        case ParameterGroup::Coefficient:
            return "coefficient";
        case ParameterGroup::Irf:
            return "irf";
        case ParameterGroup::NoiseScale:
            return "noise_scale";
        case ParameterGroup::RandomIntercept:
            return "random_intercept";
        case ParameterGroup::RandomCoefficient:
            return "random_coefficient";
        case ParameterGroup::RandomIrf:
            return "random_irf";
        case ParameterGroup::PosteriorScale:
            return "posterior_scale";
    }
    return "unknown";
}

bool is_random_effect(ParameterGroup group) noexcept {
    return group == ParameterGroup::RandomIntercept || group == ParameterGroup::RandomCoefficient ||
           group == ParameterGroup::RandomIrf;
}

Parameter::Parameter(std::string name, double value, ParameterGroup group)
    : Parameter(std::move(name), value, group, make_identity_transform()) {}

Parameter::Parameter(std::string name,
                     double value,
                     ParameterGroup group,
                     std::shared_ptr<const ParameterTransform> transform)
    : name_(std::move(name)), group_(group), transform_(std::move(transform)) {
    if (name_.empty()) {
        throw std::invalid_argument("parameter name must be non-empty");
    }
    if (!transform_) {
        throw std::invalid_argument("parameter transform must be non-null");
    }
    if (!transform_->is_valid_constrained(value)) {
        throw std::out_of_range("initial value of " + name_ + " violates transform constraints");
    }
    unconstrained_value_ = transform_->to_unconstrained(value);
}

const std::string& Parameter::name() const noexcept {
    return name_;
}

ParameterGroup Parameter::group() const noexcept {
    return group_;
}

double Parameter::value() const {
    return transform_->to_constrained(unconstrained_value_);
}

void Parameter::set_value(double value) {
    if (!transform_->is_valid_constrained(value)) {
        throw std::out_of_range("value of " + name_ + " violates transform constraints");
    }
    unconstrained_value_ = transform_->to_unconstrained(value);
}

double Parameter::unconstrained_value() const noexcept {
    return unconstrained_value_;
}

void Parameter::set_unconstrained_value(double value) {
    unconstrained_value_ = value;
}

std::shared_ptr<const ParameterTransform> Parameter::transform() const noexcept {
    return transform_;
}

}  // namespace libcdr
