#include "libcdr/irf_kernel.hpp"

#include "libcdr/errors.hpp"
#include "libcdr/parameter_transform.hpp"

#include <cmath>
#include <stdexcept>

namespace libcdr {

KernelEvaluation IrfKernel::evaluate(const std::vector<double>& params, double lag, bool with_gradient) const {
    check_arity(params);
    KernelEvaluation eval;
    std::vector<double> d_log;
    eval.log_weight = log_evaluate(params, lag, with_gradient ? &d_log : nullptr);
    if (std::isnan(eval.log_weight) || eval.log_weight == std::numeric_limits<double>::infinity()) {
        throw NumericInstabilityError(name() + " kernel produced a non-finite log weight at lag " + std::to_string(lag));
    }
    eval.weight = std::exp(eval.log_weight);
    require_finite(eval.weight, name() + " kernel weight");
    if (with_gradient) {
        eval.gradient.assign(d_log.size(), 0.0);
        if (eval.weight > 0.0) {
            for (std::size_t k = 0; k < d_log.size(); ++k) {
                eval.gradient[k] = eval.weight * d_log[k];
            }
        }
        require_finite(eval.gradient, name() + " kernel gradient");
    }
    return eval;
}

std::size_t IrfKernel::parameter_count() const {
    return parameter_names().size();
}

std::vector<double> IrfKernel::constrain(const std::vector<double>& unconstrained) const {
    check_arity(unconstrained);
    const auto family_transforms = transforms();
    std::vector<double> constrained(unconstrained.size());
    for (std::size_t k = 0; k < unconstrained.size(); ++k) {
        constrained[k] = family_transforms[k]->to_constrained(unconstrained[k]);
        if (!std::isfinite(constrained[k]) || !family_transforms[k]->is_valid_constrained(constrained[k])) {
            throw NumericInstabilityError(name() + " parameter " + parameter_names()[k] +
                                          " left its valid domain (unconstrained value " +
                                          std::to_string(unconstrained[k]) + ")");
        }
    }
    return constrained;
}

std::vector<double> IrfKernel::constrained_derivatives(const std::vector<double>& unconstrained) const {
    check_arity(unconstrained);
    const auto family_transforms = transforms();
    std::vector<double> derivatives(unconstrained.size());
    for (std::size_t k = 0; k < unconstrained.size(); ++k) {
        derivatives[k] = family_transforms[k]->constrained_derivative(unconstrained[k]);
    }
    return derivatives;
}

bool IrfKernel::is_valid(const std::vector<double>& params) const {
    if (params.size() != parameter_count()) {
        return false;
    }
    const auto family_transforms = transforms();
    for (std::size_t k = 0; k < params.size(); ++k) {
        if (!family_transforms[k]->is_valid_constrained(params[k])) {
            return false;
        }
    }
    return true;
}

void IrfKernel::check_arity(const std::vector<double>& params) const {
    if (params.size() != parameter_count()) {
        throw std::invalid_argument(name() + " kernel expects " + std::to_string(parameter_count()) +
                                    " parameters, got " + std::to_string(params.size()));
    }
}

}  // namespace libcdr
