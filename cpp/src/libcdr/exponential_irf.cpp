#include "libcdr/exponential_irf.hpp"

#include "libcdr/parameter_transform.hpp"

#include <cmath>

namespace libcdr {

std::string ExponentialIrf::name() const {
    return "exponential";
}

std::vector<std::string> ExponentialIrf::parameter_names() const {
    return {"rate"};
}

std::vector<double> ExponentialIrf::default_values() const {
    return {1.0};
}

std::vector<std::shared_ptr<const ParameterTransform>> ExponentialIrf::transforms() const {
    return {make_softplus_transform()};
}

double ExponentialIrf::log_evaluate(const std::vector<double>& params, double lag, std::vector<double>* d_log) const {
    check_arity(params);
    const double rate = params[0];
    if (d_log) {
        d_log->assign(1, 1.0 / rate - lag);
    }
    return std::log(rate) - rate * lag;
}

}  // namespace libcdr
