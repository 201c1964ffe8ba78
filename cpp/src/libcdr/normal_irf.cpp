#include "libcdr/normal_irf.hpp"

#include "libcdr/parameter_transform.hpp"

#include <cmath>
#include <numbers>

namespace libcdr {

namespace {
const double kLogSqrtTwoPi = 0.5 * std::log(2.0 * std::numbers::pi_v<double>);
}

std::string NormalIrf::name() const {
    return "normal";
}

std::vector<std::string> NormalIrf::parameter_names() const {
    return {"mean", "sd"};
}

std::vector<double> NormalIrf::default_values() const {
    return {0.0, 1.0};
}

std::vector<std::shared_ptr<const ParameterTransform>> NormalIrf::transforms() const {
    return {make_identity_transform(), make_softplus_transform()};
}

double NormalIrf::log_evaluate(const std::vector<double>& params, double lag, std::vector<double>* d_log) const {
    check_arity(params);
    const double mean = params[0];
    const double sd = params[1];
    const double z = (lag - mean) / sd;
    if (d_log) {
        *d_log = {z / sd, (z * z - 1.0) / sd};
    }
    return -kLogSqrtTwoPi - std::log(sd) - 0.5 * z * z;
}

}  // namespace libcdr
