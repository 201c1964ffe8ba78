#include "libcdr/irf_kernel_factory.hpp"

#include "libcdr/basis_irf.hpp"
#include "libcdr/errors.hpp"
#include "libcdr/exponential_irf.hpp"
#include "libcdr/gamma_irf.hpp"
#include "libcdr/normal_irf.hpp"

namespace libcdr {

std::shared_ptr<const IrfKernel> IrfKernelFactory::create(const std::string& family,
                                                           const std::vector<double>& knots) {
    if (family == "exponential") {
        return std::make_shared<ExponentialIrf>();
    }
    if (family == "gamma") {
        return std::make_shared<GammaIrf>(false);
    }
    if (family == "gamma_kgt1") {
        return std::make_shared<GammaIrf>(true);
    }
    if (family == "shifted_gamma") {
        return std::make_shared<ShiftedGammaIrf>();
    }
    if (family == "normal") {
        return std::make_shared<NormalIrf>();
    }
    if (family == "double_gamma") {
        return std::make_shared<DoubleGammaIrf>();
    }
    if (family == "basis") {
        return std::make_shared<BasisIrf>(knots);
    }
    throw ConfigurationError("Unknown IRF family: " + family);
}

const std::vector<std::string>& IrfKernelFactory::families() {
    static const std::vector<std::string> kFamilies = {
        "exponential", "gamma", "gamma_kgt1", "shifted_gamma", "normal", "double_gamma", "basis"};
    return kFamilies;
}

}  // namespace libcdr
