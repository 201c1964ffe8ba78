#pragma once

#include "libcdr/irf_kernel.hpp"

namespace libcdr {

class NormalIrf final : public IrfKernel {
public:
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] std::vector<std::string> parameter_names() const override;

    [[nodiscard]] std::vector<double> default_values() const override;

    [[nodiscard]] std::vector<std::shared_ptr<const ParameterTransform>> transforms() const override;

    [[nodiscard]] double log_evaluate(const std::vector<double>& params,
                                      double lag,
                                      std::vector<double>* d_log = nullptr) const override;
};

}  // namespace libcdr
