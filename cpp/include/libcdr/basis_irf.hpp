#pragma once

#include "libcdr/irf_kernel.hpp"

namespace libcdr {

// Nonparametric IRF: one non-negative height per knot, linearly
// interpolated between knots, flat before the first knot and zero after
// the last.
class BasisIrf final : public IrfKernel {
public:
    explicit BasisIrf(std::vector<double> knots);

    [[nodiscard]] std::string name() const override;

    [[nodiscard]] std::vector<std::string> parameter_names() const override;

    [[nodiscard]] std::vector<double> default_values() const override;

    [[nodiscard]] std::vector<std::shared_ptr<const ParameterTransform>> transforms() const override;

    [[nodiscard]] double log_evaluate(const std::vector<double>& params,
                                      double lag,
                                      std::vector<double>* d_log = nullptr) const override;

    [[nodiscard]] KernelEvaluation evaluate(const std::vector<double>& params,
                                            double lag,
                                            bool with_gradient = true) const override;

    [[nodiscard]] const std::vector<double>& knots() const noexcept;

private:
    // Value and d value / d heights.
    double interpolate(const std::vector<double>& heights, double lag, std::vector<double>* d_heights) const;

    std::vector<double> knots_;
};

}  // namespace libcdr
