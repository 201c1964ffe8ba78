#pragma once

#include "libcdr/irf_kernel.hpp"

namespace libcdr {

// Gamma density over the lag. With `shape_greater_than_one` the shape is
// kept above 1 so the kernel is finite (and zero) at lag 0.
class GammaIrf final : public IrfKernel {
public:
    explicit GammaIrf(bool shape_greater_than_one = false);

    [[nodiscard]] std::string name() const override;

    [[nodiscard]] std::vector<std::string> parameter_names() const override;

    [[nodiscard]] std::vector<double> default_values() const override;

    [[nodiscard]] std::vector<std::shared_ptr<const ParameterTransform>> transforms() const override;

    [[nodiscard]] double log_evaluate(const std::vector<double>& params,
                                      double lag,
                                      std::vector<double>* d_log = nullptr) const override;

private:
    bool shape_greater_than_one_;
};

// Gamma density evaluated at lag + shift, shift > 0.
class ShiftedGammaIrf final : public IrfKernel {
public:
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] std::vector<std::string> parameter_names() const override;

    [[nodiscard]] std::vector<double> default_values() const override;

    [[nodiscard]] std::vector<std::shared_ptr<const ParameterTransform>> transforms() const override;

    [[nodiscard]] double log_evaluate(const std::vector<double>& params,
                                      double lag,
                                      std::vector<double>* d_log = nullptr) const override;
};

// Two-component gamma mixture: weight * G(shape1, rate1) + (1 - weight) * G(shape2, rate2).
class DoubleGammaIrf final : public IrfKernel {
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
