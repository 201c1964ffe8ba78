#pragma once

#include <cstddef>
#include <limits>
#include <memory>
#include <string>
#include <vector>

namespace libcdr {

class ParameterTransform;

struct KernelEvaluation {
    double weight{0.0};
    double log_weight{-std::numeric_limits<double>::infinity()};
    // d weight / d constrained parameter, one entry per kernel parameter.
    std::vector<double> gradient{};
};

// Impulse response function family. Stateless; parameters are passed in
// already constrained to the family domain. Lags are assumed non-negative,
// the history assembler never hands a negative lag to a kernel.
class IrfKernel {
public:
    virtual ~IrfKernel() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    [[nodiscard]] virtual std::vector<std::string> parameter_names() const = 0;

    [[nodiscard]] virtual std::vector<double> default_values() const = 0;

    [[nodiscard]] virtual std::vector<std::shared_ptr<const ParameterTransform>> transforms() const = 0;

    // Log weight; when `d_log` is non-null it receives d log weight / d params.
    [[nodiscard]] virtual double log_evaluate(const std::vector<double>& params,
                                              double lag,
                                              std::vector<double>* d_log = nullptr) const = 0;

    // Throws NumericInstabilityError on a non-finite weight or gradient.
    [[nodiscard]] virtual KernelEvaluation evaluate(const std::vector<double>& params,
                                                    double lag,
                                                    bool with_gradient = true) const;

    [[nodiscard]] std::size_t parameter_count() const;

    // Maps unconstrained values through the family transforms. Throws
    // NumericInstabilityError if a result is non-finite or outside the domain.
    [[nodiscard]] std::vector<double> constrain(const std::vector<double>& unconstrained) const;

    [[nodiscard]] std::vector<double> constrained_derivatives(const std::vector<double>& unconstrained) const;

    [[nodiscard]] bool is_valid(const std::vector<double>& params) const;

protected:
    void check_arity(const std::vector<double>& params) const;
};

}  // namespace libcdr
