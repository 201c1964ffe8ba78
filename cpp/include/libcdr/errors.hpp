#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace libcdr {

// Unresolvable predictor or grouping reference, invalid kernel family.
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& message);
};

// Response references a series without events, or a grouping level
// absent from the coefficient schema.
class DataAlignmentError : public std::invalid_argument {
public:
    explicit DataAlignmentError(const std::string& message);
};

class NumericInstabilityError : public std::runtime_error {
public:
    explicit NumericInstabilityError(const std::string& message);

    NumericInstabilityError(const std::string& message,
                            std::size_t step,
                            std::vector<double> parameter_snapshot);

    [[nodiscard]] bool has_step() const noexcept;

    [[nodiscard]] std::size_t step() const noexcept;

    [[nodiscard]] const std::vector<double>& parameter_snapshot() const noexcept;

private:
    bool has_step_{false};
    std::size_t step_{0};
    std::vector<double> parameter_snapshot_;
};

class CheckpointVersionError : public std::runtime_error {
public:
    explicit CheckpointVersionError(const std::string& message);
};

// Not thrown: attached to a training result when the step budget ran out
// before the configured convergence criterion was met.
struct ConvergenceFailure {
    std::string message;
    std::size_t steps{0};
    double final_loss{0.0};
};

// Throws NumericInstabilityError naming `what` if `value` is NaN or infinite.
void require_finite(double value, const std::string& what);

void require_finite(const std::vector<double>& values, const std::string& what);

}  // namespace libcdr
