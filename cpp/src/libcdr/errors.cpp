#include "libcdr/errors.hpp"

#include <cmath>
#include <utility>

namespace libcdr {

ConfigurationError::ConfigurationError(const std::string& message)
    : std::invalid_argument(message) {}

DataAlignmentError::DataAlignmentError(const std::string& message)
    : std::invalid_argument(message) {}

NumericInstabilityError::NumericInstabilityError(const std::string& message)
    : std::runtime_error(message) {}

NumericInstabilityError::NumericInstabilityError(const std::string& message,
                                                 std::size_t step,
                                                 std::vector<double> parameter_snapshot)
    : std::runtime_error(message + " (step " + std::to_string(step) + ")"),
      has_step_(true),
      step_(step),
      parameter_snapshot_(std::move(parameter_snapshot)) {}

bool NumericInstabilityError::has_step() const noexcept {
    return has_step_;
}

std::size_t NumericInstabilityError::step() const noexcept {
    return step_;
}

const std::vector<double>& NumericInstabilityError::parameter_snapshot() const noexcept {
    return parameter_snapshot_;
}

CheckpointVersionError::CheckpointVersionError(const std::string& message)
    : std::runtime_error(message) {}

void require_finite(double value, const std::string& what) {
    if (!std::isfinite(value)) {
        throw NumericInstabilityError("non-finite " + what + ": " + std::to_string(value));
    }
}

void require_finite(const std::vector<double>& values, const std::string& what) {
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (!std::isfinite(values[i])) {
            throw NumericInstabilityError("non-finite " + what + " at index " + std::to_string(i));
        }
    }
}

}  // namespace libcdr
