#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "libcdr/parameter_layout.hpp"

namespace libcdr {

// Read-only snapshot of a fitted model: the layout plus one flat parameter
// vector. Handed from training to evaluation.
class ModelState {
public:
    ModelState(std::shared_ptr<const ParameterLayout> layout, std::vector<double> parameters);

    [[nodiscard]] const ParameterLayout& layout() const noexcept;

    [[nodiscard]] std::shared_ptr<const ParameterLayout> shared_layout() const noexcept;

    [[nodiscard]] const std::vector<double>& parameters() const noexcept;

    // Model parameters; posterior locations in variational mode.
    [[nodiscard]] std::vector<double> point_parameters() const;

    // Posterior standard deviations on the unconstrained scale; empty for
    // point estimates.
    [[nodiscard]] std::vector<double> posterior_sds() const;

    [[nodiscard]] double coefficient(const std::string& predictor) const;

    [[nodiscard]] std::vector<double> irf_parameters(const std::string& predictor) const;

    [[nodiscard]] double intercept() const;

    [[nodiscard]] double noise_sd() const;

    // Constrained value of every model parameter by name.
    [[nodiscard]] std::unordered_map<std::string, double> constrained_values() const;

private:
    [[nodiscard]] std::size_t predictor_position(const std::string& predictor) const;

    std::shared_ptr<const ParameterLayout> layout_;
    std::vector<double> parameters_;
};

}  // namespace libcdr
