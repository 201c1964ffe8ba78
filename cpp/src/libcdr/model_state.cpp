#include "libcdr/model_state.hpp"

#include "libcdr/errors.hpp"
#include "libcdr/parameter_transform.hpp"

#include <stdexcept>
#include <utility>

namespace libcdr {

ModelState::ModelState(std::shared_ptr<const ParameterLayout> layout, std::vector<double> parameters)
    : layout_(std::move(layout)), parameters_(std::move(parameters)) {
    if (!layout_) {
        throw std::invalid_argument("model state requires a layout");
    }
    if (parameters_.size() != layout_->size()) {
        throw std::invalid_argument("model state parameter vector does not match its layout");
    }
}

const ParameterLayout& ModelState::layout() const noexcept {
    return *layout_;
}

std::shared_ptr<const ParameterLayout> ModelState::shared_layout() const noexcept {
    return layout_;
}

const std::vector<double>& ModelState::parameters() const noexcept {
    return parameters_;
}

std::vector<double> ModelState::point_parameters() const {
    return std::vector<double>(parameters_.begin(),
                               parameters_.begin() + static_cast<std::ptrdiff_t>(layout_->point_size()));
}

std::vector<double> ModelState::posterior_sds() const {
    std::vector<double> out;
    if (!layout_->variational()) {
        return out;
    }
    const std::size_t n = layout_->point_size();
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        out.push_back(softplus(parameters_[n + i]));
    }
    return out;
}

std::size_t ModelState::predictor_position(const std::string& predictor) const {
    const auto& predictors = layout_->predictors();
    for (std::size_t p = 0; p < predictors.size(); ++p) {
        if (predictors[p].name == predictor) {
            return p;
        }
    }
    throw ConfigurationError("unknown predictor: " + predictor);
}

double ModelState::coefficient(const std::string& predictor) const {
    return parameters_[layout_->predictors()[predictor_position(predictor)].coefficient];
}

std::vector<double> ModelState::irf_parameters(const std::string& predictor) const {
    const std::size_t p = predictor_position(predictor);
    const std::size_t n_params = layout_->predictors()[p].kernel->parameter_count();
    std::vector<double> out(n_params);
    for (std::size_t k = 0; k < n_params; ++k) {
        out[k] = layout_->irf_parameter(parameters_, p, k);
    }
    return out;
}

double ModelState::intercept() const {
    if (layout_->intercept() == ParameterLayout::npos) {
        return 0.0;
    }
    return parameters_[layout_->intercept()];
}

double ModelState::noise_sd() const {
    return layout_->noise_sd(parameters_);
}

std::unordered_map<std::string, double> ModelState::constrained_values() const {
    const auto& catalog = layout_->catalog();
    const auto constrained = catalog.constrain(parameters_);
    std::unordered_map<std::string, double> out;
    for (std::size_t i = 0; i < catalog.size(); ++i) {
        out.emplace(catalog.names()[i], constrained[i]);
    }
    return out;
}

}  // namespace libcdr
