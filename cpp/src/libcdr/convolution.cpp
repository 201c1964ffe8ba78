#include "libcdr/convolution.hpp"

#include "libcdr/errors.hpp"

#include <stdexcept>

namespace libcdr {

ConvolutionEngine::ConvolutionEngine(const ParameterLayout& layout)
    : layout_(layout) {}

double ConvolutionEngine::convolve(const IrfKernel& kernel,
                                   const std::vector<double>& params,
                                   const WindowRow& lags,
                                   const WindowRow& values,
                                   const WindowRow& mask,
                                   bool normalized,
                                   std::vector<double>* d_params) {
    if (lags.size() != values.size() || lags.size() != mask.size()) {
        throw std::invalid_argument("window rows must have equal width");
    }
    const std::size_t n_params = params.size();
    const bool with_gradient = d_params != nullptr;

    long double weighted = 0.0L;
    long double total_weight = 0.0L;
    std::vector<long double> d_weighted(with_gradient ? n_params : 0, 0.0L);
    std::vector<long double> d_total(with_gradient ? n_params : 0, 0.0L);

    for (Eigen::Index j = 0; j < lags.size(); ++j) {
        if (mask(j) == 0.0) {
            continue;
        }
        const auto eval = kernel.evaluate(params, lags(j), with_gradient);
        const long double value = values(j);
        weighted += static_cast<long double>(eval.weight) * value;
        total_weight += eval.weight;
        if (with_gradient) {
            for (std::size_t k = 0; k < n_params; ++k) {
                d_weighted[k] += static_cast<long double>(eval.gradient[k]) * value;
                d_total[k] += eval.gradient[k];
            }
        }
    }

    if (with_gradient) {
        d_params->assign(n_params, 0.0);
    }
    if (!normalized) {
        if (with_gradient) {
            for (std::size_t k = 0; k < n_params; ++k) {
                (*d_params)[k] = static_cast<double>(d_weighted[k]);
            }
        }
        return static_cast<double>(weighted);
    }

    if (total_weight == 0.0L) {
        return 0.0;
    }
    const long double result = weighted / total_weight;
    if (with_gradient) {
        for (std::size_t k = 0; k < n_params; ++k) {
            (*d_params)[k] = static_cast<double>((d_weighted[k] - result * d_total[k]) / total_weight);
        }
    }
    return static_cast<double>(result);
}

std::vector<double> ConvolutionEngine::response_irf_parameters(const std::vector<double>& centred,
                                                               std::size_t predictor,
                                                               const LevelAssignment& levels,
                                                               std::size_t response) const {
    const auto& slots = layout_.predictors().at(predictor);
    const std::size_t n_params = slots.kernel->parameter_count();
    std::vector<double> params(n_params);
    for (std::size_t k = 0; k < n_params; ++k) {
        params[k] = centred[slots.irf_offset + k];
    }
    for (const auto& block : slots.random_irf) {
        const std::size_t level = levels.level_slots.at(block.factor).at(response);
        if (level == ParameterLayout::npos) {
            continue;
        }
        for (std::size_t k = 0; k < n_params; ++k) {
            params[k] += centred[block.slot(level, k)];
        }
    }
    return params;
}

ConvolutionResult ConvolutionEngine::convolve_batch(const HistoryBatch& batch,
                                                    const std::vector<double>& centred,
                                                    const LevelAssignment& levels,
                                                    bool with_gradient) const {
    const auto& predictors = layout_.predictors();
    if (batch.values.size() != predictors.size()) {
        throw std::invalid_argument("history batch does not carry one value matrix per predictor");
    }
    const auto rows = static_cast<Eigen::Index>(batch.batch_size());

    ConvolutionResult result;
    result.features = Eigen::MatrixXd::Zero(rows, static_cast<Eigen::Index>(predictors.size()));
    if (with_gradient) {
        result.d_features.reserve(predictors.size());
    }

    std::vector<double> d_constrained;
    for (std::size_t p = 0; p < predictors.size(); ++p) {
        const auto& slots = predictors[p];
        const auto& kernel = *slots.kernel;
        const std::size_t n_params = kernel.parameter_count();
        if (with_gradient) {
            result.d_features.push_back(Eigen::MatrixXd::Zero(rows, static_cast<Eigen::Index>(n_params)));
        }

        const bool shared = slots.random_irf.empty();
        std::vector<double> unconstrained;
        std::vector<double> constrained;
        std::vector<double> chain;
        if (shared) {
            unconstrained = response_irf_parameters(centred, p, levels, 0);
            constrained = kernel.constrain(unconstrained);
            chain = kernel.constrained_derivatives(unconstrained);
        }

        for (Eigen::Index b = 0; b < rows; ++b) {
            if (!shared) {
                unconstrained = response_irf_parameters(centred, p, levels, batch.responses[static_cast<std::size_t>(b)]);
                constrained = kernel.constrain(unconstrained);
                chain = kernel.constrained_derivatives(unconstrained);
            }
            const double feature = convolve(kernel, constrained, batch.lags.row(b), batch.values[p].row(b),
                                            batch.mask.row(b), slots.normalized,
                                            with_gradient ? &d_constrained : nullptr);
            result.features(b, static_cast<Eigen::Index>(p)) = feature;
            if (with_gradient) {
                for (std::size_t k = 0; k < n_params; ++k) {
                    result.d_features[p](b, static_cast<Eigen::Index>(k)) = d_constrained[k] * chain[k];
                }
            }
        }
    }
    return result;
}

}  // namespace libcdr
