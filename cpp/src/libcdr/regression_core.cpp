#include "libcdr/regression_core.hpp"

#include "libcdr/errors.hpp"
#include "libcdr/parameter_transform.hpp"

#include <cmath>
#include <numbers>
#include <stdexcept>
#include <utility>

namespace libcdr {

namespace {
const double kLogTwoPi = std::log(2.0 * std::numbers::pi_v<double>);
}

BatchInputs make_batch_inputs(HistoryAssembler& assembler,
                              const ResponseTable& responses,
                              const std::vector<std::size_t>& indices,
                              const ParameterLayout& layout,
                              const LevelAssignment& levels) {
    const auto& scaling = layout.scaling();
    std::vector<double> observed;
    observed.reserve(indices.size());
    for (std::size_t index : indices) {
        if (index >= responses.observed.size()) {
            throw std::out_of_range("response index out of range: " + std::to_string(index));
        }
        observed.push_back((responses.observed[index] - scaling.mean) / scaling.sd);
    }
    return BatchInputs{assembler.assemble(responses, indices, layout.predictor_columns()), std::move(observed), levels};
}

RegressionCore::RegressionCore(const ParameterLayout& layout)
    : layout_(layout), engine_(layout) {}

const ParameterLayout& RegressionCore::layout() const noexcept {
    return layout_;
}

ForwardPass RegressionCore::forward(const std::vector<double>& centred,
                                    const BatchInputs& batch,
                                    bool with_gradient) const {
    const auto& predictors = layout_.predictors();
    const std::size_t rows = batch.history.batch_size();

    ForwardPass pass;
    pass.convolution = engine_.convolve_batch(batch.history, centred, batch.levels, with_gradient);
    pass.coefficients = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(rows), static_cast<Eigen::Index>(predictors.size()));
    pass.mean.assign(rows, 0.0);

    for (std::size_t b = 0; b < rows; ++b) {
        const std::size_t response = batch.history.responses[b];
        const auto row = static_cast<Eigen::Index>(b);
        double mean = 0.0;
        if (layout_.intercept() != ParameterLayout::npos) {
            mean += centred[layout_.intercept()];
        }
        for (const auto& block : layout_.random_intercepts()) {
            const std::size_t level = batch.levels.level_slots[block.factor][response];
            if (level != ParameterLayout::npos) {
                mean += centred[block.slot(level)];
            }
        }
        for (std::size_t p = 0; p < predictors.size(); ++p) {
            const auto& slots = predictors[p];
            double coefficient = centred[slots.coefficient];
            for (const auto& block : slots.random_coefficients) {
                const std::size_t level = batch.levels.level_slots[block.factor][response];
                if (level != ParameterLayout::npos) {
                    coefficient += centred[block.slot(level)];
                }
            }
            const auto col = static_cast<Eigen::Index>(p);
            pass.coefficients(row, col) = coefficient;
            mean += coefficient * pass.convolution.features(row, col);
        }
        pass.mean[b] = mean;
    }
    return pass;
}

void RegressionCore::backward(const ForwardPass& pass,
                              const BatchInputs& batch,
                              const std::vector<double>& d_mean,
                              std::vector<double>& gradient) const {
    const auto& predictors = layout_.predictors();
    for (std::size_t b = 0; b < d_mean.size(); ++b) {
        const double d = d_mean[b];
        if (d == 0.0) {
            continue;
        }
        const std::size_t response = batch.history.responses[b];
        const auto row = static_cast<Eigen::Index>(b);
        if (layout_.intercept() != ParameterLayout::npos) {
            gradient[layout_.intercept()] += d;
        }
        for (const auto& block : layout_.random_intercepts()) {
            const std::size_t level = batch.levels.level_slots[block.factor][response];
            if (level != ParameterLayout::npos) {
                gradient[block.slot(level)] += d;
            }
        }
        for (std::size_t p = 0; p < predictors.size(); ++p) {
            const auto& slots = predictors[p];
            const auto col = static_cast<Eigen::Index>(p);
            const double feature = pass.convolution.features(row, col);
            gradient[slots.coefficient] += d * feature;
            for (const auto& block : slots.random_coefficients) {
                const std::size_t level = batch.levels.level_slots[block.factor][response];
                if (level != ParameterLayout::npos) {
                    gradient[block.slot(level)] += d * feature;
                }
            }

            const double scale = d * pass.coefficients(row, col);
            const auto& d_features = pass.convolution.d_features[p];
            for (Eigen::Index k = 0; k < d_features.cols(); ++k) {
                const double g = scale * d_features(row, k);
                const auto kk = static_cast<std::size_t>(k);
                gradient[slots.irf_offset + kk] += g;
                for (const auto& block : slots.random_irf) {
                    const std::size_t level = batch.levels.level_slots[block.factor][response];
                    if (level != ParameterLayout::npos) {
                        gradient[block.slot(level, kk)] += g;
                    }
                }
            }
        }
    }
}

double RegressionCore::data_term(const std::vector<double>& point,
                                 const BatchInputs& batch,
                                 double data_scale,
                                 std::optional<double> loss_cutoff,
                                 std::vector<double>& gradient,
                                 ObjectiveEvaluation& eval) const {
    const std::size_t n = layout_.point_size();
    const auto centred = layout_.centre_random_effects(point);
    const auto pass = forward(centred, batch, true);

    const double sigma = layout_.noise_sd(point);
    if (!(sigma > 0.0) || !std::isfinite(sigma)) {
        throw NumericInstabilityError("noise scale left its valid domain: " + std::to_string(sigma));
    }
    const double variance = sigma * sigma;
    const double log_norm = 0.5 * (kLogTwoPi + std::log(variance));

    const std::size_t rows = batch.history.batch_size();
    std::vector<double> d_mean(rows, 0.0);
    double d_sigma = 0.0;
    double data = 0.0;
    double log_likelihood = 0.0;
    eval.response_nll.assign(rows, 0.0);
    eval.retained = 0;

    for (std::size_t b = 0; b < rows; ++b) {
        const double residual = batch.observed[b] - pass.mean[b];
        const double nll = log_norm + 0.5 * residual * residual / variance;
        eval.response_nll[b] = nll;
        log_likelihood -= nll;
        if (loss_cutoff && nll > *loss_cutoff) {
            continue;
        }
        ++eval.retained;
        data += data_scale * nll;
        d_mean[b] = -data_scale * residual / variance;
        d_sigma += data_scale * (1.0 / sigma - residual * residual / (variance * sigma));
    }
    eval.log_likelihood = log_likelihood;

    std::vector<double> centred_gradient(n, 0.0);
    backward(pass, batch, d_mean, centred_gradient);
    layout_.uncentre_gradient(centred_gradient);
    for (std::size_t i = 0; i < n; ++i) {
        gradient[i] += centred_gradient[i];
    }
    gradient[layout_.noise_scale()] += d_sigma * sigmoid(point[layout_.noise_scale()]);
    return data;
}

ObjectiveEvaluation RegressionCore::evaluate(const std::vector<double>& parameters,
                                             const BatchInputs& batch,
                                             double data_scale,
                                             std::mt19937_64* rng,
                                             std::optional<double> loss_cutoff) const {
    if (parameters.size() != layout_.size()) {
        throw std::invalid_argument("parameter vector size mismatch: expected " + std::to_string(layout_.size()) +
                                    ", got " + std::to_string(parameters.size()));
    }
    if (batch.observed.size() != batch.history.batch_size()) {
        throw std::invalid_argument("observed values do not match batch size");
    }
    require_finite(parameters, "parameter");

    const std::size_t n = layout_.point_size();
    const auto prior_means = layout_.prior_means();
    const auto prior_sds = layout_.prior_sds();
    const auto groups = layout_.catalog().groups();

    ObjectiveEvaluation eval;
    eval.gradient.assign(layout_.size(), 0.0);

    if (!layout_.variational()) {
        const double data = data_term(parameters, batch, data_scale, loss_cutoff, eval.gradient, eval);
        for (std::size_t i = 0; i < n; ++i) {
            if (!is_random_effect(groups[i])) {
                continue;
            }
            const double z = parameters[i] / prior_sds[i];
            eval.penalty += 0.5 * z * z;
            eval.gradient[i] += parameters[i] / (prior_sds[i] * prior_sds[i]);
        }
        eval.loss = data + eval.penalty;
    } else {
        if (!rng) {
            throw std::invalid_argument("variational objective requires a random number generator");
        }
        const std::size_t n_samples = layout_.spec().objective.n_samples;
        const double inv_samples = 1.0 / static_cast<double>(n_samples);
        std::normal_distribution<double> standard_normal(0.0, 1.0);

        std::vector<double> posterior_sd(n);
        std::vector<double> d_posterior_sd(n);
        for (std::size_t i = 0; i < n; ++i) {
            posterior_sd[i] = softplus(parameters[n + i]);
            d_posterior_sd[i] = sigmoid(parameters[n + i]);
        }

        double data = 0.0;
        std::vector<double> noise(n);
        std::vector<double> sample(n);
        for (std::size_t m = 0; m < n_samples; ++m) {
            for (std::size_t i = 0; i < n; ++i) {
                noise[i] = standard_normal(*rng);
                sample[i] = parameters[i] + posterior_sd[i] * noise[i];
            }
            ObjectiveEvaluation sample_eval;
            std::vector<double> sample_gradient(n, 0.0);
            data += inv_samples * data_term(sample, batch, data_scale, loss_cutoff, sample_gradient, sample_eval);
            eval.log_likelihood += inv_samples * sample_eval.log_likelihood;
            if (m == 0) {
                eval.response_nll = std::move(sample_eval.response_nll);
                eval.retained = sample_eval.retained;
            }
            for (std::size_t i = 0; i < n; ++i) {
                eval.gradient[i] += inv_samples * sample_gradient[i];
                eval.gradient[n + i] += inv_samples * sample_gradient[i] * noise[i] * d_posterior_sd[i];
            }
        }

        // Closed-form KL between independent Gaussians.
        for (std::size_t i = 0; i < n; ++i) {
            const double s = posterior_sd[i];
            const double sp = prior_sds[i];
            const double diff = parameters[i] - prior_means[i];
            eval.kl += std::log(sp / s) + (s * s + diff * diff) / (2.0 * sp * sp) - 0.5;
            eval.gradient[i] += diff / (sp * sp);
            eval.gradient[n + i] += (-1.0 / s + s / (sp * sp)) * d_posterior_sd[i];
        }
        eval.loss = data + eval.kl;
    }

    require_finite(eval.loss, "loss");
    require_finite(eval.gradient, "gradient");
    return eval;
}

std::vector<double> RegressionCore::predict(const std::vector<double>& point, const BatchInputs& batch) const {
    if (point.size() < layout_.point_size()) {
        throw std::invalid_argument("parameter vector size mismatch");
    }
    const auto centred = layout_.centre_random_effects(point);
    return forward(centred, batch, false).mean;
}

FullBatchObjective::FullBatchObjective(const RegressionCore& core, const BatchInputs& batch)
    : core_(core), batch_(batch) {
    if (core_.layout().variational()) {
        throw std::invalid_argument("full-batch refinement requires point estimation");
    }
}

double FullBatchObjective::value(const std::vector<double>& parameters) const {
    return core_.evaluate(parameters, batch_, 1.0).loss;
}

std::vector<double> FullBatchObjective::gradient(const std::vector<double>& parameters) const {
    return core_.evaluate(parameters, batch_, 1.0).gradient;
}

double FullBatchObjective::value_and_gradient(const std::vector<double>& parameters,
                                              std::vector<double>& gradient) const {
    auto eval = core_.evaluate(parameters, batch_, 1.0);
    gradient = std::move(eval.gradient);
    return eval.loss;
}

}  // namespace libcdr
