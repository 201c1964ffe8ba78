#include "libcdr/evaluation.hpp"

#include "libcdr/errors.hpp"
#include "libcdr/history.hpp"
#include "libcdr/model_spec.hpp"
#include "libcdr/regression_core.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <numeric>
#include <random>
#include <stdexcept>
#include <utility>

namespace libcdr {

namespace {

// Linear interpolation between order statistics; `sorted` must be non-empty.
double quantile(const std::vector<double>& sorted, double p) {
    const double position = p * static_cast<double>(sorted.size() - 1);
    const auto lo = static_cast<std::size_t>(std::floor(position));
    const std::size_t hi = std::min(lo + 1, sorted.size() - 1);
    const double frac = position - static_cast<double>(lo);
    return sorted[lo] + frac * (sorted[hi] - sorted[lo]);
}

}  // namespace

Evaluator::Evaluator(ModelState state, EvaluationOptions options)
    : state_(std::move(state)), options_(options) {
    if (!(options_.interval_level > 0.0 && options_.interval_level < 1.0)) {
        throw std::invalid_argument("interval level must lie in (0, 1)");
    }
    if (options_.batch_size == 0) {
        throw std::invalid_argument("evaluation batch size must be positive");
    }
}

const ModelState& Evaluator::state() const noexcept {
    return state_;
}

const EvaluationOptions& Evaluator::options() const noexcept {
    return options_;
}

std::vector<PredictionRecord> Evaluator::predict_records(const Dataset& data, bool with_intervals) const {
    const auto& layout = state_.layout();
    const std::size_t n = data.responses.size();
    if (n == 0) {
        throw DataAlignmentError("no responses to evaluate");
    }
    validate_model_data(layout.spec(), data.events, data.responses);
    HistoryAssembler assembler(data.events, layout.spec().history);
    assembler.validate(data.responses);
    const auto levels = layout.resolve_levels(data.responses, options_.allow_unseen_levels);
    const RegressionCore core(layout);
    const auto& scaling = layout.scaling();

    const auto point = state_.point_parameters();
    std::vector<std::vector<double>> draws;
    if (with_intervals) {
        const auto sds = state_.posterior_sds();
        std::mt19937_64 rng(options_.seed);
        std::normal_distribution<double> standard_normal(0.0, 1.0);
        draws.assign(options_.n_samples, point);
        for (auto& draw : draws) {
            for (std::size_t i = 0; i < draw.size(); ++i) {
                draw[i] += sds[i] * standard_normal(rng);
            }
        }
    }

    const double tail = 0.5 * (1.0 - options_.interval_level);
    std::vector<PredictionRecord> records;
    records.reserve(n);
    std::vector<std::size_t> indices;
    std::vector<std::vector<double>> sampled(draws.size());
    std::vector<double> column;
    for (std::size_t start = 0; start < n; start += options_.batch_size) {
        const std::size_t end = std::min(n, start + options_.batch_size);
        indices.resize(end - start);
        std::iota(indices.begin(), indices.end(), start);
        const auto inputs = make_batch_inputs(assembler, data.responses, indices, layout, levels);
        const auto mean = core.predict(point, inputs);
        for (std::size_t s = 0; s < draws.size(); ++s) {
            sampled[s] = core.predict(draws[s], inputs);
        }
        for (std::size_t b = 0; b < indices.size(); ++b) {
            PredictionRecord record;
            record.response_index = indices[b];
            record.observed = data.responses.observed[indices[b]];
            record.mean = mean[b] * scaling.sd + scaling.mean;
            if (!draws.empty()) {
                column.resize(draws.size());
                for (std::size_t s = 0; s < draws.size(); ++s) {
                    column[s] = sampled[s][b] * scaling.sd + scaling.mean;
                }
                std::sort(column.begin(), column.end());
                record.lower = quantile(column, tail);
                record.upper = quantile(column, 1.0 - tail);
            }
            require_finite(record.mean, "prediction");
            records.push_back(record);
        }
    }
    return records;
}

EvaluationResult Evaluator::evaluate(const Dataset& data) const {
    const bool with_intervals = state_.layout().variational() && options_.n_samples > 0;
    EvaluationResult result;
    result.predictions = predict_records(data, with_intervals);
    result.summary = summarize_fit(result.predictions, state_.noise_sd() * state_.layout().scaling().sd);
    return result;
}

std::vector<double> Evaluator::predict(const Dataset& data) const {
    const auto records = predict_records(data, false);
    std::vector<double> out;
    out.reserve(records.size());
    for (const auto& record : records) {
        out.push_back(record.mean);
    }
    return out;
}

FitSummary summarize_fit(const std::vector<PredictionRecord>& predictions, double noise_sd) {
    if (!(noise_sd > 0.0)) {
        throw std::invalid_argument("noise sd must be positive");
    }
    FitSummary summary;
    summary.n = predictions.size();
    if (summary.n == 0) {
        return summary;
    }
    const double n = static_cast<double>(summary.n);
    const double variance = noise_sd * noise_sd;
    const double log_norm = 0.5 * (std::log(2.0 * std::numbers::pi_v<double>) + std::log(variance));

    double observed_mean = 0.0;
    double residual_mean = 0.0;
    for (const auto& record : predictions) {
        const double residual = record.observed - record.mean;
        summary.log_likelihood -= log_norm + 0.5 * residual * residual / variance;
        summary.mse += residual * residual;
        summary.mae += std::abs(residual);
        observed_mean += record.observed;
        residual_mean += residual;
    }
    summary.mse /= n;
    summary.mae /= n;
    observed_mean /= n;
    residual_mean /= n;

    double observed_var = 0.0;
    double residual_var = 0.0;
    for (const auto& record : predictions) {
        const double residual = record.observed - record.mean;
        observed_var += (record.observed - observed_mean) * (record.observed - observed_mean);
        residual_var += (residual - residual_mean) * (residual - residual_mean);
    }
    summary.explained_variance = observed_var > 0.0 ? 1.0 - residual_var / observed_var : 0.0;
    return summary;
}

void write_predictions(std::ostream& out, const EvaluationResult& result) {
    const auto precision = out.precision(10);
    out << "response_index\tobserved\tpredicted\tlower\tupper\n";
    for (const auto& record : result.predictions) {
        out << record.response_index << '\t' << record.observed << '\t' << record.mean << '\t';
        if (record.lower) {
            out << *record.lower;
        }
        out << '\t';
        if (record.upper) {
            out << *record.upper;
        }
        out << '\n';
    }
    out.precision(precision);
}

void write_summary(std::ostream& out, const FitSummary& summary) {
    const auto precision = out.precision(10);
    out << "n\tlog_likelihood\tmse\tmae\texplained_variance\n";
    out << summary.n << '\t' << summary.log_likelihood << '\t' << summary.mse << '\t' << summary.mae << '\t'
        << summary.explained_variance << '\n';
    out.precision(precision);
}

}  // namespace libcdr
