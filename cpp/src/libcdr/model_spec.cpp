#include "libcdr/model_spec.hpp"

#include "libcdr/errors.hpp"
#include "libcdr/irf_kernel_factory.hpp"

#include <cmath>
#include <unordered_set>
#include <utility>

namespace libcdr {

namespace {
[[nodiscard]] bool positive_finite(double value) {
    return value > 0.0 && std::isfinite(value);
}

void validate_history_options(const HistoryOptions& options) {
    if (!(options.max_lookback > 0.0)) {
        throw ConfigurationError("history lookback horizon must be positive");
    }
}

void validate_objective_options(const ObjectiveOptions& options) {
    if (!positive_finite(options.intercept_prior_sd) || !positive_finite(options.coefficient_prior_sd) ||
        !positive_finite(options.irf_prior_sd) || !positive_finite(options.noise_prior_sd)) {
        throw ConfigurationError("prior standard deviations must be positive and finite");
    }
    if (!positive_finite(options.ranef_to_fixef_prior_sd_ratio)) {
        throw ConfigurationError("random-effect prior sd ratio must be positive");
    }
    if (!positive_finite(options.posterior_to_prior_sd_ratio)) {
        throw ConfigurationError("posterior-to-prior sd ratio must be positive");
    }
    if (options.n_samples == 0) {
        throw ConfigurationError("objective requires at least one posterior sample");
    }
}
}  // namespace

void ModelSpecBuilder::add_predictor(std::string name, std::string family, std::string column) {
    if (name.empty()) {
        throw ConfigurationError("predictor name must be non-empty");
    }
    if (predictor_index_.contains(name)) {
        throw ConfigurationError("duplicate predictor name: " + name);
    }
    if (family.empty()) {
        throw ConfigurationError("predictor " + name + " requires an IRF family");
    }
    PredictorSpec spec;
    spec.column = column.empty() ? name : std::move(column);
    spec.name = std::move(name);
    spec.irf.family = std::move(family);
    predictor_index_.emplace(spec.name, spec_.predictors.size());
    spec_.predictors.push_back(std::move(spec));
}

PredictorSpec& ModelSpecBuilder::predictor(const std::string& name) {
    auto it = predictor_index_.find(name);
    if (it == predictor_index_.end()) {
        throw ConfigurationError("unknown predictor: " + name);
    }
    return spec_.predictors[it->second];
}

void ModelSpecBuilder::set_irf_initial_values(const std::string& name, std::vector<double> values) {
    predictor(name).irf.initial_values = std::move(values);
}

void ModelSpecBuilder::set_irf_knots(const std::string& name, std::vector<double> knots) {
    predictor(name).irf.knots = std::move(knots);
}

void ModelSpecBuilder::set_irf_normalized(const std::string& name, bool normalized) {
    predictor(name).irf.normalized = normalized;
}

void ModelSpecBuilder::set_initial_coefficient(const std::string& name, double value) {
    if (!std::isfinite(value)) {
        throw ConfigurationError("initial coefficient must be finite");
    }
    predictor(name).initial_coefficient = value;
}

void ModelSpecBuilder::add_irf_random_effect(const std::string& name, std::string grouping_factor) {
    if (grouping_factor.empty()) {
        throw ConfigurationError("grouping factor name must be non-empty");
    }
    auto& irf = predictor(name).irf;
    for (const auto& existing : irf.random_grouping_factors) {
        if (existing == grouping_factor) {
            throw ConfigurationError("IRF of " + name + " already varies by " + grouping_factor);
        }
    }
    irf.random_grouping_factors.push_back(std::move(grouping_factor));
}

void ModelSpecBuilder::add_random_effect(std::string grouping_factor, std::vector<std::string> coefficients, bool intercept) {
    if (grouping_factor.empty()) {
        throw ConfigurationError("grouping factor name must be non-empty");
    }
    for (const auto& existing : spec_.random_effects) {
        if (existing.grouping_factor == grouping_factor) {
            throw ConfigurationError("duplicate random effect for grouping factor: " + grouping_factor);
        }
    }
    std::unordered_set<std::string> seen;
    for (const auto& name : coefficients) {
        if (!predictor_index_.contains(name)) {
            throw ConfigurationError("random effect references unknown predictor: " + name);
        }
        if (!seen.insert(name).second) {
            throw ConfigurationError("random effect references predictor multiple times: " + name);
        }
    }
    if (!intercept && coefficients.empty()) {
        throw ConfigurationError("random effect for " + grouping_factor + " has neither intercept nor slopes");
    }
    spec_.random_effects.push_back(RandomEffectSpec{std::move(grouping_factor), intercept, std::move(coefficients)});
}

void ModelSpecBuilder::set_intercept(bool enabled) {
    spec_.intercept = enabled;
}

void ModelSpecBuilder::set_initial_intercept(double value) {
    if (!std::isfinite(value)) {
        throw ConfigurationError("initial intercept must be finite");
    }
    spec_.initial_intercept = value;
}

void ModelSpecBuilder::set_standardize_response(bool enabled) {
    spec_.standardize_response = enabled;
}

void ModelSpecBuilder::set_history_options(HistoryOptions options) {
    validate_history_options(options);
    spec_.history = options;
}

void ModelSpecBuilder::set_objective_options(ObjectiveOptions options) {
    validate_objective_options(options);
    spec_.objective = options;
}

ModelSpec ModelSpecBuilder::build() const {
    validate_model_spec(spec_);
    return spec_;
}

void validate_model_spec(const ModelSpec& spec) {
    if (spec.predictors.empty()) {
        throw ConfigurationError("model must contain at least one predictor");
    }
    validate_history_options(spec.history);
    validate_objective_options(spec.objective);

    std::unordered_set<std::string> names;
    for (const auto& predictor : spec.predictors) {
        if (predictor.name.empty() || predictor.column.empty()) {
            throw ConfigurationError("predictor name and column must be non-empty");
        }
        if (!names.insert(predictor.name).second) {
            throw ConfigurationError("duplicate predictor name: " + predictor.name);
        }
        const auto kernel = IrfKernelFactory::create(predictor.irf.family, predictor.irf.knots);
        if (!predictor.irf.initial_values.empty() && !kernel->is_valid(predictor.irf.initial_values)) {
            throw ConfigurationError("initial IRF parameters of " + predictor.name + " are outside the " +
                                     kernel->name() + " domain");
        }
    }

    std::unordered_set<std::string> factors;
    for (const auto& ranef : spec.random_effects) {
        if (!factors.insert(ranef.grouping_factor).second) {
            throw ConfigurationError("duplicate random effect for grouping factor: " + ranef.grouping_factor);
        }
        for (const auto& name : ranef.coefficients) {
            if (!names.contains(name)) {
                throw ConfigurationError("random effect references unknown predictor: " + name);
            }
        }
    }
}

void validate_model_data(const ModelSpec& spec, const EventTable& events, const ResponseTable& responses) {
    const std::size_t n_events = events.size();
    if (events.series_id.size() != n_events) {
        throw DataAlignmentError("event series ids do not match event count");
    }
    for (const auto& predictor : spec.predictors) {
        auto it = events.columns.find(predictor.column);
        if (it == events.columns.end()) {
            throw ConfigurationError("predictor column not found in events: " + predictor.column);
        }
        if (it->second.size() != n_events) {
            throw DataAlignmentError("predictor column " + predictor.column + " does not match event count");
        }
    }

    const std::size_t n_responses = responses.size();
    if (responses.series_id.size() != n_responses || responses.observed.size() != n_responses) {
        throw DataAlignmentError("response columns do not match response count");
    }
    auto require_factor = [&](const std::string& factor) {
        auto it = responses.grouping.find(factor);
        if (it == responses.grouping.end()) {
            throw ConfigurationError("grouping factor not found in responses: " + factor);
        }
        if (it->second.size() != n_responses) {
            throw DataAlignmentError("grouping factor " + factor + " does not match response count");
        }
    };
    for (const auto& ranef : spec.random_effects) {
        require_factor(ranef.grouping_factor);
    }
    for (const auto& predictor : spec.predictors) {
        for (const auto& factor : predictor.irf.random_grouping_factors) {
            require_factor(factor);
        }
    }
}

}  // namespace libcdr
