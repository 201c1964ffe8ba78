#include "libcdr/parameter_layout.hpp"

#include "libcdr/errors.hpp"
#include "libcdr/irf_kernel_factory.hpp"
#include "libcdr/model_spec.hpp"
#include "libcdr/parameter_transform.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace libcdr {

namespace {
const std::vector<std::string>& grouping_column(const ResponseTable& responses, const std::string& factor) {
    auto it = responses.grouping.find(factor);
    if (it == responses.grouping.end()) {
        throw ConfigurationError("grouping factor not found in responses: " + factor);
    }
    if (it->second.size() != responses.size()) {
        throw DataAlignmentError("grouping factor " + factor + " does not match response count");
    }
    return it->second;
}

std::size_t factor_position(const std::vector<GroupingFactor>& factors, const std::string& name) {
    for (std::size_t f = 0; f < factors.size(); ++f) {
        if (factors[f].name == name) {
            return f;
        }
    }
    throw ConfigurationError("unresolved grouping factor: " + name);
}

double prior_sd_for(ParameterGroup group, const ObjectiveOptions& options) {
    const double ratio = options.ranef_to_fixef_prior_sd_ratio;
    switch (group) {
        case ParameterGroup::Intercept:
            return options.intercept_prior_sd;
        case ParameterGroup::Coefficient:
            return options.coefficient_prior_sd;
        case ParameterGroup::Irf:
            return options.irf_prior_sd;
        case ParameterGroup::NoiseScale:
            return options.noise_prior_sd;
        case ParameterGroup::RandomIntercept:
            return options.intercept_prior_sd * ratio;
        case ParameterGroup::RandomCoefficient:
            return options.coefficient_prior_sd * ratio;
        case ParameterGroup::RandomIrf:
            return options.irf_prior_sd * ratio;
        case ParameterGroup::PosteriorScale:
            break;
    }
    throw std::invalid_argument("posterior scale slots have no prior");
}
}  // namespace

ParameterLayout ParameterLayout::build(const ModelSpec& spec, const ResponseTable& training) {
    validate_model_spec(spec);
    const std::size_t n = training.size();
    if (n == 0) {
        throw DataAlignmentError("training responses are empty");
    }
    if (training.observed.size() != n) {
        throw DataAlignmentError("observed values do not match response count");
    }

    double mean = 0.0;
    for (double y : training.observed) {
        mean += y;
    }
    mean /= static_cast<double>(n);
    double sd = 0.0;
    if (n > 1) {
        double ss = 0.0;
        for (double y : training.observed) {
            ss += (y - mean) * (y - mean);
        }
        sd = std::sqrt(ss / static_cast<double>(n - 1));
    }
    if (!(sd > 0.0) || !std::isfinite(sd)) {
        sd = 1.0;
    }
    require_finite(mean, "training response mean");

    ParameterLayout layout;
    layout.spec_ = spec;
    layout.scaling_ = spec.standardize_response ? ResponseScaling{mean, sd} : ResponseScaling{};

    std::vector<std::string> factor_names;
    auto note_factor = [&](const std::string& name) {
        if (std::find(factor_names.begin(), factor_names.end(), name) == factor_names.end()) {
            factor_names.push_back(name);
        }
    };
    for (const auto& ranef : spec.random_effects) {
        note_factor(ranef.grouping_factor);
    }
    for (const auto& predictor : spec.predictors) {
        for (const auto& factor : predictor.irf.random_grouping_factors) {
            note_factor(factor);
        }
    }
    for (const auto& name : factor_names) {
        const auto& labels = grouping_column(training, name);
        std::set<std::string> unique(labels.begin(), labels.end());
        GroupingFactor factor;
        factor.name = name;
        factor.levels.assign(unique.begin(), unique.end());
        for (std::size_t l = 0; l < factor.levels.size(); ++l) {
            factor.level_index.emplace(factor.levels[l], l);
        }
        layout.factors_.push_back(std::move(factor));
    }

    auto& catalog = layout.catalog_;
    // Slot names join user-supplied strings with '/', so distinct slots can
    // spell the same name. Blocks assume contiguous fresh slots.
    const auto register_slot = [&catalog](const std::string& name, double initial_value, ParameterGroup group,
                                          std::shared_ptr<const ParameterTransform> transform = nullptr) {
        if (catalog.contains(name)) {
            throw ConfigurationError("parameter slot name collision: " + name);
        }
        return catalog.register_parameter(name, initial_value, group, std::move(transform));
    };
    if (spec.intercept) {
        double init = spec.standardize_response ? 0.0 : mean;
        if (spec.initial_intercept) {
            init = (*spec.initial_intercept - layout.scaling_.mean) / layout.scaling_.sd;
        }
        layout.intercept_ = register_slot("intercept", init, ParameterGroup::Intercept);
    }

    for (const auto& predictor : spec.predictors) {
        PredictorSlots slots;
        slots.name = predictor.name;
        slots.column = predictor.column;
        slots.kernel = IrfKernelFactory::create(predictor.irf.family, predictor.irf.knots);
        slots.normalized = predictor.irf.normalized;
        slots.coefficient = register_slot("coef/" + predictor.name, predictor.initial_coefficient,
                                                       ParameterGroup::Coefficient);
        const auto names = slots.kernel->parameter_names();
        const auto transforms = slots.kernel->transforms();
        const auto init = predictor.irf.initial_values.empty() ? slots.kernel->default_values()
                                                                 : predictor.irf.initial_values;
        slots.irf_offset = catalog.size();
        for (std::size_t k = 0; k < names.size(); ++k) {
            register_slot("irf/" + predictor.name + "/" + names[k], init[k], ParameterGroup::Irf,
                                       transforms[k]);
        }
        layout.predictors_.push_back(std::move(slots));
    }

    layout.noise_ = register_slot("noise_sd", spec.standardize_response ? 1.0 : sd,
                                               ParameterGroup::NoiseScale, make_softplus_transform());

    for (const auto& ranef : spec.random_effects) {
        if (!ranef.intercept) {
            continue;
        }
        RandomBlock block;
        block.factor = factor_position(layout.factors_, ranef.grouping_factor);
        block.offset = catalog.size();
        block.width = 1;
        for (const auto& level : layout.factors_[block.factor].levels) {
            register_slot("ranef/" + ranef.grouping_factor + "/intercept/" + level, 0.0,
                                       ParameterGroup::RandomIntercept);
        }
        layout.random_intercepts_.push_back(block);
    }

    for (const auto& ranef : spec.random_effects) {
        for (const auto& name : ranef.coefficients) {
            auto it = std::find_if(layout.predictors_.begin(), layout.predictors_.end(),
                                   [&](const PredictorSlots& slots) { return slots.name == name; });
            RandomBlock block;
            block.factor = factor_position(layout.factors_, ranef.grouping_factor);
            block.offset = catalog.size();
            block.width = 1;
            for (const auto& level : layout.factors_[block.factor].levels) {
                register_slot("ranef/" + ranef.grouping_factor + "/coef/" + name + "/" + level, 0.0,
                                           ParameterGroup::RandomCoefficient);
            }
            it->random_coefficients.push_back(block);
        }
    }

    for (std::size_t p = 0; p < spec.predictors.size(); ++p) {
        auto& slots = layout.predictors_[p];
        const auto names = slots.kernel->parameter_names();
        for (const auto& factor_name : spec.predictors[p].irf.random_grouping_factors) {
            RandomBlock block;
            block.factor = factor_position(layout.factors_, factor_name);
            block.offset = catalog.size();
            block.width = names.size();
            for (const auto& level : layout.factors_[block.factor].levels) {
                for (const auto& param : names) {
                    register_slot("ranef/" + factor_name + "/irf/" + slots.name + "/" + param + "/" + level,
                                               0.0, ParameterGroup::RandomIrf);
                }
            }
            slots.random_irf.push_back(block);
        }
    }

    return layout;
}

const ModelSpec& ParameterLayout::spec() const noexcept {
    return spec_;
}

const ParameterCatalog& ParameterLayout::catalog() const noexcept {
    return catalog_;
}

bool ParameterLayout::variational() const noexcept {
    return spec_.objective.mode == EstimationMode::Variational;
}

std::size_t ParameterLayout::point_size() const noexcept {
    return catalog_.size();
}

std::size_t ParameterLayout::size() const noexcept {
    return variational() ? 2 * catalog_.size() : catalog_.size();
}

std::size_t ParameterLayout::intercept() const noexcept {
    return intercept_;
}

std::size_t ParameterLayout::noise_scale() const noexcept {
    return noise_;
}

const std::vector<RandomBlock>& ParameterLayout::random_intercepts() const noexcept {
    return random_intercepts_;
}

const std::vector<PredictorSlots>& ParameterLayout::predictors() const noexcept {
    return predictors_;
}

const std::vector<GroupingFactor>& ParameterLayout::grouping_factors() const noexcept {
    return factors_;
}

std::vector<std::string> ParameterLayout::predictor_columns() const {
    std::vector<std::string> columns;
    columns.reserve(predictors_.size());
    for (const auto& slots : predictors_) {
        columns.push_back(slots.column);
    }
    return columns;
}

const ResponseScaling& ParameterLayout::scaling() const noexcept {
    return scaling_;
}

std::vector<std::string> ParameterLayout::names() const {
    std::vector<std::string> out = catalog_.names();
    if (variational()) {
        for (std::size_t i = 0; i < catalog_.size(); ++i) {
            out.push_back(catalog_.names()[i] + "/posterior_sd");
        }
    }
    return out;
}

std::string ParameterLayout::schema() const {
    std::ostringstream out;
    out << std::hexfloat;
    for (const auto& predictor : spec_.predictors) {
        out << predictor.name << '\t' << predictor.irf.family << '\t' << (predictor.irf.normalized ? 1 : 0);
        for (double knot : predictor.irf.knots) {
            out << '\t' << knot;
        }
        out << '\n';
    }
    return out.str();
}

std::vector<ParameterGroup> ParameterLayout::groups() const {
    std::vector<ParameterGroup> out = catalog_.groups();
    if (variational()) {
        out.resize(2 * catalog_.size(), ParameterGroup::PosteriorScale);
    }
    return out;
}

std::vector<double> ParameterLayout::initial_parameters() const {
    std::vector<double> out = catalog_.initial_unconstrained();
    if (variational()) {
        const auto sds = prior_sds();
        for (double sd : sds) {
            out.push_back(inverse_softplus(sd * spec_.objective.posterior_to_prior_sd_ratio));
        }
    }
    return out;
}

std::vector<double> ParameterLayout::prior_means() const {
    return catalog_.initial_unconstrained();
}

std::vector<double> ParameterLayout::prior_sds() const {
    std::vector<double> out(catalog_.size());
    for (std::size_t i = 0; i < catalog_.size(); ++i) {
        out[i] = prior_sd_for(catalog_.at(i).group(), spec_.objective);
    }
    return out;
}

LevelAssignment ParameterLayout::resolve_levels(const ResponseTable& responses, bool allow_unseen) const {
    LevelAssignment assignment;
    assignment.level_slots.resize(factors_.size());
    for (std::size_t f = 0; f < factors_.size(); ++f) {
        const auto& factor = factors_[f];
        const auto& labels = grouping_column(responses, factor.name);
        auto& slots = assignment.level_slots[f];
        slots.resize(labels.size());
        for (std::size_t i = 0; i < labels.size(); ++i) {
            auto it = factor.level_index.find(labels[i]);
            if (it != factor.level_index.end()) {
                slots[i] = it->second;
            } else if (allow_unseen) {
                slots[i] = npos;
            } else {
                throw DataAlignmentError("level '" + labels[i] + "' of grouping factor " + factor.name +
                                         " has no random-effect slot");
            }
        }
    }
    return assignment;
}

std::vector<RandomBlock> ParameterLayout::all_blocks() const {
    std::vector<RandomBlock> blocks = random_intercepts_;
    for (const auto& slots : predictors_) {
        blocks.insert(blocks.end(), slots.random_coefficients.begin(), slots.random_coefficients.end());
        blocks.insert(blocks.end(), slots.random_irf.begin(), slots.random_irf.end());
    }
    return blocks;
}

std::vector<double> ParameterLayout::centre_random_effects(const std::vector<double>& point) const {
    if (point.size() < catalog_.size()) {
        throw std::invalid_argument("parameter vector size mismatch");
    }
    std::vector<double> out(point.begin(), point.begin() + static_cast<std::ptrdiff_t>(catalog_.size()));
    for (const auto& block : all_blocks()) {
        const std::size_t n_levels = factors_[block.factor].levels.size();
        if (n_levels == 0) {
            continue;
        }
        for (std::size_t k = 0; k < block.width; ++k) {
            double mean = 0.0;
            for (std::size_t l = 0; l < n_levels; ++l) {
                mean += point[block.slot(l, k)];
            }
            mean /= static_cast<double>(n_levels);
            for (std::size_t l = 0; l < n_levels; ++l) {
                out[block.slot(l, k)] = point[block.slot(l, k)] - mean;
            }
        }
    }
    return out;
}

void ParameterLayout::uncentre_gradient(std::vector<double>& gradient) const {
    for (const auto& block : all_blocks()) {
        const std::size_t n_levels = factors_[block.factor].levels.size();
        if (n_levels == 0) {
            continue;
        }
        for (std::size_t k = 0; k < block.width; ++k) {
            double mean = 0.0;
            for (std::size_t l = 0; l < n_levels; ++l) {
                mean += gradient[block.slot(l, k)];
            }
            mean /= static_cast<double>(n_levels);
            for (std::size_t l = 0; l < n_levels; ++l) {
                gradient[block.slot(l, k)] -= mean;
            }
        }
    }
}

double ParameterLayout::irf_parameter(const std::vector<double>& parameters, std::size_t predictor, std::size_t k) const {
    const auto& slots = predictors_.at(predictor);
    return catalog_.at(slots.irf_offset + k).transform()->to_constrained(parameters.at(slots.irf_offset + k));
}

double ParameterLayout::noise_sd(const std::vector<double>& parameters) const {
    return softplus(parameters.at(noise_));
}

}  // namespace libcdr
