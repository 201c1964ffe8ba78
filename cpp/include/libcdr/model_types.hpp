#pragma once

#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace libcdr {

// Columnar event stream. One row per event; `columns` holds one value per
// event for every predictor column.
struct EventTable {
    std::vector<double> time;
    std::vector<std::string> series_id;
    std::unordered_map<std::string, std::vector<double>> columns;

    [[nodiscard]] std::size_t size() const noexcept { return time.size(); }
};

// Columnar response stream. `grouping` maps a grouping factor name to one
// categorical label per response.
struct ResponseTable {
    std::vector<double> time;
    std::vector<std::string> series_id;
    std::unordered_map<std::string, std::vector<std::string>> grouping;
    std::vector<double> observed;

    [[nodiscard]] std::size_t size() const noexcept { return time.size(); }
};

struct Dataset {
    EventTable events;
    ResponseTable responses;
};

enum class EstimationMode {
    PointEstimate,
    Variational
};

struct IrfSpec {
    std::string family;
    std::vector<double> initial_values;  // constrained; empty = family defaults
    std::vector<double> knots;           // "basis" family only
    bool normalized{false};
    std::vector<std::string> random_grouping_factors;
};

struct PredictorSpec {
    std::string name;
    std::string column;
    IrfSpec irf;
    double initial_coefficient{0.0};
};

struct RandomEffectSpec {
    std::string grouping_factor;
    bool intercept{true};
    std::vector<std::string> coefficients;  // predictor names with random slopes
};

struct HistoryOptions {
    double max_lookback{std::numeric_limits<double>::infinity()};
    std::size_t max_events{0};       // 0 = unbounded
    std::size_t cache_capacity{0};   // 0 = no caching
};

struct ObjectiveOptions {
    EstimationMode mode{EstimationMode::PointEstimate};
    double intercept_prior_sd{1.0};
    double coefficient_prior_sd{1.0};
    double irf_prior_sd{1.0};
    double noise_prior_sd{1.0};
    // Random-effect prior sd is the fixed-effect prior sd times this ratio.
    double ranef_to_fixef_prior_sd_ratio{0.1};
    // Initial posterior sd (variational) is the prior sd times this ratio.
    double posterior_to_prior_sd_ratio{0.01};
    std::size_t n_samples{1};
};

struct ModelSpec {
    std::vector<PredictorSpec> predictors;
    std::vector<RandomEffectSpec> random_effects;
    bool intercept{true};
    std::optional<double> initial_intercept{};
    bool standardize_response{false};
    HistoryOptions history{};
    ObjectiveOptions objective{};
};

}  // namespace libcdr
