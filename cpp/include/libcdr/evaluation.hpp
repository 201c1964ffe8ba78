#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <vector>

#include "libcdr/model_state.hpp"
#include "libcdr/model_types.hpp"

namespace libcdr {

struct EvaluationOptions {
    std::size_t n_samples{100};  // posterior draws for credible intervals (variational only)
    double interval_level{0.95};
    bool allow_unseen_levels{false};
    std::uint64_t seed{0};
    std::size_t batch_size{1024};
};

struct PredictionRecord {
    std::size_t response_index{0};
    double observed{0.0};
    double mean{0.0};
    std::optional<double> lower{};
    std::optional<double> upper{};
};

// Aggregate fit statistics in the original response units.
struct FitSummary {
    std::size_t n{0};
    double log_likelihood{0.0};
    double mse{0.0};
    double mae{0.0};
    double explained_variance{0.0};
};

struct EvaluationResult {
    std::vector<PredictionRecord> predictions;
    FitSummary summary;
};

// Read-only scoring of a fitted model on in- or out-of-sample data.
class Evaluator {
public:
    explicit Evaluator(ModelState state, EvaluationOptions options = {});

    [[nodiscard]] EvaluationResult evaluate(const Dataset& data) const;

    // Predicted means in original response units, one per response.
    [[nodiscard]] std::vector<double> predict(const Dataset& data) const;

    [[nodiscard]] const ModelState& state() const noexcept;

    [[nodiscard]] const EvaluationOptions& options() const noexcept;

private:
    [[nodiscard]] std::vector<PredictionRecord> predict_records(const Dataset& data, bool with_intervals) const;

    ModelState state_;
    EvaluationOptions options_;
};

[[nodiscard]] FitSummary summarize_fit(const std::vector<PredictionRecord>& predictions, double noise_sd);

// Tab-separated, one header line then one line per response. Missing
// interval bounds are written as empty fields.
void write_predictions(std::ostream& out, const EvaluationResult& result);

void write_summary(std::ostream& out, const FitSummary& summary);

}  // namespace libcdr
