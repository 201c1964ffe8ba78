#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <memory>
#include <numbers>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "libcdr/errors.hpp"
#include "libcdr/evaluation.hpp"
#include "libcdr/history.hpp"
#include "libcdr/model_spec.hpp"
#include "libcdr/model_state.hpp"
#include "libcdr/parameter_layout.hpp"
#include "libcdr/regression_core.hpp"

namespace {
libcdr::Dataset make_dataset() {
    libcdr::Dataset data;
    for (const std::string id : {"a", "b"}) {
        for (int i = 0; i < 8; ++i) {
            data.events.time.push_back(0.5 * i + (id == "a" ? 0.0 : 0.2));
            data.events.series_id.push_back(id);
            data.events.columns["x"].push_back(1.0 + 0.1 * i);
        }
    }
    const std::vector<std::string> subjects{"s1", "s2"};
    for (const std::string id : {"a", "b"}) {
        for (int r = 0; r < 5; ++r) {
            data.responses.time.push_back(0.8 + 0.7 * r);
            data.responses.series_id.push_back(id);
            data.responses.grouping["subject"].push_back(subjects[static_cast<std::size_t>(r) % 2]);
            data.responses.observed.push_back(10.0 + 2.0 * r + (id == "a" ? 1.0 : -1.0));
        }
    }
    return data;
}

libcdr::ModelSpec make_spec(bool standardize,
                            libcdr::EstimationMode mode = libcdr::EstimationMode::PointEstimate) {
    libcdr::ModelSpecBuilder builder;
    builder.add_predictor("x", "exponential");
    builder.set_initial_coefficient("x", 0.5);
    builder.add_random_effect("subject");
    builder.set_standardize_response(standardize);
    libcdr::ObjectiveOptions objective;
    objective.mode = mode;
    builder.set_objective_options(objective);
    return builder.build();
}

libcdr::ModelState initial_state(const libcdr::ModelSpec& spec, const libcdr::Dataset& data) {
    auto layout = std::make_shared<const libcdr::ParameterLayout>(libcdr::ParameterLayout::build(spec, data.responses));
    auto parameters = layout->initial_parameters();
    return libcdr::ModelState(layout, std::move(parameters));
}
}  // namespace

TEST_CASE("Predictions match the regression core", "[evaluation]") {
    const auto data = make_dataset();
    const auto state = initial_state(make_spec(false), data);
    const libcdr::Evaluator evaluator(state);
    const auto predicted = evaluator.predict(data);
    REQUIRE(predicted.size() == data.responses.size());

    const auto& layout = state.layout();
    const auto levels = layout.resolve_levels(data.responses, false);
    libcdr::HistoryAssembler assembler(data.events, layout.spec().history);
    std::vector<std::size_t> all(data.responses.size());
    for (std::size_t i = 0; i < all.size(); ++i) {
        all[i] = i;
    }
    const auto inputs = libcdr::make_batch_inputs(assembler, data.responses, all, layout, levels);
    const auto expected = libcdr::RegressionCore(layout).predict(state.parameters(), inputs);
    for (std::size_t i = 0; i < predicted.size(); ++i) {
        REQUIRE(predicted[i] == Catch::Approx(expected[i]).epsilon(1e-12));
    }
}

TEST_CASE("Standardised models predict in original units", "[evaluation]") {
    auto data = make_dataset();
    auto spec = make_spec(true);
    spec.predictors[0].initial_coefficient = 0.0;
    const auto state = initial_state(spec, data);
    REQUIRE(state.layout().scaling().sd > 1.0);

    double mean = 0.0;
    for (double y : data.responses.observed) {
        mean += y;
    }
    mean /= static_cast<double>(data.responses.size());

    libcdr::EvaluationOptions options;
    options.batch_size = 3;
    const libcdr::Evaluator evaluator(state, options);
    for (double value : evaluator.predict(data)) {
        REQUIRE(value == Catch::Approx(mean));
    }
}

TEST_CASE("Point estimates carry no intervals", "[evaluation]") {
    const auto data = make_dataset();
    const libcdr::Evaluator evaluator(initial_state(make_spec(false), data));
    const auto result = evaluator.evaluate(data);
    REQUIRE(result.summary.n == data.responses.size());
    for (const auto& record : result.predictions) {
        REQUIRE_FALSE(record.lower.has_value());
        REQUIRE_FALSE(record.upper.has_value());
    }
}

TEST_CASE("Variational models report credible intervals", "[evaluation][variational]") {
    const auto data = make_dataset();
    const auto state = initial_state(make_spec(true, libcdr::EstimationMode::Variational), data);
    libcdr::EvaluationOptions options;
    options.n_samples = 200;
    options.seed = 3;
    const libcdr::Evaluator evaluator(state, options);
    const auto result = evaluator.evaluate(data);

    for (const auto& record : result.predictions) {
        REQUIRE(record.lower.has_value());
        REQUIRE(record.upper.has_value());
        REQUIRE(*record.lower < *record.upper);
        REQUIRE(*record.lower <= record.mean);
        REQUIRE(record.mean <= *record.upper);
    }

    // Same seed, same draws.
    const auto again = evaluator.evaluate(data);
    REQUIRE(*again.predictions[0].lower == *result.predictions[0].lower);
}

TEST_CASE("Unseen grouping levels are rejected unless allowed", "[evaluation]") {
    const auto data = make_dataset();
    const auto state = initial_state(make_spec(false), data);

    auto unseen = data;
    unseen.responses.grouping["subject"][0] = "s9";
    REQUIRE_THROWS_AS(libcdr::Evaluator(state).evaluate(unseen), libcdr::DataAlignmentError);

    libcdr::EvaluationOptions options;
    options.allow_unseen_levels = true;
    const auto predicted = libcdr::Evaluator(state, options).predict(unseen);
    // Unseen levels contribute the population-level prediction.
    REQUIRE(predicted[0] == Catch::Approx(libcdr::Evaluator(state).predict(data)[0]));
}

TEST_CASE("Evaluation rejects empty or misaligned data", "[evaluation]") {
    const auto data = make_dataset();
    const auto state = initial_state(make_spec(false), data);
    const libcdr::Evaluator evaluator(state);

    libcdr::Dataset empty;
    empty.events = data.events;
    REQUIRE_THROWS_AS(evaluator.evaluate(empty), libcdr::DataAlignmentError);

    auto orphan = data;
    orphan.responses.series_id[2] = "c";
    REQUIRE_THROWS_AS(evaluator.predict(orphan), libcdr::DataAlignmentError);

    libcdr::EvaluationOptions bad;
    bad.interval_level = 1.0;
    REQUIRE_THROWS_AS(libcdr::Evaluator(state, bad), std::invalid_argument);
}

TEST_CASE("Fit summaries", "[evaluation]") {
    std::vector<libcdr::PredictionRecord> records(4);
    const std::vector<double> observed{1.0, 2.0, 3.0, 4.0};
    for (std::size_t i = 0; i < records.size(); ++i) {
        records[i].response_index = i;
        records[i].observed = observed[i];
        records[i].mean = observed[i];
    }

    SECTION("perfect predictions") {
        const auto summary = libcdr::summarize_fit(records, 1.0);
        REQUIRE(summary.n == 4);
        REQUIRE(summary.mse == 0.0);
        REQUIRE(summary.mae == 0.0);
        REQUIRE(summary.explained_variance == Catch::Approx(1.0));
        REQUIRE(summary.log_likelihood == Catch::Approx(-2.0 * std::log(2.0 * std::numbers::pi)));
    }

    SECTION("constant offset") {
        for (auto& record : records) {
            record.mean += 0.5;
        }
        const auto summary = libcdr::summarize_fit(records, 0.5);
        REQUIRE(summary.mse == Catch::Approx(0.25));
        REQUIRE(summary.mae == Catch::Approx(0.5));
        // A constant residual explains all of the variance.
        REQUIRE(summary.explained_variance == Catch::Approx(1.0));
    }

    REQUIRE_THROWS_AS(libcdr::summarize_fit(records, 0.0), std::invalid_argument);
}

TEST_CASE("Evaluation tables are tab separated", "[evaluation]") {
    libcdr::EvaluationResult result;
    libcdr::PredictionRecord plain;
    plain.response_index = 0;
    plain.observed = 1.5;
    plain.mean = 1.25;
    libcdr::PredictionRecord bounded = plain;
    bounded.response_index = 1;
    bounded.lower = 1.0;
    bounded.upper = 2.0;
    result.predictions = {plain, bounded};
    result.summary = libcdr::summarize_fit(result.predictions, 1.0);

    std::ostringstream predictions;
    libcdr::write_predictions(predictions, result);
    REQUIRE(predictions.str() ==
            "response_index\tobserved\tpredicted\tlower\tupper\n"
            "0\t1.5\t1.25\t\t\n"
            "1\t1.5\t1.25\t1\t2\n");

    std::ostringstream summary;
    libcdr::write_summary(summary, result.summary);
    const auto text = summary.str();
    REQUIRE(text.rfind("n\tlog_likelihood\tmse\tmae\texplained_variance\n2\t", 0) == 0);
    REQUIRE(text.find("0.0625\t0.25\t0\n") != std::string::npos);
}
