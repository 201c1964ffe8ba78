#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "libcdr/checkpoint.hpp"
#include "libcdr/errors.hpp"
#include "libcdr/model_spec.hpp"
#include "libcdr/trainer.hpp"

namespace {
constexpr double kTrueIntercept = 0.5;
constexpr double kTrueCoefficient = 2.0;
constexpr double kTrueRate = 1.5;
constexpr double kNoiseSd = 0.1;

// Responses driven by one exponential IRF over irregular event streams.
libcdr::Dataset make_synthetic(std::uint32_t seed, std::size_t n_series = 4, std::size_t n_responses = 100) {
    std::mt19937 rng(seed);
    std::exponential_distribution<double> gap(2.0);
    std::uniform_real_distribution<double> value(0.5, 1.5);
    std::normal_distribution<double> noise(0.0, kNoiseSd);

    libcdr::Dataset data;
    for (std::size_t s = 0; s < n_series; ++s) {
        const std::string id = "series" + std::to_string(s);
        std::vector<double> times;
        std::vector<double> values;
        double t = 0.0;
        for (int i = 0; i < 60; ++i) {
            t += gap(rng);
            times.push_back(t);
            values.push_back(value(rng));
            data.events.time.push_back(t);
            data.events.series_id.push_back(id);
            data.events.columns["x"].push_back(values.back());
        }
        std::uniform_real_distribution<double> when(1.0, t);
        for (std::size_t r = 0; r < n_responses; ++r) {
            const double at = when(rng);
            double signal = 0.0;
            for (std::size_t e = 0; e < times.size(); ++e) {
                if (times[e] <= at) {
                    signal += values[e] * kTrueRate * std::exp(-kTrueRate * (at - times[e]));
                }
            }
            data.responses.time.push_back(at);
            data.responses.series_id.push_back(id);
            data.responses.observed.push_back(kTrueIntercept + kTrueCoefficient * signal + noise(rng));
        }
    }
    return data;
}

libcdr::ModelSpec make_spec(libcdr::EstimationMode mode = libcdr::EstimationMode::PointEstimate) {
    libcdr::ModelSpecBuilder builder;
    builder.add_predictor("x", "exponential");
    libcdr::HistoryOptions history;
    history.max_lookback = 10.0;
    history.cache_capacity = 64;
    builder.set_history_options(history);
    libcdr::ObjectiveOptions objective;
    objective.mode = mode;
    builder.set_objective_options(objective);
    return builder.build();
}

libcdr::TrainingOptions quick_options(std::size_t max_steps) {
    libcdr::TrainingOptions options;
    options.batch_size = 32;
    options.max_steps = max_steps;
    options.eval_every = 10;
    options.seed = 11;
    options.adam.learning_rate = 0.05;
    return options;
}

std::filesystem::path scratch_path(const std::string& name) {
    auto path = std::filesystem::temp_directory_path() / ("libcdr_trainer_" + name + ".bin");
    std::filesystem::remove(path);
    return path;
}
}  // namespace

TEST_CASE("Training with a fixed seed is reproducible", "[trainer]") {
    const auto data = make_synthetic(3);

    libcdr::Trainer first(make_spec(), data, quick_options(40));
    libcdr::Trainer second(make_spec(), data, quick_options(40));
    const auto a = first.fit();
    const auto b = second.fit();

    REQUIRE(a.steps == 40);
    REQUIRE(first.parameters() == second.parameters());
    REQUIRE(a.training_losses == b.training_losses);

    auto other_seed = quick_options(40);
    other_seed.seed = 12;
    libcdr::Trainer third(make_spec(), data, other_seed);
    third.fit();
    REQUIRE(third.parameters() != first.parameters());
}

TEST_CASE("Training recovers a known exponential response", "[trainer][recovery]") {
    const auto data = make_synthetic(5);

    auto options = quick_options(3000);
    options.batch_size = 64;
    options.eval_every = 100;
    options.adam.decay_rate = 0.5;
    options.adam.decay_steps = 1000;
    options.adam.lr_min = 0.005;
    options.convergence_tolerance = 1e-3;
    libcdr::Trainer trainer(make_spec(), data, options);
    const auto result = trainer.fit();

    REQUIRE(result.steps <= options.max_steps);
    REQUIRE((result.outcome == libcdr::TrainingState::Converged ||
             result.outcome == libcdr::TrainingState::StoppedEarly));
    REQUIRE(trainer.state() == libcdr::TrainingState::Terminal);

    const auto state = trainer.snapshot();
    REQUIRE(state.coefficient("x") == Catch::Approx(kTrueCoefficient).margin(0.2));
    REQUIRE(state.irf_parameters("x")[0] == Catch::Approx(kTrueRate).margin(0.2));
    REQUIRE(state.intercept() == Catch::Approx(kTrueIntercept).margin(0.2));

    SECTION("full-batch refinement tightens the estimate") {
        const double before = trainer.validation_loss();
        const auto refined = trainer.refine("lbfgs");
        REQUIRE(std::isfinite(refined.objective_value));
        REQUIRE(trainer.validation_loss() <= before + 1e-9);

        const auto tightened = trainer.snapshot();
        REQUIRE(tightened.coefficient("x") == Catch::Approx(kTrueCoefficient).margin(0.1));
        REQUIRE(tightened.irf_parameters("x")[0] == Catch::Approx(kTrueRate).margin(0.1));
        REQUIRE(tightened.noise_sd() == Catch::Approx(kNoiseSd).margin(0.05));
    }
}

TEST_CASE("An exhausted step budget reports a convergence failure", "[trainer]") {
    const auto data = make_synthetic(7);
    auto options = quick_options(20);
    options.convergence_tolerance = 1e-12;
    libcdr::Trainer trainer(make_spec(), data, options);
    const auto result = trainer.fit();

    REQUIRE(result.outcome == libcdr::TrainingState::StoppedEarly);
    REQUIRE(result.steps == 20);
    REQUIRE(result.convergence_failure.has_value());
    REQUIRE(result.convergence_failure->steps == 20);
    REQUIRE_FALSE(result.interrupted);
    REQUIRE(result.training_losses.size() == 2);
}

TEST_CASE("Reaching the target loss converges", "[trainer]") {
    const auto data = make_synthetic(7);
    auto options = quick_options(500);
    options.target_loss = 1e12;
    libcdr::Trainer trainer(make_spec(), data, options);
    const auto result = trainer.fit();

    REQUIRE(result.outcome == libcdr::TrainingState::Converged);
    REQUIRE(result.steps == options.eval_every);
    REQUIRE_FALSE(result.convergence_failure.has_value());
}

TEST_CASE("Early stopping restores the best parameters", "[trainer]") {
    const auto data = make_synthetic(9);
    const auto validation = make_synthetic(10, 2, 40);
    auto options = quick_options(500);
    options.patience = 1;
    options.min_delta = 1e9;  // no evaluation after the first can improve
    libcdr::Trainer trainer(make_spec(), data, options, validation);
    const auto result = trainer.fit();

    REQUIRE(result.outcome == libcdr::TrainingState::StoppedEarly);
    REQUIRE(result.steps == 2 * options.eval_every);
    REQUIRE_FALSE(result.convergence_failure.has_value());
    REQUIRE(result.validation_losses.size() == 2);
    REQUIRE(trainer.parameters() == trainer.progress().best_parameters);
}

TEST_CASE("A stop request ends training at the next minibatch boundary", "[trainer]") {
    const auto data = make_synthetic(13);
    auto options = quick_options(500);
    libcdr::Trainer* self = nullptr;
    std::size_t reports = 0;
    options.on_step = [&](const libcdr::StepReport& report) {
        ++reports;
        REQUIRE(std::isfinite(report.loss));
        REQUIRE(report.retained == 32);
        if (report.step == 5) {
            self->request_stop();
        }
    };
    libcdr::Trainer trainer(make_spec(), data, options);
    self = &trainer;
    const auto result = trainer.fit();

    REQUIRE(result.interrupted);
    REQUIRE(result.outcome == libcdr::TrainingState::StoppedEarly);
    REQUIRE(result.steps == 5);
    REQUIRE(reports == 5);
    REQUIRE(trainer.state() == libcdr::TrainingState::Terminal);
}

TEST_CASE("Resuming from a checkpoint continues the same trajectory", "[trainer][checkpoint]") {
    const auto data = make_synthetic(17);

    libcdr::Trainer uninterrupted(make_spec(), data, quick_options(40));
    uninterrupted.fit();

    const auto path = scratch_path("resume");
    auto first_half = quick_options(20);
    first_half.checkpoint_path = path.string();
    libcdr::Trainer before(make_spec(), data, first_half);
    before.fit();
    REQUIRE(std::filesystem::exists(path));

    libcdr::Trainer after(make_spec(), data, quick_options(40));
    after.resume(path.string());
    REQUIRE(after.progress().step == 20);
    REQUIRE(after.parameters() == before.parameters());
    REQUIRE(after.optimizer_state().step == before.optimizer_state().step);
    const auto result = after.fit();

    REQUIRE(result.steps == 40);
    REQUIRE(after.parameters() == uninterrupted.parameters());
    std::filesystem::remove(path);
}

TEST_CASE("Saved models reload with identical predictions", "[trainer][checkpoint]") {
    const auto data = make_synthetic(19);
    libcdr::Trainer trainer(make_spec(), data, quick_options(30));
    trainer.fit();
    const auto path = scratch_path("reload");
    trainer.save(path.string());

    libcdr::Trainer restored(make_spec(), data, quick_options(30));
    restored.resume(path.string());
    REQUIRE(restored.parameters() == trainer.parameters());
    REQUIRE(restored.validation_loss() == trainer.validation_loss());
    std::filesystem::remove(path);
}

TEST_CASE("Checkpoints from a different model are refused", "[trainer][checkpoint]") {
    const auto data = make_synthetic(23);
    libcdr::Trainer trainer(make_spec(), data, quick_options(10));
    trainer.fit();
    const auto path = scratch_path("schema");
    trainer.save(path.string());

    libcdr::ModelSpecBuilder builder;
    builder.add_predictor("x", "gamma");
    libcdr::Trainer other(builder.build(), data, quick_options(10));
    REQUIRE_THROWS_AS(other.resume(path.string()), libcdr::CheckpointVersionError);

    libcdr::Trainer variational(make_spec(libcdr::EstimationMode::Variational), data, quick_options(10));
    REQUIRE_THROWS_AS(variational.resume(path.string()), libcdr::CheckpointVersionError);
    std::filesystem::remove(path);
}

TEST_CASE("Kernels sharing parameter names do not share checkpoints", "[trainer][checkpoint]") {
    const auto data = make_synthetic(41, 2, 20);
    const auto path = scratch_path("family");
    const auto build = [](const std::string& family, std::vector<double> knots, bool normalized) {
        libcdr::ModelSpecBuilder builder;
        builder.add_predictor("x", family);
        if (!knots.empty()) {
            builder.set_irf_knots("x", std::move(knots));
        }
        builder.set_irf_normalized("x", normalized);
        return builder.build();
    };

    libcdr::Trainer gamma(build("gamma", {}, false), data, quick_options(10));
    libcdr::Trainer gamma_kgt1(build("gamma_kgt1", {}, false), data, quick_options(10));
    REQUIRE(gamma.layout().names() == gamma_kgt1.layout().names());
    gamma.save(path.string());
    REQUIRE_THROWS_AS(gamma_kgt1.resume(path.string()), libcdr::CheckpointVersionError);

    libcdr::Trainer normalized(build("gamma", {}, true), data, quick_options(10));
    REQUIRE_THROWS_AS(normalized.resume(path.string()), libcdr::CheckpointVersionError);

    libcdr::Trainer basis(build("basis", {0.0, 1.0, 2.0}, false), data, quick_options(10));
    libcdr::Trainer shifted_knots(build("basis", {0.0, 1.5, 3.0}, false), data, quick_options(10));
    REQUIRE(basis.layout().names() == shifted_knots.layout().names());
    basis.save(path.string());
    REQUIRE_THROWS_AS(shifted_knots.resume(path.string()), libcdr::CheckpointVersionError);

    libcdr::Trainer same_knots(build("basis", {0.0, 1.0, 2.0}, false), data, quick_options(10));
    same_knots.resume(path.string());
    REQUIRE(same_knots.parameters() == basis.parameters());
    std::filesystem::remove(path);
}

TEST_CASE("A stop request during the final step does not carry over", "[trainer]") {
    const auto data = make_synthetic(43);
    const auto path = scratch_path("stale_stop");
    auto options = quick_options(100);
    options.target_loss = 1e12;
    libcdr::Trainer* self = nullptr;
    options.on_step = [&](const libcdr::StepReport& report) {
        if (report.step == options.eval_every) {
            self->request_stop();
        }
    };
    libcdr::Trainer trainer(make_spec(), data, options);
    self = &trainer;
    trainer.save(path.string());

    const auto first = trainer.fit();
    REQUIRE(first.outcome == libcdr::TrainingState::Converged);
    REQUIRE_FALSE(first.interrupted);

    trainer.resume(path.string());
    const auto second = trainer.fit();
    REQUIRE(second.outcome == libcdr::TrainingState::Converged);
    REQUIRE_FALSE(second.interrupted);
    REQUIRE(second.steps == options.eval_every);
    std::filesystem::remove(path);
}

TEST_CASE("Configuration and alignment errors surface before training", "[trainer]") {
    auto data = make_synthetic(29, 2, 10);

    auto no_batch = quick_options(10);
    no_batch.batch_size = 0;
    REQUIRE_THROWS_AS(libcdr::Trainer(make_spec(), data, no_batch), libcdr::ConfigurationError);

    auto orphan_checkpoints = quick_options(10);
    orphan_checkpoints.checkpoint_every = 5;
    REQUIRE_THROWS_AS(libcdr::Trainer(make_spec(), data, orphan_checkpoints), libcdr::ConfigurationError);

    libcdr::ModelSpecBuilder builder;
    builder.add_predictor("x", "exponential", "missing_column");
    REQUIRE_THROWS_AS(libcdr::Trainer(builder.build(), data, quick_options(10)), libcdr::ConfigurationError);

    auto orphan = data;
    orphan.responses.series_id[0] = "unknown";
    REQUIRE_THROWS_AS(libcdr::Trainer(make_spec(), orphan, quick_options(10)), libcdr::DataAlignmentError);

    libcdr::Dataset empty_validation;
    empty_validation.events = data.events;
    REQUIRE_THROWS_AS(libcdr::Trainer(make_spec(), data, quick_options(10), empty_validation),
                      libcdr::DataAlignmentError);
}

TEST_CASE("Non-finite losses abort training with a snapshot", "[trainer][failure]") {
    auto data = make_synthetic(31, 2, 10);
    for (auto& y : data.responses.observed) {
        y = 1e200;
    }
    data.responses.observed[0] = 2e200;

    const auto path = scratch_path("failure");
    auto options = quick_options(10);
    options.checkpoint_path = path.string();
    libcdr::Trainer trainer(make_spec(), data, options);

    SECTION("without an earlier checkpoint") {}
    std::vector<char> existing;
    SECTION("over an earlier checkpoint") {
        trainer.save(path.string());
        std::ifstream in(path, std::ios::binary);
        existing.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        REQUIRE_FALSE(existing.empty());
    }

    bool thrown = false;
    try {
        trainer.fit();
    } catch (const libcdr::NumericInstabilityError& e) {
        thrown = true;
        REQUIRE(e.has_step());
        REQUIRE(e.step() == 0);
        REQUIRE(e.parameter_snapshot().size() == trainer.layout().size());
    }
    REQUIRE(thrown);
    REQUIRE(trainer.state() == libcdr::TrainingState::Terminal);
    if (existing.empty()) {
        REQUIRE_FALSE(std::filesystem::exists(path));
    } else {
        std::ifstream in(path, std::ios::binary);
        const std::vector<char> after(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>{});
        REQUIRE(after == existing);
    }
    std::filesystem::remove(path);
}

TEST_CASE("Variational training updates posterior scales", "[trainer][variational]") {
    const auto data = make_synthetic(37);
    libcdr::Trainer trainer(make_spec(libcdr::EstimationMode::Variational), data, quick_options(30));
    const auto result = trainer.fit();

    REQUIRE(result.steps == 30);
    const auto state = trainer.snapshot();
    REQUIRE(state.parameters().size() == 2 * state.layout().point_size());
    const auto sds = state.posterior_sds();
    REQUIRE(sds.size() == state.layout().point_size());
    for (double sd : sds) {
        REQUIRE(sd > 0.0);
        REQUIRE(std::isfinite(sd));
    }
    REQUIRE_THROWS_AS(trainer.refine("lbfgs"), libcdr::ConfigurationError);
}
