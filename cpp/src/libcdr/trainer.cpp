#include "libcdr/trainer.hpp"

#include "libcdr/model_spec.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <numbers>
#include <numeric>
#include <random>
#include <stdexcept>
#include <utility>

namespace libcdr {

namespace {

constexpr std::uint64_t kEpochStream = 0x65706f6368ULL;
constexpr std::uint64_t kStepStream = 0x73746570ULL;

std::uint64_t splitmix64(std::uint64_t x) {
    x += 0x9e3779b97f4a7c15ULL;
    x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
    x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
    return x ^ (x >> 31);
}

// Independent stream per (seed, purpose, index): resumed runs regenerate
// the same draws without storing generator state.
std::uint64_t derive_seed(std::uint64_t seed, std::uint64_t stream, std::uint64_t index) {
    return splitmix64(splitmix64(seed ^ stream) + index);
}

void validate_options(const TrainingOptions& options) {
    if (options.batch_size == 0) {
        throw ConfigurationError("batch size must be positive");
    }
    if (options.eval_every == 0) {
        throw ConfigurationError("eval_every must be positive");
    }
    if (options.convergence_tolerance < 0.0) {
        throw ConfigurationError("convergence tolerance must be non-negative");
    }
    if (options.convergence_tolerance > 0.0 && options.convergence_window == 0) {
        throw ConfigurationError("convergence window must be positive");
    }
    if (options.min_delta < 0.0) {
        throw ConfigurationError("min_delta must be non-negative");
    }
    if (options.loss_filter_n_sds) {
        if (!(*options.loss_filter_n_sds > 0.0)) {
            throw ConfigurationError("loss filter width must be positive");
        }
        if (!(options.ema_decay > 0.0 && options.ema_decay < 1.0)) {
            throw ConfigurationError("ema decay must lie in (0, 1)");
        }
    }
    if (options.checkpoint_every > 0 && options.checkpoint_path.empty()) {
        throw ConfigurationError("checkpoint_every requires a checkpoint path");
    }
}

ParameterLayout build_layout(const ModelSpec& spec, const Dataset& training, const TrainingOptions& options) {
    validate_options(options);
    validate_model_spec(spec);
    validate_model_data(spec, training.events, training.responses);
    return ParameterLayout::build(spec, training.responses);
}

}  // namespace

std::string to_string(TrainingState state) {
    switch (state) {
    case TrainingState::Initialized:
        return "initialized";
    case TrainingState::Running:
        return "running";
    case TrainingState::Converged:
        return "converged";
    case TrainingState::StoppedEarly:
        return "stopped_early";
    case TrainingState::Failed:
        return "failed";
    case TrainingState::Terminal:
        return "terminal";
    }
    return "unknown";
}

Trainer::Trainer(ModelSpec spec, Dataset training, TrainingOptions options, std::optional<Dataset> validation)
    : options_(std::move(options)),
      training_(std::move(training)),
      validation_(std::move(validation)),
      layout_(std::make_shared<const ParameterLayout>(build_layout(spec, training_, options_))),
      core_(*layout_),
      adam_(options_.adam, layout_->groups()) {
    const auto make_split = [this](const Dataset& data, bool check_columns) {
        if (check_columns) {
            validate_model_data(layout_->spec(), data.events, data.responses);
        }
        auto assembler = std::make_unique<HistoryAssembler>(data.events, layout_->spec().history);
        assembler->validate(data.responses);
        auto levels = layout_->resolve_levels(data.responses, false);
        return std::make_unique<Split>(Split{data, std::move(assembler), std::move(levels)});
    };
    train_split_ = make_split(training_, false);
    if (validation_) {
        if (validation_->responses.size() == 0) {
            throw DataAlignmentError("validation responses are empty");
        }
        validation_split_ = make_split(*validation_, true);
    }

    parameters_ = layout_->initial_parameters();
    adam_state_ = adam_.initial_state();
}

void Trainer::request_stop() noexcept {
    stop_requested_.store(true);
}

TrainingState Trainer::state() const noexcept {
    return state_;
}

const std::vector<double>& Trainer::parameters() const noexcept {
    return parameters_;
}

const AdamState& Trainer::optimizer_state() const noexcept {
    return adam_state_;
}

const TrainingProgress& Trainer::progress() const noexcept {
    return progress_;
}

const ParameterLayout& Trainer::layout() const noexcept {
    return *layout_;
}

const TrainingOptions& Trainer::options() const noexcept {
    return options_;
}

ModelState Trainer::snapshot() const {
    return ModelState(layout_, parameters_);
}

std::vector<std::size_t> Trainer::next_batch() {
    const std::size_t n = training_.responses.size();
    if (!has_permutation_ || permutation_epoch_ != progress_.epoch) {
        permutation_.resize(n);
        std::iota(permutation_.begin(), permutation_.end(), std::size_t{0});
        if (options_.shuffle) {
            std::mt19937_64 rng(derive_seed(options_.seed, kEpochStream, progress_.epoch));
            std::shuffle(permutation_.begin(), permutation_.end(), rng);
        }
        permutation_epoch_ = progress_.epoch;
        has_permutation_ = true;
    }
    const auto begin = static_cast<std::size_t>(progress_.cursor);
    const std::size_t end = std::min(n, begin + options_.batch_size);
    return std::vector<std::size_t>(permutation_.begin() + static_cast<std::ptrdiff_t>(begin),
                                    permutation_.begin() + static_cast<std::ptrdiff_t>(end));
}

std::optional<double> Trainer::loss_cutoff() const {
    if (!options_.loss_filter_n_sds) {
        return std::nullopt;
    }
    const auto warm_up = static_cast<std::uint64_t>(2.0 / (1.0 - options_.ema_decay));
    if (progress_.step <= warm_up) {
        return std::nullopt;
    }
    return progress_.loss_ema + *options_.loss_filter_n_sds * progress_.loss_sd_ema;
}

void Trainer::run_step() {
    const std::size_t n = training_.responses.size();
    const auto indices = next_batch();
    const auto inputs = make_batch_inputs(*train_split_->assembler, training_.responses, indices, *layout_,
                                          train_split_->levels);

    std::mt19937_64 rng(derive_seed(options_.seed, kStepStream, progress_.step));
    const double data_scale = static_cast<double>(n) / static_cast<double>(indices.size());
    const auto cutoff = loss_cutoff();
    const auto eval = core_.evaluate(parameters_, inputs, data_scale, &rng, cutoff);

    AdamState next_state = adam_state_;
    auto next = adam_.step(parameters_, eval.gradient, next_state);
    require_finite(next, "updated parameter");

    double loss_ema = progress_.loss_ema;
    double loss_sd_ema = progress_.loss_sd_ema;
    if (options_.loss_filter_n_sds) {
        double sum = 0.0;
        double squares = 0.0;
        std::size_t kept = 0;
        for (double nll : eval.response_nll) {
            if (cutoff && nll > *cutoff) {
                continue;
            }
            sum += nll;
            squares += (nll - loss_ema) * (nll - loss_ema);
            ++kept;
        }
        if (kept > 0) {
            const double beta = options_.ema_decay;
            const double k = static_cast<double>(kept);
            loss_ema = beta * loss_ema + (1.0 - beta) * (sum / k);
            loss_sd_ema = beta * loss_sd_ema + (1.0 - beta) * std::sqrt(squares / k);
        }
    }

    // Commit.
    const double lr = adam_.learning_rate(adam_state_.step);
    parameters_ = std::move(next);
    adam_state_ = std::move(next_state);
    progress_.loss_ema = loss_ema;
    progress_.loss_sd_ema = loss_sd_ema;
    progress_.interval_loss_sum += eval.loss;
    ++progress_.interval_steps;
    ++progress_.step;
    progress_.cursor += indices.size();
    if (progress_.cursor >= n) {
        progress_.cursor = 0;
        ++progress_.epoch;
    }

    if (options_.on_step) {
        options_.on_step(StepReport{progress_.step, eval.loss, lr, eval.retained});
    }
}

double Trainer::mean_nll(Split& split, const std::vector<double>& parameters) const {
    const std::size_t n = split.data.responses.size();
    const double sigma = layout_->noise_sd(parameters);
    const double variance = sigma * sigma;
    const double log_norm = 0.5 * (std::log(2.0 * std::numbers::pi_v<double>) + std::log(variance));

    double total = 0.0;
    std::vector<std::size_t> indices;
    for (std::size_t start = 0; start < n; start += options_.batch_size) {
        const std::size_t end = std::min(n, start + options_.batch_size);
        indices.resize(end - start);
        std::iota(indices.begin(), indices.end(), start);
        const auto inputs = make_batch_inputs(*split.assembler, split.data.responses, indices, *layout_, split.levels);
        const auto mean = core_.predict(parameters, inputs);
        for (std::size_t b = 0; b < mean.size(); ++b) {
            const double residual = inputs.observed[b] - mean[b];
            total += log_norm + 0.5 * residual * residual / variance;
        }
    }
    const double out = total / static_cast<double>(n);
    require_finite(out, "validation loss");
    return out;
}

double Trainer::validation_loss() {
    return mean_nll(validation_split_ ? *validation_split_ : *train_split_, parameters_);
}

std::optional<TrainingState> Trainer::evaluate_progress() {
    if (progress_.interval_steps == 0) {
        return std::nullopt;
    }
    const double interval = progress_.interval_loss_sum / static_cast<double>(progress_.interval_steps);
    const double validation = validation_split_ ? mean_nll(*validation_split_, parameters_) : interval;
    progress_.training_losses.push_back(interval);
    progress_.validation_losses.push_back(validation);
    progress_.interval_loss_sum = 0.0;
    progress_.interval_steps = 0;
    ++progress_.evaluations;

    if (!progress_.has_best || validation < progress_.best_loss - options_.min_delta) {
        progress_.best_loss = validation;
        progress_.has_best = true;
        progress_.bad_evaluations = 0;
        if (options_.patience > 0 && options_.restore_best) {
            progress_.best_parameters = parameters_;
        }
    } else {
        ++progress_.bad_evaluations;
    }

    if (options_.convergence_tolerance > 0.0 && progress_.has_previous_interval) {
        const double scale = std::max(std::abs(progress_.previous_interval_loss), 1e-12);
        const double relative = std::abs(interval - progress_.previous_interval_loss) / scale;
        progress_.stable_evaluations = relative < options_.convergence_tolerance ? progress_.stable_evaluations + 1 : 0;
    }
    progress_.previous_interval_loss = interval;
    progress_.has_previous_interval = true;

    if (options_.verbose) {
        std::cout << "step " << progress_.step << ": train loss = " << interval;
        if (validation_split_) {
            std::cout << ", validation loss = " << validation;
        }
        std::cout << ", lr = " << adam_.learning_rate(adam_state_.step) << std::endl;
    }

    if (options_.target_loss && interval <= *options_.target_loss) {
        return TrainingState::Converged;
    }
    if (options_.convergence_tolerance > 0.0 && progress_.stable_evaluations >= options_.convergence_window) {
        return TrainingState::Converged;
    }
    if (options_.patience > 0 && progress_.bad_evaluations >= options_.patience) {
        if (options_.restore_best && !progress_.best_parameters.empty()) {
            parameters_ = progress_.best_parameters;
        }
        return TrainingState::StoppedEarly;
    }
    return std::nullopt;
}

TrainingResult Trainer::fit() {
    if (state_ == TrainingState::Running) {
        throw std::logic_error("training is already running");
    }
    state_ = TrainingState::Running;

    TrainingResult result;
    std::optional<TrainingState> outcome;
    try {
        while (progress_.step < options_.max_steps) {
            if (stop_requested_.exchange(false)) {
                result.interrupted = true;
                outcome = TrainingState::StoppedEarly;
                break;
            }
            run_step();
            if (progress_.step % options_.eval_every == 0) {
                outcome = evaluate_progress();
            }
            if (outcome) {
                break;
            }
            if (options_.checkpoint_every > 0 && progress_.step % options_.checkpoint_every == 0) {
                write_checkpoint();
            }
        }
    } catch (const NumericInstabilityError& e) {
        stop_requested_.store(false);
        state_ = TrainingState::Failed;
        if (options_.verbose) {
            std::cerr << "Training failed at step " << progress_.step << ": " << e.what() << std::endl;
        }
        state_ = TrainingState::Terminal;
        if (e.has_step()) {
            throw;
        }
        throw NumericInstabilityError(e.what(), static_cast<std::size_t>(progress_.step), parameters_);
    } catch (const std::exception&) {
        stop_requested_.store(false);
        state_ = TrainingState::Terminal;
        throw;
    }
    // A request that arrived during the final step must not end the next run.
    stop_requested_.store(false);

    if (progress_.interval_steps > 0) {
        result.final_loss = progress_.interval_loss_sum / static_cast<double>(progress_.interval_steps);
    } else if (!progress_.training_losses.empty()) {
        result.final_loss = progress_.training_losses.back();
    }
    if (!outcome) {
        outcome = TrainingState::StoppedEarly;
        result.convergence_failure = ConvergenceFailure{
            "step budget of " + std::to_string(options_.max_steps) + " exhausted before convergence",
            static_cast<std::size_t>(progress_.step), result.final_loss};
    }
    state_ = *outcome;

    if (!options_.checkpoint_path.empty()) {
        write_checkpoint();
    }

    result.outcome = *outcome;
    result.steps = static_cast<std::size_t>(progress_.step);
    result.training_losses = progress_.training_losses;
    result.validation_losses = progress_.validation_losses;
    if (options_.verbose) {
        std::cout << "Training " << to_string(result.outcome) << " after " << result.steps << " steps";
        if (result.interrupted) {
            std::cout << " (interrupted)";
        }
        std::cout << std::endl;
    }
    state_ = TrainingState::Terminal;
    return result;
}

Checkpoint Trainer::make_checkpoint() const {
    Checkpoint checkpoint;
    checkpoint.mode = layout_->spec().objective.mode;
    checkpoint.seed = options_.seed;
    checkpoint.scaling = layout_->scaling();
    checkpoint.schema = layout_->schema();
    checkpoint.parameter_names = layout_->names();
    checkpoint.parameters = parameters_;
    checkpoint.optimizer = adam_state_;
    checkpoint.progress = progress_;
    return checkpoint;
}

void Trainer::write_checkpoint() const {
    save_checkpoint(options_.checkpoint_path, make_checkpoint());
}

void Trainer::save(const std::string& path) const {
    save_checkpoint(path, make_checkpoint());
}

void Trainer::resume(const std::string& path) {
    if (state_ == TrainingState::Running) {
        throw std::logic_error("cannot resume while training is running");
    }
    auto checkpoint = load_checkpoint(path);
    if (checkpoint.mode != layout_->spec().objective.mode || checkpoint.schema != layout_->schema() ||
        checkpoint.parameter_names != layout_->names()) {
        throw CheckpointVersionError("checkpoint " + path + " does not match the model parameter layout");
    }
    const auto& scaling = layout_->scaling();
    if (checkpoint.scaling.mean != scaling.mean || checkpoint.scaling.sd != scaling.sd) {
        throw CheckpointVersionError("checkpoint " + path + " was written for a different response scaling");
    }
    if (!checkpoint.progress.best_parameters.empty() &&
        checkpoint.progress.best_parameters.size() != checkpoint.parameters.size()) {
        throw CheckpointVersionError("corrupt checkpoint " + path + ": best parameters have the wrong length");
    }
    if (checkpoint.seed != options_.seed) {
        std::cerr << "Warning: checkpoint seed " << checkpoint.seed << " differs from configured seed "
                  << options_.seed << "; subsequent batches will differ from the original run" << std::endl;
    }
    require_finite(checkpoint.parameters, "checkpoint parameter");

    parameters_ = std::move(checkpoint.parameters);
    adam_state_ = std::move(checkpoint.optimizer);
    progress_ = std::move(checkpoint.progress);
    has_permutation_ = false;
    state_ = TrainingState::Initialized;
}

OptimizationResult Trainer::refine(const std::string& optimizer_name, const OptimizationOptions& options) {
    if (state_ == TrainingState::Running) {
        throw std::logic_error("cannot refine while training is running");
    }
    if (layout_->variational()) {
        throw ConfigurationError("full-batch refinement requires point estimation");
    }
    const auto optimizer = make_optimizer(optimizer_name);

    std::vector<std::size_t> all(training_.responses.size());
    std::iota(all.begin(), all.end(), std::size_t{0});
    const auto inputs = make_batch_inputs(*train_split_->assembler, training_.responses, all, *layout_,
                                          train_split_->levels);
    FullBatchObjective objective(core_, inputs);
    auto result = optimizer->optimize(objective, parameters_, options);
    require_finite(result.parameters, "refined parameter");
    parameters_ = result.parameters;

    if (options_.verbose) {
        std::cout << optimizer->name() << " refinement: objective = " << result.objective_value
                  << ", gradient norm = " << result.gradient_norm << ", iterations = " << result.iterations
                  << (result.converged ? " (converged)" : "") << std::endl;
    }
    return result;
}

}  // namespace libcdr
