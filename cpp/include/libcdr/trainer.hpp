#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "libcdr/checkpoint.hpp"
#include "libcdr/errors.hpp"
#include "libcdr/history.hpp"
#include "libcdr/model_state.hpp"
#include "libcdr/model_types.hpp"
#include "libcdr/optimizer.hpp"
#include "libcdr/parameter_layout.hpp"
#include "libcdr/regression_core.hpp"

namespace libcdr {

enum class TrainingState {
    Initialized,
    Running,
    Converged,
    StoppedEarly,
    Failed,
    Terminal
};

[[nodiscard]] std::string to_string(TrainingState state);

struct StepReport {
    std::uint64_t step{0};
    double loss{0.0};
    double learning_rate{0.0};
    std::size_t retained{0};
};

struct TrainingOptions {
    std::size_t batch_size{128};
    std::size_t max_steps{1000};
    AdamOptions adam{};

    // Loss bookkeeping and stopping checks run every `eval_every` steps.
    std::size_t eval_every{50};
    std::size_t patience{0};  // 0 disables early stopping
    double min_delta{0.0};
    bool restore_best{true};
    double convergence_tolerance{0.0};  // relative change of interval loss; 0 disables
    std::size_t convergence_window{3};
    std::optional<double> target_loss{};

    std::size_t checkpoint_every{0};  // 0 = only at the end of a successful run
    std::string checkpoint_path{};    // empty disables checkpointing

    std::uint64_t seed{0};
    bool shuffle{true};

    // Drop responses whose loss exceeds the running mean by this many
    // running standard deviations, once the running estimates have warmed up.
    std::optional<double> loss_filter_n_sds{};
    double ema_decay{0.999};

    bool verbose{false};
    std::function<void(const StepReport&)> on_step{};
};

struct TrainingResult {
    TrainingState outcome{TrainingState::Initialized};
    std::size_t steps{0};
    double final_loss{0.0};
    std::vector<double> training_losses;
    std::vector<double> validation_losses;
    std::optional<ConvergenceFailure> convergence_failure{};
    bool interrupted{false};
};

// Minibatch training driver. Configuration and data alignment are checked
// in the constructor, before any step runs. The trainer keeps references
// into its own datasets and is therefore neither copyable nor movable.
class Trainer {
public:
    Trainer(ModelSpec spec,
            Dataset training,
            TrainingOptions options = {},
            std::optional<Dataset> validation = std::nullopt);

    Trainer(const Trainer&) = delete;
    Trainer& operator=(const Trainer&) = delete;

    // Runs until convergence, early stopping, cancellation or the step
    // budget. A NumericInstabilityError aborts the run and is rethrown with
    // the failing step and the parameters at the start of that step.
    TrainingResult fit();

    // Honoured at the next minibatch boundary; safe to call from any thread.
    void request_stop() noexcept;

    // Restores parameters, optimizer state and loop trackers.
    void resume(const std::string& path);

    void save(const std::string& path) const;

    // Full-batch refinement of point estimates with "lbfgs" or "gradient_descent".
    OptimizationResult refine(const std::string& optimizer_name, const OptimizationOptions& options = {});

    [[nodiscard]] ModelState snapshot() const;

    [[nodiscard]] TrainingState state() const noexcept;

    [[nodiscard]] const std::vector<double>& parameters() const noexcept;

    [[nodiscard]] const AdamState& optimizer_state() const noexcept;

    [[nodiscard]] const TrainingProgress& progress() const noexcept;

    [[nodiscard]] const ParameterLayout& layout() const noexcept;

    [[nodiscard]] const TrainingOptions& options() const noexcept;

    // Mean negative log-likelihood of the validation set (the training set
    // when there is none) at the current parameters, in modelled units.
    [[nodiscard]] double validation_loss();

private:
    struct Split {
        const Dataset& data;
        std::unique_ptr<HistoryAssembler> assembler;
        LevelAssignment levels;
    };

    [[nodiscard]] std::vector<std::size_t> next_batch();
    [[nodiscard]] std::optional<double> loss_cutoff() const;
    void run_step();
    [[nodiscard]] std::optional<TrainingState> evaluate_progress();
    [[nodiscard]] double mean_nll(Split& split, const std::vector<double>& parameters) const;
    void write_checkpoint() const;
    [[nodiscard]] Checkpoint make_checkpoint() const;

    TrainingOptions options_;
    Dataset training_;
    std::optional<Dataset> validation_;
    std::shared_ptr<const ParameterLayout> layout_;
    RegressionCore core_;
    AdamOptimizer adam_;
    std::unique_ptr<Split> train_split_;
    std::unique_ptr<Split> validation_split_;

    std::vector<double> parameters_;
    AdamState adam_state_;
    TrainingProgress progress_;
    TrainingState state_{TrainingState::Initialized};
    std::atomic<bool> stop_requested_{false};

    std::vector<std::size_t> permutation_;
    std::uint64_t permutation_epoch_{0};
    bool has_permutation_{false};
};

}  // namespace libcdr
