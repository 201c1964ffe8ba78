#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "libcdr/model_types.hpp"
#include "libcdr/optimizer.hpp"
#include "libcdr/parameter_layout.hpp"

namespace libcdr {

inline constexpr std::uint32_t kCheckpointFormatVersion = 2;

// Loop position and convergence trackers; enough to continue a run so that
// the following steps are bit-identical to an uninterrupted one.
struct TrainingProgress {
    std::uint64_t step{0};
    std::uint64_t epoch{0};
    std::uint64_t cursor{0};  // position within the current epoch permutation
    std::uint64_t evaluations{0};
    std::uint64_t bad_evaluations{0};
    std::uint64_t stable_evaluations{0};
    double best_loss{0.0};
    bool has_best{false};
    double previous_interval_loss{0.0};
    bool has_previous_interval{false};
    double interval_loss_sum{0.0};
    std::uint64_t interval_steps{0};
    double loss_ema{0.0};
    double loss_sd_ema{0.0};
    std::vector<double> best_parameters;
    std::vector<double> training_losses;
    std::vector<double> validation_losses;
};

struct Checkpoint {
    std::uint32_t version{kCheckpointFormatVersion};
    EstimationMode mode{EstimationMode::PointEstimate};
    std::uint64_t seed{0};
    ResponseScaling scaling{};
    std::string schema;
    std::vector<std::string> parameter_names;
    std::vector<double> parameters;
    AdamState optimizer;
    TrainingProgress progress;
};

// Writes to a temporary file beside `path` and renames it into place, so an
// existing checkpoint is only ever replaced by a complete one.
void save_checkpoint(const std::string& path, const Checkpoint& checkpoint);

// Throws CheckpointVersionError on a foreign, incompatible or truncated file.
[[nodiscard]] Checkpoint load_checkpoint(const std::string& path);

}  // namespace libcdr
