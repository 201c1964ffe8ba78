#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "libcdr/irf_kernel.hpp"
#include "libcdr/model_types.hpp"
#include "libcdr/parameter_catalog.hpp"

namespace libcdr {

// Affine map between observed response units and modelled units.
struct ResponseScaling {
    double mean{0.0};
    double sd{1.0};
};

struct GroupingFactor {
    std::string name;
    std::vector<std::string> levels;
    std::unordered_map<std::string, std::size_t> level_index;
};

// Random-effect slots for one grouping factor, level-major: level l owns
// slots [offset + l * width, offset + (l + 1) * width).
struct RandomBlock {
    std::size_t factor{0};
    std::size_t offset{0};
    std::size_t width{1};

    [[nodiscard]] std::size_t slot(std::size_t level, std::size_t k = 0) const noexcept {
        return offset + level * width + k;
    }
};

struct PredictorSlots {
    std::string name;
    std::string column;
    std::shared_ptr<const IrfKernel> kernel;
    bool normalized{false};
    std::size_t coefficient{0};
    std::size_t irf_offset{0};
    std::vector<RandomBlock> random_coefficients;
    std::vector<RandomBlock> random_irf;
};

// level_slots[factor][response] is the level of that response, or npos when
// the level was not seen during training and population effects apply.
struct LevelAssignment {
    std::vector<std::vector<std::size_t>> level_slots;
};

// Flat parameter vector layout resolved once from the model specification
// and the grouping levels present in the training responses. In variational
// mode the vector holds the posterior locations followed by one posterior
// scale slot per location.
class ParameterLayout {
public:
    static constexpr std::size_t npos = ParameterCatalog::npos;

    [[nodiscard]] static ParameterLayout build(const ModelSpec& spec, const ResponseTable& training);

    [[nodiscard]] const ModelSpec& spec() const noexcept;

    [[nodiscard]] const ParameterCatalog& catalog() const noexcept;

    [[nodiscard]] bool variational() const noexcept;

    // Number of model parameters (posterior locations in variational mode).
    [[nodiscard]] std::size_t point_size() const noexcept;

    // Length of the flat optimizer vector.
    [[nodiscard]] std::size_t size() const noexcept;

    [[nodiscard]] std::size_t intercept() const noexcept;

    [[nodiscard]] std::size_t noise_scale() const noexcept;

    [[nodiscard]] const std::vector<RandomBlock>& random_intercepts() const noexcept;

    [[nodiscard]] const std::vector<PredictorSlots>& predictors() const noexcept;

    [[nodiscard]] const std::vector<GroupingFactor>& grouping_factors() const noexcept;

    [[nodiscard]] std::vector<std::string> predictor_columns() const;

    [[nodiscard]] const ResponseScaling& scaling() const noexcept;

    [[nodiscard]] std::vector<std::string> names() const;

    // Kernel family, knots and normalisation of every predictor. Families can
    // share parameter names, so two layouts with equal names() may still
    // read the same values differently.
    [[nodiscard]] std::string schema() const;

    [[nodiscard]] std::vector<ParameterGroup> groups() const;

    [[nodiscard]] std::vector<double> initial_parameters() const;

    // Prior location (initial value) and scale per model parameter.
    [[nodiscard]] std::vector<double> prior_means() const;

    [[nodiscard]] std::vector<double> prior_sds() const;

    // Throws DataAlignmentError for an unseen level unless `allow_unseen`.
    [[nodiscard]] LevelAssignment resolve_levels(const ResponseTable& responses, bool allow_unseen) const;

    // Copy of the model parameters with every random-effect slot replaced by
    // its value centred on the mean over levels of its block.
    [[nodiscard]] std::vector<double> centre_random_effects(const std::vector<double>& point) const;

    // Maps a gradient with respect to centred random effects onto the raw slots.
    void uncentre_gradient(std::vector<double>& gradient) const;

    [[nodiscard]] double irf_parameter(const std::vector<double>& parameters, std::size_t predictor, std::size_t k) const;

    [[nodiscard]] double noise_sd(const std::vector<double>& parameters) const;

private:
    ParameterLayout() = default;

    [[nodiscard]] std::vector<RandomBlock> all_blocks() const;

    ModelSpec spec_;
    ParameterCatalog catalog_;
    ResponseScaling scaling_;
    std::size_t intercept_{npos};
    std::size_t noise_{npos};
    std::vector<RandomBlock> random_intercepts_;
    std::vector<PredictorSlots> predictors_;
    std::vector<GroupingFactor> factors_;
};

}  // namespace libcdr
