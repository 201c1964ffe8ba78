#pragma once

#include <optional>
#include <random>
#include <vector>

#include <Eigen/Dense>

#include "libcdr/convolution.hpp"
#include "libcdr/history.hpp"
#include "libcdr/optimizer.hpp"
#include "libcdr/parameter_layout.hpp"

namespace libcdr {

// Everything the objective needs about a minibatch that does not depend on
// the parameters.
struct BatchInputs {
    HistoryBatch history;
    std::vector<double> observed;  // modelled (possibly standardised) units, one per batch row
    const LevelAssignment& levels;  // indexed by history.responses; must outlive the batch
};

// Assembles the histories of `indices` and the standardised observations.
[[nodiscard]] BatchInputs make_batch_inputs(HistoryAssembler& assembler,
                                            const ResponseTable& responses,
                                            const std::vector<std::size_t>& indices,
                                            const ParameterLayout& layout,
                                            const LevelAssignment& levels);

struct ObjectiveEvaluation {
    double loss{0.0};
    double log_likelihood{0.0};  // sum over the batch, modelled units (sample mean when variational)
    double penalty{0.0};         // random-effect shrinkage (point estimate)
    double kl{0.0};              // KL(q || prior) (variational)
    std::vector<double> gradient;
    std::vector<double> response_nll;  // per batch row, first sample when variational
    std::size_t retained{0};
};

struct ForwardPass {
    std::vector<double> mean;
    ConvolutionResult convolution;
    Eigen::MatrixXd coefficients;  // effective coefficient per (row, predictor)
};

// Gaussian likelihood of responses given convolved predictors and the
// current coefficients. Computes the objective and its gradient with
// respect to every slot of the flat parameter vector; never mutates state.
class RegressionCore {
public:
    explicit RegressionCore(const ParameterLayout& layout);

    // `data_scale` multiplies the data term (N / batch size gives an
    // unbiased full-data objective). `rng` is required in variational mode.
    // Rows whose negative log-likelihood exceeds `loss_cutoff` are dropped
    // from loss and gradient.
    [[nodiscard]] ObjectiveEvaluation evaluate(const std::vector<double>& parameters,
                                               const BatchInputs& batch,
                                               double data_scale,
                                               std::mt19937_64* rng = nullptr,
                                               std::optional<double> loss_cutoff = std::nullopt) const;

    // Predicted means in modelled units from model parameters (posterior
    // locations when variational).
    [[nodiscard]] std::vector<double> predict(const std::vector<double>& point, const BatchInputs& batch) const;

    [[nodiscard]] ForwardPass forward(const std::vector<double>& centred,
                                      const BatchInputs& batch,
                                      bool with_gradient) const;

    [[nodiscard]] const ParameterLayout& layout() const noexcept;

private:
    // Data term at model parameters `point`; gradient is with respect to raw slots.
    double data_term(const std::vector<double>& point,
                     const BatchInputs& batch,
                     double data_scale,
                     std::optional<double> loss_cutoff,
                     std::vector<double>& gradient,
                     ObjectiveEvaluation& eval) const;

    void backward(const ForwardPass& pass,
                  const BatchInputs& batch,
                  const std::vector<double>& d_mean,
                  std::vector<double>& gradient) const;

    const ParameterLayout& layout_;
    ConvolutionEngine engine_;
};

// Adapts the core to the full-batch optimizer interface (point estimates).
class FullBatchObjective final : public ObjectiveFunction {
public:
    FullBatchObjective(const RegressionCore& core, const BatchInputs& batch);

    [[nodiscard]] double value(const std::vector<double>& parameters) const override;

    [[nodiscard]] std::vector<double> gradient(const std::vector<double>& parameters) const override;

    [[nodiscard]] double value_and_gradient(const std::vector<double>& parameters,
                                            std::vector<double>& gradient) const override;

private:
    const RegressionCore& core_;
    const BatchInputs& batch_;
};

}  // namespace libcdr
