#pragma once

#include <vector>

#include <Eigen/Dense>

#include "libcdr/history.hpp"
#include "libcdr/irf_kernel.hpp"
#include "libcdr/parameter_layout.hpp"

namespace libcdr {

// One row of a padded batch matrix; rows of column-major storage are strided.
using WindowRow = Eigen::Ref<const Eigen::RowVectorXd, 0, Eigen::InnerStride<>>;

struct ConvolutionResult {
    Eigen::MatrixXd features;  // batch x predictors
    // Per predictor, batch x kernel parameters: d feature / d unconstrained
    // IRF parameter of that response.
    std::vector<Eigen::MatrixXd> d_features;
};

// Discretised causal convolution: events are point masses, so the
// convolution integral reduces to a kernel-weighted sum over the window.
class ConvolutionEngine {
public:
    explicit ConvolutionEngine(const ParameterLayout& layout);

    // Masked weighted sum over one padded window row, accumulated in long
    // double. An empty window yields exactly 0. `d_params` receives
    // d result / d constrained kernel parameter when non-null.
    [[nodiscard]] static double convolve(const IrfKernel& kernel,
                                         const std::vector<double>& params,
                                         const WindowRow& lags,
                                         const WindowRow& values,
                                         const WindowRow& mask,
                                         bool normalized,
                                         std::vector<double>* d_params = nullptr);

    // Unconstrained IRF parameters of `predictor` for one response: fixed
    // values plus the centred deviation of each grouping level the IRF is
    // keyed on.
    [[nodiscard]] std::vector<double> response_irf_parameters(const std::vector<double>& centred,
                                                              std::size_t predictor,
                                                              const LevelAssignment& levels,
                                                              std::size_t response) const;

    // `centred` is the output of ParameterLayout::centre_random_effects.
    [[nodiscard]] ConvolutionResult convolve_batch(const HistoryBatch& batch,
                                                   const std::vector<double>& centred,
                                                   const LevelAssignment& levels,
                                                   bool with_gradient) const;

private:
    const ParameterLayout& layout_;
};

}  // namespace libcdr
