#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "libcdr/parameter.hpp"

namespace libcdr {

struct OptimizationOptions {
    std::size_t max_iterations{1000};
    double tolerance{1e-6};
    double learning_rate{0.1};

    // L-BFGS specific options
    int m{6}; // History size
    int past{0}; // Distance for delta-based convergence
    double delta{0.0}; // Delta for convergence test
    int max_linesearch{20}; // Max line search trials
    std::string linesearch_type{"strong_wolfe"}; // "armijo", "wolfe", "strong_wolfe"
};

struct OptimizationResult {
    std::vector<double> parameters;
    double objective_value{0.0};
    double gradient_norm{0.0};
    std::size_t iterations{0};
    bool converged{false};
};

class ObjectiveFunction {
public:
    virtual ~ObjectiveFunction() = default;

    [[nodiscard]] virtual double value(const std::vector<double>& parameters) const = 0;

    [[nodiscard]] virtual std::vector<double> gradient(const std::vector<double>& parameters) const = 0;

    // Fused evaluation; the default calls value and gradient separately.
    [[nodiscard]] virtual double value_and_gradient(const std::vector<double>& parameters,
                                                    std::vector<double>& gradient) const {
        gradient = this->gradient(parameters);
        return this->value(parameters);
    }
};

// Full-batch minimiser.
class Optimizer {
public:
    virtual ~Optimizer() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    [[nodiscard]] virtual OptimizationResult optimize(const ObjectiveFunction& function,
                                                       std::vector<double> initial_parameters,
                                                       const OptimizationOptions& options) const = 0;
};

class GradientDescentOptimizer final : public Optimizer {
public:
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] OptimizationResult optimize(const ObjectiveFunction& function,
                                               std::vector<double> initial_parameters,
                                               const OptimizationOptions& options) const override;
};

class LBFGSOptimizer final : public Optimizer {
public:
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] OptimizationResult optimize(const ObjectiveFunction& function,
                                               std::vector<double> initial_parameters,
                                               const OptimizationOptions& options) const override;
};

[[nodiscard]] std::unique_ptr<Optimizer> make_gradient_descent_optimizer();

[[nodiscard]] std::unique_ptr<Optimizer> make_lbfgs_optimizer();

// "lbfgs" or "gradient_descent"; throws ConfigurationError otherwise.
[[nodiscard]] std::unique_ptr<Optimizer> make_optimizer(const std::string& name);

struct AdamOptions {
    double learning_rate{0.01};
    double beta1{0.9};
    double beta2{0.999};
    double epsilon{1e-8};
    // Exponential decay: lr * decay_rate^(step / decay_steps), floored at lr_min.
    double decay_rate{1.0};
    std::size_t decay_steps{0};
    bool staircase{false};
    double lr_min{0.0};
    // Per-group multiplier on the learning rate; missing groups use 1.
    std::unordered_map<ParameterGroup, double> group_scales{};
};

struct AdamState {
    std::vector<double> first_moment;
    std::vector<double> second_moment;
    std::uint64_t step{0};
};

// Stochastic minibatch stepper: momentum plus per-parameter variance
// normalisation over one flat parameter vector.
class AdamOptimizer {
public:
    AdamOptimizer(AdamOptions options, std::vector<ParameterGroup> groups);

    [[nodiscard]] AdamState initial_state() const;

    [[nodiscard]] double learning_rate(std::uint64_t step) const;

    // Returns the updated parameters and advances `state`; neither input is
    // touched when the gradient has the wrong size.
    [[nodiscard]] std::vector<double> step(const std::vector<double>& parameters,
                                           const std::vector<double>& gradient,
                                           AdamState& state) const;

    [[nodiscard]] const AdamOptions& options() const noexcept;

private:
    AdamOptions options_;
    std::vector<double> scales_;
};

}  // namespace libcdr
