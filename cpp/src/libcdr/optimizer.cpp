#include "libcdr/optimizer.hpp"

#include "libcdr/errors.hpp"

#include <Eigen/Core>
#include <LBFGS.h>

#include <algorithm>
#include <iostream>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace libcdr {

namespace {
[[nodiscard]] double norm2(const std::vector<double>& values) {
    double sum_sq = 0.0;
    for (double v : values) {
        sum_sq += v * v;
    }
    return std::sqrt(sum_sq);
}

[[nodiscard]] bool valid_options(const OptimizationOptions& options) {
    return options.max_iterations > 0 && options.tolerance > 0.0 && options.learning_rate > 0.0;
}
}  // namespace

std::string GradientDescentOptimizer::name() const {
    return "gradient_descent";
}

OptimizationResult GradientDescentOptimizer::optimize(const ObjectiveFunction& function,
                                                      std::vector<double> parameters,
                                                      const OptimizationOptions& options) const {
    if (!valid_options(options)) {
        throw std::invalid_argument("invalid optimization options");
    }
    OptimizationResult result;
    result.parameters = std::move(parameters);

    const double decrease_factor = 0.5;
    const double increase_factor = 1.05;
    const double min_step = 1e-8;
    double step_size = options.learning_rate;
    std::vector<double> candidate(result.parameters.size());
    std::vector<double> candidate_gradient(result.parameters.size());
    std::vector<double> gradient(result.parameters.size());

    double objective = function.value_and_gradient(result.parameters, gradient);
    double grad_norm = norm2(gradient);

    for (std::size_t iter = 0; iter < options.max_iterations; ++iter) {
        result.iterations = iter + 1;
        result.gradient_norm = grad_norm;
        result.objective_value = objective;

        if (grad_norm <= options.tolerance) {
            result.converged = true;
            break;
        }

        bool accepted = false;
        double step = step_size;
        double candidate_objective = objective;
        for (int backtrack = 0; backtrack < 12; ++backtrack) {
            for (std::size_t i = 0; i < result.parameters.size(); ++i) {
                candidate[i] = result.parameters[i] - step * gradient[i];
            }
            candidate_objective = function.value_and_gradient(candidate, candidate_gradient);
            if (candidate_objective <= objective) {
                accepted = true;
                break;
            }
            step *= decrease_factor;
            if (step < min_step) {
                break;
            }
        }

        if (!accepted) {
            step_size = std::max(step_size * decrease_factor, min_step);
            if (step_size <= min_step) {
                break;
            }
            continue;  // try again with a smaller global step
        }

        result.parameters = candidate;
        gradient = candidate_gradient;
        objective = candidate_objective;
        grad_norm = norm2(gradient);
        result.objective_value = objective;
        result.gradient_norm = grad_norm;
        step_size = std::min(step * increase_factor, options.learning_rate * 4.0);
    }

    if (grad_norm <= options.tolerance) {
        result.converged = true;
    }
    return result;
}

std::unique_ptr<Optimizer> make_gradient_descent_optimizer() {
    return std::make_unique<GradientDescentOptimizer>();
}

class LBFGSFunctor {
public:
    explicit LBFGSFunctor(const ObjectiveFunction& function) : function_(function) {}

    double operator()(const Eigen::VectorXd& x, Eigen::VectorXd& grad) {
        std::vector<double> params(x.data(), x.data() + x.size());
        std::vector<double> g(static_cast<std::size_t>(grad.size()));
        double value = function_.value_and_gradient(params, g);

        if (g.size() != static_cast<std::size_t>(grad.size())) {
             throw std::runtime_error("Gradient dimension mismatch");
        }
        for(std::size_t i=0; i<g.size(); ++i) grad[static_cast<Eigen::Index>(i)] = g[i];

        return value;
    }

private:
    const ObjectiveFunction& function_;
};

std::string LBFGSOptimizer::name() const {
    return "lbfgs";
}

OptimizationResult LBFGSOptimizer::optimize(const ObjectiveFunction& function,
                                            std::vector<double> initial_parameters,
                                            const OptimizationOptions& options) const {
    if (!valid_options(options)) {
        throw std::invalid_argument("invalid optimization options");
    }

    LBFGSpp::LBFGSParam<double> param;
    param.epsilon = options.tolerance;
    param.max_iterations = static_cast<int>(options.max_iterations);
    param.m = options.m;
    param.past = options.past;
    param.delta = options.delta;
    param.max_linesearch = options.max_linesearch;

    if (options.linesearch_type == "armijo") {
        param.linesearch = LBFGSpp::LBFGS_LINESEARCH_BACKTRACKING_ARMIJO;
    } else if (options.linesearch_type == "wolfe") {
        param.linesearch = LBFGSpp::LBFGS_LINESEARCH_BACKTRACKING_WOLFE;
    } else {
        param.linesearch = LBFGSpp::LBFGS_LINESEARCH_BACKTRACKING_STRONG_WOLFE;
    }

    LBFGSpp::LBFGSSolver<double> solver(param);
    LBFGSFunctor functor(function);

    Eigen::VectorXd x = Eigen::Map<Eigen::VectorXd>(initial_parameters.data(),
                                                    static_cast<Eigen::Index>(initial_parameters.size()));
    double fx = 0.0;

    int niter = 0;
    try {
        niter = solver.minimize(functor, x, fx);
    } catch (const NumericInstabilityError&) {
        throw;
    } catch (const std::exception& e) {
        // Line-search breakdown: continue from the last iterate with backtracking descent.
        std::cerr << "lbfgs stopped early (" << e.what() << "), falling back to gradient descent" << std::endl;
        GradientDescentOptimizer fallback;
        std::vector<double> current(x.data(), x.data() + x.size());
        return fallback.optimize(function, current, options);
    }

    OptimizationResult result;
    result.parameters.assign(x.data(), x.data() + x.size());
    result.objective_value = fx;
    result.iterations = static_cast<std::size_t>(niter);

    std::vector<double> final_grad = function.gradient(result.parameters);
    result.gradient_norm = norm2(final_grad);
    result.converged = (result.gradient_norm <= options.tolerance);

    if (!result.converged) {
        GradientDescentOptimizer fallback;
        return fallback.optimize(function, result.parameters, options);
    }

    return result;
}

std::unique_ptr<Optimizer> make_lbfgs_optimizer() {
    return std::make_unique<LBFGSOptimizer>();
}

std::unique_ptr<Optimizer> make_optimizer(const std::string& name) {
    if (name == "lbfgs") {
        return make_lbfgs_optimizer();
    }
    if (name == "gradient_descent") {
        return make_gradient_descent_optimizer();
    }
    throw ConfigurationError("Unknown optimizer: " + name);
}

AdamOptimizer::AdamOptimizer(AdamOptions options, std::vector<ParameterGroup> groups)
    : options_(std::move(options)) {
    if (!(options_.learning_rate > 0.0)) {
        throw std::invalid_argument("adam learning rate must be positive");
    }
    if (!(options_.beta1 >= 0.0 && options_.beta1 < 1.0) || !(options_.beta2 >= 0.0 && options_.beta2 < 1.0)) {
        throw std::invalid_argument("adam moment decay rates must lie in [0, 1)");
    }
    if (!(options_.epsilon > 0.0)) {
        throw std::invalid_argument("adam epsilon must be positive");
    }
    if (!(options_.decay_rate > 0.0)) {
        throw std::invalid_argument("learning rate decay must be positive");
    }
    scales_.resize(groups.size(), 1.0);
    for (std::size_t i = 0; i < groups.size(); ++i) {
        auto it = options_.group_scales.find(groups[i]);
        if (it != options_.group_scales.end()) {
            if (!(it->second >= 0.0)) {
                throw std::invalid_argument("learning rate scale must be non-negative");
            }
            scales_[i] = it->second;
        }
    }
}

AdamState AdamOptimizer::initial_state() const {
    AdamState state;
    state.first_moment.assign(scales_.size(), 0.0);
    state.second_moment.assign(scales_.size(), 0.0);
    state.step = 0;
    return state;
}

double AdamOptimizer::learning_rate(std::uint64_t step) const {
    double lr = options_.learning_rate;
    if (options_.decay_steps > 0 && options_.decay_rate != 1.0) {
        double exponent = static_cast<double>(step) / static_cast<double>(options_.decay_steps);
        if (options_.staircase) {
            exponent = std::floor(exponent);
        }
        lr *= std::pow(options_.decay_rate, exponent);
    }
    return std::max(lr, options_.lr_min);
}

std::vector<double> AdamOptimizer::step(const std::vector<double>& parameters,
                                        const std::vector<double>& gradient,
                                        AdamState& state) const {
    const std::size_t n = scales_.size();
    if (parameters.size() != n || gradient.size() != n || state.first_moment.size() != n ||
        state.second_moment.size() != n) {
        throw std::invalid_argument("adam step size mismatch");
    }
    const double lr = learning_rate(state.step);
    const std::uint64_t t = state.step + 1;
    const double correction1 = 1.0 - std::pow(options_.beta1, static_cast<double>(t));
    const double correction2 = 1.0 - std::pow(options_.beta2, static_cast<double>(t));

    std::vector<double> updated(parameters);
    for (std::size_t i = 0; i < n; ++i) {
        const double g = gradient[i];
        state.first_moment[i] = options_.beta1 * state.first_moment[i] + (1.0 - options_.beta1) * g;
        state.second_moment[i] = options_.beta2 * state.second_moment[i] + (1.0 - options_.beta2) * g * g;
        const double m_hat = state.first_moment[i] / correction1;
        const double v_hat = state.second_moment[i] / correction2;
        updated[i] -= lr * scales_[i] * m_hat / (std::sqrt(v_hat) + options_.epsilon);
    }
    state.step = t;
    return updated;
}

const AdamOptions& AdamOptimizer::options() const noexcept {
    return options_;
}

}  // namespace libcdr
