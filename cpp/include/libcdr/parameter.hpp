#pragma once

#include <memory>
#include <string>

namespace libcdr {

class ParameterTransform;

// Learning-rate scaling and prior selection operate per group.
enum class ParameterGroup {
    Intercept,
    Coefficient,
    Irf,
    NoiseScale,
    RandomIntercept,
    RandomCoefficient,
    RandomIrf,
    PosteriorScale
};

[[nodiscard]] const char* to_string(ParameterGroup group) noexcept;

[[nodiscard]] bool is_random_effect(ParameterGroup group) noexcept;

class Parameter {
public:
    Parameter(std::string name, double value, ParameterGroup group);

    Parameter(std::string name, double value, ParameterGroup group, std::shared_ptr<const ParameterTransform> transform);

    [[nodiscard]] const std::string& name() const noexcept;

    [[nodiscard]] ParameterGroup group() const noexcept;

    [[nodiscard]] double value() const;

    void set_value(double value);

    [[nodiscard]] double unconstrained_value() const noexcept;

    void set_unconstrained_value(double value);

    [[nodiscard]] std::shared_ptr<const ParameterTransform> transform() const noexcept;

private:
    std::string name_;
    ParameterGroup group_;
    double unconstrained_value_;
    std::shared_ptr<const ParameterTransform> transform_;
};

}  // namespace libcdr
