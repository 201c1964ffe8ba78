#pragma once

#include <cstddef>
#include <limits>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "libcdr/parameter.hpp"

namespace libcdr {

class ParameterCatalog {
public:
    static constexpr std::size_t npos = std::numeric_limits<std::size_t>::max();

    // Returns the existing index when `name` is already registered.
    std::size_t register_parameter(const std::string& name,
                                   double initial_value,
                                   ParameterGroup group,
                                   std::shared_ptr<const ParameterTransform> transform = nullptr);

    [[nodiscard]] std::size_t size() const noexcept;

    [[nodiscard]] bool contains(const std::string& name) const noexcept;

    [[nodiscard]] std::size_t find_index(const std::string& name) const noexcept;

    [[nodiscard]] const Parameter& at(std::size_t index) const;

    [[nodiscard]] const std::vector<std::string>& names() const noexcept;

    [[nodiscard]] std::vector<ParameterGroup> groups() const;

    [[nodiscard]] std::vector<double> initial_unconstrained() const;

    [[nodiscard]] std::vector<double> constrain(const std::vector<double>& unconstrained) const;

    [[nodiscard]] std::vector<double> constrained_derivatives(const std::vector<double>& unconstrained) const;

private:
    std::vector<Parameter> parameters_;
    std::vector<std::string> names_;
    std::unordered_map<std::string, std::size_t> index_;
};

}  // namespace libcdr
