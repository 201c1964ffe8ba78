#pragma once

#include <memory>
#include <string>
#include <vector>

#include "libcdr/irf_kernel.hpp"

namespace libcdr {

class IrfKernelFactory {
public:
    // Throws ConfigurationError for an unknown family tag. `knots` is only
    // read by the "basis" family.
    static std::shared_ptr<const IrfKernel> create(const std::string& family,
                                                   const std::vector<double>& knots = {});

    static const std::vector<std::string>& families();
};

}  // namespace libcdr
