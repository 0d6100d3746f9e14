#include <evsim/core/error.hpp>

#include <cstdlib>
#include <iostream>

namespace evsim::core::detail {

void invariant_failure(std::string_view what) noexcept {
    std::cerr << "evsim: invariant violated: " << what << std::endl;
    std::abort();
}

} // namespace evsim::core::detail
