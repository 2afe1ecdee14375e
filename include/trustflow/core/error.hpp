#pragma once

#include <stdexcept>
#include <string>

namespace trustflow::core {

// Raised for every precondition violation: length mismatches, out-of-range
// ids or parameters, malformed teleport vectors. Always thrown before any
// computation starts.
struct InvalidInput : public std::invalid_argument {
  using std::invalid_argument::invalid_argument;
};

} // namespace trustflow::core
