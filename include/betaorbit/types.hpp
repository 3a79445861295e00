#pragma once

#include <cstdint>

namespace betaorbit {

/// Position in an orbit. Signed so that a negative request is reportable.
using Index = std::int64_t;

/// One digit of a β-expansion, 0 <= c < ceil(β).
using Digit = std::int64_t;

/// Default number of guard bits in the iterator's error bound.
constexpr unsigned DEFAULT_GUARD_BITS = 5;

} // namespace betaorbit
