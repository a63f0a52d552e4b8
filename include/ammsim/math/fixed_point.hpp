// Fixed-point helpers shared by the invariant engines
// Inputs and outputs are integers scaled by 1e18; every division floors
#pragma once

#include <vector>

#include "ammsim/core/numeric_types.hpp"

namespace ammsim {
namespace math {

// Integer square root (floor) of an unscaled integer
Int isqrt(const Int& x);

// sqrt(x) for 1e18-scaled x, Newton iteration seeded at (x + 1e18) / 2
Int sqrt_int(const Int& x);

// floor(log2(x)) via a fixed 256-bit bisection cascade; 0 for x == 0
unsigned log2_256(const Int& x, bool roundup = false);

// Cube root of a 1e18-scaled value (7 Newton steps from a log2-based guess)
Int cbrt(const Int& x);

// 2-value geometric mean by Newton iteration
Int geometric_mean2(const std::vector<Int>& unsorted_x, bool sort);

// 3-value geometric mean through cbrt; 0 when the scaled product is 0
Int geometric_mean3(const std::vector<Int>& x);

// Dispatches on x.size() (2 or 3)
Int geometric_mean(const std::vector<Int>& x);

// 1e18 * 0.5 ** (power / 1e18)
Int halfpow(const Int& power);

} // namespace math
} // namespace ammsim
