// Cryptoswap invariant math for 2-coin (factory twocrypto) and 3-coin (tricrypto-ng) pools
// ANN is A * n^n * A_MULTIPLIER; every division floors
#pragma once

#include <cstdint>
#include <vector>

#include "ammsim/core/numeric_types.hpp"

namespace ammsim {
namespace pools {
namespace cryptoswap {

// Solved balance plus the K0 estimate the 3-coin closed form produces
// (zero when the iterative solver was used). K0 seeds the next newton_D.
struct YResult {
    Int value;
    Int K0;
};

// -----------------------------------------------------------------------------
// 2-coin math
// -----------------------------------------------------------------------------
namespace two_coin {

Int min_A();
Int max_A();
Int min_gamma();
Int max_gamma();

Int newton_D(const Int& ANN, const Int& gamma, const std::vector<Int>& x_unsorted);
Int newton_y(const Int& ANN, const Int& gamma, const std::vector<Int>& x, const Int& D, std::size_t i);

// 2 * virtual_price * sqrt(price_oracle[0])
Int lp_price(const Int& virtual_price, const std::vector<Int>& price_oracle);

} // namespace two_coin

// -----------------------------------------------------------------------------
// 3-coin math
// -----------------------------------------------------------------------------
namespace three_coin {

Int min_A();
Int max_A();
Int min_gamma();
Int max_gamma();

// Halley-style update; K0_prev from a preceding get_y seeds the first guess
Int newton_D(const Int& ANN, const Int& gamma, const std::vector<Int>& x_unsorted, const Int& K0_prev);

// Closed-form cubic solve, falling back to newton_y when the discriminant is not positive
YResult get_y(const Int& ANN, const Int& gamma, const std::vector<Int>& x, const Int& D, std::size_t i);
Int newton_y(const Int& ANN, const Int& gamma, const std::vector<Int>& x, const Int& D, std::size_t i);

// 3 * virtual_price * cbrt(price_oracle[0] * price_oracle[1])
Int lp_price(const Int& virtual_price, const std::vector<Int>& price_oracle);

} // namespace three_coin

// -----------------------------------------------------------------------------
// Dispatch on the number of coins
// -----------------------------------------------------------------------------

Int newton_D(const Int& ANN, const Int& gamma, const std::vector<Int>& xp, const Int& K0_prev = Int(0));

// 2-coin and 3-coin results may differ by a couple of wei; the solvers differ
YResult get_y(const Int& ANN, const Int& gamma, const std::vector<Int>& xp, const Int& D, std::size_t j);

// EMA weight of the previous oracle value after (now - last) seconds
Int get_alpha(const Int& ma_half_time, uint64_t block_timestamp, uint64_t last_prices_timestamp,
              std::size_t n_coins);

// Marginal prices dx_0/dx_k at xp, k = 1..n-1, before multiplying by price_scale
std::vector<Int> get_p(const std::vector<Int>& xp, const Int& D, const Int& ANN, const Int& gamma);

Int lp_price(const Int& virtual_price, const std::vector<Int>& price_oracle);

} // namespace cryptoswap
} // namespace pools
} // namespace ammsim
