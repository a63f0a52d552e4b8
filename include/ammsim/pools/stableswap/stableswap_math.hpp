// Stableswap invariant math shared by the plain pool and the meta-pool
// Solves A*n^n*sum(x) + D = A*n^n*D + D^(n+1) / (n^n * prod(x)) by Newton's method
#pragma once

#include <cstddef>
#include <vector>

#include "ammsim/core/numeric_types.hpp"
#include "ammsim/pools/common.hpp"

namespace ammsim {
namespace pools {
namespace stableswap {

// Balances scaled by per-coin rates: x * rate / 1e18
std::vector<Int> xp_mem(const std::vector<Int>& balances, const std::vector<Int>& rates);

// Invariant D for rate-scaled balances xp; converges to within 1 unit
Int get_D(const std::vector<Int>& xp, const Int& A);

// Balance of coin j after coin i is set to x, holding D(xp) fixed
Int get_y(std::size_t i, std::size_t j, const Int& x, const std::vector<Int>& xp, const Int& A);

// Balance of coin i that yields invariant D given the other balances in xp
Int get_y_D(const Int& A, std::size_t i, const std::vector<Int>& xp, const Int& D);

// Balance-weighted fee: fee_mul * fee / ((fee_mul - 1e10) * 4*xpi*xpj / (xpi+xpj)^2 + 1e10)
Int dynamic_fee(const Int& xpi, const Int& xpj, const Int& fee, const Int& fee_mul);

// Withdrawal of coin i for token_amount LP tokens at the given balances and rates.
// The imbalance fee is charged on the deviation from a proportional withdrawal.
SwapResult calc_withdraw_one_coin(const std::vector<Int>& balances, const std::vector<Int>& rates,
                                  const Int& A, const Int& fee, const Int& tokens,
                                  const Int& token_amount, std::size_t i, bool use_fee);

// LP tokens minted for a deposit of amounts; fees are per-coin imbalance fees
MintResult calc_token_amount(const std::vector<Int>& balances, const std::vector<Int>& rates,
                             const Int& A, const Int& fee, const Int& tokens,
                             const std::vector<Int>& amounts, bool use_fee);

// Fee-less dy/dx of the invariant at xp (closed form)
double dydx_raw(std::size_t i, std::size_t j, const std::vector<Int>& xp, const Int& A, const Int& D);

} // namespace stableswap
} // namespace pools
} // namespace ammsim
