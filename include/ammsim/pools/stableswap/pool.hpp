// Stableswap pool: n-coin constant-sum/constant-product hybrid
// Integer arithmetic matches the deployed StableSwap contracts
#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "ammsim/core/numeric_types.hpp"
#include "ammsim/pools/common.hpp"
#include "ammsim/pools/snapshot.hpp"

namespace ammsim {
namespace pools {
namespace stableswap {

// Construction parameters. Empty rates default to 1e18 per coin;
// tokens defaults to D when not supplied.
struct StableswapParams {
    Int A{100};
    std::size_t n{2};
    std::vector<Int> rates{};
    Int fee{4000000};              // 1e10 denominator (0.04%)
    std::optional<Int> fee_mul{};  // enables the dynamic fee when set
    Int admin_fee{0};              // share of fees kept by the admin, 1e10 denominator
    std::optional<Int> tokens{};
};

class StableswapPool {
public:
    // Parameters
    Int A;
    std::size_t n;
    Int fee;
    std::optional<Int> fee_mul;
    Int admin_fee;
    std::vector<Int> rates;

    // State
    std::vector<Int> balances;
    std::vector<Int> admin_balances;
    Int tokens;

    // Balances derived from D: x_i = D / n * 1e18 / rate_i
    StableswapPool(const StableswapParams& params, const Int& D);
    StableswapPool(const StableswapParams& params, std::vector<Int> balances);

    std::size_t n_total() const { return n; }

    std::vector<Int> xp() const;

    // Invariant at current balances / at the given rate-scaled balances
    Int D() const;
    Int get_D(const std::vector<Int>& xp) const;
    Int get_D_mem(const std::vector<Int>& balances) const;

    Int get_y(std::size_t i, std::size_t j, const Int& x, const std::vector<Int>& xp) const;
    Int get_y_D(const Int& A, std::size_t i, const std::vector<Int>& xp, const Int& D) const;

    // Swap dx of coin i for coin j; returns (dy after fee, fee) in coin j units
    SwapResult exchange(std::size_t i, std::size_t j, const Int& dx);

    // Coin i received for burning token_amount LP tokens; fee is the
    // imbalance fee (zero when use_fee is false)
    SwapResult calc_withdraw_one_coin(const Int& token_amount, std::size_t i, bool use_fee = true) const;
    SwapResult remove_liquidity_one_coin(const Int& token_amount, std::size_t i);

    MintResult calc_token_amount(const std::vector<Int>& amounts, bool use_fee = false) const;
    Int add_liquidity(const std::vector<Int>& amounts);

    Int get_virtual_price() const;

    Int dynamic_fee(const Int& xpi, const Int& xpj) const;

    // Spot price dy/dx at current balances, optionally net of the fee rate
    double dydx(std::size_t i, std::size_t j, bool use_fee = false) const;
    double dydxfee(std::size_t i, std::size_t j) const { return dydx(i, j, true); }

    StableswapSnapshot get_snapshot() const;
    void revert_to_snapshot(const StableswapSnapshot& snapshot);
};

} // namespace stableswap
} // namespace pools
} // namespace ammsim
