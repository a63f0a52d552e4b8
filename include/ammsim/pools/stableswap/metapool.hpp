// Stableswap meta-pool: a primary pool whose last coin is the LP token of a base pool
// Underlying trades route through the base pool's own liquidity operations
#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "ammsim/core/numeric_types.hpp"
#include "ammsim/pools/common.hpp"
#include "ammsim/pools/snapshot.hpp"
#include "ammsim/pools/stableswap/pool.hpp"

namespace ammsim {
namespace pools {
namespace stableswap {

// Flattened index space: [0, max_coin) are primary coins, max_coin + k is
// base-pool coin k. Slot max_coin itself holds the base-pool LP token.
class MetaPool {
public:
    // Parameters
    Int A;
    std::size_t n;
    std::size_t max_coin;
    Int fee;
    std::optional<Int> fee_mul;
    Int admin_fee;
    std::vector<Int> rate_multipliers;  // entry max_coin is replaced by the base virtual price

    // State
    std::vector<Int> balances;
    std::vector<Int> admin_balances;
    Int tokens;

    StableswapPool basepool;

    MetaPool(const StableswapParams& params, const Int& D, StableswapPool basepool);
    MetaPool(const StableswapParams& params, std::vector<Int> balances, StableswapPool basepool);

    // Primary coins plus base-pool underlyings
    std::size_t n_total() const { return n + basepool.n - 1; }

    std::vector<Int> rates() const;
    std::vector<Int> xp() const;

    Int D() const;
    Int get_D(const std::vector<Int>& xp) const;
    Int get_D_mem(const std::vector<Int>& rates, const std::vector<Int>& balances) const;

    Int get_y(std::size_t i, std::size_t j, const Int& x, const std::vector<Int>& xp) const;
    Int get_y_D(const Int& A, std::size_t i, const std::vector<Int>& xp, const Int& D) const;

    // Swap between meta-level slots (base LP token included)
    SwapResult exchange(std::size_t i, std::size_t j, const Int& dx);

    // Swap in the flattened index space, routing through the base pool as needed
    SwapResult exchange_underlying(std::size_t i, std::size_t j, const Int& dx);

    SwapResult calc_withdraw_one_coin(const Int& token_amount, std::size_t i, bool use_fee = true) const;
    SwapResult remove_liquidity_one_coin(const Int& token_amount, std::size_t i);

    MintResult calc_token_amount(const std::vector<Int>& amounts, bool use_fee = false) const;
    Int add_liquidity(const std::vector<Int>& amounts);

    Int get_virtual_price() const;
    Int dynamic_fee(const Int& xpi, const Int& xpj) const;

    // Spot price in the flattened index space; base-pool legs use the chain rule
    double dydx(std::size_t i, std::size_t j, bool use_fee = false) const;

    // Spot price between meta-level slots at the given rate-scaled balances
    double dydx_meta(std::size_t i, std::size_t j, const std::vector<Int>& xp, bool use_fee = false) const;

    MetaPoolSnapshot get_snapshot() const;
    void revert_to_snapshot(const MetaPoolSnapshot& snapshot);

private:
    void validate_basepool() const;
};

} // namespace stableswap
} // namespace pools
} // namespace ammsim
