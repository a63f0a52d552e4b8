// Cryptoswap pool: 2-coin and 3-coin repegging invariant with EMA oracle and price-scale rebalancing
// Balances are native units; xp is balances * precision * price_scale / 1e18
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "ammsim/core/numeric_types.hpp"
#include "ammsim/pools/common.hpp"
#include "ammsim/pools/snapshot.hpp"

namespace ammsim {
namespace pools {
namespace cryptoswap {

// Construction parameters. price_oracle and last_prices default to price_scale;
// tokens defaults to the xcp of D; block_timestamp defaults to the wall clock.
struct CryptoParams {
    Int A;                      // A * n^n * A_MULTIPLIER
    Int gamma;
    std::size_t n{2};
    std::vector<Int> precisions{};
    Int mid_fee;
    Int out_fee;
    Int allowed_extra_profit;
    Int fee_gamma;
    Int adjustment_step;
    Int ma_half_time;
    std::vector<Int> price_scale;
    std::vector<Int> price_oracle{};
    std::vector<Int> last_prices{};
    std::optional<Int> tokens{};
    Int admin_fee{5000000000};
    Int xcp_profit{"1000000000000000000"};
    Int xcp_profit_a{"1000000000000000000"};
    std::optional<uint64_t> block_timestamp{};
};

// Result of a single-sided withdrawal quote: amount out, trade price estimate,
// the reduced invariant and the post-withdrawal xp
struct WithdrawQuote {
    Int dy;
    Int p;
    Int D;
    std::vector<Int> xp;
};

class CryptoPool {
public:
    // Parameters
    Int A;
    Int gamma;
    std::size_t n;
    std::vector<Int> precisions;
    Int mid_fee;
    Int out_fee;
    Int allowed_extra_profit;
    Int fee_gamma;
    Int adjustment_step;
    Int ma_half_time;
    Int admin_fee;

    // State
    std::vector<Int> balances;
    Int D;
    Int tokens;
    std::vector<Int> price_scale;
    std::vector<Int> price_oracle_;  // raw EMA state; price_oracle() advances it to now
    std::vector<Int> last_prices;
    uint64_t last_prices_timestamp{0};
    uint64_t block_timestamp{0};
    Int virtual_price;
    Int xcp_profit;
    Int xcp_profit_a;
    bool not_adjusted{false};

    CryptoPool(const CryptoParams& params, std::vector<Int> balances);
    // Balances derived from D at price_scale; D == 0 builds an empty pool
    CryptoPool(const CryptoParams& params, const Int& D);

    std::vector<Int> xp() const;
    std::vector<Int> xp_mem(const std::vector<Int>& balances) const;

    // Constant-product value of D at the equilibrium point of price_scale
    Int get_xcp(const Int& D) const;

    // Blends mid_fee and out_fee by the balance statistic K (1e10 denominator)
    Int fee(const std::vector<Int>& xp) const;

    Int get_dy(std::size_t i, std::size_t j, const Int& dx) const;
    SwapResult exchange(std::size_t i, std::size_t j, const Int& dx, const Int& min_dy = Int(0));
    SwapResult exchange_underlying(std::size_t i, std::size_t j, const Int& dx, const Int& min_dy = Int(0));

    // EMA oracle update, profit accounting and price-scale adjustment after a state change.
    // new_D == 0 recomputes D from xp (seeded with K0_prev for 3 coins).
    void tweak_price(const Int& A, const Int& gamma, const std::vector<Int>& xp, std::size_t i,
                     const Int& p_i, const Int& new_D, const Int& K0_prev = Int(0));
    void claim_admin_fees();

    Int add_liquidity(const std::vector<Int>& amounts, const Int& min_mint_amount = Int(0));
    std::vector<Int> remove_liquidity(const Int& amount, const std::vector<Int>& min_amounts = {});
    Int remove_liquidity_one_coin(const Int& token_amount, std::size_t i, const Int& min_amount = Int(0));
    Int calc_withdraw_one_coin(const Int& token_amount, std::size_t i) const;
    Int calc_token_amount(const std::vector<Int>& amounts) const;

    Int lp_price() const;
    std::vector<Int> internal_price_oracle() const;
    std::vector<Int> price_oracle() const { return internal_price_oracle(); }
    Int get_virtual_price() const;

    // Marginal price of coin i in units of coin j at the current state
    double dydx(std::size_t i, std::size_t j, bool use_fee = false) const;

    void set_block_timestamp(uint64_t ts) { block_timestamp = ts; }
    // Advances the clock by 12 seconds per block, or jumps to timestamp when given
    void increment_timestamp(uint64_t blocks = 1, std::optional<uint64_t> timestamp = std::nullopt);

    CryptoSnapshot get_snapshot() const;
    void revert_to_snapshot(const CryptoSnapshot& snapshot);

private:
    void init_common(const CryptoParams& params);
    void init_supply(const CryptoParams& params);
    Int calc_token_fee(const std::vector<Int>& amounts, const std::vector<Int>& xp) const;
    WithdrawQuote calc_withdraw_one_coin_impl(const Int& token_amount, std::size_t i, bool update_D,
                                              bool calc_price) const;
};

} // namespace cryptoswap
} // namespace pools
} // namespace ammsim
