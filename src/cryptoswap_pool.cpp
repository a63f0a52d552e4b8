// Cryptoswap pool - implementation
#include "ammsim/pools/cryptoswap/pool.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <utility>

#include "ammsim/core/errors.hpp"
#include "ammsim/core/logging.hpp"
#include "ammsim/math/fixed_point.hpp"
#include "ammsim/pools/cryptoswap/calcs.hpp"

namespace ammsim {
namespace pools {
namespace cryptoswap {

namespace {

const Int& PREC() { return Fixed::PRECISION(); }

uint64_t unix_now() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
}

// Integer EMA step: (last * (1 - alpha) + oracle * alpha) / 1e18
std::vector<Int> ema(const std::vector<Int>& last_prices, const std::vector<Int>& oracle, const Int& alpha) {
    std::vector<Int> out(oracle.size());
    for (std::size_t k = 0; k < oracle.size(); ++k) {
        out[k] = (last_prices[k] * (PREC() - alpha) + oracle[k] * alpha) / PREC();
    }
    return out;
}

// Balances at the equilibrium point of D for the given price scale
std::vector<Int> equilibrium_xp(const Int& D, const std::vector<Int>& price_scale) {
    const Int n = Int(price_scale.size() + 1);
    std::vector<Int> x;
    x.reserve(price_scale.size() + 1);
    x.push_back(D / n);
    for (const auto& p : price_scale) {
        x.push_back(D * PREC() / (p * n));
    }
    return x;
}

} // namespace

// =============================================================================
// Construction
// =============================================================================

void CryptoPool::init_common(const CryptoParams& params) {
    A = params.A;
    gamma = params.gamma;
    n = params.n;
    mid_fee = params.mid_fee;
    out_fee = params.out_fee;
    allowed_extra_profit = params.allowed_extra_profit;
    fee_gamma = params.fee_gamma;
    adjustment_step = params.adjustment_step;
    ma_half_time = params.ma_half_time;
    admin_fee = params.admin_fee;
    xcp_profit = params.xcp_profit;
    xcp_profit_a = params.xcp_profit_a;
    not_adjusted = false;

    if (n != 2 && n != 3) {
        throw CryptoPoolError("Only 2 or 3-coin crypto pools are currently supported.");
    }
    precisions = params.precisions.empty() ? std::vector<Int>(n, Int(1)) : params.precisions;
    if (precisions.size() != n) {
        throw ConfigError("cryptoswap: len(precisions) must equal n (" + std::to_string(n) + ")");
    }
    if (params.price_scale.size() != n - 1) {
        throw ConfigError("cryptoswap: expected " + std::to_string(n - 1) + " price_scale entries");
    }
    if (ma_half_time <= 0) {
        throw ConfigError("cryptoswap: ma_half_time must be positive");
    }

    price_scale = params.price_scale;
    price_oracle_ = params.price_oracle.empty() ? price_scale : params.price_oracle;
    last_prices = params.last_prices.empty() ? price_scale : params.last_prices;
    if (price_oracle_.size() != n - 1 || last_prices.size() != n - 1) {
        throw ConfigError("cryptoswap: price_oracle and last_prices need n - 1 entries");
    }

    block_timestamp = params.block_timestamp ? *params.block_timestamp : unix_now();
    last_prices_timestamp = block_timestamp;
}

void CryptoPool::init_supply(const CryptoParams& params) {
    const Int xcp = D == 0 ? Int(0) : get_xcp(D);
    tokens = params.tokens ? *params.tokens : xcp;
    virtual_price = tokens == 0 ? Int(0) : Int(PREC() * xcp / tokens);
}

CryptoPool::CryptoPool(const CryptoParams& params, std::vector<Int> balances_) {
    init_common(params);
    if (balances_.size() != n) {
        throw ConfigError("cryptoswap: expected " + std::to_string(n) + " balances, got " +
                          std::to_string(balances_.size()));
    }
    balances = std::move(balances_);
    D = sum(balances) == 0 ? Int(0) : newton_D(A, gamma, xp());
    init_supply(params);
}

CryptoPool::CryptoPool(const CryptoParams& params, const Int& D_) {
    init_common(params);
    D = D_;
    balances.reserve(n);
    balances.push_back(D / n / precisions[0]);
    for (std::size_t k = 1; k < n; ++k) {
        balances.push_back(D * PREC() / (price_scale[k - 1] * n) / precisions[k]);
    }
    init_supply(params);
}

// =============================================================================
// Views
// =============================================================================

std::vector<Int> CryptoPool::xp() const {
    return xp_mem(balances);
}

std::vector<Int> CryptoPool::xp_mem(const std::vector<Int>& balances_) const {
    std::vector<Int> out;
    out.reserve(n);
    out.push_back(balances_[0] * precisions[0]);
    for (std::size_t k = 1; k < n; ++k) {
        out.push_back(balances_[k] * precisions[k] * price_scale[k - 1] / PREC());
    }
    return out;
}

Int CryptoPool::get_xcp(const Int& D_) const {
    return math::geometric_mean(equilibrium_xp(D_, price_scale));
}

Int CryptoPool::fee(const std::vector<Int>& xp_) const {
    Int f;
    if (n == 2) {
        const Int S = xp_[0] + xp_[1];
        f = fee_gamma * PREC() / (fee_gamma + PREC() - 4 * PREC() * xp_[0] / S * xp_[1] / S);
    } else {
        const Int S = sum(xp_);
        const Int n_coins = Int(n);
        Int K = PREC();
        for (const auto& x : xp_) {
            K = K * n_coins * x / S;
        }
        f = fee_gamma * PREC() / (fee_gamma + PREC() - K);
    }
    return (mid_fee * f + out_fee * (PREC() - f)) / PREC();
}

Int CryptoPool::get_dy(std::size_t i, std::size_t j, const Int& dx) const {
    check_pair(i, j, n);

    std::vector<Int> bal = balances;
    bal[i] += dx;
    auto xp_ = xp_mem(bal);

    const Int y = get_y(A, gamma, xp_, D, j).value;
    Int dy = xp_[j] - y - 1;
    xp_[j] = y;
    if (j > 0) {
        dy = dy * PREC() / (price_scale[j - 1] * precisions[j]);
    } else {
        dy = dy / precisions[0];
    }
    dy -= fee(xp_) * dy / Fixed::FEE_PRECISION();
    return dy;
}

// =============================================================================
// Exchange
// =============================================================================

SwapResult CryptoPool::exchange(std::size_t i, std::size_t j, const Int& dx, const Int& min_dy) {
    check_pair(i, j, n);
    if (dx <= 0) throw std::invalid_argument("exchange: do not exchange 0 coins");

    std::vector<Int> bal = balances;
    Int y = bal[j];
    bal[i] += dx;

    auto xp_ = xp_mem(bal);
    const auto y_out = get_y(A, gamma, xp_, D, j);
    Int dy = xp_[j] - y_out.value;
    xp_[j] -= dy;
    dy -= 1;

    if (j > 0) dy = dy * PREC() / price_scale[j - 1];
    dy = dy / precisions[j];

    const Int dy_fee = fee(xp_) * dy / Fixed::FEE_PRECISION();
    dy -= dy_fee;
    if (dy < min_dy) {
        throw SafetyBoundError("Slippage: dy=" + dy.str() + " < min_dy=" + min_dy.str());
    }

    // Committed only once the output is known to be valid
    balances[i] = bal[i];
    y -= dy;
    balances[j] = y;

    y *= precisions[j];
    if (j > 0) y = y * price_scale[j - 1] / PREC();
    xp_[j] = y;

    // Trade price, quoted against coin 0 where possible
    Int p = 0;
    std::size_t ix = j;
    if (dx > Fixed::NOISE_FEE() && dy > Fixed::NOISE_FEE()) {
        const Int _dx = dx * precisions[i];
        const Int _dy = dy * precisions[j];
        if (i != 0 && j != 0) {
            p = last_prices[i - 1] * _dx / _dy;
        } else if (i == 0) {
            p = _dx * PREC() / _dy;
        } else {
            p = _dy * PREC() / _dx;
            ix = i;
        }
    }

    tweak_price(A, gamma, xp_, ix, p, Int(0), y_out.K0);
    return {dy, dy_fee};
}

SwapResult CryptoPool::exchange_underlying(std::size_t i, std::size_t j, const Int& dx, const Int& min_dy) {
    return exchange(i, j, dx, min_dy);
}

// =============================================================================
// Rebalancing
// =============================================================================

void CryptoPool::tweak_price(const Int& A_, const Int& gamma_, const std::vector<Int>& xp_, std::size_t i,
                             const Int& p_i, const Int& new_D, const Int& K0_prev) {
    // EMA oracle moves once per block, toward the last trade price of the previous block
    if (last_prices_timestamp < block_timestamp) {
        const Int alpha = get_alpha(ma_half_time, block_timestamp, last_prices_timestamp, n);
        price_oracle_ = ema(last_prices, price_oracle_, alpha);
        last_prices_timestamp = block_timestamp;
    }

    const Int D_unadjusted = new_D == 0 ? newton_D(A_, gamma_, xp_, K0_prev) : new_D;

    if (p_i > 0) {
        if (i > 0) {
            last_prices[i - 1] = p_i;
        } else {
            // A new price for coin 0 rescales every quote
            for (auto& lp : last_prices) lp = lp * PREC() / p_i;
        }
    } else {
        // Quote a tiny trade of coin 0
        std::vector<Int> xp_bumped = xp_;
        const Int dx_price = xp_bumped[0] / pow10(6);
        xp_bumped[0] += dx_price;
        for (std::size_t k = 1; k < n; ++k) {
            const Int y = get_y(A_, gamma_, xp_bumped, D_unadjusted, k).value;
            last_prices[k - 1] = price_scale[k - 1] * dx_price / (xp_bumped[k] - y);
        }
    }

    const Int old_xcp_profit = xcp_profit;
    const Int old_virtual_price = virtual_price;

    // Profit accounting at the current price scale
    Int new_xcp_profit = PREC();
    Int new_virtual_price = PREC();
    if (old_virtual_price > 0) {
        const Int xcp = math::geometric_mean(equilibrium_xp(D_unadjusted, price_scale));
        new_virtual_price = PREC() * xcp / tokens;
        if (new_virtual_price < old_virtual_price) {
            throw CryptoPoolError("Loss: virtual price " + new_virtual_price.str() + " < " +
                                  old_virtual_price.str());
        }
        new_xcp_profit = old_xcp_profit * new_virtual_price / old_virtual_price;
    }
    xcp_profit = new_xcp_profit;

    Int norm = 0;
    for (std::size_t k = 0; k + 1 < n; ++k) {
        const Int ratio = abs_int(price_oracle_[k] * PREC() / price_scale[k] - PREC());
        norm += ratio * ratio;
    }
    norm = math::isqrt(norm);
    const Int step = max_int(adjustment_step, norm / 5);

    bool needs_adjustment = not_adjusted;
    if (!needs_adjustment &&
        new_virtual_price * 2 - PREC() > new_xcp_profit + 2 * allowed_extra_profit &&
        norm > step && old_virtual_price > 0) {
        needs_adjustment = true;
        not_adjusted = true;
    }

    if (trace_enabled()) {
        std::lock_guard<std::mutex> lk(io_mu);
        std::cerr << "[tweak_price] ts=" << block_timestamp << " vp=" << new_virtual_price
                  << " xcp_profit=" << new_xcp_profit << " norm=" << norm << " step=" << step
                  << " adjust=" << (needs_adjustment ? 1 : 0) << std::endl;
    }

    if (needs_adjustment && norm > step && old_virtual_price > 0) {
        std::vector<Int> new_prices(n - 1);
        for (std::size_t k = 0; k + 1 < n; ++k) {
            new_prices[k] = (price_scale[k] * (norm - step) + step * price_oracle_[k]) / norm;
        }

        std::vector<Int> xp_new = xp_;
        for (std::size_t k = 1; k < n; ++k) {
            xp_new[k] = xp_[k] * new_prices[k - 1] / price_scale[k - 1];
        }

        const Int D_new = newton_D(A_, gamma_, xp_new);
        const Int vp_new =
            PREC() * math::geometric_mean(equilibrium_xp(D_new, new_prices)) / tokens;

        if (vp_new > PREC() && 2 * vp_new - PREC() > new_xcp_profit) {
            price_scale = std::move(new_prices);
            D = D_new;
            virtual_price = vp_new;
            return;
        }
    }

    // No adjustment: keep the scale, still record D and the profit counters
    D = D_unadjusted;
    virtual_price = new_virtual_price;

    if (needs_adjustment) {
        not_adjusted = false;
        claim_admin_fees();
    }
}

void CryptoPool::claim_admin_fees() {
    Int profit = xcp_profit;
    const Int profit_a = xcp_profit_a;
    const Int vprice = virtual_price;

    if (profit > profit_a) {
        const Int fees = (profit - profit_a) * admin_fee / (2 * Fixed::FEE_PRECISION());
        if (fees > 0) {
            const Int frac = vprice * PREC() / (vprice - fees) - PREC();
            tokens += tokens * frac / PREC();
            profit -= fees * 2;
            xcp_profit = profit;
        }
    }

    D = newton_D(A, gamma, xp());
    virtual_price = PREC() * get_xcp(D) / tokens;

    if (profit > profit_a) xcp_profit_a = profit;
}

// =============================================================================
// Liquidity
// =============================================================================

Int CryptoPool::calc_token_fee(const std::vector<Int>& amounts, const std::vector<Int>& xp_) const {
    const Int n_coins = Int(n);
    const Int f = fee(xp_) * n_coins / (4 * (n_coins - 1));
    const Int S = sum(amounts);
    const Int avg = S / n_coins;
    Int Sdiff = 0;
    for (const auto& a : amounts) Sdiff += abs_int(a - avg);
    return f * Sdiff / S + Fixed::NOISE_FEE();
}

Int CryptoPool::add_liquidity(const std::vector<Int>& amounts, const Int& min_mint_amount) {
    check_amounts(amounts, n);
    if (std::none_of(amounts.begin(), amounts.end(), [](const Int& a) { return a > 0; })) {
        throw std::invalid_argument("add_liquidity: no coins to add");
    }

    const auto xp_old = xp_mem(balances);
    std::vector<Int> new_balances = balances;
    for (std::size_t k = 0; k < n; ++k) new_balances[k] += amounts[k];

    const auto xp_ = xp_mem(new_balances);
    std::vector<Int> amountsp(n);
    for (std::size_t k = 0; k < n; ++k) amountsp[k] = xp_[k] - xp_old[k];

    const Int old_D = D;
    const Int D_new = newton_D(A, gamma, xp_);

    Int token_supply = tokens;
    Int d_token = old_D > 0 ? Int(token_supply * D_new / old_D - token_supply) : get_xcp(D_new);
    if (d_token <= 0) throw SafetyBoundError("add_liquidity: nothing minted");

    if (old_D > 0) {
        const Int d_token_fee = calc_token_fee(amountsp, xp_) * d_token / Fixed::FEE_PRECISION() + 1;
        d_token -= d_token_fee;
    }
    if (d_token < min_mint_amount) {
        throw SafetyBoundError("Slippage: minted " + d_token.str() + " < " + min_mint_amount.str());
    }

    balances = std::move(new_balances);

    if (old_D == 0) {
        // Initial deposit sets the virtual price to 1
        D = D_new;
        virtual_price = PREC();
        xcp_profit = PREC();
        tokens += d_token;
        return d_token;
    }

    token_supply += d_token;
    tokens += d_token;

    // Single-sided deposit: implied price of the deposited coin
    Int p = 0;
    std::size_t ix = 0;
    if (d_token > Fixed::NOISE_FEE()) {
        std::size_t nonzero = 0;
        for (std::size_t k = 0; k < n; ++k) {
            if (amounts[k] != 0) {
                ++nonzero;
                ix = k;
            }
        }
        if (nonzero == 1) {
            Int S = 0;
            for (std::size_t k = 0; k < n; ++k) {
                if (k == ix) continue;
                if (k == 0) {
                    S += balances[0] * precisions[0];
                } else {
                    S += balances[k] * precisions[k] * last_prices[k - 1] / PREC();
                }
            }
            S = S * d_token / token_supply;
            const Int denom = amounts[ix] * precisions[ix] - d_token * balances[ix] * precisions[ix] / token_supply;
            if (denom > 0) p = S * PREC() / denom;
        }
    }

    tweak_price(A, gamma, xp_, ix, p, D_new);
    return d_token;
}

std::vector<Int> CryptoPool::remove_liquidity(const Int& amount_, const std::vector<Int>& min_amounts) {
    if (!min_amounts.empty()) check_amounts(min_amounts, n);
    if (amount_ > tokens) throw SafetyBoundError("remove_liquidity: amount exceeds supply");

    const Int total_supply = tokens;
    const Int amount = amount_ - 1;  // rounding favors the remaining LPs

    std::vector<Int> withdrawn(n);
    std::vector<Int> new_balances = balances;
    for (std::size_t k = 0; k < n; ++k) {
        withdrawn[k] = balances[k] * amount / total_supply;
        if (!min_amounts.empty() && withdrawn[k] < min_amounts[k]) {
            throw SafetyBoundError("Slippage: withdrawal of coin " + std::to_string(k) + " below minimum");
        }
        new_balances[k] -= withdrawn[k];
    }

    balances = std::move(new_balances);
    tokens -= amount_;
    D = D - D * amount / total_supply;
    return withdrawn;
}

WithdrawQuote CryptoPool::calc_withdraw_one_coin_impl(const Int& token_amount, std::size_t i, bool update_D,
                                                      bool calc_price) const {
    check_index(i, n);
    const Int token_supply = tokens;
    if (token_amount > token_supply) {
        throw SafetyBoundError("calc_withdraw_one_coin: token amount more than supply");
    }

    const std::vector<Int>& xx = balances;
    auto xp_ = xp_mem(xx);

    const Int D0 = update_D ? newton_D(A, gamma, xp_) : D;
    Int D_new = D0;

    // Fee charged on D rather than on y
    const Int f = fee(xp_);
    const Int dD = token_amount * D_new / token_supply;
    D_new -= dD - (f * dD / (2 * Fixed::FEE_PRECISION()) + 1);

    const Int y = get_y(A, gamma, xp_, D_new, i).value;
    Int dy;
    if (i == 0) {
        dy = (xp_[i] - y) / precisions[i];
    } else {
        dy = (xp_[i] - y) * PREC() / (precisions[i] * price_scale[i - 1]);
    }
    xp_[i] = y;

    // Implied price for 2 coins; 3-coin pools fall back to the small-trade quote in tweak_price
    Int p = 0;
    if (n == 2 && calc_price && dy > Fixed::NOISE_FEE() && token_amount > Fixed::NOISE_FEE()) {
        Int S;
        Int precision;
        if (i == 1) {
            S = xx[0] * precisions[0];
            precision = precisions[1];
        } else {
            S = xx[1] * precisions[1];
            precision = precisions[0];
        }
        S = S * dD / D0;
        const Int denom = dy * precision - dD * xx[i] * precision / D0;
        if (denom > 0) {
            p = S * PREC() / denom;
            if (i == 0 && p > 0) p = PREC() * PREC() / p;
        }
    }

    return {dy, p, D_new, xp_};
}

Int CryptoPool::remove_liquidity_one_coin(const Int& token_amount, std::size_t i, const Int& min_amount) {
    auto quote = calc_withdraw_one_coin_impl(token_amount, i, false, true);
    if (quote.dy < min_amount) {
        throw SafetyBoundError("Slippage: dy=" + quote.dy.str() + " < min_amount=" + min_amount.str());
    }

    balances[i] -= quote.dy;
    tokens -= token_amount;

    tweak_price(A, gamma, quote.xp, i, quote.p, quote.D);
    return quote.dy;
}

Int CryptoPool::calc_withdraw_one_coin(const Int& token_amount, std::size_t i) const {
    return calc_withdraw_one_coin_impl(token_amount, i, true, false).dy;
}

Int CryptoPool::calc_token_amount(const std::vector<Int>& amounts) const {
    check_amounts(amounts, n);
    const Int token_supply = tokens;

    auto xp_ = xp();
    const auto amountsp = xp_mem(amounts);
    for (std::size_t k = 0; k < n; ++k) xp_[k] += amountsp[k];

    const Int D_new = newton_D(A, gamma, xp_);
    if (D == 0) return get_xcp(D_new);

    Int d_token = token_supply * D_new / D - token_supply;
    d_token -= calc_token_fee(amountsp, xp_) * d_token / Fixed::FEE_PRECISION() + 1;
    return d_token;
}

// =============================================================================
// Oracle and virtual price
// =============================================================================

Int CryptoPool::lp_price() const {
    return cryptoswap::lp_price(virtual_price, internal_price_oracle());
}

std::vector<Int> CryptoPool::internal_price_oracle() const {
    if (last_prices_timestamp < block_timestamp) {
        const Int alpha = get_alpha(ma_half_time, block_timestamp, last_prices_timestamp, n);
        return ema(last_prices, price_oracle_, alpha);
    }
    return price_oracle_;
}

Int CryptoPool::get_virtual_price() const {
    if (tokens == 0) return 0;
    return PREC() * get_xcp(D) / tokens;
}

double CryptoPool::dydx(std::size_t i, std::size_t j, bool use_fee) const {
    check_pair(i, j, n);
    const auto xp_ = xp();
    const auto p = get_p(xp_, D, A, gamma);

    // Value of one native unit of coin k in coin 0, as a 1e36-scaled integer
    auto value_of = [&](std::size_t k) -> Int {
        if (k == 0) return PREC() * PREC() * precisions[0];
        return p[k - 1] * price_scale[k - 1] * precisions[k];
    };

    double r = ratio_to_double(value_of(i), value_of(j));
    if (use_fee) {
        r *= 1.0 - ratio_to_double(fee(xp_), Fixed::FEE_PRECISION());
    }
    return r;
}

void CryptoPool::increment_timestamp(uint64_t blocks, std::optional<uint64_t> timestamp) {
    if (timestamp) {
        block_timestamp = *timestamp;
        return;
    }
    block_timestamp += 12 * blocks;
}

// =============================================================================
// Snapshots
// =============================================================================

CryptoSnapshot CryptoPool::get_snapshot() const {
    CryptoSnapshot s;
    s.balances = balances;
    s.D = D;
    s.price_scale = price_scale;
    s.price_oracle = price_oracle_;
    s.last_prices = last_prices;
    s.last_prices_timestamp = last_prices_timestamp;
    s.virtual_price = virtual_price;
    s.xcp_profit = xcp_profit;
    s.xcp_profit_a = xcp_profit_a;
    s.tokens = tokens;
    s.not_adjusted = not_adjusted;
    return s;
}

void CryptoPool::revert_to_snapshot(const CryptoSnapshot& s) {
    balances = s.balances;
    D = s.D;
    price_scale = s.price_scale;
    price_oracle_ = s.price_oracle;
    last_prices = s.last_prices;
    last_prices_timestamp = s.last_prices_timestamp;
    virtual_price = s.virtual_price;
    xcp_profit = s.xcp_profit;
    xcp_profit_a = s.xcp_profit_a;
    tokens = s.tokens;
    not_adjusted = s.not_adjusted;
}

} // namespace cryptoswap
} // namespace pools
} // namespace ammsim
