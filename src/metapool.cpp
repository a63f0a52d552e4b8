// Stableswap meta-pool - implementation
#include "ammsim/pools/stableswap/metapool.hpp"

#include <string>
#include <utility>

#include "ammsim/core/errors.hpp"
#include "ammsim/pools/stableswap/stableswap_math.hpp"

namespace ammsim {
namespace pools {
namespace stableswap {

namespace {

std::vector<Int> default_multipliers(const StableswapParams& params) {
    if (params.rates.empty()) return std::vector<Int>(params.n, Fixed::PRECISION());
    if (params.rates.size() != params.n) {
        throw ConfigError("metapool: expected " + std::to_string(params.n) + " rates, got " +
                          std::to_string(params.rates.size()));
    }
    return params.rates;
}

} // namespace

MetaPool::MetaPool(const StableswapParams& params, const Int& D, StableswapPool basepool_)
    : A(params.A),
      n(params.n),
      max_coin(params.n - 1),
      fee(params.fee),
      fee_mul(params.fee_mul),
      admin_fee(params.admin_fee),
      rate_multipliers(default_multipliers(params)),
      admin_balances(params.n, Int(0)),
      basepool(std::move(basepool_)) {
    if (n < 2) throw ConfigError("metapool: need at least 2 coins");
    validate_basepool();
    const auto rates_ = rates();
    balances.reserve(n);
    for (const auto& rate : rates_) {
        balances.push_back(D / n * Fixed::PRECISION() / rate);
    }
    tokens = params.tokens ? *params.tokens : this->D();
}

MetaPool::MetaPool(const StableswapParams& params, std::vector<Int> balances_, StableswapPool basepool_)
    : A(params.A),
      n(params.n),
      max_coin(params.n - 1),
      fee(params.fee),
      fee_mul(params.fee_mul),
      admin_fee(params.admin_fee),
      rate_multipliers(default_multipliers(params)),
      balances(std::move(balances_)),
      admin_balances(params.n, Int(0)),
      basepool(std::move(basepool_)) {
    if (n < 2) throw ConfigError("metapool: need at least 2 coins");
    if (balances.size() != n) {
        throw ConfigError("metapool: expected " + std::to_string(n) + " balances, got " +
                          std::to_string(balances.size()));
    }
    validate_basepool();
    tokens = params.tokens ? *params.tokens : this->D();
}

void MetaPool::validate_basepool() const {
    const Int limit = pow10(30);
    for (const auto& r : basepool.rates) {
        if (r > limit) {
            throw ConfigError("metapool: base pool rate " + r.str() + " too high: decimals must be >= 6");
        }
    }
}

std::vector<Int> MetaPool::rates() const {
    std::vector<Int> out = rate_multipliers;
    out[max_coin] = basepool.get_virtual_price();
    return out;
}

std::vector<Int> MetaPool::xp() const {
    return xp_mem(balances, rates());
}

Int MetaPool::D() const {
    return get_D(xp());
}

Int MetaPool::get_D(const std::vector<Int>& xp_) const {
    return stableswap::get_D(xp_, A);
}

Int MetaPool::get_D_mem(const std::vector<Int>& rates_, const std::vector<Int>& balances_) const {
    return get_D(xp_mem(balances_, rates_));
}

Int MetaPool::get_y(std::size_t i, std::size_t j, const Int& x, const std::vector<Int>& xp_) const {
    return stableswap::get_y(i, j, x, xp_, A);
}

Int MetaPool::get_y_D(const Int& A_, std::size_t i, const std::vector<Int>& xp_, const Int& D_) const {
    return stableswap::get_y_D(A_, i, xp_, D_);
}

SwapResult MetaPool::exchange(std::size_t i, std::size_t j, const Int& dx) {
    check_pair(i, j, n);
    const Int& PREC = Fixed::PRECISION();
    const Int& FEE_PREC = Fixed::FEE_PRECISION();

    const auto rates_ = rates();
    const auto xp_ = xp_mem(balances, rates_);
    const Int x = xp_[i] + dx * rates_[i] / PREC;
    const Int y = get_y(i, j, x, xp_);
    Int dy = xp_[j] - y - 1;

    Int dy_fee;
    if (fee_mul) {
        dy_fee = floor_div(dy * dynamic_fee((xp_[i] + x) / 2, (xp_[j] + y) / 2), FEE_PREC);
    } else {
        dy_fee = floor_div(dy * fee, FEE_PREC);
    }
    Int dy_admin_fee = floor_div(dy_fee * admin_fee, FEE_PREC);

    dy = floor_div((dy - dy_fee) * PREC, rates_[j]);
    dy_fee = floor_div(dy_fee * PREC, rates_[j]);
    dy_admin_fee = floor_div(dy_admin_fee * PREC, rates_[j]);

    if (dy < 0) {
        throw SafetyBoundError("metapool exchange produced negative output: i=" + std::to_string(i) +
                               " j=" + std::to_string(j) + " dx=" + dx.str());
    }

    balances[i] += dx;
    balances[j] -= dy + dy_admin_fee;
    admin_balances[j] += dy_admin_fee;
    return {dy, dy_fee};
}

SwapResult MetaPool::exchange_underlying(std::size_t i, std::size_t j, const Int& dx) {
    check_pair(i, j, n_total());
    const Int& PREC = Fixed::PRECISION();
    const Int& FEE_PREC = Fixed::FEE_PRECISION();

    const bool i_in_base = i >= max_coin;
    const bool j_in_base = j >= max_coin;

    if (i_in_base && j_in_base) {
        return basepool.exchange(i - max_coin, j - max_coin, dx);
    }

    const std::size_t meta_i = i_in_base ? max_coin : i;
    const std::size_t meta_j = j_in_base ? max_coin : j;

    // Rates are taken before the base deposit moves the base virtual price
    const auto rates_ = rates();
    const auto xp_ = xp_mem(balances, rates_);

    Int dx_meta = dx;
    Int x;
    if (!i_in_base) {
        x = xp_[i] + dx * rates_[i] / PREC;
    } else {
        std::vector<Int> base_inputs(basepool.n, Int(0));
        base_inputs[i - max_coin] = dx;
        dx_meta = basepool.add_liquidity(base_inputs);
        x = dx_meta * rates_[max_coin] / PREC + xp_[max_coin];
    }

    const Int y = get_y(meta_i, meta_j, x, xp_);
    Int dy = xp_[meta_j] - y - 1;
    Int dy_fee = floor_div(dy * fee, FEE_PREC);
    Int dy_admin_fee = floor_div(dy_fee * admin_fee, FEE_PREC);

    dy = floor_div((dy - dy_fee) * PREC, rates_[meta_j]);
    dy_admin_fee = floor_div(dy_admin_fee * PREC, rates_[meta_j]);
    dy_fee = floor_div(dy_fee * PREC, rates_[meta_j]);

    if (dy < 0) {
        throw SafetyBoundError("exchange_underlying produced negative output: i=" + std::to_string(i) +
                               " j=" + std::to_string(j) + " dx=" + dx.str());
    }

    balances[meta_i] += dx_meta;
    balances[meta_j] -= dy + dy_admin_fee;
    admin_balances[meta_j] += dy_admin_fee;

    if (j_in_base) {
        return basepool.remove_liquidity_one_coin(dy, j - max_coin);
    }
    return {dy, dy_fee};
}

SwapResult MetaPool::calc_withdraw_one_coin(const Int& token_amount, std::size_t i, bool use_fee) const {
    check_index(i, n);
    return stableswap::calc_withdraw_one_coin(balances, rates(), A, fee, tokens, token_amount, i, use_fee);
}

SwapResult MetaPool::remove_liquidity_one_coin(const Int& token_amount, std::size_t i) {
    const auto out = calc_withdraw_one_coin(token_amount, i, true);
    const Int dy_admin_fee = floor_div(out.fee * admin_fee, Fixed::FEE_PRECISION());
    balances[i] -= out.dy + dy_admin_fee;
    admin_balances[i] += dy_admin_fee;
    tokens -= token_amount;
    return out;
}

MintResult MetaPool::calc_token_amount(const std::vector<Int>& amounts, bool use_fee) const {
    check_amounts(amounts, n);
    return stableswap::calc_token_amount(balances, rates(), A, fee, tokens, amounts, use_fee);
}

Int MetaPool::add_liquidity(const std::vector<Int>& amounts) {
    const auto mint = calc_token_amount(amounts, true);
    tokens += mint.amount;
    for (std::size_t k = 0; k < n; ++k) {
        const Int admin_part = mint.fees[k] * admin_fee / Fixed::FEE_PRECISION();
        balances[k] += amounts[k] - admin_part;
        admin_balances[k] += admin_part;
    }
    return mint.amount;
}

Int MetaPool::get_virtual_price() const {
    if (tokens == 0) return 0;
    return D() * Fixed::PRECISION() / tokens;
}

Int MetaPool::dynamic_fee(const Int& xpi, const Int& xpj) const {
    return stableswap::dynamic_fee(xpi, xpj, fee, fee_mul ? *fee_mul : Fixed::FEE_PRECISION());
}

double MetaPool::dydx_meta(std::size_t i, std::size_t j, const std::vector<Int>& xp_, bool use_fee) const {
    check_pair(i, j, n);
    double r = dydx_raw(i, j, xp_, A, get_D(xp_));
    if (!use_fee) return r;

    double fee_factor;
    if (!fee_mul) {
        fee_factor = ratio_to_double(fee, Fixed::FEE_PRECISION());
    } else {
        // Dynamic fee sampled at the midpoint of a 1e12 test trade
        const Int dx = pow10(12);
        const Int dy = from_double(r * 1e12);
        fee_factor = ratio_to_double(dynamic_fee(xp_[i] + dx / 2, xp_[j] - dy / 2), Fixed::FEE_PRECISION());
    }
    return r * (1.0 - fee_factor);
}

double MetaPool::dydx(std::size_t i, std::size_t j, bool use_fee) const {
    check_pair(i, j, n_total());
    const bool i_in_base = i >= max_coin;
    const bool j_in_base = j >= max_coin;

    if (i_in_base && j_in_base) {
        return basepool.dydx(i - max_coin, j - max_coin, use_fee);
    }

    const auto rates_ = rates();
    const auto xp_ = xp_mem(balances, rates_);

    if (!i_in_base && !j_in_base) {
        return dydx_meta(i, j, xp_, use_fee);
    }

    if (!i_in_base) {
        // Primary coin into a base coin: d(base coin)/d(LP) by implicit differentiation
        // of the base invariant, chained with the meta price of the LP slot
        const std::size_t base_j = j - max_coin;
        const auto base_xp = basepool.xp();
        const unsigned nb = static_cast<unsigned>(basepool.n);
        const Int Db = basepool.get_D(base_xp);
        const Int x_prod = product(base_xp);
        const Int D_pow = ipow(Db, nb + 1);
        const Int A_pow = basepool.A * ipow(Int(nb), nb + 1);
        const Int& xj = base_xp[base_j];

        const Float num = Float(A_pow * x_prod) + Float(D_pow) / Float(xj);
        const Float den = Float(ipow(Int(nb), nb) * x_prod - A_pow * x_prod - Int(nb + 1) * ipow(Db, nb));
        const double D_prime = static_cast<double>(-num / den);

        const double dwdz = dydx_meta(i, max_coin, xp_, use_fee);
        double r = dwdz / D_prime;

        if (use_fee && basepool.fee != 0) {
            const Int base_fee =
                basepool.fee - basepool.fee * xj / sum(base_xp) + Int(500000);
            r *= 1.0 - ratio_to_double(base_fee, Fixed::FEE_PRECISION());
        }
        return r;
    }

    // Base coin into a primary coin: quote a small deposit into the base pool
    const std::size_t base_i = i - max_coin;
    const Int dx = pow10(12);
    std::vector<Int> base_inputs(basepool.n, Int(0));
    base_inputs[base_i] = dx * Fixed::PRECISION() / basepool.rates[base_i];
    const Int dw = basepool.calc_token_amount(base_inputs, true).amount * rates_[max_coin] / Fixed::PRECISION();

    const Int x = xp_[max_coin] + dw;
    const Int y = get_y(max_coin, j, x, xp_);
    Int dy = xp_[j] - y - 1;
    if (use_fee) dy -= dy * fee / Fixed::FEE_PRECISION();
    return ratio_to_double(dy, dx);
}

MetaPoolSnapshot MetaPool::get_snapshot() const {
    return {{balances, admin_balances, tokens}, basepool.get_snapshot()};
}

void MetaPool::revert_to_snapshot(const MetaPoolSnapshot& snapshot) {
    balances = snapshot.meta.balances;
    admin_balances = snapshot.meta.admin_balances;
    tokens = snapshot.meta.tokens;
    basepool.revert_to_snapshot(snapshot.base);
}

} // namespace stableswap
} // namespace pools
} // namespace ammsim
