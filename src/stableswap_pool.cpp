// Stableswap pool - implementation
#include "ammsim/pools/stableswap/pool.hpp"

#include <string>
#include <utility>

#include "ammsim/core/errors.hpp"
#include "ammsim/pools/stableswap/stableswap_math.hpp"

namespace ammsim {
namespace pools {
namespace stableswap {

namespace {

std::vector<Int> default_rates(const StableswapParams& params) {
    if (params.rates.empty()) return std::vector<Int>(params.n, Fixed::PRECISION());
    if (params.rates.size() != params.n) {
        throw ConfigError("stableswap: expected " + std::to_string(params.n) + " rates, got " +
                          std::to_string(params.rates.size()));
    }
    return params.rates;
}

} // namespace

StableswapPool::StableswapPool(const StableswapParams& params, const Int& D)
    : A(params.A),
      n(params.n),
      fee(params.fee),
      fee_mul(params.fee_mul),
      admin_fee(params.admin_fee),
      rates(default_rates(params)),
      admin_balances(params.n, Int(0)) {
    if (n < 2) throw ConfigError("stableswap: need at least 2 coins");
    balances.reserve(n);
    for (const auto& rate : rates) {
        balances.push_back(D / n * Fixed::PRECISION() / rate);
    }
    tokens = params.tokens ? *params.tokens : this->D();
}

StableswapPool::StableswapPool(const StableswapParams& params, std::vector<Int> balances_)
    : A(params.A),
      n(params.n),
      fee(params.fee),
      fee_mul(params.fee_mul),
      admin_fee(params.admin_fee),
      rates(default_rates(params)),
      balances(std::move(balances_)),
      admin_balances(params.n, Int(0)) {
    if (n < 2) throw ConfigError("stableswap: need at least 2 coins");
    if (balances.size() != n) {
        throw ConfigError("stableswap: expected " + std::to_string(n) + " balances, got " +
                          std::to_string(balances.size()));
    }
    tokens = params.tokens ? *params.tokens : this->D();
}

std::vector<Int> StableswapPool::xp() const {
    return xp_mem(balances, rates);
}

Int StableswapPool::D() const {
    return get_D(xp());
}

Int StableswapPool::get_D(const std::vector<Int>& xp_) const {
    return stableswap::get_D(xp_, A);
}

Int StableswapPool::get_D_mem(const std::vector<Int>& balances_) const {
    return get_D(xp_mem(balances_, rates));
}

Int StableswapPool::get_y(std::size_t i, std::size_t j, const Int& x, const std::vector<Int>& xp_) const {
    return stableswap::get_y(i, j, x, xp_, A);
}

Int StableswapPool::get_y_D(const Int& A_, std::size_t i, const std::vector<Int>& xp_, const Int& D_) const {
    return stableswap::get_y_D(A_, i, xp_, D_);
}

SwapResult StableswapPool::exchange(std::size_t i, std::size_t j, const Int& dx) {
    check_pair(i, j, n);
    const Int& PREC = Fixed::PRECISION();
    const Int& FEE_PREC = Fixed::FEE_PRECISION();

    const auto xp_ = xp();
    const Int x = xp_[i] + dx * rates[i] / PREC;
    const Int y = get_y(i, j, x, xp_);
    Int dy = xp_[j] - y - 1;

    Int dy_fee;
    if (fee_mul) {
        dy_fee = floor_div(dy * dynamic_fee((xp_[i] + x) / 2, (xp_[j] + y) / 2), FEE_PREC);
    } else {
        dy_fee = floor_div(dy * fee, FEE_PREC);
    }
    Int dy_admin_fee = floor_div(dy_fee * admin_fee, FEE_PREC);

    const Int& rate = rates[j];
    dy = floor_div((dy - dy_fee) * PREC, rate);
    dy_fee = floor_div(dy_fee * PREC, rate);
    dy_admin_fee = floor_div(dy_admin_fee * PREC, rate);

    if (dy < 0) {
        throw SafetyBoundError("exchange produced negative output: i=" + std::to_string(i) +
                               " j=" + std::to_string(j) + " dx=" + dx.str() +
                               " balances=" + to_string(balances));
    }

    balances[i] += dx;
    balances[j] -= dy + dy_admin_fee;
    admin_balances[j] += dy_admin_fee;
    return {dy, dy_fee};
}

SwapResult StableswapPool::calc_withdraw_one_coin(const Int& token_amount, std::size_t i, bool use_fee) const {
    check_index(i, n);
    return stableswap::calc_withdraw_one_coin(balances, rates, A, fee, tokens, token_amount, i, use_fee);
}

SwapResult StableswapPool::remove_liquidity_one_coin(const Int& token_amount, std::size_t i) {
    const auto out = calc_withdraw_one_coin(token_amount, i, true);
    const Int dy_admin_fee = floor_div(out.fee * admin_fee, Fixed::FEE_PRECISION());
    balances[i] -= out.dy + dy_admin_fee;
    admin_balances[i] += dy_admin_fee;
    tokens -= token_amount;
    return out;
}

MintResult StableswapPool::calc_token_amount(const std::vector<Int>& amounts, bool use_fee) const {
    check_amounts(amounts, n);
    return stableswap::calc_token_amount(balances, rates, A, fee, tokens, amounts, use_fee);
}

Int StableswapPool::add_liquidity(const std::vector<Int>& amounts) {
    const auto mint = calc_token_amount(amounts, true);
    tokens += mint.amount;
    for (std::size_t k = 0; k < n; ++k) {
        const Int admin_part = mint.fees[k] * admin_fee / Fixed::FEE_PRECISION();
        balances[k] += amounts[k] - admin_part;
        admin_balances[k] += admin_part;
    }
    return mint.amount;
}

Int StableswapPool::get_virtual_price() const {
    if (tokens == 0) return 0;
    return D() * Fixed::PRECISION() / tokens;
}

Int StableswapPool::dynamic_fee(const Int& xpi, const Int& xpj) const {
    return stableswap::dynamic_fee(xpi, xpj, fee, fee_mul ? *fee_mul : Fixed::FEE_PRECISION());
}

double StableswapPool::dydx(std::size_t i, std::size_t j, bool use_fee) const {
    check_pair(i, j, n);
    const auto xp_ = xp();
    double r = dydx_raw(i, j, xp_, A, get_D(xp_));

    double fee_factor = 0.0;
    if (use_fee) {
        const Int f = fee_mul ? dynamic_fee(xp_[i], xp_[j]) : fee;
        fee_factor = ratio_to_double(f, Fixed::FEE_PRECISION());
    }
    r *= 1.0 - fee_factor;
    return r;
}

StableswapSnapshot StableswapPool::get_snapshot() const {
    return {balances, admin_balances, tokens};
}

void StableswapPool::revert_to_snapshot(const StableswapSnapshot& snapshot) {
    balances = snapshot.balances;
    admin_balances = snapshot.admin_balances;
    tokens = snapshot.tokens;
}

} // namespace stableswap
} // namespace pools
} // namespace ammsim
