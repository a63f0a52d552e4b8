// Stableswap invariant math - implementation
#include "ammsim/pools/stableswap/stableswap_math.hpp"

#include <string>

#include "ammsim/core/errors.hpp"

namespace ammsim {
namespace pools {
namespace stableswap {

std::vector<Int> xp_mem(const std::vector<Int>& balances, const std::vector<Int>& rates) {
    std::vector<Int> xp(balances.size());
    for (std::size_t k = 0; k < balances.size(); ++k) {
        xp[k] = balances[k] * rates[k] / Fixed::PRECISION();
    }
    return xp;
}

Int get_D(const std::vector<Int>& xp, const Int& A) {
    const Int S = sum(xp);
    if (S == 0) return 0;

    const Int n = Int(xp.size());
    for (const auto& x : xp) {
        if (x <= 0) {
            throw SafetyBoundError("get_D: non-positive balance in " + to_string(xp) +
                                   " (A=" + A.str() + ")");
        }
    }

    const Int Ann = A * n;
    Int D = S;
    Int Dprev = 0;
    std::size_t it = 0;
    while (abs_int(D - Dprev) > 1) {
        if (it++ >= MAX_ITERATIONS) {
            throw CalculationError("Did not converge: get_D(xp=" + to_string(xp) +
                                   ", A=" + A.str() + ")");
        }
        Int D_P = D;
        for (const auto& x : xp) {
            D_P = D_P * D / (n * x);
        }
        Dprev = D;
        D = (Ann * S + D_P * n) * D / ((Ann - 1) * D + (n + 1) * D_P);
    }
    return D;
}

Int get_y(std::size_t i, std::size_t j, const Int& x, const std::vector<Int>& xp, const Int& A) {
    const Int D = get_D(xp, A);
    const Int n = Int(xp.size());
    const Int Ann = A * n;

    Int c = D;
    Int S = 0;
    for (std::size_t k = 0; k < xp.size(); ++k) {
        if (k == j) continue;
        const Int& xk = (k == i) ? x : xp[k];
        if (xk <= 0) {
            throw SafetyBoundError("get_y: non-positive balance (i=" + std::to_string(i) +
                                   ", x=" + x.str() + ", xp=" + to_string(xp) + ")");
        }
        c = c * D / (xk * n);
        S += xk;
    }
    c = c * D / (n * Ann);
    const Int b = S + D / Ann - D;

    Int y_prev = 0;
    Int y = D;
    std::size_t it = 0;
    while (abs_int(y - y_prev) > 1) {
        if (it++ >= MAX_ITERATIONS) {
            throw CalculationError("Did not converge: get_y(i=" + std::to_string(i) +
                                   ", j=" + std::to_string(j) + ", x=" + x.str() +
                                   ", xp=" + to_string(xp) + ", A=" + A.str() + ")");
        }
        y_prev = y;
        y = floor_div(y * y + c, 2 * y + b);
    }
    return y;
}

Int get_y_D(const Int& A, std::size_t i, const std::vector<Int>& xp, const Int& D) {
    const Int n = Int(xp.size());
    const Int Ann = A * n;

    Int c = D;
    Int S = 0;
    for (std::size_t k = 0; k < xp.size(); ++k) {
        if (k == i) continue;
        if (xp[k] <= 0) {
            throw SafetyBoundError("get_y_D: non-positive balance in " + to_string(xp));
        }
        c = c * D / (xp[k] * n);
        S += xp[k];
    }
    c = c * D / (n * Ann);
    const Int b = S + D / Ann;

    Int y_prev = 0;
    Int y = D;
    std::size_t it = 0;
    while (abs_int(y - y_prev) > 1) {
        if (it++ >= MAX_ITERATIONS) {
            throw CalculationError("Did not converge: get_y_D(i=" + std::to_string(i) +
                                   ", xp=" + to_string(xp) + ", D=" + D.str() +
                                   ", A=" + A.str() + ")");
        }
        y_prev = y;
        y = floor_div(y * y + c, 2 * y + b - D);
    }
    return y;
}

Int dynamic_fee(const Int& xpi, const Int& xpj, const Int& fee, const Int& fee_mul) {
    const Int& FEE_PREC = Fixed::FEE_PRECISION();
    Int xps2 = xpi + xpj;
    xps2 *= xps2;
    return (fee_mul * fee) / ((fee_mul - FEE_PREC) * 4 * xpi * xpj / xps2 + FEE_PREC);
}

SwapResult calc_withdraw_one_coin(const std::vector<Int>& balances, const std::vector<Int>& rates,
                                  const Int& A, const Int& fee, const Int& tokens,
                                  const Int& token_amount, std::size_t i, bool use_fee) {
    if (tokens == 0) throw SafetyBoundError("calc_withdraw_one_coin: pool has no liquidity tokens");
    const Int& PREC = Fixed::PRECISION();
    const Int& FEE_PREC = Fixed::FEE_PRECISION();
    const std::size_t n = balances.size();

    auto xp = xp_mem(balances, rates);
    const Int D0 = get_D(xp, A);
    const Int D1 = D0 - token_amount * D0 / tokens;
    const Int new_y = get_y_D(A, i, xp, D1);
    const Int dy_before_fee = floor_div((xp[i] - new_y) * PREC, rates[i]);

    // Reduced in place: the final read of xp[i] sees the fee-adjusted value
    if (fee != 0 && use_fee) {
        const Int n_coins = Int(n);
        const Int _fee = fee * n_coins / (4 * (n_coins - 1));
        for (std::size_t k = 0; k < n; ++k) {
            Int dx_expected;
            if (k == i) {
                dx_expected = xp[k] * D1 / D0 - new_y;
            } else {
                dx_expected = xp[k] - xp[k] * D1 / D0;
            }
            xp[k] -= floor_div(_fee * dx_expected, FEE_PREC);
        }
    }

    Int dy = xp[i] - get_y_D(A, i, xp, D1);
    dy = floor_div((dy - 1) * PREC, rates[i]);

    if (!use_fee) return {dy, Int(0)};
    return {dy, dy_before_fee - dy};
}

MintResult calc_token_amount(const std::vector<Int>& balances, const std::vector<Int>& rates,
                             const Int& A, const Int& fee, const Int& tokens,
                             const std::vector<Int>& amounts, bool use_fee) {
    const Int& FEE_PREC = Fixed::FEE_PRECISION();
    const std::size_t n = balances.size();

    const Int D0 = get_D(xp_mem(balances, rates), A);
    std::vector<Int> new_balances = balances;
    for (std::size_t k = 0; k < n; ++k) new_balances[k] += amounts[k];
    const Int D1 = get_D(xp_mem(new_balances, rates), A);

    MintResult out{Int(0), std::vector<Int>(n, Int(0))};

    // First deposit mints D with no imbalance fee
    if (D0 == 0) {
        out.amount = D1;
        return out;
    }

    std::vector<Int> mint_balances = new_balances;
    if (use_fee) {
        const Int n_coins = Int(n);
        const Int _fee = fee * n_coins / (4 * (n_coins - 1));
        for (std::size_t k = 0; k < n; ++k) {
            const Int ideal_balance = D1 * balances[k] / D0;
            const Int difference = abs_int(ideal_balance - new_balances[k]);
            out.fees[k] = _fee * difference / FEE_PREC;
            mint_balances[k] -= out.fees[k];
        }
    }
    const Int D2 = get_D(xp_mem(mint_balances, rates), A);
    out.amount = floor_div(tokens * (D2 - D0), D0);
    return out;
}

double dydx_raw(std::size_t i, std::size_t j, const std::vector<Int>& xp, const Int& A, const Int& D) {
    const unsigned n = static_cast<unsigned>(xp.size());
    const Int& xi = xp[i];
    const Int& xj = xp[j];

    const Int D_pow = ipow(D, n + 1);
    const Int x_prod = product(xp);
    const Int A_pow = A * ipow(Int(n), n + 1);

    const Int num = xj * (xi * A_pow * x_prod + D_pow);
    const Int den = xi * (xj * A_pow * x_prod + D_pow);
    return ratio_to_double(num, den);
}

} // namespace stableswap
} // namespace pools
} // namespace ammsim
