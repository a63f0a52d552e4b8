// Cryptoswap invariant math - implementation
#include "ammsim/pools/cryptoswap/calcs.hpp"

#include <algorithm>
#include <functional>
#include <string>

#include "ammsim/core/errors.hpp"
#include "ammsim/core/logging.hpp"
#include "ammsim/math/fixed_point.hpp"

namespace ammsim {
namespace pools {
namespace cryptoswap {

namespace {

const Int& E18() { return pow10(18); }
const Int& E36() { return pow10(36); }

void check_A_gamma(const Int& ANN, const Int& gamma, const Int& lo_A, const Int& hi_A,
                   const Int& lo_gamma, const Int& hi_gamma) {
    if (ANN < lo_A || ANN > hi_A) {
        throw SafetyBoundError("Unsafe value for A: " + ANN.str() + " not in [" + lo_A.str() + ", " +
                               hi_A.str() + "]");
    }
    if (gamma < lo_gamma || gamma > hi_gamma) {
        throw SafetyBoundError("Unsafe value for gamma: " + gamma.str() + " not in [" + lo_gamma.str() +
                               ", " + hi_gamma.str() + "]");
    }
}

void check_D_range(const Int& D, const char* where) {
    if (D < pow10(17) || D > pow10(33)) {
        throw SafetyBoundError(std::string(where) + ": unsafe value for D: " + D.str());
    }
}

// 1e16 <= x[k] * 1e18 / D <= 1e20 for every k != skip
void check_fracs(const std::vector<Int>& x, const Int& D, std::size_t skip, const char* where) {
    for (std::size_t k = 0; k < x.size(); ++k) {
        if (k == skip) continue;
        const Int frac = x[k] * E18() / D;
        if (frac < pow10(16) || frac > pow10(20)) {
            throw SafetyBoundError(std::string(where) + ": unsafe values x[i]: x=" + to_string(x) +
                                   " D=" + D.str());
        }
    }
}

// Checks on solver output: a converged D or y outside the safe band is a calculation failure
void check_solved_fracs(const std::vector<Int>& x, const Int& D, const char* where) {
    for (const auto& xi : x) {
        const Int frac = xi * E18() / D;
        if (frac < pow10(16) || frac > pow10(20)) {
            throw CalculationError(std::string(where) + ": unsafe values x[i]: x=" + to_string(x) +
                                   " D=" + D.str());
        }
    }
}

void check_y_frac(const Int& y, const Int& D, const char* where) {
    const Int frac = y * E18() / D;
    if (frac < pow10(16) || frac > pow10(20)) {
        throw CalculationError(std::string(where) + ": unsafe value for y: y=" + y.str() + " D=" + D.str());
    }
}

std::vector<Int> sorted_desc(std::vector<Int> x) {
    std::sort(x.begin(), x.end(), std::greater<Int>());
    return x;
}

// Newton iteration on y shared by the 2-coin and 3-coin solvers; only the seed differs
Int newton_y_iterate(const Int& ANN, const Int& gamma, const Int& D, Int y, const Int& K0_i,
                     const Int& S_i, std::size_t n_coins, const Int& convergence_limit) {
    const Int& PREC = E18();
    const Int n = Int(n_coins);

    for (std::size_t it = 0; it < MAX_ITERATIONS; ++it) {
        const Int y_prev = y;
        const Int K0 = K0_i * y * n / D;
        const Int S = S_i + y;

        const Int _g1k0 = abs_int(gamma + PREC - K0) + 1;
        const Int mul1 = PREC * D / gamma * _g1k0 / gamma * _g1k0 * Fixed::A_MULTIPLIER() / ANN;
        const Int mul2 = PREC + 2 * PREC * K0 / _g1k0;

        Int yfprime = PREC * y + S * mul2 + mul1;
        const Int _dyfprime = D * mul2;
        if (yfprime < _dyfprime) {
            y = y_prev / 2;
            continue;
        }
        yfprime -= _dyfprime;
        const Int fprime = yfprime / y;

        Int y_minus = mul1 / fprime;
        const Int y_plus = (yfprime + PREC * D) / fprime + y_minus * PREC / K0;
        y_minus += PREC * S / fprime;

        if (y_plus < y_minus) {
            y = y_prev / 2;
        } else {
            y = y_plus - y_minus;
        }

        const Int diff = abs_int(y - y_prev);
        if (diff < max_int(convergence_limit, y / pow10(14))) {
            check_y_frac(y, D, "newton_y");
            return y;
        }
    }
    throw CalculationError("Did not converge: newton_y(ANN=" + ANN.str() + ", gamma=" + gamma.str() +
                           ", D=" + D.str() + ")");
}

} // namespace

// =============================================================================
// 2-coin
// =============================================================================
namespace two_coin {

Int min_A() { return 4 * Fixed::A_MULTIPLIER() / 10; }
Int max_A() { return 4 * Fixed::A_MULTIPLIER() * 100000; }
Int min_gamma() { return pow10(10); }
Int max_gamma() { return 2 * pow10(16); }

Int newton_D(const Int& ANN, const Int& gamma, const std::vector<Int>& x_unsorted) {
    check_A_gamma(ANN, gamma, min_A(), max_A(), min_gamma(), max_gamma());
    const Int& PREC = E18();
    const Int n = 2;

    const auto x = sorted_desc(x_unsorted);
    if (x[0] < pow10(9) || x[0] > pow10(33)) {
        throw SafetyBoundError("newton_D: unsafe values x[0]: " + to_string(x_unsorted));
    }
    if (x[1] * PREC / x[0] < pow10(11)) {
        throw SafetyBoundError("newton_D: unsafe values x[i] (input): " + to_string(x_unsorted));
    }

    Int D = n * math::geometric_mean2(x, false);
    const Int S = x[0] + x[1];

    for (std::size_t it = 0; it < MAX_ITERATIONS; ++it) {
        const Int D_prev = D;
        const Int K0 = 4 * PREC * x[0] / D * x[1] / D;

        const Int _g1k0 = abs_int(gamma + PREC - K0) + 1;
        const Int mul1 = PREC * D / gamma * _g1k0 / gamma * _g1k0 * Fixed::A_MULTIPLIER() / ANN;
        const Int mul2 = 2 * PREC * n * K0 / _g1k0;

        const Int neg_fprime = (S + S * mul2 / PREC) + mul1 * n / K0 - mul2 * D / PREC;

        const Int D_plus = floor_div(D * (neg_fprime + S), neg_fprime);
        Int D_minus = floor_div(D * D, neg_fprime);
        if (PREC > K0) {
            D_minus += D * floor_div(mul1, neg_fprime) / PREC * (PREC - K0) / K0;
        } else {
            D_minus -= D * floor_div(mul1, neg_fprime) / PREC * (K0 - PREC) / K0;
        }

        if (D_plus > D_minus) {
            D = D_plus - D_minus;
        } else {
            D = (D_minus - D_plus) / 2;
        }

        const Int diff = abs_int(D - D_prev);
        if (diff * pow10(14) < max_int(pow10(16), D)) {
            for (const auto& xi : x) {
                const Int frac = xi * PREC / D;
                if (frac < pow10(16) || frac > pow10(20)) {
                    throw CalculationError("Unsafe value for x[i]: x=" + to_string(x_unsorted) +
                                           " D=" + D.str());
                }
            }
            return D;
        }
    }
    throw CalculationError("Did not converge: newton_D(ANN=" + ANN.str() + ", gamma=" + gamma.str() +
                           ", x=" + to_string(x_unsorted) + ")");
}

Int newton_y(const Int& ANN, const Int& gamma, const std::vector<Int>& x, const Int& D, std::size_t i) {
    check_A_gamma(ANN, gamma, min_A(), max_A(), min_gamma(), max_gamma());
    check_D_range(D, "newton_y");
    check_fracs(x, D, i, "newton_y");

    std::vector<Int> x_sorted = x;
    x_sorted[i] = 0;
    x_sorted = sorted_desc(x_sorted);
    const Int convergence_limit = max_int(max_int(x_sorted[0] / pow10(14), D / pow10(14)), Int(100));

    const Int S_i = x[1 - i];
    const Int y = D * D / (S_i * 4);
    const Int K0_i = 2 * E18() * S_i / D;

    return newton_y_iterate(ANN, gamma, D, y, K0_i, S_i, 2, convergence_limit);
}

Int lp_price(const Int& virtual_price, const std::vector<Int>& price_oracle) {
    return 2 * virtual_price * math::sqrt_int(price_oracle[0]) / E18();
}

} // namespace two_coin

// =============================================================================
// 3-coin
// =============================================================================
namespace three_coin {

Int min_A() { return 27 * Fixed::A_MULTIPLIER() / 100; }
Int max_A() { return 27 * Fixed::A_MULTIPLIER() * 1000; }
Int min_gamma() { return pow10(10); }
Int max_gamma() { return 5 * pow10(16); }

Int newton_D(const Int& ANN, const Int& gamma, const std::vector<Int>& x_unsorted, const Int& K0_prev) {
    const Int& PREC = E18();
    const Int n = 3;

    const auto x = sorted_desc(x_unsorted);
    static const Int x0_cap = (ipow(Int(2), 256) - 1) / PREC * 27;
    if (x[0] >= x0_cap || x[0] <= 0) {
        throw SafetyBoundError("newton_D: unsafe values x[0]: " + to_string(x_unsorted));
    }
    const Int S = sum(x);

    Int D;
    if (K0_prev == 0) {
        D = n * math::geometric_mean3(x);
    } else if (S > E36()) {
        D = math::cbrt(x[0] * x[1] / E36() * x[2] / K0_prev * 27 * pow10(12));
    } else if (S > pow10(24)) {
        D = math::cbrt(x[0] * x[1] / pow10(24) * x[2] / K0_prev * 27 * pow10(6));
    } else {
        D = math::cbrt(x[0] * x[1] / PREC * x[2] / K0_prev * 27);
    }
    if (D == 0) {
        throw CalculationError("newton_D: zero initial guess for x=" + to_string(x_unsorted));
    }

    for (std::size_t it = 0; it < MAX_ITERATIONS; ++it) {
        const Int D_prev = D;
        const Int K0 = PREC * x[0] * n / D * x[1] * n / D * x[2] * n / D;

        const Int _g1k0 = abs_int(gamma + PREC - K0) + 1;
        const Int mul1 = PREC * D / gamma * _g1k0 / gamma * _g1k0 * Fixed::A_MULTIPLIER() / ANN;
        const Int mul2 = 2 * PREC * n * K0 / _g1k0;

        const Int neg_fprime = (S + S * mul2 / PREC) + mul1 * n / K0 - mul2 * D / PREC;

        const Int D_plus = floor_div(D * (neg_fprime + S), neg_fprime);
        Int D_minus = floor_div(D * D, neg_fprime);
        if (PREC > K0) {
            D_minus += D * floor_div(mul1, neg_fprime) / PREC * (PREC - K0) / K0;
        } else {
            D_minus -= floor_div(floor_div(D * mul1, neg_fprime) / PREC * (K0 - PREC), K0);
        }

        if (D_plus > D_minus) {
            D = D_plus - D_minus;
        } else {
            D = (D_minus - D_plus) / 2;
        }

        const Int diff = abs_int(D - D_prev);
        if (diff * pow10(14) < max_int(pow10(16), D)) {
            check_solved_fracs(x, D, "newton_D");
            return D;
        }
    }
    throw CalculationError("Did not converge: newton_D(ANN=" + ANN.str() + ", gamma=" + gamma.str() +
                           ", x=" + to_string(x_unsorted) + ")");
}

Int newton_y(const Int& ANN, const Int& gamma, const std::vector<Int>& x, const Int& D, std::size_t i) {
    check_A_gamma(ANN, gamma, min_A(), max_A(), min_gamma(), max_gamma());
    check_D_range(D, "newton_y");
    check_fracs(x, D, i, "newton_y");

    const std::size_t n_coins = x.size();
    const Int n = Int(n_coins);

    std::vector<Int> x_sorted = x;
    x_sorted[i] = 0;
    x_sorted = sorted_desc(x_sorted);
    const Int convergence_limit = max_int(max_int(x_sorted[0] / pow10(14), D / pow10(14)), Int(100));

    Int y = D / n;
    Int K0_i = E18();
    Int S_i = 0;
    for (std::size_t j = 2; j <= n_coins; ++j) {
        const Int& _x = x_sorted[n_coins - j];
        y = y * D / (_x * n);  // small _x first
        S_i += _x;
    }
    for (std::size_t j = 0; j + 1 < n_coins; ++j) {
        K0_i = K0_i * x_sorted[j] * n / D;  // large _x first
    }

    return newton_y_iterate(ANN, gamma, D, y, K0_i, S_i, n_coins, convergence_limit);
}

YResult get_y(const Int& ANN, const Int& gamma_, const std::vector<Int>& x, const Int& D, std::size_t i) {
    check_A_gamma(ANN, gamma_, min_A(), max_A(), min_gamma(), max_gamma());
    check_D_range(D, "get_y");
    check_fracs(x, D, i, "get_y");

    const Int& PREC = E18();
    const Int& A_MUL = Fixed::A_MULTIPLIER();

    std::size_t j = 0;
    std::size_t k = 0;
    if (i == 0) {
        j = 1;
        k = 2;
    } else if (i == 1) {
        j = 0;
        k = 2;
    } else {
        j = 0;
        k = 1;
    }

    const Int& x_j = x[j];
    const Int& x_k = x[k];
    const Int& gamma = gamma_;
    const Int gamma2 = gamma * gamma;

    Int a = E36() / 27;
    Int b = E36() / 9 + 2 * PREC * gamma / 27 - D * D / x_j * gamma2 * ANN / 729 / A_MUL / x_k;
    const bool b_is_neg = b < 0;

    Int c = E36() / 9 + gamma * (gamma + 4 * PREC) / 27;
    const Int _c_neg = x_j + x_k - D;
    if (_c_neg < 0) {
        c -= gamma2 * (-_c_neg) / D * ANN / 27 / A_MUL;
    } else {
        c += gamma2 * _c_neg / D * ANN / 27 / A_MUL;
    }
    const bool c_is_neg = c < 0;

    Int d = (PREC + gamma) * (PREC + gamma) / 27;

    // Scale the cubic coefficients to keep the intermediate products in range
    const Int d0 = abs_int(floor_div(3 * a * c, b) - b);
    Int divider = 1;
    if (d0 > pow10(48)) {
        divider = pow10(30);
    } else if (d0 > pow10(44)) {
        divider = pow10(26);
    } else if (d0 > pow10(40)) {
        divider = pow10(22);
    } else if (d0 > pow10(36)) {
        divider = pow10(18);
    } else if (d0 > pow10(32)) {
        divider = pow10(14);
    } else if (d0 > pow10(28)) {
        divider = pow10(10);
    } else if (d0 > pow10(24)) {
        divider = pow10(6);
    } else if (d0 > pow10(20)) {
        divider = pow10(2);
    }

    if (b_is_neg) b = -b;
    if (c_is_neg) c = -c;

    if (a > b) {
        const Int additional_prec = a / b;
        a = a * additional_prec / divider;
        b = b * additional_prec / divider;
        c = c * additional_prec / divider;
        d = d * additional_prec / divider;
    } else {
        const Int additional_prec = b / a;
        a = a / additional_prec / divider;
        b = b / additional_prec / divider;
        c = c / additional_prec / divider;
        d = d / additional_prec / divider;
    }

    if (b_is_neg) b = -b;
    if (c_is_neg) c = -c;

    auto sign = [](const Int& v) { return v < 0 ? -1 : 1; };

    const Int _3ac = 3 * a * c;
    Int delta0;
    Int delta1;
    if (sign(_3ac) != sign(b)) {
        delta0 = -floor_div(_3ac, -b) - b;
        delta1 = -floor_div(3 * _3ac, -b) - 2 * b;
    } else {
        delta0 = floor_div(_3ac, b) - b;
        delta1 = floor_div(3 * _3ac, b) - 2 * b;
    }

    if (b_is_neg) {
        delta1 -= 27 * a * a / (-b) * d / (-b);
    } else {
        delta1 -= 27 * a * a / b * d / b;
    }

    Int sqrt_arg;
    if (b_is_neg) {
        sqrt_arg = delta1 * delta1 - floor_div(4 * delta0 * delta0, -b) * delta0;
    } else {
        sqrt_arg = delta1 * delta1 + floor_div(4 * delta0 * delta0, b) * delta0;
    }

    if (sqrt_arg <= 0) {
        if (trace_enabled()) {
            std::lock_guard<std::mutex> lk(io_mu);
            std::cerr << "[get_y] non-positive discriminant, falling back to newton_y" << std::endl;
        }
        return {newton_y(ANN, gamma, x, D, i), Int(0)};
    }
    const Int sqrt_val = math::isqrt(sqrt_arg);

    const Int b_cbrt = b >= 0 ? math::cbrt(b) : Int(-math::cbrt(-b));

    Int second_cbrt;
    if (delta1 > 0) {
        second_cbrt = math::cbrt((delta1 + sqrt_val) / 2);
    } else {
        second_cbrt = -math::cbrt((sqrt_val - delta1) / 2);
    }

    Int C1;
    if (second_cbrt < 0) {
        C1 = -(b_cbrt * b_cbrt / PREC * (-second_cbrt) / PREC);
    } else {
        C1 = b_cbrt * b_cbrt / PREC * second_cbrt / PREC;
    }
    if (C1 == 0) {
        throw CalculationError("get_y: degenerate cubic for x=" + to_string(x) + " D=" + D.str());
    }

    Int root_K0;
    if (sign(b * delta0) != sign(C1)) {
        root_K0 = floor_div(b - floor_div(b * delta0, -C1) - C1, Int(3));
    } else {
        root_K0 = floor_div(b + floor_div(b * delta0, C1) - C1, Int(3));
    }

    const Int root = floor_div(D * D / 27 / x_k * D / x_j * root_K0, a);
    YResult out{root, floor_div(PREC * root_K0, a)};
    check_y_frac(out.value, D, "get_y");
    return out;
}

Int lp_price(const Int& virtual_price, const std::vector<Int>& price_oracle) {
    return 3 * virtual_price * math::cbrt(price_oracle[0] * price_oracle[1]) / pow10(24);
}

} // namespace three_coin

// =============================================================================
// Dispatch
// =============================================================================

Int newton_D(const Int& ANN, const Int& gamma, const std::vector<Int>& xp, const Int& K0_prev) {
    if (xp.size() == 2) return two_coin::newton_D(ANN, gamma, xp);
    if (xp.size() == 3) return three_coin::newton_D(ANN, gamma, xp, K0_prev);
    throw CryptoPoolError("More than 3 coins is not supported.");
}

YResult get_y(const Int& ANN, const Int& gamma, const std::vector<Int>& xp, const Int& D, std::size_t j) {
    if (xp.size() == 2) return {two_coin::newton_y(ANN, gamma, xp, D, j), Int(0)};
    if (xp.size() == 3) return three_coin::get_y(ANN, gamma, xp, D, j);
    throw CryptoPoolError("More than 3 coins is not supported.");
}

Int get_alpha(const Int& ma_half_time, uint64_t block_timestamp, uint64_t last_prices_timestamp,
              std::size_t n_coins) {
    const Int elapsed = Int(block_timestamp) - Int(last_prices_timestamp);
    if (n_coins != 2 && n_coins != 3) throw CryptoPoolError("More than 3 coins is not supported.");
    return math::halfpow(elapsed * E18() / ma_half_time);
}

std::vector<Int> get_p(const std::vector<Int>& xp, const Int& D, const Int& ANN, const Int& gamma) {
    check_D_range(D, "get_p");
    const Int& PREC = E18();
    const std::size_t n = xp.size();

    Int K0;
    if (n == 2) {
        K0 = 4 * xp[0] * xp[1] / D * E36() / D;
    } else if (n == 3) {
        K0 = 27 * xp[0] * xp[1] / D * xp[2] / D * E36() / D;
    } else {
        throw CryptoPoolError("More than 3 coins is not supported.");
    }

    const Int GK0 = 2 * K0 * K0 / E36() * K0 / E36() + (gamma + PREC) * (gamma + PREC) -
                    K0 * K0 / E36() * (2 * gamma + 3 * PREC) / PREC;
    const Int NNAG2 = ANN * gamma * gamma / Fixed::A_MULTIPLIER();
    const Int denominator = GK0 + NNAG2 * xp[0] / D * K0 / E36();

    std::vector<Int> p;
    p.reserve(n - 1);
    for (std::size_t k = 1; k < n; ++k) {
        p.push_back(floor_div(xp[0] * (GK0 + NNAG2 * xp[k] / D * K0 / E36()) / xp[k] * PREC, denominator));
    }
    return p;
}

Int lp_price(const Int& virtual_price, const std::vector<Int>& price_oracle) {
    if (price_oracle.size() == 1) return two_coin::lp_price(virtual_price, price_oracle);
    if (price_oracle.size() == 2) return three_coin::lp_price(virtual_price, price_oracle);
    throw CryptoPoolError("More than 3 coins is not supported.");
}

} // namespace cryptoswap
} // namespace pools
} // namespace ammsim
