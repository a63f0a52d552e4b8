// Fixed-point helpers - implementation
#include "ammsim/math/fixed_point.hpp"

#include <algorithm>
#include <functional>

#include "ammsim/core/errors.hpp"

namespace ammsim {
namespace math {

namespace {

// 2**256 / 1e36 rounded, used as the cbrt scaling threshold
const Int& CBRT_THRESHOLD() {
    static const Int v("115792089237316195423570985008687907853269");
    return v;
}

Int shl(const Int& a, unsigned n) {
    return a * ipow(Int(2), n);
}

} // namespace

Int isqrt(const Int& x) {
    if (x < 0) throw SafetyBoundError("isqrt of negative value: " + x.str());
    return boost::multiprecision::sqrt(x);
}

Int sqrt_int(const Int& x) {
    if (x == 0) return 0;
    const Int& PREC = Fixed::PRECISION();

    Int z = (x + PREC) / 2;
    Int y = x;
    for (std::size_t it = 0; it < MAX_ITERATIONS + 1; ++it) {
        if (z == y) return y;
        y = z;
        z = (x * PREC / z + z) / 2;
    }
    throw CalculationError("Did not converge: sqrt_int(" + x.str() + ")");
}

unsigned log2_256(const Int& x, bool roundup) {
    Int value = x;
    unsigned result = 0;
    if ((x >> 128) != 0) {
        value = x >> 128;
        result = 128;
    }
    if ((value >> 64) != 0) { value >>= 64; result += 64; }
    if ((value >> 32) != 0) { value >>= 32; result += 32; }
    if ((value >> 16) != 0) { value >>= 16; result += 16; }
    if ((value >> 8) != 0)  { value >>= 8;  result += 8; }
    if ((value >> 4) != 0)  { value >>= 4;  result += 4; }
    if ((value >> 2) != 0)  { value >>= 2;  result += 2; }
    if ((value >> 1) != 0)  { result += 1; }
    if (roundup && (Int(1) << result) < x) result += 1;
    return result;
}

Int cbrt(const Int& x) {
    if (x == 0) return 0;

    const Int& T = CBRT_THRESHOLD();
    const Int T18 = T * pow10(18);

    Int xx;
    if (x >= T18) {
        xx = x;
    } else if (x >= T) {
        xx = x * pow10(18);
    } else {
        xx = x * pow10(36);
    }

    const unsigned log2x = log2_256(xx);
    const unsigned remainder = log2x % 3;
    Int a = shl(Int(1), log2x / 3) * ipow(Int(1260), remainder) / ipow(Int(1000), remainder);

    for (int step = 0; step < 7; ++step) {
        a = (2 * a + xx / (a * a)) / 3;
    }

    if (x >= T18) {
        a *= pow10(12);
    } else if (x >= T) {
        a *= pow10(6);
    }
    return a;
}

Int geometric_mean2(const std::vector<Int>& unsorted_x, bool sort) {
    std::vector<Int> x = unsorted_x;
    if (sort) std::sort(x.begin(), x.end(), std::greater<Int>());
    const Int n = Int(x.size());

    Int D = x[0];
    if (D == 0) throw CalculationError("geometric_mean of zero balance: " + to_string(unsorted_x));
    for (std::size_t it = 0; it < MAX_ITERATIONS; ++it) {
        Int D_prev = D;
        D = (D + x[0] * x[1] / D) / n;
        Int diff = abs_int(D_prev - D);
        if (diff <= 1 || diff * Fixed::PRECISION() < D) return D;
    }
    throw CalculationError("Did not converge: geometric_mean(" + to_string(unsorted_x) + ")");
}

Int geometric_mean3(const std::vector<Int>& x) {
    const Int& PREC = Fixed::PRECISION();
    Int prod = x[0] * x[1] / PREC * x[2] / PREC;
    if (prod == 0) return 0;
    return cbrt(prod);
}

Int geometric_mean(const std::vector<Int>& x) {
    if (x.size() == 2) return geometric_mean2(x, true);
    if (x.size() == 3) return geometric_mean3(x);
    throw CryptoPoolError("More than 3 coins is not supported.");
}

Int halfpow(const Int& power) {
    const Int& PREC = Fixed::PRECISION();
    const Int intpow = power / PREC;
    const Int otherpow = power - intpow * PREC;
    if (intpow > 59) return 0;

    const Int result = PREC / ipow(Int(2), intpow.convert_to<unsigned>());
    if (otherpow == 0) return result;

    Int term = PREC;
    const Int x = 5 * pow10(17);
    Int S = PREC;
    bool neg = false;

    for (unsigned i = 1; i < 256; ++i) {
        const Int K = Int(i) * PREC;
        Int c = K - PREC;
        if (otherpow > c) {
            c = otherpow - c;
            neg = !neg;
        } else {
            c -= otherpow;
        }
        term = term * (c * x / PREC) / K;
        if (neg) {
            S -= term;
        } else {
            S += term;
        }
        if (term < Fixed::EXP_PRECISION()) {
            return result * S / PREC;
        }
    }
    throw CalculationError("Did not converge: halfpow(" + power.str() + ")");
}

} // namespace math
} // namespace ammsim
