// Core numeric types: arbitrary-precision integers and fixed-point constants
// All invariant math runs on Int; Float is only used for final price ratios
#pragma once

#include <cstddef>
#include <sstream>
#include <string>
#include <vector>

#include <boost/multiprecision/cpp_bin_float.hpp>
#include <boost/multiprecision/cpp_int.hpp>

namespace ammsim {

using Int   = boost::multiprecision::cpp_int;
using Float = boost::multiprecision::cpp_bin_float_50;

// Iteration cap shared by every Newton-style solver
constexpr std::size_t MAX_ITERATIONS = 255;

// -----------------------------------------------------------------------------
// Fixed-point constants
// -----------------------------------------------------------------------------

struct Fixed {
    static const Int& PRECISION() { static const Int v("1000000000000000000"); return v; }  // 1e18
    static const Int& FEE_PRECISION() { static const Int v("10000000000"); return v; }     // 1e10
    static const Int& A_MULTIPLIER() { static const Int v(10000); return v; }
    static const Int& NOISE_FEE() { static const Int v(100000); return v; }               // 0.1 bps
    static const Int& EXP_PRECISION() { static const Int v("10000000000"); return v; }     // 1e10
    static const Int& ZERO() { static const Int v(0); return v; }
    static const Int& ONE() { static const Int v(1); return v; }
};

// 10**e, cached for the exponents used by the solvers
inline const Int& pow10(unsigned e) {
    static const std::vector<Int> table = []() {
        std::vector<Int> t;
        t.reserve(80);
        Int v = 1;
        for (unsigned k = 0; k < 80; ++k) {
            t.push_back(v);
            v *= 10;
        }
        return t;
    }();
    return table.at(e);
}

// -----------------------------------------------------------------------------
// Integer helpers
// -----------------------------------------------------------------------------

// Floor division (rounds toward negative infinity); cpp_int '/' truncates
inline Int floor_div(const Int& a, const Int& b) {
    Int q = a / b;
    Int r = a - q * b;
    if (r != 0 && ((r < 0) != (b < 0))) --q;
    return q;
}

inline Int abs_int(const Int& a) { return a < 0 ? Int(-a) : a; }

inline Int max_int(const Int& a, const Int& b) { return a > b ? a : b; }
inline Int min_int(const Int& a, const Int& b) { return a < b ? a : b; }

inline Int sum(const std::vector<Int>& xs) {
    Int s = 0;
    for (const auto& x : xs) s += x;
    return s;
}

inline Int product(const std::vector<Int>& xs) {
    Int p = 1;
    for (const auto& x : xs) p *= x;
    return p;
}

inline Int ipow(const Int& base, unsigned e) {
    return boost::multiprecision::pow(base, e);
}

// -----------------------------------------------------------------------------
// Conversions
// -----------------------------------------------------------------------------

inline double to_double(const Int& v) { return v.convert_to<double>(); }

// num / den evaluated in extended precision, then narrowed
inline double ratio_to_double(const Int& num, const Int& den) {
    Float r = Float(num) / Float(den);
    return r.convert_to<double>();
}

// Truncating conversion of a double amount to Int (non-finite -> 0)
inline Int from_double(double v) {
    if (!(v == v) || v > 1e300 || v < -1e300) return Int(0);
    Float f(v);
    return f.convert_to<Int>();
}

inline std::string to_string(const Int& v) { return v.str(); }

inline std::string to_string(const std::vector<Int>& xs) {
    std::ostringstream oss;
    oss << "[";
    for (std::size_t k = 0; k < xs.size(); ++k) {
        if (k) oss << ", ";
        oss << xs[k].str();
    }
    oss << "]";
    return oss.str();
}

} // namespace ammsim
