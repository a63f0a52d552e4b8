// Shared pool result types and index validation
#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include "ammsim/core/numeric_types.hpp"

namespace ammsim {
namespace pools {

// Output of a swap or single-sided withdrawal, in native units of the out coin
struct SwapResult {
    Int dy;
    Int fee;
};

// Liquidity tokens minted by a deposit plus the per-coin imbalance fees charged
struct MintResult {
    Int amount;
    std::vector<Int> fees;
};

inline void check_index(std::size_t i, std::size_t n) {
    if (i >= n) {
        throw std::invalid_argument("coin index out of range: " + std::to_string(i));
    }
}

inline void check_pair(std::size_t i, std::size_t j, std::size_t n) {
    check_index(i, n);
    check_index(j, n);
    if (i == j) {
        throw std::invalid_argument("coin indices must differ: " + std::to_string(i));
    }
}

inline void check_amounts(const std::vector<Int>& amounts, std::size_t n) {
    if (amounts.size() != n) {
        throw std::invalid_argument("expected " + std::to_string(n) + " amounts, got " +
                                    std::to_string(amounts.size()));
    }
}

} // namespace pools
} // namespace ammsim
