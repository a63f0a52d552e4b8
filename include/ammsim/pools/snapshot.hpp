// Pool state snapshots and the scoped trial guard
// A snapshot is a value copy of every field a trial trade can mutate
#pragma once

#include <cstdint>
#include <utility>
#include <vector>

#include "ammsim/core/numeric_types.hpp"

namespace ammsim {
namespace pools {

struct StableswapSnapshot {
    std::vector<Int> balances;
    std::vector<Int> admin_balances;
    Int tokens;
};

// Meta-pool state plus the nested base pool it trades through
struct MetaPoolSnapshot {
    StableswapSnapshot meta;
    StableswapSnapshot base;
};

struct CryptoSnapshot {
    std::vector<Int> balances;
    Int D;
    std::vector<Int> price_scale;
    std::vector<Int> price_oracle;
    std::vector<Int> last_prices;
    uint64_t last_prices_timestamp{0};
    Int virtual_price;
    Int xcp_profit;
    Int xcp_profit_a;
    Int tokens;
    bool not_adjusted{false};
};

// Restores the pool on every exit path, including exceptions thrown mid-trial.
// Pool must provide get_snapshot() and revert_to_snapshot(const Snapshot&).
template <typename Pool>
class ScopedSnapshot {
public:
    using Snapshot = decltype(std::declval<const Pool&>().get_snapshot());

    explicit ScopedSnapshot(Pool& pool)
        : pool_(pool), snapshot_(pool.get_snapshot()) {}

    ~ScopedSnapshot() { pool_.revert_to_snapshot(snapshot_); }

    ScopedSnapshot(const ScopedSnapshot&) = delete;
    ScopedSnapshot& operator=(const ScopedSnapshot&) = delete;

    const Snapshot& snapshot() const { return snapshot_; }

private:
    Pool& pool_;
    Snapshot snapshot_;
};

} // namespace pools
} // namespace ammsim
