// Trading surface shared by every pool kind: price, trade, size bounds, snapshots
// Coins are addressed by name; the name -> index map is built once per pool
#pragma once

#include <cstddef>
#include <limits>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "ammsim/core/numeric_types.hpp"
#include "ammsim/pools/cryptoswap/pool.hpp"
#include "ammsim/pools/snapshot.hpp"
#include "ammsim/pools/stableswap/metapool.hpp"
#include "ammsim/pools/stableswap/pool.hpp"

namespace ammsim {
namespace pools {

// Output of SimPool::trade; volume is the input amount in pool value (D) units
struct TradeOutput {
    Int amount_out;
    Int fee;
    Int volume;
};

// Share of the out-coin balance left by the largest trade the solver brackets
constexpr double STABLESWAP_OUT_BALANCE_PERC = 0.01;
constexpr double CRYPTOSWAP_OUT_BALANCE_PERC = 0.05;

class AssetIndices {
public:
    void add(const std::string& name, std::size_t index);
    bool contains(const std::string& name) const { return map_.count(name) > 0; }
    std::size_t at(const std::string& name) const;

    // Both indices; throws ConfigError("Duplicate coin indices.") when they coincide
    std::pair<std::size_t, std::size_t> pair(const std::string& coin_in, const std::string& coin_out) const;

private:
    std::unordered_map<std::string, std::size_t> map_;
};

// -----------------------------------------------------------------------------
// Stableswap
// -----------------------------------------------------------------------------
class SimStableswapPool {
public:
    SimStableswapPool(stableswap::StableswapPool pool, std::vector<std::string> coin_names);

    const std::vector<std::string>& asset_names() const { return names_; }

    double price(const std::string& coin_in, const std::string& coin_out, bool use_fee = true) const;
    TradeOutput trade(const std::string& coin_in, const std::string& coin_out, const Int& size);
    Int get_max_trade_size(const std::string& coin_in, const std::string& coin_out,
                           double out_balance_perc = STABLESWAP_OUT_BALANCE_PERC) const;
    Int get_min_trade_size(const std::string&) const { return Int(0); }

    StableswapSnapshot get_snapshot() const { return pool_.get_snapshot(); }
    void revert_to_snapshot(const StableswapSnapshot& s) { pool_.revert_to_snapshot(s); }

    stableswap::StableswapPool& pool() { return pool_; }
    const stableswap::StableswapPool& pool() const { return pool_; }

private:
    stableswap::StableswapPool pool_;
    std::vector<std::string> names_;
    AssetIndices indices_;
};

// -----------------------------------------------------------------------------
// Meta-pool
// -----------------------------------------------------------------------------
class SimMetaPool {
public:
    // Index of the base-pool LP token; reachable by its name or by "bp_token"
    static constexpr std::size_t BP_TOKEN = std::numeric_limits<std::size_t>::max();

    // coin_names are the n meta-level names (last is the base LP token);
    // base_coin_names are the base pool's coins
    SimMetaPool(stableswap::MetaPool pool, std::vector<std::string> coin_names,
                std::vector<std::string> base_coin_names);

    const std::vector<std::string>& asset_names() const { return names_; }

    double price(const std::string& coin_in, const std::string& coin_out, bool use_fee = true) const;
    TradeOutput trade(const std::string& coin_in, const std::string& coin_out, const Int& size);
    Int get_max_trade_size(const std::string& coin_in, const std::string& coin_out,
                           double out_balance_perc = STABLESWAP_OUT_BALANCE_PERC) const;
    Int get_min_trade_size(const std::string&) const { return Int(0); }

    MetaPoolSnapshot get_snapshot() const { return pool_.get_snapshot(); }
    void revert_to_snapshot(const MetaPoolSnapshot& s) { pool_.revert_to_snapshot(s); }

    stableswap::MetaPool& pool() { return pool_; }
    const stableswap::MetaPool& pool() const { return pool_; }

private:
    // Rate of flattened coin i: meta rate multipliers, then base rates
    Int precision(std::size_t i) const;

    stableswap::MetaPool pool_;
    std::vector<std::string> names_;
    AssetIndices indices_;
};

// -----------------------------------------------------------------------------
// Cryptoswap
// -----------------------------------------------------------------------------
class SimCryptoPool {
public:
    // Requires precision 1 (18 decimals) for every coin
    SimCryptoPool(cryptoswap::CryptoPool pool, std::vector<std::string> coin_names);

    const std::vector<std::string>& asset_names() const { return names_; }

    double price(const std::string& coin_in, const std::string& coin_out, bool use_fee = true) const;
    TradeOutput trade(const std::string& coin_in, const std::string& coin_out, const Int& size);
    Int get_max_trade_size(const std::string& coin_in, const std::string& coin_out,
                           double out_balance_perc = CRYPTOSWAP_OUT_BALANCE_PERC) const;
    Int get_min_trade_size(const std::string&) const { return Int(0); }

    CryptoSnapshot get_snapshot() const { return pool_.get_snapshot(); }
    void revert_to_snapshot(const CryptoSnapshot& s) { pool_.revert_to_snapshot(s); }

    cryptoswap::CryptoPool& pool() { return pool_; }
    const cryptoswap::CryptoPool& pool() const { return pool_; }

private:
    cryptoswap::CryptoPool pool_;
    std::vector<std::string> names_;
    AssetIndices indices_;
};

// -----------------------------------------------------------------------------
// Closed set of pool kinds behind one trading capability
// -----------------------------------------------------------------------------
class SimPool {
public:
    using Variant = std::variant<SimStableswapPool, SimMetaPool, SimCryptoPool>;
    using Snapshot = std::variant<StableswapSnapshot, MetaPoolSnapshot, CryptoSnapshot>;

    explicit SimPool(SimStableswapPool pool) : impl_(std::move(pool)) {}
    explicit SimPool(SimMetaPool pool) : impl_(std::move(pool)) {}
    explicit SimPool(SimCryptoPool pool) : impl_(std::move(pool)) {}

    // "stableswap", "metapool" or "cryptoswap"
    const char* kind() const;

    const std::vector<std::string>& asset_names() const;

    double price(const std::string& coin_in, const std::string& coin_out, bool use_fee = true) const;
    TradeOutput trade(const std::string& coin_in, const std::string& coin_out, const Int& size);
    Int get_max_trade_size(const std::string& coin_in, const std::string& coin_out) const;
    Int get_min_trade_size(const std::string& coin_in) const;

    Snapshot get_snapshot() const;
    void revert_to_snapshot(const Snapshot& snapshot);

    Variant& impl() { return impl_; }
    const Variant& impl() const { return impl_; }

private:
    Variant impl_;
};

} // namespace pools
} // namespace ammsim
