// Pool configuration parsing
// A config holds one template pool, a parameter grid and trader settings;
// every grid point is the template with its parameters overridden
#pragma once

#include <string>
#include <utility>
#include <vector>

#include <boost/json.hpp>

#include "ammsim/pools/cryptoswap/pool.hpp"
#include "ammsim/pools/sim_pool.hpp"
#include "ammsim/pools/stableswap/pool.hpp"

namespace ammsim {
namespace pools {

enum class PoolKind { Stableswap, MetaPool, Cryptoswap };

PoolKind parse_pool_kind(const std::string& s);

enum class TraderKind { VolumeLimited, Simple };

TraderKind parse_trader_kind(const std::string& s);

// Parsed config file
// Format:
// {
//   "tag": "...",
//   "pool": { "kind": "stableswap", "coins": [...], "A": 250, "D": "...", ... },
//   "param_grid": { "A": [100, 250], "fee": [1000000, 4000000] },
//   "trader": "volume_limited" | "simple",
//   "vol_mult": 1.0
// }
struct SimConfig {
    std::string tag;
    boost::json::object pool;
    std::vector<std::pair<std::string, std::vector<boost::json::value>>> param_grid;
    TraderKind trader{TraderKind::VolumeLimited};
    double vol_mult{1.0};
};

// One parameter combination: the overrides applied and the resulting pool entry
struct GridPoint {
    boost::json::object params;
    boost::json::object pool;
};

// Integer parameters may be JSON numbers or decimal strings (values past 2^64)
stableswap::StableswapParams parse_stableswap_params(const boost::json::object& obj);
cryptoswap::CryptoParams parse_crypto_params(const boost::json::object& obj);

// Builds the pool a config entry describes; "D" or "balances" sets its size
SimPool make_sim_pool(const boost::json::object& pool);

SimConfig parse_sim_config(const boost::json::value& root);
SimConfig load_sim_config(const std::string& path);

// Cartesian product of the grid, in key order; a single point when the grid is empty
std::vector<GridPoint> expand_param_grid(const SimConfig& cfg);

} // namespace pools
} // namespace ammsim
