// Pool runner - replays price samples through one pool per parameter combination
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <boost/json.hpp>

#include "ammsim/core/numeric_types.hpp"
#include "ammsim/harness/samples.hpp"
#include "ammsim/pools/config.hpp"
#include "ammsim/pools/sim_pool.hpp"

namespace ammsim {
namespace harness {

struct RunConfig {
    pools::TraderKind trader{pools::TraderKind::VolumeLimited};
    double vol_mult{1.0};
    bool verbose{true};
};

// Result of one parameter combination. A pool error aborts the run and is
// reported with its kind; degraded solver steps are only counted.
struct RunResult {
    boost::json::object params;

    std::size_t samples_run{0};
    std::size_t n_trades{0};
    std::size_t n_degraded{0};
    Int volume{0};
    double mean_abs_price_error{0.0};

    boost::json::object final_state;
    double elapsed_ms{0.0};

    bool success{false};
    std::string error_kind;
    std::string error_msg;
};

// Final balances, supply and price state of the pool, integers as decimal strings
boost::json::object pool_state_json(const pools::SimPool& pool);

RunResult run_single(const pools::GridPoint& point, const std::vector<PriceSample>& samples,
                     const RunConfig& cfg);

// Runs every grid point in order; each gets a fresh pool built from the template
std::vector<RunResult> run_grid(const pools::SimConfig& sim_cfg, const std::vector<PriceSample>& samples,
                                const RunConfig& cfg);

} // namespace harness
} // namespace ammsim
