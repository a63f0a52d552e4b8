// Pool runner - implementation
#include "ammsim/harness/runner.hpp"

#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <type_traits>
#include <variant>

#include "ammsim/core/errors.hpp"
#include "ammsim/core/json_utils.hpp"
#include "ammsim/core/logging.hpp"
#include "ammsim/trading/arbitrageur.hpp"

namespace ammsim {
namespace harness {

namespace json = boost::json;

namespace {

json::object stableswap_state_json(const pools::stableswap::StableswapPool& p) {
    json::object o;
    o["balances"] = ints_to_json(p.balances);
    o["tokens"] = int_to_json(p.tokens);
    o["D"] = int_to_json(p.D());
    o["virtual_price"] = int_to_json(p.get_virtual_price());
    return o;
}

} // namespace

json::object pool_state_json(const pools::SimPool& pool) {
    json::object o = std::visit(
        [](const auto& sim) -> json::object {
            using T = std::decay_t<decltype(sim)>;
            const auto& p = sim.pool();
            if constexpr (std::is_same_v<T, pools::SimStableswapPool>) {
                return stableswap_state_json(p);
            } else if constexpr (std::is_same_v<T, pools::SimMetaPool>) {
                json::object m;
                m["balances"] = ints_to_json(p.balances);
                m["tokens"] = int_to_json(p.tokens);
                m["D"] = int_to_json(p.D());
                m["virtual_price"] = int_to_json(p.get_virtual_price());
                m["basepool"] = stableswap_state_json(p.basepool);
                return m;
            } else {
                json::object c;
                c["balances"] = ints_to_json(p.balances);
                c["tokens"] = int_to_json(p.tokens);
                c["D"] = int_to_json(p.D);
                c["virtual_price"] = int_to_json(p.virtual_price);
                c["xcp_profit"] = int_to_json(p.xcp_profit);
                c["price_scale"] = ints_to_json(p.price_scale);
                c["price_oracle"] = ints_to_json(p.price_oracle_);
                c["last_prices"] = ints_to_json(p.last_prices);
                c["timestamp"] = p.block_timestamp;
                return c;
            }
        },
        pool.impl());
    o["kind"] = pool.kind();
    return o;
}

RunResult run_single(const pools::GridPoint& point, const std::vector<PriceSample>& samples,
                     const RunConfig& cfg) {
    RunResult result;
    result.params = point.params;

    auto t_start = std::chrono::high_resolution_clock::now();

    try {
        auto pool = pools::make_sim_pool(point.pool);
        auto* crypto = std::get_if<pools::SimCryptoPool>(&pool.impl());

        trading::VolumeLimitedArbitrageur vol_arb(pool);
        trading::SimpleArbitrageur simple_arb(pool);

        double abs_err_sum = 0.0;
        std::size_t n_err = 0;

        for (const auto& sample : samples) {
            if (crypto && sample.timestamp > 0) crypto->pool().set_block_timestamp(sample.timestamp);

            auto step = cfg.trader == pools::TraderKind::Simple
                ? simple_arb.process_time_sample(sample.prices)
                : vol_arb.process_time_sample(sample.prices, volume_limits(sample, cfg.vol_mult));

            if (!step.arb.ok()) ++result.n_degraded;
            for (const auto& t : step.trades) {
                ++result.n_trades;
                result.volume += t.volume();
            }
            for (const auto& kv : step.arb.price_errors()) {
                if (std::isfinite(kv.second)) {
                    abs_err_sum += std::fabs(kv.second);
                    ++n_err;
                }
            }
            ++result.samples_run;
        }

        result.mean_abs_price_error = n_err > 0 ? abs_err_sum / static_cast<double>(n_err) : 0.0;
        result.final_state = pool_state_json(pool);
        result.success = true;
    } catch (const std::exception& e) {
        result.success = false;
        result.error_kind = error_kind(e);
        result.error_msg = e.what();
        log_error("run_single", std::string(result.error_kind) + " after " +
                                    std::to_string(result.samples_run) + " samples (params " +
                                    json::serialize(result.params) + "): " + result.error_msg);
    }

    auto t_end = std::chrono::high_resolution_clock::now();
    result.elapsed_ms = std::chrono::duration<double, std::milli>(t_end - t_start).count();
    return result;
}

std::vector<RunResult> run_grid(const pools::SimConfig& sim_cfg, const std::vector<PriceSample>& samples,
                                const RunConfig& cfg) {
    const auto points = pools::expand_param_grid(sim_cfg);
    std::vector<RunResult> results;
    results.reserve(points.size());

    for (std::size_t i = 0; i < points.size(); ++i) {
        if (cfg.verbose) {
            std::lock_guard<std::mutex> lock(io_mu);
            std::cout << "dispatch job " << (i + 1) << "/" << points.size() << "\n";
        }

        results.push_back(run_single(points[i], samples, cfg));

        if (cfg.verbose) {
            std::lock_guard<std::mutex> lock(io_mu);
            std::cout << "finished job " << (i + 1) << "/" << points.size()
                      << ", time: " << std::fixed << std::setprecision(4)
                      << (results.back().elapsed_ms / 1000.0) << " s\n";
        }
    }
    return results;
}

} // namespace harness
} // namespace ammsim
