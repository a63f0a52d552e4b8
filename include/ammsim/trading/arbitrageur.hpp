// Arbitrage trade sizing against external market prices
// Single pair: bracketed toms748 root find; all pairs: bounded Levenberg-Marquardt least squares
#pragma once

#include <cstddef>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <boost/math/tools/roots.hpp>

#include "ammsim/core/numeric_types.hpp"
#include "ammsim/pools/sim_pool.hpp"
#include "ammsim/trading/trade.hpp"

namespace ammsim {
namespace trading {

using pools::SimPool;

// Root finder wrapper
template <typename F>
inline bool toms748_root(
    F&& f,
    double lo, double hi,
    double Flo, double Fhi,
    double& out_root,
    unsigned max_iters = 100,
    int bits = std::numeric_limits<double>::digits - 3
) {
    if (!(hi > lo) || !(Flo * Fhi < 0.0)) return false;
    auto tol = boost::math::tools::eps_tolerance<double>(bits);
    boost::uintmax_t it = max_iters;
    auto r = boost::math::tools::toms748_solve(std::forward<F>(f), lo, hi, Flo, Fhi, tol, it);
    out_root = (r.first + r.second) / 2.0;
    return true;
}

// price(coin_in, coin_out, use_fee) - price_target after trading dx, evaluated
// inside a snapshot that is always reverted
double post_trade_price_error(SimPool& pool, const std::string& coin_in, const std::string& coin_out,
                              const Int& dx, double price_target);

// Size of coin_in that moves the fee-inclusive pool price to price_target.
// Requires price(coin_in, coin_out) > price_target; nullopt when [0, max trade size]
// does not bracket the target.
std::optional<Int> opt_arb(SimPool& pool, const std::string& coin_in, const std::string& coin_out,
                           double price_target);

// One oriented ArbTrade per priced pair: size 0 (pair as given) when the pool
// price already sits inside the fee band around the target
std::vector<ArbTrade> get_arb_trades(SimPool& pool, const PriceMap& prices);

// -----------------------------------------------------------------------------
// Multi-pair solve result
// -----------------------------------------------------------------------------

// Either the solver converged (trades plus post-trade errors) or it degraded to
// the errors of the unarbitraged pool with no trades. Errors are relative
// ((price - target) / target) and keyed by the oriented (coin_in, coin_out) pair.
class ArbResult {
public:
    enum class Status { Solved, Degraded };

    static ArbResult solved(std::vector<Trade> trades, std::map<CoinPair, double> price_errors) {
        return ArbResult(Status::Solved, std::move(trades), std::move(price_errors), {});
    }

    static ArbResult degraded(std::map<CoinPair, double> price_errors, std::string reason) {
        return ArbResult(Status::Degraded, {}, std::move(price_errors), std::move(reason));
    }

    Status status() const { return status_; }
    bool ok() const { return status_ == Status::Solved; }

    const std::vector<Trade>& trades() const { return trades_; }
    const std::map<CoinPair, double>& price_errors() const { return price_errors_; }
    const std::string& failure_reason() const { return reason_; }

private:
    ArbResult(Status status, std::vector<Trade> trades, std::map<CoinPair, double> price_errors,
              std::string reason)
        : status_(status),
          trades_(std::move(trades)),
          price_errors_(std::move(price_errors)),
          reason_(std::move(reason)) {}

    Status status_;
    std::vector<Trade> trades_;
    std::map<CoinPair, double> price_errors_;
    std::string reason_;
};

// Sizes every pair's trade simultaneously. Each pair is bounded by [0, limit];
// pairs whose limit does not exceed the minimum trade size are left out of the
// solve and report their unarbitraged error. Solver failure degrades, never throws.
ArbResult opt_arb_multi(SimPool& pool, const PriceMap& prices, const VolumeLimits& limits);

// -----------------------------------------------------------------------------
// Traders
// -----------------------------------------------------------------------------

// Trades executed for one time sample plus the solver outcome that produced them
struct SampleResult {
    std::vector<TradeResult> trades;
    ArbResult arb;
};

class Trader {
public:
    explicit Trader(SimPool& pool) : pool_(pool) {}

    // Executes trades in order on the live pool
    std::vector<TradeResult> do_trades(const std::vector<Trade>& trades);

    SimPool& pool() { return pool_; }

protected:
    SimPool& pool_;
};

// Closes every pair's price gap at once, capped by per-pair volume
class VolumeLimitedArbitrageur : public Trader {
public:
    using Trader::Trader;

    ArbResult compute_trades(const PriceMap& prices, const VolumeLimits& limits);
    SampleResult process_time_sample(const PriceMap& prices, const VolumeLimits& limits);
};

// Takes only the single most profitable pair trade, assuming infinite depth at
// the target price elsewhere
class SimpleArbitrageur : public Trader {
public:
    using Trader::Trader;

    ArbResult compute_trades(const PriceMap& prices);
    SampleResult process_time_sample(const PriceMap& prices);
};

} // namespace trading
} // namespace ammsim
