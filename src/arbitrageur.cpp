// Arbitrage trade sizing - implementation
#include "ammsim/trading/arbitrageur.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <Eigen/Dense>
#include <unsupported/Eigen/NonLinearOptimization>
#include <unsupported/Eigen/NumericalDiff>

#include "ammsim/core/errors.hpp"
#include "ammsim/core/logging.hpp"
#include "ammsim/pools/snapshot.hpp"

namespace ammsim {
namespace trading {

namespace {

using pools::ScopedSnapshot;

// Least-squares tolerances for the simultaneous solve
constexpr double LSQ_XTOL = 1e-15;
constexpr double LSQ_GTOL = 1e-15;

double relative_error(double price, double target) {
    return (price - target) / target;
}

// Solver candidate: NaN/inf -> 0, then clamped into [0, hi]
Int candidate_size(double x, double hi) {
    if (!std::isfinite(x) || x < 0.0) return Int(0);
    return from_double(std::min(x, hi));
}

// Applies every trade in order inside one snapshot, then reads each pair's
// relative fee-inclusive price error. Sizes at or below the pool's minimum are skipped.
std::vector<double> post_trade_price_errors(SimPool& pool, const std::vector<ArbTrade>& trades,
                                            const std::vector<Int>& sizes) {
    ScopedSnapshot<SimPool> guard(pool);

    for (std::size_t k = 0; k < trades.size(); ++k) {
        const auto& t = trades[k];
        if (sizes[k] > pool.get_min_trade_size(t.coin_in)) {
            pool.trade(t.coin_in, t.coin_out, sizes[k]);
        }
    }

    std::vector<double> errors;
    errors.reserve(trades.size());
    for (const auto& t : trades) {
        errors.push_back(relative_error(pool.price(t.coin_in, t.coin_out, true), t.price_target));
    }
    return errors;
}

// Residual functor for Eigen's Levenberg-Marquardt; one residual per included pair
struct PriceErrorFunctor {
    typedef double Scalar;
    typedef Eigen::VectorXd InputType;
    typedef Eigen::VectorXd ValueType;
    typedef Eigen::MatrixXd JacobianType;
    enum { InputsAtCompileTime = Eigen::Dynamic, ValuesAtCompileTime = Eigen::Dynamic };

    SimPool* pool;
    const std::vector<ArbTrade>* trades;
    std::vector<double> hi;

    int inputs() const { return static_cast<int>(trades->size()); }
    int values() const { return static_cast<int>(trades->size()); }

    std::vector<Int> sizes(const Eigen::VectorXd& x) const {
        std::vector<Int> out;
        out.reserve(static_cast<std::size_t>(x.size()));
        for (Eigen::Index k = 0; k < x.size(); ++k) {
            out.push_back(candidate_size(x[k], hi[static_cast<std::size_t>(k)]));
        }
        return out;
    }

    int operator()(const Eigen::VectorXd& x, Eigen::VectorXd& fvec) const {
        const auto errors = post_trade_price_errors(*pool, *trades, sizes(x));
        for (std::size_t k = 0; k < errors.size(); ++k) {
            fvec[static_cast<Eigen::Index>(k)] = errors[k];
        }
        return 0;
    }
};

const char* status_name(Eigen::LevenbergMarquardtSpace::Status s) {
    using namespace Eigen::LevenbergMarquardtSpace;
    switch (s) {
        case NotStarted: return "NotStarted";
        case Running: return "Running";
        case ImproperInputParameters: return "ImproperInputParameters";
        case RelativeReductionTooSmall: return "RelativeReductionTooSmall";
        case RelativeErrorTooSmall: return "RelativeErrorTooSmall";
        case RelativeErrorAndReductionTooSmall: return "RelativeErrorAndReductionTooSmall";
        case CosinusTooSmall: return "CosinusTooSmall";
        case TooManyFunctionEvaluation: return "TooManyFunctionEvaluation";
        case FtolTooSmall: return "FtolTooSmall";
        case XtolTooSmall: return "XtolTooSmall";
        case GtolTooSmall: return "GtolTooSmall";
        case UserAsked: return "UserAsked";
    }
    return "Unknown";
}

bool converged(Eigen::LevenbergMarquardtSpace::Status s) {
    using namespace Eigen::LevenbergMarquardtSpace;
    switch (s) {
        case RelativeReductionTooSmall:
        case RelativeErrorTooSmall:
        case RelativeErrorAndReductionTooSmall:
        case CosinusTooSmall:
        case FtolTooSmall:
        case XtolTooSmall:
        case GtolTooSmall:
            return true;
        default:
            return false;
    }
}

std::string describe_inputs(const std::vector<ArbTrade>& trades, const std::vector<Int>& hi) {
    std::ostringstream oss;
    oss << std::setprecision(17) << "x0: [";
    for (std::size_t k = 0; k < trades.size(); ++k) oss << (k ? ", " : "") << trades[k].amount_in.str();
    oss << "], hi: [";
    for (std::size_t k = 0; k < hi.size(); ++k) oss << (k ? ", " : "") << hi[k].str();
    oss << "], prices: [";
    for (std::size_t k = 0; k < trades.size(); ++k) oss << (k ? ", " : "") << trades[k].price_target;
    oss << "]";
    return oss.str();
}

} // namespace

// =============================================================================
// Single pair
// =============================================================================

double post_trade_price_error(SimPool& pool, const std::string& coin_in, const std::string& coin_out,
                              const Int& dx, double price_target) {
    ScopedSnapshot<SimPool> guard(pool);
    if (dx > 0) pool.trade(coin_in, coin_out, dx);
    return pool.price(coin_in, coin_out, true) - price_target;
}

std::optional<Int> opt_arb(SimPool& pool, const std::string& coin_in, const std::string& coin_out,
                           double price_target) {
    const Int high = pool.get_max_trade_size(coin_in, coin_out);
    if (high <= 0) return std::nullopt;

    auto residual = [&](double dx) {
        return post_trade_price_error(pool, coin_in, coin_out, from_double(dx), price_target);
    };

    const double lo = 0.0;
    const double hi = to_double(high);
    const double f_lo = residual(lo);
    const double f_hi = residual(hi);

    double root = 0.0;
    if (!toms748_root(residual, lo, hi, f_lo, f_hi, root)) {
        if (trace_arb_enabled()) {
            std::lock_guard<std::mutex> lk(io_mu);
            std::cerr << std::setprecision(15) << "[TRACE_ARB] No crossing: " << coin_in << "->" << coin_out
                      << " F_lo=" << f_lo << " F_hi=" << f_hi << " hi=" << high.str() << "\n";
        }
        return std::nullopt;
    }

    if (trace_arb_enabled()) {
        std::lock_guard<std::mutex> lk(io_mu);
        std::cerr << std::setprecision(15) << "[TRACE_ARB] Root found: " << coin_in << "->" << coin_out
                  << " dx=" << root << " target=" << price_target << "\n";
    }
    return from_double(root);
}

std::vector<ArbTrade> get_arb_trades(SimPool& pool, const PriceMap& prices) {
    std::vector<ArbTrade> trades;
    trades.reserve(prices.size());

    for (const auto& [pair, p] : prices) {
        const auto& [i, j] = pair;
        if (!(p > 0.0) || !std::isfinite(p)) {
            throw ConfigError("price target for (" + i + ", " + j + ") must be positive");
        }

        std::string coin_in;
        std::string coin_out;
        double target = 0.0;
        if (pool.price(i, j) - p > 0) {
            coin_in = i;
            coin_out = j;
            target = p;
        } else if (pool.price(j, i) - 1.0 / p > 0) {
            coin_in = j;
            coin_out = i;
            target = 1.0 / p;
        } else {
            trades.push_back({i, j, Int(0), p});
            continue;
        }

        Int size = 0;
        if (auto root = opt_arb(pool, coin_in, coin_out, target)) {
            size = *root;
        } else {
            const double pool_price = pool.price(coin_in, coin_out);
            std::ostringstream oss;
            oss << std::setprecision(17) << "Pair: (" << coin_in << ", " << coin_out << "), Pool price: "
                << pool_price << ", Target Price: " << target << ", Diff: " << pool_price - target;
            log_error("opt_arb", oss.str());
        }
        trades.push_back({coin_in, coin_out, size, target});
    }
    return trades;
}

// =============================================================================
// All pairs
// =============================================================================

ArbResult opt_arb_multi(SimPool& pool, const PriceMap& prices, const VolumeLimits& limits) {
    const auto initial = get_arb_trades(pool, prices);

    struct Candidate {
        ArbTrade trade;
        Int limit;
    };

    std::vector<Candidate> included;
    std::vector<ArbTrade> excluded;

    std::size_t k = 0;
    for (const auto& entry : prices) {
        const ArbTrade& t = initial[k++];
        auto it = limits.find(entry.first);
        if (it == limits.end()) {
            throw ConfigError("missing volume limit for (" + entry.first.first + ", " + entry.first.second + ")");
        }
        const Int limit = it->second > 0.0 ? from_double(it->second * 1e18) : Int(0);

        if (limit <= pool.get_min_trade_size(t.coin_in)) {
            excluded.push_back(t.replace_amount_in(Int(0)));
            continue;
        }
        included.push_back({t.replace_amount_in(min_int(t.amount_in, limit)), limit});
    }

    // Larger expected trades first
    std::stable_sort(included.begin(), included.end(),
                     [](const Candidate& a, const Candidate& b) { return a.trade.amount_in > b.trade.amount_in; });

    std::vector<ArbTrade> trades_in;
    std::vector<Int> hi;
    for (const auto& c : included) {
        trades_in.push_back(c.trade);
        hi.push_back(c.limit + 1);
    }

    // Errors of pairs outside the solve come from the unarbitraged pool
    std::map<CoinPair, double> errors;
    {
        const auto unarbed = post_trade_price_errors(pool, excluded, std::vector<Int>(excluded.size()));
        for (std::size_t e = 0; e < excluded.size(); ++e) errors[excluded[e].pair()] = unarbed[e];
    }

    if (trades_in.empty()) return ArbResult::solved({}, std::move(errors));

    auto degrade = [&](const std::string& reason) {
        log_error("opt_arb_multi", "Optarbs args: " + describe_inputs(trades_in, hi) + ": " + reason);
        const auto unarbed = post_trade_price_errors(pool, trades_in, std::vector<Int>(trades_in.size()));
        for (std::size_t e = 0; e < trades_in.size(); ++e) errors[trades_in[e].pair()] = unarbed[e];
        return ArbResult::degraded(std::move(errors), reason);
    };

    PriceErrorFunctor functor;
    functor.pool = &pool;
    functor.trades = &trades_in;
    for (const auto& h : hi) functor.hi.push_back(to_double(h));

    Eigen::VectorXd x(static_cast<Eigen::Index>(trades_in.size()));
    for (std::size_t t = 0; t < trades_in.size(); ++t) {
        x[static_cast<Eigen::Index>(t)] = to_double(trades_in[t].amount_in);
    }

    std::vector<Int> sizes;
    try {
        Eigen::NumericalDiff<PriceErrorFunctor> numdiff(functor);
        Eigen::LevenbergMarquardt<Eigen::NumericalDiff<PriceErrorFunctor>> lm(numdiff);
        lm.parameters.xtol = LSQ_XTOL;
        lm.parameters.gtol = LSQ_GTOL;

        const auto status = lm.minimize(x);
        if (trace_arb_enabled()) {
            std::lock_guard<std::mutex> lk(io_mu);
            std::cerr << "[TRACE_ARB] opt_arb_multi status=" << status_name(status) << " nfev=" << lm.nfev
                      << " fnorm=" << lm.fnorm << "\n";
        }
        if (!converged(status)) return degrade(std::string("least squares did not converge: ") + status_name(status));

        sizes = functor.sizes(x);
    } catch (const std::exception& e) {
        return degrade(e.what());
    }

    // hi is limit + 1 for the solver; executed trades respect the limit itself
    for (std::size_t t = 0; t < sizes.size(); ++t) sizes[t] = min_int(sizes[t], included[t].limit);

    const auto final_errors = post_trade_price_errors(pool, trades_in, sizes);
    std::vector<Trade> trades;
    for (std::size_t t = 0; t < trades_in.size(); ++t) {
        errors[trades_in[t].pair()] = final_errors[t];
        if (sizes[t] > pool.get_min_trade_size(trades_in[t].coin_in)) {
            trades.push_back({trades_in[t].coin_in, trades_in[t].coin_out, sizes[t]});
        }
    }
    return ArbResult::solved(std::move(trades), std::move(errors));
}

// =============================================================================
// Traders
// =============================================================================

std::vector<TradeResult> Trader::do_trades(const std::vector<Trade>& trades) {
    std::vector<TradeResult> results;
    results.reserve(trades.size());
    for (const auto& t : trades) {
        TradeResult r(t);
        const auto out = pool_.trade(t.coin_in, t.coin_out, t.amount_in);
        r.set_outcome(out.amount_out, out.fee, out.volume);
        results.push_back(std::move(r));
    }
    return results;
}

ArbResult VolumeLimitedArbitrageur::compute_trades(const PriceMap& prices, const VolumeLimits& limits) {
    return opt_arb_multi(pool_, prices, limits);
}

SampleResult VolumeLimitedArbitrageur::process_time_sample(const PriceMap& prices, const VolumeLimits& limits) {
    auto arb = compute_trades(prices, limits);
    auto trades = do_trades(arb.trades());
    return {std::move(trades), std::move(arb)};
}

ArbResult SimpleArbitrageur::compute_trades(const PriceMap& prices) {
    const auto candidates = get_arb_trades(pool_, prices);

    double max_profit = 0.0;
    std::optional<Trade> best;
    double price_error = 0.0;
    for (const auto& t : candidates) {
        if (t.amount_in <= pool_.get_min_trade_size(t.coin_in)) continue;

        ScopedSnapshot<SimPool> guard(pool_);
        const auto out = pool_.trade(t.coin_in, t.coin_out, t.amount_in);
        // Assumes the in-coin was bought at the target price with infinite depth elsewhere
        const double profit = to_double(out.amount_out) - to_double(t.amount_in) * t.price_target;
        if (profit > max_profit) {
            max_profit = profit;
            best = t.trade();
            price_error = relative_error(pool_.price(t.coin_in, t.coin_out), t.price_target);
        }
    }

    if (!best) return ArbResult::solved({}, {});
    std::map<CoinPair, double> errors{{CoinPair{best->coin_in, best->coin_out}, price_error}};
    return ArbResult::solved({*best}, std::move(errors));
}

SampleResult SimpleArbitrageur::process_time_sample(const PriceMap& prices) {
    auto arb = compute_trades(prices);
    auto trades = do_trades(arb.trades());
    return {std::move(trades), std::move(arb)};
}

} // namespace trading
} // namespace ammsim
