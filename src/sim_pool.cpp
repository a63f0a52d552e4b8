// Trading surface - implementation
#include "ammsim/pools/sim_pool.hpp"

#include <algorithm>
#include <type_traits>

#include "ammsim/core/errors.hpp"
#include "ammsim/pools/cryptoswap/calcs.hpp"

namespace ammsim {
namespace pools {

namespace {

// int(x * perc) for a non-negative integer x
Int scale_by(const Int& x, double perc) {
    return from_double(to_double(x) * perc);
}

} // namespace

// =============================================================================
// AssetIndices
// =============================================================================

void AssetIndices::add(const std::string& name, std::size_t index) {
    if (!map_.emplace(name, index).second) {
        throw ConfigError("Duplicate coin name: " + name);
    }
}

std::size_t AssetIndices::at(const std::string& name) const {
    auto it = map_.find(name);
    if (it == map_.end()) throw ConfigError("Unknown coin: " + name);
    return it->second;
}

std::pair<std::size_t, std::size_t> AssetIndices::pair(const std::string& coin_in,
                                                       const std::string& coin_out) const {
    const std::size_t i = at(coin_in);
    const std::size_t j = at(coin_out);
    if (i == j) throw ConfigError("Duplicate coin indices.");
    return {i, j};
}

// =============================================================================
// SimStableswapPool
// =============================================================================

SimStableswapPool::SimStableswapPool(stableswap::StableswapPool pool, std::vector<std::string> coin_names)
    : pool_(std::move(pool)), names_(std::move(coin_names)) {
    if (names_.size() != pool_.n) {
        throw ConfigError("stableswap: expected " + std::to_string(pool_.n) + " coin names");
    }
    for (std::size_t k = 0; k < names_.size(); ++k) indices_.add(names_[k], k);
}

double SimStableswapPool::price(const std::string& coin_in, const std::string& coin_out, bool use_fee) const {
    const auto ij = indices_.pair(coin_in, coin_out);
    return pool_.dydx(ij.first, ij.second, use_fee);
}

TradeOutput SimStableswapPool::trade(const std::string& coin_in, const std::string& coin_out, const Int& size) {
    const auto ij = indices_.pair(coin_in, coin_out);
    const auto out = pool_.exchange(ij.first, ij.second, size);
    return {out.dy, out.fee, size * pool_.rates[ij.first] / Fixed::PRECISION()};
}

Int SimStableswapPool::get_max_trade_size(const std::string& coin_in, const std::string& coin_out,
                                          double out_balance_perc) const {
    const auto ij = indices_.pair(coin_in, coin_out);
    const std::size_t i = ij.first;
    const std::size_t j = ij.second;

    const auto xp = pool_.xp();
    const Int high_xp = pool_.get_y(j, i, scale_by(xp[j], out_balance_perc), xp) - xp[i];
    return high_xp * Fixed::PRECISION() / pool_.rates[i];
}

// =============================================================================
// SimMetaPool
// =============================================================================

SimMetaPool::SimMetaPool(stableswap::MetaPool pool, std::vector<std::string> coin_names,
                         std::vector<std::string> base_coin_names)
    : pool_(std::move(pool)) {
    if (coin_names.size() != pool_.n) {
        throw ConfigError("metapool: expected " + std::to_string(pool_.n) + " coin names");
    }
    if (base_coin_names.size() != pool_.basepool.n) {
        throw ConfigError("metapool: expected " + std::to_string(pool_.basepool.n) + " base coin names");
    }
    names_.assign(coin_names.begin(), coin_names.end() - 1);
    names_.insert(names_.end(), base_coin_names.begin(), base_coin_names.end());
    for (std::size_t k = 0; k < names_.size(); ++k) indices_.add(names_[k], k);

    indices_.add(coin_names.back(), BP_TOKEN);
    if (coin_names.back() != "bp_token") indices_.add("bp_token", BP_TOKEN);
}

Int SimMetaPool::precision(std::size_t i) const {
    if (i < pool_.max_coin) return pool_.rate_multipliers[i];
    return pool_.basepool.rates[i - pool_.max_coin];
}

double SimMetaPool::price(const std::string& coin_in, const std::string& coin_out, bool use_fee) const {
    auto ij = indices_.pair(coin_in, coin_out);
    if (ij.first != BP_TOKEN && ij.second != BP_TOKEN) {
        return pool_.dydx(ij.first, ij.second, use_fee);
    }

    // Meta-level price against the base LP token
    if (ij.first == BP_TOKEN) ij.first = pool_.max_coin;
    if (ij.second == BP_TOKEN) ij.second = pool_.max_coin;
    if (ij.first >= pool_.n || ij.second >= pool_.n || ij.first == ij.second) {
        throw SimPoolError("bp_token can only be priced against a primary coin");
    }
    return pool_.dydx_meta(ij.first, ij.second, pool_.xp(), use_fee);
}

TradeOutput SimMetaPool::trade(const std::string& coin_in, const std::string& coin_out, const Int& size) {
    auto ij = indices_.pair(coin_in, coin_out);
    const std::size_t max_coin = pool_.max_coin;

    if (ij.first == BP_TOKEN || ij.second == BP_TOKEN) {
        if (ij.first == BP_TOKEN) ij.first = max_coin;
        if (ij.second == BP_TOKEN) ij.second = max_coin;
        if (ij.first >= pool_.n || ij.second >= pool_.n || ij.first == ij.second) {
            throw SimPoolError("bp_token can only be traded against a primary coin");
        }
        const Int rate = pool_.rates()[ij.first];
        const auto out = pool_.exchange(ij.first, ij.second, size);
        return {out.dy, out.fee, size * rate / Fixed::PRECISION()};
    }

    const std::size_t i = ij.first;
    const std::size_t j = ij.second;
    const auto out = pool_.exchange_underlying(i, j, size);

    // Only trades touching a primary coin count as meta-pool volume
    Int volume = 0;
    if (i < max_coin || j < max_coin) volume = size * precision(i) / Fixed::PRECISION();
    return {out.dy, out.fee, volume};
}

Int SimMetaPool::get_max_trade_size(const std::string& coin_in, const std::string& coin_out,
                                    double out_balance_perc) const {
    const auto ij = indices_.pair(coin_in, coin_out);
    const std::size_t max_coin = pool_.max_coin;
    const std::size_t i = ij.first == BP_TOKEN ? max_coin : ij.first;
    const std::size_t j = ij.second == BP_TOKEN ? max_coin : ij.second;

    const bool i_in_base = ij.first != BP_TOKEN && i >= max_coin;
    const bool j_in_base = ij.second != BP_TOKEN && j >= max_coin;

    if (i_in_base && j_in_base) {
        const auto& bp = pool_.basepool;
        const std::size_t bi = i - max_coin;
        const std::size_t bj = j - max_coin;
        const auto xp_base = bp.xp();
        const Int high = bp.get_y(bj, bi, scale_by(xp_base[bj], out_balance_perc), xp_base) - xp_base[bi];
        return high * Fixed::PRECISION() / bp.rates[bi];
    }

    const std::size_t meta_i = std::min(i, max_coin);
    const std::size_t meta_j = std::min(j, max_coin);
    const auto rates = pool_.rates();
    const auto xp_meta = pool_.xp();
    const Int high = pool_.get_y(meta_j, meta_i, scale_by(xp_meta[meta_j], out_balance_perc), xp_meta) -
                     xp_meta[meta_i];

    // A base-coin input enters as LP tokens; its size is approximated at the base coin's rate
    if (i_in_base) return high * Fixed::PRECISION() / pool_.basepool.rates[i - max_coin];
    return high * Fixed::PRECISION() / rates[meta_i];
}

// =============================================================================
// SimCryptoPool
// =============================================================================

SimCryptoPool::SimCryptoPool(cryptoswap::CryptoPool pool, std::vector<std::string> coin_names)
    : pool_(std::move(pool)), names_(std::move(coin_names)) {
    for (const auto& p : pool_.precisions) {
        if (p != 1) throw SimPoolError("SimPool must have 18 decimals (precision 1) for each coin.");
    }
    if (names_.size() != pool_.n) {
        throw ConfigError("cryptoswap: expected " + std::to_string(pool_.n) + " coin names");
    }
    for (std::size_t k = 0; k < names_.size(); ++k) indices_.add(names_[k], k);
}

double SimCryptoPool::price(const std::string& coin_in, const std::string& coin_out, bool use_fee) const {
    const auto ij = indices_.pair(coin_in, coin_out);
    return pool_.dydx(ij.first, ij.second, use_fee);
}

TradeOutput SimCryptoPool::trade(const std::string& coin_in, const std::string& coin_out, const Int& size) {
    const auto ij = indices_.pair(coin_in, coin_out);
    const std::size_t i = ij.first;

    // Volume valued at the pre-trade price scale
    const Int volume = i == 0 ? size : Int(size * pool_.price_scale[i - 1] / Fixed::PRECISION());
    const auto out = pool_.exchange(i, ij.second, size);
    return {out.dy, out.fee, volume};
}

Int SimCryptoPool::get_max_trade_size(const std::string& coin_in, const std::string& coin_out,
                                      double out_balance_perc) const {
    const auto ij = indices_.pair(coin_in, coin_out);
    const std::size_t i = ij.first;
    const std::size_t j = ij.second;

    const auto xp = pool_.xp();
    auto xp_target = xp;
    xp_target[j] = scale_by(xp[j], out_balance_perc);
    const Int y = cryptoswap::get_y(pool_.A, pool_.gamma, xp_target, pool_.D, i).value;

    const Int high_xp = y - xp[i];
    if (i == 0) return high_xp;
    return high_xp * Fixed::PRECISION() / pool_.price_scale[i - 1];
}

// =============================================================================
// SimPool
// =============================================================================

const char* SimPool::kind() const {
    switch (impl_.index()) {
        case 0: return "stableswap";
        case 1: return "metapool";
        default: return "cryptoswap";
    }
}

const std::vector<std::string>& SimPool::asset_names() const {
    return std::visit([](const auto& p) -> const std::vector<std::string>& { return p.asset_names(); }, impl_);
}

double SimPool::price(const std::string& coin_in, const std::string& coin_out, bool use_fee) const {
    return std::visit([&](const auto& p) { return p.price(coin_in, coin_out, use_fee); }, impl_);
}

TradeOutput SimPool::trade(const std::string& coin_in, const std::string& coin_out, const Int& size) {
    return std::visit([&](auto& p) { return p.trade(coin_in, coin_out, size); }, impl_);
}

Int SimPool::get_max_trade_size(const std::string& coin_in, const std::string& coin_out) const {
    return std::visit([&](const auto& p) { return p.get_max_trade_size(coin_in, coin_out); }, impl_);
}

Int SimPool::get_min_trade_size(const std::string& coin_in) const {
    return std::visit([&](const auto& p) { return p.get_min_trade_size(coin_in); }, impl_);
}

SimPool::Snapshot SimPool::get_snapshot() const {
    return std::visit([](const auto& p) -> Snapshot { return p.get_snapshot(); }, impl_);
}

void SimPool::revert_to_snapshot(const Snapshot& snapshot) {
    std::visit(
        [&](auto& p) {
            using S = std::decay_t<decltype(p.get_snapshot())>;
            const S* s = std::get_if<S>(&snapshot);
            if (!s) throw SnapshotError(std::string("snapshot does not match pool kind ") + kind());
            p.revert_to_snapshot(*s);
        },
        impl_);
}

} // namespace pools
} // namespace ammsim
