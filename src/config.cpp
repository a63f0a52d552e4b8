// Pool configuration parsing - implementation
#include "ammsim/pools/config.hpp"

#include <optional>

#include "ammsim/core/errors.hpp"
#include "ammsim/core/json_utils.hpp"
#include "ammsim/pools/stableswap/metapool.hpp"

namespace ammsim {
namespace pools {

namespace json = boost::json;

namespace {

std::optional<Int> opt_int(const json::object& obj, const char* key) {
    if (auto* v = obj.if_contains(key)) return parse_int(*v);
    return std::nullopt;
}

std::vector<Int> opt_int_array(const json::object& obj, const char* key) {
    if (auto* v = obj.if_contains(key)) return parse_int_array(*v);
    return {};
}

std::vector<std::string> parse_names(const json::object& obj, const char* key) {
    const auto& v = get_required(obj, key);
    if (!v.is_array()) throw ConfigError(std::string("expected array of names for key: ") + key);
    std::vector<std::string> out;
    for (const auto& e : v.as_array()) {
        if (!e.is_string()) throw ConfigError(std::string("expected string in: ") + key);
        out.emplace_back(e.as_string().c_str());
    }
    return out;
}

const json::object& as_object(const json::value& v, const char* what) {
    if (!v.is_object()) throw ConfigError(std::string("expected object for ") + what);
    return v.as_object();
}

stableswap::StableswapPool make_stableswap(const json::object& obj) {
    const auto params = parse_stableswap_params(obj);
    if (auto* b = obj.if_contains("balances")) {
        return stableswap::StableswapPool(params, parse_int_array(*b));
    }
    return stableswap::StableswapPool(params, parse_int(get_required(obj, "D")));
}

} // namespace

// =============================================================================
// Kinds
// =============================================================================

PoolKind parse_pool_kind(const std::string& s) {
    if (s == "stableswap") return PoolKind::Stableswap;
    if (s == "metapool") return PoolKind::MetaPool;
    if (s == "cryptoswap") return PoolKind::Cryptoswap;
    throw ConfigError("unknown pool kind: " + s);
}

TraderKind parse_trader_kind(const std::string& s) {
    if (s == "volume_limited") return TraderKind::VolumeLimited;
    if (s == "simple") return TraderKind::Simple;
    throw ConfigError("unknown trader: " + s);
}

// =============================================================================
// Pool parameters
// =============================================================================

stableswap::StableswapParams parse_stableswap_params(const json::object& obj) {
    stableswap::StableswapParams p;
    p.n = parse_names(obj, "coins").size();
    p.A = parse_int(get_required(obj, "A"));
    if (auto v = opt_int(obj, "fee")) p.fee = *v;
    p.fee_mul = opt_int(obj, "fee_mul");
    if (auto v = opt_int(obj, "admin_fee")) p.admin_fee = *v;
    p.rates = opt_int_array(obj, "rates");
    p.tokens = opt_int(obj, "tokens");
    return p;
}

cryptoswap::CryptoParams parse_crypto_params(const json::object& obj) {
    cryptoswap::CryptoParams p;
    p.n = parse_names(obj, "coins").size();
    p.A = parse_int(get_required(obj, "A"));
    p.gamma = parse_int(get_required(obj, "gamma"));
    p.precisions = opt_int_array(obj, "precisions");
    p.mid_fee = parse_int(get_required(obj, "mid_fee"));
    p.out_fee = parse_int(get_required(obj, "out_fee"));
    p.allowed_extra_profit = parse_int(get_required(obj, "allowed_extra_profit"));
    p.fee_gamma = parse_int(get_required(obj, "fee_gamma"));
    p.adjustment_step = parse_int(get_required(obj, "adjustment_step"));
    p.ma_half_time = parse_int(get_required(obj, "ma_half_time"));
    p.price_scale = parse_int_array(get_required(obj, "price_scale"));
    p.price_oracle = opt_int_array(obj, "price_oracle");
    p.last_prices = opt_int_array(obj, "last_prices");
    p.tokens = opt_int(obj, "tokens");
    if (auto v = opt_int(obj, "admin_fee")) p.admin_fee = *v;
    if (auto v = opt_int(obj, "xcp_profit")) p.xcp_profit = *v;
    if (auto v = opt_int(obj, "xcp_profit_a")) p.xcp_profit_a = *v;
    if (obj.contains("block_timestamp")) p.block_timestamp = get_u64_opt(obj, "block_timestamp", 0);
    return p;
}

SimPool make_sim_pool(const json::object& pool) {
    const PoolKind kind = parse_pool_kind(get_str(pool, "kind"));
    switch (kind) {
        case PoolKind::Stableswap:
            return SimPool(SimStableswapPool(make_stableswap(pool), parse_names(pool, "coins")));

        case PoolKind::MetaPool: {
            const auto& base = as_object(get_required(pool, "basepool"), "basepool");
            auto basepool = make_stableswap(base);
            const auto params = parse_stableswap_params(pool);
            auto meta = pool.contains("balances")
                ? stableswap::MetaPool(params, parse_int_array(pool.at("balances")), std::move(basepool))
                : stableswap::MetaPool(params, parse_int(get_required(pool, "D")), std::move(basepool));
            return SimPool(SimMetaPool(std::move(meta), parse_names(pool, "coins"), parse_names(base, "coins")));
        }

        case PoolKind::Cryptoswap: {
            const auto params = parse_crypto_params(pool);
            auto crypto = pool.contains("balances")
                ? cryptoswap::CryptoPool(params, parse_int_array(pool.at("balances")))
                : cryptoswap::CryptoPool(params, parse_int(get_required(pool, "D")));
            return SimPool(SimCryptoPool(std::move(crypto), parse_names(pool, "coins")));
        }
    }
    throw ConfigError("unhandled pool kind");
}

// =============================================================================
// Config file
// =============================================================================

SimConfig parse_sim_config(const json::value& root) {
    const auto& obj = as_object(root, "config root");

    SimConfig cfg;
    if (auto* v = obj.if_contains("tag")) {
        if (v->is_string()) cfg.tag = v->as_string().c_str();
    }
    cfg.pool = as_object(get_required(obj, "pool"), "pool");
    // Fail on a bad kind before any grid expansion
    parse_pool_kind(get_str(cfg.pool, "kind"));

    if (auto* v = obj.if_contains("param_grid")) {
        for (const auto& kv : as_object(*v, "param_grid")) {
            if (!kv.value().is_array() || kv.value().as_array().empty()) {
                throw ConfigError("param_grid." + std::string(kv.key()) + " must be a non-empty array");
            }
            const auto& a = kv.value().as_array();
            cfg.param_grid.emplace_back(std::string(kv.key()), std::vector<json::value>(a.begin(), a.end()));
        }
    }
    if (obj.contains("trader")) cfg.trader = parse_trader_kind(get_str(obj, "trader"));
    if (auto* v = obj.if_contains("vol_mult")) cfg.vol_mult = parse_real(*v);
    return cfg;
}

SimConfig load_sim_config(const std::string& path) {
    const std::string s = read_file(path);
    json::error_code ec;
    json::value root = json::parse(s, ec);
    if (ec) throw ConfigError("Invalid config json " + path + ": " + ec.message());
    return parse_sim_config(root);
}

std::vector<GridPoint> expand_param_grid(const SimConfig& cfg) {
    std::vector<GridPoint> points{GridPoint{json::object{}, cfg.pool}};
    for (const auto& [key, values] : cfg.param_grid) {
        std::vector<GridPoint> next;
        next.reserve(points.size() * values.size());
        for (const auto& point : points) {
            for (const auto& v : values) {
                GridPoint p = point;
                p.params[key] = v;
                p.pool[key] = v;
                next.push_back(std::move(p));
            }
        }
        points = std::move(next);
    }
    return points;
}

} // namespace pools
} // namespace ammsim
