#include <gtest/gtest.h>
#include <boost/json.hpp>
#include "ammsim/core/errors.hpp"
#include "ammsim/harness/samples.hpp"
#include "ammsim/pools/config.hpp"

using namespace ammsim;
using namespace ammsim::pools;
using namespace ammsim::harness;

namespace json = boost::json;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = json::parse(R"({
            "tag": "3pool-sweep",
            "pool": {
                "kind": "stableswap",
                "coins": ["DAI", "USDC", "USDT"],
                "A": 250,
                "D": "3000000000000000000000000",
                "fee": 4000000
            },
            "param_grid": { "A": [100, 250, 1000], "fee": [1000000, 4000000] },
            "trader": "simple",
            "vol_mult": 0.5
        })");
    }

    json::value config_;
};

// ============================================================================
// Kinds
// ============================================================================

TEST_F(ConfigTest, KindNames) {
    EXPECT_EQ(parse_pool_kind("stableswap"), PoolKind::Stableswap);
    EXPECT_EQ(parse_pool_kind("metapool"), PoolKind::MetaPool);
    EXPECT_EQ(parse_pool_kind("cryptoswap"), PoolKind::Cryptoswap);
    EXPECT_THROW(parse_pool_kind("uniswap"), ConfigError);

    EXPECT_EQ(parse_trader_kind("volume_limited"), TraderKind::VolumeLimited);
    EXPECT_EQ(parse_trader_kind("simple"), TraderKind::Simple);
    EXPECT_THROW(parse_trader_kind("greedy"), ConfigError);
}

// ============================================================================
// Config file
// ============================================================================

TEST_F(ConfigTest, ParsesTopLevel) {
    const auto cfg = parse_sim_config(config_);
    EXPECT_EQ(cfg.tag, "3pool-sweep");
    EXPECT_EQ(cfg.trader, TraderKind::Simple);
    EXPECT_DOUBLE_EQ(cfg.vol_mult, 0.5);
    ASSERT_EQ(cfg.param_grid.size(), 2u);
    EXPECT_EQ(cfg.param_grid[0].first, "A");
    EXPECT_EQ(cfg.param_grid[0].second.size(), 3u);
}

TEST_F(ConfigTest, DefaultsWithoutOptionalKeys) {
    auto& obj = config_.as_object();
    obj.erase("param_grid");
    obj.erase("trader");
    obj.erase("vol_mult");

    const auto cfg = parse_sim_config(config_);
    EXPECT_EQ(cfg.trader, TraderKind::VolumeLimited);
    EXPECT_DOUBLE_EQ(cfg.vol_mult, 1.0);
    EXPECT_EQ(expand_param_grid(cfg).size(), 1u);
}

TEST_F(ConfigTest, BadPoolKindFailsEarly) {
    config_.as_object()["pool"].as_object()["kind"] = "uniswap";
    EXPECT_THROW(parse_sim_config(config_), ConfigError);
}

TEST_F(ConfigTest, EmptyGridAxisRejected) {
    config_.as_object()["param_grid"].as_object()["A"] = json::array{};
    EXPECT_THROW(parse_sim_config(config_), ConfigError);
}

TEST_F(ConfigTest, GridIsCartesianProduct) {
    const auto points = expand_param_grid(parse_sim_config(config_));
    ASSERT_EQ(points.size(), 6u);

    // First key varies slowest
    EXPECT_EQ(points[0].params.at("A").as_int64(), 100);
    EXPECT_EQ(points[0].params.at("fee").as_int64(), 1000000);
    EXPECT_EQ(points[1].params.at("A").as_int64(), 100);
    EXPECT_EQ(points[1].params.at("fee").as_int64(), 4000000);
    EXPECT_EQ(points[5].params.at("A").as_int64(), 1000);

    // Overrides land in the pool entry; untouched keys survive
    EXPECT_EQ(points[5].pool.at("A").as_int64(), 1000);
    EXPECT_EQ(points[5].pool.at("coins").as_array().size(), 3u);
}

TEST_F(ConfigTest, MissingFileIsConfigError) {
    EXPECT_THROW(load_sim_config("/nonexistent/ammsim-config.json"), ConfigError);
}

// ============================================================================
// Pool construction
// ============================================================================

TEST_F(ConfigTest, BuildsStableswapFromD) {
    const auto cfg = parse_sim_config(config_);
    const auto pool = make_sim_pool(cfg.pool);
    EXPECT_STREQ(pool.kind(), "stableswap");

    const auto& p = std::get<SimStableswapPool>(pool.impl()).pool();
    EXPECT_EQ(p.A, Int(250));
    EXPECT_EQ(p.balances[0], Int("1000000000000000000000000"));
}

TEST_F(ConfigTest, BuildsStableswapFromBalances) {
    const auto obj = json::parse(R"({
        "kind": "stableswap",
        "coins": ["A", "B"],
        "A": 100,
        "balances": ["5000000000000000000000", "3000000000000000000000"]
    })").as_object();
    const auto pool = make_sim_pool(obj);
    const auto& p = std::get<SimStableswapPool>(pool.impl()).pool();
    EXPECT_EQ(p.balances[1], Int("3000000000000000000000"));
}

TEST_F(ConfigTest, MissingAmplificationRejected) {
    auto obj = config_.as_object()["pool"].as_object();
    obj.erase("A");
    EXPECT_THROW(make_sim_pool(obj), ConfigError);
}

TEST_F(ConfigTest, MissingSizeRejected) {
    auto obj = config_.as_object()["pool"].as_object();
    obj.erase("D");
    EXPECT_THROW(make_sim_pool(obj), ConfigError);
}

TEST_F(ConfigTest, BuildsMetaPool) {
    const auto obj = json::parse(R"({
        "kind": "metapool",
        "coins": ["GUSD", "3CRV"],
        "A": 1000,
        "rates": ["10000000000000000000000000000000000", "1000000000000000000"],
        "D": "4000000000000000000000000",
        "basepool": {
            "coins": ["DAI", "USDC", "USDT"],
            "A": 2000,
            "rates": ["1000000000000000000", "1000000000000000000000000000000",
                      "1000000000000000000000000000000"],
            "D": "3000000000000000000000000"
        }
    })").as_object();

    const auto pool = make_sim_pool(obj);
    EXPECT_STREQ(pool.kind(), "metapool");
    const std::vector<std::string> names{"GUSD", "DAI", "USDC", "USDT"};
    EXPECT_EQ(pool.asset_names(), names);
    EXPECT_EQ(std::get<SimMetaPool>(pool.impl()).pool().basepool.A, Int(2000));
}

TEST_F(ConfigTest, BuildsCryptoPool) {
    const auto obj = json::parse(R"({
        "kind": "cryptoswap",
        "coins": ["USD", "ETH"],
        "A": 400000,
        "gamma": "145000000000000",
        "mid_fee": 26000000,
        "out_fee": 45000000,
        "allowed_extra_profit": "2000000000000",
        "fee_gamma": "230000000000000",
        "adjustment_step": "146000000000000",
        "ma_half_time": 600,
        "price_scale": ["1500000000000000000000"],
        "D": "3000000000000000000000000",
        "block_timestamp": 1700000000
    })").as_object();

    const auto pool = make_sim_pool(obj);
    const auto& p = std::get<SimCryptoPool>(pool.impl()).pool();
    EXPECT_EQ(p.n, 2u);
    EXPECT_EQ(p.block_timestamp, 1700000000u);
    EXPECT_EQ(p.balances[1], Int("1000000000000000000000"));
}

TEST_F(ConfigTest, CryptoRequiresGamma) {
    const auto obj = json::parse(R"({
        "kind": "cryptoswap", "coins": ["USD", "ETH"], "A": 400000,
        "mid_fee": 1, "out_fee": 1, "allowed_extra_profit": 1, "fee_gamma": 1,
        "adjustment_step": 1, "ma_half_time": 600, "price_scale": [1], "D": 1
    })").as_object();
    EXPECT_THROW(make_sim_pool(obj), ConfigError);
}

// ============================================================================
// Samples
// ============================================================================

class SamplesTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = json::parse(R"({
            "pairs": [["DAI", "USDC"], ["DAI", "USDT"]],
            "samples": [
                { "timestamp": 1690000000, "prices": [1.0002, 0.9995], "volumes": [12000.0, 8000.0] },
                { "timestamp": 1690003600, "prices": [0.9991, 1.0], "volumes": [500.0, 0.0] },
                { "timestamp": 1690007200, "prices": [1.0, 1.0] }
            ]
        })");
    }

    json::value root_;
};

TEST_F(SamplesTest, ParsesPairsInOrder) {
    const auto samples = parse_samples(root_);
    ASSERT_EQ(samples.size(), 3u);
    EXPECT_EQ(samples[0].timestamp, 1690000000u);
    EXPECT_DOUBLE_EQ(samples[0].prices.at({"DAI", "USDC"}), 1.0002);
    EXPECT_DOUBLE_EQ(samples[0].prices.at({"DAI", "USDT"}), 0.9995);
    EXPECT_DOUBLE_EQ(samples[1].volumes.at({"DAI", "USDC"}), 500.0);
    EXPECT_TRUE(samples[2].volumes.empty());
}

TEST_F(SamplesTest, MaxSamplesTruncates) {
    EXPECT_EQ(parse_samples(root_, 2).size(), 2u);
}

TEST_F(SamplesTest, PriceCountMustMatchPairs) {
    root_.as_object()["samples"].as_array()[0].as_object()["prices"] = json::array{1.0};
    EXPECT_THROW(parse_samples(root_), ConfigError);
}

TEST_F(SamplesTest, VolumeLimitsScaleByMultiplier) {
    const auto samples = parse_samples(root_);
    const auto limits = volume_limits(samples[0], 0.5);
    EXPECT_DOUBLE_EQ(limits.at({"DAI", "USDC"}), 6000.0);
    EXPECT_DOUBLE_EQ(limits.at({"DAI", "USDT"}), 4000.0);
}

TEST_F(SamplesTest, VolumeLimitsNeedVolumes) {
    const auto samples = parse_samples(root_);
    EXPECT_THROW(volume_limits(samples[2], 1.0), ConfigError);
}
