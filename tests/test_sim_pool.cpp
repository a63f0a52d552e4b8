#include <gtest/gtest.h>
#include <memory>
#include "ammsim/core/errors.hpp"
#include "ammsim/pools/sim_pool.hpp"
#include "ammsim/pools/snapshot.hpp"

using namespace ammsim;
using namespace ammsim::pools;

namespace {

Int e18(unsigned long long v) { return Int(v) * Fixed::PRECISION(); }
Int e6(unsigned long long v) { return Int(v) * pow10(6); }

SimPool make_stableswap_pool() {
    stableswap::StableswapParams p;
    p.A = 250;
    p.n = 3;
    p.rates = {Fixed::PRECISION(), pow10(30), pow10(30)};
    return SimPool(SimStableswapPool(stableswap::StableswapPool(p, e18(3000000)), {"DAI", "USDC", "USDT"}));
}

SimPool make_meta_pool() {
    stableswap::StableswapParams base;
    base.A = 1000;
    base.n = 3;
    base.rates = {Fixed::PRECISION(), pow10(30), pow10(30)};

    stableswap::StableswapParams meta;
    meta.A = 250;
    meta.n = 2;
    meta.rates = {pow10(34), Fixed::PRECISION()};  // 2-decimal primary coin

    stableswap::MetaPool pool(meta, e18(4000000), stableswap::StableswapPool(base, e18(3000000)));
    return SimPool(SimMetaPool(std::move(pool), {"GUSD", "3CRV"}, {"DAI", "USDC", "USDT"}));
}

cryptoswap::CryptoParams crypto_params() {
    cryptoswap::CryptoParams p;
    p.A = 400000;
    p.gamma = Int("145000000000000");
    p.n = 2;
    p.mid_fee = 26000000;
    p.out_fee = 45000000;
    p.allowed_extra_profit = Int("2000000000000");
    p.fee_gamma = Int("230000000000000");
    p.adjustment_step = Int("146000000000000");
    p.ma_half_time = 600;
    p.price_scale = {e18(1500)};
    p.block_timestamp = 1700000000;
    return p;
}

SimPool make_crypto_pool() {
    return SimPool(SimCryptoPool(cryptoswap::CryptoPool(crypto_params(), e18(3000000)), {"USD", "ETH"}));
}

} // namespace

// ============================================================================
// Name resolution
// ============================================================================

TEST(AssetIndicesTest, ResolvesAndRejects) {
    AssetIndices idx;
    idx.add("DAI", 0);
    idx.add("USDC", 1);

    EXPECT_EQ(idx.at("USDC"), 1u);
    EXPECT_TRUE(idx.contains("DAI"));
    EXPECT_FALSE(idx.contains("USDT"));
    EXPECT_THROW(idx.at("USDT"), ConfigError);
    EXPECT_THROW(idx.add("DAI", 2), ConfigError);
    EXPECT_THROW(idx.pair("DAI", "DAI"), ConfigError);
}

TEST(AssetIndicesTest, AliasesShareIndex) {
    AssetIndices idx;
    idx.add("3CRV", 7);
    idx.add("bp_token", 7);
    EXPECT_THROW(idx.pair("3CRV", "bp_token"), ConfigError);
}

class SimPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        stable_ = std::make_unique<SimPool>(make_stableswap_pool());
    }

    std::unique_ptr<SimPool> stable_;
};

// ============================================================================
// Stableswap adapter
// ============================================================================

TEST_F(SimPoolTest, Kind) {
    EXPECT_STREQ(stable_->kind(), "stableswap");
    EXPECT_STREQ(make_meta_pool().kind(), "metapool");
    EXPECT_STREQ(make_crypto_pool().kind(), "cryptoswap");
}

TEST_F(SimPoolTest, StableswapPriceIncludesFee) {
    EXPECT_NEAR(stable_->price("DAI", "USDC", false), 1.0, 1e-9);
    EXPECT_NEAR(stable_->price("DAI", "USDC"), 0.9996, 1e-9);
}

TEST_F(SimPoolTest, UnknownCoinRejected) {
    EXPECT_THROW(stable_->price("DAI", "FRAX"), ConfigError);
    EXPECT_THROW(stable_->trade("USDC", "USDC", e6(1)), ConfigError);
}

TEST_F(SimPoolTest, DuplicateNamesRejected) {
    stableswap::StableswapParams p;
    p.A = 100;
    p.n = 2;
    EXPECT_THROW(SimStableswapPool(stableswap::StableswapPool(p, e18(2000)), {"DAI", "DAI"}), ConfigError);
}

TEST_F(SimPoolTest, StableswapTradeVolumeInPoolUnits) {
    const auto out = stable_->trade("USDC", "DAI", e6(1000));
    EXPECT_EQ(out.volume, e18(1000));
    EXPECT_GT(out.amount_out, e18(999));
    EXPECT_GT(out.fee, Int(0));
}

TEST_F(SimPoolTest, StableswapMaxTradeDrainsOutCoin) {
    const Int high = stable_->get_max_trade_size("DAI", "USDC");
    EXPECT_GT(high, e18(1000000));
    EXPECT_EQ(stable_->get_min_trade_size("DAI"), Int(0));

    const auto out = stable_->trade("DAI", "USDC", high);
    // About 1% of the out-coin balance is left
    EXPECT_GT(out.amount_out, e6(980000));
    EXPECT_LT(out.amount_out, e6(1000000));
}

// ============================================================================
// Snapshots
// ============================================================================

TEST_F(SimPoolTest, ExceptionMidTrialLeavesPoolIdentical) {
    const auto& impl = std::get<SimStableswapPool>(stable_->impl());
    const auto before = impl.pool().balances;
    const Int supply = impl.pool().tokens;

    try {
        ScopedSnapshot<SimPool> guard(*stable_);
        stable_->trade("DAI", "USDC", e18(250000));
        stable_->trade("USDT", "FRAX", e6(1));
        FAIL() << "expected ConfigError";
    } catch (const ConfigError&) {
    }

    EXPECT_EQ(impl.pool().balances, before);
    EXPECT_EQ(impl.pool().tokens, supply);
}

TEST_F(SimPoolTest, SnapshotKindMismatch) {
    auto crypto = make_crypto_pool();
    const auto snap = stable_->get_snapshot();
    EXPECT_THROW(crypto.revert_to_snapshot(snap), SnapshotError);
}

// ============================================================================
// Meta-pool adapter
// ============================================================================

TEST_F(SimPoolTest, MetaPoolAssetNames) {
    auto meta = make_meta_pool();
    const std::vector<std::string> expected{"GUSD", "DAI", "USDC", "USDT"};
    EXPECT_EQ(meta.asset_names(), expected);
}

TEST_F(SimPoolTest, MetaPoolLpTokenAddressable) {
    auto meta = make_meta_pool();
    EXPECT_NEAR(meta.price("GUSD", "bp_token", false), 1.0, 1e-9);
    EXPECT_NEAR(meta.price("3CRV", "GUSD", false), 1.0, 1e-9);
    EXPECT_THROW(meta.price("DAI", "bp_token"), SimPoolError);
}

TEST_F(SimPoolTest, MetaPoolVolumeCountsPrimaryLegsOnly) {
    auto meta = make_meta_pool();

    const auto primary = meta.trade("GUSD", "DAI", Int(100000));  // 1000.00 GUSD
    EXPECT_EQ(primary.volume, e18(1000));
    EXPECT_GT(primary.amount_out, e18(998));

    const auto base_only = meta.trade("DAI", "USDC", e18(1000));
    EXPECT_EQ(base_only.volume, Int(0));
    EXPECT_GT(base_only.amount_out, e6(999));
}

TEST_F(SimPoolTest, MetaPoolMaxTradeIsPositive) {
    auto meta = make_meta_pool();
    EXPECT_GT(meta.get_max_trade_size("GUSD", "DAI"), Int(0));
    EXPECT_GT(meta.get_max_trade_size("USDC", "GUSD"), Int(0));
    EXPECT_GT(meta.get_max_trade_size("DAI", "USDT"), Int(0));
}

// ============================================================================
// Cryptoswap adapter
// ============================================================================

TEST_F(SimPoolTest, CryptoRequiresEighteenDecimals) {
    auto p = crypto_params();
    p.precisions = {Int(1), pow10(12)};
    EXPECT_THROW(SimCryptoPool(cryptoswap::CryptoPool(p, e18(3000000)), {"USD", "ETH"}), SimPoolError);
}

TEST_F(SimPoolTest, CryptoVolumeAtPriceScale) {
    auto crypto = make_crypto_pool();
    const auto out = crypto.trade("ETH", "USD", e18(2));
    EXPECT_EQ(out.volume, e18(3000));
    EXPECT_GT(out.amount_out, e18(2980));
    EXPECT_NEAR(crypto.price("ETH", "USD", false) / 1500.0, 1.0, 1e-2);
}

TEST_F(SimPoolTest, CryptoMaxTradeIsTradable) {
    auto crypto = make_crypto_pool();
    const Int high = crypto.get_max_trade_size("USD", "ETH");
    EXPECT_GT(high, e18(1000000));
    EXPECT_NO_THROW(crypto.trade("USD", "ETH", high / 2));
}
