#include <gtest/gtest.h>
#include "ammsim/core/errors.hpp"
#include "ammsim/pools/snapshot.hpp"
#include "ammsim/pools/stableswap/metapool.hpp"

using namespace ammsim;
using namespace ammsim::pools;
using namespace ammsim::pools::stableswap;

namespace {

Int e18(unsigned long long v) { return Int(v) * Fixed::PRECISION(); }
Int e6(unsigned long long v) { return Int(v) * pow10(6); }

} // namespace

class MetaPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        // 18/6/6-decimal base pool, 1M of each coin
        base_params_.A = 1000;
        base_params_.n = 3;
        base_params_.rates = {Fixed::PRECISION(), pow10(30), pow10(30)};

        meta_params_.A = 250;
        meta_params_.n = 2;
    }

    MetaPool make_pool() const {
        StableswapPool base(base_params_, e18(3000000));
        return MetaPool(meta_params_, e18(4000000), std::move(base));
    }

    StableswapParams base_params_;
    StableswapParams meta_params_;
};

// ============================================================================
// Layout
// ============================================================================

TEST_F(MetaPoolTest, FlattenedIndexSpace) {
    auto pool = make_pool();
    EXPECT_EQ(pool.max_coin, 1u);
    EXPECT_EQ(pool.n_total(), 4u);
    EXPECT_EQ(pool.basepool.balances[1], e6(1000000));
}

TEST_F(MetaPoolTest, LpSlotRateIsBaseVirtualPrice) {
    auto pool = make_pool();
    const auto rates = pool.rates();
    ASSERT_EQ(rates.size(), 2u);
    EXPECT_EQ(rates[0], Fixed::PRECISION());
    EXPECT_EQ(rates[1], pool.basepool.get_virtual_price());
}

TEST_F(MetaPoolTest, BalancedInvariant) {
    auto pool = make_pool();
    EXPECT_EQ(pool.D(), e18(4000000));
}

TEST_F(MetaPoolTest, HighBaseRateRejected) {
    base_params_.rates = {Fixed::PRECISION(), pow10(31), pow10(30)};
    EXPECT_THROW(make_pool(), ConfigError);
}

// ============================================================================
// Underlying exchanges
// ============================================================================

TEST_F(MetaPoolTest, PrimaryToBaseCoinWithdrawsFromBase) {
    auto pool = make_pool();
    const Int base_dai = pool.basepool.balances[0];
    const Int base_supply = pool.basepool.tokens;

    const auto out = pool.exchange_underlying(0, 1, e18(1000));

    EXPECT_GT(out.dy, e18(998));
    EXPECT_LT(out.dy, e18(1000));
    EXPECT_EQ(pool.basepool.balances[0], base_dai - out.dy);
    EXPECT_LT(pool.basepool.tokens, base_supply);
    EXPECT_EQ(pool.balances[0], e18(2000000) + e18(1000));
}

TEST_F(MetaPoolTest, BaseCoinToPrimaryDepositsIntoBase) {
    auto pool = make_pool();
    const Int base_supply = pool.basepool.tokens;
    const Int lp_before = pool.balances[1];

    const auto out = pool.exchange_underlying(2, 0, e6(1000));

    EXPECT_GT(out.dy, e18(998));
    EXPECT_LT(out.dy, e18(1000));
    EXPECT_GT(pool.basepool.tokens, base_supply);
    EXPECT_EQ(pool.balances[1] - lp_before, pool.basepool.tokens - base_supply);
}

TEST_F(MetaPoolTest, BaseToBaseSkipsPrimary) {
    auto pool = make_pool();
    const auto meta_before = pool.balances;

    const auto out = pool.exchange_underlying(2, 3, e6(1000));

    EXPECT_GT(out.dy, e6(999));
    EXPECT_EQ(pool.balances, meta_before);
}

TEST_F(MetaPoolTest, PrimaryBaseRoundTripLosesFees) {
    auto pool = make_pool();
    const Int dx = e18(1000);
    const Int usdc = pool.exchange_underlying(0, 2, dx).dy;
    EXPECT_LT(pool.exchange_underlying(2, 0, usdc).dy, dx);

    const Int dai = e18(1000);
    const Int primary = pool.exchange_underlying(1, 0, dai).dy;
    EXPECT_LT(pool.exchange_underlying(0, 1, primary).dy, dai);
}

TEST_F(MetaPoolTest, BaseBaseRoundTripLosesFees) {
    auto pool = make_pool();
    const Int dx = e18(1000);
    const Int usdt = pool.exchange_underlying(1, 3, dx).dy;
    EXPECT_LT(pool.exchange_underlying(3, 1, usdt).dy, dx);

    const Int usdc = e6(1000);
    const Int usdt2 = pool.exchange_underlying(2, 3, usdc).dy;
    EXPECT_LT(pool.exchange_underlying(3, 2, usdt2).dy, usdc);
}

TEST_F(MetaPoolTest, LpSlotExchange) {
    auto pool = make_pool();
    const auto out = pool.exchange(1, 0, e18(1000));
    EXPECT_GT(out.dy, e18(999));
    EXPECT_EQ(pool.balances[1], e18(2000000) + e18(1000));
}

TEST_F(MetaPoolTest, UnderlyingIndexOutOfRange) {
    auto pool = make_pool();
    EXPECT_THROW(pool.exchange_underlying(0, 4, e18(1)), std::invalid_argument);
}

// ============================================================================
// Prices
// ============================================================================

TEST_F(MetaPoolTest, BalancedPricesNearOne) {
    auto pool = make_pool();
    EXPECT_NEAR(pool.dydx(0, 1), 1.0, 1e-9);
    EXPECT_NEAR(pool.dydx(1, 0), 1.0, 1e-9);
    EXPECT_NEAR(pool.dydx_meta(0, 1, pool.xp()), 1.0, 1e-12);
}

TEST_F(MetaPoolTest, FeeLowersPrice) {
    auto pool = make_pool();
    EXPECT_LT(pool.dydx(0, 1, true), pool.dydx(0, 1, false));
    EXPECT_LT(pool.dydx(2, 3, true), pool.dydx(2, 3, false));
}

TEST_F(MetaPoolTest, PriceMovesWithTrade) {
    auto pool = make_pool();
    const double before = pool.dydx(0, 1);
    pool.exchange_underlying(0, 1, e18(200000));
    EXPECT_LT(pool.dydx(0, 1), before);
}

// ============================================================================
// Snapshots
// ============================================================================

TEST_F(MetaPoolTest, SnapshotCoversBasePool) {
    auto pool = make_pool();
    const auto snap = pool.get_snapshot();

    pool.exchange_underlying(0, 2, e18(5000));
    pool.exchange_underlying(3, 1, e6(5000));
    ASSERT_NE(pool.basepool.balances, snap.base.balances);

    pool.revert_to_snapshot(snap);
    EXPECT_EQ(pool.balances, snap.meta.balances);
    EXPECT_EQ(pool.tokens, snap.meta.tokens);
    EXPECT_EQ(pool.basepool.balances, snap.base.balances);
    EXPECT_EQ(pool.basepool.tokens, snap.base.tokens);
}
