#include <gtest/gtest.h>
#include "ammsim/core/errors.hpp"
#include "ammsim/pools/snapshot.hpp"
#include "ammsim/pools/stableswap/pool.hpp"

using namespace ammsim;
using namespace ammsim::pools;
using namespace ammsim::pools::stableswap;

namespace {

Int e18(unsigned long long v) { return Int(v) * Fixed::PRECISION(); }

} // namespace

class StableswapTest : public ::testing::Test {
protected:
    void SetUp() override {
        params_.A = 250;
        params_.n = 2;
        params_.fee = 4000000;
    }

    StableswapParams params_;
};

// ============================================================================
// Invariant
// ============================================================================

TEST_F(StableswapTest, BalancedPoolInvariantEqualsTotalValue) {
    StableswapPool pool(params_, e18(2000000));
    EXPECT_EQ(pool.balances[0], e18(1000000));
    EXPECT_EQ(pool.balances[1], e18(1000000));
    EXPECT_EQ(pool.D(), e18(2000000));
}

TEST_F(StableswapTest, BalancedThreeCoinInvariant) {
    params_.n = 3;
    StableswapPool pool(params_, e18(3000000));
    EXPECT_EQ(pool.D(), e18(3000000));
}

TEST_F(StableswapTest, ImbalancedInvariantBelowSum) {
    StableswapPool pool(params_, std::vector<Int>{e18(1500000), e18(500000)});
    const Int D = pool.D();
    EXPECT_LT(D, e18(2000000));
    EXPECT_GT(D, e18(1990000));
}

TEST_F(StableswapTest, ZeroBalanceIsUnsafe) {
    EXPECT_THROW(StableswapPool(params_, std::vector<Int>{Int(0), e18(1000000)}), SafetyBoundError);
}

TEST_F(StableswapTest, MismatchedRatesRejected) {
    params_.rates = {Fixed::PRECISION()};
    EXPECT_THROW(StableswapPool(params_, e18(2000000)), ConfigError);
}

// ============================================================================
// Exchange
// ============================================================================

TEST_F(StableswapTest, ExchangeMatchesContract) {
    // Two 6-decimal coins, 1M each
    params_.rates = {pow10(30), pow10(30)};
    StableswapPool pool(params_, e18(1000000));

    const auto out = pool.exchange(0, 1, Int(150000000));
    EXPECT_EQ(out.dy, Int(149939820));
    EXPECT_EQ(out.fee, Int(59999));
}

TEST_F(StableswapTest, ExchangeMovesBalances) {
    StableswapPool pool(params_, e18(2000000));
    const Int dx = e18(1000);
    const auto out = pool.exchange(0, 1, dx);

    EXPECT_EQ(pool.balances[0], e18(1000000) + dx);
    EXPECT_EQ(pool.balances[1], e18(1000000) - out.dy);
    EXPECT_LT(out.dy, dx);
    EXPECT_GT(out.fee, Int(0));
}

TEST_F(StableswapTest, RoundTripLosesFees) {
    StableswapPool pool(params_, e18(2000000));
    const Int dx = e18(50000);
    const auto there = pool.exchange(0, 1, dx);
    const auto back = pool.exchange(1, 0, there.dy);
    EXPECT_LT(back.dy, dx);
}

TEST_F(StableswapTest, AdminFeeAccrues) {
    params_.admin_fee = 5000000000;  // 50%
    StableswapPool pool(params_, e18(2000000));
    const auto out = pool.exchange(0, 1, e18(1000));

    EXPECT_EQ(pool.admin_balances[0], Int(0));
    EXPECT_GT(pool.admin_balances[1], Int(0));
    EXPECT_LE(pool.admin_balances[1], out.fee / 2 + 1);
}

TEST_F(StableswapTest, InvalidIndicesRejected) {
    StableswapPool pool(params_, e18(2000000));
    EXPECT_THROW(pool.exchange(0, 0, e18(1)), std::invalid_argument);
    EXPECT_THROW(pool.exchange(0, 2, e18(1)), std::invalid_argument);
}

// ============================================================================
// Prices and fees
// ============================================================================

TEST_F(StableswapTest, BalancedSpotPriceIsOne) {
    StableswapPool pool(params_, e18(2000000));
    EXPECT_NEAR(pool.dydx(0, 1), 1.0, 1e-12);
    EXPECT_NEAR(pool.dydx(0, 1, true), 1.0 - 0.0004, 1e-12);
}

TEST_F(StableswapTest, SpotPriceFallsAfterSelling) {
    StableswapPool pool(params_, e18(2000000));
    pool.exchange(0, 1, e18(200000));
    EXPECT_LT(pool.dydx(0, 1), 1.0);
    EXPECT_GT(pool.dydx(1, 0), 1.0);
}

TEST_F(StableswapTest, DynamicFeeAtBalanceIsBaseFee) {
    params_.fee_mul = Int(20000000000);
    StableswapPool pool(params_, e18(2000000));
    EXPECT_EQ(pool.dynamic_fee(e18(1000000), e18(1000000)), params_.fee);
    EXPECT_GT(pool.dynamic_fee(e18(1500000), e18(500000)), params_.fee);
}

// ============================================================================
// Liquidity
// ============================================================================

TEST_F(StableswapTest, VirtualPriceStartsAtOne) {
    StableswapPool pool(params_, e18(2000000));
    EXPECT_EQ(pool.get_virtual_price(), Fixed::PRECISION());
}

TEST_F(StableswapTest, FeesRaiseVirtualPrice) {
    StableswapPool pool(params_, e18(2000000));
    const Int vp0 = pool.get_virtual_price();
    pool.exchange(0, 1, e18(100000));
    EXPECT_GT(pool.get_virtual_price(), vp0);
}

TEST_F(StableswapTest, ProportionalDepositMintsProportionally) {
    StableswapPool pool(params_, e18(2000000));
    const Int supply = pool.tokens;
    const Int minted = pool.add_liquidity({e18(1000), e18(1000)});
    EXPECT_NEAR(to_double(minted) / to_double(supply), 0.001, 1e-9);
    EXPECT_EQ(pool.tokens, supply + minted);
}

TEST_F(StableswapTest, WithdrawOneCoin) {
    StableswapPool pool(params_, e18(2000000));
    const auto quote = pool.calc_withdraw_one_coin(e18(1000), 0);
    const auto out = pool.remove_liquidity_one_coin(e18(1000), 0);

    EXPECT_EQ(out.dy, quote.dy);
    EXPECT_GT(out.dy, e18(990));
    EXPECT_LT(out.dy, e18(1000));
    EXPECT_EQ(pool.tokens, e18(2000000) - e18(1000));
}

// ============================================================================
// Snapshots
// ============================================================================

TEST_F(StableswapTest, RevertRestoresState) {
    StableswapPool pool(params_, e18(2000000));
    const auto snap = pool.get_snapshot();
    pool.exchange(0, 1, e18(5000));
    pool.add_liquidity({e18(10), e18(0)});
    pool.revert_to_snapshot(snap);

    EXPECT_EQ(pool.balances, snap.balances);
    EXPECT_EQ(pool.tokens, snap.tokens);
}

TEST_F(StableswapTest, ScopedSnapshotRevertsOnException) {
    StableswapPool pool(params_, e18(2000000));
    const auto before = pool.balances;
    const auto admin_before = pool.admin_balances;

    try {
        ScopedSnapshot<StableswapPool> guard(pool);
        pool.exchange(0, 1, e18(5000));
        pool.exchange(1, 1, e18(5000));  // throws after the first trade landed
        FAIL() << "expected invalid_argument";
    } catch (const std::invalid_argument&) {
    }

    EXPECT_EQ(pool.balances, before);
    EXPECT_EQ(pool.admin_balances, admin_before);
}
