#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "execution_simulator.hpp"

using namespace pmx;
using namespace pmx::analytics;
using namespace pmx::types;

class ExecutionSimulatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        booked.id = "booked";
        booked.yes_mid = 0.5;
        booked.no_mid = 0.5;
        OrderBook book;
        book.asks = {{0.55, 100, BookSide::ASK}, {0.50, 100, BookSide::ASK}};
        book.bids = {{0.48, 60, BookSide::BID}, {0.45, 40, BookSide::BID}};
        booked.yes_book = book;

        synthetic.id = "synthetic";
        synthetic.yes_mid = 0.5;
        synthetic.no_mid = 0.5;
        synthetic.liquidity = 50000;
    }

    static StrategyLeg leg(const MarketId& id, OrderSide side, Outcome outcome, double size) {
        return StrategyLeg(id, id, side, outcome, 0.5, size, "");
    }

    ExecutionSimulator simulator;
    MarketInfo booked;
    MarketInfo synthetic;
};

TEST_F(ExecutionSimulatorTest, WalksRealAsksForBuy) {
    auto result = simulator.simulate(leg("booked", OrderSide::BUY, Outcome::YES, 150), booked);
    ASSERT_TRUE(result.is_success());
    const auto& estimate = result.value();

    EXPECT_DOUBLE_EQ(estimate.filled, 150.0);
    EXPECT_NEAR(estimate.vwap, 0.5167, 1e-4);
    EXPECT_NEAR(estimate.mid, 0.49, 1e-12);
    EXPECT_NEAR(estimate.slippage, estimate.vwap - 0.49, 1e-12);
    EXPECT_FALSE(estimate.partial_fill);
    EXPECT_DOUBLE_EQ(estimate.shortfall, 0.0);
    EXPECT_FALSE(estimate.synthetic_depth);
}

TEST_F(ExecutionSimulatorTest, TwoSidedBookMidOverridesStaleMetadata) {
    MarketInfo stale;
    stale.id = "stale";
    stale.yes_mid = 0.30;
    stale.no_mid = 0.70;
    OrderBook book;
    book.bids = {{0.49, 500, BookSide::BID}};
    book.asks = {{0.51, 500, BookSide::ASK}};
    stale.yes_book = book;

    auto result = simulator.simulate(leg("stale", OrderSide::BUY, Outcome::YES, 100), stale);
    ASSERT_TRUE(result.is_success());

    EXPECT_NEAR(result.value().mid, 0.50, 1e-12);
    EXPECT_NEAR(result.value().vwap, 0.51, 1e-12);
    EXPECT_NEAR(result.value().slippage, 0.01, 1e-12);
}

TEST_F(ExecutionSimulatorTest, OneSidedBookUsesMetadataMid) {
    MarketInfo asks_only;
    asks_only.id = "asks_only";
    asks_only.yes_mid = 0.40;
    asks_only.no_mid = 0.60;
    OrderBook book;
    book.asks = {{0.42, 500, BookSide::ASK}};
    asks_only.yes_book = book;

    auto result = simulator.simulate(leg("asks_only", OrderSide::BUY, Outcome::YES, 100), asks_only);
    ASSERT_TRUE(result.is_success());
    EXPECT_NEAR(result.value().mid, 0.40, 1e-12);
    EXPECT_NEAR(result.value().slippage, 0.02, 1e-12);

    asks_only.yes_mid = 0.0;
    auto no_metadata = simulator.simulate(leg("asks_only", OrderSide::BUY, Outcome::YES, 100), asks_only);
    ASSERT_TRUE(no_metadata.is_success());
    EXPECT_NEAR(no_metadata.value().mid, 0.42, 1e-12);
    EXPECT_NEAR(no_metadata.value().slippage, 0.0, 1e-12);
}

TEST_F(ExecutionSimulatorTest, ReportsShortfallWhenDepthRunsOut) {
    auto result = simulator.simulate(leg("booked", OrderSide::BUY, Outcome::YES, 300), booked);
    ASSERT_TRUE(result.is_success());

    EXPECT_DOUBLE_EQ(result.value().filled, 200.0);
    EXPECT_TRUE(result.value().partial_fill);
    EXPECT_DOUBLE_EQ(result.value().shortfall, 100.0);
}

TEST_F(ExecutionSimulatorTest, SellWalksBidsDownward) {
    auto result = simulator.simulate(leg("booked", OrderSide::SELL, Outcome::YES, 80), booked);
    ASSERT_TRUE(result.is_success());

    EXPECT_NEAR(result.value().vwap, (60 * 0.48 + 20 * 0.45) / 80.0, 1e-12);
    EXPECT_LT(result.value().slippage, 0.0);
}

TEST_F(ExecutionSimulatorTest, SyntheticDepthIsDeterministicLadder) {
    OrderBook book = simulator.synthetic_depth(0.5, 50000);

    ASSERT_EQ(book.asks.size(), 5u);
    ASSERT_EQ(book.bids.size(), 5u);
    EXPECT_NEAR(book.asks[0].price, 0.51, 1e-12);
    EXPECT_NEAR(book.asks[4].price, 0.55, 1e-12);
    EXPECT_NEAR(book.bids[0].price, 0.49, 1e-12);
    EXPECT_DOUBLE_EQ(book.asks[0].size, 4000.0);
    EXPECT_NEAR(book.asks[1].size, 5400.0, 1e-9);

    OrderBook again = simulator.synthetic_depth(0.5, 50000);
    EXPECT_DOUBLE_EQ(again.asks[3].price, book.asks[3].price);
    EXPECT_DOUBLE_EQ(again.bids[3].size, book.bids[3].size);
}

TEST_F(ExecutionSimulatorTest, SyntheticDepthFloorsTickSizeAndBids) {
    OrderBook book = simulator.synthetic_depth(0.0002, 0);

    EXPECT_NEAR(book.asks[0].price, 0.0003, 1e-12);
    EXPECT_DOUBLE_EQ(book.asks[0].size, 1000.0);
    for (const auto& bid : book.bids) {
        EXPECT_GE(bid.price, 0.0001);
    }
}

TEST_F(ExecutionSimulatorTest, SyntheticAsksNeverExceedOne) {
    OrderBook book = simulator.synthetic_depth(0.99, 10000);

    ASSERT_EQ(book.asks.size(), 5u);
    for (const auto& ask : book.asks) {
        EXPECT_LE(ask.price, 1.0);
    }
    EXPECT_DOUBLE_EQ(book.asks.back().price, 1.0);
    EXPECT_NEAR(book.bids.front().price, 0.99 - 0.0198, 1e-12);
}

TEST_F(ExecutionSimulatorTest, FallsBackToSyntheticDepth) {
    auto result = simulator.simulate(leg("synthetic", OrderSide::BUY, Outcome::YES, 5000), synthetic);
    ASSERT_TRUE(result.is_success());

    EXPECT_TRUE(result.value().synthetic_depth);
    EXPECT_NEAR(result.value().vwap, (4000 * 0.51 + 1000 * 0.52) / 5000.0, 1e-12);
}

TEST_F(ExecutionSimulatorTest, InvalidLegsAreRejected) {
    EXPECT_TRUE(simulator.simulate(leg("booked", OrderSide::BUY, Outcome::YES, 0), booked)
                    .is_error(ErrorKind::INVALID_INPUT));

    MarketInfo dark;
    dark.id = "dark";
    EXPECT_TRUE(simulator.simulate(leg("dark", OrderSide::BUY, Outcome::YES, 10), dark)
                    .is_error(ErrorKind::UPSTREAM_DATA_GAP));
}

TEST_F(ExecutionSimulatorTest, SimulateAllKeepsLegOrder) {
    Strategy strategy;
    strategy.legs = {
        leg("booked", OrderSide::BUY, Outcome::YES, 150),
        leg("missing", OrderSide::BUY, Outcome::YES, 10),
        leg("synthetic", OrderSide::BUY, Outcome::NO, 10)
    };

    auto slots = simulator.simulate_all(strategy, {booked, synthetic});

    ASSERT_EQ(slots.size(), 3u);
    EXPECT_EQ(slots[0].item_id, "booked|yes");
    EXPECT_TRUE(slots[0].outcome.is_success());
    EXPECT_TRUE(slots[1].outcome.is_error(ErrorKind::UPSTREAM_DATA_GAP));
    ASSERT_TRUE(slots[2].outcome.is_success());
    EXPECT_TRUE(slots[2].outcome.value().synthetic_depth);
    EXPECT_EQ(slots[2].outcome.value().outcome, Outcome::NO);
}
