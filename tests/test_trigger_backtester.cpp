#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "trigger_backtester.hpp"
#include "hedge_strategy_builder.hpp"

using namespace pmx;
using namespace pmx::analytics;
using namespace pmx::types;
using ::testing::ElementsAre;

namespace {
constexpr Timestamp kDay = 86400000;
}

class TriggerBacktesterTest : public ::testing::Test {
protected:
    void SetUp() override {
        strategy.primary_market_id = "p";
        strategy.legs.emplace_back("p", "Primary", OrderSide::BUY, Outcome::YES, 0.60, 100, "Primary long YES");
        strategy.triggers = {
            trigger(TriggerType::ENTRY, 0.63, "entry"),
            trigger(TriggerType::TAKE_PROFIT, 0.75, "take profit"),
            trigger(TriggerType::STOP_LOSS, 0.51, "stop loss")
        };
    }

    static StrategyTrigger trigger(TriggerType type, double level, const std::string& condition) {
        StrategyTrigger t;
        t.type = type;
        t.market_id = "p";
        t.price_level = level;
        t.condition = condition;
        return t;
    }

    static MarketHistory history(const MarketId& id, const std::vector<double>& prices, Timestamp spacing) {
        PriceSeries series;
        for (size_t i = 0; i < prices.size(); ++i) {
            series.emplace_back(static_cast<Timestamp>(i) * spacing, prices[i]);
        }
        return MarketHistory(id, series);
    }

    TriggerBacktester backtester;
    Strategy strategy;
};

TEST_F(TriggerBacktesterTest, ReplaysEntriesAndExitsInOrder) {
    auto prices = history("p", {0.66, 0.62, 0.70, 0.76, 0.60, 0.50, 0.55}, 60000);

    auto result = backtester.run(strategy, {prices});
    ASSERT_TRUE(result.is_success());
    const auto& report = result.value();

    ASSERT_EQ(report.events.size(), 5u);
    EXPECT_EQ(report.events[0].type, BacktestEventType::ENTRY);
    EXPECT_DOUBLE_EQ(report.events[0].price, 0.62);
    EXPECT_EQ(report.events[1].trigger, TriggerType::TAKE_PROFIT);
    EXPECT_NEAR(report.events[1].pnl, 14.0, 1e-9);
    EXPECT_EQ(report.events[1].triggered_by, "take profit");
    EXPECT_EQ(report.events[3].trigger, TriggerType::STOP_LOSS);
    EXPECT_NEAR(report.events[3].pnl, -10.0, 1e-9);
    EXPECT_NEAR(report.events[3].cumulative_pnl, 4.0, 1e-9);
    EXPECT_EQ(report.events[4].type, BacktestEventType::ENTRY);

    EXPECT_NEAR(report.total_pnl, 4.0, 1e-9);
    EXPECT_EQ(report.trades, 2u);
    EXPECT_EQ(report.open_positions, 1u);
    // Mean 2, population sd 12
    EXPECT_NEAR(report.sharpe_ratio, 2.0 / 12.0, 1e-9);
}

TEST_F(TriggerBacktesterTest, DipBelowEntryIsNotTakeProfit) {
    auto prices = history("p", {0.62, 0.58, 0.61}, 60000);

    auto result = backtester.run(strategy, {prices});
    ASSERT_TRUE(result.is_success());

    ASSERT_EQ(result.value().events.size(), 1u);
    EXPECT_EQ(result.value().trades, 0u);
    EXPECT_EQ(result.value().open_positions, 1u);
    EXPECT_DOUBLE_EQ(result.value().sharpe_ratio, 0.0);
}

TEST_F(TriggerBacktesterTest, UnwindClosesAheadOfResolution) {
    StrategyTrigger unwind;
    unwind.type = TriggerType::UNWIND;
    unwind.market_id = "p";
    unwind.days_before_resolution = 7;
    unwind.condition = "unwind";
    strategy.triggers.push_back(unwind);

    auto prices = history("p", {0.60, 0.61, 0.62, 0.63, 0.60, 0.59}, kDay);

    auto result = backtester.run(strategy, {prices}, 10 * kDay);
    ASSERT_TRUE(result.is_success());
    const auto& report = result.value();

    // Window opens at day 3: exit there and no re-entry afterwards
    ASSERT_EQ(report.events.size(), 2u);
    EXPECT_EQ(report.events[1].trigger, TriggerType::UNWIND);
    EXPECT_EQ(report.events[1].timestamp, 3 * kDay);
    EXPECT_NEAR(report.events[1].pnl, 3.0, 1e-9);
    EXPECT_EQ(report.open_positions, 0u);
    // A single trade divides by 1
    EXPECT_NEAR(report.sharpe_ratio, 3.0, 1e-9);

    auto without_resolution = backtester.run(strategy, {prices});
    ASSERT_TRUE(without_resolution.is_success());
    EXPECT_EQ(without_resolution.value().trades, 0u);
}

TEST_F(TriggerBacktesterTest, NoLegsTradeComplementPrice) {
    strategy.legs[0] = StrategyLeg("p", "Primary", OrderSide::BUY, Outcome::NO, 0.60, 100, "Primary long NO");
    // YES prices; the NO leg sees 0.62 then 0.76
    auto prices = history("p", {0.38, 0.24}, 60000);

    auto result = backtester.run(strategy, {prices});
    ASSERT_TRUE(result.is_success());

    ASSERT_EQ(result.value().events.size(), 2u);
    EXPECT_NEAR(result.value().events[0].price, 0.62, 1e-12);
    EXPECT_NEAR(result.value().total_pnl, 14.0, 1e-9);
}

TEST_F(TriggerBacktesterTest, LegsWithoutUsableHistoryAreSkipped) {
    auto result = backtester.run(strategy, {history("other", {0.5, 0.5}, 60000)});
    ASSERT_TRUE(result.is_success());

    EXPECT_TRUE(result.value().events.empty());
    EXPECT_THAT(result.value().skipped_legs, ElementsAre("p"));

    auto invalid = backtester.run(strategy, {history("p", {0.5, 1.7}, 60000)});
    ASSERT_TRUE(invalid.is_success());
    EXPECT_THAT(invalid.value().skipped_legs, ElementsAre("p"));
}

TEST_F(TriggerBacktesterTest, StrategyWithoutLegsOrTriggersIsInsufficient) {
    Strategy bare;
    EXPECT_TRUE(backtester.run(bare, {}).is_error(ErrorKind::INSUFFICIENT_DATA));

    strategy.triggers.clear();
    EXPECT_TRUE(backtester.run(strategy, {}).is_error(ErrorKind::INSUFFICIENT_DATA));
}

TEST_F(TriggerBacktesterTest, BuiltStrategyTriggersReplay) {
    MarketInfo primary;
    primary.id = "p";
    primary.yes_mid = 0.60;
    primary.no_mid = 0.40;

    HedgeStrategyBuilder builder;
    HedgeRequest request = builder.default_request();
    request.primary_market_id = "p";
    request.markets = {primary};
    request.size = 100;

    auto built = builder.build(request);
    ASSERT_TRUE(built.is_success());

    // Entry at or below 0.63, take profit at 0.75
    auto result = backtester.run(built.value(), {history("p", {0.62, 0.80}, 60000)});
    ASSERT_TRUE(result.is_success());
    ASSERT_EQ(result.value().events.size(), 2u);
    EXPECT_EQ(result.value().events[1].trigger, TriggerType::TAKE_PROFIT);
    EXPECT_NEAR(result.value().total_pnl, 18.0, 1e-9);
}
