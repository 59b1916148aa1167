#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "hedge_strategy_builder.hpp"
#include <limits>

using namespace pmx;
using namespace pmx::analytics;
using namespace pmx::types;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

class HedgeStrategyBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        primary = market("p", "Primary", 0.6, 120000, "c");
        same_cluster = market("q", "Same cluster", 0.3, 50000, "c");
        other_cluster = market("r", "Other cluster", 0.45, 90000, "d");

        request = builder.default_request();
        request.primary_market_id = "p";
        request.markets = {primary, same_cluster, other_cluster};
        request.size = 1000;
    }

    static MarketInfo market(const MarketId& id, const std::string& title, double yes_mid,
                             double liquidity, const std::string& cluster) {
        MarketInfo info;
        info.id = id;
        info.title = title;
        info.yes_mid = yes_mid;
        info.no_mid = 1.0 - yes_mid;
        info.liquidity = liquidity;
        info.cluster_key = cluster;
        return info;
    }

    static CorrelationEdge edge(const MarketId& a, const MarketId& b, double r) {
        CorrelationEdge e;
        e.token_a = a;
        e.token_b = b;
        e.correlation = r;
        return e;
    }

    HedgeStrategyBuilder builder;
    HedgeRequest request;
    MarketInfo primary;
    MarketInfo same_cluster;
    MarketInfo other_cluster;
};

TEST_F(HedgeStrategyBuilderTest, DefaultRequestUsesConfiguredWeightAndCap) {
    HedgeRequest defaults = builder.default_request();

    EXPECT_DOUBLE_EQ(defaults.correlation_weight, 0.5);
    EXPECT_DOUBLE_EQ(defaults.risk_cap, 1500.0);
}

TEST_F(HedgeStrategyBuilderTest, BullishWithinBudgetAddsTopAlternativeHedge) {
    auto result = builder.build(request);
    ASSERT_TRUE(result.is_success());
    const auto& strategy = result.value();

    EXPECT_DOUBLE_EQ(strategy.requested_shares, 1000.0);
    EXPECT_DOUBLE_EQ(strategy.capped_shares, 1000.0);

    ASSERT_EQ(strategy.legs.size(), 2u);
    EXPECT_EQ(strategy.legs[0].market_id, "p");
    EXPECT_EQ(strategy.legs[0].outcome, Outcome::YES);
    EXPECT_DOUBLE_EQ(strategy.legs[0].price, 0.6);
    EXPECT_EQ(strategy.legs[1].market_id, "r");
    EXPECT_EQ(strategy.legs[1].outcome, Outcome::YES);
    EXPECT_DOUBLE_EQ(strategy.legs[1].size, 500.0);

    EXPECT_THAT(strategy.rationale, ElementsAre("Primary long YES expresses bullish view.",
                                                "Requested size fits within risk budget.",
                                                "Hedge leg chosen from top alternative in the cluster."));
}

TEST_F(HedgeStrategyBuilderTest, RiskCapLimitsShares) {
    request.size = 5000;

    auto result = builder.build(request);
    ASSERT_TRUE(result.is_success());

    EXPECT_DOUBLE_EQ(result.value().requested_shares, 5000.0);
    EXPECT_NEAR(result.value().capped_shares, 2500.0, 1e-9);
    EXPECT_THAT(result.value().rationale[1], HasSubstr("Sizing capped by risk budget: $1500.00 allows"));
}

TEST_F(HedgeStrategyBuilderTest, HedgeLegAboveCapIsExplained) {
    request.size = 5000;

    auto result = builder.build(request);
    ASSERT_TRUE(result.is_success());
    const auto& strategy = result.value();

    ASSERT_EQ(strategy.legs.size(), 2u);
    EXPECT_NEAR(strategy.legs[0].cost(), 1500.0, 1e-6);
    EXPECT_EQ(strategy.legs[1].market_id, "r");
    EXPECT_NEAR(strategy.legs[1].size, 1250.0, 1e-6);
    EXPECT_NEAR(strategy.capital_at_risk(), 2062.5, 1e-6);
    EXPECT_THAT(strategy.rationale[1], HasSubstr("primary shares."));
    EXPECT_EQ(strategy.rationale.back(), "Hedge legs add $562.50 at risk beyond the primary cap; total $2062.50.");
}

TEST_F(HedgeStrategyBuilderTest, PrimaryLegCarriesTriggers) {
    request.markets[0].resolution_horizon_days = 30;

    auto result = builder.build(request);
    ASSERT_TRUE(result.is_success());
    const auto& triggers = result.value().triggers;

    ASSERT_EQ(triggers.size(), 4u);
    EXPECT_EQ(triggers[0].type, TriggerType::ENTRY);
    EXPECT_EQ(triggers[0].market_id, "p");
    EXPECT_NEAR(*triggers[0].price_level, 0.63, 1e-12);
    EXPECT_EQ(triggers[0].condition, "Enter when primary YES price is at or below 0.630");
    EXPECT_EQ(triggers[1].type, TriggerType::TAKE_PROFIT);
    EXPECT_NEAR(*triggers[1].price_level, 0.75, 1e-12);
    EXPECT_EQ(triggers[1].condition, "Take profit at 25% gain");
    EXPECT_EQ(triggers[2].type, TriggerType::STOP_LOSS);
    EXPECT_NEAR(*triggers[2].price_level, 0.51, 1e-12);
    EXPECT_EQ(triggers[2].condition, "Stop loss at 15% loss");
    EXPECT_EQ(triggers[3].type, TriggerType::UNWIND);
    EXPECT_FALSE(triggers[3].price_level.has_value());
    EXPECT_EQ(triggers[3].condition, "Unwind 7 days before resolution");

    request.markets[0].resolution_horizon_days = 0;
    auto undated = builder.build(request);
    ASSERT_TRUE(undated.is_success());
    EXPECT_EQ(undated.value().triggers.size(), 3u);
}

TEST_F(HedgeStrategyBuilderTest, NotionalSizingDividesByEntryPrice) {
    request.sizing_mode = SizingMode::NOTIONAL;
    request.size = 600;

    auto result = builder.build(request);
    ASSERT_TRUE(result.is_success());

    EXPECT_NEAR(result.value().requested_shares, 1000.0, 1e-9);
}

TEST_F(HedgeStrategyBuilderTest, BearishBuysNoAtNoMid) {
    request.view = StrategyView::BEARISH;
    request.size = 10000;

    auto result = builder.build(request);
    ASSERT_TRUE(result.is_success());
    const auto& strategy = result.value();

    EXPECT_EQ(strategy.legs[0].outcome, Outcome::NO);
    EXPECT_NEAR(strategy.legs[0].price, 0.4, 1e-12);
    EXPECT_NEAR(strategy.capped_shares, 1500.0 / 0.4, 1e-9);
    EXPECT_EQ(strategy.rationale[0], "Primary long NO expresses bearish view.");
}

TEST_F(HedgeStrategyBuilderTest, RelativePrefersSameClusterAlternative) {
    request.view = StrategyView::RELATIVE;

    auto result = builder.build(request);
    ASSERT_TRUE(result.is_success());
    const auto& strategy = result.value();

    ASSERT_EQ(strategy.legs.size(), 2u);
    EXPECT_EQ(strategy.legs[0].outcome, Outcome::NO);
    EXPECT_EQ(strategy.legs[1].market_id, "q");
    EXPECT_EQ(strategy.legs[1].outcome, Outcome::YES);
    EXPECT_DOUBLE_EQ(strategy.legs[1].size, strategy.capped_shares * 0.5);
}

TEST_F(HedgeStrategyBuilderTest, RelativeFallsBackToMostLiquidMarket) {
    request.view = StrategyView::RELATIVE;
    request.markets = {primary, other_cluster, market("s", "Small", 0.2, 1000, "e")};

    auto result = builder.build(request);
    ASSERT_TRUE(result.is_success());

    EXPECT_EQ(result.value().legs[1].market_id, "r");
}

TEST_F(HedgeStrategyBuilderTest, RelativeWithoutAlternativeIsInsufficient) {
    request.view = StrategyView::RELATIVE;
    request.markets = {primary};

    EXPECT_TRUE(builder.build(request).is_error(ErrorKind::INSUFFICIENT_DATA));
}

TEST_F(HedgeStrategyBuilderTest, SingleMarketBullishHasOneLeg) {
    request.markets = {primary};

    auto result = builder.build(request);
    ASSERT_TRUE(result.is_success());

    EXPECT_EQ(result.value().legs.size(), 1u);
}

TEST_F(HedgeStrategyBuilderTest, NegativeCorrelationHedgesWithSameOutcome) {
    request.correlations = {edge("q", "p", -0.62)};

    auto result = builder.build(request);
    ASSERT_TRUE(result.is_success());
    const auto& strategy = result.value();

    ASSERT_EQ(strategy.legs.size(), 2u);
    EXPECT_EQ(strategy.legs[1].market_id, "q");
    EXPECT_EQ(strategy.legs[1].outcome, Outcome::YES);
    EXPECT_EQ(strategy.legs[1].rationale, "Negative correlation (-62%) provides downside protection");
    EXPECT_EQ(strategy.rationale.back(), "Hedge leg chosen from correlation analysis (hedge, r = -0.62).");
}

TEST_F(HedgeStrategyBuilderTest, SpreadTradeOutranksHedgeAndTakesOppositeOutcome) {
    InefficiencySignal divergence;
    divergence.type = SignalType::ARBITRAGE;
    divergence.primary_market = "p";
    divergence.related_market = "r";
    divergence.score = 2.0;

    request.correlations = {edge("p", "q", -0.62), edge("p", "r", 0.85)};
    request.signals = {divergence};

    auto result = builder.build(request);
    ASSERT_TRUE(result.is_success());
    const auto& hedge = result.value().legs[1];

    EXPECT_EQ(hedge.market_id, "r");
    EXPECT_EQ(hedge.outcome, Outcome::NO);
    EXPECT_NEAR(hedge.price, 0.55, 1e-12);
    EXPECT_THAT(hedge.rationale, HasSubstr("spread trade opportunity"));
}

TEST_F(HedgeStrategyBuilderTest, SuggestionsRankedByConfidence) {
    InefficiencySignal divergence;
    divergence.type = SignalType::ARBITRAGE;
    divergence.primary_market = "p";
    divergence.related_market = "q";
    divergence.score = 2.0;

    auto suggestions = builder.suggest_hedges("p", {same_cluster, other_cluster},
                                              {edge("p", "q", -0.5), edge("p", "r", 0.9)}, {divergence});

    ASSERT_EQ(suggestions.size(), 1u);
    EXPECT_EQ(suggestions[0].kind, HedgeKind::HEDGE);
    EXPECT_DOUBLE_EQ(suggestions[0].hedge_ratio, 0.5);
    EXPECT_EQ(suggestions[0].rationale,
              "Negative correlation (-50%) provides downside protection. arbitrage opportunity (score: 2.000)");
}

TEST_F(HedgeStrategyBuilderTest, ValidationErrors) {
    HedgeRequest bad_weight = request;
    bad_weight.correlation_weight = 1.0;
    EXPECT_TRUE(builder.build(bad_weight).is_error(ErrorKind::INVALID_INPUT));

    HedgeRequest bad_size = request;
    bad_size.size = -1;
    EXPECT_TRUE(builder.build(bad_size).is_error(ErrorKind::INVALID_INPUT));

    HedgeRequest bad_cap = request;
    bad_cap.risk_cap = 0;
    EXPECT_TRUE(builder.build(bad_cap).is_error(ErrorKind::INVALID_INPUT));

    HedgeRequest bad_mid = request;
    bad_mid.markets[0].yes_mid = 1.2;
    EXPECT_TRUE(builder.build(bad_mid).is_error(ErrorKind::INVALID_INPUT));
}

TEST_F(HedgeStrategyBuilderTest, MissingPrimaryIsDataGap) {
    HedgeRequest unselected = request;
    unselected.primary_market_id.clear();
    EXPECT_TRUE(builder.build(unselected).is_error(ErrorKind::UPSTREAM_DATA_GAP));

    HedgeRequest unknown = request;
    unknown.primary_market_id = "zzz";
    EXPECT_TRUE(builder.build(unknown).is_error(ErrorKind::UPSTREAM_DATA_GAP));
}

TEST_F(HedgeStrategyBuilderTest, InvalidCandidatesAreIgnored) {
    MarketInfo broken = market("x", "Broken", 0.9, 999999, "c");
    broken.yes_mid = std::numeric_limits<double>::quiet_NaN();
    request.markets = {primary, broken, same_cluster};

    auto result = builder.build(request);
    ASSERT_TRUE(result.is_success());

    ASSERT_EQ(result.value().legs.size(), 2u);
    EXPECT_EQ(result.value().legs[1].market_id, "q");
}

TEST_F(HedgeStrategyBuilderTest, WeightPresetsScaleHedgeLeg) {
    auto slots = builder.build_weight_presets(request);

    ASSERT_EQ(slots.size(), 3u);
    EXPECT_EQ(slots[0].item_id, "w=0.3");
    EXPECT_EQ(slots[2].item_id, "w=0.7");
    for (const auto& slot : slots) {
        ASSERT_TRUE(slot.outcome.is_success());
    }
    EXPECT_NEAR(slots[0].outcome.value().legs[1].size, 300.0, 1e-9);
    EXPECT_NEAR(slots[2].outcome.value().legs[1].size, 700.0, 1e-9);
}
