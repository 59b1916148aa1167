#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "analytics_engine.hpp"
#include <nlohmann/json.hpp>
#include <random>

using namespace pmx;
using namespace pmx::analytics;
using namespace pmx::types;

class AnalyticsEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::mt19937 rng(11);
        std::normal_distribution<double> step(0.0, 0.01);
        std::vector<double> base;
        double p = 0.5;
        for (int i = 0; i < 40; ++i) {
            p = std::min(0.9, std::max(0.1, p + step(rng)));
            base.push_back(p);
        }

        std::vector<double> mirror;
        for (double v : base) mirror.push_back(1.0 - v);

        histories = {history("a", base), history("b", mirror), history("c", base)};

        primary = market("a", 0.6, 120000, "c");
        hedge = market("b", 0.4, 90000, "c");
    }

    static MarketHistory history(const MarketId& id, const std::vector<double>& prices) {
        PriceSeries series;
        for (size_t i = 0; i < prices.size(); ++i) {
            series.emplace_back(static_cast<Timestamp>(i) * 60000, prices[i]);
        }
        return MarketHistory(id, series);
    }

    static MarketInfo market(const MarketId& id, double yes_mid, double liquidity, const std::string& cluster) {
        MarketInfo info;
        info.id = id;
        info.title = id;
        info.yes_mid = yes_mid;
        info.no_mid = 1.0 - yes_mid;
        info.liquidity = liquidity;
        info.cluster_key = cluster;
        return info;
    }

    static AnalyticsConfig parallel_config() {
        AnalyticsConfig config;
        config.engine.worker_threads = 3;
        return config;
    }

    std::vector<MarketHistory> histories;
    MarketInfo primary;
    MarketInfo hedge;
};

TEST_F(AnalyticsEngineTest, AnalyzeRunsCorrelationsSignalsAndMetrics) {
    AnalyticsEngine engine;

    MarketAnalysis analysis = engine.analyze(histories, "a");

    EXPECT_FALSE(engine.is_parallel());
    ASSERT_EQ(analysis.correlations.size(), 3u);
    ASSERT_TRUE(analysis.correlations[0].outcome.is_success());
    EXPECT_NEAR(analysis.correlations[0].outcome.value().correlation, -1.0, 1e-9);
    EXPECT_NEAR(analysis.correlations[1].outcome.value().correlation, 1.0, 1e-9);
    EXPECT_TRUE(analysis.signals.is_success());
    ASSERT_TRUE(analysis.metrics.is_success());
    EXPECT_DOUBLE_EQ(analysis.metrics.value().latest_price, histories[0].prices.back().price);
}

TEST_F(AnalyticsEngineTest, UnknownPrimaryKeepsMatrixButReportsGap) {
    AnalyticsEngine engine;

    MarketAnalysis analysis = engine.analyze(histories, "nope");

    EXPECT_EQ(analysis.correlations.size(), 3u);
    EXPECT_TRUE(analysis.signals.is_error(ErrorKind::UPSTREAM_DATA_GAP));
    EXPECT_TRUE(analysis.metrics.is_error(ErrorKind::UPSTREAM_DATA_GAP));
}

TEST_F(AnalyticsEngineTest, ParallelAndSequentialAgree) {
    AnalyticsEngine sequential;
    AnalyticsEngine parallel(parallel_config());
    ASSERT_TRUE(parallel.is_parallel());

    auto expected = sequential.scan_signals(histories);
    auto actual = parallel.scan_signals(histories);

    ASSERT_EQ(actual.size(), expected.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(actual[i].item_id, expected[i].item_id);
        ASSERT_EQ(actual[i].outcome.is_success(), expected[i].outcome.is_success());
        if (expected[i].outcome.is_success()) {
            ASSERT_EQ(actual[i].outcome.value().size(), expected[i].outcome.value().size());
            for (size_t k = 0; k < expected[i].outcome.value().size(); ++k) {
                EXPECT_EQ(actual[i].outcome.value()[k].type, expected[i].outcome.value()[k].type);
                EXPECT_DOUBLE_EQ(actual[i].outcome.value()[k].score, expected[i].outcome.value()[k].score);
            }
        }
    }
}

TEST_F(AnalyticsEngineTest, BuildStrategyProjectsAndSimulates) {
    AnalyticsEngine engine;
    HedgeRequest request = engine.default_request();
    request.primary_market_id = "a";
    request.markets = {primary, hedge};
    request.size = 1000;

    auto result = engine.build_strategy(request, 0.75, 30);
    ASSERT_TRUE(result.is_success());
    const StrategyReport& report = result.value();

    ASSERT_EQ(report.strategy.legs.size(), 2u);
    EXPECT_EQ(report.strategy.payoff_curve.size(), 21u);
    EXPECT_EQ(report.strategy.time_decay.size(), 4u);
    EXPECT_EQ(report.strategy.settlement_grid.size(), 4u);

    ASSERT_EQ(report.executions.size(), 2u);
    for (const auto& slot : report.executions) {
        ASSERT_TRUE(slot.outcome.is_success());
        EXPECT_TRUE(slot.outcome.value().synthetic_depth);
        EXPECT_FALSE(slot.outcome.value().partial_fill);
    }
}

TEST_F(AnalyticsEngineTest, BuildStrategyPropagatesBuilderErrors) {
    AnalyticsEngine engine;
    HedgeRequest request = engine.default_request();
    request.primary_market_id = "a";
    request.markets = {primary};
    request.view = StrategyView::RELATIVE;

    EXPECT_TRUE(engine.build_strategy(request, 0.5, 30).is_error(ErrorKind::INSUFFICIENT_DATA));
}

TEST_F(AnalyticsEngineTest, ExposesConsistencyAndBookFeatures) {
    AnalyticsEngine engine;

    MarketInfo skewed = primary;
    skewed.no_mid = 0.6;
    EXPECT_EQ(engine.scan_consistency({skewed}).findings.size(), 1u);

    auto features = engine.extract_book(nlohmann::json::parse(R"({"bids": [[0.49, 10]], "asks": [[0.51, 10]]})"));
    ASSERT_TRUE(features.is_success());
    EXPECT_NEAR(features.value().mid, 0.5, 1e-12);
}

TEST_F(AnalyticsEngineTest, AnalyzePairChecksComplementSpread) {
    AnalyticsEngine engine;

    auto exact = engine.analyze_pair(histories[0], histories[1]);
    ASSERT_TRUE(exact.is_success());
    EXPECT_TRUE(exact.value().empty());

    std::vector<double> rich;
    for (const auto& point : histories[1].prices) rich.push_back(point.price + 0.08);
    auto result = engine.analyze_pair(histories[0], history("d", rich));
    ASSERT_TRUE(result.is_success());
    ASSERT_EQ(result.value().size(), 1u);
    EXPECT_EQ(result.value()[0].type, SignalType::SPREAD);
    EXPECT_NEAR(result.value()[0].score, 0.08, 1e-9);

    EXPECT_TRUE(engine.analyze_pair(histories[0], MarketHistory()).is_error(ErrorKind::UPSTREAM_DATA_GAP));
}

TEST_F(AnalyticsEngineTest, BacktestStrategyReplaysBuiltTriggers) {
    AnalyticsEngine engine;
    HedgeRequest request = engine.default_request();
    request.primary_market_id = "a";
    request.markets = {primary};
    request.size = 100;

    auto built = engine.build_strategy(request, 0.75, 30);
    ASSERT_TRUE(built.is_success());

    auto report = engine.backtest_strategy(built.value().strategy, {history("a", {0.62, 0.80})});
    ASSERT_TRUE(report.is_success());
    EXPECT_EQ(report.value().trades, 1u);
    EXPECT_NEAR(report.value().total_pnl, 18.0, 1e-9);

    EXPECT_TRUE(engine.backtest_strategy(Strategy(), histories).is_error(ErrorKind::INSUFFICIENT_DATA));
}
