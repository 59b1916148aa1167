#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <cmath>
#include <filesystem>

#include "analytics_engine.hpp"
#include "analytics_config.hpp"
#include "config/config_manager.hpp"
#include "utils/logger.hpp"

using ::testing::Contains;
using ::testing::Field;

namespace pmx {
namespace integration {

using namespace analytics;
using namespace types;

class EndToEndTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::Logger::initialize("test_logs/integration.log", utils::LogLevel::DEBUG, 1024 * 1024, 2, false);

        ASSERT_TRUE(config_manager.load_from_string(R"({
            "engine": {"worker_threads": 2},
            "hedge": {"risk_cap": 600.0, "correlation_weight": 0.4},
            "orderbook": {"top_levels": 5},
            "payoff": {"probability_step": 0.1, "horizons_days": [14, 60]},
            "execution": {"min_base_size": 100}
        })"));
        config = load_analytics_config(config_manager);

        // Two markets on the same question that trade as mirror images
        for (int i = 0; i < 30; ++i) {
            const double p = 0.4 + 0.1 * std::sin(i / 3.0);
            leader.prices.emplace_back(static_cast<Timestamp>(i) * 60000, p);
            mirror.prices.emplace_back(static_cast<Timestamp>(i) * 60000, 1.0 - p);
        }
        leader.market_id = "lead";
        mirror.market_id = "mirror";
    }

    void TearDown() override {
        utils::Logger::shutdown();
        std::filesystem::remove_all("test_logs");
    }

    static MarketInfo info(const MarketId& id, double yes_mid, double liquidity) {
        MarketInfo market;
        market.id = id;
        market.title = id;
        market.yes_mid = yes_mid;
        market.no_mid = 1.0 - yes_mid;
        market.spread = 0.02;
        market.liquidity = liquidity;
        market.cluster_key = "election";
        market.last_update_age_minutes = 2;
        return market;
    }

    config::ConfigManager config_manager;
    AnalyticsConfig config;
    MarketHistory leader;
    MarketHistory mirror;
};

TEST_F(EndToEndTest, ConfigurationReachesEveryComponent) {
    EXPECT_EQ(config.engine.worker_threads, 2u);
    EXPECT_DOUBLE_EQ(config.hedge.risk_cap, 600.0);
    EXPECT_EQ(config.orderbook.top_levels, 5u);
    EXPECT_EQ(config.payoff.horizons_days.size(), 2u);
    EXPECT_EQ(config.alignment.mode, AlignmentMode::EXACT);
    EXPECT_DOUBLE_EQ(config.consistency.overround_limit, 1.03);
}

TEST_F(EndToEndTest, HistoriesToHedgedStrategy) {
    AnalyticsEngine engine(config);
    ASSERT_TRUE(engine.is_parallel());

    MarketAnalysis analysis = engine.analyze({leader, mirror}, "lead");
    ASSERT_EQ(analysis.correlations.size(), 1u);
    ASSERT_TRUE(analysis.correlations[0].outcome.is_success());
    const CorrelationEdge& edge = analysis.correlations[0].outcome.value();
    EXPECT_NEAR(edge.correlation, -1.0, 1e-9);
    EXPECT_EQ(edge.confidence, ConfidenceLevel::HIGH);
    ASSERT_TRUE(analysis.signals.is_success());
    ASSERT_TRUE(analysis.metrics.is_success());

    MarketInfo lead = info("lead", leader.prices.back().price, 80000);
    MarketInfo hedge = info("mirror", mirror.prices.back().price, 40000);
    OrderBook hedge_book;
    hedge_book.asks = {{hedge.yes_mid + 0.01, 50, BookSide::ASK}, {hedge.yes_mid + 0.03, 50, BookSide::ASK}};
    hedge.yes_book = hedge_book;

    HedgeRequest request = engine.default_request();
    EXPECT_DOUBLE_EQ(request.risk_cap, 600.0);
    request.primary_market_id = "lead";
    request.markets = {lead, hedge};
    request.size = 5000;
    request.correlations = {edge};
    request.signals = analysis.signals.value();

    auto built = engine.build_strategy(request, 0.6, 20);
    ASSERT_TRUE(built.is_success());
    const StrategyReport& report = built.value();
    const Strategy& strategy = report.strategy;

    EXPECT_NEAR(strategy.capped_shares, 600.0 / lead.yes_mid, 1e-6);
    ASSERT_EQ(strategy.legs.size(), 2u);
    EXPECT_EQ(strategy.legs[1].market_id, "mirror");
    EXPECT_EQ(strategy.legs[1].outcome, Outcome::YES);
    EXPECT_NEAR(strategy.legs[1].size, strategy.capped_shares * 0.4, 1e-9);

    EXPECT_EQ(strategy.payoff_curve.size(), 11u);
    EXPECT_EQ(strategy.time_decay.size(), 2u);
    EXPECT_EQ(strategy.settlement_grid.size(), 4u);

    ASSERT_EQ(report.executions.size(), 2u);
    ASSERT_TRUE(report.executions[0].outcome.is_success());
    EXPECT_TRUE(report.executions[0].outcome.value().synthetic_depth);
    ASSERT_TRUE(report.executions[1].outcome.is_success());
    const ExecutionEstimate& hedge_fill = report.executions[1].outcome.value();
    EXPECT_FALSE(hedge_fill.synthetic_depth);
    EXPECT_EQ(hedge_fill.partial_fill, strategy.legs[1].size > 100.0);
}

TEST_F(EndToEndTest, ClusterScanFlagsBrokenQuotes) {
    AnalyticsEngine engine(config);

    MarketInfo a = info("a", 0.55, 90000);
    a.mutually_exclusive = true;
    MarketInfo b = info("b", 0.50, 90000);
    b.mutually_exclusive = true;
    MarketInfo c = info("c", 0.40, 20000);
    c.no_mid = 0.45;

    ConsistencyReport report = engine.scan_consistency({a, b, c});

    EXPECT_THAT(report.findings, Contains(Field(&ConsistencyFinding::kind, FindingKind::OVERROUND)));
    EXPECT_THAT(report.findings, Contains(Field(&ConsistencyFinding::kind, FindingKind::PARITY_BREAK)));
    EXPECT_THAT(report.findings, Contains(Field(&ConsistencyFinding::kind, FindingKind::THIN_LIQUIDITY)));
}

} // namespace integration
} // namespace pmx
