#pragma once

#include "types/common_types.hpp"
#include "core/result.hpp"
#include "utils/thread_pool.hpp"
#include "analytics_config.hpp"
#include "orderbook_features.hpp"
#include "correlation_analyzer.hpp"
#include "market_metrics.hpp"
#include "inefficiency_detector.hpp"
#include "consistency_scanner.hpp"
#include "hedge_strategy_builder.hpp"
#include "payoff_projector.hpp"
#include "execution_simulator.hpp"
#include "trigger_backtester.hpp"
#include <memory>
#include <optional>
#include <vector>

namespace pmx {
namespace analytics {

struct MarketAnalysis {
    types::MarketId primary_market_id;
    std::vector<BatchSlot<CorrelationEdge>> correlations;
    Result<SignalList> signals;
    Result<MarketMetrics> metrics;

    MarketAnalysis()
        : signals(Result<SignalList>::error(ErrorKind::UPSTREAM_DATA_GAP, "not analyzed"))
        , metrics(Result<MarketMetrics>::error(ErrorKind::UPSTREAM_DATA_GAP, "not analyzed")) {}
};

struct StrategyReport {
    Strategy strategy;
    std::vector<BatchSlot<ExecutionEstimate>> executions;
};

// Runs the analytics pipeline with one shared configuration
class AnalyticsEngine {
public:
    explicit AnalyticsEngine(const AnalyticsConfig& config = AnalyticsConfig());
    ~AnalyticsEngine();

    AnalyticsEngine(const AnalyticsEngine&) = delete;
    AnalyticsEngine& operator=(const AnalyticsEngine&) = delete;

    // Pairwise correlations over all histories, then signals and metrics for the primary
    MarketAnalysis analyze(const std::vector<types::MarketHistory>& histories,
                           const types::MarketId& primary_id,
                           const std::optional<OrderbookFeatures>& primary_book = std::nullopt) const;

    std::vector<BatchSlot<SignalList>> scan_signals(const std::vector<types::MarketHistory>& histories) const;

    // Residual divergence and complementary spread for two linked markets
    Result<SignalList> analyze_pair(const types::MarketHistory& a, const types::MarketHistory& b) const;

    ConsistencyReport scan_consistency(const std::vector<types::MarketInfo>& cluster) const;

    Result<OrderbookFeatures> extract_book(const types::OrderBook& book) const;
    Result<OrderbookFeatures> extract_book(const nlohmann::json& payload) const;

    // Strategy with payoff curve, time decay and settlement grid, plus per-leg execution estimates
    Result<StrategyReport> build_strategy(const HedgeRequest& request, double belief,
                                          double half_life_days) const;

    Result<BacktestReport> backtest_strategy(const Strategy& strategy,
                                             const std::vector<types::MarketHistory>& histories,
                                             std::optional<types::Timestamp> resolution_time = std::nullopt) const;

    HedgeRequest default_request() const { return hedge_builder_.default_request(); }

    const AnalyticsConfig& config() const { return config_; }
    bool is_parallel() const { return pool_ != nullptr; }

private:
    AnalyticsConfig config_;
    std::unique_ptr<utils::ThreadPool> pool_;

    OrderbookFeatureExtractor orderbook_;
    CorrelationAnalyzer correlation_;
    MarketMetricsCalculator metrics_;
    InefficiencyDetector detector_;
    ConsistencyScanner consistency_;
    HedgeStrategyBuilder hedge_builder_;
    PayoffProjector projector_;
    ExecutionSimulator execution_;
    TriggerBacktester backtester_;
};

} // namespace analytics
} // namespace pmx
