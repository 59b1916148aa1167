#include "analytics_engine.hpp"
#include "utils/logger.hpp"
#include <algorithm>

namespace pmx {
namespace analytics {

AnalyticsEngine::AnalyticsEngine(const AnalyticsConfig& config)
    : config_(config)
    , orderbook_(config.orderbook)
    , correlation_(config.correlation, config.alignment)
    , metrics_(config.metrics)
    , detector_(config.inefficiency, config.alignment)
    , consistency_(config.consistency)
    , hedge_builder_(config.hedge)
    , projector_(config.payoff)
    , execution_(config.execution) {
    if (config_.engine.worker_threads > 0) {
        pool_ = std::make_unique<utils::ThreadPool>(config_.engine.worker_threads);
    }
    utils::Logger::info("Analytics engine ready ({} worker threads, {} alignment)",
                        config_.engine.worker_threads, to_string(config_.alignment.mode));
}

AnalyticsEngine::~AnalyticsEngine() {
    if (pool_) {
        pool_->shutdown();
    }
}

MarketAnalysis AnalyticsEngine::analyze(const std::vector<types::MarketHistory>& histories,
                                        const types::MarketId& primary_id,
                                        const std::optional<OrderbookFeatures>& primary_book) const {
    PMX_SCOPED_TIMER("analyze");

    MarketAnalysis analysis;
    analysis.primary_market_id = primary_id;
    analysis.correlations = correlation_.compute_matrix(histories, pool_.get());
    utils::AnalyticsLogger::log_performance_metric("correlation_pairs",
                                                   static_cast<double>(analysis.correlations.size()));

    auto primary = std::find_if(histories.begin(), histories.end(),
                                [&](const types::MarketHistory& h) { return h.market_id == primary_id; });
    if (primary == histories.end()) {
        const Error missing(ErrorKind::UPSTREAM_DATA_GAP, "primary market " + primary_id + " has no history");
        analysis.signals = Result<SignalList>::error(missing);
        analysis.metrics = Result<MarketMetrics>::error(missing);
        utils::Logger::warn("Analysis without primary history: {}", primary_id);
        return analysis;
    }

    std::vector<types::MarketHistory> peers;
    for (const auto& history : histories) {
        if (history.market_id != primary_id) {
            peers.push_back(history);
        }
    }

    const auto edges = successful_edges(analysis.correlations);
    analysis.signals = detector_.detect(*primary, edges, peers);
    analysis.metrics = metrics_.compute(primary->prices, primary_book);
    return analysis;
}

std::vector<BatchSlot<SignalList>> AnalyticsEngine::scan_signals(
    const std::vector<types::MarketHistory>& histories) const {
    const auto edges = successful_edges(correlation_.compute_matrix(histories, pool_.get()));
    return detector_.scan(histories, edges, pool_.get());
}

Result<SignalList> AnalyticsEngine::analyze_pair(const types::MarketHistory& a,
                                                 const types::MarketHistory& b) const {
    return detector_.detect_pair(a, b);
}

Result<BacktestReport> AnalyticsEngine::backtest_strategy(const Strategy& strategy,
                                                          const std::vector<types::MarketHistory>& histories,
                                                          std::optional<types::Timestamp> resolution_time) const {
    return backtester_.run(strategy, histories, resolution_time);
}

ConsistencyReport AnalyticsEngine::scan_consistency(const std::vector<types::MarketInfo>& cluster) const {
    return consistency_.scan(cluster);
}

Result<OrderbookFeatures> AnalyticsEngine::extract_book(const types::OrderBook& book) const {
    return orderbook_.extract(book);
}

Result<OrderbookFeatures> AnalyticsEngine::extract_book(const nlohmann::json& payload) const {
    return orderbook_.extract(payload);
}

Result<StrategyReport> AnalyticsEngine::build_strategy(const HedgeRequest& request, double belief,
                                                       double half_life_days) const {
    PMX_SCOPED_TIMER("build_strategy");

    auto built = hedge_builder_.build(request);
    if (built.is_error()) {
        return Result<StrategyReport>::error(built.error());
    }

    auto projected = projector_.project(built.value(), request.markets, belief, half_life_days);
    if (projected.is_error()) {
        return Result<StrategyReport>::error(projected.error());
    }

    StrategyReport report;
    report.strategy = std::move(projected.value());
    report.executions = execution_.simulate_all(report.strategy, request.markets);
    return Result<StrategyReport>::success(std::move(report));
}

} // namespace analytics
} // namespace pmx
