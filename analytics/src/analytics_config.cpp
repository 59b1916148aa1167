#include "analytics_config.hpp"
#include "utils/logger.hpp"

namespace pmx {
namespace analytics {

namespace {

OrderbookConfig read_orderbook(const config::ConfigManager& config) {
    OrderbookConfig c;
    c.top_levels = config.get_value<size_t>("orderbook.top_levels", c.top_levels);
    c.small_order_size = config.get_value<double>("orderbook.small_order_size", c.small_order_size);
    c.medium_order_size = config.get_value<double>("orderbook.medium_order_size", c.medium_order_size);
    c.large_order_size = config.get_value<double>("orderbook.large_order_size", c.large_order_size);
    c.very_tight_spread_percent = config.get_value<double>("orderbook.very_tight_spread_percent", c.very_tight_spread_percent);
    c.tight_spread_percent = config.get_value<double>("orderbook.tight_spread_percent", c.tight_spread_percent);
    c.moderate_spread_percent = config.get_value<double>("orderbook.moderate_spread_percent", c.moderate_spread_percent);
    c.imbalance_threshold = config.get_value<double>("orderbook.imbalance_threshold", c.imbalance_threshold);
    c.deep_book_depth = config.get_value<double>("orderbook.deep_book_depth", c.deep_book_depth);
    c.adequate_book_depth = config.get_value<double>("orderbook.adequate_book_depth", c.adequate_book_depth);
    c.high_slippage_threshold = config.get_value<double>("orderbook.high_slippage_threshold", c.high_slippage_threshold);
    c.reject_crossed_books = config.get_value<bool>("orderbook.reject_crossed_books", c.reject_crossed_books);
    return c;
}

AlignmentConfig read_alignment(const config::ConfigManager& config) {
    AlignmentConfig c;
    std::string mode = config.get_value<std::string>("alignment.mode", "exact");
    c.mode = mode == "nearest" ? AlignmentMode::NEAREST : AlignmentMode::EXACT;
    c.tolerance_ms = config.get_value<int64_t>("alignment.tolerance_ms", c.tolerance_ms);
    return c;
}

CorrelationConfig read_correlation(const config::ConfigManager& config) {
    CorrelationConfig c;
    c.max_lag = config.get_value<size_t>("correlation.max_lag", c.max_lag);
    c.min_lag_to_report = config.get_value<size_t>("correlation.min_lag_to_report", c.min_lag_to_report);
    c.rolling_window = config.get_value<size_t>("correlation.rolling_window", c.rolling_window);
    c.high_confidence_correlation = config.get_value<double>("correlation.high_confidence_correlation", c.high_confidence_correlation);
    c.high_confidence_p_value = config.get_value<double>("correlation.high_confidence_p_value", c.high_confidence_p_value);
    c.medium_confidence_correlation = config.get_value<double>("correlation.medium_confidence_correlation", c.medium_confidence_correlation);
    c.medium_confidence_p_value = config.get_value<double>("correlation.medium_confidence_p_value", c.medium_confidence_p_value);
    return c;
}

MetricsConfig read_metrics(const config::ConfigManager& config) {
    MetricsConfig c;
    c.momentum_window = config.get_value<size_t>("metrics.momentum_window", c.momentum_window);
    c.rolling_window = config.get_value<size_t>("metrics.rolling_window", c.rolling_window);
    c.bollinger_multiplier = config.get_value<double>("metrics.bollinger_multiplier", c.bollinger_multiplier);
    c.low_volatility = config.get_value<double>("metrics.low_volatility", c.low_volatility);
    c.low_drawdown = config.get_value<double>("metrics.low_drawdown", c.low_drawdown);
    c.healthy_bid_depth = config.get_value<double>("metrics.healthy_bid_depth", c.healthy_bid_depth);
    c.volatile_regime = config.get_value<double>("metrics.volatile_regime", c.volatile_regime);
    c.trend_threshold = config.get_value<double>("metrics.trend_threshold", c.trend_threshold);
    return c;
}

InefficiencyConfig read_inefficiency(const config::ConfigManager& config) {
    InefficiencyConfig c;
    c.momentum_window = config.get_value<size_t>("inefficiency.momentum_window", c.momentum_window);
    c.momentum_threshold = config.get_value<double>("inefficiency.momentum_threshold", c.momentum_threshold);
    c.momentum_confidence = config.get_value<double>("inefficiency.momentum_confidence", c.momentum_confidence);
    c.mean_reversion_z = config.get_value<double>("inefficiency.mean_reversion_z", c.mean_reversion_z);
    c.mean_reversion_confidence = config.get_value<double>("inefficiency.mean_reversion_confidence", c.mean_reversion_confidence);
    c.pair_min_correlation = config.get_value<double>("inefficiency.pair_min_correlation", c.pair_min_correlation);
    c.divergence_ratio = config.get_value<double>("inefficiency.divergence_ratio", c.divergence_ratio);
    c.arbitrage_confidence = config.get_value<double>("inefficiency.arbitrage_confidence", c.arbitrage_confidence);
    c.detect_mispricing = config.get_value<bool>("inefficiency.detect_mispricing", c.detect_mispricing);
    c.mispricing_low = config.get_value<double>("inefficiency.mispricing_low", c.mispricing_low);
    c.mispricing_high = config.get_value<double>("inefficiency.mispricing_high", c.mispricing_high);
    c.mispricing_confidence = config.get_value<double>("inefficiency.mispricing_confidence", c.mispricing_confidence);
    c.residual_min_correlation = config.get_value<double>("inefficiency.residual_min_correlation", c.residual_min_correlation);
    c.residual_min_points = config.get_value<size_t>("inefficiency.residual_min_points", c.residual_min_points);
    c.residual_z_threshold = config.get_value<double>("inefficiency.residual_z_threshold", c.residual_z_threshold);
    c.residual_medium_z = config.get_value<double>("inefficiency.residual_medium_z", c.residual_medium_z);
    c.residual_high_z = config.get_value<double>("inefficiency.residual_high_z", c.residual_high_z);
    c.spread_tolerance = config.get_value<double>("inefficiency.spread_tolerance", c.spread_tolerance);
    c.spread_medium_deviation = config.get_value<double>("inefficiency.spread_medium_deviation", c.spread_medium_deviation);
    c.spread_high_deviation = config.get_value<double>("inefficiency.spread_high_deviation", c.spread_high_deviation);
    c.low_confidence = config.get_value<double>("inefficiency.low_confidence", c.low_confidence);
    c.medium_confidence = config.get_value<double>("inefficiency.medium_confidence", c.medium_confidence);
    c.high_confidence = config.get_value<double>("inefficiency.high_confidence", c.high_confidence);
    return c;
}

ConsistencyConfig read_consistency(const config::ConfigManager& config) {
    ConsistencyConfig c;
    c.overround_limit = config.get_value<double>("consistency.overround_limit", c.overround_limit);
    c.underround_limit = config.get_value<double>("consistency.underround_limit", c.underround_limit);
    c.parity_tolerance = config.get_value<double>("consistency.parity_tolerance", c.parity_tolerance);
    c.term_structure_tolerance = config.get_value<double>("consistency.term_structure_tolerance", c.term_structure_tolerance);
    c.wide_spread = config.get_value<double>("consistency.wide_spread", c.wide_spread);
    c.thin_liquidity = config.get_value<double>("consistency.thin_liquidity", c.thin_liquidity);
    c.stale_minutes = config.get_value<double>("consistency.stale_minutes", c.stale_minutes);
    c.max_findings = config.get_value<size_t>("consistency.max_findings", c.max_findings);
    return c;
}

HedgeConfig read_hedge(const config::ConfigManager& config) {
    HedgeConfig c;
    c.correlation_weight = config.get_value<double>("hedge.correlation_weight", c.correlation_weight);
    c.weight_presets = config.get_value<std::vector<double>>("hedge.weight_presets", c.weight_presets);
    c.risk_cap = config.get_value<double>("hedge.risk_cap", c.risk_cap);
    c.min_entry_price = config.get_value<double>("hedge.min_entry_price", c.min_entry_price);
    c.hedge_correlation = config.get_value<double>("hedge.hedge_correlation", c.hedge_correlation);
    c.hedge_confidence = config.get_value<double>("hedge.hedge_confidence", c.hedge_confidence);
    c.spread_trade_correlation = config.get_value<double>("hedge.spread_trade_correlation", c.spread_trade_correlation);
    c.spread_trade_confidence = config.get_value<double>("hedge.spread_trade_confidence", c.spread_trade_confidence);
    c.max_suggestions = config.get_value<size_t>("hedge.max_suggestions", c.max_suggestions);
    c.entry_trigger_ratio = config.get_value<double>("hedge.entry_trigger_ratio", c.entry_trigger_ratio);
    c.take_profit_ratio = config.get_value<double>("hedge.take_profit_ratio", c.take_profit_ratio);
    c.stop_loss_ratio = config.get_value<double>("hedge.stop_loss_ratio", c.stop_loss_ratio);
    c.unwind_days_before_resolution = config.get_value<double>("hedge.unwind_days_before_resolution",
                                                               c.unwind_days_before_resolution);
    return c;
}

PayoffConfig read_payoff(const config::ConfigManager& config) {
    PayoffConfig c;
    c.probability_step = config.get_value<double>("payoff.probability_step", c.probability_step);
    c.horizons_days = config.get_value<std::vector<double>>("payoff.horizons_days", c.horizons_days);
    c.min_half_life_days = config.get_value<double>("payoff.min_half_life_days", c.min_half_life_days);
    return c;
}

ExecutionConfig read_execution(const config::ConfigManager& config) {
    ExecutionConfig c;
    c.synthetic_levels = config.get_value<size_t>("execution.synthetic_levels", c.synthetic_levels);
    c.tick_ratio = config.get_value<double>("execution.tick_ratio", c.tick_ratio);
    c.min_tick = config.get_value<double>("execution.min_tick", c.min_tick);
    c.min_base_size = config.get_value<double>("execution.min_base_size", c.min_base_size);
    c.liquidity_size_ratio = config.get_value<double>("execution.liquidity_size_ratio", c.liquidity_size_ratio);
    c.size_growth = config.get_value<double>("execution.size_growth", c.size_growth);
    c.min_price = config.get_value<double>("execution.min_price", c.min_price);
    c.max_price = config.get_value<double>("execution.max_price", c.max_price);
    return c;
}

} // namespace

AnalyticsConfig load_analytics_config(const config::ConfigManager& config) {
    AnalyticsConfig analytics;
    analytics.orderbook = read_orderbook(config);
    analytics.alignment = read_alignment(config);
    analytics.correlation = read_correlation(config);
    analytics.metrics = read_metrics(config);
    analytics.inefficiency = read_inefficiency(config);
    analytics.consistency = read_consistency(config);
    analytics.hedge = read_hedge(config);
    analytics.payoff = read_payoff(config);
    analytics.execution = read_execution(config);
    analytics.engine.worker_threads = config.get_value<size_t>("engine.worker_threads", analytics.engine.worker_threads);

    utils::Logger::debug("Analytics config loaded: top_levels={}, alignment={}, risk_cap={}, workers={}",
                         analytics.orderbook.top_levels, to_string(analytics.alignment.mode),
                         analytics.hedge.risk_cap, analytics.engine.worker_threads);
    return analytics;
}

std::string to_string(AlignmentMode mode) {
    switch (mode) {
        case AlignmentMode::EXACT: return "exact";
        case AlignmentMode::NEAREST: return "nearest";
        default: return "exact";
    }
}

} // namespace analytics
} // namespace pmx
