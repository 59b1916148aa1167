#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "config/config_manager.hpp"

namespace pmx {
namespace analytics {

struct OrderbookConfig {
    size_t top_levels;
    double small_order_size;
    double medium_order_size;
    double large_order_size;
    double very_tight_spread_percent;
    double tight_spread_percent;
    double moderate_spread_percent;
    double imbalance_threshold;
    double deep_book_depth;
    double adequate_book_depth;
    double high_slippage_threshold;
    bool reject_crossed_books;

    OrderbookConfig()
        : top_levels(10), small_order_size(100), medium_order_size(500), large_order_size(1000)
        , very_tight_spread_percent(0.5), tight_spread_percent(2.0), moderate_spread_percent(5.0)
        , imbalance_threshold(0.3), deep_book_depth(1000), adequate_book_depth(100)
        , high_slippage_threshold(0.05), reject_crossed_books(false) {}
};

enum class AlignmentMode {
    EXACT,
    NEAREST
};

struct AlignmentConfig {
    AlignmentMode mode;
    int64_t tolerance_ms;

    AlignmentConfig() : mode(AlignmentMode::EXACT), tolerance_ms(60000) {}
};

struct CorrelationConfig {
    size_t max_lag;
    size_t min_lag_to_report;
    size_t rolling_window;
    double high_confidence_correlation;
    double high_confidence_p_value;
    double medium_confidence_correlation;
    double medium_confidence_p_value;

    CorrelationConfig()
        : max_lag(5), min_lag_to_report(2), rolling_window(10)
        , high_confidence_correlation(0.7), high_confidence_p_value(0.05)
        , medium_confidence_correlation(0.5), medium_confidence_p_value(0.10) {}
};

struct MetricsConfig {
    size_t momentum_window;
    size_t rolling_window;
    double bollinger_multiplier;
    double low_volatility;
    double low_drawdown;
    double healthy_bid_depth;
    double volatile_regime;
    double trend_threshold;

    MetricsConfig()
        : momentum_window(10), rolling_window(20), bollinger_multiplier(2.0)
        , low_volatility(0.1), low_drawdown(0.1), healthy_bid_depth(100)
        , volatile_regime(0.15), trend_threshold(0.05) {}
};

struct InefficiencyConfig {
    size_t momentum_window;
    double momentum_threshold;
    double momentum_confidence;
    double mean_reversion_z;
    double mean_reversion_confidence;
    double pair_min_correlation;
    double divergence_ratio;
    double arbitrage_confidence;
    bool detect_mispricing;
    double mispricing_low;
    double mispricing_high;
    double mispricing_confidence;
    // Pair checks: regression residual and complementary spread
    double residual_min_correlation;
    size_t residual_min_points;
    double residual_z_threshold;
    double residual_medium_z;
    double residual_high_z;
    double spread_tolerance;
    double spread_medium_deviation;
    double spread_high_deviation;
    double low_confidence;
    double medium_confidence;
    double high_confidence;

    InefficiencyConfig()
        : momentum_window(10), momentum_threshold(0.1), momentum_confidence(0.7)
        , mean_reversion_z(1.5), mean_reversion_confidence(0.6)
        , pair_min_correlation(0.7), divergence_ratio(1.5), arbitrage_confidence(0.8)
        , detect_mispricing(true), mispricing_low(0.05), mispricing_high(0.95)
        , mispricing_confidence(0.3)
        , residual_min_correlation(0.5), residual_min_points(3), residual_z_threshold(2.0)
        , residual_medium_z(2.5), residual_high_z(3.0)
        , spread_tolerance(0.05), spread_medium_deviation(0.07), spread_high_deviation(0.10)
        , low_confidence(0.4), medium_confidence(0.6), high_confidence(0.8) {}
};

struct ConsistencyConfig {
    double overround_limit;
    double underround_limit;
    double parity_tolerance;
    double term_structure_tolerance;
    double wide_spread;
    double thin_liquidity;
    double stale_minutes;
    size_t max_findings;

    ConsistencyConfig()
        : overround_limit(1.03), underround_limit(0.97), parity_tolerance(0.04)
        , term_structure_tolerance(0.01), wide_spread(0.05), thin_liquidity(60000)
        , stale_minutes(15), max_findings(6) {}
};

struct HedgeConfig {
    double correlation_weight;
    std::vector<double> weight_presets;
    double risk_cap;
    double min_entry_price;
    double hedge_correlation;
    double hedge_confidence;
    double spread_trade_correlation;
    double spread_trade_confidence;
    size_t max_suggestions;
    // Trigger levels as multiples of the primary entry price
    double entry_trigger_ratio;
    double take_profit_ratio;
    double stop_loss_ratio;
    double unwind_days_before_resolution;

    HedgeConfig()
        : correlation_weight(0.5), weight_presets{0.3, 0.5, 0.7}, risk_cap(1500)
        , min_entry_price(0.01), hedge_correlation(-0.3), hedge_confidence(0.6)
        , spread_trade_correlation(0.7), spread_trade_confidence(0.8), max_suggestions(5)
        , entry_trigger_ratio(1.05), take_profit_ratio(1.25), stop_loss_ratio(0.85)
        , unwind_days_before_resolution(7) {}
};

struct PayoffConfig {
    double probability_step;
    std::vector<double> horizons_days;
    double min_half_life_days;

    PayoffConfig() : probability_step(0.05), horizons_days{7, 30, 90, 180}, min_half_life_days(1) {}
};

struct ExecutionConfig {
    size_t synthetic_levels;
    double tick_ratio;
    double min_tick;
    double min_base_size;
    double liquidity_size_ratio;
    double size_growth;
    double min_price;
    double max_price;

    ExecutionConfig()
        : synthetic_levels(5), tick_ratio(0.02), min_tick(0.0001), min_base_size(1000)
        , liquidity_size_ratio(0.08), size_growth(0.35), min_price(0.0001), max_price(1.0) {}
};

struct EngineConfig {
    size_t worker_threads;

    EngineConfig() : worker_threads(0) {}
};

struct AnalyticsConfig {
    OrderbookConfig orderbook;
    AlignmentConfig alignment;
    CorrelationConfig correlation;
    MetricsConfig metrics;
    InefficiencyConfig inefficiency;
    ConsistencyConfig consistency;
    HedgeConfig hedge;
    PayoffConfig payoff;
    ExecutionConfig execution;
    EngineConfig engine;
};

// Read every analytics section from the configuration, keeping defaults for absent keys
AnalyticsConfig load_analytics_config(const config::ConfigManager& config);

std::string to_string(AlignmentMode mode);

} // namespace analytics
} // namespace pmx
