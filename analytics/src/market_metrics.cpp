#include "market_metrics.hpp"
#include "time_series.hpp"
#include "utils/stats_utils.hpp"
#include <algorithm>
#include <cmath>

namespace pmx {
namespace analytics {

namespace {

// Prices of series[end - window, end)
std::vector<double> window_prices(const types::PriceSeries& series, size_t end, size_t window) {
    std::vector<double> prices;
    prices.reserve(window);
    for (size_t i = end - window; i < end; ++i) {
        prices.push_back(series[i].price);
    }
    return prices;
}

} // namespace

MarketMetricsCalculator::MarketMetricsCalculator(const MetricsConfig& config)
    : config_(config) {
}

double MarketMetricsCalculator::momentum(const std::vector<double>& prices, size_t window) {
    if (prices.size() < 2 || window < 2) return 0.0;

    const size_t span = std::min(window, prices.size());
    const double first = prices[prices.size() - span];
    const double last = prices.back();
    if (first <= 0) return 0.0;
    return (last - first) / first;
}

Result<MarketMetrics> MarketMetricsCalculator::compute(const types::PriceSeries& series,
                                                       const std::optional<OrderbookFeatures>& book) const {
    auto valid = validate_series(series, "market metrics");
    if (valid.is_error()) {
        return Result<MarketMetrics>::error(valid.error());
    }
    if (series.size() < 2) {
        return Result<MarketMetrics>::error(ErrorKind::INSUFFICIENT_DATA, "market metrics need at least 2 points");
    }

    const std::vector<double> prices = prices_of(series);

    MarketMetrics metrics;
    metrics.latest_price = prices.back();
    metrics.volatility = utils::stats::population_stddev(utils::stats::simple_returns(prices));
    metrics.momentum = momentum(prices, config_.momentum_window);
    metrics.max_drawdown = utils::stats::max_drawdown(prices);

    double health = 0.5;
    if (metrics.volatility < config_.low_volatility) health += 0.2;
    if (metrics.max_drawdown < config_.low_drawdown) health += 0.15;
    if (book.has_value() && book->depth.bid > config_.healthy_bid_depth) health += 0.15;
    metrics.health_score = utils::stats::clamp(health, 0.0, 1.0);

    metrics.regime = classify(metrics.volatility, metrics.momentum);
    metrics.trend_strength = std::min(1.0, std::fabs(metrics.momentum) / (metrics.volatility + 0.01));

    return Result<MarketMetrics>::success(metrics);
}

TrendRegime MarketMetricsCalculator::classify(double volatility, double momentum) const {
    if (volatility > config_.volatile_regime) return TrendRegime::VOLATILE;
    if (momentum > config_.trend_threshold) return TrendRegime::UPTREND;
    if (momentum < -config_.trend_threshold) return TrendRegime::DOWNTREND;
    return TrendRegime::SIDEWAYS;
}

std::vector<SeriesValue> MarketMetricsCalculator::rolling_volatility(const types::PriceSeries& series) const {
    std::vector<SeriesValue> result;
    const size_t window = config_.rolling_window;
    if (window == 0 || series.size() < window) return result;

    for (size_t end = window; end <= series.size(); ++end) {
        auto returns = utils::stats::simple_returns(window_prices(series, end, window));
        result.emplace_back(series[end - 1].timestamp, utils::stats::population_stddev(returns));
    }
    return result;
}

std::vector<SeriesValue> MarketMetricsCalculator::moving_average(const types::PriceSeries& series) const {
    std::vector<SeriesValue> result;
    const size_t window = config_.rolling_window;
    if (window == 0 || series.size() < window) return result;

    for (size_t end = window; end <= series.size(); ++end) {
        result.emplace_back(series[end - 1].timestamp, utils::stats::mean(window_prices(series, end, window)));
    }
    return result;
}

std::vector<BollingerBand> MarketMetricsCalculator::bollinger_bands(const types::PriceSeries& series) const {
    std::vector<BollingerBand> result;
    const size_t window = config_.rolling_window;
    if (window == 0 || series.size() < window) return result;

    for (size_t end = window; end <= series.size(); ++end) {
        auto prices = window_prices(series, end, window);
        const double middle = utils::stats::mean(prices);
        const double width = config_.bollinger_multiplier * utils::stats::population_stddev(prices);
        result.emplace_back(series[end - 1].timestamp, middle + width, middle, middle - width);
    }
    return result;
}

std::string to_string(TrendRegime regime) {
    switch (regime) {
        case TrendRegime::UPTREND: return "uptrend";
        case TrendRegime::DOWNTREND: return "downtrend";
        case TrendRegime::SIDEWAYS: return "sideways";
        case TrendRegime::VOLATILE: return "volatile";
        default: return "sideways";
    }
}

} // namespace analytics
} // namespace pmx
