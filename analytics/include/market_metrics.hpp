#pragma once

#include "types/common_types.hpp"
#include "core/result.hpp"
#include "analytics_config.hpp"
#include "orderbook_features.hpp"
#include <optional>
#include <string>
#include <vector>

namespace pmx {
namespace analytics {

enum class TrendRegime {
    UPTREND,
    DOWNTREND,
    SIDEWAYS,
    VOLATILE
};

struct MarketMetrics {
    types::Price latest_price;
    double volatility;        // Population stddev of simple returns
    double momentum;          // Relative change over the momentum window
    double max_drawdown;
    double health_score;      // [0, 1]
    TrendRegime regime;
    double trend_strength;    // [0, 1]

    MarketMetrics()
        : latest_price(0), volatility(0), momentum(0), max_drawdown(0)
        , health_score(0), regime(TrendRegime::SIDEWAYS), trend_strength(0) {}
};

struct SeriesValue {
    types::Timestamp timestamp;
    double value;

    SeriesValue(types::Timestamp ts, double v) : timestamp(ts), value(v) {}
};

struct BollingerBand {
    types::Timestamp timestamp;
    double upper;
    double middle;
    double lower;

    BollingerBand(types::Timestamp ts, double u, double m, double l)
        : timestamp(ts), upper(u), middle(m), lower(l) {}
};

class MarketMetricsCalculator {
public:
    explicit MarketMetricsCalculator(const MetricsConfig& config = MetricsConfig());

    // Needs at least two valid points. The book, when given, contributes its bid depth to the health score.
    Result<MarketMetrics> compute(const types::PriceSeries& series,
                                  const std::optional<OrderbookFeatures>& book = std::nullopt) const;

    // Window statistics; empty when the series is shorter than the window
    std::vector<SeriesValue> rolling_volatility(const types::PriceSeries& series) const;
    std::vector<SeriesValue> moving_average(const types::PriceSeries& series) const;
    std::vector<BollingerBand> bollinger_bands(const types::PriceSeries& series) const;

    // (last - first) / first over the trailing window, 0 when first <= 0
    static double momentum(const std::vector<double>& prices, size_t window);

    const MetricsConfig& config() const { return config_; }

private:
    MetricsConfig config_;

    TrendRegime classify(double volatility, double momentum) const;
};

std::string to_string(TrendRegime regime);

} // namespace analytics
} // namespace pmx
