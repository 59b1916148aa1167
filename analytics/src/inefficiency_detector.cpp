#include "inefficiency_detector.hpp"
#include "market_metrics.hpp"
#include "utils/logger.hpp"
#include "utils/stats_utils.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace pmx {
namespace analytics {

namespace {

const types::MarketHistory* find_history(const std::vector<types::MarketHistory>& histories,
                                         const types::MarketId& id) {
    for (const auto& history : histories) {
        if (history.market_id == id) {
            return &history;
        }
    }
    return nullptr;
}

std::string fixed(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

} // namespace

InefficiencyDetector::InefficiencyDetector(const InefficiencyConfig& config, const AlignmentConfig& alignment)
    : config_(config), aligner_(alignment) {
}

std::optional<InefficiencySignal> InefficiencyDetector::momentum_signal(const types::MarketHistory& primary) const {
    const auto prices = prices_of(primary.prices);
    const size_t span = std::min(config_.momentum_window, prices.size());
    if (span < 2 || prices[prices.size() - span] <= 0) {
        return std::nullopt;
    }

    const double momentum = MarketMetricsCalculator::momentum(prices, config_.momentum_window);
    if (std::fabs(momentum) <= config_.momentum_threshold) {
        return std::nullopt;
    }

    InefficiencySignal signal;
    signal.type = SignalType::MOMENTUM;
    signal.primary_market = primary.market_id;
    signal.score = std::fabs(momentum);
    signal.confidence = config_.momentum_confidence;
    signal.description = std::string("Strong ") + (momentum > 0 ? "bullish" : "bearish") +
                         " momentum detected (" + fixed(momentum * 100.0, 1) + "%)";
    return signal;
}

std::optional<InefficiencySignal> InefficiencyDetector::mean_reversion_signal(const types::MarketHistory& primary) const {
    const auto prices = prices_of(primary.prices);
    const double mean = utils::stats::mean(prices);
    const double sd = utils::stats::population_stddev(prices);
    if (sd <= 0) {
        return std::nullopt;
    }

    const double z = utils::stats::z_score(prices.back(), mean, sd);
    if (std::fabs(z) <= config_.mean_reversion_z) {
        return std::nullopt;
    }

    InefficiencySignal signal;
    signal.type = SignalType::MEAN_REVERSION;
    signal.primary_market = primary.market_id;
    signal.score = std::min(1.0, std::fabs(z) / 3.0);
    signal.confidence = config_.mean_reversion_confidence;
    signal.description = "Price is " + fixed(std::fabs(z), 1) + " standard deviations " +
                         (z > 0 ? "above" : "below") + " its mean";
    return signal;
}

std::optional<InefficiencySignal> InefficiencyDetector::divergence_signal(const types::MarketHistory& primary,
                                                                          const types::MarketHistory& related,
                                                                          double correlation) const {
    const AlignedSeries aligned = aligner_.align(primary.prices, related.prices);
    if (aligned.empty()) {
        return std::nullopt;
    }

    const double recent_diff = std::fabs(aligned.a.back() - aligned.b.back());
    double total_diff = 0.0;
    for (size_t i = 0; i < aligned.size(); ++i) {
        total_diff += std::fabs(aligned.a[i] - aligned.b[i]);
    }
    const double avg_diff = total_diff / static_cast<double>(aligned.size());

    if (!std::isfinite(avg_diff) || !std::isfinite(recent_diff) || avg_diff <= 0 ||
        recent_diff <= config_.divergence_ratio * avg_diff) {
        return std::nullopt;
    }

    InefficiencySignal signal;
    signal.type = SignalType::ARBITRAGE;
    signal.primary_market = primary.market_id;
    signal.related_market = related.market_id;
    signal.score = std::max(0.0, (recent_diff / avg_diff - 1.0) / 2.0);
    signal.confidence = config_.arbitrage_confidence;
    signal.description = "Divergence detected with correlated market (" +
                         fixed(correlation * 100.0, 0) + "% correlation)";
    return signal;
}

std::optional<InefficiencySignal> InefficiencyDetector::mispricing_signal(const types::MarketHistory& primary) const {
    if (!config_.detect_mispricing || primary.prices.empty()) {
        return std::nullopt;
    }

    const double latest = primary.prices.back().price;
    double score = 0.0;
    if (latest < config_.mispricing_low && config_.mispricing_low > 0) {
        score = (config_.mispricing_low - latest) / config_.mispricing_low;
    } else if (latest > config_.mispricing_high && config_.mispricing_high < 1) {
        score = (latest - config_.mispricing_high) / (1.0 - config_.mispricing_high);
    } else {
        return std::nullopt;
    }

    InefficiencySignal signal;
    signal.type = SignalType::MISPRICING;
    signal.primary_market = primary.market_id;
    signal.score = utils::stats::clamp(score, 0.0, 1.0);
    signal.confidence = config_.mispricing_confidence;
    signal.description = "Extreme price " + fixed(latest, 3) + " may over-state certainty";
    return signal;
}

std::optional<InefficiencySignal> InefficiencyDetector::residual_divergence_signal(const types::MarketHistory& a,
                                                                                   const types::MarketHistory& b) const {
    const AlignedSeries aligned = aligner_.align(a.prices, b.prices);
    const size_t n = aligned.size();
    if (n < std::max<size_t>(config_.residual_min_points, 2)) {
        return std::nullopt;
    }

    const double correlation = utils::stats::pearson(aligned.a, aligned.b);
    if (std::fabs(correlation) < config_.residual_min_correlation) {
        return std::nullopt;
    }

    // Ordinary least squares of b on a
    double sum_x = 0.0, sum_y = 0.0, sum_xy = 0.0, sum_x2 = 0.0;
    for (size_t i = 0; i < n; ++i) {
        sum_x += aligned.a[i];
        sum_y += aligned.b[i];
        sum_xy += aligned.a[i] * aligned.b[i];
        sum_x2 += aligned.a[i] * aligned.a[i];
    }
    const double count = static_cast<double>(n);
    const double denominator = count * sum_x2 - sum_x * sum_x;
    if (!std::isfinite(denominator) || std::fabs(denominator) < 1e-15) {
        return std::nullopt;
    }
    const double slope = (count * sum_xy - sum_x * sum_y) / denominator;
    const double intercept = (sum_y - slope * sum_x) / count;

    std::vector<double> residuals;
    residuals.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        residuals.push_back(aligned.b[i] - (slope * aligned.a[i] + intercept));
    }

    const double sd = utils::stats::population_stddev(residuals);
    if (!std::isfinite(sd) || sd <= 1e-12) {
        return std::nullopt;
    }
    const double z = utils::stats::z_score(residuals.back(), utils::stats::mean(residuals), sd);
    if (std::fabs(z) <= config_.residual_z_threshold) {
        return std::nullopt;
    }

    InefficiencySignal signal;
    signal.type = SignalType::DIVERGENCE;
    signal.primary_market = a.market_id;
    signal.related_market = b.market_id;
    signal.score = std::min(1.0, std::fabs(z) / 3.0);
    signal.confidence = std::fabs(z) > config_.residual_high_z ? config_.high_confidence
                      : std::fabs(z) > config_.residual_medium_z ? config_.medium_confidence
                      : config_.low_confidence;
    signal.description = std::string(z > 0 ? "Positive" : "Negative") + " divergence from " + b.market_id +
                         ": latest residual is " + fixed(std::fabs(z), 1) +
                         " standard deviations from the fitted relation (r = " + fixed(correlation, 2) + ")";
    return signal;
}

std::optional<InefficiencySignal> InefficiencyDetector::complement_spread_signal(const types::MarketHistory& a,
                                                                                 const types::MarketHistory& b) const {
    if (a.prices.empty() || b.prices.empty()) {
        return std::nullopt;
    }

    const double sum = a.prices.back().price + b.prices.back().price;
    const double deviation = std::fabs(sum - 1.0);
    if (!std::isfinite(deviation) || deviation <= config_.spread_tolerance) {
        return std::nullopt;
    }

    InefficiencySignal signal;
    signal.type = SignalType::SPREAD;
    signal.primary_market = a.market_id;
    signal.related_market = b.market_id;
    signal.score = std::min(1.0, deviation);
    signal.confidence = deviation > config_.spread_high_deviation ? config_.high_confidence
                      : deviation > config_.spread_medium_deviation ? config_.medium_confidence
                      : config_.low_confidence;
    signal.description = "Complementary prices sum to " + fixed(sum * 100.0, 0) + "c (expected 100c)";
    return signal;
}

Result<SignalList> InefficiencyDetector::detect_pair(const types::MarketHistory& a,
                                                     const types::MarketHistory& b) const {
    for (const auto* history : {&a, &b}) {
        auto valid = validate_series(history->prices, history->market_id);
        if (valid.is_error()) {
            return Result<SignalList>::error(valid.error());
        }
    }

    SignalList signals;
    if (auto signal = residual_divergence_signal(a, b)) {
        signals.push_back(*signal);
    }
    if (auto signal = complement_spread_signal(a, b)) {
        signals.push_back(*signal);
    }

    for (const auto& signal : signals) {
        utils::AnalyticsLogger::log_signal_detected(to_string(signal.type), signal.primary_market,
                                                    signal.related_market.value_or(""),
                                                    signal.score, signal.confidence);
    }
    return Result<SignalList>::success(std::move(signals));
}

Result<SignalList> InefficiencyDetector::detect(const types::MarketHistory& primary,
                                                const std::vector<CorrelationEdge>& edges,
                                                const std::vector<types::MarketHistory>& peers) const {
    auto valid = validate_series(primary.prices, primary.market_id);
    if (valid.is_error()) {
        return Result<SignalList>::error(valid.error());
    }
    if (primary.prices.size() < 2) {
        return Result<SignalList>::error(ErrorKind::INSUFFICIENT_DATA,
            "inefficiency detection needs at least 2 points for " + primary.market_id);
    }

    SignalList signals;

    if (auto signal = momentum_signal(primary)) {
        signals.push_back(*signal);
    }

    if (auto signal = mean_reversion_signal(primary)) {
        signals.push_back(*signal);
    }

    for (const auto& edge : edges) {
        if (!edge.touches(primary.market_id) || edge.correlation <= config_.pair_min_correlation) {
            continue;
        }

        const auto& related_id = edge.other(primary.market_id);
        const types::MarketHistory* related = find_history(peers, related_id);
        if (related == nullptr || related->prices.empty()) {
            utils::Logger::debug("No history for correlated market {}, skipping pair check", related_id);
            continue;
        }
        auto related_valid = validate_series(related->prices, related_id);
        if (related_valid.is_error()) {
            utils::Logger::debug("Invalid history for correlated market {}, skipping pair check: {}",
                                 related_id, related_valid.error().message);
            continue;
        }

        if (auto signal = divergence_signal(primary, *related, edge.correlation)) {
            signals.push_back(*signal);
        }
    }

    if (auto signal = mispricing_signal(primary)) {
        signals.push_back(*signal);
    }

    for (const auto& signal : signals) {
        utils::AnalyticsLogger::log_signal_detected(to_string(signal.type), signal.primary_market,
                                                    signal.related_market.value_or(""),
                                                    signal.score, signal.confidence);
    }

    return Result<SignalList>::success(std::move(signals));
}

std::vector<BatchSlot<SignalList>> InefficiencyDetector::scan(const std::vector<types::MarketHistory>& markets,
                                                              const std::vector<CorrelationEdge>& edges,
                                                              utils::ThreadPool* pool) const {
    PMX_SCOPED_TIMER("inefficiency_scan");

    auto detect_one = [this, &markets, &edges](size_t i) {
        return BatchSlot<SignalList>(markets[i].market_id, detect(markets[i], edges, markets));
    };

    std::vector<BatchSlot<SignalList>> slots;
    if (pool != nullptr && pool->is_running()) {
        slots = pool->map_indexed(markets.size(), detect_one);
    } else {
        slots.reserve(markets.size());
        for (size_t i = 0; i < markets.size(); ++i) {
            slots.push_back(detect_one(i));
        }
    }

    for (const auto& slot : slots) {
        if (slot.outcome.is_error()) {
            utils::AnalyticsLogger::log_batch_item_failed("inefficiency_scan", slot.item_id,
                to_string(slot.outcome.error().kind), slot.outcome.error().message);
        }
    }
    return slots;
}

std::string to_string(SignalType type) {
    switch (type) {
        case SignalType::MOMENTUM: return "momentum";
        case SignalType::MEAN_REVERSION: return "meanReversion";
        case SignalType::ARBITRAGE: return "arbitrage";
        case SignalType::MISPRICING: return "mispricing";
        case SignalType::DIVERGENCE: return "divergence";
        case SignalType::SPREAD: return "spread";
        default: return "unknown";
    }
}

} // namespace analytics
} // namespace pmx
