#include "correlation_analyzer.hpp"
#include "utils/logger.hpp"
#include "utils/stats_utils.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <utility>

namespace pmx {
namespace analytics {

namespace {

// Absolute correlation gain a later lag needs to replace the current best
constexpr double kLagImprovementEpsilon = 1e-12;

std::pair<std::vector<double>, std::vector<double>> shifted(const std::vector<double>& a,
                                                            const std::vector<double>& b,
                                                            int lag) {
    const size_t n = std::min(a.size(), b.size());
    const size_t shift = static_cast<size_t>(std::abs(lag));
    std::vector<double> xs;
    std::vector<double> ys;
    if (shift >= n) {
        return {xs, ys};
    }

    xs.reserve(n - shift);
    ys.reserve(n - shift);
    for (size_t i = 0; i + shift < n; ++i) {
        if (lag >= 0) {
            xs.push_back(a[i]);
            ys.push_back(b[i + shift]);
        } else {
            xs.push_back(a[i + shift]);
            ys.push_back(b[i]);
        }
    }
    return {xs, ys};
}

} // namespace

CorrelationAnalyzer::CorrelationAnalyzer(const CorrelationConfig& config, const AlignmentConfig& alignment)
    : config_(config), aligner_(alignment) {
}

double CorrelationAnalyzer::pearson(const std::vector<double>& a, const std::vector<double>& b) {
    return utils::stats::pearson(a, b);
}

LeadLag CorrelationAnalyzer::lead_lag(const std::vector<double>& a, const std::vector<double>& b) const {
    const size_t n = std::min(a.size(), b.size());
    const int max_lag = static_cast<int>(std::min(config_.max_lag, n / 2));

    int best_lag = 0;
    double best_correlation = pearson(a, b);
    const double lag_zero_correlation = best_correlation;

    for (int step = 1; step <= max_lag; ++step) {
        for (int lag : {step, -step}) {
            auto [xs, ys] = shifted(a, b, lag);
            const double r = pearson(xs, ys);
            if (std::fabs(r) > std::fabs(best_correlation) + kLagImprovementEpsilon) {
                best_correlation = r;
                best_lag = lag;
            }
        }
    }

    LeadLag result;
    if (static_cast<size_t>(std::abs(best_lag)) < config_.min_lag_to_report) {
        result.direction = LeadLagDirection::NONE;
        result.lag_periods = 0;
        result.correlation = lag_zero_correlation;
    } else {
        result.direction = best_lag > 0 ? LeadLagDirection::LEADS : LeadLagDirection::LAGS;
        result.lag_periods = static_cast<size_t>(std::abs(best_lag));
        result.correlation = best_correlation;
    }
    return result;
}

double CorrelationAnalyzer::p_value(double correlation, size_t sample_size) {
    if (sample_size < 3) return 1.0;

    const double r_squared = correlation * correlation;
    const double df = static_cast<double>(sample_size - 2);
    const double abs_t = r_squared >= 1.0
        ? std::numeric_limits<double>::infinity()
        : std::fabs(correlation * std::sqrt(df / (1.0 - r_squared)));

    if (abs_t > 3.0) return 0.01;
    if (abs_t > 2.5) return 0.02;
    if (abs_t > 2.0) return 0.05;
    if (abs_t > 1.5) return 0.10;
    return 0.20;
}

ConfidenceLevel CorrelationAnalyzer::confidence(double correlation, double p_value) const {
    const double magnitude = std::fabs(correlation);
    if (magnitude > config_.high_confidence_correlation && p_value < config_.high_confidence_p_value) {
        return ConfidenceLevel::HIGH;
    }
    if (magnitude > config_.medium_confidence_correlation && p_value < config_.medium_confidence_p_value) {
        return ConfidenceLevel::MEDIUM;
    }
    return ConfidenceLevel::LOW;
}

Result<AlignedSeries> CorrelationAnalyzer::aligned_pair(const types::MarketHistory& a,
                                                        const types::MarketHistory& b) const {
    auto check_a = validate_series(a.prices, a.market_id);
    if (check_a.is_error()) {
        return Result<AlignedSeries>::error(check_a.error());
    }
    auto check_b = validate_series(b.prices, b.market_id);
    if (check_b.is_error()) {
        return Result<AlignedSeries>::error(check_b.error());
    }

    AlignedSeries aligned = aligner_.align(a.prices, b.prices);
    if (aligned.size() < 2) {
        return Result<AlignedSeries>::error(ErrorKind::INSUFFICIENT_DATA,
            std::to_string(aligned.size()) + " aligned points between " + a.market_id + " and " + b.market_id);
    }
    return Result<AlignedSeries>::success(std::move(aligned));
}

Result<CorrelationEdge> CorrelationAnalyzer::analyze_pair(const types::MarketHistory& a,
                                                          const types::MarketHistory& b) const {
    return aligned_pair(a, b).and_then([&](const AlignedSeries& aligned) {
        CorrelationEdge edge;
        edge.token_a = a.market_id;
        edge.token_b = b.market_id;
        edge.sample_size = aligned.size();
        edge.correlation = pearson(aligned.a, aligned.b);
        edge.lead_lag = lead_lag(aligned.a, aligned.b);
        edge.p_value = p_value(edge.correlation, edge.sample_size);
        edge.confidence = confidence(edge.correlation, edge.p_value);
        return Result<CorrelationEdge>::success(std::move(edge));
    });
}

Result<std::vector<RollingCorrelationPoint>> CorrelationAnalyzer::rolling_correlation(
    const types::MarketHistory& a, const types::MarketHistory& b) const {
    using Rolling = std::vector<RollingCorrelationPoint>;

    const size_t window = config_.rolling_window;
    return aligned_pair(a, b).and_then([window](const AlignedSeries& aligned) {
        if (window < 2 || aligned.size() < window) {
            return Result<Rolling>::error(ErrorKind::INSUFFICIENT_DATA,
                "rolling window " + std::to_string(window) + " needs at least that many aligned points, have " +
                std::to_string(aligned.size()));
        }

        Rolling points;
        points.reserve(aligned.size() - window + 1);
        for (size_t end = window; end <= aligned.size(); ++end) {
            std::vector<double> xs(aligned.a.begin() + static_cast<std::ptrdiff_t>(end - window),
                                   aligned.a.begin() + static_cast<std::ptrdiff_t>(end));
            std::vector<double> ys(aligned.b.begin() + static_cast<std::ptrdiff_t>(end - window),
                                   aligned.b.begin() + static_cast<std::ptrdiff_t>(end));
            points.emplace_back(aligned.timestamps[end - 1], utils::stats::pearson(xs, ys));
        }
        return Result<Rolling>::success(std::move(points));
    });
}

std::vector<BatchSlot<CorrelationEdge>> CorrelationAnalyzer::compute_matrix(
    const std::vector<types::MarketHistory>& histories, utils::ThreadPool* pool) const {
    PMX_SCOPED_TIMER("correlation_matrix");

    std::vector<std::pair<size_t, size_t>> pairs;
    for (size_t i = 0; i < histories.size(); ++i) {
        for (size_t j = i + 1; j < histories.size(); ++j) {
            pairs.emplace_back(i, j);
        }
    }

    auto compute = [this, &pairs, &histories](size_t k) {
        const auto& a = histories[pairs[k].first];
        const auto& b = histories[pairs[k].second];
        return BatchSlot<CorrelationEdge>(a.market_id + "|" + b.market_id, analyze_pair(a, b));
    };

    std::vector<BatchSlot<CorrelationEdge>> slots;
    if (pool != nullptr && pool->is_running()) {
        slots = pool->map_indexed(pairs.size(), compute);
    } else {
        slots.reserve(pairs.size());
        for (size_t k = 0; k < pairs.size(); ++k) {
            slots.push_back(compute(k));
        }
    }

    size_t failed = 0;
    for (const auto& slot : slots) {
        if (slot.outcome.is_error()) {
            ++failed;
            utils::AnalyticsLogger::log_batch_item_failed("correlation_matrix", slot.item_id,
                to_string(slot.outcome.error().kind), slot.outcome.error().message);
        }
    }
    utils::Logger::debug("Correlation matrix: {} markets, {} pairs, {} failed",
                         histories.size(), slots.size(), failed);
    return slots;
}

std::optional<CorrelationEdge> find_edge(const std::vector<CorrelationEdge>& edges,
                                         const types::MarketId& a, const types::MarketId& b) {
    for (const auto& edge : edges) {
        if ((edge.token_a == a && edge.token_b == b) || (edge.token_a == b && edge.token_b == a)) {
            return edge;
        }
    }
    return std::nullopt;
}

std::vector<CorrelationEdge> successful_edges(const std::vector<BatchSlot<CorrelationEdge>>& slots) {
    std::vector<CorrelationEdge> edges;
    for (const auto& slot : slots) {
        if (slot.outcome.is_success()) {
            edges.push_back(slot.outcome.value());
        }
    }
    return edges;
}

std::string to_string(LeadLagDirection direction) {
    switch (direction) {
        case LeadLagDirection::LEADS: return "leads";
        case LeadLagDirection::LAGS: return "lags";
        case LeadLagDirection::NONE: return "none";
        default: return "none";
    }
}

std::string to_string(ConfidenceLevel level) {
    switch (level) {
        case ConfidenceLevel::HIGH: return "high";
        case ConfidenceLevel::MEDIUM: return "medium";
        case ConfidenceLevel::LOW: return "low";
        default: return "low";
    }
}

} // namespace analytics
} // namespace pmx
