#pragma once

#include "types/common_types.hpp"
#include "core/result.hpp"
#include "utils/thread_pool.hpp"
#include "analytics_config.hpp"
#include "time_series.hpp"
#include <optional>
#include <string>
#include <vector>

namespace pmx {
namespace analytics {

enum class LeadLagDirection {
    LEADS,   // A moves first
    LAGS,    // B moves first
    NONE
};

enum class ConfidenceLevel {
    HIGH,
    MEDIUM,
    LOW
};

struct LeadLag {
    LeadLagDirection direction;
    size_t lag_periods;
    double correlation;   // Correlation at the reported lag

    LeadLag() : direction(LeadLagDirection::NONE), lag_periods(0), correlation(0) {}
};

struct CorrelationEdge {
    types::MarketId token_a;
    types::MarketId token_b;
    double correlation;
    LeadLag lead_lag;
    double p_value;
    ConfidenceLevel confidence;
    size_t sample_size;

    CorrelationEdge() : correlation(0), p_value(1.0), confidence(ConfidenceLevel::LOW), sample_size(0) {}

    bool touches(const types::MarketId& market) const {
        return token_a == market || token_b == market;
    }

    const types::MarketId& other(const types::MarketId& market) const {
        return token_a == market ? token_b : token_a;
    }
};

struct RollingCorrelationPoint {
    types::Timestamp timestamp;
    double correlation;

    RollingCorrelationPoint(types::Timestamp ts, double r) : timestamp(ts), correlation(r) {}
};

class CorrelationAnalyzer {
public:
    explicit CorrelationAnalyzer(const CorrelationConfig& config = CorrelationConfig(),
                                 const AlignmentConfig& alignment = AlignmentConfig());

    static double pearson(const std::vector<double>& a, const std::vector<double>& b);

    // Lags searched in the order 0, +1, -1, +2, -2, ...; a later lag wins only on strictly
    // larger absolute correlation. Positive lag pairs a[i] with b[i + lag].
    LeadLag lead_lag(const std::vector<double>& a, const std::vector<double>& b) const;

    // Bucketed two-sided p-value from t = r * sqrt((n - 2) / (1 - r^2))
    static double p_value(double correlation, size_t sample_size);

    ConfidenceLevel confidence(double correlation, double p_value) const;

    Result<CorrelationEdge> analyze_pair(const types::MarketHistory& a, const types::MarketHistory& b) const;

    Result<std::vector<RollingCorrelationPoint>> rolling_correlation(const types::MarketHistory& a,
                                                                     const types::MarketHistory& b) const;

    // All i < j pairs in (i, j) order. A failing pair keeps its slot.
    std::vector<BatchSlot<CorrelationEdge>> compute_matrix(const std::vector<types::MarketHistory>& histories,
                                                           utils::ThreadPool* pool = nullptr) const;

    const CorrelationConfig& config() const { return config_; }
    const TimeSeriesAligner& aligner() const { return aligner_; }

private:
    CorrelationConfig config_;
    TimeSeriesAligner aligner_;

    Result<AlignedSeries> aligned_pair(const types::MarketHistory& a, const types::MarketHistory& b) const;
};

// Edge between two markets in either orientation
std::optional<CorrelationEdge> find_edge(const std::vector<CorrelationEdge>& edges,
                                         const types::MarketId& a, const types::MarketId& b);

// Successful edges of a matrix, in slot order
std::vector<CorrelationEdge> successful_edges(const std::vector<BatchSlot<CorrelationEdge>>& slots);

std::string to_string(LeadLagDirection direction);
std::string to_string(ConfidenceLevel level);

} // namespace analytics
} // namespace pmx
