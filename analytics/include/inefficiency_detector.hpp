#pragma once

#include "types/common_types.hpp"
#include "core/result.hpp"
#include "utils/thread_pool.hpp"
#include "analytics_config.hpp"
#include "correlation_analyzer.hpp"
#include "time_series.hpp"
#include <optional>
#include <string>
#include <vector>

namespace pmx {
namespace analytics {

enum class SignalType {
    MOMENTUM,
    MEAN_REVERSION,
    ARBITRAGE,
    MISPRICING,
    DIVERGENCE,     // Latest residual of B regressed on A is an outlier
    SPREAD          // Complementary pair prices do not sum to 1
};

struct InefficiencySignal {
    SignalType type;
    types::MarketId primary_market;
    std::optional<types::MarketId> related_market;
    double score;
    double confidence;
    std::string description;

    InefficiencySignal() : type(SignalType::MOMENTUM), score(0), confidence(0) {}
};

using SignalList = std::vector<InefficiencySignal>;

class InefficiencyDetector {
public:
    explicit InefficiencyDetector(const InefficiencyConfig& config = InefficiencyConfig(),
                                  const AlignmentConfig& alignment = AlignmentConfig());

    // Signals for one market, in the order momentum, mean reversion, pair divergence, mispricing.
    // Edges not touching the primary are ignored; peers without a history are skipped.
    Result<SignalList> detect(const types::MarketHistory& primary,
                              const std::vector<CorrelationEdge>& edges = {},
                              const std::vector<types::MarketHistory>& peers = {}) const;

    // Runs detect for every market against the others. One slot per market, in input order.
    // Pair checks for two markets the caller treats as linked: residual divergence, then
    // complementary spread. Both histories must be valid.
    Result<SignalList> detect_pair(const types::MarketHistory& a, const types::MarketHistory& b) const;

    std::vector<BatchSlot<SignalList>> scan(const std::vector<types::MarketHistory>& markets,
                                            const std::vector<CorrelationEdge>& edges,
                                            utils::ThreadPool* pool = nullptr) const;

    std::optional<InefficiencySignal> momentum_signal(const types::MarketHistory& primary) const;
    std::optional<InefficiencySignal> mean_reversion_signal(const types::MarketHistory& primary) const;
    std::optional<InefficiencySignal> divergence_signal(const types::MarketHistory& primary,
                                                        const types::MarketHistory& related,
                                                        double correlation) const;
    std::optional<InefficiencySignal> mispricing_signal(const types::MarketHistory& primary) const;
    std::optional<InefficiencySignal> residual_divergence_signal(const types::MarketHistory& a,
                                                                 const types::MarketHistory& b) const;
    std::optional<InefficiencySignal> complement_spread_signal(const types::MarketHistory& a,
                                                               const types::MarketHistory& b) const;

    const InefficiencyConfig& config() const { return config_; }

private:
    InefficiencyConfig config_;
    TimeSeriesAligner aligner_;
};

std::string to_string(SignalType type);

} // namespace analytics
} // namespace pmx
