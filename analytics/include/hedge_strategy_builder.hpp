#pragma once

#include "types/common_types.hpp"
#include "core/result.hpp"
#include "analytics_config.hpp"
#include "correlation_analyzer.hpp"
#include "inefficiency_detector.hpp"
#include "strategy_types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace pmx {
namespace analytics {

struct HedgeRequest {
    types::MarketId primary_market_id;
    std::vector<types::MarketInfo> markets;   // Primary plus candidates
    StrategyView view;
    double correlation_weight;
    SizingMode sizing_mode;
    double size;
    double risk_cap;
    std::vector<CorrelationEdge> correlations;
    std::vector<InefficiencySignal> signals;

    HedgeRequest()
        : view(StrategyView::BULLISH), correlation_weight(0.5), sizing_mode(SizingMode::SHARES)
        , size(0), risk_cap(1500) {}
};

enum class HedgeKind {
    HEDGE,          // Negatively correlated, offsets the primary
    SPREAD_TRADE    // Highly correlated and currently diverging
};

struct HedgeSuggestion {
    types::MarketId market_id;
    HedgeKind kind;
    double correlation;
    double hedge_ratio;
    double confidence;
    std::string rationale;

    HedgeSuggestion() : kind(HedgeKind::HEDGE), correlation(0), hedge_ratio(0), confidence(0) {}
};

class HedgeStrategyBuilder {
public:
    explicit HedgeStrategyBuilder(const HedgeConfig& config = HedgeConfig());

    // Legs and rationale only; payoff and time decay are filled in by PayoffProjector
    Result<Strategy> build(const HedgeRequest& request) const;

    // Candidates ranked by confidence (stable), at most max_suggestions
    std::vector<HedgeSuggestion> suggest_hedges(const types::MarketId& primary_id,
                                                const std::vector<types::MarketInfo>& candidates,
                                                const std::vector<CorrelationEdge>& correlations,
                                                const std::vector<InefficiencySignal>& signals) const;

    // The same request built once per configured weight preset, slot ids "w=0.3" and so on
    std::vector<BatchSlot<Strategy>> build_weight_presets(const HedgeRequest& request) const;

    // Request seeded from the configured weight and risk cap
    HedgeRequest default_request() const;

    const HedgeConfig& config() const { return config_; }

private:
    HedgeConfig config_;

    Result<bool> validate(const HedgeRequest& request, const types::MarketInfo& primary) const;

    std::optional<types::MarketInfo> relative_alternative(const types::MarketInfo& primary,
                                                          const std::vector<types::MarketInfo>& candidates) const;

    void append_hedge_leg(const HedgeRequest& request, const types::MarketInfo& primary,
                          const std::vector<types::MarketInfo>& candidates, Strategy& strategy) const;

    // Entry, take-profit and stop-loss on the primary leg, plus an unwind when the
    // resolution horizon is known
    void append_triggers(const types::MarketInfo& primary, Strategy& strategy) const;
};

std::string to_string(HedgeKind kind);

} // namespace analytics
} // namespace pmx
