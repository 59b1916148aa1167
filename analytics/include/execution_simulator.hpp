#pragma once

#include "types/common_types.hpp"
#include "core/result.hpp"
#include "analytics_config.hpp"
#include "strategy_types.hpp"
#include <vector>

namespace pmx {
namespace analytics {

struct ExecutionEstimate {
    types::MarketId market_id;
    types::Outcome outcome;
    types::OrderSide side;
    types::Quantity requested;
    types::Quantity filled;
    types::Price vwap;
    types::Price mid;
    double slippage;            // vwap - mid, 0 when nothing filled
    bool partial_fill;
    types::Quantity shortfall;
    bool synthetic_depth;       // True when no real book was available

    ExecutionEstimate()
        : outcome(types::Outcome::YES), side(types::OrderSide::BUY), requested(0), filled(0)
        , vwap(0), mid(0), slippage(0), partial_fill(false), shortfall(0), synthetic_depth(false) {}
};

// Result of walking one side of a book
struct FillSummary {
    types::Quantity filled;
    types::Amount cost;

    FillSummary() : filled(0), cost(0) {}

    types::Price vwap() const { return filled > 0 ? cost / filled : 0.0; }
};

class ExecutionSimulator {
public:
    explicit ExecutionSimulator(const ExecutionConfig& config = ExecutionConfig());

    // Deterministic ladder around the mid, used when no real book is supplied
    types::OrderBook synthetic_depth(types::Price mid, types::Amount liquidity) const;

    // Greedy fill over levels in the order given
    static FillSummary walk_levels(const std::vector<types::OrderBookLevel>& levels, types::Quantity size);

    Result<ExecutionEstimate> simulate(const StrategyLeg& leg, const types::MarketInfo& market) const;

    // One slot per leg, in leg order. Legs on markets missing from the list fail their slot.
    std::vector<BatchSlot<ExecutionEstimate>> simulate_all(const Strategy& strategy,
                                                           const std::vector<types::MarketInfo>& markets) const;

    const ExecutionConfig& config() const { return config_; }

private:
    ExecutionConfig config_;
};

} // namespace analytics
} // namespace pmx
