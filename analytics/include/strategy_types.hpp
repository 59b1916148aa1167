#pragma once

#include "types/common_types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace pmx {
namespace analytics {

enum class StrategyView {
    BULLISH,
    BEARISH,
    RELATIVE
};

enum class SizingMode {
    SHARES,
    NOTIONAL
};

struct StrategyLeg {
    types::MarketId market_id;
    std::string market_title;
    types::OrderSide side;
    types::Outcome outcome;
    types::Price price;
    types::Quantity size;
    std::string rationale;

    StrategyLeg() : side(types::OrderSide::BUY), outcome(types::Outcome::YES), price(0), size(0) {}
    StrategyLeg(types::MarketId id, std::string title, types::OrderSide s, types::Outcome o,
                types::Price p, types::Quantity q, std::string why)
        : market_id(std::move(id)), market_title(std::move(title)), side(s), outcome(o)
        , price(p), size(q), rationale(std::move(why)) {}

    // Capital spent entering the leg
    types::Amount cost() const { return price * size; }
};

struct PayoffPoint {
    double p_true;
    double expected_value;

    PayoffPoint(double p, double ev) : p_true(p), expected_value(ev) {}
};

struct TimeDecayLeg {
    types::MarketId market_id;
    types::Outcome outcome;
    types::Price mid;              // Current YES mid of the leg's market
    types::Price expected_price;   // Projected YES price at the horizon
    double mark_to_market;

    TimeDecayLeg() : outcome(types::Outcome::YES), mid(0), expected_price(0), mark_to_market(0) {}
};

struct TimeDecayRow {
    double horizon_days;
    double multiplier;
    std::vector<TimeDecayLeg> legs;
    double total;

    TimeDecayRow() : horizon_days(0), multiplier(1), total(0) {}
};

// One cell of the two-leg resolution grid
struct SettlementScenario {
    types::Outcome first_outcome;
    types::Outcome second_outcome;
    double probability;
    double pnl;

    SettlementScenario(types::Outcome first, types::Outcome second, double prob, double value)
        : first_outcome(first), second_outcome(second), probability(prob), pnl(value) {}
};

enum class TriggerType {
    ENTRY,
    TAKE_PROFIT,
    STOP_LOSS,
    UNWIND
};

// Price levels are in the traded outcome's price, not the YES price
struct StrategyTrigger {
    TriggerType type;
    types::MarketId market_id;
    std::optional<types::Price> price_level;
    std::optional<double> days_before_resolution;
    std::string condition;

    StrategyTrigger() : type(TriggerType::ENTRY) {}
};

struct Strategy {
    types::MarketId primary_market_id;
    StrategyView view;
    double correlation_weight;
    double requested_shares;
    double capped_shares;
    std::vector<StrategyLeg> legs;
    std::vector<PayoffPoint> payoff_curve;
    std::vector<TimeDecayRow> time_decay;
    std::vector<SettlementScenario> settlement_grid;
    std::vector<StrategyTrigger> triggers;
    std::vector<std::string> rationale;

    Strategy() : view(StrategyView::BULLISH), correlation_weight(0.5), requested_shares(0), capped_shares(0) {}

    types::Amount capital_at_risk() const {
        types::Amount total = 0;
        for (const auto& leg : legs) {
            total += leg.cost();
        }
        return total;
    }
};

std::string to_string(StrategyView view);
std::string to_string(SizingMode mode);
std::string to_string(TriggerType type);

} // namespace analytics
} // namespace pmx
