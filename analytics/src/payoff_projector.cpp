#include "payoff_projector.hpp"
#include "utils/logger.hpp"
#include "utils/stats_utils.hpp"
#include <cmath>

namespace pmx {
namespace analytics {

using types::MarketInfo;
using types::OrderSide;
using types::Outcome;

namespace {

const MarketInfo* find_market(const std::vector<MarketInfo>& markets, const types::MarketId& id) {
    for (const auto& market : markets) {
        if (market.id == id) {
            return &market;
        }
    }
    return nullptr;
}

double signed_for(const StrategyLeg& leg, double value) {
    return leg.side == OrderSide::SELL ? -value : value;
}

// Legs whose market is known, paired with that market; unknown ones are logged and dropped
std::vector<std::pair<const StrategyLeg*, const MarketInfo*>> resolve_legs(const Strategy& strategy,
                                                                          const std::vector<MarketInfo>& markets) {
    std::vector<std::pair<const StrategyLeg*, const MarketInfo*>> resolved;
    for (const auto& leg : strategy.legs) {
        const MarketInfo* market = find_market(markets, leg.market_id);
        if (market == nullptr) {
            utils::Logger::warn("Skipping leg on unknown market {}", leg.market_id);
            continue;
        }
        resolved.emplace_back(&leg, market);
    }
    return resolved;
}

} // namespace

PayoffProjector::PayoffProjector(const PayoffConfig& config)
    : config_(config) {
}

double PayoffProjector::leg_expected_value(const StrategyLeg& leg, double p_yes) {
    const double p_win = leg.outcome == Outcome::YES ? p_yes : 1.0 - p_yes;
    const double ev = leg.size * (p_win * (1.0 - leg.price) + (1.0 - p_win) * (-leg.price));
    return signed_for(leg, ev);
}

double PayoffProjector::leg_settlement_value(const StrategyLeg& leg, Outcome resolved) {
    const double value = leg.outcome == resolved ? leg.size * (1.0 - leg.price) : -leg.size * leg.price;
    return signed_for(leg, value);
}

std::vector<double> PayoffProjector::probability_grid() const {
    double step = config_.probability_step;
    if (!std::isfinite(step) || step <= 0.0 || step > 1.0) {
        step = PayoffConfig().probability_step;
    }

    const size_t count = static_cast<size_t>(std::ceil(1.0 / step - 1e-9));
    std::vector<double> grid;
    grid.reserve(count + 1);
    for (size_t i = 0; i < count; ++i) {
        grid.push_back(static_cast<double>(i) * step);
    }
    grid.push_back(1.0);
    return grid;
}

Result<std::vector<PayoffPoint>> PayoffProjector::ev_curve(const Strategy& strategy,
                                                           const std::vector<MarketInfo>& markets) const {
    using Curve = std::vector<PayoffPoint>;

    if (strategy.legs.empty()) {
        return Result<Curve>::error(ErrorKind::INSUFFICIENT_DATA, "strategy has no legs");
    }
    const MarketInfo* primary = find_market(markets, strategy.primary_market_id);
    if (primary == nullptr) {
        return Result<Curve>::error(ErrorKind::UPSTREAM_DATA_GAP,
            "primary market " + strategy.primary_market_id + " missing for payoff curve");
    }

    const auto legs = resolve_legs(strategy, markets);
    const double w = strategy.correlation_weight;

    Curve curve;
    for (double p_true : probability_grid()) {
        double total = 0.0;
        for (const auto& [leg, market] : legs) {
            const double p_adj = leg->market_id == strategy.primary_market_id
                ? p_true
                : utils::stats::clamp(market->yes_mid + (p_true - primary->yes_mid) * w, 0.0, 1.0);
            total += leg_expected_value(*leg, p_adj);
        }
        curve.emplace_back(p_true, total);
    }
    return Result<Curve>::success(std::move(curve));
}

Result<std::vector<TimeDecayRow>> PayoffProjector::time_decay(const Strategy& strategy,
                                                              const std::vector<MarketInfo>& markets,
                                                              double belief, double half_life_days) const {
    using Rows = std::vector<TimeDecayRow>;

    if (strategy.legs.empty()) {
        return Result<Rows>::error(ErrorKind::INSUFFICIENT_DATA, "strategy has no legs");
    }
    if (!std::isfinite(belief) || !std::isfinite(half_life_days)) {
        return Result<Rows>::error(ErrorKind::INVALID_INPUT, "belief and half-life must be finite");
    }

    const double target = utils::stats::clamp(belief, 0.0, 1.0);
    const double half_life = std::max(config_.min_half_life_days, half_life_days);
    const auto legs = resolve_legs(strategy, markets);

    Rows rows;
    rows.reserve(config_.horizons_days.size());
    for (double days : config_.horizons_days) {
        TimeDecayRow row;
        row.horizon_days = days;
        row.multiplier = std::pow(2.0, -days / half_life);

        for (const auto& [leg, market] : legs) {
            TimeDecayLeg cell;
            cell.market_id = leg->market_id;
            cell.outcome = leg->outcome;
            cell.mid = market->yes_mid;
            cell.expected_price = target + (cell.mid - target) * row.multiplier;

            const double move = cell.expected_price - cell.mid;
            const double mtm = leg->size * (leg->outcome == Outcome::YES ? move : -move);
            cell.mark_to_market = signed_for(*leg, mtm);

            row.total += cell.mark_to_market;
            row.legs.push_back(cell);
        }
        rows.push_back(std::move(row));
    }
    return Result<Rows>::success(std::move(rows));
}

std::vector<SettlementScenario> PayoffProjector::settlement_grid(const Strategy& strategy) const {
    std::vector<SettlementScenario> grid;
    if (strategy.legs.size() < 2) {
        return grid;
    }

    const StrategyLeg& first = strategy.legs[0];
    const StrategyLeg& second = strategy.legs[1];

    // Probability each market resolves YES, read off the entry prices
    auto p_yes = [](const StrategyLeg& leg) {
        return leg.outcome == Outcome::YES ? leg.price : 1.0 - leg.price;
    };

    for (Outcome a : {Outcome::YES, Outcome::NO}) {
        for (Outcome b : {Outcome::YES, Outcome::NO}) {
            const double prob_a = a == Outcome::YES ? p_yes(first) : 1.0 - p_yes(first);
            const double prob_b = b == Outcome::YES ? p_yes(second) : 1.0 - p_yes(second);
            grid.emplace_back(a, b, prob_a * prob_b,
                              leg_settlement_value(first, a) + leg_settlement_value(second, b));
        }
    }
    return grid;
}

Result<Strategy> PayoffProjector::project(const Strategy& strategy, const std::vector<MarketInfo>& markets,
                                          double belief, double half_life_days) const {
    auto curve = ev_curve(strategy, markets);
    if (curve.is_error()) {
        return Result<Strategy>::error(curve.error());
    }
    auto decay = time_decay(strategy, markets, belief, half_life_days);
    if (decay.is_error()) {
        return Result<Strategy>::error(decay.error());
    }

    Strategy projected = strategy;
    projected.payoff_curve = std::move(curve.value());
    projected.time_decay = std::move(decay.value());
    projected.settlement_grid = settlement_grid(strategy);

    utils::Logger::debug("Projected {} payoff points and {} horizons for {}",
                         projected.payoff_curve.size(), projected.time_decay.size(), strategy.primary_market_id);
    return Result<Strategy>::success(std::move(projected));
}

} // namespace analytics
} // namespace pmx
