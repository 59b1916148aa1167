#include "hedge_strategy_builder.hpp"
#include "utils/logger.hpp"
#include "utils/stats_utils.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace pmx {
namespace analytics {

using types::MarketInfo;
using types::OrderSide;
using types::Outcome;

namespace {

Outcome opposite(Outcome outcome) {
    return outcome == Outcome::YES ? Outcome::NO : Outcome::YES;
}

std::string percent_whole(double ratio) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(0) << ratio * 100.0 << "%";
    return oss.str();
}

const InefficiencySignal* find_pair_signal(const std::vector<InefficiencySignal>& signals,
                                           const types::MarketId& primary_id,
                                           const types::MarketId& related_id,
                                           std::optional<SignalType> type) {
    for (const auto& signal : signals) {
        if (signal.primary_market == primary_id && signal.related_market == related_id &&
            (!type || signal.type == *type)) {
            return &signal;
        }
    }
    return nullptr;
}

} // namespace

HedgeStrategyBuilder::HedgeStrategyBuilder(const HedgeConfig& config)
    : config_(config) {
}

HedgeRequest HedgeStrategyBuilder::default_request() const {
    HedgeRequest request;
    request.correlation_weight = config_.correlation_weight;
    request.risk_cap = config_.risk_cap;
    return request;
}

Result<bool> HedgeStrategyBuilder::validate(const HedgeRequest& request, const MarketInfo& primary) const {
    const double w = request.correlation_weight;
    if (!std::isfinite(w) || w <= 0.0 || w >= 1.0) {
        return Result<bool>::error(ErrorKind::INVALID_INPUT, "correlation weight must be in (0, 1)");
    }
    if (!std::isfinite(request.size) || request.size < 0.0) {
        return Result<bool>::error(ErrorKind::INVALID_INPUT, "size must be finite and non-negative");
    }
    if (!std::isfinite(request.risk_cap) || request.risk_cap <= 0.0) {
        return Result<bool>::error(ErrorKind::INVALID_INPUT, "risk cap must be positive");
    }
    if (!types::is_valid_probability(primary.yes_mid) || !types::is_valid_probability(primary.no_mid)) {
        return Result<bool>::error(ErrorKind::INVALID_INPUT, "primary mids must be in [0, 1] for " + primary.id);
    }
    return Result<bool>::success(true);
}

Result<Strategy> HedgeStrategyBuilder::build(const HedgeRequest& request) const {
    if (request.primary_market_id.empty()) {
        return Result<Strategy>::error(ErrorKind::UPSTREAM_DATA_GAP, "no primary market selected");
    }

    auto primary_it = std::find_if(request.markets.begin(), request.markets.end(),
                                   [&](const MarketInfo& m) { return m.id == request.primary_market_id; });
    if (primary_it == request.markets.end()) {
        return Result<Strategy>::error(ErrorKind::UPSTREAM_DATA_GAP,
            "primary market " + request.primary_market_id + " missing from request");
    }
    const MarketInfo& primary = *primary_it;

    auto valid = validate(request, primary);
    if (valid.is_error()) {
        return Result<Strategy>::error(valid.error());
    }

    std::vector<MarketInfo> candidates;
    for (const auto& market : request.markets) {
        if (market.id == primary.id) continue;
        if (!types::is_valid_probability(market.yes_mid) || !types::is_valid_probability(market.no_mid)) {
            utils::Logger::warn("Ignoring candidate {} with invalid mids", market.id);
            continue;
        }
        candidates.push_back(market);
    }

    const Outcome primary_outcome = request.view == StrategyView::BULLISH ? Outcome::YES : Outcome::NO;
    const double entry_price = std::max(config_.min_entry_price, primary.mid_for(primary_outcome));
    const double requested = request.sizing_mode == SizingMode::NOTIONAL ? request.size / entry_price : request.size;
    const double capped = std::min(requested, request.risk_cap / entry_price);

    Strategy strategy;
    strategy.primary_market_id = primary.id;
    strategy.view = request.view;
    strategy.correlation_weight = request.correlation_weight;
    strategy.requested_shares = requested;
    strategy.capped_shares = capped;

    switch (request.view) {
        case StrategyView::BULLISH:
            strategy.legs.emplace_back(primary.id, primary.title, OrderSide::BUY, Outcome::YES,
                                       primary.yes_mid, capped, "Primary long YES");
            strategy.rationale.push_back("Primary long YES expresses bullish view.");
            break;

        case StrategyView::BEARISH:
            strategy.legs.emplace_back(primary.id, primary.title, OrderSide::BUY, Outcome::NO,
                                       primary.no_mid, capped, "Primary long NO");
            strategy.rationale.push_back("Primary long NO expresses bearish view.");
            break;

        case StrategyView::RELATIVE: {
            auto alternative = relative_alternative(primary, candidates);
            if (!alternative) {
                return Result<Strategy>::error(ErrorKind::INSUFFICIENT_DATA,
                    "relative view needs an alternative market for " + primary.id);
            }
            strategy.legs.emplace_back(primary.id, primary.title, OrderSide::BUY, Outcome::NO,
                                       primary.no_mid, capped, "Fade primary");
            strategy.legs.emplace_back(alternative->id, alternative->title, OrderSide::BUY, Outcome::YES,
                                       alternative->yes_mid, capped * request.correlation_weight,
                                       "Pair with higher-liquidity alternative");
            strategy.rationale.push_back("Relative structure: fade primary, pair with higher-liquidity alternative.");
            strategy.rationale.push_back("Hedge size scaled by correlation weight.");
            break;
        }
    }

    if (capped < requested) {
        strategy.rationale.push_back("Sizing capped by risk budget: " + utils::format::usd(request.risk_cap) +
                                     " allows " + utils::format::price(capped) + " primary shares.");
    } else {
        strategy.rationale.push_back("Requested size fits within risk budget.");
    }

    if (strategy.legs.size() == 1 && !candidates.empty()) {
        append_hedge_leg(request, primary, candidates, strategy);
    }

    // The cap bounds the primary leg only; hedge legs are sized on top of it
    const double primary_cost = strategy.legs.front().cost();
    const double total_cost = strategy.capital_at_risk();
    if (total_cost > request.risk_cap) {
        strategy.rationale.push_back("Hedge legs add " + utils::format::usd(total_cost - primary_cost) +
                                     " at risk beyond the primary cap; total " +
                                     utils::format::usd(total_cost) + ".");
    }

    append_triggers(primary, strategy);

    utils::AnalyticsLogger::log_strategy_built(primary.id, to_string(request.view), strategy.legs.size(),
                                               capped, strategy.capital_at_risk());
    return Result<Strategy>::success(std::move(strategy));
}

std::vector<BatchSlot<Strategy>> HedgeStrategyBuilder::build_weight_presets(const HedgeRequest& request) const {
    std::vector<BatchSlot<Strategy>> slots;
    slots.reserve(config_.weight_presets.size());

    for (double weight : config_.weight_presets) {
        HedgeRequest variant = request;
        variant.correlation_weight = weight;

        std::ostringstream id;
        id << "w=" << weight;
        slots.emplace_back(id.str(), build(variant));
    }
    return slots;
}

std::optional<MarketInfo> HedgeStrategyBuilder::relative_alternative(const MarketInfo& primary,
                                                                     const std::vector<MarketInfo>& candidates) const {
    const MarketInfo* best_in_cluster = nullptr;
    const MarketInfo* best_overall = nullptr;

    for (const auto& candidate : candidates) {
        if (best_overall == nullptr || candidate.liquidity > best_overall->liquidity) {
            best_overall = &candidate;
        }
        if (!primary.cluster_key.empty() && candidate.cluster_key == primary.cluster_key &&
            (best_in_cluster == nullptr || candidate.liquidity > best_in_cluster->liquidity)) {
            best_in_cluster = &candidate;
        }
    }

    if (best_in_cluster != nullptr) return *best_in_cluster;
    if (best_overall != nullptr) return *best_overall;
    return std::nullopt;
}

void HedgeStrategyBuilder::append_hedge_leg(const HedgeRequest& request, const MarketInfo& primary,
                                            const std::vector<MarketInfo>& candidates, Strategy& strategy) const {
    const double hedge_size = strategy.capped_shares * request.correlation_weight;
    const Outcome primary_outcome = strategy.legs.front().outcome;

    if (!request.correlations.empty()) {
        auto suggestions = suggest_hedges(primary.id, candidates, request.correlations, request.signals);
        if (!suggestions.empty()) {
            const HedgeSuggestion& top = suggestions.front();
            auto market = std::find_if(candidates.begin(), candidates.end(),
                                       [&](const MarketInfo& m) { return m.id == top.market_id; });
            if (market != candidates.end()) {
                // Negative correlation hedges with the same outcome, positive with the opposite one
                const Outcome outcome = top.correlation < 0 ? primary_outcome : opposite(primary_outcome);
                strategy.legs.emplace_back(market->id, market->title, OrderSide::BUY, outcome,
                                           market->mid_for(outcome), hedge_size, top.rationale);

                std::ostringstream why;
                why << "Hedge leg chosen from correlation analysis (" << to_string(top.kind)
                    << ", r = " << std::fixed << std::setprecision(2) << top.correlation << ").";
                strategy.rationale.push_back(why.str());
                return;
            }
        }
    }

    const MarketInfo* best = nullptr;
    for (const auto& candidate : candidates) {
        if (best == nullptr || candidate.yes_mid > best->yes_mid) {
            best = &candidate;
        }
    }
    if (best == nullptr) return;

    strategy.legs.emplace_back(best->id, best->title, OrderSide::BUY, Outcome::YES,
                               best->yes_mid, hedge_size, "Hedge with top alternative");
    strategy.rationale.push_back("Hedge leg chosen from top alternative in the cluster.");
}

void HedgeStrategyBuilder::append_triggers(const MarketInfo& primary, Strategy& strategy) const {
    const StrategyLeg& leg = strategy.legs.front();
    const std::string outcome = leg.outcome == Outcome::YES ? "YES" : "NO";

    StrategyTrigger entry;
    entry.type = TriggerType::ENTRY;
    entry.market_id = primary.id;
    entry.price_level = std::min(1.0, leg.price * config_.entry_trigger_ratio);
    entry.condition = "Enter when primary " + outcome + " price is at or below " +
                      utils::format::price(*entry.price_level);
    strategy.triggers.push_back(entry);

    StrategyTrigger take_profit;
    take_profit.type = TriggerType::TAKE_PROFIT;
    take_profit.market_id = primary.id;
    take_profit.price_level = std::min(1.0, leg.price * config_.take_profit_ratio);
    take_profit.condition = "Take profit at " + percent_whole(config_.take_profit_ratio - 1.0) + " gain";
    strategy.triggers.push_back(take_profit);

    StrategyTrigger stop_loss;
    stop_loss.type = TriggerType::STOP_LOSS;
    stop_loss.market_id = primary.id;
    stop_loss.price_level = leg.price * config_.stop_loss_ratio;
    stop_loss.condition = "Stop loss at " + percent_whole(1.0 - config_.stop_loss_ratio) + " loss";
    strategy.triggers.push_back(stop_loss);

    if (primary.resolution_horizon_days > 0) {
        StrategyTrigger unwind;
        unwind.type = TriggerType::UNWIND;
        unwind.market_id = primary.id;
        unwind.days_before_resolution = config_.unwind_days_before_resolution;

        std::ostringstream condition;
        condition << "Unwind " << config_.unwind_days_before_resolution << " days before resolution";
        unwind.condition = condition.str();
        strategy.triggers.push_back(unwind);
    }
}

std::vector<HedgeSuggestion> HedgeStrategyBuilder::suggest_hedges(const types::MarketId& primary_id,
                                                                  const std::vector<MarketInfo>& candidates,
                                                                  const std::vector<CorrelationEdge>& correlations,
                                                                  const std::vector<InefficiencySignal>& signals) const {
    std::vector<HedgeSuggestion> suggestions;

    for (const auto& candidate : candidates) {
        if (candidate.id == primary_id) continue;

        auto edge = find_edge(correlations, primary_id, candidate.id);
        if (!edge) continue;

        const double r = edge->correlation;
        if (r < config_.hedge_correlation) {
            HedgeSuggestion suggestion;
            suggestion.market_id = candidate.id;
            suggestion.kind = HedgeKind::HEDGE;
            suggestion.correlation = r;
            suggestion.hedge_ratio = std::fabs(r);
            suggestion.confidence = config_.hedge_confidence;
            suggestion.rationale = "Negative correlation (" + percent_whole(r) + ") provides downside protection";

            if (const auto* signal = find_pair_signal(signals, primary_id, candidate.id, std::nullopt)) {
                suggestion.rationale += ". " + to_string(signal->type) + " opportunity (score: " +
                                        utils::format::price(signal->score) + ")";
            }
            suggestions.push_back(std::move(suggestion));
        } else if (r > config_.spread_trade_correlation &&
                   find_pair_signal(signals, primary_id, candidate.id, SignalType::ARBITRAGE) != nullptr) {
            HedgeSuggestion suggestion;
            suggestion.market_id = candidate.id;
            suggestion.kind = HedgeKind::SPREAD_TRADE;
            suggestion.correlation = r;
            suggestion.hedge_ratio = 1.0;
            suggestion.confidence = config_.spread_trade_confidence;
            suggestion.rationale = "High correlation (" + percent_whole(r) +
                                   ") with divergence detected - spread trade opportunity";
            suggestions.push_back(std::move(suggestion));
        }
    }

    std::stable_sort(suggestions.begin(), suggestions.end(),
                     [](const HedgeSuggestion& a, const HedgeSuggestion& b) { return a.confidence > b.confidence; });
    if (suggestions.size() > config_.max_suggestions) {
        suggestions.resize(config_.max_suggestions);
    }
    return suggestions;
}

std::string to_string(StrategyView view) {
    switch (view) {
        case StrategyView::BULLISH: return "bullish";
        case StrategyView::BEARISH: return "bearish";
        case StrategyView::RELATIVE: return "relative";
        default: return "bullish";
    }
}

std::string to_string(SizingMode mode) {
    switch (mode) {
        case SizingMode::SHARES: return "shares";
        case SizingMode::NOTIONAL: return "notional";
        default: return "shares";
    }
}

std::string to_string(TriggerType type) {
    switch (type) {
        case TriggerType::ENTRY: return "entry";
        case TriggerType::TAKE_PROFIT: return "take_profit";
        case TriggerType::STOP_LOSS: return "stop_loss";
        case TriggerType::UNWIND: return "unwind";
        default: return "entry";
    }
}

std::string to_string(HedgeKind kind) {
    switch (kind) {
        case HedgeKind::HEDGE: return "hedge";
        case HedgeKind::SPREAD_TRADE: return "spread trade";
        default: return "hedge";
    }
}

} // namespace analytics
} // namespace pmx
