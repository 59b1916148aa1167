#include "trigger_backtester.hpp"
#include "time_series.hpp"
#include "utils/logger.hpp"
#include "utils/stats_utils.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>

namespace pmx {
namespace analytics {

using types::OrderSide;
using types::Outcome;

namespace {

constexpr double kMillisPerDay = 86400000.0;

const types::MarketHistory* find_history(const std::vector<types::MarketHistory>& histories,
                                         const types::MarketId& id) {
    for (const auto& history : histories) {
        if (history.market_id == id) {
            return &history;
        }
    }
    return nullptr;
}

std::vector<const StrategyTrigger*> triggers_for(const Strategy& strategy, const types::MarketId& market_id,
                                                 TriggerType type) {
    std::vector<const StrategyTrigger*> matches;
    for (const auto& trigger : strategy.triggers) {
        if (trigger.market_id == market_id && trigger.type == type) {
            matches.push_back(&trigger);
        }
    }
    return matches;
}

} // namespace

double TriggerBacktester::sharpe_ratio(const std::vector<double>& trade_pnls) {
    if (trade_pnls.empty()) {
        return 0.0;
    }
    const double average = utils::stats::mean(trade_pnls);
    const double sd = trade_pnls.size() > 1 ? utils::stats::population_stddev(trade_pnls) : 1.0;
    return sd > 0 ? average / sd : 0.0;
}

Result<BacktestReport> TriggerBacktester::run(const Strategy& strategy,
                                              const std::vector<types::MarketHistory>& histories,
                                              std::optional<types::Timestamp> resolution_time) const {
    if (strategy.legs.empty()) {
        return Result<BacktestReport>::error(ErrorKind::INSUFFICIENT_DATA, "strategy has no legs");
    }
    if (strategy.triggers.empty()) {
        return Result<BacktestReport>::error(ErrorKind::INSUFFICIENT_DATA, "strategy has no triggers");
    }

    PMX_SCOPED_TIMER("trigger_backtest");

    BacktestReport report;
    std::vector<double> trade_pnls;
    double cumulative = 0.0;

    for (const auto& leg : strategy.legs) {
        const auto entries = triggers_for(strategy, leg.market_id, TriggerType::ENTRY);
        if (entries.empty()) {
            continue;
        }

        const types::MarketHistory* history = find_history(histories, leg.market_id);
        if (history == nullptr || validate_series(history->prices, leg.market_id).is_error()) {
            utils::Logger::debug("No usable history for leg {}, skipping backtest", leg.market_id);
            report.skipped_legs.push_back(leg.market_id);
            continue;
        }

        const auto take_profits = triggers_for(strategy, leg.market_id, TriggerType::TAKE_PROFIT);
        const auto stop_losses = triggers_for(strategy, leg.market_id, TriggerType::STOP_LOSS);
        const auto unwinds = triggers_for(strategy, leg.market_id, TriggerType::UNWIND);

        std::optional<double> unwind_start;
        const StrategyTrigger* unwind = nullptr;
        if (resolution_time && !unwinds.empty() && unwinds.front()->days_before_resolution) {
            unwind = unwinds.front();
            unwind_start = static_cast<double>(*resolution_time) - *unwind->days_before_resolution * kMillisPerDay;
        }

        bool open = false;
        double entry_price = 0.0;

        for (const auto& point : history->prices) {
            const double price = leg.outcome == Outcome::YES ? point.price : 1.0 - point.price;
            const bool unwinding = unwind_start && static_cast<double>(point.timestamp) >= *unwind_start;

            if (!open) {
                if (unwinding) continue;
                for (const auto* trigger : entries) {
                    if (trigger->price_level && price <= *trigger->price_level) {
                        open = true;
                        entry_price = price;

                        BacktestEvent event;
                        event.timestamp = point.timestamp;
                        event.market_id = leg.market_id;
                        event.type = BacktestEventType::ENTRY;
                        event.trigger = TriggerType::ENTRY;
                        event.price = price;
                        event.cumulative_pnl = cumulative;
                        event.triggered_by = trigger->condition;
                        report.events.push_back(std::move(event));
                        break;
                    }
                }
                continue;
            }

            const StrategyTrigger* fired = nullptr;
            for (const auto* trigger : take_profits) {
                if (trigger->price_level && price >= *trigger->price_level && price > entry_price) {
                    fired = trigger;
                    break;
                }
            }
            if (fired == nullptr) {
                for (const auto* trigger : stop_losses) {
                    if (trigger->price_level && price <= *trigger->price_level && price < entry_price) {
                        fired = trigger;
                        break;
                    }
                }
            }
            if (fired == nullptr && unwinding) {
                fired = unwind;
            }
            if (fired == nullptr) {
                continue;
            }

            double pnl = (price - entry_price) * leg.size;
            if (leg.side == OrderSide::SELL) pnl = -pnl;
            cumulative += pnl;
            trade_pnls.push_back(pnl);
            open = false;

            BacktestEvent event;
            event.timestamp = point.timestamp;
            event.market_id = leg.market_id;
            event.type = BacktestEventType::EXIT;
            event.trigger = fired->type;
            event.price = price;
            event.pnl = pnl;
            event.cumulative_pnl = cumulative;
            event.triggered_by = fired->condition;
            report.events.push_back(std::move(event));
            report.trades++;
        }

        if (open) {
            report.open_positions++;
        }
    }

    std::vector<double> realized;
    std::copy_if(trade_pnls.begin(), trade_pnls.end(), std::back_inserter(realized),
                 [](double pnl) { return pnl != 0.0; });

    report.total_pnl = cumulative;
    report.sharpe_ratio = sharpe_ratio(realized);

    utils::AnalyticsLogger::log_performance_metric("backtest_total_pnl", report.total_pnl);
    utils::Logger::debug("Backtest for {}: {} trades, {} open, sharpe {:.3f}",
                         strategy.primary_market_id, report.trades, report.open_positions, report.sharpe_ratio);
    return Result<BacktestReport>::success(std::move(report));
}

std::string to_string(BacktestEventType type) {
    switch (type) {
        case BacktestEventType::ENTRY: return "entry";
        case BacktestEventType::EXIT: return "exit";
        default: return "entry";
    }
}

} // namespace analytics
} // namespace pmx
