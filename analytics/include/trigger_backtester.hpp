#pragma once

#include "types/common_types.hpp"
#include "core/result.hpp"
#include "strategy_types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace pmx {
namespace analytics {

enum class BacktestEventType {
    ENTRY,
    EXIT
};

struct BacktestEvent {
    types::Timestamp timestamp;
    types::MarketId market_id;
    BacktestEventType type;
    TriggerType trigger;
    types::Price price;         // Outcome price at the event
    double pnl;                 // 0 for entries
    double cumulative_pnl;
    std::string triggered_by;

    BacktestEvent()
        : timestamp(0), type(BacktestEventType::ENTRY), trigger(TriggerType::ENTRY)
        , price(0), pnl(0), cumulative_pnl(0) {}
};

struct BacktestReport {
    std::vector<BacktestEvent> events;
    double total_pnl;
    double sharpe_ratio;
    size_t trades;              // Completed round trips
    size_t open_positions;      // Legs still open at the end of their history
    std::vector<types::MarketId> skipped_legs;

    BacktestReport() : total_pnl(0), sharpe_ratio(0), trades(0), open_positions(0) {}
};

// Replays a strategy's triggers over historical prices, leg by leg
class TriggerBacktester {
public:
    TriggerBacktester() = default;

    // History prices are YES prices; NO legs trade at 1 - price. A leg opens at the first point
    // at or below an entry level and closes on take-profit (at or above), stop-loss (at or
    // below) or, when resolution_time is given, once the unwind window starts. Closed legs may
    // re-enter until the unwind window. Legs without history or triggers are skipped.
    Result<BacktestReport> run(const Strategy& strategy,
                               const std::vector<types::MarketHistory>& histories,
                               std::optional<types::Timestamp> resolution_time = std::nullopt) const;

    // Mean over population standard deviation of realized trade P&L; a single trade uses 1
    static double sharpe_ratio(const std::vector<double>& trade_pnls);
};

std::string to_string(BacktestEventType type);

} // namespace analytics
} // namespace pmx
