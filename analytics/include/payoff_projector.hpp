#pragma once

#include "types/common_types.hpp"
#include "core/result.hpp"
#include "analytics_config.hpp"
#include "strategy_types.hpp"
#include <vector>

namespace pmx {
namespace analytics {

class PayoffProjector {
public:
    explicit PayoffProjector(const PayoffConfig& config = PayoffConfig());

    // Portfolio EV over the assumed true probability of the primary market, 0 to 1 inclusive.
    // Non-primary legs move with the primary scaled by the strategy's correlation weight.
    // Endpoints equal settlement values for primary-market legs only; other legs stay blended.
    Result<std::vector<PayoffPoint>> ev_curve(const Strategy& strategy,
                                              const std::vector<types::MarketInfo>& markets) const;

    // Half-life convergence of every leg's YES price toward the belief
    Result<std::vector<TimeDecayRow>> time_decay(const Strategy& strategy,
                                                 const std::vector<types::MarketInfo>& markets,
                                                 double belief, double half_life_days) const;

    // P&L of the first two legs under each pair of resolutions, independence assumed
    std::vector<SettlementScenario> settlement_grid(const Strategy& strategy) const;

    // Copy of the strategy with curve, time decay and settlement grid filled in
    Result<Strategy> project(const Strategy& strategy, const std::vector<types::MarketInfo>& markets,
                             double belief, double half_life_days) const;

    // Expected value of a leg given the probability its market resolves YES
    static double leg_expected_value(const StrategyLeg& leg, double p_yes);

    // Settled value of a leg when its market resolves to the given outcome
    static double leg_settlement_value(const StrategyLeg& leg, types::Outcome resolved);

    const PayoffConfig& config() const { return config_; }

private:
    PayoffConfig config_;

    std::vector<double> probability_grid() const;
};

} // namespace analytics
} // namespace pmx
