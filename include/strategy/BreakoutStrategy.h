#pragma once

#include "strategy/IStrategy.h"
#include "strategy/HoldingPolicy.h"
#include "strategy/StrategyConfig.h"

namespace signalbench {
namespace strategy {

// N-day range breakout with volume and trend confirmation.
// Resistance/support come from the N bars before the current bar, so the
// current bar never matches itself.
class BreakoutStrategy : public IStrategy {
public:
    static constexpr const char* kName = "Breakout";

    BreakoutStrategy(const BreakoutStrategyConfig& config, const HoldingPolicy& policy);

    StrategyInfo getInfo() const override;
    std::string getName() const override { return kName; }
    TradeProposal generateSignal(const std::vector<Bar>& history) const override;

    // round(target_pct / stop_pct, 2)
    double rewardRisk() const;

private:
    TradeProposal neutralProposal(double close) const;

    BreakoutStrategyConfig config_;
    HoldingPolicy policy_;
};

} // namespace strategy
} // namespace signalbench
