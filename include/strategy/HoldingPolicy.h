#pragma once

#include "strategy/StrategyConfig.h"

namespace signalbench {
namespace strategy {

// Recommended holding horizon (trading days) from reward:risk and volume spike
class HoldingPolicy {
public:
    HoldingPolicy(const HoldingPolicyConfig& config, int min_days, int max_days);

    int recommendHoldingDays(double reward_risk, bool volume_spike) const;

    // Clamp any day count into [min_days, max_days]
    int clamp(int days) const;

private:
    HoldingPolicyConfig config_;
    int min_days_;
    int max_days_;
};

} // namespace strategy
} // namespace signalbench
