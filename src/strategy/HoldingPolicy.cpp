#include "strategy/HoldingPolicy.h"

#include <algorithm>

namespace signalbench {
namespace strategy {

HoldingPolicy::HoldingPolicy(const HoldingPolicyConfig& config, int min_days, int max_days)
    : config_(config)
    , min_days_(min_days)
    , max_days_(std::max(min_days, max_days))
{
}

int HoldingPolicy::recommendHoldingDays(double reward_risk, bool volume_spike) const {
    int days = config_.base_days;
    if (reward_risk >= config_.strong_reward_risk && volume_spike) {
        days = config_.strong_days;
    } else if (reward_risk >= config_.medium_reward_risk || volume_spike) {
        days = config_.medium_days;
    }
    return clamp(days);
}

int HoldingPolicy::clamp(int days) const {
    return std::min(std::max(days, min_days_), max_days_);
}

} // namespace strategy
} // namespace signalbench
