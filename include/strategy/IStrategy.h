#pragma once

#include "common/Types.h"
#include <cmath>
#include <string>
#include <vector>
#include <memory>

namespace signalbench {
namespace strategy {

// Trade proposal produced for the evaluation day
struct TradeProposal {
    Direction direction;
    double target;
    double stop;
    double reward_risk;
    int holding_days;               // bounded to [t_plus_min, t_plus_max]
    double reference_price;         // close that produced the proposal
    std::string rationale;

    TradeProposal()
        : direction(Direction::SIDEWAYS)
        , target(0.0)
        , stop(0.0)
        , reward_risk(0.0)
        , holding_days(0)
        , reference_price(0.0)
    {}

    bool isDirectional() const { return direction != Direction::SIDEWAYS; }

    bool hasValidLevels() const {
        return std::isfinite(target) && std::isfinite(stop);
    }
};

// Strategy metadata
struct StrategyInfo {
    std::string name;
    std::string description;
    int min_bars;               // bars needed for a non-neutral proposal

    StrategyInfo() : min_bars(0) {}
};

// Strategy interface. generateSignal reads only the given history, which
// ends at the evaluation day inclusive, and keeps no state between calls.
class IStrategy {
public:
    virtual ~IStrategy() = default;

    virtual StrategyInfo getInfo() const = 0;

    // Name recorded on trade records and positions ("Bollinger", "Breakout")
    virtual std::string getName() const = 0;

    virtual TradeProposal generateSignal(const std::vector<Bar>& history) const = 0;
};

using StrategyPtr = std::shared_ptr<IStrategy>;

} // namespace strategy
} // namespace signalbench
