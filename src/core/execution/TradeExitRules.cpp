#include "core/execution/TradeExitRules.h"

namespace signalbench {
namespace core {
namespace execution {

std::optional<ExitDecision> TradeExitRules::checkBarExit(
    Direction direction,
    double target,
    double stop,
    const Bar& bar
) {
    if (direction == Direction::DOWN) {
        if (bar.low <= target) {
            return ExitDecision{ExitReason::TARGET_HIT, target};
        }
        if (bar.high >= stop) {
            return ExitDecision{ExitReason::STOP_HIT, stop};
        }
        return std::nullopt;
    }

    if (bar.high >= target) {
        return ExitDecision{ExitReason::TARGET_HIT, target};
    }
    if (bar.low <= stop) {
        return ExitDecision{ExitReason::STOP_HIT, stop};
    }
    return std::nullopt;
}

double TradeExitRules::pnlPerShare(Direction direction, double entry_price, double exit_price) {
    return direction == Direction::DOWN ? entry_price - exit_price : exit_price - entry_price;
}

double TradeExitRules::pnlPercent(Direction direction, double entry_price, double exit_price) {
    if (entry_price <= 0.0) {
        return 0.0;
    }
    return pnlPerShare(direction, entry_price, exit_price) / entry_price * 100.0;
}

TradeResult TradeExitRules::classify(double pnl) {
    if (pnl > 0.0) return TradeResult::WIN;
    if (pnl < 0.0) return TradeResult::LOSS;
    return TradeResult::BREAKEVEN;
}

} // namespace execution
} // namespace core
} // namespace signalbench
