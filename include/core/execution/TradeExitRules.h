#pragma once

#include <optional>

#include "common/Types.h"
#include "core/model/TradeTypes.h"

namespace signalbench {
namespace core {
namespace execution {

struct ExitDecision {
    ExitReason reason = ExitReason::HORIZON_EXPIRED;
    double price = 0.0;
};

// Exit evaluation shared by the simulator and the live position tracker
class TradeExitRules {
public:
    // Target is checked before stop. SIDEWAYS is evaluated with long bias.
    static std::optional<ExitDecision> checkBarExit(
        Direction direction,
        double target,
        double stop,
        const Bar& bar
    );

    // Signed percent return for the direction; 0 when entry <= 0
    static double pnlPercent(Direction direction, double entry_price, double exit_price);

    // Signed price difference per share for the direction
    static double pnlPerShare(Direction direction, double entry_price, double exit_price);

    static TradeResult classify(double pnl);
};

} // namespace execution
} // namespace core
} // namespace signalbench
