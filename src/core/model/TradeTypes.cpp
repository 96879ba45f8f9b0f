#include "core/model/TradeTypes.h"

namespace signalbench {
namespace core {

std::string exitReasonToString(ExitReason reason) {
    switch (reason) {
        case ExitReason::TARGET_HIT: return "target-hit";
        case ExitReason::STOP_HIT: return "stop-hit";
        case ExitReason::HORIZON_EXPIRED: return "horizon-expired";
    }
    return "horizon-expired";
}

std::optional<ExitReason> exitReasonFromString(const std::string& text) {
    if (text == "target-hit") return ExitReason::TARGET_HIT;
    if (text == "stop-hit") return ExitReason::STOP_HIT;
    if (text == "horizon-expired") return ExitReason::HORIZON_EXPIRED;
    return std::nullopt;
}

std::string tradeResultToString(TradeResult result) {
    switch (result) {
        case TradeResult::WIN: return "Win";
        case TradeResult::LOSS: return "Loss";
        case TradeResult::BREAKEVEN: return "Breakeven";
    }
    return "Breakeven";
}

std::string positionStatusToString(PositionStatus status) {
    switch (status) {
        case PositionStatus::PENDING: return "pending";
        case PositionStatus::OPEN: return "open";
        case PositionStatus::CLOSED: return "closed";
    }
    return "pending";
}

std::optional<PositionStatus> positionStatusFromString(const std::string& text) {
    if (text == "pending") return PositionStatus::PENDING;
    if (text == "open") return PositionStatus::OPEN;
    if (text == "closed") return PositionStatus::CLOSED;
    return std::nullopt;
}

} // namespace core
} // namespace signalbench
