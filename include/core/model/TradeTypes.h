#pragma once

#include <optional>
#include <string>

#include "common/Types.h"

namespace signalbench {
namespace core {

enum class ExitReason { TARGET_HIT, STOP_HIT, HORIZON_EXPIRED };
enum class TradeResult { WIN, LOSS, BREAKEVEN };
enum class PositionStatus { PENDING, OPEN, CLOSED };

std::string exitReasonToString(ExitReason reason);
std::optional<ExitReason> exitReasonFromString(const std::string& text);
std::string tradeResultToString(TradeResult result);
std::string positionStatusToString(PositionStatus status);
std::optional<PositionStatus> positionStatusFromString(const std::string& text);

// One simulated trade
struct TradeRecord {
    std::string symbol;
    std::string strategy;
    Date signal_date;
    Date entry_date;
    Date exit_date;
    Direction direction = Direction::SIDEWAYS;
    double entry_price = 0.0;
    double target = 0.0;
    double stop = 0.0;
    int holding_days = 0;
    double exit_price = 0.0;
    ExitReason exit_reason = ExitReason::HORIZON_EXPIRED;
    double shares = 0.0;
    double pnl = 0.0;
    double pnl_pct = 0.0;
    TradeResult result = TradeResult::BREAKEVEN;
};

// Identity of a tracked signal
struct PositionKey {
    std::string symbol;
    std::string strategy;
    Date signal_date;

    bool operator==(const PositionKey& other) const {
        return symbol == other.symbol && strategy == other.strategy && signal_date == other.signal_date;
    }
    bool operator<(const PositionKey& other) const {
        if (symbol != other.symbol) return symbol < other.symbol;
        if (strategy != other.strategy) return strategy < other.strategy;
        return signal_date < other.signal_date;
    }
};

// Live-tracked proposal: PENDING -> OPEN -> CLOSED
struct Position {
    std::string symbol;
    std::string strategy;
    Date signal_date;
    Direction direction = Direction::UP;
    double recommended_entry = 0.0;
    double target = 0.0;
    double stop = 0.0;
    int holding_days = 0;
    Date entry_date;
    std::optional<double> entry_price;
    Date expected_exit_date;
    std::optional<Date> exit_date;
    std::optional<double> exit_price;
    std::optional<ExitReason> exit_reason;
    std::optional<double> pnl_pct;
    PositionStatus status = PositionStatus::PENDING;

    PositionKey key() const { return PositionKey{symbol, strategy, signal_date}; }
};

} // namespace core
} // namespace signalbench
