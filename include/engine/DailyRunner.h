#pragma once

#include <map>
#include <string>
#include <vector>

#include "common/Types.h"
#include "core/model/TradeTypes.h"
#include "engine/PositionTracker.h"
#include "strategy/StrategyManager.h"

namespace signalbench {
namespace engine {

struct SymbolSignal {
    std::string symbol;
    strategy::StrategySignal signal;
};

// Outcome of one end-of-day run over a symbol set
struct DailySummary {
    Date run_date;
    int symbols_processed = 0;
    int symbols_skipped = 0;        // no bars on or before run_date
    int symbols_failed = 0;         // exception caught at the symbol boundary
    int stale_bar_symbols = 0;      // today's bar missing, last available used

    int signals_added = 0;
    int signals_sideways = 0;
    int signals_duplicate = 0;
    int signals_invalid = 0;

    std::vector<SymbolSignal> signals;
    std::vector<core::Position> closed_today;

    std::vector<SymbolSignal> signalsWithDirection(Direction direction) const;
};

// End-of-day driver: applies the day's bar to tracked positions, then asks
// every strategy for a proposal on the series as of that day.
class DailyRunner {
public:
    DailyRunner(const strategy::StrategyManager& strategies, PositionTracker& tracker);

    DailySummary runDay(const Date& today, const std::map<std::string, std::vector<Bar>>& symbol_bars);

private:
    void runSymbol(const Date& today, const std::string& symbol,
                   const std::vector<Bar>& bars, DailySummary& summary);

    const strategy::StrategyManager& strategies_;
    PositionTracker& tracker_;
};

} // namespace engine
} // namespace signalbench
