#include "engine/DailyRunner.h"
#include "backtest/DataHistory.h"
#include "common/Logger.h"

#include <stdexcept>

namespace signalbench {
namespace engine {

std::vector<SymbolSignal> DailySummary::signalsWithDirection(Direction direction) const {
    std::vector<SymbolSignal> out;
    for (const auto& s : signals) {
        if (s.signal.proposal.direction == direction) {
            out.push_back(s);
        }
    }
    return out;
}

DailyRunner::DailyRunner(const strategy::StrategyManager& strategies, PositionTracker& tracker)
    : strategies_(strategies)
    , tracker_(tracker)
{
}

DailySummary DailyRunner::runDay(const Date& today, const std::map<std::string, std::vector<Bar>>& symbol_bars) {
    DailySummary summary;
    summary.run_date = today;

    LOG_INFO("===== Daily run {} ({} symbols) =====", today.toString(), symbol_bars.size());

    for (const auto& [symbol, bars] : symbol_bars) {
        try {
            runSymbol(today, symbol, bars, summary);
        } catch (const std::exception& e) {
            summary.symbols_failed++;
            LOG_ERROR("{}: daily run failed: {}", symbol, e.what());
        }
    }

    LOG_INFO("Daily run done: processed={} skipped={} failed={} added={} closed={}",
             summary.symbols_processed, summary.symbols_skipped, summary.symbols_failed,
             summary.signals_added, summary.closed_today.size());
    return summary;
}

void DailyRunner::runSymbol(const Date& today, const std::string& symbol,
                            const std::vector<Bar>& bars, DailySummary& summary) {
    // 1. Series as of today
    const auto history = backtest::DataHistory::sliceUpTo(bars, today);
    if (history.empty()) {
        summary.symbols_skipped++;
        LOG_WARN("{}: no bars on or before {}, skipping", symbol, today.toString());
        return;
    }

    // 2. Today's bar, or the last available one
    const Bar& today_bar = history.back();
    if (today_bar.date != today) {
        summary.stale_bar_symbols++;
        LOG_WARN("{}: {} not in data, using last available bar ({})",
                 symbol, today.toString(), today_bar.date.toString());
    }

    // 3. Pending -> open, open -> exit
    auto closed = tracker_.updatePositions(today, symbol, today_bar);
    summary.closed_today.insert(summary.closed_today.end(), closed.begin(), closed.end());

    // 4. New proposals on the same series
    const auto signals = strategies_.collectSignals(symbol, history);
    for (const auto& signal : signals) {
        summary.signals.push_back(SymbolSignal{symbol, signal});

        const auto result = tracker_.addSignal(symbol, signal.strategy_name, today,
                                               signal.proposal, today_bar.close);
        LOG_DEBUG("{}/{}: {}", symbol, signal.strategy_name, addSignalResultToString(result));
        switch (result) {
            case AddSignalResult::ADDED: summary.signals_added++; break;
            case AddSignalResult::IGNORED_SIDEWAYS: summary.signals_sideways++; break;
            case AddSignalResult::DUPLICATE: summary.signals_duplicate++; break;
            case AddSignalResult::IGNORED_INVALID: summary.signals_invalid++; break;
        }
    }

    summary.symbols_processed++;
}

} // namespace engine
} // namespace signalbench
