#include "backtest/SimulationEngine.h"
#include "common/Logger.h"
#include "common/TradingCalendar.h"
#include "core/execution/TradeExitRules.h"
#include <algorithm>

namespace signalbench {
namespace backtest {

using core::execution::TradeExitRules;

SimulationEngine::SimulationEngine(const engine::AnalysisConfig& config)
    : config_(config)
{
}

std::vector<core::TradeRecord> SimulationEngine::simulate(
    const std::string& symbol,
    const std::vector<Bar>& bars,
    const strategy::IStrategy& strategy,
    double shares,
    SimulationFunnel* funnel
) const {
    std::vector<core::TradeRecord> trades;
    SimulationFunnel local;
    SimulationFunnel& f = funnel ? *funnel : local;

    const size_t n = bars.size();
    const size_t first_day = static_cast<size_t>(std::max(config_.simulation_min_lookback, 0));
    const std::string strategy_name = strategy.getName();

    // d + 1 must exist for the entry
    for (size_t d = first_day; d + 1 < n; ++d) {
        ++f.days_evaluated;

        const std::vector<Bar> history(bars.begin(), bars.begin() + static_cast<std::ptrdiff_t>(d + 1));
        strategy::TradeProposal proposal;
        try {
            proposal = strategy.generateSignal(history);
        } catch (const std::exception& e) {
            ++f.strategy_errors;
            LOG_DEBUG("Signal error on {} for {}/{}: {}", bars[d].date.toString(), symbol, strategy_name, e.what());
            continue;
        }

        if (!proposal.hasValidLevels()) {
            ++f.invalid_proposals;
            continue;
        }
        if (bars[d + 1].open <= 0.0) {
            ++f.invalid_entry_price;
            continue;
        }

        auto trade = simulateTrade(symbol, strategy_name, bars, d, proposal, shares);
        switch (trade.exit_reason) {
            case core::ExitReason::TARGET_HIT: ++f.target_hits; break;
            case core::ExitReason::STOP_HIT: ++f.stop_hits; break;
            case core::ExitReason::HORIZON_EXPIRED: ++f.horizon_exits; break;
        }
        ++f.trades;
        trades.push_back(std::move(trade));
    }

    const auto wins = std::count_if(trades.begin(), trades.end(), [](const core::TradeRecord& t) {
        return t.result == core::TradeResult::WIN;
    });
    const auto losses = std::count_if(trades.begin(), trades.end(), [](const core::TradeRecord& t) {
        return t.result == core::TradeResult::LOSS;
    });
    LOG_INFO("{}/{}: {} trades simulated (Win: {}, Loss: {})", symbol, strategy_name, trades.size(), wins, losses);
    return trades;
}

core::TradeRecord SimulationEngine::simulateTrade(
    const std::string& symbol,
    const std::string& strategy_name,
    const std::vector<Bar>& bars,
    size_t signal_index,
    const strategy::TradeProposal& proposal,
    double shares
) const {
    const size_t n = bars.size();
    const size_t entry_index = signal_index + 1;
    const int holding = std::min(std::max(proposal.holding_days, config_.t_plus_min), config_.t_plus_max);

    core::TradeRecord trade;
    trade.symbol = symbol;
    trade.strategy = strategy_name;
    trade.signal_date = bars[signal_index].date;
    trade.entry_date = bars[entry_index].date;
    trade.direction = proposal.direction;
    trade.entry_price = bars[entry_index].open;
    trade.target = proposal.target;
    trade.stop = proposal.stop;
    trade.holding_days = holding;
    trade.shares = shares;

    // Same trading-day horizon as the live tracker
    const Date exit_by = TradingCalendar::addTradingDays(trade.entry_date, holding);

    // 1. Target/stop on the bars after the entry bar, up to the first bar on or after exit_by
    size_t last = entry_index;
    bool exited = false;
    for (size_t check = entry_index + 1; check < n; ++check) {
        last = check;
        const auto decision = TradeExitRules::checkBarExit(proposal.direction, proposal.target, proposal.stop, bars[check]);
        if (decision) {
            trade.exit_price = decision->price;
            trade.exit_reason = decision->reason;
            trade.exit_date = bars[check].date;
            exited = true;
            break;
        }
        if (bars[check].date >= exit_by) {
            break;
        }
    }

    // 2. Horizon: close of the last bar walked (clipped to the series end)
    if (!exited) {
        trade.exit_price = bars[last].close;
        trade.exit_reason = core::ExitReason::HORIZON_EXPIRED;
        trade.exit_date = bars[last].date;
    }

    trade.pnl = shares * TradeExitRules::pnlPerShare(trade.direction, trade.entry_price, trade.exit_price);
    trade.pnl_pct = TradeExitRules::pnlPercent(trade.direction, trade.entry_price, trade.exit_price);
    trade.result = TradeExitRules::classify(trade.pnl);
    return trade;
}

std::vector<core::TradeRecord> SimulationEngine::simulateAll(
    const std::string& symbol,
    const std::vector<Bar>& bars,
    const strategy::StrategyManager& strategies,
    double shares
) const {
    std::vector<core::TradeRecord> all;
    for (const auto& strategy : strategies.getStrategies()) {
        auto trades = simulate(symbol, bars, *strategy, shares);
        all.insert(all.end(), trades.begin(), trades.end());
    }
    return all;
}

} // namespace backtest
} // namespace signalbench
