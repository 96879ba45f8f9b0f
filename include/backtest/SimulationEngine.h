#pragma once

#include <string>
#include <vector>
#include "common/Types.h"
#include "core/model/TradeTypes.h"
#include "engine/EngineConfig.h"
#include "strategy/IStrategy.h"
#include "strategy/StrategyManager.h"

namespace signalbench {
namespace backtest {

// Per-run counters explaining why evaluation days did not become trades
struct SimulationFunnel {
    int days_evaluated = 0;
    int strategy_errors = 0;
    int invalid_proposals = 0;
    int invalid_entry_price = 0;
    int trades = 0;
    int target_hits = 0;
    int stop_hits = 0;
    int horizon_exits = 0;
};

// No-lookahead daily replay. For each evaluation day d the strategy sees
// bars[0..d]; the trade fills at bars[d+1].open and is checked on the
// following holding_days bars.
class SimulationEngine {
public:
    explicit SimulationEngine(const engine::AnalysisConfig& config);

    std::vector<core::TradeRecord> simulate(
        const std::string& symbol,
        const std::vector<Bar>& bars,
        const strategy::IStrategy& strategy,
        double shares,
        SimulationFunnel* funnel = nullptr
    ) const;

    // Every registered strategy over the same series, in registry order
    std::vector<core::TradeRecord> simulateAll(
        const std::string& symbol,
        const std::vector<Bar>& bars,
        const strategy::StrategyManager& strategies,
        double shares
    ) const;

private:
    core::TradeRecord simulateTrade(
        const std::string& symbol,
        const std::string& strategy_name,
        const std::vector<Bar>& bars,
        size_t signal_index,
        const strategy::TradeProposal& proposal,
        double shares
    ) const;

    engine::AnalysisConfig config_;
};

} // namespace backtest
} // namespace signalbench
