#pragma once

#include "strategy/IStrategy.h"
#include "strategy/StrategyConfig.h"
#include "engine/EngineConfig.h"
#include <vector>
#include <memory>
#include <mutex>
#include <string>

namespace signalbench {
namespace strategy {

// Everything needed to build the configured strategies
struct StrategySettings {
    engine::AnalysisConfig analysis;
    HoldingPolicyConfig holding;
    MeanReversionStrategyConfig mean_reversion;
    BreakoutStrategyConfig breakout;
    FibonacciStrategyConfig fibonacci;
};

// One strategy's proposal for the evaluation day
struct StrategySignal {
    std::string strategy_name;
    TradeProposal proposal;
};

// Ordered registry of named strategies
class StrategyManager {
public:
    StrategyManager() = default;

    // Builds a strategy from its config key ("bollinger", "breakout",
    // "fibonacci"; aliases accepted). Returns nullptr for unknown names.
    static StrategyPtr createStrategy(const std::string& name, const StrategySettings& settings);

    // Registers enabled strategies in order, skipping unknown names and duplicates
    void registerEnabled(const std::vector<std::string>& names, const StrategySettings& settings);

    void registerStrategy(StrategyPtr strategy);

    // Lookup by display name or config key, case-insensitive
    StrategyPtr getStrategy(const std::string& name) const;
    std::vector<StrategyPtr> getStrategies() const;
    size_t size() const;

    // Runs every strategy on the same history. A throwing strategy is logged
    // and skipped; the others still run.
    std::vector<StrategySignal> collectSignals(const std::string& symbol,
                                               const std::vector<Bar>& history) const;

private:
    std::vector<StrategyPtr> strategies_;
    mutable std::mutex mutex_;
};

} // namespace strategy
} // namespace signalbench
