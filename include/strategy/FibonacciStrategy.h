#pragma once

#include "strategy/IStrategy.h"
#include "strategy/HoldingPolicy.h"
#include "strategy/StrategyConfig.h"
#include "analytics/FeatureEngine.h"

namespace signalbench {
namespace strategy {

// Retracement bounce built on the feature snapshot.
// UP when price is above its SMA on a volume spike and sits at a retracement
// support; DOWN when price is below its SMA and sits at a resistance.
class FibonacciStrategy : public IStrategy {
public:
    static constexpr const char* kName = "Fibonacci";

    FibonacciStrategy(const FibonacciStrategyConfig& config,
                      const engine::AnalysisConfig& analysis,
                      const HoldingPolicy& policy);

    StrategyInfo getInfo() const override;
    std::string getName() const override { return kName; }
    TradeProposal generateSignal(const std::vector<Bar>& history) const override;

private:
    static double levelOr(const analytics::FeatureSnapshot& snap, double ratio, double fallback);
    TradeProposal neutralProposal(const analytics::FeatureSnapshot& snap) const;

    FibonacciStrategyConfig config_;
    analytics::FeatureEngine features_;
    HoldingPolicy policy_;
};

} // namespace strategy
} // namespace signalbench
