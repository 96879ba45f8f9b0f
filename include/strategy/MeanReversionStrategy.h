#pragma once

#include "strategy/IStrategy.h"
#include "strategy/HoldingPolicy.h"
#include "strategy/StrategyConfig.h"

namespace signalbench {
namespace strategy {

// Bollinger band touch-then-reclaim mean reversion.
//
// UP:   previous bar low touched the previous lower band and the current
//       close is back above the current lower band.
// DOWN: previous bar high touched the previous upper band and the current
//       close is back below the current upper band.
// Both need a wide enough band, a 50-bar trend that does not oppose the
// trade and a touch bar traded on at least average volume.
class MeanReversionStrategy : public IStrategy {
public:
    static constexpr const char* kName = "Bollinger";

    MeanReversionStrategy(const MeanReversionStrategyConfig& config, const HoldingPolicy& policy);

    StrategyInfo getInfo() const override;
    std::string getName() const override { return kName; }
    TradeProposal generateSignal(const std::vector<Bar>& history) const override;

    // max(period + 2, trend_period + 2)
    size_t requiredBars() const;

private:
    // Touch bar volume >= its own volume SMA x capitulation ratio.
    // Passes when there is not enough history or the average is not positive.
    bool hasCapitulationVolume(const std::vector<Bar>& history) const;
    bool hasVolumeSpike(const std::vector<Bar>& history) const;

    TradeProposal neutralProposal(double close) const;

    MeanReversionStrategyConfig config_;
    HoldingPolicy policy_;
};

} // namespace strategy
} // namespace signalbench
