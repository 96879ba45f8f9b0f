#include "strategy/FibonacciStrategy.h"
#include "common/PriceHelper.h"
#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace signalbench {
namespace strategy {

using analytics::FeatureSnapshot;
using analytics::PricePosition;

namespace {
constexpr double kNeutralTargetPct = 0.02;
constexpr double kNeutralStopPct = 0.01;
}

FibonacciStrategy::FibonacciStrategy(
    const FibonacciStrategyConfig& config,
    const engine::AnalysisConfig& analysis,
    const HoldingPolicy& policy)
    : config_(config)
    , features_(analysis)
    , policy_(policy)
{
}

StrategyInfo FibonacciStrategy::getInfo() const
{
    StrategyInfo info;
    info.name = kName;
    info.description = "Retracement support/resistance with SMA position and volume spike";
    info.min_bars = features_.config().sma_period;
    return info;
}

double FibonacciStrategy::levelOr(const FeatureSnapshot& snap, double ratio, double fallback)
{
    const auto it = snap.retracement.find(ratio);
    return it != snap.retracement.end() ? it->second : fallback;
}

TradeProposal FibonacciStrategy::generateSignal(const std::vector<Bar>& history) const
{
    const auto features = features_.compute(history);
    if (!features.ok()) {
        FeatureSnapshot snap;
        snap.close = history.empty() ? 0.0 : history.back().close;
        return neutralProposal(snap);
    }

    const FeatureSnapshot& snap = features.snapshot;
    const double close = snap.close;

    const bool bullish = snap.price_position == PricePosition::ABOVE &&
                         snap.volume_spike && snap.at_support;
    const bool bearish = snap.price_position == PricePosition::BELOW && snap.at_resistance;
    if (!bullish && !bearish) {
        return neutralProposal(snap);
    }

    TradeProposal proposal;
    proposal.reference_price = close;
    if (bullish) {
        const double raw_target = levelOr(snap, 0.236, close);
        proposal.direction = Direction::UP;
        proposal.target = common::roundPrice(raw_target > close ? raw_target : levelOr(snap, 0.0, close));
        proposal.stop = common::roundPrice(snap.swing.low * (1.0 - config_.stop_buffer_pct));
        proposal.rationale = fmt::format(
            "Close {:.2f} above SMA {:.2f} on a volume spike, bouncing off retracement support {:.2f}.",
            close, snap.sma, snap.nearest_support);
    } else {
        const double raw_target = levelOr(snap, 0.618, close);
        proposal.direction = Direction::DOWN;
        proposal.target = common::roundPrice(raw_target < close ? raw_target : levelOr(snap, 1.0, close));
        proposal.stop = common::roundPrice(snap.swing.high * (1.0 + config_.stop_buffer_pct));
        proposal.rationale = fmt::format(
            "Close {:.2f} below SMA {:.2f}, rejected at retracement resistance {:.2f}.",
            close, snap.sma, snap.nearest_resistance);
    }

    const bool straddles = proposal.direction == Direction::UP
        ? (proposal.target > close && proposal.stop < close)
        : (proposal.target < close && proposal.stop > close);
    if (!straddles) {
        return neutralProposal(snap);
    }

    const double risk = std::abs(close - proposal.stop);
    proposal.reward_risk = risk > 0.0
        ? common::roundTo(std::abs(proposal.target - close) / risk, 2)
        : 0.0;
    proposal.holding_days = policy_.recommendHoldingDays(proposal.reward_risk, snap.volume_spike);
    return proposal;
}

TradeProposal FibonacciStrategy::neutralProposal(const FeatureSnapshot& snap) const
{
    const double close = snap.close;

    TradeProposal proposal;
    proposal.direction = Direction::SIDEWAYS;
    proposal.reference_price = close;

    // Range between the nearest levels, or a fixed band when close sits outside it
    if (snap.nearest_resistance > close && snap.nearest_support < close) {
        proposal.target = common::roundPrice(snap.nearest_resistance);
        proposal.stop = common::roundPrice(snap.nearest_support);
        proposal.rationale = fmt::format(
            "Ranging between retracement support {:.2f} and resistance {:.2f}.",
            snap.nearest_support, snap.nearest_resistance);
    } else {
        proposal.target = common::roundPrice(close * (1.0 + kNeutralTargetPct));
        proposal.stop = common::roundPrice(close * (1.0 - kNeutralStopPct));
        proposal.rationale = "No retracement setup.";
    }

    const double risk = std::abs(close - proposal.stop);
    proposal.reward_risk = risk > 0.0
        ? common::roundTo(std::abs(proposal.target - close) / risk, 2)
        : 0.0;
    proposal.holding_days = policy_.clamp(config_.neutral_holding_days);
    return proposal;
}

} // namespace strategy
} // namespace signalbench
