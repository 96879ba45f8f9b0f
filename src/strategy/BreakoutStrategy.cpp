#include "strategy/BreakoutStrategy.h"
#include "analytics/TechnicalIndicators.h"
#include "common/PriceHelper.h"
#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace signalbench {
namespace strategy {

using analytics::TechnicalIndicators;

// ===== Constructor =====

BreakoutStrategy::BreakoutStrategy(const BreakoutStrategyConfig& config, const HoldingPolicy& policy)
    : config_(config)
    , policy_(policy)
{
}

StrategyInfo BreakoutStrategy::getInfo() const
{
    StrategyInfo info;
    info.name = kName;
    info.description = "N-day range breakout confirmed by volume and SMA slope";
    info.min_bars = config_.lookback_period + 5;
    return info;
}

double BreakoutStrategy::rewardRisk() const
{
    return config_.stop_pct > 0.0 ? common::roundTo(config_.target_pct / config_.stop_pct, 2) : 0.0;
}

// ===== Main Signal Generation =====

TradeProposal BreakoutStrategy::generateSignal(const std::vector<Bar>& history) const
{
    if (history.empty()) {
        return neutralProposal(0.0);
    }

    const size_t n = history.size();
    const size_t lookback = static_cast<size_t>(config_.lookback_period);
    const double close = history.back().close;

    // 1. Guard
    if (n < lookback + 5) {
        return neutralProposal(close);
    }

    // 2. Range of the N bars before the current one
    const double resistance = TechnicalIndicators::highestHigh(history, n - 1 - lookback, n - 1);
    const double support = TechnicalIndicators::lowestLow(history, n - 1 - lookback, n - 1);

    // 3. Volume confirmation
    const auto volumes = TechnicalIndicators::extractVolumes(history);
    const auto vol_sma = TechnicalIndicators::calculateSMAAt(volumes, n - 1, config_.volume_period);
    if (!vol_sma || *vol_sma <= 0.0) {
        return neutralProposal(close);
    }
    const double cur_vol = volumes.back();
    const bool volume_ok = cur_vol >= *vol_sma * config_.volume_ratio;

    // 4. Trend: SMA now vs trend_lookback bars ago, strictly
    if (n < static_cast<size_t>(config_.trend_lookback) + 1) {
        return neutralProposal(close);
    }
    const auto closes = TechnicalIndicators::extractClosePrices(history);
    const auto sma_now = TechnicalIndicators::calculateSMAAt(closes, n - 1, config_.trend_period);
    const auto sma_prev = TechnicalIndicators::calculateSMAAt(
        closes, n - 1 - static_cast<size_t>(config_.trend_lookback), config_.trend_period);
    if (!sma_now || !sma_prev) {
        return neutralProposal(close);
    }
    const bool trend_up = *sma_now > *sma_prev;
    const bool trend_down = *sma_now < *sma_prev;

    const bool up_signal = close >= resistance && volume_ok && trend_up;
    const bool down_signal = close <= support && volume_ok && trend_down;
    if (!up_signal && !down_signal) {
        return neutralProposal(close);
    }

    // 5. Build proposal
    TradeProposal proposal;
    proposal.reference_price = close;
    proposal.reward_risk = rewardRisk();
    const bool volume_spike = cur_vol >= *vol_sma * config_.spike_volume_ratio;
    proposal.holding_days = policy_.recommendHoldingDays(proposal.reward_risk, volume_spike);

    if (up_signal) {
        proposal.direction = Direction::UP;
        proposal.target = common::roundPrice(close * (1.0 + config_.target_pct));
        proposal.stop = common::roundPrice(close * (1.0 - config_.stop_pct));
        proposal.rationale = fmt::format(
            "Close {:.2f} broke the {}-day resistance {:.2f} on volume {:.0f} ({:.1f}x SMA{}). "
            "SMA{} rising ({:.2f} -> {:.2f}). Target +{:.0f}% at {:.2f}.",
            close, config_.lookback_period, resistance, cur_vol, cur_vol / *vol_sma,
            config_.volume_period, config_.trend_period, *sma_prev, *sma_now,
            config_.target_pct * 100.0, proposal.target);
    } else {
        proposal.direction = Direction::DOWN;
        proposal.target = common::roundPrice(close * (1.0 - config_.target_pct));
        proposal.stop = common::roundPrice(close * (1.0 + config_.stop_pct));
        proposal.rationale = fmt::format(
            "Close {:.2f} broke the {}-day support {:.2f} on volume {:.0f} ({:.1f}x SMA{}). "
            "SMA{} falling ({:.2f} -> {:.2f}). Target -{:.0f}% at {:.2f}.",
            close, config_.lookback_period, support, cur_vol, cur_vol / *vol_sma,
            config_.volume_period, config_.trend_period, *sma_prev, *sma_now,
            config_.target_pct * 100.0, proposal.target);
    }
    return proposal;
}

// ===== Neutral =====

TradeProposal BreakoutStrategy::neutralProposal(double close) const
{
    TradeProposal proposal;
    proposal.direction = Direction::SIDEWAYS;
    proposal.reference_price = close;
    proposal.target = common::roundPrice(close * (1.0 + config_.target_pct));
    proposal.stop = common::roundPrice(close * (1.0 - config_.stop_pct));
    proposal.reward_risk = rewardRisk();
    proposal.holding_days = policy_.clamp(config_.neutral_holding_days);
    proposal.rationale = fmt::format(
        "No confirmed breakout of the {}-day range with enough volume.", config_.lookback_period);
    return proposal;
}

} // namespace strategy
} // namespace signalbench
