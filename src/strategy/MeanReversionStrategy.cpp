#include "strategy/MeanReversionStrategy.h"
#include "analytics/TechnicalIndicators.h"
#include "common/PriceHelper.h"
#include <algorithm>
#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace signalbench {
namespace strategy {

using analytics::TechnicalIndicators;

// ===== Constructor =====

MeanReversionStrategy::MeanReversionStrategy(
    const MeanReversionStrategyConfig& config,
    const HoldingPolicy& policy)
    : config_(config)
    , policy_(policy)
{
}

// ===== Strategy Info =====

StrategyInfo MeanReversionStrategy::getInfo() const
{
    StrategyInfo info;
    info.name = kName;
    info.description = "Bollinger band touch-then-reclaim with bandwidth, trend and capitulation volume filters";
    info.min_bars = static_cast<int>(requiredBars());
    return info;
}

size_t MeanReversionStrategy::requiredBars() const
{
    return static_cast<size_t>(std::max(config_.period + 2, config_.trend_period + 2));
}

// ===== Main Signal Generation =====

TradeProposal MeanReversionStrategy::generateSignal(const std::vector<Bar>& history) const
{
    if (history.empty()) {
        return neutralProposal(0.0);
    }

    const size_t n = history.size();
    const double close = history.back().close;
    if (n < requiredBars() || n < static_cast<size_t>(config_.trend_lookback) + 2) {
        return neutralProposal(close);
    }

    const auto closes = TechnicalIndicators::extractClosePrices(history);

    // 1. Bands for the current and the touch bar
    const auto bands = TechnicalIndicators::calculateBollingerBandsAt(
        closes, n - 1, config_.period, config_.std_multiplier);
    const auto prev_bands = TechnicalIndicators::calculateBollingerBandsAt(
        closes, n - 2, config_.period, config_.std_multiplier);
    if (!bands || !prev_bands) {
        return neutralProposal(close);
    }

    // 2. Bandwidth filter
    if (bands->bandwidth < config_.min_bandwidth) {
        return neutralProposal(close);
    }

    // 3. Long trend: flat or rising allows UP, flat or falling allows DOWN
    const auto trend_now = TechnicalIndicators::calculateSMAAt(closes, n - 1, config_.trend_period);
    const auto trend_prev = TechnicalIndicators::calculateSMAAt(
        closes, n - 1 - static_cast<size_t>(config_.trend_lookback), config_.trend_period);
    if (!trend_now || !trend_prev) {
        return neutralProposal(close);
    }
    const bool trend_up = *trend_now >= *trend_prev;
    const bool trend_down = *trend_now <= *trend_prev;

    // 4. Touch-then-reclaim
    const Bar& touch = history[n - 2];
    const bool up_confirmed = touch.low <= prev_bands->lower && close > bands->lower;
    const bool down_confirmed = touch.high >= prev_bands->upper && close < bands->upper;

    const bool volume_ok = hasCapitulationVolume(history);

    TradeProposal proposal;
    proposal.reference_price = close;

    if (up_confirmed && trend_up && volume_ok) {
        proposal.direction = Direction::UP;
        proposal.target = common::roundPrice(bands->middle);
        proposal.stop = common::roundPrice(bands->lower * (1.0 - config_.stop_buffer_pct));
        proposal.rationale = fmt::format(
            "Bollinger reclaim: prior low {:.2f} touched lower band {:.2f}, close {:.2f} back inside. "
            "Bandwidth {:.1f}%. SMA{} rising ({:.2f} -> {:.2f}). Target middle band {:.2f}.",
            touch.low, prev_bands->lower, close, bands->bandwidth * 100.0,
            config_.trend_period, *trend_prev, *trend_now, bands->middle);
    } else if (down_confirmed && trend_down && volume_ok) {
        proposal.direction = Direction::DOWN;
        proposal.target = common::roundPrice(bands->middle);
        proposal.stop = common::roundPrice(bands->upper * (1.0 + config_.stop_buffer_pct));
        proposal.rationale = fmt::format(
            "Bollinger rejection: prior high {:.2f} touched upper band {:.2f}, close {:.2f} back inside. "
            "Bandwidth {:.1f}%. SMA{} falling ({:.2f} -> {:.2f}). Target middle band {:.2f}.",
            touch.high, prev_bands->upper, close, bands->bandwidth * 100.0,
            config_.trend_period, *trend_prev, *trend_now, bands->middle);
    } else {
        return neutralProposal(close);
    }

    // Middle band on the wrong side of the close leaves nothing to revert to
    const bool straddles = proposal.direction == Direction::UP
        ? (proposal.target > close && proposal.stop < close)
        : (proposal.target < close && proposal.stop > close);
    if (!straddles) {
        return neutralProposal(close);
    }

    const double reward = std::abs(proposal.target - close);
    const double risk = std::abs(close - proposal.stop);
    proposal.reward_risk = risk > 0.0 ? common::roundTo(reward / risk, 2) : 0.0;
    proposal.holding_days = policy_.recommendHoldingDays(proposal.reward_risk, hasVolumeSpike(history));
    return proposal;
}

// ===== Volume Filters =====

bool MeanReversionStrategy::hasCapitulationVolume(const std::vector<Bar>& history) const
{
    const size_t n = history.size();
    if (n < static_cast<size_t>(config_.period) + 2) {
        return true;
    }

    const auto volumes = TechnicalIndicators::extractVolumes(history);
    const auto touch_avg = TechnicalIndicators::calculateSMAAt(volumes, n - 2, config_.period);
    if (!touch_avg || *touch_avg <= 0.0) {
        return true;
    }
    return volumes[n - 2] >= *touch_avg * config_.capitulation_volume_ratio;
}

bool MeanReversionStrategy::hasVolumeSpike(const std::vector<Bar>& history) const
{
    const auto volumes = TechnicalIndicators::extractVolumes(history);
    if (volumes.size() < static_cast<size_t>(config_.period)) {
        return false;
    }
    const double avg = TechnicalIndicators::calculateSMA(volumes, config_.period);
    return avg > 0.0 && volumes.back() > avg * config_.spike_volume_ratio;
}

// ===== Neutral =====

TradeProposal MeanReversionStrategy::neutralProposal(double close) const
{
    TradeProposal proposal;
    proposal.direction = Direction::SIDEWAYS;
    proposal.reference_price = close;
    proposal.target = common::roundPrice(close * (1.0 + config_.neutral_target_pct));
    proposal.stop = common::roundPrice(close * (1.0 - config_.neutral_stop_pct));

    const double risk = std::abs(close - proposal.stop);
    proposal.reward_risk = risk > 0.0
        ? common::roundTo(std::abs(proposal.target - close) / risk, 2)
        : 0.0;
    proposal.holding_days = policy_.clamp(config_.neutral_holding_days);
    proposal.rationale = "Price inside the Bollinger bands, no confirmed reversal.";
    return proposal;
}

} // namespace strategy
} // namespace signalbench
