#include "analytics/FeatureEngine.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"
#include "common/PriceHelper.h"

#include <algorithm>
#include <cmath>

namespace signalbench {
namespace analytics {

std::string pricePositionToString(PricePosition position) {
    switch (position) {
        case PricePosition::ABOVE: return "above";
        case PricePosition::BELOW: return "below";
        case PricePosition::UNKNOWN: return "unknown";
    }
    return "unknown";
}

std::string swingMethodToString(SwingMethod method) {
    switch (method) {
        case SwingMethod::CENTERED_WINDOW: return "centered";
        case SwingMethod::CENTERED_WINDOW_NARROW: return "centered_narrow";
        case SwingMethod::ROLLING_EXTREMES: return "rolling_extremes";
    }
    return "rolling_extremes";
}

FeatureEngine::FeatureEngine(const engine::AnalysisConfig& config)
    : config_(config)
{
}

FeatureResult FeatureEngine::compute(const std::vector<Bar>& bars) const {
    FeatureResult result;
    result.bars_required = config_.sma_period;

    if (bars.empty() || bars.size() < static_cast<size_t>(config_.sma_period)) {
        result.status = FeatureStatus::INSUFFICIENT_DATA;
        return result;
    }

    FeatureSnapshot& snap = result.snapshot;
    const Bar& last = bars.back();
    snap.date = last.date;
    snap.close = last.close;

    // 1. Price change vs prior close
    if (bars.size() >= 2) {
        const double prev_close = bars[bars.size() - 2].close;
        snap.pct_change = prev_close != 0.0
            ? common::roundTo((snap.close - prev_close) / prev_close * 100.0, 2)
            : 0.0;
    }

    // 2. Price and volume SMAs
    const auto closes = TechnicalIndicators::extractClosePrices(bars);
    const auto volumes = TechnicalIndicators::extractVolumes(bars);
    snap.sma = TechnicalIndicators::calculateSMA(closes, config_.sma_period);
    snap.price_position = snap.close > snap.sma ? PricePosition::ABOVE : PricePosition::BELOW;

    snap.volume = last.volume;
    snap.volume_sma = TechnicalIndicators::calculateSMA(volumes, config_.sma_period);
    snap.volume_spike = snap.volume_sma > 0.0 &&
                        snap.volume > snap.volume_sma * config_.volume_spike_ratio;

    // 3. Swing pair and retracement levels
    const auto window = lookbackWindow(bars);
    snap.swing = detectSwingPair(window, snap.close);
    snap.retracement = TechnicalIndicators::calculateFibonacciLevels(
        snap.swing.high, snap.swing.low, config_.fib_levels);

    const auto levels = nearestLevels(snap.close, snap.retracement);
    snap.nearest_support = levels.first;
    snap.nearest_resistance = levels.second;
    snap.at_support = isNear(snap.close, snap.nearest_support, config_.fib_proximity_pct);
    snap.at_resistance = isNear(snap.close, snap.nearest_resistance, config_.fib_proximity_pct);

    LOG_DEBUG("Features {}: close {:.2f} {} SMA {:.2f}, swing {:.2f}/{:.2f} ({}), S {:.2f} R {:.2f}",
              snap.date.toString(), snap.close, pricePositionToString(snap.price_position), snap.sma,
              snap.swing.high, snap.swing.low, swingMethodToString(snap.swing.method),
              snap.nearest_support, snap.nearest_resistance);

    result.status = FeatureStatus::OK;
    return result;
}

std::vector<Bar> FeatureEngine::lookbackWindow(const std::vector<Bar>& bars) const {
    if (bars.empty()) {
        return {};
    }

    const Date cutoff = TradingCalendar::subtractMonths(bars.back().date, config_.fib_lookback_months);
    std::vector<Bar> window;
    for (const auto& bar : bars) {
        if (bar.date >= cutoff) {
            window.push_back(bar);
        }
    }

    if (window.size() < kMinLookbackBars) {
        return bars;
    }
    return window;
}

SwingPair FeatureEngine::detectSwingPair(const std::vector<Bar>& window, double close) const {
    const int attempts[2] = {config_.swing_window, kNarrowSwingWindow};
    const SwingMethod methods[2] = {SwingMethod::CENTERED_WINDOW, SwingMethod::CENTERED_WINDOW_NARROW};

    for (int a = 0; a < 2; ++a) {
        const SwingIndices swings = findSwings(window, attempts[a]);
        if (swings.complete()) {
            SwingPair pair = selectTrendAwarePair(window, swings, close);
            pair.method = methods[a];
            pair.window = attempts[a];
            return pair;
        }
    }

    LOG_DEBUG("Swing detection fallback to rolling extremes ({} bars)", window.size());
    return rollingExtremes(window, kRollingExtremesBars);
}

SwingIndices FeatureEngine::findSwings(const std::vector<Bar>& bars, int window) {
    SwingIndices swings;
    if (window < 1) {
        return swings;
    }

    const size_t w = static_cast<size_t>(window);
    const size_t n = bars.size();
    for (size_t i = w; i + w < n; ++i) {
        if (TechnicalIndicators::isLocalMaximum(bars, i, window)) {
            swings.highs.push_back(i);
        }
        if (TechnicalIndicators::isLocalMinimum(bars, i, window)) {
            swings.lows.push_back(i);
        }
    }
    return swings;
}

SwingPair FeatureEngine::rollingExtremes(const std::vector<Bar>& bars, int length) {
    SwingPair pair;
    pair.method = SwingMethod::ROLLING_EXTREMES;
    if (bars.empty()) {
        return pair;
    }

    const size_t len = std::min(bars.size(), static_cast<size_t>(std::max(length, 1)));
    const size_t begin = bars.size() - len;
    pair.high = TechnicalIndicators::highestHigh(bars, begin, bars.size());
    pair.low = TechnicalIndicators::lowestLow(bars, begin, bars.size());
    pair.window = static_cast<int>(len);
    return pair;
}

SwingPair FeatureEngine::selectTrendAwarePair(
    const std::vector<Bar>& window,
    const SwingIndices& swings,
    double close
) const {
    const auto closes = TechnicalIndicators::extractClosePrices(window);
    const int mid_period = std::min(config_.sma_period, static_cast<int>(closes.size()));
    const double mid = TechnicalIndicators::calculateSMA(closes, mid_period);

    SwingPair pair;
    if (close >= mid) {
        // Most recent swing low, then the highest swing high after it
        const size_t latest_low = *std::max_element(swings.lows.begin(), swings.lows.end());
        std::vector<size_t> candidates;
        for (size_t i : swings.highs) {
            if (i > latest_low) candidates.push_back(i);
        }
        if (candidates.empty()) {
            candidates = swings.highs;
        }
        size_t best = candidates.front();
        for (size_t i : candidates) {
            if (window[i].high > window[best].high) best = i;
        }
        pair.high = window[best].high;
        pair.low = window[latest_low].low;
    } else {
        // Most recent swing high, then the lowest swing low after it
        const size_t latest_high = *std::max_element(swings.highs.begin(), swings.highs.end());
        std::vector<size_t> candidates;
        for (size_t i : swings.lows) {
            if (i > latest_high) candidates.push_back(i);
        }
        if (candidates.empty()) {
            candidates = swings.lows;
        }
        size_t best = candidates.front();
        for (size_t i : candidates) {
            if (window[i].low < window[best].low) best = i;
        }
        pair.high = window[latest_high].high;
        pair.low = window[best].low;
    }
    return pair;
}

std::pair<double, double> FeatureEngine::nearestLevels(
    double close,
    const std::map<double, double>& levels
) {
    if (levels.empty()) {
        return {0.0, 0.0};
    }

    std::vector<double> prices;
    for (const auto& entry : levels) {
        prices.push_back(entry.second);
    }
    std::sort(prices.begin(), prices.end());

    double support = prices.front();
    for (double p : prices) {
        if (p < close) support = p;
    }

    double resistance = prices.back();
    for (auto it = prices.rbegin(); it != prices.rend(); ++it) {
        if (*it > close) resistance = *it;
    }
    return {support, resistance};
}

bool FeatureEngine::isNear(double close, double level, double pct) {
    if (level == 0.0) {
        return false;
    }
    return std::abs(close - level) / level <= pct;
}

} // namespace analytics
} // namespace signalbench
