#include "analytics/FeatureEngine.h"
#include "analytics/TechnicalIndicators.h"
#include "BarFixtures.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace signalbench;
using namespace signalbench::analytics;

namespace {

bool near(double a, double b, double eps = 1e-6) {
    return std::abs(a - b) < eps;
}

// Up 100 -> 110 (bar 10), down to 90 (bar 20), back up to 99 (bar 29)
std::vector<Bar> swingSeries() {
    const auto dates = testing::tradingDates(Date(2024, 3, 1), 30);
    std::vector<Bar> bars;
    for (size_t i = 0; i < 30; ++i) {
        double c = 0.0;
        if (i <= 10) {
            c = 100.0 + static_cast<double>(i);
        } else if (i <= 20) {
            c = 110.0 - 2.0 * static_cast<double>(i - 10);
        } else {
            c = 90.0 + static_cast<double>(i - 20);
        }
        bars.emplace_back(dates[i], c, c + 0.5, c - 0.5, c, 1000.0);
    }
    bars.back().volume = 2000.0;
    return bars;
}

} // namespace

int main() {
    std::cout << "[TEST] Starting FeatureEngine Test..." << std::endl;

    engine::AnalysisConfig config;
    FeatureEngine features(config);

    // 1. Indicators
    {
        const std::vector<double> v{1, 2, 3, 4, 5};
        assert(near(TechnicalIndicators::calculateSMA(v, 5), 3.0));
        assert(TechnicalIndicators::calculateSMA(v, 6) == 0.0);
        assert(near(*TechnicalIndicators::calculateSMAAt(v, 2, 3), 2.0));
        assert(!TechnicalIndicators::calculateSMAAt(v, 1, 3));
        assert(near(*TechnicalIndicators::calculateStdDevAt(v, 4, 5), std::sqrt(2.5)));

        const auto levels = TechnicalIndicators::calculateFibonacciLevels(110.0, 90.0, config.fib_levels);
        assert(levels.size() == 7);
        assert(near(levels.at(0.0), 110.0));
        assert(near(levels.at(0.5), 100.0));
        assert(near(levels.at(0.618), 97.64));
        assert(near(levels.at(1.0), 90.0));
    }

    // 2. Nearest levels and proximity
    {
        const std::map<double, double> levels{{0.0, 110.0}, {0.5, 105.0}, {1.0, 100.0}};
        auto sr = FeatureEngine::nearestLevels(103.0, levels);
        assert(sr.first == 100.0 && sr.second == 105.0);
        sr = FeatureEngine::nearestLevels(120.0, levels);
        assert(sr.first == 110.0 && sr.second == 110.0);
        sr = FeatureEngine::nearestLevels(95.0, levels);
        assert(sr.first == 100.0 && sr.second == 100.0);

        assert(FeatureEngine::isNear(101.0, 100.0, 0.015));
        assert(!FeatureEngine::isNear(102.0, 100.0, 0.015));
        assert(!FeatureEngine::isNear(1.0, 0.0, 0.015));
    }

    // 3. Swing detection policy
    {
        const auto bars = swingSeries();
        const auto swings = FeatureEngine::findSwings(bars, 5);
        assert(swings.complete());
        assert(swings.highs.size() == 1 && swings.highs[0] == 10);
        assert(swings.lows.size() == 1 && swings.lows[0] == 20);

        const auto pair = features.detectSwingPair(bars, bars.back().close);
        assert(pair.method == SwingMethod::CENTERED_WINDOW);
        assert(pair.window == 5);
        assert(near(pair.high, 110.5));
        assert(near(pair.low, 89.5));

        // Monotonic series has no interior swing low at any width
        std::vector<Bar> rising;
        const auto dates = testing::tradingDates(Date(2024, 3, 1), 15);
        for (size_t i = 0; i < dates.size(); ++i) {
            const double c = 50.0 + static_cast<double>(i);
            rising.emplace_back(dates[i], c, c + 1.0, c - 1.0, c, 1000.0);
        }
        const auto fallback = features.detectSwingPair(rising, rising.back().close);
        assert(fallback.method == SwingMethod::ROLLING_EXTREMES);
        assert(near(fallback.high, 65.0));
        assert(near(fallback.low, 49.0));
        assert(swingMethodToString(fallback.method) == "rolling_extremes");
    }

    // 4. Full snapshot
    {
        const auto result = features.compute(swingSeries());
        assert(result.ok());
        const auto& snap = result.snapshot;
        assert(near(snap.close, 99.0));
        assert(near(snap.pct_change, 1.02));
        assert(near(snap.sma, 97.75));
        assert(snap.price_position == PricePosition::ABOVE);
        assert(near(snap.volume_sma, 1050.0));
        assert(snap.volume_spike);
        assert(near(snap.nearest_support, 97.52));
        assert(near(snap.nearest_resistance, 100.0));
        assert(!snap.at_support);
        assert(snap.at_resistance);

        // Same bars, same snapshot
        const auto again = features.compute(swingSeries());
        assert(again.snapshot.retracement == snap.retracement);
    }

    // 5. Insufficient data
    {
        const auto few = testing::flatBars(Date(2024, 3, 1), 10, 20.0, 100.0);
        const auto result = features.compute(few);
        assert(!result.ok());
        assert(result.status == FeatureStatus::INSUFFICIENT_DATA);
        assert(result.bars_required == config.sma_period);
        assert(!features.compute({}).ok());
    }

    // 6. Lookback window is the last fib_lookback_months of dates
    {
        const auto bars = testing::flatBars(Date(2023, 1, 2), 200, 30.0, 100.0);
        const auto window = features.lookbackWindow(bars);
        const Date cutoff = TradingCalendar::subtractMonths(bars.back().date, config.fib_lookback_months);
        assert(window.size() < bars.size());
        assert(window.front().date >= cutoff);
        assert(window.back().date == bars.back().date);
        assert(bars[bars.size() - window.size() - 1].date < cutoff);

        const auto tiny = testing::flatBars(Date(2023, 1, 2), 5, 30.0, 100.0);
        assert(features.lookbackWindow(tiny).size() == 5);
    }

    std::cout << "[TEST] FeatureEngine Test PASSED!" << std::endl;
    return 0;
}
