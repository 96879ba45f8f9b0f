#include "strategy/BreakoutStrategy.h"
#include "strategy/MeanReversionStrategy.h"
#include "strategy/FibonacciStrategy.h"
#include "strategy/HoldingPolicy.h"
#include "strategy/StrategyManager.h"
#include "common/PriceHelper.h"
#include "BarFixtures.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>

using namespace signalbench;
using namespace signalbench::strategy;

namespace {

bool near(double a, double b, double eps = 1e-6) {
    return std::abs(a - b) < eps;
}

// 59 bars drifting up 0.1 per day on flat volume, then a close of 110 on
// double volume: above the prior 20-day high with a rising SMA20.
std::vector<Bar> breakoutSeries() {
    const auto dates = testing::tradingDates(Date(2024, 1, 2), 60);
    std::vector<Bar> bars;
    for (size_t i = 0; i < 59; ++i) {
        const double c = 100.0 + 0.1 * static_cast<double>(i);
        bars.emplace_back(dates[i], c, c + 0.5, c - 0.5, c, 1000.0);
    }
    bars.emplace_back(dates[59], 106.0, 110.5, 105.5, 110.0, 2000.0);
    return bars;
}

// Closes alternate 98/102; bar 58 dips to 90 below the lower band on heavy
// volume, bar 59 closes back inside the band below the middle.
std::vector<Bar> reclaimSeries() {
    const auto dates = testing::tradingDates(Date(2024, 1, 2), 60);
    std::vector<Bar> bars;
    for (size_t i = 0; i < 58; ++i) {
        const double c = (i % 2 == 0) ? 98.0 : 102.0;
        bars.emplace_back(dates[i], c, c + 0.5, c - 0.5, c, 1000.0);
    }
    bars.emplace_back(dates[58], 100.0, 102.5, 90.0, 102.0, 3000.0);
    bars.emplace_back(dates[59], 100.0, 100.5, 98.5, 99.0, 1000.0);
    return bars;
}

// Mirror of breakoutSeries: drifting down, then a close of 90 below the
// prior 20-day low on double volume with a falling SMA20.
std::vector<Bar> breakdownSeries() {
    const auto dates = testing::tradingDates(Date(2024, 1, 2), 60);
    std::vector<Bar> bars;
    for (size_t i = 0; i < 59; ++i) {
        const double c = 100.0 - 0.1 * static_cast<double>(i);
        bars.emplace_back(dates[i], c, c + 0.5, c - 0.5, c, 1000.0);
    }
    bars.emplace_back(dates[59], 94.0, 94.5, 89.5, 90.0, 2000.0);
    return bars;
}

// 58 bars alternating between two closes on flat volume
std::vector<Bar> alternatingBars(double low_close, double high_close, double wick) {
    const auto dates = testing::tradingDates(Date(2024, 1, 2), 60);
    std::vector<Bar> bars;
    for (size_t i = 0; i < 58; ++i) {
        const double c = (i % 2 == 0) ? low_close : high_close;
        bars.emplace_back(dates[i], c, c + wick, c - wick, c, 1000.0);
    }
    return bars;
}

// Bar 58 spikes to 110 above the upper band on heavy volume, bar 59 closes
// back inside the band above the middle.
std::vector<Bar> rejectionSeries() {
    auto bars = alternatingBars(98.0, 102.0, 0.5);
    const auto dates = testing::tradingDates(Date(2024, 1, 2), 60);
    bars.emplace_back(dates[58], 100.0, 110.0, 97.5, 98.0, 3000.0);
    bars.emplace_back(dates[59], 100.0, 101.5, 99.5, 101.0, 1000.0);
    return bars;
}

void checkLevelOrdering(const TradeProposal& p) {
    if (p.direction == Direction::UP) {
        assert(p.target > p.reference_price);
        assert(p.reference_price > p.stop);
    } else if (p.direction == Direction::DOWN) {
        assert(p.target < p.reference_price);
        assert(p.reference_price < p.stop);
    }
}

class ThrowingStrategy : public IStrategy {
public:
    StrategyInfo getInfo() const override {
        StrategyInfo info;
        info.name = "Throwing";
        return info;
    }
    std::string getName() const override { return "Throwing"; }
    TradeProposal generateSignal(const std::vector<Bar>&) const override {
        throw std::runtime_error("broken indicator");
    }
};

} // namespace

int main() {
    std::cout << "[TEST] Starting Strategies Test..." << std::endl;

    StrategySettings settings;
    const HoldingPolicy policy(settings.holding, settings.analysis.t_plus_min, settings.analysis.t_plus_max);

    // 1. Holding policy table
    assert(policy.recommendHoldingDays(2.33, true) == 5);
    assert(policy.recommendHoldingDays(2.33, false) == 4);
    assert(policy.recommendHoldingDays(1.0, true) == 4);
    assert(policy.recommendHoldingDays(1.5, false) == 4);
    assert(policy.recommendHoldingDays(1.0, false) == 3);
    assert(policy.clamp(9) == 5);
    assert(policy.clamp(1) == 3);

    // 2. Breakout: concrete UP scenario
    const BreakoutStrategy breakout(settings.breakout, policy);
    {
        const auto bars = breakoutSeries();
        const auto p = breakout.generateSignal(bars);
        std::cout << "Breakout: " << directionToString(p.direction) << " target " << p.target
                  << " stop " << p.stop << " rr " << p.reward_risk << std::endl;
        assert(p.direction == Direction::UP);
        assert(near(p.target, common::roundPrice(110.0 * 1.07)));
        assert(near(p.stop, common::roundPrice(110.0 * 0.97)));
        assert(near(p.reward_risk, 2.33));
        assert(p.holding_days == 5);
        assert(!p.rationale.empty());
        checkLevelOrdering(p);

        // Same close on ordinary volume is not confirmed
        auto quiet = bars;
        quiet.back().volume = 1000.0;
        assert(breakout.generateSignal(quiet).direction == Direction::SIDEWAYS);

        // Short history stays neutral with the default band
        const std::vector<Bar> short_history(bars.begin(), bars.begin() + 20);
        const auto neutral = breakout.generateSignal(short_history);
        assert(neutral.direction == Direction::SIDEWAYS);
        assert(neutral.hasValidLevels());
        assert(neutral.holding_days == 5);

        assert(breakout.generateSignal({}).direction == Direction::SIDEWAYS);
    }

    // 2a. Breakout: DOWN through the prior support
    {
        const auto p = breakout.generateSignal(breakdownSeries());
        assert(p.direction == Direction::DOWN);
        assert(near(p.target, 83.7));
        assert(near(p.stop, 92.7));
        assert(near(p.reference_price, 90.0));
        assert(p.target < p.reference_price && p.reference_price < p.stop);
        assert(p.holding_days == 5);
        checkLevelOrdering(p);
    }

    // 2b. Breakout: a new high against a falling SMA20 is not confirmed
    {
        const auto dates = testing::tradingDates(Date(2024, 1, 2), 60);
        std::vector<Bar> bars;
        for (size_t i = 0; i < 59; ++i) {
            const double c = 110.0 - 0.1 * static_cast<double>(i);
            bars.emplace_back(dates[i], c, c + 0.5, c - 0.5, c, 1000.0);
        }
        // Above the 106.6 range high on double volume
        bars.emplace_back(dates[59], 105.0, 110.5, 104.5, 110.0, 2000.0);
        assert(breakout.generateSignal(bars).direction == Direction::SIDEWAYS);
    }

    // 3. Bollinger: touch-then-reclaim UP
    const MeanReversionStrategy bollinger(settings.mean_reversion, policy);
    {
        const auto bars = reclaimSeries();
        const auto p = bollinger.generateSignal(bars);
        std::cout << "Bollinger: " << directionToString(p.direction) << " target " << p.target
                  << " stop " << p.stop << " rr " << p.reward_risk << std::endl;
        assert(p.direction == Direction::UP);
        assert(near(p.target, 100.05));
        assert(p.stop < 96.0);
        assert(p.holding_days == 3);
        checkLevelOrdering(p);

        // Without the heavy touch bar the capitulation filter rejects it
        auto thin = bars;
        thin[58].volume = 500.0;
        assert(bollinger.generateSignal(thin).direction == Direction::SIDEWAYS);

        // Not enough bars for the 50-bar trend
        const std::vector<Bar> short_history(bars.end() - 40, bars.end());
        assert(bollinger.generateSignal(short_history).direction == Direction::SIDEWAYS);
    }

    // 3a. Bollinger: touch-then-reject DOWN
    {
        const auto p = bollinger.generateSignal(rejectionSeries());
        assert(p.direction == Direction::DOWN);
        assert(near(p.target, 99.95));
        assert(near(p.stop, 105.53));
        assert(near(p.reference_price, 101.0));
        assert(p.target < p.reference_price && p.reference_price < p.stop);
        assert(p.holding_days == 3);
        checkLevelOrdering(p);
    }

    // 3b. Bollinger: the same reclaim under a falling SMA50 is rejected
    {
        auto bars = reclaimSeries();
        for (size_t i = 0; i < 10; ++i) {
            bars[i].open += 10.0;
            bars[i].high += 10.0;
            bars[i].low += 10.0;
            bars[i].close += 10.0;
        }
        assert(bollinger.generateSignal(bars).direction == Direction::SIDEWAYS);
    }

    // 3c. Bollinger: bands narrower than 3% are rejected
    {
        auto bars = alternatingBars(99.6, 100.4, 0.2);
        const auto dates = testing::tradingDates(Date(2024, 1, 2), 60);
        bars.emplace_back(dates[58], 100.0, 100.6, 90.0, 100.4, 3000.0);
        bars.emplace_back(dates[59], 100.0, 100.1, 99.7, 99.9, 1000.0);
        assert(bollinger.generateSignal(bars).direction == Direction::SIDEWAYS);

        MeanReversionStrategyConfig no_bandwidth = settings.mean_reversion;
        no_bandwidth.min_bandwidth = 0.0;
        const MeanReversionStrategy unfiltered(no_bandwidth, policy);
        const auto p = unfiltered.generateSignal(bars);
        assert(p.direction == Direction::UP);
        checkLevelOrdering(p);
    }

    // 4. Fibonacci: valid neutral on short data, ordered levels otherwise
    const FibonacciStrategy fibonacci(settings.fibonacci, settings.analysis, policy);
    {
        const auto few = testing::flatBars(Date(2024, 1, 2), 5, 50.0, 1000.0);
        const auto p = fibonacci.generateSignal(few);
        assert(p.direction == Direction::SIDEWAYS);
        assert(p.hasValidLevels());
        assert(p.holding_days == 3);

        checkLevelOrdering(fibonacci.generateSignal(breakoutSeries()));
        checkLevelOrdering(fibonacci.generateSignal(reclaimSeries()));
    }

    // 5. No lookahead: rewriting the future never changes a past proposal
    {
        const std::vector<const IStrategy*> all{&breakout, &bollinger, &fibonacci};
        for (const auto* strategy : all) {
            auto bars = reclaimSeries();
            const auto extra = breakoutSeries();
            bars.insert(bars.end(), extra.begin() + 40, extra.end());
            const auto dates = testing::tradingDates(Date(2024, 1, 2), bars.size());
            for (size_t k = 0; k < bars.size(); ++k) {
                bars[k].date = dates[k];
            }
            for (size_t d = 30; d + 1 < bars.size(); d += 3) {
                const std::vector<Bar> prefix(bars.begin(), bars.begin() + static_cast<long>(d + 1));
                const auto before = strategy->generateSignal(prefix);

                auto rewritten = bars;
                for (size_t k = d + 1; k < rewritten.size(); ++k) {
                    rewritten[k].high *= 3.0;
                    rewritten[k].close *= 0.2;
                    rewritten[k].volume *= 10.0;
                }
                const std::vector<Bar> same_prefix(rewritten.begin(), rewritten.begin() + static_cast<long>(d + 1));
                const auto after = strategy->generateSignal(same_prefix);

                assert(before.direction == after.direction);
                assert(before.target == after.target);
                assert(before.stop == after.stop);
                assert(before.holding_days == after.holding_days);
                checkLevelOrdering(before);
            }
        }
    }

    // 6. Registry: config keys, aliases, order, isolation of a failing strategy
    {
        StrategyManager manager;
        manager.registerEnabled({"Breakout", "bb", "unknown", "range_breakout"}, settings);
        assert(manager.size() == 2);
        assert(manager.getStrategies()[0]->getName() == "Breakout");
        assert(manager.getStrategies()[1]->getName() == "Bollinger");
        assert(manager.getStrategy("bollinger") != nullptr);
        assert(manager.getStrategy("mean_reversion") != nullptr);
        assert(manager.getStrategy("fibonacci") == nullptr);
        assert(StrategyManager::createStrategy("fib", settings) != nullptr);
        assert(StrategyManager::createStrategy("rsi", settings) == nullptr);

        manager.registerStrategy(std::make_shared<ThrowingStrategy>());
        const auto signals = manager.collectSignals("TEST", breakoutSeries());
        assert(signals.size() == 2);
        assert(signals[0].strategy_name == "Breakout");
        assert(signals[0].proposal.direction == Direction::UP);
    }

    std::cout << "[TEST] Strategies Test PASSED!" << std::endl;
    return 0;
}
