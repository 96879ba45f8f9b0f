#include "backtest/SimulationEngine.h"
#include "backtest/TradeRecordWriter.h"
#include "engine/PerformanceStore.h"
#include "engine/PositionTracker.h"
#include "strategy/BreakoutStrategy.h"
#include "strategy/HoldingPolicy.h"
#include "BarFixtures.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

using namespace signalbench;
using core::ExitReason;

namespace {

bool near(double a, double b, double eps = 1e-6) {
    return std::abs(a - b) < eps;
}

// Breakout on bar 60, entry at 110 on bar 61, range-bound until bar 66
// whose high clears the +7% target.
std::vector<Bar> scenarioSeries() {
    const auto dates = testing::tradingDates(Date(2024, 1, 2), 67);
    std::vector<Bar> bars;
    for (size_t i = 0; i < 60; ++i) {
        const double c = 100.0 + 0.1 * static_cast<double>(i);
        bars.emplace_back(dates[i], c, c + 0.5, c - 0.5, c, 1000.0);
    }
    bars.emplace_back(dates[60], 106.0, 110.5, 105.5, 110.0, 2000.0);
    for (size_t i = 61; i < 66; ++i) {
        bars.emplace_back(dates[i], 110.0, 112.0, 108.0, 110.0, 1000.0);
    }
    bars.emplace_back(dates[66], 111.0, 118.0, 110.0, 117.0, 1000.0);
    return bars;
}

const core::TradeRecord* findTrade(const std::vector<core::TradeRecord>& trades, const Date& signal_date) {
    for (const auto& t : trades) {
        if (t.signal_date == signal_date) return &t;
    }
    return nullptr;
}

// Fixed long proposal around the last close; remembers the last date it saw
class FixedLongStrategy : public strategy::IStrategy {
public:
    explicit FixedLongStrategy(double target_pct = 0.05, double stop_pct = 0.05)
        : target_pct_(target_pct), stop_pct_(stop_pct) {}

    strategy::StrategyInfo getInfo() const override {
        strategy::StrategyInfo info;
        info.name = "FixedLong";
        return info;
    }
    std::string getName() const override { return "FixedLong"; }

    strategy::TradeProposal generateSignal(const std::vector<Bar>& history) const override {
        seen_.push_back(history.back().date);
        strategy::TradeProposal p;
        const double close = history.back().close;
        p.direction = Direction::UP;
        p.reference_price = close;
        p.target = close * (1.0 + target_pct_);
        p.stop = close * (1.0 - stop_pct_);
        p.holding_days = 3;
        return p;
    }

    mutable std::vector<Date> seen_;

private:
    double target_pct_;
    double stop_pct_;
};

class NanStrategy : public FixedLongStrategy {
public:
    std::string getName() const override { return "Nan"; }
    strategy::TradeProposal generateSignal(const std::vector<Bar>& history) const override {
        auto p = FixedLongStrategy::generateSignal(history);
        p.target = std::numeric_limits<double>::quiet_NaN();
        return p;
    }
};

class FailingStrategy : public FixedLongStrategy {
public:
    std::string getName() const override { return "Failing"; }
    strategy::TradeProposal generateSignal(const std::vector<Bar>&) const override {
        throw std::runtime_error("no data");
    }
};

} // namespace

int main() {
    std::cout << "[TEST] Starting SimulationEngine Test..." << std::endl;

    engine::AnalysisConfig config;
    backtest::SimulationEngine simulator(config);
    strategy::StrategySettings settings;
    const strategy::HoldingPolicy policy(settings.holding, config.t_plus_min, config.t_plus_max);
    const strategy::BreakoutStrategy breakout(settings.breakout, policy);

    // 1. Breakout scenario end to end
    {
        const auto bars = scenarioSeries();
        backtest::SimulationFunnel funnel;
        const auto trades = simulator.simulate("TEST", bars, breakout, 100.0, &funnel);
        assert(trades.size() == 6);             // d = 60 .. 65
        assert(funnel.days_evaluated == 6);
        assert(funnel.trades == 6);

        const auto* t = findTrade(trades, bars[60].date);
        assert(t != nullptr);
        assert(t->strategy == "Breakout");
        assert(t->direction == Direction::UP);
        assert(t->entry_date == bars[61].date);
        assert(near(t->entry_price, 110.0));
        assert(near(t->target, 117.7));
        assert(near(t->stop, 106.7));
        assert(t->holding_days == 5);
        assert(t->exit_reason == ExitReason::TARGET_HIT);
        assert(t->exit_date == bars[66].date);
        assert(near(t->exit_price, 117.7));
        assert(near(t->pnl, 770.0));
        assert(near(t->pnl_pct, 7.0));
        assert(t->result == core::TradeResult::WIN);

        // Last evaluation day: nothing left to check, horizon at the final close
        const auto* last = findTrade(trades, bars[65].date);
        assert(last != nullptr);
        assert(last->direction == Direction::SIDEWAYS);
        assert(last->exit_reason == ExitReason::HORIZON_EXPIRED);
        assert(last->exit_date == bars[66].date);
        assert(near(last->exit_price, 117.0));

        const std::string row = backtest::TradeRecordWriter::toCsvRow(*t);
        assert(row.find("TEST,Breakout,") == 0);
        assert(row.find(",target-hit,") != std::string::npos);
        assert(row.find(",770.00,") != std::string::npos);
    }

    // 2. Target wins when one bar reaches both levels
    {
        auto bars = scenarioSeries();
        bars[62].high = 120.0;
        bars[62].low = 100.0;
        const auto trades = simulator.simulate("TEST", bars, breakout, 100.0);
        const auto* t = findTrade(trades, bars[60].date);
        assert(t != nullptr);
        assert(t->exit_reason == ExitReason::TARGET_HIT);
        assert(t->exit_date == bars[62].date);
    }

    // 3. The entry bar itself is not checked for exits
    {
        auto bars = scenarioSeries();
        bars[61].high = 200.0;
        const auto trades = simulator.simulate("TEST", bars, breakout, 100.0);
        const auto* t = findTrade(trades, bars[60].date);
        assert(t != nullptr);
        assert(t->exit_date == bars[66].date);
    }

    // 4. The strategy only ever sees bars up to the evaluation day
    {
        const auto bars = testing::flatBars(Date(2024, 1, 2), 70, 50.0, 1000.0);
        FixedLongStrategy fixed_long;
        const auto trades = simulator.simulate("FLAT", bars, fixed_long, 10.0);
        assert(trades.size() == 9);             // d = 60 .. 68
        assert(fixed_long.seen_.size() == 9);
        for (size_t k = 0; k < trades.size(); ++k) {
            assert(fixed_long.seen_[k] == trades[k].signal_date);
            assert(trades[k].signal_date < trades[k].entry_date);
            // Flat bars never reach +/-5%: horizon after 3 days, clipped at the end
            assert(trades[k].exit_reason == ExitReason::HORIZON_EXPIRED);
            assert(trades[k].result == core::TradeResult::BREAKEVEN);
        }
        assert(trades.back().exit_date == bars.back().date);
    }

    // 5. Not enough bars, invalid proposals and throwing strategies
    {
        const auto short_bars = testing::flatBars(Date(2024, 1, 2), 61, 50.0, 1000.0);
        FixedLongStrategy fixed_long;
        assert(simulator.simulate("SHORT", short_bars, fixed_long, 10.0).empty());

        const auto bars = testing::flatBars(Date(2024, 1, 2), 65, 50.0, 1000.0);
        NanStrategy nan_strategy;
        backtest::SimulationFunnel funnel;
        assert(simulator.simulate("NAN", bars, nan_strategy, 10.0, &funnel).empty());
        assert(funnel.invalid_proposals == 4);

        FailingStrategy failing;
        backtest::SimulationFunnel fail_funnel;
        assert(simulator.simulate("FAIL", bars, failing, 10.0, &fail_funnel).empty());
        assert(fail_funnel.strategy_errors == 4);

        auto zero_open = bars;
        zero_open[61].open = 0.0;
        backtest::SimulationFunnel open_funnel;
        assert(simulator.simulate("ZERO", zero_open, fixed_long, 10.0, &open_funnel).size() == 3);
        assert(open_funnel.invalid_entry_price == 1);
    }

    // 6. Aggregation: SIDEWAYS trades do not enter P&L
    {
        const auto trades = simulator.simulate("TEST", scenarioSeries(), breakout, 100.0);
        engine::PerformanceStore store;
        store.rebuild(trades);
        const auto& stats = store.byStrategy().at("Breakout");
        assert(stats.trades == 1);
        assert(stats.wins == 1);
        assert(stats.sideways_trades == 5);
        assert(near(stats.net_profit, 770.0));
        assert(near(stats.capital_deployed, 11000.0));
        assert(near(stats.winRate(), 1.0));
        assert(stats.up_signals == 1 && stats.up_correct == 1);
        assert(near(stats.upAccuracy(), 1.0));
        // Signal on 2024-03-26, exit on 2024-04-03: booked in the signal month
        assert(stats.monthly_pnl.size() == 1);
        assert(near(stats.monthly_pnl.at("2024-03"), 770.0));

        assert(store.byBucket().size() == 1);
        const auto top = store.topBuckets(10);
        assert(top.size() == 1);
        assert(top[0].first.symbol == "TEST");
        assert(top[0].first.strategy_name == "Breakout");
    }

    // 6a. Strategies rank by return on capital, not by raw P&L
    {
        auto make = [](const std::string& strategy_name, double entry, double pnl) {
            core::TradeRecord t;
            t.symbol = "VCB";
            t.strategy = strategy_name;
            t.direction = Direction::UP;
            t.signal_date = Date(2024, 2, 1);
            t.exit_date = Date(2024, 2, 7);
            t.entry_price = entry;
            t.shares = 100.0;
            t.exit_price = entry + pnl / t.shares;
            t.pnl = pnl;
            t.result = core::TradeResult::WIN;
            return t;
        };
        engine::PerformanceStore store;
        store.rebuild({make("Small", 100.0, 500.0), make("Large", 200.0, 600.0)});
        const auto ranked = store.rankedStrategies();
        assert(ranked.size() == 2);
        assert(ranked[0].first == "Small");         // 5% on 10000
        assert(ranked[1].first == "Large");         // 3% on 20000
        assert(store.topBuckets(10)[0].first.strategy_name == "Large");
    }

    // 7. A missing weekday bar: the horizon follows the trading calendar, as in the tracker
    {
        engine::AnalysisConfig gap_config;
        gap_config.simulation_min_lookback = 1;
        backtest::SimulationEngine gap_simulator(gap_config);

        // Wednesday 2024-01-10 has no bar
        std::vector<Bar> bars;
        for (const Date& date : {Date(2024, 1, 5), Date(2024, 1, 8), Date(2024, 1, 9), Date(2024, 1, 11),
                                 Date(2024, 1, 12), Date(2024, 1, 15), Date(2024, 1, 16)}) {
            bars.emplace_back(date, 50.0, 50.5, 49.5, 50.0, 1000.0);
        }

        FixedLongStrategy fixed_long;
        const auto trades = gap_simulator.simulate("GAP", bars, fixed_long, 10.0);
        const auto* t = findTrade(trades, Date(2024, 1, 8));
        assert(t != nullptr);
        assert(t->entry_date == Date(2024, 1, 9));
        assert(t->exit_reason == ExitReason::HORIZON_EXPIRED);
        assert(t->exit_date == Date(2024, 1, 12));

        engine::PositionTracker tracker(gap_config);
        strategy::TradeProposal p;
        p.direction = Direction::UP;
        p.reference_price = 50.0;
        p.target = 52.5;
        p.stop = 47.5;
        p.holding_days = 3;
        assert(tracker.addSignal("GAP", "FixedLong", Date(2024, 1, 8), p, 50.0) == engine::AddSignalResult::ADDED);
        assert(tracker.getAllPositions().front().expected_exit_date == t->exit_date);
    }

    std::cout << "[TEST] SimulationEngine Test PASSED!" << std::endl;
    return 0;
}
