#include "engine/PerformanceStore.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace signalbench {
namespace engine {
namespace {
std::string monthKey(const Date& date) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d", date.year, date.month);
    return std::string(buf);
}

void accumulateStats(StrategyPerformanceStats& s, const core::TradeRecord& trade) {
    if (trade.direction == Direction::SIDEWAYS) {
        s.sideways_trades++;
        return;
    }

    s.trades++;
    s.net_profit += trade.pnl;
    s.capital_deployed += trade.entry_price * trade.shares;
    s.sum_return_pct += trade.pnl_pct;
    s.monthly_pnl[monthKey(trade.signal_date)] += trade.pnl;

    if (trade.result == core::TradeResult::WIN) {
        s.wins++;
        s.gross_profit += trade.pnl;
    } else if (trade.result == core::TradeResult::LOSS) {
        s.losses++;
        s.gross_loss_abs += std::abs(trade.pnl);
    }

    if (trade.direction == Direction::UP) {
        s.up_signals++;
        if (trade.exit_price > trade.entry_price) s.up_correct++;
    } else {
        s.down_signals++;
        if (trade.exit_price < trade.entry_price) s.down_correct++;
    }
}
}

void PerformanceStore::rebuild(const std::vector<core::TradeRecord>& trades) {
    by_strategy_.clear();
    by_bucket_.clear();

    for (const auto& trade : trades) {
        const std::string strategy_name = trade.strategy.empty() ? "unknown" : trade.strategy;
        accumulateStats(by_strategy_[strategy_name], trade);

        PerformanceBucketKey key;
        key.symbol = trade.symbol;
        key.strategy_name = strategy_name;
        accumulateStats(by_bucket_[key], trade);
    }
}

std::vector<std::pair<std::string, StrategyPerformanceStats>> PerformanceStore::rankedStrategies() const {
    std::vector<std::pair<std::string, StrategyPerformanceStats>> ranked(by_strategy_.begin(), by_strategy_.end());
    std::sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
        const double roc_a = a.second.returnOnCapital();
        const double roc_b = b.second.returnOnCapital();
        if (roc_a != roc_b) {
            return roc_a > roc_b;
        }
        return a.first < b.first;
    });
    return ranked;
}

std::vector<std::pair<PerformanceBucketKey, StrategyPerformanceStats>> PerformanceStore::topBuckets(size_t limit) const {
    std::vector<std::pair<PerformanceBucketKey, StrategyPerformanceStats>> ranked(by_bucket_.begin(), by_bucket_.end());
    std::sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
        if (a.second.net_profit != b.second.net_profit) {
            return a.second.net_profit > b.second.net_profit;
        }
        if (a.first.symbol != b.first.symbol) {
            return a.first.symbol < b.first.symbol;
        }
        return a.first.strategy_name < b.first.strategy_name;
    });
    if (ranked.size() > limit) {
        ranked.resize(limit);
    }
    return ranked;
}

} // namespace engine
} // namespace signalbench
