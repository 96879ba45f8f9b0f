#pragma once

#include "core/model/TradeTypes.h"
#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace signalbench {
namespace engine {

// Directional trades feed P&L; SIDEWAYS trades are only counted
struct StrategyPerformanceStats {
    int trades = 0;
    int wins = 0;
    int losses = 0;
    int sideways_trades = 0;
    double gross_profit = 0.0;
    double gross_loss_abs = 0.0;
    double net_profit = 0.0;
    double capital_deployed = 0.0;      // sum of entry_price x shares
    double sum_return_pct = 0.0;

    int up_signals = 0;
    int up_correct = 0;                 // exit above entry
    int down_signals = 0;
    int down_correct = 0;               // exit below entry

    std::map<std::string, double> monthly_pnl;  // "YYYY-MM" of the signal date

    double winRate() const {
        return (trades > 0) ? (static_cast<double>(wins) / static_cast<double>(trades)) : 0.0;
    }
    double expectancy() const {
        return (trades > 0) ? (net_profit / static_cast<double>(trades)) : 0.0;
    }
    double profitFactor() const {
        return (gross_loss_abs > 1e-12) ? (gross_profit / gross_loss_abs) : 0.0;
    }
    double returnOnCapital() const {
        return (capital_deployed > 0.0) ? (net_profit / capital_deployed) : 0.0;
    }
    double averageReturnPct() const {
        return (trades > 0) ? (sum_return_pct / static_cast<double>(trades)) : 0.0;
    }
    double upAccuracy() const {
        return (up_signals > 0) ? (static_cast<double>(up_correct) / up_signals) : 0.0;
    }
    double downAccuracy() const {
        return (down_signals > 0) ? (static_cast<double>(down_correct) / down_signals) : 0.0;
    }
    double directionalAccuracy() const {
        const int total = up_signals + down_signals;
        return (total > 0) ? (static_cast<double>(up_correct + down_correct) / total) : 0.0;
    }
};

struct PerformanceBucketKey {
    std::string symbol;
    std::string strategy_name;

    bool operator==(const PerformanceBucketKey& other) const {
        return symbol == other.symbol && strategy_name == other.strategy_name;
    }
};

struct PerformanceBucketKeyHash {
    std::size_t operator()(const PerformanceBucketKey& key) const {
        std::size_t h1 = std::hash<std::string>{}(key.symbol);
        std::size_t h2 = std::hash<std::string>{}(key.strategy_name);
        return h1 ^ (h2 << 1);
    }
};

// Aggregate simulated trade outcomes into strategy-level and
// symbol x strategy stats.
class PerformanceStore {
public:
    void rebuild(const std::vector<core::TradeRecord>& trades);

    const std::unordered_map<std::string, StrategyPerformanceStats>& byStrategy() const {
        return by_strategy_;
    }
    const std::unordered_map<PerformanceBucketKey, StrategyPerformanceStats, PerformanceBucketKeyHash>& byBucket() const {
        return by_bucket_;
    }

    // Strategies by return on capital, best first
    std::vector<std::pair<std::string, StrategyPerformanceStats>> rankedStrategies() const;
    // Symbol x strategy buckets by net profit, best first, at most `limit`
    std::vector<std::pair<PerformanceBucketKey, StrategyPerformanceStats>> topBuckets(size_t limit) const;

private:
    std::unordered_map<std::string, StrategyPerformanceStats> by_strategy_;
    std::unordered_map<PerformanceBucketKey, StrategyPerformanceStats, PerformanceBucketKeyHash> by_bucket_;
};

} // namespace engine
} // namespace signalbench
