#pragma once

namespace signalbench {
namespace strategy {

// Horizon table: rr >= strong_rr && spike -> strong_days,
// rr >= medium_rr || spike -> medium_days, else base_days
struct HoldingPolicyConfig {
    double strong_reward_risk = 2.0;
    double medium_reward_risk = 1.5;
    int strong_days = 5;
    int medium_days = 4;
    int base_days = 3;
};

struct MeanReversionStrategyConfig {
    int period = 20;
    double std_multiplier = 2.0;
    int trend_period = 50;
    int trend_lookback = 5;
    double min_bandwidth = 0.03;            // (upper - lower) / middle

    // Touch bar must trade at least this multiple of its own volume SMA
    double capitulation_volume_ratio = 1.0;
    // Current bar volume above this multiple counts as a spike
    double spike_volume_ratio = 1.2;

    double stop_buffer_pct = 0.015;         // beyond the touched band

    // Neutral band
    double neutral_target_pct = 0.02;
    double neutral_stop_pct = 0.01;
    int neutral_holding_days = 5;
};

struct BreakoutStrategyConfig {
    int lookback_period = 20;
    double volume_ratio = 1.5;          // current volume >= volume SMA x ratio
    int volume_period = 20;
    int trend_period = 20;
    int trend_lookback = 5;
    double target_pct = 0.07;
    double stop_pct = 0.03;
    double spike_volume_ratio = 1.2;
    int neutral_holding_days = 5;
};

struct FibonacciStrategyConfig {
    double stop_buffer_pct = 0.02;          // beyond the swing extreme
    int neutral_holding_days = 3;
};

} // namespace strategy
} // namespace signalbench
