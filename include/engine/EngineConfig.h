#pragma once

#include <string>
#include <vector>

namespace signalbench {
namespace engine {

// Indicator and horizon parameters shared by the feature engine,
// the strategies and both runners
struct AnalysisConfig {
    int sma_period = 20;
    double volume_spike_ratio = 1.2;    // volume > SMA x ratio
    int fib_lookback_months = 6;
    int swing_window = 5;               // centered window half-width
    double fib_proximity_pct = 0.015;   // |close - level| / level
    std::vector<double> fib_levels{0.0, 0.236, 0.382, 0.5, 0.618, 0.786, 1.0};
    int t_plus_min = 3;
    int t_plus_max = 5;
    int simulation_min_lookback = 60;
};

// Universe, strategies and file locations for the executable
struct RunConfig {
    std::vector<std::string> symbols{
        "ACB", "BCM", "BID", "BVH", "CTG", "FPT", "GAS", "GVR", "HDB", "HPG",
        "MBB", "MSN", "MWG", "PLX", "POW", "SAB", "SHB", "SSB", "SSI", "STB",
        "TCB", "TPB", "VCB", "VHM", "VIB", "VIC", "VJC", "VNM", "VPB", "VRE"
    };
    std::vector<std::string> enabled_strategies{"bollinger", "breakout"};
    std::string data_dir = "data";
    std::string positions_file = "reports/open_positions.json";
    std::string trades_file = "reports/simulation_trades.csv";
    std::string log_dir = "logs";
    std::string log_level = "info";
    double shares = 100.0;
};

} // namespace engine
} // namespace signalbench
