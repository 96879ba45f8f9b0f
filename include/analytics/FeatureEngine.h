#pragma once

#include <map>
#include <string>
#include <vector>

#include "common/Types.h"
#include "engine/EngineConfig.h"

namespace signalbench {
namespace analytics {

enum class PricePosition { ABOVE, BELOW, UNKNOWN };

// Which attempt of the swing fallback policy produced the pair
enum class SwingMethod {
    CENTERED_WINDOW,        // configured window
    CENTERED_WINDOW_NARROW, // W = 3
    ROLLING_EXTREMES        // max high / min low of the last 60 bars
};

std::string pricePositionToString(PricePosition position);
std::string swingMethodToString(SwingMethod method);

struct SwingPair {
    double high;
    double low;
    SwingMethod method;
    int window;             // centered half-width, or rolling length

    SwingPair() : high(0), low(0), method(SwingMethod::ROLLING_EXTREMES), window(0) {}
};

struct FeatureSnapshot {
    Date date;
    double close;
    double pct_change;
    double sma;
    PricePosition price_position;
    double volume;
    double volume_sma;
    bool volume_spike;

    SwingPair swing;
    std::map<double, double> retracement;   // ratio -> price

    double nearest_support;
    double nearest_resistance;
    bool at_support;
    bool at_resistance;

    FeatureSnapshot()
        : close(0), pct_change(0), sma(0), price_position(PricePosition::UNKNOWN)
        , volume(0), volume_sma(0), volume_spike(false)
        , nearest_support(0), nearest_resistance(0)
        , at_support(false), at_resistance(false) {}
};

enum class FeatureStatus { OK, INSUFFICIENT_DATA };

struct FeatureResult {
    FeatureStatus status;
    int bars_required;
    FeatureSnapshot snapshot;

    FeatureResult() : status(FeatureStatus::INSUFFICIENT_DATA), bars_required(0) {}

    bool ok() const { return status == FeatureStatus::OK; }
};

// Swing indices found by one centered-window pass
struct SwingIndices {
    std::vector<size_t> highs;
    std::vector<size_t> lows;

    bool complete() const { return !highs.empty() && !lows.empty(); }
};

// Computes the daily feature snapshot from the series ending at the
// evaluation day. Pure: the same bars always give the same snapshot.
class FeatureEngine {
public:
    static constexpr int kNarrowSwingWindow = 3;
    static constexpr int kRollingExtremesBars = 60;
    static constexpr size_t kMinLookbackBars = 10;

    explicit FeatureEngine(const engine::AnalysisConfig& config);

    FeatureResult compute(const std::vector<Bar>& bars) const;

    // Bars dated on/after (last date - fib_lookback_months); whole series
    // when fewer than kMinLookbackBars remain
    std::vector<Bar> lookbackWindow(const std::vector<Bar>& bars) const;

    // Swing pair for `bars` (already restricted to the lookback window)
    // following CENTERED(W) -> CENTERED(3) -> ROLLING(60)
    SwingPair detectSwingPair(const std::vector<Bar>& window, double close) const;

    static SwingIndices findSwings(const std::vector<Bar>& bars, int window);
    static SwingPair rollingExtremes(const std::vector<Bar>& bars, int length);

    // Support: largest level strictly below close (else the minimum).
    // Resistance: smallest level strictly above close (else the maximum).
    static std::pair<double, double> nearestLevels(double close,
                                                   const std::map<double, double>& levels);

    // |close - level| / level <= pct; false when level is 0
    static bool isNear(double close, double level, double pct);

    const engine::AnalysisConfig& config() const { return config_; }

private:
    SwingPair selectTrendAwarePair(const std::vector<Bar>& window,
                                   const SwingIndices& swings,
                                   double close) const;

    engine::AnalysisConfig config_;
};

} // namespace analytics
} // namespace signalbench
