#pragma once

#include <vector>
#include <map>
#include <optional>
#include "common/Types.h"

namespace signalbench {
namespace analytics {

// Technical indicators over daily bars. All "At" variants evaluate the
// window ending at end_index inclusive and never read past it.
class TechnicalIndicators {
public:
    // SMA over the latest `period` values (0.0 when there are fewer)
    static double calculateSMA(const std::vector<double>& values, int period);

    // SMA over values[end_index - period + 1 .. end_index]
    static std::optional<double> calculateSMAAt(const std::vector<double>& values,
                                                size_t end_index, int period);

    // Sample standard deviation (n - 1) over the same window
    static std::optional<double> calculateStdDevAt(const std::vector<double>& values,
                                                   size_t end_index, int period);

    // Bollinger Bands - SMA +/- mult x sample std
    struct BollingerBands {
        double upper;
        double middle;
        double lower;
        double bandwidth;   // (upper - lower) / middle, 0 when middle <= 0

        BollingerBands() : upper(0), middle(0), lower(0), bandwidth(0) {}
    };
    static std::optional<BollingerBands> calculateBollingerBandsAt(
        const std::vector<double>& prices,
        size_t end_index,
        int period = 20,
        double std_dev_mult = 2.0);

    // Highest high / lowest low over bars[begin, end)
    static double highestHigh(const std::vector<Bar>& bars, size_t begin, size_t end);
    static double lowestLow(const std::vector<Bar>& bars, size_t begin, size_t end);

    // Retracement price per ratio: high - ratio x (high - low), rounded to 2 decimals
    static std::map<double, double> calculateFibonacciLevels(double high, double low,
                                                             const std::vector<double>& ratios);

    // Centered-window extremes: bars[index] is the max high (min low)
    // of bars[index - window .. index + window]
    static bool isLocalMaximum(const std::vector<Bar>& bars, size_t index, int window);
    static bool isLocalMinimum(const std::vector<Bar>& bars, size_t index, int window);

    // Helper: column extraction
    static std::vector<double> extractClosePrices(const std::vector<Bar>& bars);
    static std::vector<double> extractVolumes(const std::vector<Bar>& bars);
};

} // namespace analytics
} // namespace signalbench
