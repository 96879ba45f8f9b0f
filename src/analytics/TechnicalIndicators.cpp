#include "analytics/TechnicalIndicators.h"
#include "common/PriceHelper.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace signalbench {
namespace analytics {

double TechnicalIndicators::calculateSMA(const std::vector<double>& values, int period) {
    if (period <= 0 || values.size() < static_cast<size_t>(period)) return 0.0;

    double sum = 0.0;
    for (size_t i = values.size() - period; i < values.size(); ++i) {
        sum += values[i];
    }

    return sum / period;
}

std::optional<double> TechnicalIndicators::calculateSMAAt(
    const std::vector<double>& values,
    size_t end_index,
    int period
) {
    if (period <= 0 || end_index >= values.size() || end_index + 1 < static_cast<size_t>(period)) {
        return std::nullopt;
    }

    double sum = 0.0;
    for (size_t i = end_index + 1 - period; i <= end_index; ++i) {
        sum += values[i];
    }
    return sum / period;
}

std::optional<double> TechnicalIndicators::calculateStdDevAt(
    const std::vector<double>& values,
    size_t end_index,
    int period
) {
    if (period < 2) {
        return std::nullopt;
    }
    const auto mean = calculateSMAAt(values, end_index, period);
    if (!mean) {
        return std::nullopt;
    }

    double sum_sq = 0.0;
    for (size_t i = end_index + 1 - period; i <= end_index; ++i) {
        const double diff = values[i] - *mean;
        sum_sq += diff * diff;
    }
    return std::sqrt(sum_sq / (period - 1));
}

std::optional<TechnicalIndicators::BollingerBands> TechnicalIndicators::calculateBollingerBandsAt(
    const std::vector<double>& prices,
    size_t end_index,
    int period,
    double std_dev_mult
) {
    const auto middle = calculateSMAAt(prices, end_index, period);
    const auto std_dev = calculateStdDevAt(prices, end_index, period);
    if (!middle || !std_dev) {
        return std::nullopt;
    }

    BollingerBands result;
    result.middle = *middle;
    result.upper = result.middle + (*std_dev * std_dev_mult);
    result.lower = result.middle - (*std_dev * std_dev_mult);
    result.bandwidth = result.middle > 0.0 ? (result.upper - result.lower) / result.middle : 0.0;
    return result;
}

double TechnicalIndicators::highestHigh(const std::vector<Bar>& bars, size_t begin, size_t end) {
    double best = -std::numeric_limits<double>::infinity();
    for (size_t i = begin; i < end && i < bars.size(); ++i) {
        best = std::max(best, bars[i].high);
    }
    return best;
}

double TechnicalIndicators::lowestLow(const std::vector<Bar>& bars, size_t begin, size_t end) {
    double best = std::numeric_limits<double>::infinity();
    for (size_t i = begin; i < end && i < bars.size(); ++i) {
        best = std::min(best, bars[i].low);
    }
    return best;
}

std::map<double, double> TechnicalIndicators::calculateFibonacciLevels(
    double high,
    double low,
    const std::vector<double>& ratios
) {
    std::map<double, double> levels;
    const double diff = high - low;
    for (double ratio : ratios) {
        levels[ratio] = common::roundPrice(high - ratio * diff);
    }
    return levels;
}

bool TechnicalIndicators::isLocalMaximum(const std::vector<Bar>& bars, size_t index, int window) {
    if (window < 0 || index >= bars.size()) return false;
    const size_t w = static_cast<size_t>(window);
    const size_t begin = index >= w ? index - w : 0;
    const size_t end = std::min(bars.size(), index + w + 1);
    return bars[index].high == highestHigh(bars, begin, end);
}

bool TechnicalIndicators::isLocalMinimum(const std::vector<Bar>& bars, size_t index, int window) {
    if (window < 0 || index >= bars.size()) return false;
    const size_t w = static_cast<size_t>(window);
    const size_t begin = index >= w ? index - w : 0;
    const size_t end = std::min(bars.size(), index + w + 1);
    return bars[index].low == lowestLow(bars, begin, end);
}

std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<Bar>& bars) {
    std::vector<double> prices;
    prices.reserve(bars.size());
    for (const auto& bar : bars) {
        prices.push_back(bar.close);
    }
    return prices;
}

std::vector<double> TechnicalIndicators::extractVolumes(const std::vector<Bar>& bars) {
    std::vector<double> volumes;
    volumes.reserve(bars.size());
    for (const auto& bar : bars) {
        volumes.push_back(bar.volume);
    }
    return volumes;
}

} // namespace analytics
} // namespace signalbench
