#pragma once
// ===================================================================
// Price rounding helpers
//
// Proposal levels and retracement prices are quoted with 2 decimals,
// position P&L percentages with 4 decimals.
// ===================================================================

#include <cmath>

namespace signalbench {
namespace common {

inline double roundTo(double value, int decimals) {
    if (!std::isfinite(value)) {
        return value;
    }
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

inline double roundPrice(double price) {
    return roundTo(price, 2);
}

inline double roundPercent(double pct) {
    return roundTo(pct, 4);
}

} // namespace common
} // namespace signalbench
