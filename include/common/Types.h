#pragma once

#include <string>
#include <vector>

#include "common/TradingCalendar.h"

namespace signalbench {

enum class Direction { UP, DOWN, SIDEWAYS };

inline std::string directionToString(Direction direction) {
    switch (direction) {
        case Direction::UP: return "UP";
        case Direction::DOWN: return "DOWN";
        case Direction::SIDEWAYS: return "SIDEWAYS";
    }
    return "SIDEWAYS";
}

// Unknown text maps to SIDEWAYS
inline Direction directionFromString(const std::string& text) {
    if (text == "UP") return Direction::UP;
    if (text == "DOWN") return Direction::DOWN;
    return Direction::SIDEWAYS;
}

// One trading day of OHLCV
struct Bar {
    Date date;
    double open;
    double high;
    double low;
    double close;
    double volume;

    Bar() : open(0), high(0), low(0), close(0), volume(0) {}

    Bar(const Date& d, double o, double h, double l, double c, double v)
        : date(d), open(o), high(h), low(l), close(c), volume(v) {}
};

} // namespace signalbench
