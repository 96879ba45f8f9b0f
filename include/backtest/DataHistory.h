#pragma once

#include <optional>
#include <string>
#include <vector>
#include "common/Types.h"

namespace signalbench {
namespace backtest {

class DataHistory {
public:
    // Load daily bars from a CSV file
    // Expected format: date,open,high,low,close,volume (header optional,
    // columns located by header name when present; "time" is accepted for date).
    // Malformed rows are skipped. Output is sorted ascending by date; for a
    // duplicated date the row appearing last in the file wins.
    static std::vector<Bar> loadCSV(const std::string& file_path);

    // Bars dated on or before `date` (the series as of that day)
    static std::vector<Bar> sliceUpTo(const std::vector<Bar>& bars, const Date& date);

    // Sort ascending and drop duplicate dates (last occurrence wins)
    static void normalize(std::vector<Bar>& bars);
};

} // namespace backtest
} // namespace signalbench
