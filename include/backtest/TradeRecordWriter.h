#pragma once

#include <string>
#include <vector>
#include "core/model/TradeTypes.h"

namespace signalbench {
namespace backtest {

// Simulation trades as CSV, one row per trade
class TradeRecordWriter {
public:
    static std::string header();
    static std::string toCsvRow(const core::TradeRecord& trade);

    // Overwrites `file_path`; false when the file cannot be written
    static bool writeCSV(const std::string& file_path, const std::vector<core::TradeRecord>& trades);
};

} // namespace backtest
} // namespace signalbench
