#include "backtest/TradeRecordWriter.h"
#include "common/Logger.h"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace signalbench {
namespace backtest {

std::string TradeRecordWriter::header() {
    return "symbol,strategy,signal_date,entry_date,exit_date,direction,entry_price,target,stop,"
           "holding_days,exit_price,exit_reason,shares,pnl,pnl_pct,result";
}

std::string TradeRecordWriter::toCsvRow(const core::TradeRecord& t) {
    std::ostringstream oss;
    oss << t.symbol << ','
        << t.strategy << ','
        << t.signal_date.toString() << ','
        << t.entry_date.toString() << ','
        << t.exit_date.toString() << ','
        << directionToString(t.direction) << ','
        << std::fixed << std::setprecision(2) << t.entry_price << ','
        << t.target << ','
        << t.stop << ','
        << t.holding_days << ','
        << t.exit_price << ','
        << core::exitReasonToString(t.exit_reason) << ','
        << std::setprecision(0) << t.shares << ','
        << std::setprecision(2) << t.pnl << ','
        << t.pnl_pct << ','
        << core::tradeResultToString(t.result);
    return oss.str();
}

bool TradeRecordWriter::writeCSV(const std::string& file_path, const std::vector<core::TradeRecord>& trades) {
    const std::filesystem::path path(file_path);
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            LOG_ERROR("Cannot create directory for {}: {}", file_path, ec.message());
            return false;
        }
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        LOG_ERROR("Cannot open trade file for writing: {}", file_path);
        return false;
    }

    out << header() << '\n';
    for (const auto& trade : trades) {
        out << toCsvRow(trade) << '\n';
    }
    if (!out) {
        LOG_ERROR("Write failed: {}", file_path);
        return false;
    }

    LOG_INFO("Wrote {} trades to {}", trades.size(), file_path);
    return true;
}

} // namespace backtest
} // namespace signalbench
