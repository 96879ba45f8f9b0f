#include "core/state/PositionStoreJson.h"
#include "common/Logger.h"

#include <cmath>
#include <fstream>
#include <system_error>

namespace signalbench {
namespace core {

namespace {
template <typename T>
nlohmann::json optionalToJson(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

std::optional<Date> dateField(const nlohmann::json& row, const char* key) {
    if (!row.contains(key) || !row[key].is_string()) {
        return std::nullopt;
    }
    return Date::parse(row[key].get<std::string>());
}

std::optional<double> numberField(const nlohmann::json& row, const char* key) {
    if (!row.contains(key) || !row[key].is_number()) {
        return std::nullopt;
    }
    const double value = row[key].get<double>();
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}
} // namespace

PositionStoreJson::PositionStoreJson(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {}

nlohmann::json PositionStoreJson::positionToJson(const Position& p) {
    nlohmann::json row;
    row["symbol"] = p.symbol;
    row["strategy"] = p.strategy;
    row["signal_date"] = p.signal_date.toString();
    row["direction"] = directionToString(p.direction);
    row["recommended_entry"] = p.recommended_entry;
    row["target"] = p.target;
    row["stop"] = p.stop;
    row["holding_days"] = p.holding_days;
    row["entry_date"] = p.entry_date.toString();
    row["entry_price"] = optionalToJson(p.entry_price);
    row["expected_exit_date"] = p.expected_exit_date.toString();
    row["exit_date"] = p.exit_date ? nlohmann::json(p.exit_date->toString()) : nlohmann::json(nullptr);
    row["exit_price"] = optionalToJson(p.exit_price);
    row["exit_reason"] = p.exit_reason ? nlohmann::json(exitReasonToString(*p.exit_reason))
                                       : nlohmann::json(nullptr);
    row["pnl_pct"] = optionalToJson(p.pnl_pct);
    row["status"] = positionStatusToString(p.status);
    return row;
}

std::optional<Position> PositionStoreJson::positionFromJson(const nlohmann::json& row) {
    if (!row.is_object()) {
        return std::nullopt;
    }

    Position p;
    p.symbol = row.value("symbol", std::string());
    p.strategy = row.value("strategy", std::string());
    if (p.symbol.empty() || p.strategy.empty()) {
        return std::nullopt;
    }

    const auto signal_date = dateField(row, "signal_date");
    const auto entry_date = dateField(row, "entry_date");
    const auto expected_exit = dateField(row, "expected_exit_date");
    const auto target = numberField(row, "target");
    const auto stop = numberField(row, "stop");
    if (!signal_date || !entry_date || !expected_exit || !target || !stop) {
        return std::nullopt;
    }

    const std::string direction = row.value("direction", std::string());
    if (direction != "UP" && direction != "DOWN") {
        return std::nullopt;
    }
    const auto status = positionStatusFromString(row.value("status", std::string()));
    if (!status) {
        return std::nullopt;
    }

    p.signal_date = *signal_date;
    p.entry_date = *entry_date;
    p.expected_exit_date = *expected_exit;
    p.direction = directionFromString(direction);
    p.target = *target;
    p.stop = *stop;
    p.recommended_entry = numberField(row, "recommended_entry").value_or(0.0);
    p.holding_days = row.value("holding_days", 0);
    p.status = *status;

    p.entry_price = numberField(row, "entry_price");
    p.exit_price = numberField(row, "exit_price");
    p.pnl_pct = numberField(row, "pnl_pct");
    p.exit_date = dateField(row, "exit_date");
    if (row.contains("exit_reason") && row["exit_reason"].is_string()) {
        p.exit_reason = exitReasonFromString(row["exit_reason"].get<std::string>());
    }

    // Lifecycle fields must agree with the status
    if (p.status != PositionStatus::PENDING && !p.entry_price) {
        return std::nullopt;
    }
    if (p.status == PositionStatus::CLOSED && (!p.exit_date || !p.exit_price || !p.exit_reason)) {
        return std::nullopt;
    }
    return p;
}

PositionLoadResult PositionStoreJson::load() {
    PositionLoadResult result;
    if (!std::filesystem::exists(file_path_)) {
        result.status = PositionLoadStatus::MISSING;
        return result;
    }

    result.status = PositionLoadStatus::UNREADABLE;
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        LOG_ERROR("Cannot open position file: {}", file_path_.string());
        return result;
    }

    nlohmann::json raw;
    try {
        in >> raw;
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Position file is not valid JSON ({}): {}", file_path_.string(), e.what());
        return result;
    }

    result.status = PositionLoadStatus::LOADED;
    PositionSnapshot& snapshot = result.snapshot;
    const nlohmann::json* rows = nullptr;
    if (raw.is_array()) {
        rows = &raw;
    } else if (raw.is_object()) {
        snapshot.schema_version = raw.value("schema_version", 1);
        snapshot.saved_at_ms = raw.value("saved_at_ms", 0LL);
        if (raw.contains("positions") && raw["positions"].is_array()) {
            rows = &raw["positions"];
        }
    }
    if (rows == nullptr) {
        LOG_WARN("Position file has no positions array: {}", file_path_.string());
        return result;
    }

    for (const auto& row : *rows) {
        std::optional<Position> position;
        try {
            position = positionFromJson(row);
        } catch (const nlohmann::json::exception& e) {
            LOG_WARN("Position row parse error: {}", e.what());
        }
        if (position) {
            snapshot.positions.push_back(*position);
        } else {
            ++snapshot.skipped_rows;
            LOG_WARN("Skipping malformed position row: {}", row.dump());
        }
    }
    return result;
}

bool PositionStoreJson::save(const PositionSnapshot& snapshot) {
    nlohmann::json raw;
    raw["schema_version"] = snapshot.schema_version;
    raw["saved_at_ms"] = snapshot.saved_at_ms;
    raw["positions"] = nlohmann::json::array();
    for (const auto& position : snapshot.positions) {
        raw["positions"].push_back(positionToJson(position));
    }

    std::error_code ec;
    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path(), ec);
        if (ec) {
            LOG_ERROR("Cannot create directory for {}: {}", file_path_.string(), ec.message());
            return false;
        }
    }

    auto tmp_path = file_path_;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return false;
        }
        out << raw.dump(2);
        if (!out) {
            return false;
        }
    }

    std::filesystem::rename(tmp_path, file_path_, ec);
    if (!ec) {
        return true;
    }

    // Rename over an existing file can fail on some filesystems; fall back to copy+remove.
    ec.clear();
    std::filesystem::copy_file(
        tmp_path,
        file_path_,
        std::filesystem::copy_options::overwrite_existing,
        ec
    );
    if (ec) {
        return false;
    }

    std::filesystem::remove(tmp_path, ec);
    return true;
}

} // namespace core
} // namespace signalbench
