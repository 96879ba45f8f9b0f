#include "core/state/PositionStoreJson.h"
#include "engine/PositionTracker.h"
#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>

using namespace signalbench;
using namespace signalbench::core;

namespace {

Position makePosition(const std::string& symbol, PositionStatus status) {
    Position p;
    p.symbol = symbol;
    p.strategy = "Breakout";
    p.signal_date = Date(2024, 1, 9);
    p.direction = Direction::UP;
    p.recommended_entry = 100.1;
    p.target = 107.0;
    p.stop = 97.0;
    p.holding_days = 5;
    p.entry_date = Date(2024, 1, 10);
    p.expected_exit_date = Date(2024, 1, 17);
    p.status = status;
    if (status != PositionStatus::PENDING) {
        p.entry_price = 100.5;
    }
    if (status == PositionStatus::CLOSED) {
        p.exit_date = Date(2024, 1, 12);
        p.exit_price = 107.0;
        p.exit_reason = ExitReason::TARGET_HIT;
        p.pnl_pct = 6.4677;
    }
    return p;
}

void writeText(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path, std::ios::trunc);
    out << text;
}

} // namespace

int main() {
    std::cout << "[TEST] Starting PositionStore Test..." << std::endl;

    const auto dir = std::filesystem::temp_directory_path() / "signalbench_test_store";
    std::filesystem::remove_all(dir);
    const auto file = dir / "nested" / "open_positions.json";

    // 1. Missing file: nothing to load
    PositionStoreJson store(file);
    assert(store.load().status == PositionLoadStatus::MISSING);

    // 2. Save creates the directory and round-trips every lifecycle stage
    {
        PositionSnapshot snapshot;
        snapshot.saved_at_ms = 1704844800000LL;
        snapshot.positions.push_back(makePosition("VCB", PositionStatus::PENDING));
        snapshot.positions.push_back(makePosition("FPT", PositionStatus::OPEN));
        snapshot.positions.push_back(makePosition("HPG", PositionStatus::CLOSED));
        assert(store.save(snapshot));
        assert(std::filesystem::exists(file));
        assert(!std::filesystem::exists(file.string() + ".tmp"));

        const auto result = store.load();
        assert(result.status == PositionLoadStatus::LOADED);
        const auto* loaded = &result.snapshot;
        assert(loaded->saved_at_ms == 1704844800000LL);
        assert(loaded->skipped_rows == 0);
        assert(loaded->positions.size() == 3);

        const auto& pending = loaded->positions[0];
        assert(pending.symbol == "VCB");
        assert(pending.status == PositionStatus::PENDING);
        assert(!pending.entry_price && !pending.exit_date && !pending.pnl_pct);
        assert(pending.expected_exit_date == Date(2024, 1, 17));

        const auto& closed = loaded->positions[2];
        assert(closed.status == PositionStatus::CLOSED);
        assert(closed.exit_reason == ExitReason::TARGET_HIT);
        assert(closed.exit_date == Date(2024, 1, 12));
        assert(std::abs(*closed.pnl_pct - 6.4677) < 1e-9);
        assert(closed.key() == makePosition("HPG", PositionStatus::CLOSED).key());

        const auto row = PositionStoreJson::positionToJson(pending);
        assert(row["status"] == "pending");
        assert(row["entry_price"].is_null());
        assert(row["signal_date"] == "2024-01-09");
    }

    // 3. Malformed rows are skipped, the rest load
    {
        nlohmann::json rows = nlohmann::json::array();
        rows.push_back(PositionStoreJson::positionToJson(makePosition("VCB", PositionStatus::OPEN)));

        auto no_target = PositionStoreJson::positionToJson(makePosition("FPT", PositionStatus::OPEN));
        no_target.erase("target");
        rows.push_back(no_target);

        auto closed_without_exit = PositionStoreJson::positionToJson(makePosition("HPG", PositionStatus::CLOSED));
        closed_without_exit["exit_price"] = nullptr;
        rows.push_back(closed_without_exit);

        auto bad_date = PositionStoreJson::positionToJson(makePosition("MWG", PositionStatus::PENDING));
        bad_date["signal_date"] = "09/01/2024";
        rows.push_back(bad_date);

        rows.push_back("not an object");

        auto sideways = PositionStoreJson::positionToJson(makePosition("SSI", PositionStatus::PENDING));
        sideways["direction"] = "SIDEWAYS";
        rows.push_back(sideways);

        writeText(file, rows.dump());
        const auto result = store.load();
        assert(result.status == PositionLoadStatus::LOADED);
        assert(result.snapshot.positions.size() == 1);
        assert(result.snapshot.positions[0].symbol == "VCB");
        assert(result.snapshot.skipped_rows == 5);
    }

    // 4. Unparsable document is reported apart from a missing one
    {
        writeText(file, "{ \"positions\": [ ");
        const auto broken = store.load();
        assert(broken.status == PositionLoadStatus::UNREADABLE);
        assert(broken.snapshot.positions.empty());

        writeText(file, "{ \"schema_version\": 1 }");
        const auto empty = store.load();
        assert(empty.status == PositionLoadStatus::LOADED && empty.snapshot.positions.empty());
    }

    // 5. A tracker that read an unreadable file never overwrites it
    {
        const std::string corrupt = "{ \"positions\": [ {\"symbol\": \"VCB\"";
        writeText(file, corrupt);

        engine::PositionTracker tracker{engine::AnalysisConfig()};
        assert(tracker.load(store) == PositionLoadStatus::UNREADABLE);
        assert(tracker.size() == 0);

        strategy::TradeProposal p;
        p.direction = Direction::UP;
        p.target = 110.0;
        p.stop = 95.0;
        p.holding_days = 3;
        assert(tracker.addSignal("FPT", "Breakout", Date(2024, 1, 10), p, 100.0) == engine::AddSignalResult::ADDED);
        assert(!tracker.save(store));

        std::ifstream in(file);
        const std::string kept((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        assert(kept == corrupt);
    }

    std::filesystem::remove_all(dir);
    std::cout << "[TEST] PositionStore Test PASSED!" << std::endl;
    return 0;
}
