#pragma once

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "common/Types.h"
#include "core/contracts/IPositionStore.h"
#include "core/model/TradeTypes.h"
#include "engine/EngineConfig.h"
#include "strategy/IStrategy.h"

namespace signalbench {
namespace engine {

enum class AddSignalResult {
    ADDED,
    IGNORED_SIDEWAYS,
    IGNORED_INVALID,
    DUPLICATE
};

std::string addSignalResultToString(AddSignalResult result);

// Live lifecycle of proposals across end-of-day runs.
//
// PENDING (signal day) -> OPEN (filled at the entry day's open) -> CLOSED
// (target, stop or horizon). CLOSED positions are never modified again.
// The tracker owns its position set between load() and save(); the mutex
// serializes callers so per-symbol workers may share one tracker.
class PositionTracker {
public:
    static constexpr double kLongEntryMarkup = 1.001;
    static constexpr double kShortEntryMarkdown = 0.999;

    explicit PositionTracker(const AnalysisConfig& config);

    AddSignalResult addSignal(
        const std::string& symbol,
        const std::string& strategy_name,
        const Date& signal_date,
        const strategy::TradeProposal& proposal,
        double reference_close
    );

    // Applies today's bar to the symbol's PENDING/OPEN positions and returns
    // the positions closed by this call. An update dated before the last one
    // applied to the same symbol is rejected and returns nothing.
    std::vector<core::Position> updatePositions(const Date& today, const std::string& symbol, const Bar& bar);

    // PENDING and OPEN positions of `symbol`
    std::vector<core::Position> getOpenPositions(const std::string& symbol) const;
    std::vector<core::Position> getAllPositions() const;
    size_t size() const;

    // Replaces the in-memory set with the store's content and re-arms the
    // per-symbol ordering guard from it. On MISSING or UNREADABLE the set is
    // left empty; after UNREADABLE, save() refuses to overwrite the store.
    core::PositionLoadStatus load(core::IPositionStore& store);
    bool save(core::IPositionStore& store) const;

private:
    void closePosition(core::Position& position, const Date& today,
                       core::ExitReason reason, double exit_price);

    AnalysisConfig config_;
    std::vector<core::Position> positions_;
    std::set<core::PositionKey> keys_;
    std::map<std::string, Date> last_update_;
    core::PositionLoadStatus load_status_ = core::PositionLoadStatus::MISSING;
    mutable std::mutex mutex_;
};

} // namespace engine
} // namespace signalbench
