#include "engine/PositionTracker.h"
#include "common/Logger.h"
#include "common/PriceHelper.h"
#include "core/execution/TradeExitRules.h"

#include <algorithm>
#include <chrono>
#include <cmath>

namespace signalbench {
namespace engine {

using core::Position;
using core::PositionStatus;
using core::execution::TradeExitRules;

std::string addSignalResultToString(AddSignalResult result) {
    switch (result) {
        case AddSignalResult::ADDED: return "added";
        case AddSignalResult::IGNORED_SIDEWAYS: return "ignored_sideways";
        case AddSignalResult::IGNORED_INVALID: return "ignored_invalid";
        case AddSignalResult::DUPLICATE: return "duplicate";
    }
    return "ignored_invalid";
}

PositionTracker::PositionTracker(const AnalysisConfig& config)
    : config_(config)
{
}

AddSignalResult PositionTracker::addSignal(
    const std::string& symbol,
    const std::string& strategy_name,
    const Date& signal_date,
    const strategy::TradeProposal& proposal,
    double reference_close
) {
    if (!proposal.isDirectional()) {
        return AddSignalResult::IGNORED_SIDEWAYS;
    }
    if (!proposal.hasValidLevels() || !std::isfinite(reference_close) || reference_close <= 0.0) {
        LOG_WARN("Invalid proposal skipped: {}/{}/{}", symbol, strategy_name, signal_date.toString());
        return AddSignalResult::IGNORED_INVALID;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    const core::PositionKey key{symbol, strategy_name, signal_date};
    if (keys_.count(key) > 0) {
        LOG_DEBUG("Duplicate signal skipped: {}/{}/{}", symbol, strategy_name, signal_date.toString());
        return AddSignalResult::DUPLICATE;
    }

    const int holding = std::min(std::max(proposal.holding_days, config_.t_plus_min), config_.t_plus_max);

    Position position;
    position.symbol = symbol;
    position.strategy = strategy_name;
    position.signal_date = signal_date;
    position.direction = proposal.direction;
    position.recommended_entry = common::roundPrice(
        reference_close * (proposal.direction == Direction::UP ? kLongEntryMarkup : kShortEntryMarkdown));
    position.target = proposal.target;
    position.stop = proposal.stop;
    position.holding_days = holding;
    position.entry_date = TradingCalendar::nextTradingDate(signal_date);
    position.expected_exit_date = TradingCalendar::addTradingDays(position.entry_date, holding);
    position.status = PositionStatus::PENDING;

    positions_.push_back(position);
    keys_.insert(key);

    LOG_INFO("Signal added: {}/{}/{} {} entry {} exit by {}",
             symbol, strategy_name, signal_date.toString(), directionToString(proposal.direction),
             position.entry_date.toString(), position.expected_exit_date.toString());
    return AddSignalResult::ADDED;
}

std::vector<Position> PositionTracker::updatePositions(const Date& today, const std::string& symbol, const Bar& bar) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Position> closed;

    auto last = last_update_.find(symbol);
    if (last != last_update_.end() && today < last->second) {
        LOG_WARN("{}: update for {} rejected, already applied {}", symbol, today.toString(), last->second.toString());
        return closed;
    }
    last_update_[symbol] = today;

    for (auto& position : positions_) {
        if (position.symbol != symbol || position.status == PositionStatus::CLOSED) {
            continue;
        }

        // 1. pending -> open on the entry day
        if (position.status == PositionStatus::PENDING) {
            if (position.entry_date != today) {
                continue;
            }
            position.entry_price = bar.open;
            position.status = PositionStatus::OPEN;
            LOG_INFO("{}/{}: pending -> open at {:.2f}", symbol, position.strategy, bar.open);
        }

        // 2. open -> target/stop on today's range, else horizon at the close
        const auto decision = TradeExitRules::checkBarExit(position.direction, position.target, position.stop, bar);
        if (decision) {
            closePosition(position, today, decision->reason, decision->price);
        } else if (today >= position.expected_exit_date) {
            closePosition(position, today, core::ExitReason::HORIZON_EXPIRED, bar.close);
        } else {
            continue;
        }
        closed.push_back(position);
    }

    return closed;
}

void PositionTracker::closePosition(Position& position, const Date& today,
                                    core::ExitReason reason, double exit_price) {
    position.exit_date = today;
    position.exit_price = exit_price;
    position.exit_reason = reason;

    const double entry = position.entry_price.value_or(0.0);
    if (entry > 0.0) {
        position.pnl_pct = common::roundPercent(TradeExitRules::pnlPercent(position.direction, entry, exit_price));
    }
    position.status = PositionStatus::CLOSED;

    LOG_INFO("{}/{}: closed via {} at {:.2f}", position.symbol, position.strategy,
             core::exitReasonToString(reason), exit_price);
    Logger::getInstance().logTrade(position.symbol, position.strategy, directionToString(position.direction),
                                   entry, exit_price, core::exitReasonToString(reason),
                                   position.pnl_pct.value_or(0.0));
}

std::vector<Position> PositionTracker::getOpenPositions(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Position> open;
    for (const auto& position : positions_) {
        if (position.symbol == symbol && position.status != PositionStatus::CLOSED) {
            open.push_back(position);
        }
    }
    return open;
}

std::vector<Position> PositionTracker::getAllPositions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return positions_;
}

size_t PositionTracker::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return positions_.size();
}

core::PositionLoadStatus PositionTracker::load(core::IPositionStore& store) {
    const auto loaded = store.load();

    std::lock_guard<std::mutex> lock(mutex_);
    positions_.clear();
    keys_.clear();
    last_update_.clear();
    load_status_ = loaded.status;
    if (loaded.status != core::PositionLoadStatus::LOADED) {
        return loaded.status;
    }

    const auto& snapshot = loaded.snapshot;
    for (const auto& position : snapshot.positions) {
        if (keys_.insert(position.key()).second) {
            positions_.push_back(position);

            // Latest day already applied to this symbol
            Date applied = position.signal_date;
            if (position.status != PositionStatus::PENDING && position.entry_date > applied) {
                applied = position.entry_date;
            }
            if (position.exit_date && *position.exit_date > applied) {
                applied = *position.exit_date;
            }
            auto it = last_update_.find(position.symbol);
            if (it == last_update_.end() || it->second < applied) {
                last_update_[position.symbol] = applied;
            }
        } else {
            LOG_WARN("Duplicate persisted position dropped: {}/{}/{}",
                     position.symbol, position.strategy, position.signal_date.toString());
        }
    }
    LOG_INFO("Positions loaded: {} rows ({} skipped)", positions_.size(), snapshot.skipped_rows);
    return loaded.status;
}

bool PositionTracker::save(core::IPositionStore& store) const {
    core::PositionSnapshot snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (load_status_ == core::PositionLoadStatus::UNREADABLE) {
            LOG_ERROR("Positions not saved: the stored file could not be read and would be overwritten");
            return false;
        }
        snapshot.positions = positions_;
    }
    snapshot.saved_at_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();

    const bool ok = store.save(snapshot);
    if (ok) {
        LOG_INFO("Positions saved: {} rows", snapshot.positions.size());
    } else {
        LOG_ERROR("Positions save failed");
    }
    return ok;
}

} // namespace engine
} // namespace signalbench
