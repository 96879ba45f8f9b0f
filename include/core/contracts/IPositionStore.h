#pragma once

#include <vector>

#include "core/model/TradeTypes.h"

namespace signalbench {
namespace core {

enum class PositionLoadStatus {
    LOADED,
    MISSING,        // no persisted state yet
    UNREADABLE      // file exists but cannot be read or parsed
};

struct PositionSnapshot {
    int schema_version = 1;
    long long saved_at_ms = 0;
    std::vector<Position> positions;
    int skipped_rows = 0;       // malformed rows dropped on load
};

struct PositionLoadResult {
    PositionLoadStatus status = PositionLoadStatus::MISSING;
    PositionSnapshot snapshot;
};

class IPositionStore {
public:
    virtual ~IPositionStore() = default;

    virtual PositionLoadResult load() = 0;
    virtual bool save(const PositionSnapshot& snapshot) = 0;
};

} // namespace core
} // namespace signalbench
