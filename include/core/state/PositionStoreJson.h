#pragma once

#include <filesystem>
#include <optional>

#include <nlohmann/json.hpp>

#include "core/contracts/IPositionStore.h"

namespace signalbench {
namespace core {

class PositionStoreJson : public IPositionStore {
public:
    explicit PositionStoreJson(std::filesystem::path file_path);

    PositionLoadResult load() override;
    bool save(const PositionSnapshot& snapshot) override;

    static nlohmann::json positionToJson(const Position& position);
    // nullopt for rows with missing or malformed fields
    static std::optional<Position> positionFromJson(const nlohmann::json& row);

private:
    std::filesystem::path file_path_;
};

} // namespace core
} // namespace signalbench
