#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"
#include "strategy/StrategyConfig.h"

namespace signalbench {

class Config {
public:
    static Config& getInstance();

    // Missing file keeps defaults; parse errors are reported and defaults kept
    void load(const std::string& config_path);
    // Apply an already parsed document on top of the current values.
    // Throws nlohmann::json::exception on a mistyped field; nothing is applied then.
    void loadFromJson(const nlohmann::json& j);
    // Back to built-in defaults
    void reset();

    engine::AnalysisConfig getAnalysisConfig() const { return analysis_config_; }
    engine::RunConfig getRunConfig() const { return run_config_; }
    std::string getLogLevel() const { return run_config_.log_level; }
    double getShares() const { return run_config_.shares; }

    void setEnabledStrategies(const std::vector<std::string>& v);

    // Strategy Configs
    strategy::MeanReversionStrategyConfig getMeanReversionConfig() const { return mean_reversion_config_; }
    strategy::BreakoutStrategyConfig getBreakoutConfig() const { return breakout_config_; }
    strategy::FibonacciStrategyConfig getFibonacciConfig() const { return fibonacci_config_; }
    strategy::HoldingPolicyConfig getHoldingPolicyConfig() const { return holding_policy_config_; }

    static std::string normalizeStrategyName(std::string name);

private:
    Config() = default;
    void applyJson(const nlohmann::json& j);
    void validate();

    engine::AnalysisConfig analysis_config_;
    engine::RunConfig run_config_;
    strategy::MeanReversionStrategyConfig mean_reversion_config_;
    strategy::BreakoutStrategyConfig breakout_config_;
    strategy::FibonacciStrategyConfig fibonacci_config_;
    strategy::HoldingPolicyConfig holding_policy_config_;
};

} // namespace signalbench
