#include "common/Config.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace signalbench {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string upperCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return trimCopy(s);
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

std::string Config::normalizeStrategyName(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    name = trimCopy(name);

    // Aliases
    if (name == "mean_reversion" || name == "bollinger_band" || name == "bb") {
        return "bollinger";
    }
    if (name == "range_breakout") {
        return "breakout";
    }
    if (name == "fib" || name == "fibonacci_retracement") {
        return "fibonacci";
    }
    return name;
}

void Config::setEnabledStrategies(const std::vector<std::string>& v) {
    run_config_.enabled_strategies.clear();
    for (const auto& name : v) {
        run_config_.enabled_strategies.push_back(normalizeStrategyName(name));
    }
}

void Config::reset() {
    analysis_config_ = engine::AnalysisConfig();
    run_config_ = engine::RunConfig();
    mean_reversion_config_ = strategy::MeanReversionStrategyConfig();
    breakout_config_ = strategy::BreakoutStrategyConfig();
    fibonacci_config_ = strategy::FibonacciStrategyConfig();
    holding_policy_config_ = strategy::HoldingPolicyConfig();
}

void Config::load(const std::string& path) {
    try {
        std::filesystem::path config_path;
        if (std::filesystem::path(path).is_absolute()) {
            config_path = path;
        } else {
            config_path = utils::PathUtils::resolveRelativePath(path);
        }

        std::cout << "Config path: " << config_path << std::endl;

        if (!std::filesystem::exists(config_path)) {
            std::cout << "Warning: config file not found: " << config_path << std::endl;
            std::cout << "Using defaults." << std::endl;
            return;
        }

        std::ifstream file(config_path);
        if (!file.is_open()) {
            std::cout << "Warning: cannot open config file." << std::endl;
            return;
        }

        nlohmann::json j;
        file >> j;
        loadFromJson(j);

        std::cout << "Config loaded: symbols=" << run_config_.symbols.size()
                  << ", strategies=" << run_config_.enabled_strategies.size()
                  << ", sma_period=" << analysis_config_.sma_period << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Config load error: " << e.what() << std::endl;
    }
}

void Config::loadFromJson(const nlohmann::json& j) {
    // A type error part way through leaves the previous values in place
    const auto analysis_backup = analysis_config_;
    const auto run_backup = run_config_;
    const auto mean_reversion_backup = mean_reversion_config_;
    const auto breakout_backup = breakout_config_;
    const auto fibonacci_backup = fibonacci_config_;
    const auto holding_backup = holding_policy_config_;
    try {
        applyJson(j);
    } catch (const nlohmann::json::exception&) {
        analysis_config_ = analysis_backup;
        run_config_ = run_backup;
        mean_reversion_config_ = mean_reversion_backup;
        breakout_config_ = breakout_backup;
        fibonacci_config_ = fibonacci_backup;
        holding_policy_config_ = holding_backup;
        throw;
    }

    validate();
}

void Config::applyJson(const nlohmann::json& j) {
    if (j.contains("analysis")) {
        const auto& a = j["analysis"];
        analysis_config_.sma_period = a.value("sma_period", 20);
        analysis_config_.volume_spike_ratio = a.value("volume_spike_ratio", 1.2);
        analysis_config_.fib_lookback_months = a.value("fib_lookback_months", 6);
        analysis_config_.swing_window = a.value("swing_window", 5);
        analysis_config_.fib_proximity_pct = a.value("fib_proximity_pct", 0.015);
        if (a.contains("fib_levels")) {
            analysis_config_.fib_levels = a["fib_levels"].get<std::vector<double>>();
        }
        analysis_config_.t_plus_min = a.value("t_plus_min", 3);
        analysis_config_.t_plus_max = a.value("t_plus_max", 5);
        analysis_config_.simulation_min_lookback = a.value("simulation_min_lookback", 60);
    }

    if (j.contains("simulation")) {
        run_config_.shares = j["simulation"].value("shares", 100.0);
    }

    if (j.contains("holding_policy")) {
        const auto& h = j["holding_policy"];
        holding_policy_config_.strong_reward_risk = h.value("strong_reward_risk", 2.0);
        holding_policy_config_.medium_reward_risk = h.value("medium_reward_risk", 1.5);
        holding_policy_config_.strong_days = h.value("strong_days", 5);
        holding_policy_config_.medium_days = h.value("medium_days", 4);
        holding_policy_config_.base_days = h.value("base_days", 3);
    }

    if (j.contains("strategies") && j["strategies"].contains("bollinger")) {
        const auto& s = j["strategies"]["bollinger"];
        mean_reversion_config_.period = s.value("period", 20);
        mean_reversion_config_.std_multiplier = s.value("std_multiplier", 2.0);
        mean_reversion_config_.trend_period = s.value("trend_period", 50);
        mean_reversion_config_.trend_lookback = s.value("trend_lookback", 5);
        mean_reversion_config_.min_bandwidth = s.value("min_bandwidth", 0.03);
        mean_reversion_config_.capitulation_volume_ratio = s.value("capitulation_volume_ratio", 1.0);
        mean_reversion_config_.spike_volume_ratio = s.value("spike_volume_ratio", 1.2);
        mean_reversion_config_.stop_buffer_pct = s.value("stop_buffer_pct", 0.015);
        mean_reversion_config_.neutral_target_pct = s.value("neutral_target_pct", 0.02);
        mean_reversion_config_.neutral_stop_pct = s.value("neutral_stop_pct", 0.01);
        mean_reversion_config_.neutral_holding_days = s.value("neutral_holding_days", 5);
    }

    if (j.contains("strategies") && j["strategies"].contains("breakout")) {
        const auto& s = j["strategies"]["breakout"];
        breakout_config_.lookback_period = s.value("lookback_period", 20);
        breakout_config_.volume_ratio = s.value("volume_ratio", 1.5);
        breakout_config_.volume_period = s.value("volume_period", 20);
        breakout_config_.trend_period = s.value("trend_period", 20);
        breakout_config_.trend_lookback = s.value("trend_lookback", 5);
        breakout_config_.target_pct = s.value("target_pct", 0.07);
        breakout_config_.stop_pct = s.value("stop_pct", 0.03);
        breakout_config_.spike_volume_ratio = s.value("spike_volume_ratio", 1.2);
        breakout_config_.neutral_holding_days = s.value("neutral_holding_days", 5);
    }

    if (j.contains("strategies") && j["strategies"].contains("fibonacci")) {
        const auto& s = j["strategies"]["fibonacci"];
        fibonacci_config_.stop_buffer_pct = s.value("stop_buffer_pct", 0.02);
        fibonacci_config_.neutral_holding_days = s.value("neutral_holding_days", 3);
    }

    if (j.contains("run")) {
        const auto& r = j["run"];
        if (r.contains("symbols")) {
            run_config_.symbols.clear();
            for (const auto& symbol : r["symbols"].get<std::vector<std::string>>()) {
                const std::string normalized = upperCopy(symbol);
                if (!normalized.empty()) {
                    run_config_.symbols.push_back(normalized);
                }
            }
        }
        if (r.contains("enabled_strategies")) {
            setEnabledStrategies(r["enabled_strategies"].get<std::vector<std::string>>());
        }
        run_config_.data_dir = r.value("data_dir", std::string("data"));
        run_config_.positions_file = r.value("positions_file", std::string("reports/open_positions.json"));
        run_config_.trades_file = r.value("trades_file", std::string("reports/simulation_trades.csv"));
        run_config_.log_dir = r.value("log_dir", std::string("logs"));
        run_config_.log_level = r.value("log_level", std::string("info"));
    }
}

void Config::validate() {
    auto& a = analysis_config_;
    if (a.sma_period < 1) {
        std::cout << "Warning: analysis.sma_period < 1, using 20" << std::endl;
        a.sma_period = 20;
    }
    if (a.swing_window < 1) {
        std::cout << "Warning: analysis.swing_window < 1, using 5" << std::endl;
        a.swing_window = 5;
    }
    if (a.fib_lookback_months < 0) {
        a.fib_lookback_months = 0;
    }
    if (a.t_plus_min < 1) {
        a.t_plus_min = 1;
    }
    if (a.t_plus_max < a.t_plus_min) {
        std::cout << "Warning: analysis.t_plus_max < t_plus_min, clamping" << std::endl;
        a.t_plus_max = a.t_plus_min;
    }
    if (a.simulation_min_lookback < 1) {
        a.simulation_min_lookback = 1;
    }
    if (a.fib_levels.empty()) {
        a.fib_levels = engine::AnalysisConfig().fib_levels;
    }
    if (run_config_.shares <= 0.0) {
        std::cout << "Warning: simulation.shares <= 0, using 100" << std::endl;
        run_config_.shares = 100.0;
    }
    if (breakout_config_.lookback_period < 1) {
        breakout_config_.lookback_period = 20;
    }
    if (breakout_config_.stop_pct <= 0.0) {
        breakout_config_.stop_pct = 0.03;
    }
}

} // namespace signalbench
