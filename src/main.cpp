#include "common/Logger.h"
#include "common/Config.h"
#include "common/PathUtils.h"
#include "backtest/DataHistory.h"
#include "backtest/SimulationEngine.h"
#include "backtest/TradeRecordWriter.h"
#include "core/state/PositionStoreJson.h"
#include "engine/DailyRunner.h"
#include "engine/PerformanceStore.h"
#include "engine/PositionTracker.h"
#include "strategy/StrategyManager.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <string>
#include <vector>

using namespace signalbench;

namespace {

constexpr size_t kTopBuckets = 10;

void printUsage() {
    std::cout << "Usage:\n";
    std::cout << "  signalbench [--config path] simulate [SYMBOL...]\n";
    std::cout << "  signalbench [--config path] daily YYYY-MM-DD [SYMBOL...]\n";
}

std::string toUpperCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

std::filesystem::path resolvePath(const std::string& path) {
    if (std::filesystem::path(path).is_absolute()) {
        return path;
    }
    return utils::PathUtils::resolveRelativePath(path);
}

strategy::StrategySettings buildStrategySettings(const Config& config) {
    strategy::StrategySettings settings;
    settings.analysis = config.getAnalysisConfig();
    settings.holding = config.getHoldingPolicyConfig();
    settings.mean_reversion = config.getMeanReversionConfig();
    settings.breakout = config.getBreakoutConfig();
    settings.fibonacci = config.getFibonacciConfig();
    return settings;
}

// <data_dir>/<SYMBOL>.csv per symbol; symbols without a usable file are left out
std::map<std::string, std::vector<Bar>> loadSymbolBars(const std::vector<std::string>& symbols,
                                                       const std::filesystem::path& data_dir) {
    std::map<std::string, std::vector<Bar>> out;
    for (const auto& symbol : symbols) {
        const auto csv_path = data_dir / (symbol + ".csv");
        if (!std::filesystem::exists(csv_path)) {
            LOG_WARN("{}: data file not found: {}", symbol, csv_path.string());
            continue;
        }
        auto bars = backtest::DataHistory::loadCSV(csv_path.string());
        if (bars.empty()) {
            LOG_WARN("{}: no usable bars in {}", symbol, csv_path.string());
            continue;
        }
        out.emplace(symbol, std::move(bars));
    }
    return out;
}

void printPerformance(const engine::PerformanceStore& store) {
    std::cout << "\nStrategy comparison\n";
    std::cout << "---------------------------------------------\n";
    for (const auto& [name, s] : store.rankedStrategies()) {
        std::cout << "  - " << name
                  << " | trades=" << s.trades
                  << " | win=" << std::fixed << std::setprecision(1) << (s.winRate() * 100.0) << "%"
                  << " | pnl=" << std::setprecision(2) << s.net_profit
                  << " | pf=" << s.profitFactor()
                  << " | exp=" << s.expectancy()
                  << " | roc=" << (s.returnOnCapital() * 100.0) << "%"
                  << " | avg=" << s.averageReturnPct() << "%"
                  << " | up_acc=" << std::setprecision(1) << (s.upAccuracy() * 100.0) << "%"
                  << " | down_acc=" << (s.downAccuracy() * 100.0) << "%"
                  << " | sideways=" << s.sideways_trades << "\n";
        for (const auto& [month, pnl] : s.monthly_pnl) {
            std::cout << "      " << month << "  " << std::setprecision(2) << pnl << "\n";
        }
    }

    std::cout << "\nTop symbol x strategy by P&L\n";
    std::cout << "---------------------------------------------\n";
    int rank = 1;
    for (const auto& [key, s] : store.topBuckets(kTopBuckets)) {
        std::cout << std::setw(3) << rank++ << ". " << key.symbol << "/" << key.strategy_name
                  << " | trades=" << s.trades
                  << " | wins=" << s.wins
                  << " | win=" << std::fixed << std::setprecision(1) << (s.winRate() * 100.0) << "%"
                  << " | pnl=" << std::setprecision(2) << s.net_profit
                  << " | acc=" << std::setprecision(1) << (s.directionalAccuracy() * 100.0) << "%\n";
    }
    std::cout << "---------------------------------------------\n";
}

int runSimulate(const Config& config, const std::vector<std::string>& symbols) {
    const auto run = config.getRunConfig();
    const auto settings = buildStrategySettings(config);

    strategy::StrategyManager strategies;
    strategies.registerEnabled(run.enabled_strategies, settings);
    if (strategies.size() == 0) {
        LOG_ERROR("No strategies enabled");
        return 1;
    }

    const auto symbol_bars = loadSymbolBars(symbols, resolvePath(run.data_dir));
    backtest::SimulationEngine simulator(settings.analysis);

    std::vector<core::TradeRecord> all_trades;
    for (const auto& [symbol, bars] : symbol_bars) {
        try {
            auto trades = simulator.simulateAll(symbol, bars, strategies, run.shares);
            all_trades.insert(all_trades.end(), trades.begin(), trades.end());
        } catch (const std::exception& e) {
            LOG_ERROR("{}: simulation failed: {}", symbol, e.what());
        }
    }

    if (!backtest::TradeRecordWriter::writeCSV(resolvePath(run.trades_file).string(), all_trades)) {
        return 1;
    }

    engine::PerformanceStore performance;
    performance.rebuild(all_trades);
    printPerformance(performance);
    return 0;
}

int runDaily(const Config& config, const Date& today, const std::vector<std::string>& symbols) {
    const auto run = config.getRunConfig();
    const auto settings = buildStrategySettings(config);

    strategy::StrategyManager strategies;
    strategies.registerEnabled(run.enabled_strategies, settings);
    if (strategies.size() == 0) {
        LOG_ERROR("No strategies enabled");
        return 1;
    }

    core::PositionStoreJson store(resolvePath(run.positions_file));
    engine::PositionTracker tracker(settings.analysis);
    if (tracker.load(store) == core::PositionLoadStatus::UNREADABLE) {
        LOG_ERROR("Cannot read {}; fix or move it aside before the next daily run", run.positions_file);
        std::cout << "Error: position file is unreadable: " << run.positions_file << "\n";
        return 1;
    }

    const auto symbol_bars = loadSymbolBars(symbols, resolvePath(run.data_dir));
    engine::DailyRunner runner(strategies, tracker);
    const auto summary = runner.runDay(today, symbol_bars);

    const bool saved = tracker.save(store);

    std::cout << "\nDaily run summary - " << today.toString() << "\n";
    std::cout << "---------------------------------------------\n";
    for (Direction direction : {Direction::UP, Direction::DOWN}) {
        const auto list = summary.signalsWithDirection(direction);
        std::cout << directionToString(direction) << " signals (" << list.size() << "):";
        if (list.empty()) {
            std::cout << " none";
        }
        for (const auto& s : list) {
            std::cout << " " << s.symbol << "(" << s.signal.strategy_name << ")";
        }
        std::cout << "\n";
    }

    std::cout << "Closed today (" << summary.closed_today.size() << ")\n";
    for (const auto& p : summary.closed_today) {
        std::cout << "  " << p.symbol << "/" << p.strategy << " " << directionToString(p.direction)
                  << " -> " << (p.exit_reason ? core::exitReasonToString(*p.exit_reason) : "unknown") << " ";
        if (p.pnl_pct) {
            std::cout << std::showpos << std::fixed << std::setprecision(2) << *p.pnl_pct << "%" << std::noshowpos;
        } else {
            std::cout << "N/A";
        }
        std::cout << "\n";
    }
    std::cout << "Positions tracked: " << tracker.size() << "\n";
    std::cout << "---------------------------------------------\n";

    return (saved && summary.symbols_failed == 0) ? 0 : 1;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);

        std::string config_path = "config/config.json";
        if (args.size() >= 2 && args[0] == "--config") {
            config_path = args[1];
            args.erase(args.begin(), args.begin() + 2);
        }
        if (args.empty()) {
            printUsage();
            return 2;
        }

        auto& config = Config::getInstance();
        config.load(resolvePath(config_path).string());

        const auto run = config.getRunConfig();
        Logger::getInstance().initialize(run.log_dir, run.log_level);

        LOG_INFO("========================================");
        LOG_INFO("SignalBench");
        LOG_INFO("========================================");

        const std::string command = args[0];
        size_t next = 1;

        Date today;
        if (command == "daily") {
            const auto parsed = (args.size() > 1) ? Date::parse(args[1]) : std::optional<Date>();
            if (!parsed) {
                std::cout << "daily needs a date (YYYY-MM-DD)\n";
                printUsage();
                return 2;
            }
            today = *parsed;
            next = 2;
        } else if (command != "simulate") {
            std::cout << "Unknown command: " << command << "\n";
            printUsage();
            return 2;
        }

        std::vector<std::string> symbols;
        for (size_t i = next; i < args.size(); ++i) {
            symbols.push_back(toUpperCopy(args[i]));
        }
        if (symbols.empty()) {
            symbols = run.symbols;
        }

        if (command == "simulate") {
            return runSimulate(config, symbols);
        }
        return runDaily(config, today, symbols);
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cout << "\nError: " << e.what() << std::endl;
        return 1;
    }
}
