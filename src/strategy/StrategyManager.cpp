#include "strategy/StrategyManager.h"
#include "strategy/BreakoutStrategy.h"
#include "strategy/FibonacciStrategy.h"
#include "strategy/HoldingPolicy.h"
#include "strategy/MeanReversionStrategy.h"
#include "common/Config.h"
#include "common/Logger.h"
#include <algorithm>
#include <cctype>

namespace signalbench {
namespace strategy {
namespace {
std::string toLowerCopy(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}
}

StrategyPtr StrategyManager::createStrategy(const std::string& name, const StrategySettings& settings) {
    const std::string key = Config::normalizeStrategyName(name);
    const HoldingPolicy policy(settings.holding, settings.analysis.t_plus_min, settings.analysis.t_plus_max);

    if (key == "bollinger") {
        return std::make_shared<MeanReversionStrategy>(settings.mean_reversion, policy);
    }
    if (key == "breakout") {
        return std::make_shared<BreakoutStrategy>(settings.breakout, policy);
    }
    if (key == "fibonacci") {
        return std::make_shared<FibonacciStrategy>(settings.fibonacci, settings.analysis, policy);
    }
    return nullptr;
}

void StrategyManager::registerEnabled(const std::vector<std::string>& names, const StrategySettings& settings) {
    for (const auto& name : names) {
        auto strategy = createStrategy(name, settings);
        if (!strategy) {
            LOG_WARN("Unknown strategy in config: {}", name);
            continue;
        }
        if (getStrategy(strategy->getName())) {
            LOG_WARN("Strategy listed twice, ignoring: {}", name);
            continue;
        }
        registerStrategy(strategy);
    }
}

void StrategyManager::registerStrategy(StrategyPtr strategy) {
    if (!strategy) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);

    auto info = strategy->getInfo();
    strategies_.push_back(strategy);

    LOG_INFO("Strategy registered: {} (min bars: {})", info.name, info.min_bars);
}

StrategyPtr StrategyManager::getStrategy(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string wanted = toLowerCopy(name);
    const std::string key = Config::normalizeStrategyName(name);
    for (const auto& strategy : strategies_) {
        const std::string own = toLowerCopy(strategy->getName());
        if (own == wanted || own == key) {
            return strategy;
        }
    }
    return nullptr;
}

std::vector<StrategyPtr> StrategyManager::getStrategies() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return strategies_;
}

size_t StrategyManager::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return strategies_.size();
}

std::vector<StrategySignal> StrategyManager::collectSignals(
    const std::string& symbol,
    const std::vector<Bar>& history
) const {
    std::vector<StrategySignal> signals;

    for (const auto& strategy : getStrategies()) {
        try {
            StrategySignal signal;
            signal.strategy_name = strategy->getName();
            signal.proposal = strategy->generateSignal(history);
            if (signal.proposal.isDirectional()) {
                LOG_INFO("{} - {} signal: {} target {:.2f} stop {:.2f} rr {:.2f} T+{}",
                         symbol, signal.strategy_name, directionToString(signal.proposal.direction),
                         signal.proposal.target, signal.proposal.stop,
                         signal.proposal.reward_risk, signal.proposal.holding_days);
            }
            signals.push_back(std::move(signal));
        } catch (const std::exception& e) {
            LOG_ERROR("Strategy execution exception ({}, {}): {}", strategy->getName(), symbol, e.what());
        }
    }

    return signals;
}

} // namespace strategy
} // namespace signalbench
