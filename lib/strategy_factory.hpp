#pragma once

#include <memory>

#include <nlohmann/json.hpp>

#include "strategy/istrategy.hpp"

/**
 * @brief Build a bundled strategy from the "strategy" config section.
 *
 * @example {"name": "sma_crossover", "short": 20, "long": 50, "stop_loss": 0.05}
 * @example {"name": "rsi", "period": 14, "oversold": 30, "overbought": 70}
 * @example {"name": "macd", "fast": 12, "slow": 26, "signal": 9, "trend": 100}
 *
 * @throws ConfigError on an unknown name or invalid parameters.
 */
[[nodiscard]] std::unique_ptr<IStrategy> makeStrategy(const nlohmann::json& config);
