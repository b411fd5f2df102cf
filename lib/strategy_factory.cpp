#include "strategy_factory.hpp"

#include <stdexcept>

#include "backtest/errors.hpp"
#include "macd_strategy.hpp"
#include "rsi_strategy.hpp"
#include "sma_crossover.hpp"

std::unique_ptr<IStrategy> makeStrategy(const nlohmann::json& config) {
    try {
        const auto name = config.at("name").get<std::string>();

        if (name == "sma_crossover") {
            return std::make_unique<SmaCrossover>(config.value("short", std::size_t{20}),
                                                  config.value("long", std::size_t{50}),
                                                  config.value("stop_loss", 0.0));
        }
        if (name == "rsi") {
            return std::make_unique<RsiStrategy>(config.value("period", std::size_t{14}),
                                                 config.value("oversold", 30.0), config.value("overbought", 70.0),
                                                 config.value("allocation", 1.0));
        }
        if (name == "macd") {
            return std::make_unique<MacdStrategy>(config.value("fast", std::size_t{12}),
                                                  config.value("slow", std::size_t{26}),
                                                  config.value("signal", std::size_t{9}),
                                                  config.value("trend", std::size_t{100}));
        }

        throw ConfigError("unknown strategy '" + name + "' (expected sma_crossover|rsi|macd)");
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid strategy section: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }
}
