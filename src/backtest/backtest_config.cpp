#include "backtest/backtest_config.hpp"

#include <cmath>
#include <fstream>

#include "backtest/errors.hpp"
#include "time_utils.hpp"

namespace {

std::optional<int64_t> dateField(const nlohmann::json& section, const char* key) {
    if (!section.contains(key) || section[key].is_null()) {
        return std::nullopt;
    }

    const auto& value = section[key];
    if (value.is_number_integer()) {
        return value.get<int64_t>();
    }
    if (!value.is_string()) {
        throw ConfigError(std::string("'") + key + "' must be a date string or epoch seconds");
    }

    const auto text   = value.get<std::string>();
    const auto parsed = parseTimestamp(text);
    if (!parsed) {
        throw ConfigError(std::string("'") + key + "' is not a valid date: " + text);
    }
    return parsed;
}

std::size_t countField(const nlohmann::json& section, const char* key, std::size_t fallback) {
    if (!section.contains(key) || section[key].is_null()) {
        return fallback;
    }

    const auto& value = section[key];
    if (!value.is_number_integer() || (!value.is_number_unsigned() && value.get<int64_t>() < 0)) {
        throw ConfigError(std::string("'") + key + "' must be a non-negative integer");
    }
    return value.get<std::size_t>();
}

}  // namespace

std::string toString(OrderErrorPolicy policy) {
    switch (policy) {
    case OrderErrorPolicy::ABORT:
        return "abort";
    case OrderErrorPolicy::SKIP_BAR:
        return "skip_bar";
    }
    return "unknown";
}

OrderErrorPolicy orderErrorPolicyFromString(const std::string& text) {
    if (text == "abort") {
        return OrderErrorPolicy::ABORT;
    }
    if (text == "skip_bar") {
        return OrderErrorPolicy::SKIP_BAR;
    }
    throw ConfigError("unknown order_error_policy '" + text + "' (expected abort|skip_bar)");
}

void BacktestConfig::validate() const {
    if (!std::isfinite(initialCapital) || initialCapital <= 0.0) {
        throw ConfigError("initial_capital must be positive");
    }
    if (!std::isfinite(commission) || commission < 0.0 || commission >= 1.0) {
        throw ConfigError("commission must be in [0, 1)");
    }
    if (startDate && endDate && *endDate < *startDate) {
        throw ConfigError("end_date is before start_date");
    }
}

BacktestConfig parseBacktestConfig(const nlohmann::json& config) {
    BacktestConfig result;

    try {
        if (config.contains("account")) {
            const auto& account   = config["account"];
            result.initialCapital = account.value("initial_capital", result.initialCapital);
            result.commission     = account.value("commission", result.commission);
        }

        if (config.contains("window")) {
            const auto& window          = config["window"];
            result.startDate            = dateField(window, "start_date");
            result.endDate              = dateField(window, "end_date");
            result.relativeLookbackSize = countField(window, "relative_lookback_size", result.relativeLookbackSize);
        }

        if (config.contains("engine")) {
            const auto& engine    = config["engine"];
            result.lookbackWindow = countField(engine, "lookback_window", result.lookbackWindow);
            result.verbose        = engine.value("verbose", result.verbose);
            result.showTrades     = engine.value("show_trades", result.showTrades);
            result.quiet          = engine.value("quiet", result.quiet);
            if (engine.contains("order_error_policy")) {
                result.orderErrorPolicy = orderErrorPolicyFromString(engine["order_error_policy"].get<std::string>());
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid backtest config: ") + e.what());
    }

    result.validate();
    return result;
}

nlohmann::json loadJsonFile(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw ConfigError("cannot open: " + path);
    }

    try {
        nlohmann::json config;
        f >> config;
        return config;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("parse error in " + path + ": " + e.what());
    }
}
