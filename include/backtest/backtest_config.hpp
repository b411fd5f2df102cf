#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

/**
 * @brief What the runner does when an order error escapes strategy logic.
 */
enum class OrderErrorPolicy
{
    ABORT,     // fail the run with StrategyLogicError
    SKIP_BAR,  // log it and continue with the next bar
};

[[nodiscard]] std::string      toString(OrderErrorPolicy policy);
[[nodiscard]] OrderErrorPolicy orderErrorPolicyFromString(const std::string& text);

struct BacktestConfig {
    double initialCapital = 10000.0;

    /**
     * @brief Commission rate in [0, 1), charged on both sides.
     */
    double commission = 0.0;

    /**
     * @brief First bar at or after this timestamp starts the run. Unset = first bar.
     */
    std::optional<int64_t> startDate;

    /**
     * @brief Last bar at or before this timestamp ends the run. Unset = last bar.
     */
    std::optional<int64_t> endDate;

    /**
     * @brief Without a start date, run only the last N bars. 0 = all bars.
     */
    std::size_t relativeLookbackSize = 0;

    /**
     * @brief Size of the price lookback handed to logic(). 0 = unbounded.
     */
    std::size_t lookbackWindow = 0;

    OrderErrorPolicy orderErrorPolicy = OrderErrorPolicy::ABORT;

    bool verbose    = false;
    bool showTrades = false;

    /**
     * @brief Drop the runner's informational std::clog lines (run banner, cancellation).
     *        Warnings and errors on std::cerr are unaffected.
     */
    bool quiet = false;

    /**
     * @throws ConfigError on out-of-range values.
     */
    void validate() const;
};

/**
 * @brief Build a BacktestConfig from the "account", "window" and "engine" sections.
 *
 * @example {
 *  "account": {"initial_capital": 10000, "commission": 0.001},
 *  "window":  {"start_date": "2021-01-01", "end_date": "2022-01-01"},
 *  "engine":  {"lookback_window": 200, "order_error_policy": "skip_bar", "verbose": false, "show_trades": true}
 * }
 * @throws ConfigError on wrong types, unparsable dates or out-of-range values.
 */
[[nodiscard]] BacktestConfig parseBacktestConfig(const nlohmann::json& config);

/**
 * @brief Read and parse a JSON document from disk.
 * @throws ConfigError if the file cannot be opened or parsed.
 */
[[nodiscard]] nlohmann::json loadJsonFile(const std::string& path);
