#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

/**
 * @brief Base class of every error raised by the backtesting core.
 */
class BacktestError: public std::runtime_error {
   public:
    explicit BacktestError(const std::string& msg)
        : std::runtime_error(msg) {}
};

/**
 * @brief Malformed or out-of-order bar input. Construction of the series is aborted.
 */
class InvalidBarData: public BacktestError {
   public:
    InvalidBarData(const std::string& msg, std::size_t index)
        : BacktestError(msg + " (bar " + std::to_string(index) + ")")
        , index_(index) {}

    [[nodiscard]] std::size_t index() const noexcept { return index_; }

   private:
    std::size_t index_;
};

class IndexOutOfRange: public BacktestError {
   public:
    IndexOutOfRange(std::size_t index, std::size_t length)
        : BacktestError("index " + std::to_string(index) + " out of range [0, " + std::to_string(length) + ")") {}
};

/**
 * @brief Indicator series whose length does not match the bar series.
 */
class AlignmentError: public BacktestError {
   public:
    explicit AlignmentError(const std::string& msg)
        : BacktestError(msg) {}
};

/**
 * @brief Requested backtest window contains no bars.
 */
class DateOutOfRange: public BacktestError {
   public:
    explicit DateOutOfRange(const std::string& msg)
        : BacktestError(msg) {}
};

/* ----- Order-level errors, raised by Account ----- */

class OrderError: public BacktestError {
   public:
    explicit OrderError(const std::string& msg)
        : BacktestError(msg) {}
};

class InsufficientFunds: public OrderError {
   public:
    explicit InsufficientFunds(const std::string& msg)
        : OrderError(msg) {}
};

class NoPosition: public OrderError {
   public:
    explicit NoPosition(const std::string& msg)
        : OrderError(msg) {}
};

class InvalidOrder: public OrderError {
   public:
    explicit InvalidOrder(const std::string& msg)
        : OrderError(msg) {}
};

/**
 * @brief Failure escaping the strategy's decision logic.
 *
 * The original exception is nested (see std::rethrow_if_nested).
 */
class StrategyLogicError: public BacktestError {
   public:
    StrategyLogicError(const std::string& msg, std::size_t barIndex, int64_t timestamp)
        : BacktestError("strategy logic failed at bar " + std::to_string(barIndex) + " (t="
                        + std::to_string(timestamp) + "): " + msg)
        , barIndex_(barIndex)
        , timestamp_(timestamp) {}

    [[nodiscard]] std::size_t barIndex() const noexcept { return barIndex_; }
    [[nodiscard]] int64_t     timestamp() const noexcept { return timestamp_; }

   private:
    std::size_t barIndex_;
    int64_t     timestamp_;
};

class ConfigError: public BacktestError {
   public:
    explicit ConfigError(const std::string& msg)
        : BacktestError(msg) {}
};
