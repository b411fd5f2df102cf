#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

#include "backtest/account.hpp"
#include "backtest/bar.hpp"
#include "backtest/indicator_adapter.hpp"
#include "backtest/indicator_series.hpp"
#include "backtest/lookback_view.hpp"

/**
 * @brief Named numeric parameters of an indicator (e.g., {"fast", 12}, {"slow", 26}).
 */
using IndicatorParams = std::map<std::string, double>;

/**
 * @brief External indicator computation.
 *
 * Invoked once with the full OHLCV history. Every returned column must have one
 * value per bar, and the value at index i may only depend on bars <= i.
 */
using IndicatorFunction = std::function<IndicatorColumns(const PriceColumns&, const IndicatorParams&)>;

struct IndicatorRegistration {
    std::string       name;
    IndicatorParams   params;
    IndicatorFunction compute;
    PlotStyle         plotStyle = PlotStyle::OVERLAY;
    std::string       color;
};

/**
 * @brief Abstract interface for trading strategies.
 *
 * The runner calls setup() once before the run, then logic() once per bar.
 * Indicators registered in setup() are reachable through indicator() and are
 * already synced to the bar being processed.
 */
class IStrategy {
   public:
    virtual ~IStrategy() = default;

    /**
     * @brief Strategy display name.
     */
    [[nodiscard]] virtual std::string name() const = 0;

    /**
     * @brief Declare the indicators the strategy needs. Called once before the run.
     */
    [[nodiscard]] virtual std::vector<IndicatorRegistration> setup() = 0;

    /**
     * @brief Decision logic for the current bar.
     * @param account  Paper account; place orders with buy()/sell().
     * @param lookback Bars up to and including the current one (lookback.back()).
     */
    virtual void logic(Account& account, const LookbackView<Bar>& lookback) = 0;

   protected:
    /**
     * @throws std::out_of_range if no indicator with this name was registered.
     * @throws std::logic_error  outside of a run.
     */
    [[nodiscard]] const IndicatorAdapter& indicator(const std::string& name) const;

   private:
    friend class StrategyRunner;

    const IndicatorSet* indicators_ = nullptr;
};
