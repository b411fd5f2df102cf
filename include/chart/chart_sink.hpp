#pragma once

#include "backtest/account.hpp"
#include "backtest/bar_series.hpp"
#include "backtest/indicator_adapter.hpp"
#include "backtest/performance_reporter.hpp"

/**
 * @brief Receives a finished run for display.
 *
 * The runner only ever holds a non-owning pointer to a sink and calls render()
 * once, after the account has been frozen.
 */
class IChartSink {
   public:
    virtual ~IChartSink() = default;

    virtual void render(const BarSeries& series, const IndicatorSet& indicators, const Account& account,
                        const Report& report) = 0;
};
