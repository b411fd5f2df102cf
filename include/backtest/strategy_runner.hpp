#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "backtest/account.hpp"
#include "backtest/backtest_config.hpp"
#include "backtest/bar_series.hpp"
#include "backtest/cancellation.hpp"
#include "backtest/indicator_adapter.hpp"
#include "backtest/performance_reporter.hpp"
#include "strategy/istrategy.hpp"

class IChartSink;

enum class RunState
{
    NOT_STARTED,
    RUNNING,
    COMPLETE,
    FAILED,
    CANCELLED,
};

[[nodiscard]] std::string toString(RunState state);

/**
 * @brief Drives one strategy over one bar series, bar by bar.
 *
 * For every bar in the window the runner checks the protective stop, syncs the
 * indicator adapters to the bar, and calls IStrategy::logic() with a price
 * lookback ending at the bar. Nothing past the current bar is reachable from
 * the strategy.
 *
 * A runner performs exactly one run. The series is borrowed and must outlive
 * the runner; parallel runs share a series and each use their own runner.
 */
class StrategyRunner {
   public:
    StrategyRunner(const BarSeries& series, IStrategy& strategy);

    /**
     * @brief Run the backtest over the configured window.
     *
     * @return Report over the processed bars. A cancelled run returns the report
     *         up to the last fully processed bar with Report::cancelled set.
     * @throws ConfigError        if `config` is invalid.
     * @throws DateOutOfRange     if the window contains no bars.
     * @throws AlignmentError     if a registered indicator does not match the series.
     * @throws StrategyLogicError if logic() throws; the cause is nested.
     * @throws std::logic_error   on a second call.
     */
    Report backtest(const BacktestConfig& config);

    /**
     * @brief Shorthand with the default starting capital.
     * @param startDate  First bar at or after this timestamp.
     * @param endDate    Last bar at or before this timestamp; unset = last bar.
     * @param commission Commission rate in [0, 1).
     * @param showTrades Hand the finished run to the chart sink, if any.
     */
    Report backtest(int64_t startDate, std::optional<int64_t> endDate, double commission, bool showTrades = false);

    /**
     * @brief Non-owning; pass nullptr to detach.
     */
    void setChartSink(IChartSink* sink) noexcept { sink_ = sink; }

    void setCancellationToken(std::shared_ptr<CancellationToken> token) { cancellation_ = std::move(token); }

    [[nodiscard]] RunState state() const noexcept { return state_; }

    /**
     * @brief Index of the bar being (or last) processed.
     */
    [[nodiscard]] std::size_t cursor() const noexcept { return cursor_; }

    /**
     * @brief The run's account, nullptr before backtest() is called.
     */
    [[nodiscard]] const Account* account() const noexcept { return account_.get(); }

    [[nodiscard]] const IndicatorSet& indicators() const noexcept { return indicators_; }

   private:
    struct Window {
        std::size_t first = 0;
        std::size_t last  = 0;
    };

    [[nodiscard]] Window resolveWindow(const BacktestConfig& config) const;

    void registerIndicators();

    /**
     * @brief Process bar `i`. Returns false if the bar was skipped on an order error.
     */
    bool step(std::size_t i, const BacktestConfig& config);

    [[noreturn]] void fail(std::size_t i, const std::string& what);

    const BarSeries& series_;
    IStrategy&       strategy_;

    IChartSink*                        sink_ = nullptr;
    std::shared_ptr<CancellationToken> cancellation_;

    RunState                 state_  = RunState::NOT_STARTED;
    std::size_t              cursor_ = 0;
    std::unique_ptr<Account> account_;
    IndicatorSet             indicators_;
};
