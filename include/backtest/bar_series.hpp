#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "backtest/bar.hpp"
#include "backtest/indicator_series.hpp"
#include "backtest/lookback_view.hpp"

/**
 * @brief Immutable, time-ordered table of historical bars plus aligned indicator columns.
 *
 * Timestamps are strictly increasing. Once built the bars never change; the only
 * mutation allowed is attaching indicator series before the series is handed to
 * a runner.
 */
class BarSeries {
   public:
    /**
     * @param bars     Time-ordered bars.
     * @param symbol   Display label (e.g., "BTCUSDT").
     * @param interval Nominal bar interval in seconds, 0 if unknown.
     * @throws InvalidBarData if a bar violates the OHLC invariants or timestamps are not strictly increasing.
     */
    explicit BarSeries(std::vector<Bar> bars, std::string symbol = "", int64_t interval = 0);

    [[nodiscard]] std::size_t length() const noexcept { return bars_.size(); }
    [[nodiscard]] bool        empty() const noexcept { return bars_.empty(); }

    [[nodiscard]] const std::string& symbol() const noexcept { return symbol_; }
    [[nodiscard]] int64_t            interval() const noexcept { return interval_; }

    /**
     * @throws IndexOutOfRange if `i` is not in [0, length).
     */
    [[nodiscard]] const Bar& barAt(std::size_t i) const;

    /**
     * @brief The last `window` bars ending at and including index `i`.
     * @param window Window size; 0 means every bar from index 0 through `i`.
     * @throws IndexOutOfRange if `i` is not in [0, length).
     */
    [[nodiscard]] LookbackView<Bar> lookback(std::size_t i, std::size_t window) const;

    /**
     * @brief First index whose timestamp is >= `timestamp`.
     */
    [[nodiscard]] std::optional<std::size_t> indexAtOrAfter(int64_t timestamp) const;

    /**
     * @brief Last index whose timestamp is <= `timestamp`.
     */
    [[nodiscard]] std::optional<std::size_t> indexAtOrBefore(int64_t timestamp) const;

    /**
     * @brief Index of the bar with exactly this timestamp.
     */
    [[nodiscard]] std::optional<std::size_t> indexOf(int64_t timestamp) const;

    /**
     * @brief OHLCV columns, the input of the indicator computation.
     */
    [[nodiscard]] PriceColumns columns() const;

    /**
     * @brief Number of consecutive-bar gaps wider than the nominal interval.
     */
    [[nodiscard]] std::size_t gapCount() const noexcept { return gapCount_; }

    /**
     * @brief Aggregate into a coarser timeframe.
     *
     * Buckets start at multiples of `interval`. open=first, high=max, low=min,
     * close=last, volume=sum. Attached indicators are not carried over.
     */
    [[nodiscard]] BarSeries resampled(int64_t interval) const;

    /**
     * @brief Attach a precomputed indicator series.
     * @throws AlignmentError on length mismatch or duplicate name.
     */
    void attach(IndicatorSeries series);

    /**
     * @brief Verify an indicator series could be attached to this bar series.
     * @throws AlignmentError on length mismatch.
     */
    void checkAlignment(const IndicatorSeries& series) const;

    [[nodiscard]] const std::vector<IndicatorSeries>& indicators() const noexcept { return indicators_; }

    [[nodiscard]] const IndicatorSeries* findIndicator(const std::string& name) const;

    [[nodiscard]] const std::vector<Bar>& bars() const noexcept { return bars_; }

   private:
    std::vector<Bar>             bars_;
    std::string                  symbol_;
    int64_t                      interval_ = 0;
    std::size_t                  gapCount_ = 0;
    std::vector<IndicatorSeries> indicators_;
};
