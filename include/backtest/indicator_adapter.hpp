#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "backtest/indicator_series.hpp"
#include "backtest/lookback_view.hpp"

/**
 * @brief Display intent for the chart collaborator. Has no effect on simulation.
 */
enum class PlotStyle
{
    OVERLAY,        // drawn over the price candles
    SEPARATE_AXIS,  // drawn in its own panel
};

/**
 * @brief Cursor-synced, read-only view over one indicator series.
 *
 * The runner calls syncTo() before invoking strategy logic; every lookback the
 * adapter hands out ends at that cursor. Strategy code only ever receives a
 * const adapter and therefore cannot move the cursor.
 */
class IndicatorAdapter {
   public:
    IndicatorAdapter(std::shared_ptr<const IndicatorSeries> series, PlotStyle style = PlotStyle::OVERLAY,
                     std::string color = "");

    [[nodiscard]] const std::string& name() const noexcept { return series_->name(); }
    [[nodiscard]] PlotStyle          plotStyle() const noexcept { return style_; }
    [[nodiscard]] const std::string& color() const noexcept { return color_; }

    [[nodiscard]] std::vector<std::string> columnNames() const { return series_->columnNames(); }
    [[nodiscard]] std::size_t              columnCount() const noexcept { return series_->columnCount(); }

    /**
     * @brief Move the visible end of every lookback to `cursor` (inclusive).
     * @throws IndexOutOfRange if `cursor` is past the series.
     */
    void syncTo(std::size_t cursor);

    [[nodiscard]] bool        synced() const noexcept { return synced_; }
    [[nodiscard]] std::size_t cursor() const noexcept { return cursor_; }

    /**
     * @brief Trailing window of the first column ending at the cursor.
     * @param window Window size; 0 means unbounded.
     */
    [[nodiscard]] LookbackView<double> lookback(std::size_t window = 0) const;

    /**
     * @brief Trailing window of `column` ending at the cursor.
     */
    [[nodiscard]] LookbackView<double> lookback(const std::string& column, std::size_t window = 0) const;

    /**
     * @brief Trailing window of `column` ending at `i`.
     * @throws IndexOutOfRange if `i` is past the cursor.
     */
    [[nodiscard]] LookbackView<double> lookback(const std::string& column, std::size_t i, std::size_t window) const;

    /**
     * @brief Value of `column` `ago` bars before the cursor (0 = current bar).
     */
    [[nodiscard]] double value(const std::string& column, std::size_t ago = 0) const;

    /**
     * @brief Value of the first column `ago` bars before the cursor.
     */
    [[nodiscard]] double value(std::size_t ago = 0) const;

   private:
    // Full columns past the cursor; only the chart writer reads them, after the run.
    friend class ChartSessionWriter;

    [[nodiscard]] const IndicatorSeries& series() const noexcept { return *series_; }

    [[nodiscard]] LookbackView<double> window(const std::vector<double>& values, std::size_t end,
                                              std::size_t window) const;

    std::shared_ptr<const IndicatorSeries> series_;
    PlotStyle                              style_;
    std::string                            color_;
    std::size_t                            cursor_ = 0;
    bool                                   synced_ = false;
};

/**
 * @brief Adapters registered for one run, looked up by name.
 *
 * Frozen once the run starts.
 */
class IndicatorSet {
   public:
    /**
     * @throws AlignmentError if an adapter with the same name exists.
     */
    void add(IndicatorAdapter adapter);

    /**
     * @throws std::out_of_range if no adapter has this name.
     */
    [[nodiscard]] const IndicatorAdapter& at(const std::string& name) const;

    [[nodiscard]] bool        contains(const std::string& name) const;
    [[nodiscard]] std::size_t size() const noexcept { return adapters_.size(); }

    [[nodiscard]] std::vector<IndicatorAdapter>::const_iterator begin() const noexcept { return adapters_.begin(); }
    [[nodiscard]] std::vector<IndicatorAdapter>::const_iterator end() const noexcept { return adapters_.end(); }

    void syncTo(std::size_t cursor);

   private:
    std::vector<IndicatorAdapter> adapters_;
};
