#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Named output columns of one indicator computation, in output order.
 * @example {{"macd", [...]}, {"signal", [...]}, {"histogram", [...]}}
 */
using IndicatorColumns = std::vector<std::pair<std::string, std::vector<double>>>;

/**
 * @brief Precomputed indicator values aligned index-for-index with a bar series.
 *
 * Each index holds a tuple with one value per column. Values during the
 * indicator's warm-up are NaN.
 */
class IndicatorSeries {
   public:
    /**
     * @throws AlignmentError if there are no columns or the columns differ in length.
     */
    IndicatorSeries(std::string name, IndicatorColumns columns);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    /**
     * @brief Number of rows (bars) covered.
     */
    [[nodiscard]] std::size_t size() const noexcept { return size_; }

    [[nodiscard]] std::size_t columnCount() const noexcept { return columns_.size(); }

    [[nodiscard]] std::vector<std::string> columnNames() const;

    [[nodiscard]] bool hasColumn(const std::string& column) const;

    /**
     * @throws std::out_of_range if `column` does not exist.
     */
    [[nodiscard]] const std::vector<double>& column(const std::string& column) const;

    [[nodiscard]] const std::vector<double>& column(std::size_t index) const;

   private:
    std::string      name_;
    IndicatorColumns columns_;
    std::size_t      size_ = 0;
};
