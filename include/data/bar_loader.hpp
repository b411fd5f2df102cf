#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "backtest/bar.hpp"
#include "backtest/bar_series.hpp"

/**
 * @brief Turns external price data into bars.
 */
class BarLoader {
   public:
    BarLoader() = delete;

    /**
     * @brief Parse the `chart.result[0]` document returned by the chart endpoint.
     *
     * Rows where any OHLC field is null are skipped; a null volume reads as 0.
     *
     * @throws InvalidBarData if the document has no result or the columns differ in length.
     */
    [[nodiscard]] static std::vector<Bar> fromChartJson(const nlohmann::json& document);

    /**
     * @brief Read bars from a CSV file with a header row.
     *
     * Columns are located by name: `timestamp` (or `date`), `open`, `high`, `low`,
     * `close` and optionally `volume`. Timestamps are epoch seconds or
     * "YYYY-MM-DD[ HH:MM:SS]" (UTC).
     *
     * @return std::nullopt if the file cannot be opened.
     * @throws InvalidBarData on a missing column or a malformed row (index = line number).
     */
    [[nodiscard]] static std::optional<std::vector<Bar>> fromCsv(const std::string& path);

    /**
     * @brief Write `series` in the layout fromCsv() reads.
     * @return false if the file cannot be written.
     */
    static bool writeCsv(const std::string& path, const BarSeries& series);
};
