#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "chart/chart_sink.hpp"

/**
 * @brief Chart sink that writes the finished run as a JSON session document.
 *
 * Layout:
 * {
 *  "symbol": "SPY", "strategy": "...",
 *  "bars": [{"t": 1609459200, "o": .., "h": .., "l": .., "c": .., "v": ..}, ...],
 *  "indicators": [{"name": "fast", "plot": "overlay", "color": "orange", "columns": {"sma": [...]}}],
 *  "trades": [...], "positions": [{"entry": .., "close": .. or null}], "equity_curve": [...], "summary": {...}
 * }
 * Warm-up values (NaN) are written as null.
 */
class ChartSessionWriter: public IChartSink {
   public:
    explicit ChartSessionWriter(std::string path);

    void render(const BarSeries& series, const IndicatorSet& indicators, const Account& account,
                const Report& report) override;

    /**
     * @brief Whether the last render() wrote the file.
     */
    [[nodiscard]] bool written() const noexcept { return written_; }

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

    [[nodiscard]] static nlohmann::json session(const BarSeries& series, const IndicatorSet& indicators,
                                                const Account& account, const Report& report);

   private:
    std::string path_;
    bool        written_ = false;
};
