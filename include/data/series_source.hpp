#pragma once

#include <memory>

#include <nlohmann/json.hpp>

#include "backtest/bar_series.hpp"

/**
 * @brief Load the bar series described by the "data" section of a backtest config.
 *
 * @example {"ticker": "SPY", "interval": "1d", "range": "5y"}
 * @example {"ticker": "SPY", "interval": "1h", "start": "2024-01-01", "end": "2024-06-01", "resample": "4-hour"}
 * @example {"csv": "data/spy.csv", "ticker": "SPY", "interval": "1d"}
 *
 * Downloads go through ChartProvider; the caller owns ChartProvider::init()/close().
 *
 * @return nullptr if the data cannot be read or downloaded.
 * @throws ConfigError    on a malformed section.
 * @throws InvalidBarData if the bars violate the series invariants.
 */
[[nodiscard]] std::shared_ptr<const BarSeries> loadSeries(const nlohmann::json& data);
