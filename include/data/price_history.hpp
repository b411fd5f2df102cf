#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "backtest/bar.hpp"

/**
 * @brief Bars downloaded from the chart provider, with the instrument metadata.
 */
struct PriceHistory {
    /**
     * @brief
     * @example "AAPL", "BTC-USD", etc.
     */
    std::string ticker = "";

    /**
     * @brief
     * @example "USD", "KRW", etc.
     */
    std::string currency = "";

    /**
     * @brief
     * @example "NMS", "CCC", etc.
     */
    std::string exchangeName = "";

    /**
     * @brief
     * @example "America/New_York", "UTC", etc.
     */
    std::string timezone = "";

    /**
     * @brief Provider interval string.
     * @example "1d", "1h", "5m", etc.
     */
    std::string interval = "";

    /**
     * @brief Nominal bar interval in seconds, 0 if unknown.
     */
    int64_t intervalSeconds = 0;

    /**
     * @brief Time-ordered bars. Rows with missing fields are already dropped.
     */
    std::vector<Bar> bars;
};
