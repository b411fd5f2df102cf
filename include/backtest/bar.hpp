#pragma once

#include <cstdint>
#include <vector>

/**
 * @brief One OHLCV observation for a fixed time interval.
 */
struct Bar {
    /**
     * @brief UTC epoch seconds of the bar open.
     * @example 1705641600
     */
    int64_t timestamp = 0;

    double open   = 0.0;
    double high   = 0.0;
    double low    = 0.0;
    double close  = 0.0;
    double volume = 0.0;
};

inline bool operator==(const Bar& lhs, const Bar& rhs) {
    return lhs.timestamp == rhs.timestamp && lhs.open == rhs.open && lhs.high == rhs.high && lhs.low == rhs.low
        && lhs.close == rhs.close && lhs.volume == rhs.volume;
}

inline bool operator!=(const Bar& lhs, const Bar& rhs) {
    return !(lhs == rhs);
}

/**
 * @brief Column-oriented OHLCV view of a bar series.
 *
 * This is the input handed to the indicator computation.
 */
struct PriceColumns {
    std::vector<int64_t> timestamps;
    std::vector<double>  open;
    std::vector<double>  high;
    std::vector<double>  low;
    std::vector<double>  close;
    std::vector<double>  volume;
};
