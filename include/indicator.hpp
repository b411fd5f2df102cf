#pragma once

#include <cmath>
#include <cstddef>
#include <limits>
#include <vector>

namespace indicator {

/**
 * @brief Value used for indices inside an indicator's warm-up period.
 */
inline constexpr double kWarmup = std::numeric_limits<double>::quiet_NaN();

/**
 * @brief Compute Simple Moving Average (SMA).
 * @param prices  Input price series.
 * @param window  Window size for the moving average.
 * @return        SMA values aligned to `prices` (same size). The first
 *                (window - 1) values are NaN.
 */
[[nodiscard]] inline std::vector<double> sma(const std::vector<double>& prices, std::size_t window) {
    std::vector<double> result(prices.size(), kWarmup);
    if (window == 0 || prices.size() < window) {
        return result;
    }

    double sum = 0.0;
    for (std::size_t i = 0; i < window; ++i) {
        sum += prices[i];
    }
    result[window - 1] = sum / static_cast<double>(window);

    for (std::size_t i = window; i < prices.size(); ++i) {
        sum += prices[i] - prices[i - window];
        result[i] = sum / static_cast<double>(window);
    }

    return result;
}

/**
 * @brief Compute Exponential Moving Average (EMA).
 * @param prices  Input series. Leading NaN values are skipped.
 * @param period  Smoothing period, alpha = 2 / (period + 1).
 * @return        EMA values aligned to `prices`. Seeded with the SMA of the
 *                first `period` valid values; earlier indices are NaN.
 */
[[nodiscard]] inline std::vector<double> ema(const std::vector<double>& prices, std::size_t period) {
    std::vector<double> result(prices.size(), kWarmup);
    if (period == 0) {
        return result;
    }

    std::size_t first = 0;
    while (first < prices.size() && std::isnan(prices[first])) {
        ++first;
    }
    if (prices.size() - first < period) {
        return result;
    }

    double seed = 0.0;
    for (std::size_t i = first; i < first + period; ++i) {
        seed += prices[i];
    }
    std::size_t seedIdx = first + period - 1;
    result[seedIdx]     = seed / static_cast<double>(period);

    const double alpha = 2.0 / (static_cast<double>(period) + 1.0);
    for (std::size_t i = seedIdx + 1; i < prices.size(); ++i) {
        result[i] = alpha * prices[i] + (1.0 - alpha) * result[i - 1];
    }

    return result;
}

/**
 * @brief Compute Relative Strength Index (RSI).
 * @param prices  Input price series.
 * @param period  Lookback period (typically 14).
 * @return        RSI values (0~100) aligned to `prices`. The first `period`
 *                values are NaN.
 *
 * Uses Wilder's smoothing method (exponential moving average of gains/losses).
 */
[[nodiscard]] inline std::vector<double> rsi(const std::vector<double>& prices, std::size_t period) {
    std::vector<double> result(prices.size(), kWarmup);
    if (period == 0 || prices.size() <= period) {
        return result;
    }

    auto toRsi = [](double avgGain, double avgLoss) {
        if (avgLoss < 1e-12) {
            return 100.0;
        }
        const double rs = avgGain / avgLoss;
        return 100.0 - (100.0 / (1.0 + rs));
    };

    // Initial average gain/loss over the first 'period' changes
    double avgGain = 0.0;
    double avgLoss = 0.0;
    for (std::size_t i = 1; i <= period; ++i) {
        const double change = prices[i] - prices[i - 1];
        if (change > 0.0) {
            avgGain += change;
        } else {
            avgLoss += -change;
        }
    }
    avgGain /= static_cast<double>(period);
    avgLoss /= static_cast<double>(period);
    result[period] = toRsi(avgGain, avgLoss);

    // Subsequent values using Wilder's smoothing
    const double smooth = static_cast<double>(period - 1) / static_cast<double>(period);
    const double inv    = 1.0 / static_cast<double>(period);

    for (std::size_t i = period + 1; i < prices.size(); ++i) {
        const double change = prices[i] - prices[i - 1];
        if (change > 0.0) {
            avgGain = avgGain * smooth + change * inv;
            avgLoss = avgLoss * smooth;
        } else {
            avgGain = avgGain * smooth;
            avgLoss = avgLoss * smooth + (-change) * inv;
        }
        result[i] = toRsi(avgGain, avgLoss);
    }

    return result;
}

struct MacdResult {
    std::vector<double> macd;       // EMA(fast) - EMA(slow)
    std::vector<double> signal;     // EMA(signal) of the MACD line
    std::vector<double> histogram;  // macd - signal
};

/**
 * @brief Compute Moving Average Convergence/Divergence.
 * @return Three series aligned to `prices`, NaN during warm-up.
 */
[[nodiscard]] inline MacdResult macd(const std::vector<double>& prices, std::size_t fast = 12, std::size_t slow = 26,
                                     std::size_t signal = 9) {
    MacdResult  result;
    const auto  fastEma = ema(prices, fast);
    const auto  slowEma = ema(prices, slow);
    std::size_t n       = prices.size();

    result.macd.assign(n, kWarmup);
    for (std::size_t i = 0; i < n; ++i) {
        if (!std::isnan(fastEma[i]) && !std::isnan(slowEma[i])) {
            result.macd[i] = fastEma[i] - slowEma[i];
        }
    }

    result.signal = ema(result.macd, signal);

    result.histogram.assign(n, kWarmup);
    for (std::size_t i = 0; i < n; ++i) {
        if (!std::isnan(result.macd[i]) && !std::isnan(result.signal[i])) {
            result.histogram[i] = result.macd[i] - result.signal[i];
        }
    }

    return result;
}

struct BollingerResult {
    std::vector<double> upper;
    std::vector<double> middle;
    std::vector<double> lower;
};

/**
 * @brief Compute Bollinger Bands: SMA(window) +/- k * population standard deviation.
 */
[[nodiscard]] inline BollingerResult bollinger(const std::vector<double>& prices, std::size_t window = 20,
                                               double k = 2.0) {
    BollingerResult result;
    result.middle = sma(prices, window);
    result.upper.assign(prices.size(), kWarmup);
    result.lower.assign(prices.size(), kWarmup);

    if (window == 0) {
        return result;
    }

    for (std::size_t i = window - 1; i < prices.size(); ++i) {
        const double mean     = result.middle[i];
        double       variance = 0.0;
        for (std::size_t j = i + 1 - window; j <= i; ++j) {
            variance += (prices[j] - mean) * (prices[j] - mean);
        }
        const double stdDev = std::sqrt(variance / static_cast<double>(window));
        result.upper[i]     = mean + k * stdDev;
        result.lower[i]     = mean - k * stdDev;
    }

    return result;
}

}  // namespace indicator
