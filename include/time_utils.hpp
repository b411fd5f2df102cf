#pragma once

#include <cstdint>
#include <optional>
#include <string>

/**
 * @brief Format a UTC epoch timestamp.
 * @param format strftime(3) format string.
 */
[[nodiscard]] std::string formatTime(int64_t timestamp, const char* format = "%Y-%m-%d");

/**
 * @brief Parse "YYYY-MM-DD" or "YYYY-MM-DD HH:MM:SS" (UTC) into epoch seconds.
 * @return std::nullopt if the text matches neither format.
 */
[[nodiscard]] std::optional<int64_t> parseTimestamp(const std::string& text);

/**
 * @brief Convert a timeframe to seconds.
 *
 * Accepts "<n>-<unit>" with unit in min/hour/day/week/month (e.g., "5-min",
 * "4-hour") and the chart provider's intervals ("1m", "15m", "1h", "1d", "1wk", "1mo").
 * A month counts as 30 days.
 *
 * @return std::nullopt if the timeframe is not recognised.
 */
[[nodiscard]] std::optional<int64_t> timeframeToSeconds(const std::string& timeframe);
