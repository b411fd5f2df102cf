#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

#include "data/price_history.hpp"

/**
 * @brief HTTP client for the public chart endpoint (query1.finance.yahoo.com/v8/finance/chart).
 *
 * Call init() once per process before fetching and close() at exit.
 */
class ChartProvider {
   public:
    static void init();
    static void close();

    ChartProvider()  = delete;
    ~ChartProvider() = delete;

    ChartProvider(const ChartProvider& other) = delete;
    ChartProvider(ChartProvider&& other)      = delete;

    ChartProvider& operator=(const ChartProvider& other) = delete;
    ChartProvider& operator=(ChartProvider&& other)      = delete;

    /**
     * @brief Fetch bars for a relative range.
     * @param ticker   Ticker (e.g., "AAPL", "BTC-USD")
     * @param interval Bar interval (e.g., "1d", "1h", "5m")
     * @param range    Data range (e.g., "1mo", "1y", "max")
     * @return nullptr on network or parse failure.
     */
    [[nodiscard]] static std::shared_ptr<PriceHistory>
    getBars(const std::string& ticker, const std::string& interval = "1d", const std::string& range = "1mo");

    /**
     * @brief Fetch bars between two dates.
     * @param startDate Start date (YYYY-MM-DD)
     * @param endDate   End date (YYYY-MM-DD), exclusive
     * @return nullptr on network or parse failure, or if a date cannot be parsed.
     */
    [[nodiscard]] static std::shared_ptr<PriceHistory> getBars(const std::string& ticker, const std::string& startDate,
                                                               const std::string& endDate,
                                                               const std::string& interval);

    /**
     * @brief Build a PriceHistory from an already downloaded chart document.
     * @return nullptr if the document cannot be parsed.
     */
    [[nodiscard]] static std::shared_ptr<PriceHistory> parse(const std::string& ticker, const std::string& interval,
                                                             const std::string& body);

   private:
    static constexpr std::string_view url_base_ = "https://query1.finance.yahoo.com/v8/finance/chart/";

    [[nodiscard]] static std::string fetch(const std::string& url);

    static std::size_t write(void* contents, std::size_t size, std::size_t nmemb, void* userp);
};
