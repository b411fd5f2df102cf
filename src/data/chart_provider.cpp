#include "data/chart_provider.hpp"

#include <iostream>

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include "backtest/errors.hpp"
#include "data/bar_loader.hpp"
#include "time_utils.hpp"

void ChartProvider::init() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void ChartProvider::close() {
    curl_global_cleanup();
}

std::shared_ptr<PriceHistory> ChartProvider::getBars(const std::string& ticker, const std::string& interval,
                                                     const std::string& range) {
    const auto fetched = fetch(std::string(url_base_) + ticker + "?interval=" + interval + "&range=" + range);
    if (fetched.empty()) {
        return nullptr;
    }
    return parse(ticker, interval, fetched);
}

std::shared_ptr<PriceHistory> ChartProvider::getBars(const std::string& ticker, const std::string& startDate,
                                                     const std::string& endDate, const std::string& interval) {
    const auto period1 = parseTimestamp(startDate);
    const auto period2 = parseTimestamp(endDate);
    if (!period1 || !period2) {
        std::cerr << "Invalid date range: " << startDate << " ~ " << endDate << std::endl;
        return nullptr;
    }

    const auto fetched = fetch(std::string(url_base_) + ticker + "?interval=" + interval
                               + "&period1=" + std::to_string(*period1) + "&period2=" + std::to_string(*period2));
    if (fetched.empty()) {
        return nullptr;
    }
    return parse(ticker, interval, fetched);
}

std::shared_ptr<PriceHistory> ChartProvider::parse(const std::string& ticker, const std::string& interval,
                                                   const std::string& body) {
    auto data      = std::make_shared<PriceHistory>();
    data->ticker   = ticker;
    data->interval = interval;
    if (const auto seconds = timeframeToSeconds(interval)) {
        data->intervalSeconds = *seconds;
    }

    try {
        const auto parsed = nlohmann::json::parse(body);

        data->bars = BarLoader::fromChartJson(parsed);

        const auto meta = parsed["chart"]["result"][0].value("meta", nlohmann::json::object());

        /**
         * @note CURRENCY
         * @example "USD", "KRW", etc.
         */
        if (meta.contains("currency") && !meta["currency"].is_null()) {
            data->currency = meta["currency"].get<std::string>();
        }

        /**
         * @note EXCHANGE-NAME
         * @example "NMS", "NYE", "CCC", etc.
         */
        if (meta.contains("exchangeName") && !meta["exchangeName"].is_null()) {
            data->exchangeName = meta["exchangeName"].get<std::string>();
        }

        /**
         * @note TIMEZONE
         * @example "EST", "UTC", etc.
         */
        if (meta.contains("timezone") && !meta["timezone"].is_null()) {
            data->timezone = meta["timezone"].get<std::string>();
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << e.what() << std::endl;
        return nullptr;
    } catch (const InvalidBarData& e) {
        std::cerr << ticker << ": " << e.what() << std::endl;
        return nullptr;
    }

    return data;
}

std::string ChartProvider::fetch(const std::string& url) {
    CURL*    curl = nullptr;
    CURLcode res  = CURLE_OK;

    std::string buffer("");

    curl = curl_easy_init();
    if (curl) {
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &buffer);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_USERAGENT,
                         "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) "
                         "Chrome/58.0.3029.110 Safari/537.3");

        res = curl_easy_perform(curl);
        if (res != CURLE_OK) {
            std::cerr << "curl_easy_perform() failed: " << curl_easy_strerror(res) << std::endl;
            buffer.clear();
        }
        curl_easy_cleanup(curl);
    }
    return buffer;
}

std::size_t ChartProvider::write(void* contents, std::size_t size, std::size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}
