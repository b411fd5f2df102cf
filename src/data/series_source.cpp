#include "data/series_source.hpp"

#include <iostream>
#include <utility>

#include "backtest/errors.hpp"
#include "data/bar_loader.hpp"
#include "data/chart_provider.hpp"
#include "time_utils.hpp"

std::shared_ptr<const BarSeries> loadSeries(const nlohmann::json& data) {
    std::string ticker;
    std::string interval;
    std::string csv;
    std::string resample;
    std::string range;
    std::string start;
    std::string end;

    try {
        ticker   = data.value("ticker", std::string(""));
        interval = data.value("interval", std::string("1d"));
        csv      = data.value("csv", std::string(""));
        resample = data.value("resample", std::string(""));
        range    = data.value("range", std::string("1y"));
        start    = data.value("start", std::string(""));
        end      = data.value("end", std::string(""));
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid data section: ") + e.what());
    }

    const auto intervalSeconds = timeframeToSeconds(interval);
    if (!intervalSeconds) {
        throw ConfigError("unknown interval '" + interval + "'");
    }

    std::vector<Bar> bars;
    if (!csv.empty()) {
        auto loaded = BarLoader::fromCsv(csv);
        if (!loaded) {
            return nullptr;
        }
        bars = std::move(*loaded);
    } else {
        if (ticker.empty()) {
            throw ConfigError("data section needs a 'ticker' or a 'csv' path");
        }

        std::shared_ptr<PriceHistory> history;
        if (!start.empty() && !end.empty()) {
            history = ChartProvider::getBars(ticker, start, end, interval);
        } else {
            history = ChartProvider::getBars(ticker, interval, range);
        }
        if (!history) {
            return nullptr;
        }
        bars = std::move(history->bars);
    }

    std::clog << "Loaded " << bars.size() << " bars for " << (ticker.empty() ? csv : ticker) << std::endl;

    auto series = std::make_shared<BarSeries>(std::move(bars), ticker.empty() ? csv : ticker, *intervalSeconds);

    if (!resample.empty()) {
        const auto target = timeframeToSeconds(resample);
        if (!target || *target < *intervalSeconds) {
            throw ConfigError("cannot resample " + interval + " bars to '" + resample + "'");
        }
        series = std::make_shared<BarSeries>(series->resampled(*target));
        std::clog << "Resampled to " << resample << ": " << series->length() << " bars" << std::endl;
    }

    return series;
}
