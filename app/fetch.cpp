#include <functional>
#include <iomanip>
#include <iostream>
#include <string>

#include "backtest/bar_series.hpp"
#include "backtest/errors.hpp"
#include "data/bar_loader.hpp"
#include "data/chart_provider.hpp"
#include "time_utils.hpp"

struct Defer {
    std::function<void()> f;
    explicit Defer(std::function<void()> f)
        : f(std::move(f)) {}
    ~Defer() {
        if (f) {
            f();
        }
    }
};

void printHeader() {
    // clang-format off
    std::clog
        << std::setw(20) << "Date"
        << std::setw(12) << "Open"
        << std::setw(12) << "High"
        << std::setw(12) << "Low"
        << std::setw(12) << "Close"
        << std::setw(15) << "Volume"
        << std::endl;
    // clang-format on
}

/**
 * Usage: fetch [ticker] [interval] [range] [output.csv]
 */
int main(int argc, char* argv[]) {
    /* parse arguments */
    const auto ticker   = (argc > 1) ? argv[1] : "^IXIC";
    const auto interval = (argc > 2) ? argv[2] : "1d";
    const auto range    = (argc > 3) ? argv[3] : "1mo";
    const auto output   = (argc > 4) ? argv[4] : "";

    ChartProvider::init();

    Defer _cleanup([] { ChartProvider::close(); });

    /* get bars */
    const auto data = ChartProvider::getBars(ticker, interval, range);
    if (!data || data->bars.empty()) {
        std::cerr << "No bars for " << ticker << std::endl;
        return 1;
    }

    try {
        const BarSeries series(data->bars, data->ticker, data->intervalSeconds);

        if (std::string(output).empty()) {
            printHeader();

            for (const auto& bar : series.bars()) {
                // clang-format off
                std::clog
                    << std::setw(20) << formatTime(bar.timestamp, "%Y-%m-%d %H:%M")
                    << std::fixed << std::setprecision(2)
                    << std::setw(12) << bar.open
                    << std::setw(12) << bar.high
                    << std::setw(12) << bar.low
                    << std::setw(12) << bar.close
                    << std::setprecision(0)
                    << std::setw(15) << bar.volume
                    << std::endl;
                // clang-format on
            }
            return 0;
        }

        if (!BarLoader::writeCsv(output, series)) {
            return 1;
        }
        std::clog << "Wrote " << series.length() << " bars (" << data->currency << ", " << data->exchangeName
                  << ") to " << output << std::endl;
    } catch (const InvalidBarData& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
