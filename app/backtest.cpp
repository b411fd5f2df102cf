#include <exception>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <string>

#include <unistd.h>

#include <nlohmann/json.hpp>

#include "backtest/backtest_config.hpp"
#include "backtest/errors.hpp"
#include "backtest/performance_reporter.hpp"
#include "backtest/strategy_runner.hpp"
#include "chart/chart_session_writer.hpp"
#include "data/chart_provider.hpp"
#include "data/series_source.hpp"
#include "strategy_factory.hpp"

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

static std::string resolveFromExe(const std::string& relativePath) {
    char    buf[4096];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len <= 0)
        return relativePath;
    buf[len] = '\0';
    std::string exePath(buf);
    // <root>/build/bin/backtest -> <root>
    for (int i = 0; i < 3; ++i) {
        auto pos = exePath.rfind('/');
        if (pos == std::string::npos)
            return relativePath;
        exePath = exePath.substr(0, pos);
    }
    return exePath + "/" + relativePath;
}

static void printNested(const std::exception& e, int depth = 0) {
    std::cerr << std::string(static_cast<std::size_t>(depth) * 2, ' ') << e.what() << std::endl;
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& nested) {
        printNested(nested, depth + 1);
    }
}

int main(int argc, char* argv[]) {
    std::string configPath = resolveFromExe("config/backtest.json");
    if (argc > 1)
        configPath = argv[1];

    ChartProvider::init();
    Defer _cleanup([] { ChartProvider::close(); });

    try {
        /* ---- Load config ---- */
        const auto json     = loadJsonFile(configPath);
        const auto config   = parseBacktestConfig(json);
        auto       strategy = makeStrategy(json.value("strategy", nlohmann::json::object()));

        const auto engine       = json.value("engine", nlohmann::json::object());
        const auto chartOutput  = engine.value("chart_output", std::string(""));
        const auto reportOutput = engine.value("report_output", std::string(""));

        /* ---- Load bars ---- */
        const auto series = loadSeries(json.value("data", nlohmann::json::object()));
        if (!series) {
            std::cerr << "Failed to load bar data." << std::endl;
            return 1;
        }
        if (series->gapCount() > 0) {
            std::clog << "Series has " << series->gapCount() << " gaps" << std::endl;
        }

        /* ---- Run ---- */
        StrategyRunner runner(*series, *strategy);

        std::unique_ptr<ChartSessionWriter> chart;
        if (!chartOutput.empty()) {
            chart = std::make_unique<ChartSessionWriter>(chartOutput);
            runner.setChartSink(chart.get());
        }

        const auto report = runner.backtest(config);

        PerformanceReporter::printSummary(report);
        if (config.showTrades) {
            PerformanceReporter::printTrades(runner.account()->ledger());
        }

        if (!reportOutput.empty()) {
            std::ofstream f(reportOutput);
            if (!f.is_open()) {
                std::cerr << "Error: Cannot write: " << reportOutput << std::endl;
                return 1;
            }
            f << PerformanceReporter::toJson(report).dump(2) << std::endl;
            std::clog << "Report written to " << reportOutput << std::endl;
        }

        if (chart && config.showTrades && !chart->written()) {
            return 1;
        }
    } catch (const StrategyLogicError& e) {
        printNested(e);
        return 2;
    } catch (const BacktestError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
