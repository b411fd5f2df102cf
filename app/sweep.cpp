#include <algorithm>
#include <atomic>
#include <csignal>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include <nlohmann/json.hpp>

#include "backtest/backtest_config.hpp"
#include "backtest/cancellation.hpp"
#include "backtest/errors.hpp"
#include "backtest/strategy_runner.hpp"
#include "data/chart_provider.hpp"
#include "data/series_source.hpp"
#include "sma_crossover.hpp"

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
    for (int i = 0; i < 3; ++i) {
        auto pos = exePath.rfind('/');
        if (pos == std::string::npos)
            return relativePath;
        exePath = exePath.substr(0, pos);
    }
    return exePath + "/" + relativePath;
}

static std::shared_ptr<CancellationToken> gCancel;

static void onInterrupt(int) {
    if (gCancel) {
        gCancel->cancel();
    }
}

/* ---- Data types ---- */

struct SweepCell {
    std::size_t shortWindow = 0;
    std::size_t longWindow  = 0;

    bool        ok = false;
    std::string error;

    double strategyReturn = 0.0;
    double relativeReturn = 0.0;
    double maxDrawdownPct = 0.0;
    double sharpeRatio    = 0.0;
    double winRate        = 0.0;

    std::size_t trades    = 0;
    bool        cancelled = false;
};

int main(int argc, char* argv[]) {
    std::string sweepPath = resolveFromExe("config/sweep.json");
    if (argc > 1)
        sweepPath = argv[1];

    ChartProvider::init();
    Defer _cleanup([] { ChartProvider::close(); });

    /* ---- Load sweep config ---- */
    nlohmann::json         sweepCfg;
    BacktestConfig         config;
    std::vector<SweepCell> cells;
    double                 stopLoss = 0.0;
    unsigned int           threads  = 0;
    std::size_t            top      = 10;
    try {
        sweepCfg = loadJsonFile(sweepPath);
        config   = parseBacktestConfig(sweepCfg);

        // Cells run concurrently; per-run log lines would interleave.
        config.quiet   = true;
        config.verbose = false;

        const auto& grid = sweepCfg.at("grid");
        stopLoss         = grid.value("stop_loss", 0.0);
        for (const auto& s : grid.at("short")) {
            for (const auto& l : grid.at("long")) {
                SweepCell cell;
                cell.shortWindow = s.get<std::size_t>();
                cell.longWindow  = l.get<std::size_t>();
                if (cell.shortWindow > 0 && cell.shortWindow < cell.longWindow) {
                    cells.push_back(cell);
                }
            }
        }

        threads = sweepCfg.value("threads", 0u);
        top     = sweepCfg.value("top", top);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Error: invalid sweep config: " << e.what() << std::endl;
        return 1;
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    if (cells.empty()) {
        std::cerr << "Error: grid has no (short < long) combination." << std::endl;
        return 1;
    }
    if (threads == 0) {
        threads = std::max(1u, std::thread::hardware_concurrency());
    }

    /* ---- Load bars (once, shared read-only by every runner) ---- */
    std::shared_ptr<const BarSeries> series;
    try {
        series = loadSeries(sweepCfg.value("data", nlohmann::json::object()));
    } catch (const BacktestError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    if (!series) {
        std::cerr << "Failed to load bar data." << std::endl;
        return 1;
    }

    gCancel = std::make_shared<CancellationToken>();
    std::signal(SIGINT, onInterrupt);

    /* ---- Run grid ---- */
    std::cerr << "Running " << cells.size() << " SMA crossover backtests on " << threads << " threads..."
              << std::endl;

    std::atomic<std::size_t> next{0};

    const auto worker = [&]() {
        for (std::size_t idx = next++; idx < cells.size(); idx = next++) {
            auto& cell = cells[idx];
            try {
                SmaCrossover   strategy(cell.shortWindow, cell.longWindow, stopLoss);
                StrategyRunner runner(*series, strategy);
                runner.setCancellationToken(gCancel);

                const auto report   = runner.backtest(config);
                cell.ok             = true;
                cell.strategyReturn = report.strategyReturn;
                cell.relativeReturn = report.relativeReturn;
                cell.maxDrawdownPct = report.maxDrawdownPct;
                cell.sharpeRatio    = report.sharpeRatio;
                cell.winRate        = report.winRate;
                cell.trades         = report.totalTrades;
                cell.cancelled      = report.cancelled;
            } catch (const std::exception& e) {
                cell.error = e.what();
            }
        }
    };

    std::vector<std::thread> pool;
    for (unsigned int t = 0; t < std::min<std::size_t>(threads, cells.size()); ++t) {
        pool.emplace_back(worker);
    }
    for (auto& thread : pool) {
        thread.join();
    }

    /* ---- Ranking ---- */
    std::vector<SweepCell> ranked;
    for (const auto& cell : cells) {
        if (cell.ok) {
            ranked.push_back(cell);
        } else {
            std::cerr << "  [FAIL] " << cell.shortWindow << "/" << cell.longWindow << ": " << cell.error << std::endl;
        }
    }
    std::sort(ranked.begin(), ranked.end(),
              [](const SweepCell& a, const SweepCell& b) { return a.sharpeRatio > b.sharpeRatio; });

    // clang-format off
    std::clog << "\n"
        << "=== SMA Crossover Sweep: " << series->symbol() << " ===" << "\n"
        << std::left
        << std::setw(12) << "(Short/Long)"
        << std::setw(12) << "(Return)"
        << std::setw(12) << "(vs B&H)"
        << std::setw(12) << "(MDD)"
        << std::setw(10) << "(Sharpe)"
        << std::setw(10) << "(WinRate)"
        << std::setw(8)  << "(Trades)"
        << "\n-"
        << std::endl;
    // clang-format on

    for (std::size_t i = 0; i < ranked.size() && i < top; ++i) {
        const auto& cell = ranked[i];
        // clang-format off
        std::clog << std::left
            << std::setw(12) << (std::to_string(cell.shortWindow) + "/" + std::to_string(cell.longWindow))
            << std::fixed << std::setprecision(2)
            << std::setw(12) << cell.strategyReturn * 100.0
            << std::setw(12) << cell.relativeReturn * 100.0
            << std::setw(12) << cell.maxDrawdownPct
            << std::setw(10) << cell.sharpeRatio
            << std::setw(10) << cell.winRate * 100.0
            << std::setw(8)  << cell.trades
            << (cell.cancelled ? "(cancelled)" : "")
            << std::endl;
        // clang-format on
    }

    return ranked.empty() ? 1 : 0;
}
