#pragma once

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "backtest/account.hpp"
#include "backtest/bar_series.hpp"

struct EquityPoint {
    int64_t timestamp = 0;
    double  strategy  = 0.0;  // mark-to-market equity at the bar close
    double  benchmark = 0.0;  // buy-and-hold equity at the bar close
};

struct Report {
    std::string symbol;
    std::string strategyName;

    int64_t     startTimestamp = 0;
    int64_t     endTimestamp   = 0;
    std::size_t startIndex     = 0;
    std::size_t endIndex       = 0;

    double initialCapital = 0.0;
    double finalEquity    = 0.0;

    /* ----- Returns (fractions, 0.1 = 10%) ----- */
    double strategyReturn = 0.0;  // (finalEquity - initialCapital) / initialCapital
    double netProfit      = 0.0;  // finalEquity - initialCapital
    double buyHoldReturn  = 0.0;  // (closeAtEnd - closeAtStart) / closeAtStart
    double buyHoldProfit  = 0.0;  // buyHoldReturn * initialCapital
    double relativeReturn = 0.0;  // strategyReturn - buyHoldReturn
    double relativeProfit = 0.0;  // netProfit - buyHoldProfit

    /* ----- Trades ----- */
    std::size_t buys         = 0;
    std::size_t sells        = 0;
    std::size_t totalTrades  = 0;
    std::size_t winningSells = 0;    // sells above the average entry price at the time
    double      winRate      = 0.0;  // winningSells / sells (0~1)

    double totalCommission = 0.0;

    /* ----- Risk ----- */
    double maxDrawdownPct = 0.0;  // Maximum drawdown percentage (negative)
    double sharpeRatio    = 0.0;  // Annualized Sharpe ratio of per-bar returns

    bool cancelled = false;

    std::vector<EquityPoint> equityCurve;
};

/**
 * @brief Post-run analytics over a frozen ledger.
 *
 * Everything is derived from the bar series and the ledger alone; neither is
 * modified. The equity curve is rebuilt by replaying the ledger against the
 * bar closes.
 */
class PerformanceReporter {
   public:
    /**
     * @param series          Bars the run was performed on.
     * @param ledger          Trades in execution order.
     * @param startingCapital Cash at the start of the run.
     * @param startDate       First timestamp of the window (first bar at or after it).
     * @param endDate         Last timestamp of the window (last bar at or before it).
     * @throws DateOutOfRange if the window contains no bars.
     */
    [[nodiscard]] static Report compute(const BarSeries& series, const std::vector<Trade>& ledger,
                                        double startingCapital, int64_t startDate, int64_t endDate);

    /**
     * @brief Human-readable summary.
     */
    static void printSummary(const Report& report, std::ostream& out = std::clog);

    /**
     * @brief Trade table.
     */
    static void printTrades(const std::vector<Trade>& ledger, std::ostream& out = std::clog);

    [[nodiscard]] static nlohmann::json toJson(const Report& report);

    [[nodiscard]] static nlohmann::json toJson(const Trade& trade);
};
