#include "backtest/performance_reporter.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <numeric>
#include <stdexcept>

#include "backtest/errors.hpp"
#include "time_utils.hpp"

namespace {

/**
 * @brief Cash and position rebuilt from the ledger, fill by fill, with the same
 *        arithmetic Account uses.
 */
struct LedgerReplay {
    double cash              = 0.0;
    double quantity          = 0.0;
    double averageEntryPrice = 0.0;

    std::size_t buys         = 0;
    std::size_t sells        = 0;
    std::size_t winningSells = 0;
    double      commission   = 0.0;

    void apply(const Trade& trade) {
        cash += trade.cashFlow();
        commission += trade.commissionPaid;

        if (trade.side == TradeSide::BUY) {
            const double newQuantity = quantity + trade.quantity;
            averageEntryPrice =
                (quantity == 0.0) ? trade.price
                                  : (quantity * averageEntryPrice + trade.quantity * trade.price) / newQuantity;
            quantity = newQuantity;
            ++buys;
            return;
        }

        if (trade.price > averageEntryPrice) {
            ++winningSells;
        }
        const double before = quantity;
        quantity -= trade.quantity;
        if (quantity <= before * kDustFraction) {
            quantity          = 0.0;
            averageEntryPrice = 0.0;
        }
        ++sells;
    }
};

}  // namespace

Report PerformanceReporter::compute(const BarSeries& series, const std::vector<Trade>& ledger,
                                    double startingCapital, int64_t startDate, int64_t endDate) {
    const auto first = series.indexAtOrAfter(startDate);
    const auto last  = series.indexAtOrBefore(endDate);
    if (!first || !last || *first > *last) {
        throw DateOutOfRange("no bars between " + formatTime(startDate, "%Y-%m-%d %H:%M:%S") + " and "
                             + formatTime(endDate, "%Y-%m-%d %H:%M:%S"));
    }
    if (startingCapital <= 0.0) {
        throw std::invalid_argument("starting capital must be positive");
    }

    Report report;
    report.symbol         = series.symbol();
    report.startIndex     = *first;
    report.endIndex       = *last;
    report.startTimestamp = series.barAt(*first).timestamp;
    report.endTimestamp   = series.barAt(*last).timestamp;
    report.initialCapital = startingCapital;

    const double closeAtStart = series.barAt(*first).close;
    const double closeAtEnd   = series.barAt(*last).close;

    LedgerReplay replay;
    replay.cash = startingCapital;

    std::size_t next = 0;
    report.equityCurve.reserve(*last - *first + 1);

    for (std::size_t i = *first; i <= *last; ++i) {
        const Bar& bar = series.barAt(i);
        while (next < ledger.size() && ledger[next].timestamp <= bar.timestamp) {
            replay.apply(ledger[next]);
            ++next;
        }

        EquityPoint point;
        point.timestamp = bar.timestamp;
        point.strategy  = replay.cash + replay.quantity * bar.close;
        point.benchmark = (closeAtStart > 0.0) ? startingCapital * bar.close / closeAtStart : startingCapital;
        report.equityCurve.push_back(point);
    }

    // 1. Returns
    report.finalEquity    = report.equityCurve.back().strategy;
    report.netProfit      = report.finalEquity - startingCapital;
    report.strategyReturn = report.netProfit / startingCapital;
    report.buyHoldReturn  = (closeAtStart > 0.0) ? (closeAtEnd - closeAtStart) / closeAtStart : 0.0;
    report.buyHoldProfit  = report.buyHoldReturn * startingCapital;
    report.relativeReturn = report.strategyReturn - report.buyHoldReturn;
    report.relativeProfit = report.netProfit - report.buyHoldProfit;

    // 2. Trades
    report.buys            = replay.buys;
    report.sells           = replay.sells;
    report.totalTrades     = replay.buys + replay.sells;
    report.winningSells    = replay.winningSells;
    report.totalCommission = replay.commission;
    if (replay.sells > 0) {
        report.winRate = static_cast<double>(replay.winningSells) / static_cast<double>(replay.sells);
    }

    // 3. Max Drawdown
    {
        double peak  = report.equityCurve.front().strategy;
        double maxDD = 0.0;
        for (const auto& point : report.equityCurve) {
            peak = std::max(peak, point.strategy);
            if (peak > 0.0) {
                const double dd = (point.strategy - peak) / peak * 100.0;
                maxDD           = std::min(maxDD, dd);
            }
        }
        report.maxDrawdownPct = maxDD;
    }

    // 4. Sharpe Ratio (annualized per-bar returns, risk-free = 0)
    if (report.equityCurve.size() > 1) {
        std::vector<double> returns;
        returns.reserve(report.equityCurve.size() - 1);
        for (std::size_t i = 1; i < report.equityCurve.size(); ++i) {
            const double prev = report.equityCurve[i - 1].strategy;
            if (prev > 0.0) {
                returns.push_back((report.equityCurve[i].strategy - prev) / prev);
            }
        }

        if (!returns.empty()) {
            const double mean =
                std::accumulate(returns.begin(), returns.end(), 0.0) / static_cast<double>(returns.size());

            double variance = 0.0;
            for (const auto& r : returns) {
                variance += (r - mean) * (r - mean);
            }
            variance /= static_cast<double>(returns.size());

            const double stdDev = std::sqrt(variance);
            if (stdDev > 1e-12) {
                report.sharpeRatio = (mean / stdDev) * std::sqrt(252.0);
            }
        }
    }

    return report;
}

void PerformanceReporter::printSummary(const Report& report, std::ostream& out) {
    // clang-format off
    out << "\n"
        << "-------------- Results ----------------" << "\n"
        << (report.strategyName.empty() ? "" : "Strategy:        " + report.strategyName + "\n")
        << (report.symbol.empty() ? "" : "Symbol:          " + report.symbol + "\n")
        << "Period:          "
            << formatTime(report.startTimestamp, "%Y-%m-%d %H:%M") << " ~ "
            << formatTime(report.endTimestamp, "%Y-%m-%d %H:%M")
            << (report.cancelled ? "  (cancelled)" : "") << "\n"
        << "\n"
        << std::fixed << std::setprecision(2)
        << "Relative Returns: " << report.relativeReturn * 100.0 << "%" << "\n"
        << "Relative Profit:  " << report.relativeProfit << "\n"
        << "\n"
        << "Strategy     : " << report.strategyReturn * 100.0 << "%" << "\n"
        << "Net Profit   : " << report.netProfit << "\n"
        << "\n"
        << "Buy and Hold : " << report.buyHoldReturn * 100.0 << "%" << "\n"
        << "Net Profit   : " << report.buyHoldProfit << "\n"
        << "\n"
        << "Buys         : " << report.buys << "\n"
        << "Sells        : " << report.sells << "\n"
        << "--------------------" << "\n"
        << "Total Trades : " << report.totalTrades << "\n"
        << "\n"
        << "Win Rate     : " << report.winRate * 100.0 << "%"
            << " (" << report.winningSells << "/" << report.sells << ")" << "\n"
        << "Max Drawdown : " << report.maxDrawdownPct << "%" << "\n"
        << "Sharpe Ratio : " << report.sharpeRatio << "\n"
        << "Commission   : " << report.totalCommission << "\n"
        << "---------------------------------------"
        << std::endl;
    // clang-format on
}

void PerformanceReporter::printTrades(const std::vector<Trade>& ledger, std::ostream& out) {
    if (ledger.empty()) {
        out << "(No trades executed)" << std::endl;
        return;
    }

    // clang-format off
    out << "=== Trades ===" << "\n"
        << std::left
        << std::setw(20) << "(Date)"
        << std::setw(8)  << "(Side)"
        << std::setw(16) << "(Quantity)"
        << std::setw(14) << "(Price)"
        << std::setw(12) << "(Commission)"
        << "\n-"
        << std::endl;
    // clang-format on

    for (const auto& trade : ledger) {
        // clang-format off
        out << std::left
            << std::setw(20) << formatTime(trade.timestamp, "%Y-%m-%d %H:%M")
            << std::setw(8)  << toString(trade.side)
            << std::fixed << std::setprecision(6)
            << std::setw(16) << trade.quantity
            << std::setprecision(2)
            << "$" << std::setw(13) << trade.price
            << "$" << trade.commissionPaid
            << std::endl;
        // clang-format on
    }
}

nlohmann::json PerformanceReporter::toJson(const Trade& trade) {
    nlohmann::json j;
    j["timestamp"]  = trade.timestamp;
    j["side"]       = toString(trade.side);
    j["quantity"]   = trade.quantity;
    j["price"]      = trade.price;
    j["commission"] = trade.commissionPaid;
    j["cash"]       = trade.cashFlow();
    if (trade.stopPrice > 0.0) {
        j["stop_price"] = trade.stopPrice;
    }
    return j;
}

nlohmann::json PerformanceReporter::toJson(const Report& report) {
    nlohmann::json j;
    j["symbol"]   = report.symbol;
    j["strategy"] = report.strategyName;

    j["window"] = {
        {"start", formatTime(report.startTimestamp, "%Y-%m-%d %H:%M:%S")},
        {"end", formatTime(report.endTimestamp, "%Y-%m-%d %H:%M:%S")},
        {"start_index", report.startIndex},
        {"end_index", report.endIndex},
        {"cancelled", report.cancelled},
    };

    j["initial_capital"] = report.initialCapital;
    j["final_equity"]    = report.finalEquity;

    j["strategy_return"] = report.strategyReturn;
    j["net_profit"]      = report.netProfit;
    j["buy_hold_return"] = report.buyHoldReturn;
    j["buy_hold_profit"] = report.buyHoldProfit;
    j["relative_return"] = report.relativeReturn;
    j["relative_profit"] = report.relativeProfit;

    j["trades"] = {
        {"buys", report.buys},
        {"sells", report.sells},
        {"total", report.totalTrades},
        {"winning_sells", report.winningSells},
        {"win_rate", report.winRate},
        {"commission", report.totalCommission},
    };

    j["max_drawdown_pct"] = report.maxDrawdownPct;
    j["sharpe_ratio"]     = report.sharpeRatio;

    auto curve = nlohmann::json::array();
    for (const auto& point : report.equityCurve) {
        curve.push_back({{"timestamp", point.timestamp}, {"strategy", point.strategy}, {"benchmark", point.benchmark}});
    }
    j["equity_curve"] = std::move(curve);

    return j;
}
