#include "chart/chart_session_writer.hpp"

#include <fstream>
#include <iostream>
#include <utility>

#include "time_utils.hpp"

namespace {

std::string plotName(PlotStyle style) {
    return style == PlotStyle::SEPARATE_AXIS ? "separate" : "overlay";
}

}  // namespace

ChartSessionWriter::ChartSessionWriter(std::string path)
    : path_(std::move(path)) {}

nlohmann::json ChartSessionWriter::session(const BarSeries& series, const IndicatorSet& indicators,
                                           const Account& account, const Report& report) {
    nlohmann::json j;
    j["symbol"]   = series.symbol();
    j["interval"] = series.interval();
    j["strategy"] = report.strategyName;

    auto bars = nlohmann::json::array();
    for (const auto& bar : series.bars()) {
        bars.push_back({{"t", bar.timestamp},
                        {"o", bar.open},
                        {"h", bar.high},
                        {"l", bar.low},
                        {"c", bar.close},
                        {"v", bar.volume}});
    }
    j["bars"] = std::move(bars);

    auto overlays = nlohmann::json::array();
    for (const auto& adapter : indicators) {
        const auto& values = adapter.series();

        nlohmann::json columns = nlohmann::json::object();
        for (const auto& column : values.columnNames()) {
            columns[column] = values.column(column);
        }

        overlays.push_back({{"name", adapter.name()},
                            {"plot", plotName(adapter.plotStyle())},
                            {"color", adapter.color()},
                            {"columns", std::move(columns)}});
    }
    j["indicators"] = std::move(overlays);

    auto trades = nlohmann::json::array();
    for (const auto& trade : account.ledger()) {
        trades.push_back(PerformanceReporter::toJson(trade));
    }
    j["trades"] = std::move(trades);

    auto closed = nlohmann::json::array();
    for (const auto& position : account.closedPositions()) {
        closed.push_back({{"entry", position.entryTimestamp},
                          {"close", position.closeTimestamp},
                          {"average_entry_price", position.averageEntryPrice}});
    }
    if (account.hasPosition()) {
        const auto& open = account.position();
        closed.push_back({{"entry", open.entryTimestamp},
                          {"close", nullptr},
                          {"average_entry_price", open.averageEntryPrice}});
    }
    j["positions"] = std::move(closed);

    auto summary = PerformanceReporter::toJson(report);
    j["equity_curve"] = std::move(summary["equity_curve"]);
    summary.erase("equity_curve");
    j["summary"] = std::move(summary);

    return j;
}

void ChartSessionWriter::render(const BarSeries& series, const IndicatorSet& indicators, const Account& account,
                                const Report& report) {
    written_ = false;

    std::ofstream f(path_);
    if (!f.is_open()) {
        std::cerr << "Error: Cannot write chart session: " << path_ << std::endl;
        return;
    }

    f << session(series, indicators, account, report).dump(2) << std::endl;
    if (!f) {
        std::cerr << "Error: Failed writing chart session: " << path_ << std::endl;
        return;
    }

    written_ = true;
    std::clog << "Chart session written to " << path_ << " (" << formatTime(report.startTimestamp) << " ~ "
              << formatTime(report.endTimestamp) << ")" << std::endl;
}
