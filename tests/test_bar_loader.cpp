#include <gtest/gtest.h>

#include <cmath>
#include <cstdio>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

#include "backtest/errors.hpp"
#include "data/bar_loader.hpp"
#include "data/chart_provider.hpp"
#include "test_helpers.hpp"

using namespace testing_util;

namespace {

class TempFile {
   public:
    explicit TempFile(const std::string& name, const std::string& content = "")
        : path_(::testing::TempDir() + name) {
        if (!content.empty()) {
            std::ofstream f(path_);
            f << content;
        }
    }
    ~TempFile() { std::remove(path_.c_str()); }

    const std::string& path() const { return path_; }

   private:
    std::string path_;
};

nlohmann::json chartDocument() {
    return nlohmann::json::parse(R"({
        "chart": {
            "result": [{
                "meta": {"currency": "USD", "symbol": "SPY"},
                "timestamp": [1609459200, 1609545600, 1609632000, 1609718400],
                "indicators": {
                    "quote": [{
                        "open":   [10.0, 11.0, null, 12.5],
                        "high":   [11.0, 12.0, null, 13.0],
                        "low":    [9.5, 10.5, null, 12.0],
                        "close":  [10.5, 11.5, null, 12.8],
                        "volume": [100, null, null, 300]
                    }]
                }
            }],
            "error": null
        }
    })");
}

}  // namespace

TEST(BarLoaderTest, ChartJsonSkipsNullRows) {
    const auto bars = BarLoader::fromChartJson(chartDocument());

    ASSERT_EQ(bars.size(), 3u);
    EXPECT_EQ(bars[0].timestamp, 1609459200);
    EXPECT_DOUBLE_EQ(bars[0].open, 10.0);
    EXPECT_DOUBLE_EQ(bars[0].close, 10.5);
    EXPECT_DOUBLE_EQ(bars[0].volume, 100.0);

    EXPECT_DOUBLE_EQ(bars[1].volume, 0.0);
    EXPECT_EQ(bars[2].timestamp, 1609718400);
    EXPECT_DOUBLE_EQ(bars[2].high, 13.0);
}

TEST(BarLoaderTest, ChartJsonWithoutResult) {
    const auto noResult = nlohmann::json::parse(R"({"chart": {"result": null, "error": {"code": "Not Found"}}})");
    EXPECT_THROW((void)BarLoader::fromChartJson(noResult), InvalidBarData);
    EXPECT_THROW((void)BarLoader::fromChartJson(nlohmann::json::object()), InvalidBarData);
}

TEST(BarLoaderTest, ChartJsonWithoutTradingActivity) {
    const auto empty = nlohmann::json::parse(R"({"chart": {"result": [{"meta": {}, "indicators": {"quote": [{}]}}]}})");
    EXPECT_TRUE(BarLoader::fromChartJson(empty).empty());
}

TEST(BarLoaderTest, ChartJsonMisalignedColumns) {
    auto document = chartDocument();
    document["chart"]["result"][0]["indicators"]["quote"][0]["close"].erase(0);
    EXPECT_THROW((void)BarLoader::fromChartJson(document), InvalidBarData);
}

TEST(BarLoaderTest, ChartJsonWithEmptyQuoteBlock) {
    const auto document =
        nlohmann::json::parse(R"({"chart": {"result": [{"timestamp": [1, 2], "indicators": {"quote": []}}]}})");
    EXPECT_THROW((void)BarLoader::fromChartJson(document), InvalidBarData);

    const auto notArray =
        nlohmann::json::parse(R"({"chart": {"result": [{"timestamp": 7, "indicators": {"quote": [{}]}}]}})");
    EXPECT_THROW((void)BarLoader::fromChartJson(notArray), InvalidBarData);

    const auto resultNotArray = nlohmann::json::parse(R"({"chart": {"result": {"timestamp": [1]}}})");
    EXPECT_THROW((void)BarLoader::fromChartJson(resultNotArray), InvalidBarData);
}

TEST(BarLoaderTest, ChartJsonWithStringTimestamp) {
    auto document = chartDocument();
    document["chart"]["result"][0]["timestamp"][1] = "2021-01-02";

    try {
        (void)BarLoader::fromChartJson(document);
        FAIL() << "expected InvalidBarData";
    } catch (const InvalidBarData& e) {
        EXPECT_EQ(e.index(), 1u);
    }
}

TEST(BarLoaderTest, ChartJsonWithStringPriceColumn) {
    auto document = chartDocument();
    document["chart"]["result"][0]["indicators"]["quote"][0]["close"] = "n/a";
    EXPECT_THROW((void)BarLoader::fromChartJson(document), InvalidBarData);
}

TEST(BarLoaderTest, ChartProviderParsesMeta) {
    const auto history = ChartProvider::parse("SPY", "1d", chartDocument().dump());
    ASSERT_NE(history, nullptr);
    EXPECT_EQ(history->ticker, "SPY");
    EXPECT_EQ(history->currency, "USD");
    EXPECT_TRUE(history->exchangeName.empty());
    EXPECT_EQ(history->intervalSeconds, kDay);
    EXPECT_EQ(history->bars.size(), 3u);
}

TEST(BarLoaderTest, ChartProviderRejectsBadBodies) {
    EXPECT_EQ(ChartProvider::parse("SPY", "1d", "<html>rate limited</html>"), nullptr);
    EXPECT_EQ(ChartProvider::parse("SPY", "1d", R"({"chart": {"result": null}})"), nullptr);
}

TEST(BarLoaderTest, CsvWithEpochTimestamps) {
    TempFile file("bars_epoch.csv",
                  "timestamp,open,high,low,close,volume\n"
                  "1609459200,10,11,9,10.5,100\n"
                  "\n"
                  "1609545600,10.5,12,10,11.5,200\n");

    const auto bars = BarLoader::fromCsv(file.path());
    ASSERT_TRUE(bars.has_value());
    ASSERT_EQ(bars->size(), 2u);
    EXPECT_EQ((*bars)[1].timestamp, 1609545600);
    EXPECT_DOUBLE_EQ((*bars)[1].close, 11.5);
    EXPECT_DOUBLE_EQ((*bars)[1].volume, 200.0);
}

TEST(BarLoaderTest, CsvWithDateColumnAndNoVolume) {
    TempFile file("bars_date.csv",
                  "Date,Open,High,Low,Close\n"
                  "2021-01-01,10,11,9,10.5\n"
                  "2021-01-02 12:00:00,10.5,12,10,11.5\n");

    const auto bars = BarLoader::fromCsv(file.path());
    ASSERT_TRUE(bars.has_value());
    ASSERT_EQ(bars->size(), 2u);
    EXPECT_EQ((*bars)[0].timestamp, kDay0);
    EXPECT_EQ((*bars)[1].timestamp, kDay0 + kDay + 12 * 3600);
    EXPECT_DOUBLE_EQ((*bars)[0].volume, 0.0);
}

TEST(BarLoaderTest, CsvColumnOrderDoesNotMatter) {
    TempFile file("bars_order.csv",
                  "close,volume,timestamp,low,high,open\n"
                  "10.5,100,1609459200,9,11,10\n");

    const auto bars = BarLoader::fromCsv(file.path());
    ASSERT_TRUE(bars.has_value());
    ASSERT_EQ(bars->size(), 1u);
    EXPECT_DOUBLE_EQ((*bars)[0].open, 10.0);
    EXPECT_DOUBLE_EQ((*bars)[0].close, 10.5);
    EXPECT_DOUBLE_EQ((*bars)[0].low, 9.0);
}

TEST(BarLoaderTest, CsvMalformedRowReportsLine) {
    TempFile file("bars_bad.csv",
                  "timestamp,open,high,low,close,volume\n"
                  "1609459200,10,11,9,10.5,100\n"
                  "1609545600,10.5,twelve,10,11.5,200\n");

    try {
        (void)BarLoader::fromCsv(file.path());
        FAIL() << "expected InvalidBarData";
    } catch (const InvalidBarData& e) {
        EXPECT_EQ(e.index(), 3u);
        EXPECT_NE(std::string(e.what()).find("high"), std::string::npos);
    }
}

TEST(BarLoaderTest, CsvShortRowAndBadTimestamp) {
    TempFile shortRow("bars_short.csv",
                      "timestamp,open,high,low,close\n"
                      "1609459200,10,11\n");
    EXPECT_THROW((void)BarLoader::fromCsv(shortRow.path()), InvalidBarData);

    TempFile badTime("bars_time.csv",
                     "timestamp,open,high,low,close\n"
                     "yesterday,10,11,9,10.5\n");
    EXPECT_THROW((void)BarLoader::fromCsv(badTime.path()), InvalidBarData);

    TempFile trailing("bars_trailing.csv",
                      "timestamp,open,high,low,close\n"
                      "1609459200,10,11,9,10.5abc\n");
    EXPECT_THROW((void)BarLoader::fromCsv(trailing.path()), InvalidBarData);
}

TEST(BarLoaderTest, CsvMissingColumn) {
    TempFile file("bars_nocol.csv",
                  "timestamp,open,high,close\n"
                  "1609459200,10,11,10.5\n");
    EXPECT_THROW((void)BarLoader::fromCsv(file.path()), InvalidBarData);
}

TEST(BarLoaderTest, CsvMissingFile) {
    EXPECT_FALSE(BarLoader::fromCsv(::testing::TempDir() + "does_not_exist.csv").has_value());
}

TEST(BarLoaderTest, WriteThenReadKeepsEveryDigit) {
    const auto series = BarSeries(makeBars({100.1, 99.97, 101.333333333, 0.000123}), "RT", kDay);
    TempFile   file("bars_written.csv");

    ASSERT_TRUE(BarLoader::writeCsv(file.path(), series));

    const auto bars = BarLoader::fromCsv(file.path());
    ASSERT_TRUE(bars.has_value());
    ASSERT_EQ(bars->size(), series.length());
    for (std::size_t i = 0; i < bars->size(); ++i) {
        EXPECT_EQ((*bars)[i], series.barAt(i)) << "bar " << i;
    }
}

TEST(BarLoaderTest, WriteToUnwritablePath) {
    const auto series = makeSeries({1, 2});
    EXPECT_FALSE(BarLoader::writeCsv(::testing::TempDir() + "no_such_dir/out.csv", series));
}
