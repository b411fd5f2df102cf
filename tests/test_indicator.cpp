#include <gtest/gtest.h>

#include <cmath>
#include <vector>

#include "indicator.hpp"
#include "strategy/indicator_registrations.hpp"
#include "test_helpers.hpp"

namespace {

std::vector<double> zigzag(std::size_t n) {
    std::vector<double> prices;
    for (std::size_t i = 0; i < n; ++i) {
        prices.push_back(100.0 + 10.0 * std::sin(static_cast<double>(i) * 0.3) + static_cast<double>(i) * 0.1);
    }
    return prices;
}

void expectSameOrBothNan(double a, double b, std::size_t i) {
    if (std::isnan(a) || std::isnan(b)) {
        EXPECT_TRUE(std::isnan(a) && std::isnan(b)) << "index " << i;
    } else {
        EXPECT_DOUBLE_EQ(a, b) << "index " << i;
    }
}

}  // namespace

TEST(IndicatorTest, SmaValuesAndWarmup) {
    const auto out = indicator::sma({1, 2, 3, 4, 5}, 3);
    ASSERT_EQ(out.size(), 5u);
    EXPECT_TRUE(std::isnan(out[0]));
    EXPECT_TRUE(std::isnan(out[1]));
    EXPECT_DOUBLE_EQ(out[2], 2.0);
    EXPECT_DOUBLE_EQ(out[3], 3.0);
    EXPECT_DOUBLE_EQ(out[4], 4.0);
}

TEST(IndicatorTest, SmaShorterThanWindowIsAllWarmup) {
    const auto out = indicator::sma({1, 2}, 3);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_TRUE(std::isnan(out[0]));
    EXPECT_TRUE(std::isnan(out[1]));
}

TEST(IndicatorTest, EmaSeededWithSma) {
    const auto out = indicator::ema({2, 4, 6, 8}, 3);
    ASSERT_EQ(out.size(), 4u);
    EXPECT_TRUE(std::isnan(out[1]));
    EXPECT_DOUBLE_EQ(out[2], 4.0);
    EXPECT_DOUBLE_EQ(out[3], 0.5 * 8.0 + 0.5 * 4.0);
}

TEST(IndicatorTest, RsiBounds) {
    std::vector<double> rising;
    for (int i = 0; i < 30; ++i) {
        rising.push_back(100.0 + i);
    }
    const auto out = indicator::rsi(rising, 14);
    ASSERT_EQ(out.size(), rising.size());
    EXPECT_TRUE(std::isnan(out[13]));
    EXPECT_DOUBLE_EQ(out[14], 100.0);
    EXPECT_DOUBLE_EQ(out.back(), 100.0);

    std::vector<double> falling(rising.rbegin(), rising.rend());
    const auto          down = indicator::rsi(falling, 14);
    EXPECT_NEAR(down.back(), 0.0, 1e-9);
}

TEST(IndicatorTest, MacdWarmup) {
    const auto prices = zigzag(60);
    const auto out    = indicator::macd(prices, 12, 26, 9);
    ASSERT_EQ(out.macd.size(), prices.size());
    ASSERT_EQ(out.signal.size(), prices.size());
    ASSERT_EQ(out.histogram.size(), prices.size());

    EXPECT_TRUE(std::isnan(out.macd[24]));
    EXPECT_FALSE(std::isnan(out.macd[25]));
    EXPECT_TRUE(std::isnan(out.signal[32]));
    EXPECT_FALSE(std::isnan(out.signal[33]));
    EXPECT_DOUBLE_EQ(out.histogram[40], out.macd[40] - out.signal[40]);
}

TEST(IndicatorTest, BollingerOnFlatSeriesCollapses) {
    const auto out = indicator::bollinger(std::vector<double>(10, 50.0), 5, 2.0);
    EXPECT_TRUE(std::isnan(out.upper[3]));
    EXPECT_DOUBLE_EQ(out.upper[4], 50.0);
    EXPECT_DOUBLE_EQ(out.middle[9], 50.0);
    EXPECT_DOUBLE_EQ(out.lower[9], 50.0);
}

TEST(IndicatorTest, BollingerWidth) {
    // Window {1, 3}: mean 2, population stddev 1.
    const auto out = indicator::bollinger({1, 3}, 2, 2.0);
    EXPECT_DOUBLE_EQ(out.upper[1], 4.0);
    EXPECT_DOUBLE_EQ(out.lower[1], 0.0);
}

// A value at index i must not change when bars after i change.
TEST(IndicatorTest, OutputsAreCausal) {
    const auto full   = zigzag(80);
    auto       edited = full;
    for (std::size_t i = 50; i < edited.size(); ++i) {
        edited[i] *= 3.0;
    }

    const auto a = indicator::macd(full);
    const auto b = indicator::macd(edited);
    const auto c = indicator::rsi(full, 14);
    const auto d = indicator::rsi(edited, 14);
    const auto e = indicator::bollinger(full, 20, 2.0);
    const auto f = indicator::bollinger(edited, 20, 2.0);

    for (std::size_t i = 0; i < 50; ++i) {
        expectSameOrBothNan(a.macd[i], b.macd[i], i);
        expectSameOrBothNan(a.signal[i], b.signal[i], i);
        expectSameOrBothNan(c[i], d[i], i);
        expectSameOrBothNan(e.upper[i], f.upper[i], i);
    }
}

TEST(IndicatorRegistrationTest, ColumnsAlignWithSeries) {
    const auto series = testing_util::makeSeries(zigzag(40));
    const auto cols   = series.columns();

    for (const auto& reg : {registration::sma("s", 5), registration::ema("e", 5), registration::rsi("r", 14),
                            registration::macd("m", 3, 6, 4), registration::bollinger("b", 10, 2.0)}) {
        const auto out = reg.compute(cols, reg.params);
        ASSERT_FALSE(out.empty()) << reg.name;
        for (const auto& column : out) {
            EXPECT_EQ(column.second.size(), series.length()) << reg.name << "." << column.first;
        }
    }
}

TEST(IndicatorRegistrationTest, PlotIntent) {
    EXPECT_EQ(registration::sma("s", 5, "red").plotStyle, PlotStyle::OVERLAY);
    EXPECT_EQ(registration::sma("s", 5, "red").color, "red");
    EXPECT_EQ(registration::rsi("r", 14).plotStyle, PlotStyle::SEPARATE_AXIS);
    EXPECT_EQ(registration::macd("m", 12, 26, 9).params.at("slow"), 26.0);
}

TEST(IndicatorRegistrationTest, RejectsZeroPeriod) {
    const auto reg = registration::sma("s", 0);
    EXPECT_THROW((void)reg.compute(testing_util::makeSeries({1, 2, 3}).columns(), reg.params), std::invalid_argument);
}
