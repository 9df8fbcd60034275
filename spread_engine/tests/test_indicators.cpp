#include "indicators.hpp"
#include "test_bars.hpp"
#include <gtest/gtest.h>
#include <cmath>

TEST(Indicators, SmaUsesTrailingWindow) {
    std::vector<double> values = {1, 2, 3, 4, 5};
    auto average = sma(values, 3);
    ASSERT_TRUE(average.has_value());
    EXPECT_DOUBLE_EQ(*average, 4.0);
    EXPECT_FALSE(sma(values, 6).has_value());
    EXPECT_FALSE(sma(values, 0).has_value());
}

TEST(Indicators, SmaSeriesIsAlignedToInput) {
    auto series = sma_series({1, 2, 3, 4, 5}, 3);
    ASSERT_EQ(series.size(), 5u);
    EXPECT_TRUE(std::isnan(series[0]));
    EXPECT_TRUE(std::isnan(series[1]));
    EXPECT_DOUBLE_EQ(series[2], 2.0);
    EXPECT_DOUBLE_EQ(series[4], 4.0);
}

TEST(Indicators, EmaSeedsWithSimpleAverage) {
    auto series = ema_series({1, 2, 3, 4, 5}, 3);
    EXPECT_TRUE(std::isnan(series[1]));
    EXPECT_DOUBLE_EQ(series[2], 2.0);
    EXPECT_DOUBLE_EQ(series[3], 3.0);
    EXPECT_DOUBLE_EQ(series[4], 4.0);
}

TEST(Indicators, RsiExtremes) {
    auto rising = rsi_series(linear_closes(30, 100.0, 1.0));
    EXPECT_TRUE(std::isnan(rising[13]));
    EXPECT_DOUBLE_EQ(rising.back(), 100.0);

    auto falling = rsi_series(linear_closes(30, 100.0, -1.0));
    EXPECT_DOUBLE_EQ(falling.back(), 0.0);

    auto flat = rsi_series(std::vector<double>(30, 50.0));
    EXPECT_DOUBLE_EQ(flat.back(), 50.0);
}

TEST(Indicators, RsiNeedsMoreThanOnePeriod) {
    auto series = rsi_series(linear_closes(14, 100.0, 1.0));
    for (double value : series) {
        EXPECT_TRUE(std::isnan(value));
    }
}

TEST(Indicators, RollingRsiTreatsLosslessWindowAsStrong) {
    auto series = rolling_rsi_series(linear_closes(20, 10.0, 0.5));
    EXPECT_NEAR(series.back(), 100.0 - 100.0 / 101.0, 1e-9);
}

TEST(Indicators, MacdWarmUp) {
    auto series = macd_series(linear_closes(40, 50.0, 0.25));
    ASSERT_EQ(series.size(), 40u);
    EXPECT_TRUE(std::isnan(series[24].macd));
    EXPECT_TRUE(std::isfinite(series[25].macd));
    EXPECT_TRUE(std::isnan(series[32].signal));
    EXPECT_TRUE(std::isfinite(series[33].signal));
    EXPECT_NEAR(series[33].histogram, series[33].macd - series[33].signal, 1e-12);
}

TEST(Indicators, AdxFirstValueAfterTwoPeriods) {
    auto closes = linear_closes(40, 100.0, 1.0);
    std::vector<double> highs;
    std::vector<double> lows;
    for (double close : closes) {
        highs.push_back(close + 1.0);
        lows.push_back(close - 1.0);
    }
    auto adx = adx_series(highs, lows, closes, 14);
    EXPECT_TRUE(std::isnan(adx[26]));
    ASSERT_TRUE(std::isfinite(adx[27]));
    // A one-way series is all directional movement
    EXPECT_NEAR(adx.back(), 100.0, 1e-9);
}

TEST(Indicators, BollingerCollapsesOnFlatSeries) {
    auto band = bollinger(std::vector<double>(25, 42.0));
    ASSERT_TRUE(band.has_value());
    EXPECT_DOUBLE_EQ(band->lower, 42.0);
    EXPECT_DOUBLE_EQ(band->middle, 42.0);
    EXPECT_DOUBLE_EQ(band->upper, 42.0);
    EXPECT_FALSE(bollinger(std::vector<double>(10, 42.0)).has_value());
}

TEST(Indicators, ObvAccumulatesSignedVolume) {
    auto obv = obv_series({10, 11, 10, 10}, {100, 200, 300, 400});
    ASSERT_EQ(obv.size(), 4u);
    EXPECT_DOUBLE_EQ(obv[0], 0.0);
    EXPECT_DOUBLE_EQ(obv[1], 200.0);
    EXPECT_DOUBLE_EQ(obv[2], -100.0);
    EXPECT_DOUBLE_EQ(obv[3], -100.0);
}

TEST(Indicators, SwingLowsRespectSeparation) {
    std::vector<double> values = {5, 4, 3, 4, 5, 4, 2, 4, 5};
    EXPECT_EQ(find_swing_lows(values, 2, 1), (std::vector<std::size_t>{2, 6}));
    EXPECT_EQ(find_swing_lows(values, 2, 5), (std::vector<std::size_t>{2}));
    EXPECT_TRUE(find_swing_lows({1, 2, 3}, 2, 1).empty());
}
