#pragma once

#include <cstddef>
#include <optional>
#include <vector>

// Indicator series are aligned to the input: element i is the value as of
// input bar i, NaN until the indicator has enough history.

// Simple average of the last `period` values
std::optional<double> sma(const std::vector<double>& values, std::size_t period);

std::vector<double> sma_series(const std::vector<double>& values, std::size_t period);

// Exponential average seeded with the SMA of the first `period` values
std::vector<double> ema_series(const std::vector<double>& values, std::size_t period);

// Wilder-smoothed RSI
std::vector<double> rsi_series(const std::vector<double>& closes, std::size_t period = 14);

// Unsmoothed RSI over each trailing window of `period` changes
std::vector<double> rolling_rsi_series(const std::vector<double>& closes, std::size_t period = 14);

struct MacdPoint {
    double macd;
    double signal;
    double histogram;
};

// MACD(fast, slow, signal). Signal and histogram stay NaN until the signal
// EMA is seeded, at index slow + signal - 2.
std::vector<MacdPoint> macd_series(const std::vector<double>& closes,
                                   std::size_t fast = 12,
                                   std::size_t slow = 26,
                                   std::size_t signal = 9);

// Wilder ADX. First value at index 2 * period - 1.
std::vector<double> adx_series(const std::vector<double>& highs,
                               const std::vector<double>& lows,
                               const std::vector<double>& closes,
                               std::size_t period = 14);

struct BollingerBand {
    double lower;
    double middle;
    double upper;
};

// Bands over the last `period` values, population standard deviation
std::optional<BollingerBand> bollinger(const std::vector<double>& values,
                                       std::size_t period = 20,
                                       double std_devs = 2.0);

std::vector<double> obv_series(const std::vector<double>& closes, const std::vector<double>& volumes);

// Strict local minima over a +/- radius window. A low is kept only when it
// sits at least `min_separation` bars after the previously kept one.
std::vector<std::size_t> find_swing_lows(const std::vector<double>& values,
                                         std::size_t radius = 2,
                                         std::size_t min_separation = 1);
