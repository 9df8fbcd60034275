#pragma once

#include "types.hpp"
#include "util.hpp"
#include <chrono>
#include <cstddef>
#include <vector>

// Shared fixtures for the price-driven suites

inline std::chrono::system_clock::time_point test_day(int offset) {
    static const auto base = *parse_iso8601("2024-01-02");
    return base + std::chrono::hours(24 * offset);
}

inline PriceBar make_bar(int offset, double close, double low, double volume = 1'000'000.0) {
    PriceBar bar;
    bar.date = test_day(offset);
    bar.open = close;
    bar.high = close * 1.01;
    bar.low = low;
    bar.close = close;
    bar.volume = volume;
    return bar;
}

inline std::vector<PriceBar> bars_from_closes(const std::vector<double>& closes, double volume = 1'000'000.0) {
    std::vector<PriceBar> bars;
    bars.reserve(closes.size());
    for (std::size_t i = 0; i < closes.size(); ++i) {
        bars.push_back(make_bar(static_cast<int>(i), closes[i], closes[i] * 0.99, volume));
    }
    return bars;
}

inline std::vector<double> linear_closes(std::size_t count, double start, double step) {
    std::vector<double> closes;
    closes.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        closes.push_back(start + step * static_cast<double>(i));
    }
    return closes;
}
