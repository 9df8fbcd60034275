#include "support.hpp"
#include "indicators.hpp"
#include <algorithm>
#include <cmath>

std::vector<SupportLevel> detect_support_levels(const std::vector<PriceBar>& bars,
                                                double tolerance,
                                                int min_touches) {
    std::vector<SupportLevel> levels;
    if (bars.size() < 5) {
        return levels;
    }

    std::vector<double> lows;
    lows.reserve(bars.size());
    for (const auto& bar : bars) {
        lows.push_back(bar.low);
    }

    std::vector<double> swing_prices;
    for (auto idx : find_swing_lows(lows, 2, 1)) {
        if (lows[idx] > 0.0) {
            swing_prices.push_back(lows[idx]);
        }
    }
    std::sort(swing_prices.begin(), swing_prices.end());

    double cluster_sum = 0.0;
    int cluster_count = 0;
    auto flush = [&]() {
        if (cluster_count > 0 && cluster_count >= min_touches) {
            levels.push_back({cluster_sum / cluster_count, cluster_count});
        }
        cluster_sum = 0.0;
        cluster_count = 0;
    };

    for (double price : swing_prices) {
        if (cluster_count > 0) {
            double mean = cluster_sum / cluster_count;
            if (std::abs(price - mean) / mean > tolerance) {
                flush();
            }
        }
        cluster_sum += price;
        ++cluster_count;
    }
    flush();

    return levels;
}

std::optional<NearestSupport> find_nearest_support(double price, const std::vector<PriceBar>& bars) {
    if (!(price > 0.0)) {
        return std::nullopt;
    }

    std::optional<NearestSupport> nearest;
    for (const auto& level : detect_support_levels(bars)) {
        if (level.price >= price) {
            continue;
        }
        if (!nearest || level.price > nearest->level.price) {
            nearest = NearestSupport{level, (price - level.price) / price};
        }
    }
    return nearest;
}

bool is_near_support(double price, const std::vector<PriceBar>& bars, double pct) {
    auto nearest = find_nearest_support(price, bars);
    return nearest && nearest->distance <= pct;
}
