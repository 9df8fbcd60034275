#pragma once

#include "types.hpp"
#include <optional>
#include <vector>

struct SupportLevel {
    double price = 0.0;
    int strength = 0;  // number of swing lows in the cluster
};

struct NearestSupport {
    SupportLevel level;
    double distance = 0.0;  // (price - level) / price
};

// Swing lows on bar lows, clustered by price. Sorted by ascending price.
std::vector<SupportLevel> detect_support_levels(const std::vector<PriceBar>& bars,
                                                double tolerance = 0.02,
                                                int min_touches = 2);

// Highest support level strictly below `price`
std::optional<NearestSupport> find_nearest_support(double price, const std::vector<PriceBar>& bars);

bool is_near_support(double price, const std::vector<PriceBar>& bars, double pct = 0.03);
