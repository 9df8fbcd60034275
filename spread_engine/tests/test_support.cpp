#include "support.hpp"
#include "test_bars.hpp"
#include <gtest/gtest.h>

namespace {
    // Three dips to roughly 100, then a rally to 128
    std::vector<PriceBar> bouncing_bars() {
        std::vector<double> lows = {110, 108, 100, 108, 110, 108, 100.5, 108, 110, 108, 99.8, 108, 110,
                                    112, 115, 118, 120, 122, 125, 128};
        std::vector<PriceBar> bars;
        for (std::size_t i = 0; i < lows.size(); ++i) {
            bars.push_back(make_bar(static_cast<int>(i), lows[i] + 1.0, lows[i]));
        }
        return bars;
    }
}

TEST(Support, ClustersRepeatedSwingLows) {
    auto levels = detect_support_levels(bouncing_bars());
    ASSERT_EQ(levels.size(), 1u);
    EXPECT_NEAR(levels[0].price, (99.8 + 100.0 + 100.5) / 3.0, 1e-9);
    EXPECT_EQ(levels[0].strength, 3);
}

TEST(Support, RequiresMinimumTouches) {
    EXPECT_TRUE(detect_support_levels(bouncing_bars(), 0.02, 4).empty());
}

TEST(Support, TooFewBarsYieldNothing) {
    auto bars = bouncing_bars();
    bars.resize(4);
    EXPECT_TRUE(detect_support_levels(bars).empty());
}

TEST(Support, NearestLevelBelowPrice) {
    auto bars = bouncing_bars();
    auto nearest = find_nearest_support(128.0, bars);
    ASSERT_TRUE(nearest.has_value());
    EXPECT_NEAR(nearest->level.price, 100.1, 1e-9);
    EXPECT_NEAR(nearest->distance, (128.0 - 100.1) / 128.0, 1e-9);

    EXPECT_FALSE(find_nearest_support(95.0, bars).has_value());
    EXPECT_FALSE(find_nearest_support(0.0, bars).has_value());
}

TEST(Support, NearSupportWithinPercent) {
    auto bars = bouncing_bars();
    EXPECT_TRUE(is_near_support(102.0, bars));
    EXPECT_FALSE(is_near_support(110.0, bars));
}
