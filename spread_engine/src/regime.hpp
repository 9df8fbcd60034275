#pragma once

#include "types.hpp"
#include <string>
#include <vector>

// Classifies the broad market from benchmark index bars (typically SPY).
// Any failure falls back to the conservative neutral default; it never
// reports a more aggressive regime than the data supports.
class RegimeDetector {
public:
    static constexpr std::size_t kMinBars = 200;

    RegimeResult detect(const std::vector<PriceBar>& benchmark_bars) const;

    static RegimeResult conservative_default(const std::string& recommendation);

    // Fixed adjustments for each regime
    static RegimeAdjustments adjustments_for(MarketRegime regime);

private:
    RegimeResult classify(const std::vector<PriceBar>& benchmark_bars) const;
};
