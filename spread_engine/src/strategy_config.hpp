#pragma once

#include "ladder.hpp"
#include "types.hpp"
#include <array>
#include <functional>
#include <map>
#include <string>
#include <vector>

// Labelled RSI zone, checked in table order
struct RsiBand {
    std::function<bool(double)> matches;
    int points = 0;
    std::string name;
    std::string label;
};

// Technical signal set for one strategy. Debit spreads score the contrarian
// set (oversold, pullbacks, 52-week lows); credit spreads score stability.
struct SignalConfig {
    SpreadStrategy style = SpreadStrategy::DebitSpread;

    // Per-group point allowance; groups not listed are uncapped
    std::map<SignalGroup, int> group_caps = {
        {SignalGroup::MovingAverage, 15},
        {SignalGroup::Momentum, 12},
        {SignalGroup::PricePosition, 12},
        {SignalGroup::Pullback, 15},
    };
    int score_ceiling = 50;
    std::size_t min_bars = 20;

    std::vector<RsiBand> rsi_bands;
    int golden_cross_points = 10;
    int ma_position_points = 5;
    double volume_surge_multiplier = 1.5;
    double near_support_pct = 0.03;
    std::size_t divergence_lookback = 20;

    static SignalConfig credit_spread();
    static SignalConfig debit_spread();
};

// Threshold tables for the seven spread-quality components
struct SpreadQualityConfig {
    PointLadder<> premium_ratio;    // premium / width x 100
    PointLadder<> distance;         // credit: % OTM, debit: % cushion above breakeven
    PointLadder<> iv_rank;
    PointLadder<> support_buffer;   // % of support above the protected level
    int support_wrong_side = 2;     // support at or below the protected level
    int no_support = 0;
    PointLadder<> dte;
    PointLadder<> delta;            // absolute delta
    PointLadder<> earnings_margin;  // days to earnings minus DTE
    int no_earnings = 10;
};

struct ConfidenceWeights {
    int stock_score = 25;
    int checklist = 20;

    int momentum_improving = 15;
    int momentum_stable = 10;
    int momentum_deteriorating = 3;

    // Per-indicator consensus adjustment; off when min signals is 0
    std::size_t consensus_min_signals = 0;
    int consensus_bonus = 0;
    int consensus_penalty = 0;

    int rs_strong = 15;
    int rs_moderate = 10;
    int rs_weak = 5;
    int rs_underperforming = 2;

    // Indexed by MarketRegime
    std::array<int, 4> regime = {15, 8, 4, 0};

    bool iv_weighted = true;
    PointLadder<> iv_environment;
};

struct SizingTier {
    PositionSize size = PositionSize::Skip;
    int percentage = 0;
};

// [ConfidenceLevel][MarketRegime]
using SizingMatrix = std::array<std::array<SizingTier, 4>, 5>;

struct TimingConfig {
    double oversold_below = 30.0;
    double ideal_max = 40.0;
    double neutral_max = 55.0;
    double extended_below = 65.0;
    double ma_band = 0.01;
    double default_rsi = 50.0;
    double default_support_distance = 10.0;
    double min_support_distance = 3.0;

    // Credit spreads want rich premium, debit spreads want it cheap
    bool iv_favorable_when_high = true;
    double iv_favorable_threshold = 30.0;

    std::string strategy_label = "PCS";
};

struct StrategyConfig {
    SpreadStrategy strategy = SpreadStrategy::CreditSpread;
    SignalConfig signals;
    SpreadQualityConfig quality;
    ConfidenceWeights confidence;
    SizingMatrix sizing;
    TimingConfig timing;
    int contract_multiplier = 100;
    double low_iv_warning = 20.0;

    static StrategyConfig credit_spread();
    static StrategyConfig debit_spread();
    static StrategyConfig for_strategy(SpreadStrategy strategy);

    const SizingTier& tier(ConfidenceLevel level, MarketRegime regime) const;
};
