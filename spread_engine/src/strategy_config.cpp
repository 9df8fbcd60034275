#include "strategy_config.hpp"

namespace {
    constexpr SizingTier kFull{PositionSize::Full, 100};
    constexpr SizingTier kThreeQuarter{PositionSize::ThreeQuarter, 75};
    constexpr SizingTier kHalf{PositionSize::Half, 50};
    constexpr SizingTier kQuarter{PositionSize::Quarter, 25};
    constexpr SizingTier kSkip{PositionSize::Skip, 0};

    PointLadder<> earnings_ladder() {
        return PointLadder<>({
            {When::above(7.0), 10},
            {When::above(0.0), 7},
            {When::above(-5.0), 3},
        }, 0);
    }
}

SignalConfig SignalConfig::credit_spread() {
    SignalConfig config;
    config.style = SpreadStrategy::CreditSpread;
    config.group_caps = {
        {SignalGroup::MovingAverage, 15},
        {SignalGroup::Momentum, 12},
        {SignalGroup::PricePosition, 10},
    };
    config.score_ceiling = 40;
    config.rsi_bands = {
        {When::between(40.0, 55.0), 10, "RSI Ideal Zone", "ideal for PCS"},
        {When::between(55.0, 65.0), 5, "RSI Acceptable", "slightly extended, acceptable"},
        {When::between(35.0, 40.0), 4, "RSI Approaching Oversold", "approaching oversold - caution"},
        {When::below(35.0), 1, "RSI Oversold Warning", "oversold - high risk for PCS"},
        {When::above(65.0), 2, "RSI Extended", "extended - may pull back"},
    };
    return config;
}

SignalConfig SignalConfig::debit_spread() {
    SignalConfig config;
    config.rsi_bands = {
        {When::between(35.0, 50.0), 10, "RSI Entry Zone", "ideal entry zone"},
        {When::between(30.0, 35.0), 7, "RSI Approaching Oversold", "approaching oversold"},
        {When::below(30.0), 5, "RSI Oversold", "oversold - verify trend"},
        {When::between(50.0, 55.0), 4, "RSI Acceptable", "slightly extended"},
        {When::below(70.0), 1, "RSI Extended", "extended - wait"},
    };
    return config;
}

StrategyConfig StrategyConfig::credit_spread() {
    StrategyConfig config;
    config.strategy = SpreadStrategy::CreditSpread;
    config.signals = SignalConfig::credit_spread();

    auto& q = config.quality;
    q.premium_ratio = PointLadder<>({
        {When::between(28.0, 38.0), 20},
        {When::between(22.0, 42.0), 15},
        {When::between(18.0, 48.0), 10},
        {When::at_least(12.0), 5},
    }, 0);
    q.distance = PointLadder<>({
        {When::between(7.0, 12.0), 20},
        {When::between(5.0, 15.0), 15},
        {When::between(3.0, 20.0), 10},
        {When::at_least(1.0), 5},
    }, 0);
    q.iv_rank = PointLadder<>({
        {When::at_least(50.0), 15},
        {When::at_least(35.0), 10},
        {When::at_least(20.0), 6},
    }, 2);
    q.support_buffer = PointLadder<>({
        {When::at_least(5.0), 15},
        {When::at_least(3.0), 10},
        {When::at_least(1.0), 6},
    }, 3);
    q.dte = PointLadder<>({
        {When::between(30.0, 45.0), 10},
        {When::between(21.0, 55.0), 7},
        {When::between(14.0, 70.0), 4},
    }, 2);
    q.delta = PointLadder<>({
        {When::between(0.23, 0.32), 10},
        {When::between(0.18, 0.38), 7},
        {When::between(0.12, 0.45), 4},
    }, 2);
    q.earnings_margin = earnings_ladder();

    auto& c = config.confidence;
    c.stock_score = 25;
    c.checklist = 20;
    c.momentum_improving = 15;
    c.momentum_stable = 10;
    c.momentum_deteriorating = 3;
    c.regime = {15, 8, 4, 0};
    c.iv_weighted = true;
    c.iv_environment = PointLadder<>({
        {When::at_least(50.0), 10},
        {When::at_least(30.0), 6},
        {When::at_least(15.0), 3},
    }, 0);

    // Short premium is punished hardest outside a bull market
    config.sizing = {{
        {{kFull, kHalf, kQuarter, kQuarter}},           // very high
        {{kThreeQuarter, kQuarter, kQuarter, kSkip}},   // high
        {{kHalf, kQuarter, kSkip, kSkip}},              // moderate
        {{kQuarter, kSkip, kSkip, kSkip}},              // low
        {{kSkip, kSkip, kSkip, kSkip}},                 // insufficient
    }};

    config.timing = TimingConfig();
    config.timing.ideal_max = 40.0;
    config.timing.extended_below = 65.0;
    config.timing.iv_favorable_when_high = true;
    config.timing.iv_favorable_threshold = 30.0;
    config.timing.strategy_label = "PCS";

    return config;
}

StrategyConfig StrategyConfig::debit_spread() {
    StrategyConfig config;
    config.strategy = SpreadStrategy::DebitSpread;
    config.signals = SignalConfig::debit_spread();

    auto& q = config.quality;
    q.premium_ratio = PointLadder<>({
        {When::between(60.0, 80.0), 20},
        {When::between(50.0, 85.0), 15},
        {When::between(40.0, 90.0), 10},
        {When::at_most(95.0), 5},
    }, 0);
    q.distance = PointLadder<>({
        {When::at_least(7.0), 20},
        {When::at_least(5.0), 16},
        {When::at_least(3.0), 10},
        {When::at_least(1.0), 5},
    }, 0);
    q.iv_rank = PointLadder<>({
        {When::at_most(30.0), 15},
        {When::at_most(50.0), 10},
        {When::at_most(70.0), 6},
    }, 2);
    q.support_buffer = PointLadder<>({
        {When::at_least(5.0), 15},
        {When::at_least(3.0), 10},
        {When::at_least(1.0), 6},
    }, 3);
    q.dte = PointLadder<>({
        {When::between(21.0, 45.0), 10},
        {When::between(14.0, 60.0), 7},
        {When::between(7.0, 90.0), 4},
    }, 2);
    q.delta = PointLadder<>({
        {When::between(0.75, 0.85), 10},
        {When::between(0.70, 0.90), 7},
        {When::between(0.60, 0.95), 4},
    }, 2);
    q.earnings_margin = earnings_ladder();

    auto& c = config.confidence;
    c.stock_score = 30;
    c.checklist = 25;
    c.momentum_improving = 20;
    c.momentum_stable = 12;
    c.momentum_deteriorating = 4;
    c.consensus_min_signals = 4;
    c.consensus_bonus = 3;
    c.consensus_penalty = 5;
    c.regime = {10, 6, 4, 2};
    c.iv_weighted = false;
    c.iv_environment = PointLadder<>();

    config.sizing = {{
        {{kFull, kThreeQuarter, kHalf, kHalf}},            // very high
        {{kThreeQuarter, kHalf, kQuarter, kQuarter}},      // high
        {{kHalf, kQuarter, kQuarter, kSkip}},              // moderate
        {{kQuarter, kSkip, kSkip, kSkip}},                 // low
        {{kSkip, kSkip, kSkip, kSkip}},                    // insufficient
    }};

    config.timing = TimingConfig();
    config.timing.ideal_max = 50.0;
    config.timing.extended_below = 70.0;
    config.timing.iv_favorable_when_high = false;
    config.timing.iv_favorable_threshold = 50.0;
    config.timing.strategy_label = "CDS";

    return config;
}

StrategyConfig StrategyConfig::for_strategy(SpreadStrategy strategy) {
    return strategy == SpreadStrategy::DebitSpread ? debit_spread() : credit_spread();
}

const SizingTier& StrategyConfig::tier(ConfidenceLevel level, MarketRegime regime) const {
    // ConfidenceLevel runs insufficient..very_high; the matrix rows run the other way
    std::size_t row = 4 - static_cast<std::size_t>(level);
    return sizing[row][static_cast<std::size_t>(regime)];
}
