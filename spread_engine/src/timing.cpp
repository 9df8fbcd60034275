#include "timing.hpp"
#include "util.hpp"
#include <cmath>
#include <fmt/format.h>

TimingAnalyzer::TimingAnalyzer(const StrategyConfig& config) : config_(config.timing) {}

TimingAnalysis TimingAnalyzer::analyze(const TimingInput& input) const {
    TimingAnalysis timing;

    double rsi = (input.rsi && std::isfinite(*input.rsi)) ? *input.rsi : config_.default_rsi;
    timing.rsi_zone = classify_rsi(rsi);
    timing.price_vs_ma = classify_price(input.current_price, input.ma50);
    timing.iv_rank_favorable = iv_favorable(input.iv_rank);

    timing.distance_to_support = config_.default_support_distance;
    if (input.support && is_finite_positive(*input.support) && is_finite_positive(input.current_price)) {
        timing.distance_to_support = (input.current_price - *input.support) / input.current_price * 100.0;
    }

    bool zone_ok = timing.rsi_zone == RsiZone::Neutral || timing.rsi_zone == RsiZone::Ideal;
    bool not_below = timing.price_vs_ma == PriceVsMa::Above || timing.price_vs_ma == PriceVsMa::At;
    bool support_room = timing.distance_to_support > config_.min_support_distance;

    int enter_score = static_cast<int>(zone_ok) + static_cast<int>(not_below) +
                      static_cast<int>(timing.iv_rank_favorable) + static_cast<int>(support_room);
    int wait_score = static_cast<int>(timing.rsi_zone == RsiZone::Oversold) +
                     static_cast<int>(timing.price_vs_ma == PriceVsMa::Below) +
                     static_cast<int>(!timing.iv_rank_favorable);

    const auto& label = config_.strategy_label;
    bool has_ma50 = input.ma50 && is_finite_positive(*input.ma50);

    if (enter_score >= 3) {
        timing.action = TimingAction::Enter;
        if (timing.iv_rank_favorable) {
            timing.reason = config_.iv_favorable_when_high
                ? fmt::format("IV elevated + stable price action - favorable for {}", label)
                : fmt::format("IV reasonable + stable price action - favorable for {}", label);
        } else {
            timing.reason = fmt::format("Price stable above support - acceptable for {}", label);
        }
    } else if (wait_score >= 2) {
        timing.action = TimingAction::Wait;
        if (timing.rsi_zone == RsiZone::Oversold) {
            timing.reason = "RSI oversold - wait for stabilization";
            timing.wait_target = has_ma50 ? *input.ma50 : input.current_price * 1.03;
        } else if (timing.price_vs_ma == PriceVsMa::Below) {
            timing.reason = "Price below MA50 - wait for reclaim";
            if (has_ma50) {
                timing.wait_target = *input.ma50;
            }
        } else {
            timing.reason = config_.iv_favorable_when_high
                ? "IV too low - wait for volatility expansion"
                : "IV too high - wait for volatility to contract";
        }
    } else {
        // Neither threshold met: default to entering
        timing.action = TimingAction::Enter;
        timing.reason = fmt::format("Conditions acceptable for {} entry", label);
    }

    return timing;
}

RsiZone TimingAnalyzer::classify_rsi(double rsi) const {
    if (rsi < config_.oversold_below) return RsiZone::Oversold;
    if (rsi <= config_.ideal_max) return RsiZone::Ideal;
    if (rsi <= config_.neutral_max) return RsiZone::Neutral;
    if (rsi < config_.extended_below) return RsiZone::Extended;
    return RsiZone::Overbought;
}

PriceVsMa TimingAnalyzer::classify_price(double price, std::optional<double> ma50) const {
    if (!ma50 || !is_finite_positive(*ma50)) {
        return PriceVsMa::At;
    }
    if (price < *ma50 * (1.0 - config_.ma_band)) return PriceVsMa::Below;
    if (price > *ma50 * (1.0 + config_.ma_band)) return PriceVsMa::Above;
    return PriceVsMa::At;
}

bool TimingAnalyzer::iv_favorable(std::optional<double> iv_rank) const {
    double iv = (iv_rank && std::isfinite(*iv_rank)) ? *iv_rank : 0.0;
    if (config_.iv_favorable_when_high) {
        return iv >= config_.iv_favorable_threshold;
    }
    return iv <= config_.iv_favorable_threshold;
}
