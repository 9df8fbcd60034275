#pragma once

#include "strategy_config.hpp"
#include "types.hpp"
#include <map>
#include <optional>
#include <vector>

// Signals with the points each one actually contributed after its group's
// allowance was applied, in input order
std::vector<TechnicalSignal> apply_group_caps(const std::vector<TechnicalSignal>& signals,
                                              const std::map<SignalGroup, int>& caps);

int total_points(const std::vector<TechnicalSignal>& signals);

// Bullish divergence between price and the rolling RSI / MACD histogram
// over the last `lookback` bars
std::optional<TechnicalSignal> check_rsi_divergence(const std::vector<double>& closes, std::size_t lookback = 20);
std::optional<TechnicalSignal> check_macd_divergence(const std::vector<double>& closes, std::size_t lookback = 20);

class TechnicalSignalDetector {
public:
    explicit TechnicalSignalDetector(const SignalConfig& config);

    TechnicalResult detect(const std::vector<PriceBar>& bars) const;

    // Individual sub-signals. Each returns nothing when its bar minimum is unmet.
    // MA position, ADX and Bollinger read differently for credit spreads.
    std::optional<TechnicalSignal> check_rsi(const std::vector<double>& closes) const;
    std::vector<TechnicalSignal> check_pullback(double price, const std::vector<double>& closes) const;
    std::optional<TechnicalSignal> check_golden_cross(const std::vector<double>& closes) const;
    std::vector<TechnicalSignal> check_ma_position(double price, const std::vector<double>& closes) const;
    std::optional<TechnicalSignal> check_ma200_reclaim(double price, const std::vector<double>& closes) const;
    std::optional<TechnicalSignal> check_ma_proximity(double price, const std::vector<double>& closes) const;
    std::optional<TechnicalSignal> check_volume_surge(const std::vector<double>& volumes) const;
    std::optional<TechnicalSignal> check_near_support(double price, const std::vector<PriceBar>& bars) const;
    std::optional<TechnicalSignal> check_obv_trend(const std::vector<double>& closes, const std::vector<double>& volumes) const;
    std::optional<TechnicalSignal> check_macd(const std::vector<double>& closes) const;
    std::optional<TechnicalSignal> check_52_week(double price, const std::vector<double>& closes) const;
    std::optional<TechnicalSignal> check_adx(const std::vector<PriceBar>& bars) const;
    std::optional<TechnicalSignal> check_bollinger(double price, const std::vector<double>& closes) const;

private:
    SignalConfig config_;
};
