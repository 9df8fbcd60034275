#include "regime.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace {
    RegimeSignal make_regime_signal(const std::string& name, double value, bool bullish, double weight) {
        RegimeSignal signal;
        signal.name = name;
        signal.value = value;
        signal.signal = bullish ? RegimeDirection::Bullish : RegimeDirection::Bearish;
        signal.weight = weight;
        return signal;
    }

    double direction(RegimeDirection signal) {
        switch (signal) {
            case RegimeDirection::Bullish: return 1.0;
            case RegimeDirection::Bearish: return -1.0;
            case RegimeDirection::Neutral: return 0.0;
        }
        return 0.0;
    }
}

RegimeResult RegimeDetector::detect(const std::vector<PriceBar>& benchmark_bars) const {
    if (benchmark_bars.size() < kMinBars) {
        spdlog::warn("Regime detection needs {} bars, got {}; using conservative default",
                     kMinBars, benchmark_bars.size());
        return conservative_default("Insufficient data for regime detection");
    }

    try {
        auto result = classify(benchmark_bars);
        spdlog::info("Market regime: {} (confidence {:.2f})", to_string(result.regime), result.confidence);
        return result;
    } catch (const std::exception& e) {
        spdlog::warn("Regime detection failed: {}; using conservative default", e.what());
        return conservative_default("Error detecting market regime");
    }
}

RegimeResult RegimeDetector::classify(const std::vector<PriceBar>& benchmark_bars) const {
    double sum200 = 0.0;
    double sum50 = 0.0;
    std::size_t n = benchmark_bars.size();
    for (std::size_t i = n - kMinBars; i < n; ++i) {
        double close = benchmark_bars[i].close;
        if (!is_finite_positive(close)) {
            throw std::runtime_error("benchmark series contains an unusable close");
        }
        sum200 += close;
        if (i >= n - 50) {
            sum50 += close;
        }
    }

    double price = benchmark_bars.back().close;
    double ma200 = sum200 / 200.0;
    double ma50 = sum50 / 50.0;

    RegimeResult result;
    result.signals.push_back(make_regime_signal("SPY vs MA200", (price - ma200) / ma200 * 100.0, price > ma200, 0.4));
    result.signals.push_back(make_regime_signal("SPY vs MA50", (price - ma50) / ma50 * 100.0, price > ma50, 0.3));
    result.signals.push_back(make_regime_signal("Golden Cross", (ma50 - ma200) / ma200 * 100.0, ma50 > ma200, 0.3));

    double score = 0.0;
    for (const auto& signal : result.signals) {
        score += direction(signal.signal) * signal.weight;
    }

    if (score > 0.5) {
        result.regime = MarketRegime::Bull;
        result.confidence = std::min(score, 1.0);
        result.recommendation = "Favorable conditions. Normal position sizing.";
    } else if (score < -0.3) {
        result.regime = MarketRegime::Bear;
        result.confidence = std::min(std::abs(score), 1.0);
        result.recommendation = "Risk-off. Reduce exposure, tighter criteria.";
    } else if (score < 0) {
        result.regime = MarketRegime::Caution;
        result.confidence = 0.5;
        result.recommendation = "Mixed signals. Focus on high-conviction setups.";
    } else {
        result.regime = MarketRegime::Neutral;
        result.confidence = 0.5;
        result.recommendation = "Proceed with normal caution.";
    }
    result.adjustments = adjustments_for(result.regime);

    spdlog::debug("Regime score {:.2f}: price {:.2f}, MA50 {:.2f}, MA200 {:.2f}", score, price, ma50, ma200);
    return result;
}

RegimeResult RegimeDetector::conservative_default(const std::string& recommendation) {
    RegimeResult result;
    result.regime = MarketRegime::Neutral;
    result.confidence = 0.5;
    result.recommendation = recommendation;
    result.adjustments = RegimeAdjustments{75, 0.5, true};
    return result;
}

RegimeAdjustments RegimeDetector::adjustments_for(MarketRegime regime) {
    switch (regime) {
        case MarketRegime::Bull: return {65, 1.0, false};
        case MarketRegime::Neutral: return {75, 0.8, false};
        case MarketRegime::Caution: return {80, 0.75, true};
        case MarketRegime::Bear: return {85, 0.5, true};
    }
    return {75, 0.5, true};
}
