#include "scoring.hpp"
#include <algorithm>
#include <cmath>

ConfidenceScorer::ConfidenceScorer(const StrategyConfig& config) : weights_(config.confidence) {}

ConfidenceScore ConfidenceScorer::score(const ConfidenceInput& input) const {
    ConfidenceScore result;
    auto& b = result.breakdown;

    // Stock score is expected in 0-100; anything outside is clamped first
    double stock = std::max(0, std::min(100, input.stock_score));
    b.stock_score = static_cast<int>(std::round(stock / 100.0 * weights_.stock_score));

    double pass_rate = 0.0;
    if (input.checklist_total > 0) {
        pass_rate = static_cast<double>(input.checklist_passed) / input.checklist_total;
        pass_rate = std::max(0.0, std::min(1.0, pass_rate));
    }
    b.checklist_pass_rate = static_cast<int>(std::round(pass_rate * weights_.checklist));

    b.momentum = score_momentum(input.momentum_overall, input.momentum_signals);

    switch (input.relative_strength) {
        case RelativeStrengthTrend::Strong: b.relative_strength = weights_.rs_strong; break;
        case RelativeStrengthTrend::Moderate: b.relative_strength = weights_.rs_moderate; break;
        case RelativeStrengthTrend::Weak: b.relative_strength = weights_.rs_weak; break;
        case RelativeStrengthTrend::Underperforming: b.relative_strength = weights_.rs_underperforming; break;
    }

    b.market_regime = weights_.regime[static_cast<std::size_t>(input.regime)];

    if (weights_.iv_weighted && input.iv_rank && std::isfinite(*input.iv_rank)) {
        b.iv_environment = weights_.iv_environment.evaluate(*input.iv_rank);
    }

    result.total = std::max(0, std::min(100, b.sum()));
    result.level = level_for(result.total);
    return result;
}

int ConfidenceScorer::score_momentum(MomentumTrend overall, const std::vector<MomentumTrend>& signals) const {
    int points = weights_.momentum_stable;
    switch (overall) {
        case MomentumTrend::Improving: points = weights_.momentum_improving; break;
        case MomentumTrend::Stable: points = weights_.momentum_stable; break;
        case MomentumTrend::Deteriorating: points = weights_.momentum_deteriorating; break;
    }

    if (weights_.consensus_min_signals == 0) {
        return points;
    }

    auto improving = static_cast<std::size_t>(std::count(signals.begin(), signals.end(), MomentumTrend::Improving));
    auto deteriorating = static_cast<std::size_t>(std::count(signals.begin(), signals.end(), MomentumTrend::Deteriorating));
    if (improving >= weights_.consensus_min_signals) {
        points = std::min(weights_.momentum_improving, points + weights_.consensus_bonus);
    } else if (deteriorating >= weights_.consensus_min_signals) {
        points = std::max(0, points - weights_.consensus_penalty);
    }
    return points;
}

ConfidenceLevel ConfidenceScorer::level_for(int total) {
    if (total >= 85) return ConfidenceLevel::VeryHigh;
    if (total >= 70) return ConfidenceLevel::High;
    if (total >= 55) return ConfidenceLevel::Moderate;
    if (total >= 40) return ConfidenceLevel::Low;
    return ConfidenceLevel::Insufficient;
}
