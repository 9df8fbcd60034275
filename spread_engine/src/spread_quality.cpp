#include "spread_quality.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace {
    // Non-finite metrics never match a rung
    int evaluate_finite(const PointLadder<>& ladder, double value) {
        return std::isfinite(value) ? ladder.evaluate(value) : 0;
    }
}

SpreadQualityScorer::SpreadQualityScorer(const StrategyConfig& config)
    : strategy_(config.strategy), quality_(config.quality) {}

SpreadQualityScore SpreadQualityScorer::score(const SpreadCandidate& candidate,
                                              std::optional<double> support,
                                              std::optional<int> days_to_earnings,
                                              double current_price,
                                              int dte) const {
    SpreadQualityScore result;
    auto& b = result.breakdown;
    b.premium_ratio = score_premium_ratio(candidate);
    b.distance = score_distance(candidate, current_price);
    b.iv_rank = score_iv_rank(candidate.iv_rank);
    b.support_buffer = score_support_buffer(candidate, support);
    b.dte = score_dte(dte);
    b.delta = score_delta(candidate.short_delta);
    b.earnings_risk = score_earnings(days_to_earnings, dte);

    result.total = std::max(0, std::min(100, b.sum()));
    result.rating = rate(result.total);
    return result;
}

ScoredSpread SpreadQualityScorer::evaluate(const SpreadCandidate& candidate,
                                           std::optional<double> support,
                                           std::optional<int> days_to_earnings,
                                           double current_price,
                                           const std::chrono::system_clock::time_point& as_of) const {
    ScoredSpread scored;
    scored.candidate = candidate;
    scored.dte = days_until(candidate.expiration, as_of);
    scored.breakeven = breakeven(candidate);

    double width = candidate.width();
    if (strategy_ == SpreadStrategy::CreditSpread) {
        scored.max_profit = candidate.premium;
        scored.max_loss = width - candidate.premium;
    } else {
        scored.max_profit = width - candidate.premium;
        scored.max_loss = candidate.premium;
    }

    scored.quality = score(candidate, support, days_to_earnings, current_price, scored.dte);

    spdlog::debug("Spread {}/{} exp {}: quality {} ({})",
                  candidate.long_strike, candidate.short_strike, format_date(candidate.expiration),
                  scored.quality.total, to_string(scored.quality.rating));
    return scored;
}

int SpreadQualityScorer::score_premium_ratio(const SpreadCandidate& candidate) const {
    double width = candidate.width();
    if (!is_finite_positive(width)) {
        return 0;
    }
    double ratio = safe_ratio(candidate.premium, width, std::nan("")) * 100.0;
    return evaluate_finite(quality_.premium_ratio, ratio);
}

int SpreadQualityScorer::score_distance(const SpreadCandidate& candidate, double current_price) const {
    if (!is_finite_positive(current_price)) {
        return 0;
    }

    double reference = strategy_ == SpreadStrategy::CreditSpread ? candidate.short_strike : breakeven(candidate);
    double pct = safe_ratio(current_price - reference, current_price, std::nan("")) * 100.0;
    return evaluate_finite(quality_.distance, pct);
}

int SpreadQualityScorer::score_iv_rank(double iv_rank) const {
    return evaluate_finite(quality_.iv_rank, iv_rank);
}

int SpreadQualityScorer::score_support_buffer(const SpreadCandidate& candidate, std::optional<double> support) const {
    if (!support || !is_finite_positive(*support)) {
        return quality_.no_support;
    }

    // Short strike for credit spreads, breakeven for debit spreads
    double protected_level = strategy_ == SpreadStrategy::CreditSpread ? candidate.short_strike : breakeven(candidate);
    if (!is_finite_positive(protected_level)) {
        return 0;
    }
    if (*support <= protected_level) {
        return quality_.support_wrong_side;
    }

    double buffer = (*support - protected_level) / protected_level * 100.0;
    return evaluate_finite(quality_.support_buffer, buffer);
}

int SpreadQualityScorer::score_dte(int dte) const {
    return quality_.dte.evaluate(static_cast<double>(dte));
}

int SpreadQualityScorer::score_delta(double delta) const {
    return evaluate_finite(quality_.delta, std::abs(delta));
}

int SpreadQualityScorer::score_earnings(std::optional<int> days_to_earnings, int dte) const {
    if (!days_to_earnings) {
        return quality_.no_earnings;
    }
    return quality_.earnings_margin.evaluate(static_cast<double>(*days_to_earnings - dte));
}

double SpreadQualityScorer::breakeven(const SpreadCandidate& candidate) const {
    if (strategy_ == SpreadStrategy::CreditSpread) {
        return candidate.short_strike - candidate.premium;
    }
    return candidate.long_strike + candidate.premium;
}

SpreadRating SpreadQualityScorer::rate(int total) {
    if (total >= 80) return SpreadRating::Excellent;
    if (total >= 60) return SpreadRating::Good;
    if (total >= 40) return SpreadRating::Fair;
    return SpreadRating::Poor;
}
