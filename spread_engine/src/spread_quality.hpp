#pragma once

#include "strategy_config.hpp"
#include "types.hpp"
#include <chrono>
#include <optional>

class SpreadQualityScorer {
public:
    explicit SpreadQualityScorer(const StrategyConfig& config);

    // Seven independent components, total clamped to [0, 100]
    SpreadQualityScore score(const SpreadCandidate& candidate,
                             std::optional<double> support,
                             std::optional<int> days_to_earnings,
                             double current_price,
                             int dte) const;

    // Scores the candidate and fills in its payoff profile
    ScoredSpread evaluate(const SpreadCandidate& candidate,
                          std::optional<double> support,
                          std::optional<int> days_to_earnings,
                          double current_price,
                          const std::chrono::system_clock::time_point& as_of) const;

    int score_premium_ratio(const SpreadCandidate& candidate) const;
    int score_distance(const SpreadCandidate& candidate, double current_price) const;
    int score_iv_rank(double iv_rank) const;
    int score_support_buffer(const SpreadCandidate& candidate, std::optional<double> support) const;
    int score_dte(int dte) const;
    int score_delta(double delta) const;
    int score_earnings(std::optional<int> days_to_earnings, int dte) const;

    // Breakeven at expiration
    double breakeven(const SpreadCandidate& candidate) const;

    static SpreadRating rate(int total);

private:
    SpreadStrategy strategy_;
    SpreadQualityConfig quality_;
};
