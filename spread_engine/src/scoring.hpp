#pragma once

#include "strategy_config.hpp"
#include "types.hpp"
#include <optional>
#include <vector>

struct ConfidenceInput {
    int stock_score = 0;
    int checklist_passed = 0;
    int checklist_total = 0;
    MomentumTrend momentum_overall = MomentumTrend::Stable;
    std::vector<MomentumTrend> momentum_signals;
    RelativeStrengthTrend relative_strength = RelativeStrengthTrend::Moderate;
    MarketRegime regime = MarketRegime::Neutral;
    std::optional<double> iv_rank;
};

class ConfidenceScorer {
public:
    explicit ConfidenceScorer(const StrategyConfig& config);

    ConfidenceScore score(const ConfidenceInput& input) const;

    int score_momentum(MomentumTrend overall, const std::vector<MomentumTrend>& signals) const;

    static ConfidenceLevel level_for(int total);

private:
    ConfidenceWeights weights_;
};
