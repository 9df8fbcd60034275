#include "scoring.hpp"
#include <gtest/gtest.h>

namespace {
    ConfidenceInput strong_setup() {
        ConfidenceInput input;
        input.stock_score = 60;
        input.checklist_passed = 8;
        input.checklist_total = 10;
        input.momentum_overall = MomentumTrend::Improving;
        input.relative_strength = RelativeStrengthTrend::Strong;
        input.regime = MarketRegime::Bull;
        input.iv_rank = 40.0;
        return input;
    }
}

TEST(Confidence, CreditBreakdown) {
    ConfidenceScorer scorer(StrategyConfig::credit_spread());
    auto score = scorer.score(strong_setup());
    EXPECT_EQ(score.breakdown.stock_score, 15);
    EXPECT_EQ(score.breakdown.checklist_pass_rate, 16);
    EXPECT_EQ(score.breakdown.momentum, 15);
    EXPECT_EQ(score.breakdown.relative_strength, 15);
    EXPECT_EQ(score.breakdown.market_regime, 15);
    EXPECT_EQ(score.breakdown.iv_environment, 6);
    EXPECT_EQ(score.total, 82);
    EXPECT_EQ(score.level, ConfidenceLevel::High);
}

TEST(Confidence, OutOfRangeInputsAreClamped) {
    ConfidenceScorer scorer(StrategyConfig::credit_spread());
    auto input = strong_setup();
    input.stock_score = 150;
    input.checklist_passed = 12;
    auto score = scorer.score(input);
    EXPECT_EQ(score.breakdown.stock_score, 25);
    EXPECT_EQ(score.breakdown.checklist_pass_rate, 20);
    EXPECT_LE(score.total, 100);

    input.checklist_total = 0;
    input.iv_rank.reset();
    score = scorer.score(input);
    EXPECT_EQ(score.breakdown.checklist_pass_rate, 0);
    EXPECT_EQ(score.breakdown.iv_environment, 0);
}

TEST(Confidence, LevelBoundaries) {
    EXPECT_EQ(ConfidenceScorer::level_for(85), ConfidenceLevel::VeryHigh);
    EXPECT_EQ(ConfidenceScorer::level_for(84), ConfidenceLevel::High);
    EXPECT_EQ(ConfidenceScorer::level_for(70), ConfidenceLevel::High);
    EXPECT_EQ(ConfidenceScorer::level_for(69), ConfidenceLevel::Moderate);
    EXPECT_EQ(ConfidenceScorer::level_for(55), ConfidenceLevel::Moderate);
    EXPECT_EQ(ConfidenceScorer::level_for(54), ConfidenceLevel::Low);
    EXPECT_EQ(ConfidenceScorer::level_for(40), ConfidenceLevel::Low);
    EXPECT_EQ(ConfidenceScorer::level_for(39), ConfidenceLevel::Insufficient);
}

TEST(Confidence, DebitMomentumConsensus) {
    ConfidenceScorer scorer(StrategyConfig::debit_spread());
    std::vector<MomentumTrend> improving(4, MomentumTrend::Improving);
    std::vector<MomentumTrend> deteriorating(4, MomentumTrend::Deteriorating);

    EXPECT_EQ(scorer.score_momentum(MomentumTrend::Improving, improving), 20);
    EXPECT_EQ(scorer.score_momentum(MomentumTrend::Stable, improving), 15);
    EXPECT_EQ(scorer.score_momentum(MomentumTrend::Stable, deteriorating), 7);
    EXPECT_EQ(scorer.score_momentum(MomentumTrend::Deteriorating, deteriorating), 0);
    EXPECT_EQ(scorer.score_momentum(MomentumTrend::Stable, {MomentumTrend::Improving}), 12);
}

TEST(Confidence, CreditIgnoresConsensus) {
    ConfidenceScorer scorer(StrategyConfig::credit_spread());
    std::vector<MomentumTrend> improving(5, MomentumTrend::Improving);
    EXPECT_EQ(scorer.score_momentum(MomentumTrend::Stable, improving), 10);
}

TEST(Confidence, DebitIgnoresImpliedVolatility) {
    ConfidenceScorer scorer(StrategyConfig::debit_spread());
    auto input = strong_setup();
    input.iv_rank = 60.0;
    auto score = scorer.score(input);
    EXPECT_EQ(score.breakdown.iv_environment, 0);
    EXPECT_EQ(score.breakdown.market_regime, 10);
    EXPECT_EQ(score.breakdown.stock_score, 18);
}
