#include "decision_engine.hpp"
#include "test_bars.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>

namespace {
    SpreadCandidate put_spread(double long_strike, double short_strike, double premium, int dte) {
        SpreadCandidate c;
        c.long_strike = long_strike;
        c.short_strike = short_strike;
        c.premium = premium;
        c.expiration = test_day(dte);
        c.short_delta = 0.27;
        c.iv_rank = 55.0;
        return c;
    }

    // Credit setup that clears every gate: confidence 82 (high) in a bull market
    DecisionEngineInput favorable_input() {
        DecisionEngineInput input;
        input.ticker = "ACME";
        input.current_price = 104.0;
        input.stock_score = 60;
        input.checklist_passed = 8;
        input.checklist_total = 10;
        input.momentum_overall = MomentumTrend::Improving;
        input.relative_strength = RelativeStrengthTrend::Strong;
        input.market_regime = MarketRegime::Bull;
        input.iv_rank = 40.0;
        input.rsi = 45.0;
        input.ma50 = 100.0;
        input.support = 100.0;
        input.spread_candidates = {put_spread(92.5, 95.0, 0.83, 38)};
        input.as_of = test_day(0);
        return input;
    }

    bool contains(const std::vector<std::string>& lines, const std::string& text) {
        return std::find(lines.begin(), lines.end(), text) != lines.end();
    }

    bool mentions(const std::vector<std::string>& lines, const std::string& fragment) {
        return std::any_of(lines.begin(), lines.end(),
                           [&fragment](const std::string& line) { return line.find(fragment) != std::string::npos; });
    }
}

TEST(DecisionEngine, EntersFavorableCreditSetup) {
    DecisionEngine engine(StrategyConfig::credit_spread());
    auto decision = engine.evaluate_entry(favorable_input());

    EXPECT_EQ(decision.action, EntryAction::EnterNow);
    EXPECT_EQ(decision.timeframe, Timeframe::Immediate);
    EXPECT_EQ(decision.confidence.total, 82);
    EXPECT_EQ(decision.position_sizing.size, PositionSize::ThreeQuarter);
    EXPECT_EQ(decision.position_sizing.max_contracts, 1);

    ASSERT_TRUE(decision.recommended_spread.has_value());
    ASSERT_TRUE(decision.spread_score.has_value());
    EXPECT_EQ(decision.recommended_spread->dte, 38);
    EXPECT_EQ(decision.spread_score->total, 100);
    EXPECT_EQ(decision.spread_score->rating, SpreadRating::Excellent);

    ASSERT_FALSE(decision.entry_guidance.empty());
    EXPECT_EQ(decision.entry_guidance[0], "Sell $95P / Buy $92.5P");
    EXPECT_TRUE(contains(decision.entry_guidance, "Credit: $83 per contract"));
    EXPECT_TRUE(contains(decision.entry_guidance, "Suggested: 1 contract(s)"));

    EXPECT_TRUE(contains(decision.risk_management, "Max loss: $167"));
    EXPECT_TRUE(contains(decision.risk_management, "Take profit at 50% of credit received"));
    EXPECT_TRUE(contains(decision.risk_management, "Exit if short strike breached"));
    EXPECT_TRUE(contains(decision.risk_management, "Support at $100.00 - exit if broken"));
    EXPECT_TRUE(decision.warnings.empty());
}

TEST(DecisionEngine, CreditBearMarketPasses) {
    DecisionEngine engine(StrategyConfig::credit_spread());
    auto input = favorable_input();
    input.market_regime = MarketRegime::Bear;
    auto decision = engine.evaluate_entry(input);

    EXPECT_EQ(decision.action, EntryAction::Pass);
    EXPECT_EQ(decision.position_sizing.size, PositionSize::Skip);
    EXPECT_TRUE(mentions(decision.warnings, "Bear market"));
    EXPECT_TRUE(contains(decision.warnings, "Bear market - avoid new PCS positions"));
    EXPECT_TRUE(decision.risk_management.empty());
}

TEST(DecisionEngine, DebitBearMarketPassesForNextWeek) {
    DecisionEngine engine(StrategyConfig::debit_spread());
    auto input = favorable_input();
    input.stock_score = 100;
    input.checklist_passed = 10;
    input.market_regime = MarketRegime::Bear;
    auto decision = engine.evaluate_entry(input);

    EXPECT_EQ(decision.confidence.level, ConfidenceLevel::VeryHigh);
    EXPECT_EQ(decision.position_sizing.size, PositionSize::Half);
    EXPECT_EQ(decision.action, EntryAction::Pass);
    EXPECT_EQ(decision.timeframe, Timeframe::NextWeek);
    EXPECT_TRUE(contains(decision.reasoning, "Bear market - CDS too risky"));
    EXPECT_TRUE(contains(decision.warnings, "Bear market - reduced position sizes"));
}

TEST(DecisionEngine, OversoldBelowMa50Passes) {
    DecisionEngine engine(StrategyConfig::credit_spread());
    auto input = favorable_input();
    input.current_price = 95.0;
    input.rsi = 25.0;
    auto decision = engine.evaluate_entry(input);

    EXPECT_EQ(decision.action, EntryAction::Pass);
    EXPECT_EQ(decision.timeframe, Timeframe::ThisWeek);
    EXPECT_TRUE(contains(decision.reasoning, "Below MA50 and oversold - wait for stabilization"));
    EXPECT_TRUE(contains(decision.entry_guidance, "No entry recommended at this time"));
}

TEST(DecisionEngine, TimingWaitBecomesPullback) {
    DecisionEngine engine(StrategyConfig::credit_spread());
    auto input = favorable_input();
    input.current_price = 95.0;
    input.support = 94.0;
    input.iv_rank = 10.0;
    auto decision = engine.evaluate_entry(input);

    EXPECT_EQ(decision.action, EntryAction::WaitForPullback);
    EXPECT_EQ(decision.timeframe, Timeframe::OneToThreeDays);
    EXPECT_TRUE(contains(decision.entry_guidance, "Wait for price to reach $100.00"));
    EXPECT_TRUE(contains(decision.warnings, "IV Rank very low - insufficient premium"));
}

TEST(DecisionEngine, InsufficientConfidencePasses) {
    DecisionEngine engine(StrategyConfig::credit_spread());
    auto input = favorable_input();
    input.stock_score = 0;
    input.checklist_passed = 0;
    input.momentum_overall = MomentumTrend::Deteriorating;
    input.relative_strength = RelativeStrengthTrend::Underperforming;
    input.checklist_fail_reasons = {"Weak earnings", "High debt", "Low volume", "Sector weak"};
    auto decision = engine.evaluate_entry(input);

    EXPECT_EQ(decision.confidence.level, ConfidenceLevel::Insufficient);
    EXPECT_EQ(decision.action, EntryAction::Pass);
    EXPECT_TRUE(contains(decision.warnings, "Momentum deteriorating - dangerous for credit selling"));
    EXPECT_TRUE(contains(decision.warnings, "Underperforming market"));
    EXPECT_TRUE(contains(decision.warnings, "Only 0/10 checklist items passed"));
    // Only the first three failure reasons are surfaced
    EXPECT_TRUE(contains(decision.warnings, "Low volume"));
    EXPECT_FALSE(contains(decision.warnings, "Sector weak"));
}

TEST(DecisionEngine, MalformedCandidatesAreExcluded) {
    DecisionEngine engine(StrategyConfig::credit_spread());
    auto input = favorable_input();
    auto broken = put_spread(90.0, 95.0, 1.0, 38);
    broken.premium = std::nan("");
    input.spread_candidates.insert(input.spread_candidates.begin(), broken);
    auto decision = engine.evaluate_entry(input);

    ASSERT_TRUE(decision.recommended_spread.has_value());
    EXPECT_DOUBLE_EQ(decision.recommended_spread->candidate.long_strike, 92.5);
    EXPECT_TRUE(contains(decision.warnings, "Excluded 1 malformed spread candidate(s)"));
}

TEST(DecisionEngine, NoCandidatesStillDecides) {
    DecisionEngine engine(StrategyConfig::credit_spread());
    auto input = favorable_input();
    input.spread_candidates.clear();
    auto decision = engine.evaluate_entry(input);

    EXPECT_EQ(decision.action, EntryAction::EnterNow);
    EXPECT_FALSE(decision.recommended_spread.has_value());
    EXPECT_TRUE(contains(decision.entry_guidance, "ACME setup favorable at $104.00"));
    EXPECT_TRUE(contains(decision.warnings, "No spread candidates available"));
}

TEST(DecisionEngine, RanksBestFirstAndKeepsTies) {
    DecisionEngine engine(StrategyConfig::credit_spread());
    auto input = favorable_input();
    auto weak = put_spread(99.0, 100.0, 0.05, 5);
    auto strong = put_spread(92.5, 95.0, 0.83, 38);
    auto strong_twin = put_spread(92.0, 94.5, 0.83, 38);
    input.spread_candidates = {weak, strong, strong_twin};

    int excluded = -1;
    auto ranked = engine.rank_candidates(input, excluded);
    EXPECT_EQ(excluded, 0);
    ASSERT_EQ(ranked.size(), 3u);
    EXPECT_GE(ranked[0].quality.total, ranked[1].quality.total);
    EXPECT_GE(ranked[1].quality.total, ranked[2].quality.total);
    EXPECT_DOUBLE_EQ(ranked[2].candidate.short_strike, 100.0);
    if (ranked[0].quality.total == ranked[1].quality.total) {
        EXPECT_DOUBLE_EQ(ranked[0].candidate.short_strike, 95.0);
    }
}

TEST(DecisionEngine, EarningsWarningAndAccountOverride) {
    DecisionEngine engine(StrategyConfig::credit_spread());
    auto input = favorable_input();
    input.days_to_earnings = 10;
    input.account_size = 10000.0;
    auto decision = engine.evaluate_entry(input);

    EXPECT_TRUE(contains(decision.warnings, "Earnings in 10 days"));
    EXPECT_DOUBLE_EQ(decision.position_sizing.max_risk_dollars, 1500.0);
    EXPECT_EQ(decision.position_sizing.max_contracts, 8);
}
