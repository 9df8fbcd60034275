#pragma once

#include "position_sizing.hpp"
#include "scoring.hpp"
#include "spread_quality.hpp"
#include "strategy_config.hpp"
#include "timing.hpp"
#include "types.hpp"
#include <vector>

// Combines confidence, timing, spread ranking and sizing into one entry
// decision. The override chain runs in a fixed order; the first rule that
// matches decides the action.
class DecisionEngine {
public:
    explicit DecisionEngine(const StrategyConfig& config,
                            const AccountSettings& account_defaults = AccountSettings(),
                            int earnings_warning_days = 14);

    EntryDecision evaluate_entry(const DecisionEngineInput& input) const;

    // Well-formed candidates scored and sorted best first; ties keep input order
    std::vector<ScoredSpread> rank_candidates(const DecisionEngineInput& input, int& excluded) const;

    const StrategyConfig& config() const { return config_; }

private:
    void add_entry_guidance(EntryDecision& decision, const DecisionEngineInput& input) const;
    void add_risk_management(EntryDecision& decision, const DecisionEngineInput& input) const;
    void add_warnings(EntryDecision& decision, const DecisionEngineInput& input) const;

    StrategyConfig config_;
    AccountSettings account_defaults_;
    int earnings_warning_days_;
    SpreadQualityScorer quality_scorer_;
    ConfidenceScorer confidence_scorer_;
    PositionSizer position_sizer_;
    TimingAnalyzer timing_analyzer_;
};
