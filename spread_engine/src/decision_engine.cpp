#include "decision_engine.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <fmt/format.h>

namespace {
    std::string display(ConfidenceLevel level) {
        auto text = to_string(level);
        std::replace(text.begin(), text.end(), '_', ' ');
        return text;
    }
}

DecisionEngine::DecisionEngine(const StrategyConfig& config,
                               const AccountSettings& account_defaults,
                               int earnings_warning_days)
    : config_(config),
      account_defaults_(account_defaults),
      earnings_warning_days_(earnings_warning_days),
      quality_scorer_(config),
      confidence_scorer_(config),
      position_sizer_(config),
      timing_analyzer_(config) {}

std::vector<ScoredSpread> DecisionEngine::rank_candidates(const DecisionEngineInput& input, int& excluded) const {
    std::vector<ScoredSpread> scored;
    excluded = 0;

    for (const auto& candidate : input.spread_candidates) {
        if (!candidate.is_well_formed()) {
            ++excluded;
            spdlog::warn("{}: excluding malformed spread candidate {}/{}",
                         input.ticker, candidate.long_strike, candidate.short_strike);
            continue;
        }
        scored.push_back(quality_scorer_.evaluate(candidate, input.support, input.days_to_earnings,
                                                  input.current_price, input.as_of));
    }

    std::stable_sort(scored.begin(), scored.end(), [](const ScoredSpread& a, const ScoredSpread& b) {
        return a.quality.total > b.quality.total;
    });
    return scored;
}

EntryDecision DecisionEngine::evaluate_entry(const DecisionEngineInput& input) const {
    EntryDecision decision;
    decision.regime = input.market_regime;

    // 1. Confidence
    ConfidenceInput confidence_input;
    confidence_input.stock_score = input.stock_score;
    confidence_input.checklist_passed = input.checklist_passed;
    confidence_input.checklist_total = input.checklist_total;
    confidence_input.momentum_overall = input.momentum_overall;
    confidence_input.momentum_signals = input.momentum_signals;
    confidence_input.relative_strength = input.relative_strength;
    confidence_input.regime = input.market_regime;
    confidence_input.iv_rank = input.iv_rank;
    decision.confidence = confidence_scorer_.score(confidence_input);
    decision.reasoning.push_back(fmt::format("Confidence: {}/100 ({})",
                                             decision.confidence.total, display(decision.confidence.level)));

    // 2. Timing
    TimingInput timing_input;
    timing_input.current_price = input.current_price;
    timing_input.rsi = input.rsi;
    timing_input.ma50 = input.ma50;
    timing_input.support = input.support;
    timing_input.iv_rank = input.iv_rank;
    decision.timing = timing_analyzer_.analyze(timing_input);

    // 3. Rank candidates
    int excluded = 0;
    auto ranked = rank_candidates(input, excluded);
    if (!ranked.empty()) {
        decision.recommended_spread = ranked.front();
        decision.spread_score = ranked.front().quality;
        decision.reasoning.push_back(fmt::format("Best spread score: {}/100 ({})",
                                                 decision.spread_score->total, to_string(decision.spread_score->rating)));
    }

    // 4. Sizing
    double width = decision.recommended_spread ? decision.recommended_spread->candidate.width() : 5.0;
    double premium = decision.recommended_spread ? decision.recommended_spread->candidate.premium : 0.0;
    AccountSettings account = account_defaults_;
    if (input.account_size) {
        account.account_size = *input.account_size;
    }
    if (input.max_risk_percent) {
        account.max_risk_percent = *input.max_risk_percent;
    }
    decision.position_sizing = position_sizer_.size(decision.confidence, input.market_regime, width, premium, account);

    // 5. Override chain
    bool below_ma50 = input.ma50 && input.current_price < *input.ma50;
    bool has_spread_data = decision.spread_score && decision.spread_score->total >= 40;
    const auto& label = config_.timing.strategy_label;

    if (decision.position_sizing.size == PositionSize::Skip) {
        decision.action = EntryAction::Pass;
        decision.timeframe = Timeframe::ThisWeek;
        decision.reasoning.push_back("Insufficient confidence or unfavorable conditions");
    } else if (decision.confidence.level == ConfidenceLevel::Insufficient) {
        decision.action = EntryAction::Pass;
        decision.timeframe = Timeframe::ThisWeek;
        decision.reasoning.push_back("Confidence too low for entry");
    } else if (input.market_regime == MarketRegime::Bear) {
        decision.action = EntryAction::Pass;
        decision.timeframe = Timeframe::NextWeek;
        decision.reasoning.push_back(fmt::format("Bear market - {} too risky", label));
    } else if (below_ma50 && decision.timing.rsi_zone == RsiZone::Oversold) {
        decision.action = EntryAction::Pass;
        decision.timeframe = Timeframe::ThisWeek;
        decision.reasoning.push_back("Below MA50 and oversold - wait for stabilization");
    } else if (decision.timing.action == TimingAction::Wait) {
        decision.action = EntryAction::WaitForPullback;
        decision.timeframe = Timeframe::OneToThreeDays;
        decision.reasoning.push_back(decision.timing.reason);
    } else {
        decision.action = EntryAction::EnterNow;
        decision.timeframe = Timeframe::Immediate;
        decision.reasoning.push_back(has_spread_data ? decision.timing.reason
                                                     : "Favorable conditions (no spread data available)");
    }

    add_entry_guidance(decision, input);
    add_risk_management(decision, input);
    add_warnings(decision, input);

    if (ranked.empty()) {
        decision.warnings.push_back("No spread candidates available");
    }
    if (excluded > 0) {
        decision.warnings.push_back(fmt::format("Excluded {} malformed spread candidate(s)", excluded));
    }

    spdlog::info("{}: {} ({}, confidence {}/100, size {})",
                 input.ticker, to_string(decision.action), to_string(decision.timeframe),
                 decision.confidence.total, to_string(decision.position_sizing.size));
    return decision;
}

void DecisionEngine::add_entry_guidance(EntryDecision& decision, const DecisionEngineInput& input) const {
    auto& guidance = decision.entry_guidance;
    const auto& spread = decision.recommended_spread;
    bool credit = config_.strategy == SpreadStrategy::CreditSpread;

    if (decision.action == EntryAction::EnterNow && spread) {
        const auto& c = spread->candidate;
        double per_contract = c.premium * config_.contract_multiplier;
        if (credit) {
            guidance.push_back(fmt::format("Sell ${:g}P / Buy ${:g}P", c.short_strike, c.long_strike));
            guidance.push_back(fmt::format("Credit: ${:.0f} per contract", per_contract));
        } else {
            guidance.push_back(fmt::format("Buy ${:g}C / Sell ${:g}C", c.long_strike, c.short_strike));
            guidance.push_back(fmt::format("Cost: ${:.0f} per contract", per_contract));
        }
        guidance.push_back(fmt::format("Expiration: {} ({} DTE)", format_date(c.expiration), spread->dte));
        if (decision.position_sizing.max_contracts > 0) {
            guidance.push_back(fmt::format("Suggested: {} contract(s)", decision.position_sizing.max_contracts));
        }
    } else if (decision.action == EntryAction::EnterNow) {
        guidance.push_back(fmt::format("{} setup favorable at ${:.2f}", input.ticker, input.current_price));
        guidance.push_back("Options: Check broker for available strikes");
    } else if (decision.action == EntryAction::WaitForPullback && decision.timing.wait_target) {
        guidance.push_back(fmt::format("Wait for price to reach ${:.2f}", *decision.timing.wait_target));
        guidance.push_back("Set price alert at target");
        guidance.push_back("Re-evaluate when target is reached");
    } else if (decision.action == EntryAction::WaitForPullback) {
        guidance.push_back("Wait for conditions to improve");
    } else {
        guidance.push_back("No entry recommended at this time");
        guidance.push_back("Monitor for improved conditions");
    }
}

void DecisionEngine::add_risk_management(EntryDecision& decision, const DecisionEngineInput& input) const {
    const auto& spread = decision.recommended_spread;
    if (!spread || decision.action == EntryAction::Pass) {
        return;
    }

    auto& risk = decision.risk_management;
    int contracts = std::max(1, decision.position_sizing.max_contracts);
    double max_loss = spread->max_loss * config_.contract_multiplier * contracts;
    risk.push_back(fmt::format("Max loss: ${:.0f}", max_loss));
    risk.push_back(fmt::format("Breakeven: ${:.2f}", spread->breakeven));

    if (config_.strategy == SpreadStrategy::CreditSpread) {
        risk.push_back("Take profit at 50% of credit received");
        risk.push_back("Exit if short strike breached");
        if (input.support) {
            risk.push_back(fmt::format("Support at ${:.2f} - exit if broken", *input.support));
        }
    } else {
        if (input.support) {
            risk.push_back(fmt::format("Exit if price breaks below ${:.2f} support", *input.support));
        }
        risk.push_back("Take profit at 50-60% of max gain");
    }
}

void DecisionEngine::add_warnings(EntryDecision& decision, const DecisionEngineInput& input) const {
    auto& warnings = decision.warnings;
    bool credit = config_.strategy == SpreadStrategy::CreditSpread;

    if (input.days_to_earnings && *input.days_to_earnings < earnings_warning_days_) {
        warnings.push_back(fmt::format("Earnings in {} days", *input.days_to_earnings));
    }
    if (input.market_regime == MarketRegime::Bear) {
        warnings.push_back(credit ? "Bear market - avoid new PCS positions"
                                  : "Bear market - reduced position sizes");
    }
    if (input.momentum_overall == MomentumTrend::Deteriorating) {
        warnings.push_back(credit ? "Momentum deteriorating - dangerous for credit selling"
                                  : "Momentum deteriorating");
    }
    if (credit && input.iv_rank.value_or(0.0) < config_.low_iv_warning) {
        warnings.push_back("IV Rank very low - insufficient premium");
    }
    if (input.relative_strength == RelativeStrengthTrend::Underperforming) {
        warnings.push_back("Underperforming market");
    }
    if (input.checklist_total > 0 && input.checklist_passed < input.checklist_total - 2) {
        warnings.push_back(fmt::format("Only {}/{} checklist items passed",
                                       input.checklist_passed, input.checklist_total));
    }

    std::size_t shown = std::min<std::size_t>(3, input.checklist_fail_reasons.size());
    for (std::size_t i = 0; i < shown; ++i) {
        warnings.push_back(input.checklist_fail_reasons[i]);
    }
}
