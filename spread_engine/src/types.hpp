#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Daily price bar from the historical-price provider
struct PriceBar {
    std::chrono::system_clock::time_point date;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;

    static std::optional<PriceBar> from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

enum class SignalCategory {
    Technical,
    Analyst
};

// Theme used when capping correlated signals
enum class SignalGroup {
    MovingAverage,
    Momentum,
    PricePosition,
    Pullback,
    Trend,
    Volume
};

struct TechnicalSignal {
    std::string name;
    SignalCategory category = SignalCategory::Technical;
    SignalGroup group = SignalGroup::Trend;
    int points = 0;
    std::string description;
    double value = 0.0;

    nlohmann::json to_json() const;
};

struct TechnicalResult {
    int score = 0;
    std::vector<TechnicalSignal> signals;

    nlohmann::json to_json() const;
};

enum class MarketRegime {
    Bull,
    Neutral,
    Caution,
    Bear
};

enum class RegimeDirection {
    Bullish,
    Bearish,
    Neutral
};

struct RegimeSignal {
    std::string name;
    double value = 0.0;
    RegimeDirection signal = RegimeDirection::Neutral;
    double weight = 0.0;
};

struct RegimeAdjustments {
    int min_score = 75;
    double position_size = 0.5;
    bool only_grade_a = true;
};

struct RegimeResult {
    MarketRegime regime = MarketRegime::Neutral;
    double confidence = 0.5;
    std::vector<RegimeSignal> signals;
    std::string recommendation;
    RegimeAdjustments adjustments;

    nlohmann::json to_json() const;
};

enum class SpreadStrategy {
    CreditSpread,  // OTM put credit spread
    DebitSpread    // deep ITM call debit spread
};

// One tradeable two-leg structure. Premium is per share: the net credit
// received for a credit spread, the net debit paid for a debit spread.
// short_delta is the short-leg delta for credit spreads and the net
// position delta for debit spreads.
struct SpreadCandidate {
    double long_strike = 0.0;
    double short_strike = 0.0;
    double premium = 0.0;
    std::chrono::system_clock::time_point expiration;
    double short_delta = 0.0;
    double iv_rank = 0.0;

    double width() const;

    // False when a required numeric field is missing or unusable
    bool is_well_formed() const;

    // Missing numeric fields decode as NaN so the engine can exclude them
    static SpreadCandidate from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

enum class SpreadRating {
    Excellent,
    Good,
    Fair,
    Poor
};

struct SpreadQualityBreakdown {
    int premium_ratio = 0;
    int distance = 0;
    int iv_rank = 0;
    int support_buffer = 0;
    int dte = 0;
    int delta = 0;
    int earnings_risk = 0;

    int sum() const;
};

struct SpreadQualityScore {
    int total = 0;
    SpreadQualityBreakdown breakdown;
    SpreadRating rating = SpreadRating::Poor;

    nlohmann::json to_json() const;
};

struct ScoredSpread {
    SpreadCandidate candidate;
    int dte = 0;
    double max_profit = 0.0;
    double max_loss = 0.0;
    double breakeven = 0.0;
    SpreadQualityScore quality;

    nlohmann::json to_json() const;
};

enum class MomentumTrend {
    Improving,
    Stable,
    Deteriorating
};

enum class RelativeStrengthTrend {
    Strong,
    Moderate,
    Weak,
    Underperforming
};

enum class ConfidenceLevel {
    Insufficient,
    Low,
    Moderate,
    High,
    VeryHigh
};

struct ConfidenceBreakdown {
    int stock_score = 0;
    int checklist_pass_rate = 0;
    int momentum = 0;
    int relative_strength = 0;
    int market_regime = 0;
    int iv_environment = 0;

    int sum() const;
};

struct ConfidenceScore {
    int total = 0;
    ConfidenceLevel level = ConfidenceLevel::Insufficient;
    ConfidenceBreakdown breakdown;

    nlohmann::json to_json() const;
};

enum class PositionSize {
    Full,
    ThreeQuarter,
    Half,
    Quarter,
    Skip
};

struct PositionSizing {
    PositionSize size = PositionSize::Skip;
    int percentage = 0;
    int max_contracts = 0;
    double max_risk_dollars = 0.0;
    std::vector<std::string> reasoning;

    nlohmann::json to_json() const;
};

enum class RsiZone {
    Oversold,
    Ideal,
    Neutral,
    Extended,
    Overbought
};

enum class PriceVsMa {
    Above,
    Below,
    At
};

enum class TimingAction {
    Enter,
    Wait
};

struct TimingAnalysis {
    TimingAction action = TimingAction::Enter;
    RsiZone rsi_zone = RsiZone::Neutral;
    PriceVsMa price_vs_ma = PriceVsMa::At;
    double distance_to_support = 0.0;
    bool iv_rank_favorable = false;
    std::optional<double> wait_target;
    std::string reason;

    nlohmann::json to_json() const;
};

enum class EntryAction {
    EnterNow,
    ScaleIn,
    WaitForPullback,
    Pass
};

enum class Timeframe {
    Immediate,
    OneToThreeDays,
    ThisWeek,
    NextWeek
};

struct EntryDecision {
    EntryAction action = EntryAction::Pass;
    ConfidenceScore confidence;
    Timeframe timeframe = Timeframe::ThisWeek;
    PositionSizing position_sizing;
    std::optional<ScoredSpread> recommended_spread;
    std::optional<SpreadQualityScore> spread_score;
    TimingAnalysis timing;
    MarketRegime regime = MarketRegime::Neutral;
    std::vector<std::string> reasoning;
    std::vector<std::string> entry_guidance;
    std::vector<std::string> risk_management;
    std::vector<std::string> warnings;

    nlohmann::json to_json() const;
};

// Everything the decision engine needs for one ticker. Days to expiration
// are measured from `as_of`, never from the wall clock.
struct DecisionEngineInput {
    std::string ticker;
    double current_price = 0.0;
    int stock_score = 0;
    int checklist_passed = 0;
    int checklist_total = 0;
    std::vector<std::string> checklist_fail_reasons;
    MomentumTrend momentum_overall = MomentumTrend::Stable;
    std::vector<MomentumTrend> momentum_signals;
    RelativeStrengthTrend relative_strength = RelativeStrengthTrend::Moderate;
    MarketRegime market_regime = MarketRegime::Neutral;
    std::optional<double> iv_rank;
    std::optional<double> rsi;
    std::optional<double> ma50;
    std::optional<double> support;
    std::optional<int> days_to_earnings;
    std::vector<SpreadCandidate> spread_candidates;
    std::chrono::system_clock::time_point as_of;
    std::optional<double> account_size;
    std::optional<double> max_risk_percent;
};

// Display names, matching the wire format
std::string to_string(SignalCategory category);
std::string to_string(SignalGroup group);
std::string to_string(MarketRegime regime);
std::string to_string(RegimeDirection direction);
std::string to_string(SpreadStrategy strategy);
std::string to_string(SpreadRating rating);
std::string to_string(MomentumTrend trend);
std::string to_string(RelativeStrengthTrend trend);
std::string to_string(ConfidenceLevel level);
std::string to_string(PositionSize size);
std::string to_string(RsiZone zone);
std::string to_string(PriceVsMa position);
std::string to_string(TimingAction action);
std::string to_string(EntryAction action);
std::string to_string(Timeframe timeframe);

std::optional<MarketRegime> parse_market_regime(const std::string& value);
std::optional<SpreadStrategy> parse_spread_strategy(const std::string& value);
std::optional<MomentumTrend> parse_momentum_trend(const std::string& value);
std::optional<RelativeStrengthTrend> parse_relative_strength(const std::string& value);
