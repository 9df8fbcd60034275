#include "types.hpp"
#include "util.hpp"
#include <cmath>
#include <limits>

namespace {
    constexpr double kMissing = std::numeric_limits<double>::quiet_NaN();

    double number_or_missing(const nlohmann::json& j, const char* key) {
        auto it = j.find(key);
        if (it == j.end() || !it->is_number()) {
            return kMissing;
        }
        return it->get<double>();
    }

    nlohmann::json optional_number(const std::optional<double>& value) {
        return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
    }
}

std::optional<PriceBar> PriceBar::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }

    try {
        PriceBar bar;
        if (j.contains("date")) {
            auto date = parse_iso8601(j.at("date").get<std::string>());
            if (!date) {
                return std::nullopt;
            }
            bar.date = *date;
        }
        bar.open = j.at("open").get<double>();
        bar.high = j.at("high").get<double>();
        bar.low = j.at("low").get<double>();
        bar.close = j.at("close").get<double>();
        bar.volume = j.value("volume", 0.0);
        return bar;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

nlohmann::json PriceBar::to_json() const {
    return {
        {"date", format_date(date)},
        {"open", open},
        {"high", high},
        {"low", low},
        {"close", close},
        {"volume", volume}
    };
}

nlohmann::json TechnicalSignal::to_json() const {
    return {
        {"name", name},
        {"category", to_string(category)},
        {"group", to_string(group)},
        {"points", points},
        {"description", description},
        {"value", value}
    };
}

nlohmann::json TechnicalResult::to_json() const {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& signal : signals) {
        items.push_back(signal.to_json());
    }
    return {
        {"score", score},
        {"signals", items}
    };
}

nlohmann::json RegimeResult::to_json() const {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& s : signals) {
        items.push_back({
            {"name", s.name},
            {"value", s.value},
            {"signal", to_string(s.signal)},
            {"weight", s.weight}
        });
    }
    return {
        {"regime", to_string(regime)},
        {"confidence", confidence},
        {"signals", items},
        {"recommendation", recommendation},
        {"adjustments", {
            {"min_score", adjustments.min_score},
            {"position_size", adjustments.position_size},
            {"only_grade_a", adjustments.only_grade_a}
        }}
    };
}

double SpreadCandidate::width() const {
    return std::abs(short_strike - long_strike);
}

bool SpreadCandidate::is_well_formed() const {
    if (!is_finite_positive(long_strike) || !is_finite_positive(short_strike)) {
        return false;
    }
    if (!is_finite_positive(premium) || !is_finite_positive(width())) {
        return false;
    }
    if (!std::isfinite(short_delta) || !std::isfinite(iv_rank)) {
        return false;
    }
    return expiration.time_since_epoch().count() != 0;
}

SpreadCandidate SpreadCandidate::from_json(const nlohmann::json& j) {
    SpreadCandidate candidate;
    candidate.long_strike = number_or_missing(j, "long_strike");
    candidate.short_strike = number_or_missing(j, "short_strike");
    candidate.premium = number_or_missing(j, "premium");
    candidate.short_delta = number_or_missing(j, "short_delta");
    candidate.iv_rank = number_or_missing(j, "iv_rank");

    auto it = j.find("expiration");
    if (it != j.end() && it->is_string()) {
        if (auto expiration = parse_iso8601(it->get<std::string>())) {
            candidate.expiration = *expiration;
        }
    }
    return candidate;
}

nlohmann::json SpreadCandidate::to_json() const {
    return {
        {"long_strike", long_strike},
        {"short_strike", short_strike},
        {"width", width()},
        {"premium", premium},
        {"expiration", format_date(expiration)},
        {"short_delta", short_delta},
        {"iv_rank", iv_rank}
    };
}

int SpreadQualityBreakdown::sum() const {
    return premium_ratio + distance + iv_rank + support_buffer + dte + delta + earnings_risk;
}

nlohmann::json SpreadQualityScore::to_json() const {
    return {
        {"total", total},
        {"rating", to_string(rating)},
        {"breakdown", {
            {"premium_ratio", breakdown.premium_ratio},
            {"distance", breakdown.distance},
            {"iv_rank", breakdown.iv_rank},
            {"support_buffer", breakdown.support_buffer},
            {"dte", breakdown.dte},
            {"delta", breakdown.delta},
            {"earnings_risk", breakdown.earnings_risk}
        }}
    };
}

nlohmann::json ScoredSpread::to_json() const {
    auto j = candidate.to_json();
    j["dte"] = dte;
    j["max_profit"] = max_profit;
    j["max_loss"] = max_loss;
    j["breakeven"] = breakeven;
    j["quality"] = quality.to_json();
    return j;
}

int ConfidenceBreakdown::sum() const {
    return stock_score + checklist_pass_rate + momentum + relative_strength +
           market_regime + iv_environment;
}

nlohmann::json ConfidenceScore::to_json() const {
    return {
        {"total", total},
        {"level", to_string(level)},
        {"breakdown", {
            {"stock_score", breakdown.stock_score},
            {"checklist_pass_rate", breakdown.checklist_pass_rate},
            {"momentum", breakdown.momentum},
            {"relative_strength", breakdown.relative_strength},
            {"market_regime", breakdown.market_regime},
            {"iv_environment", breakdown.iv_environment}
        }}
    };
}

nlohmann::json PositionSizing::to_json() const {
    return {
        {"size", to_string(size)},
        {"percentage", percentage},
        {"max_contracts", max_contracts},
        {"max_risk_dollars", max_risk_dollars},
        {"reasoning", reasoning}
    };
}

nlohmann::json TimingAnalysis::to_json() const {
    return {
        {"action", to_string(action)},
        {"rsi_zone", to_string(rsi_zone)},
        {"price_vs_ma", to_string(price_vs_ma)},
        {"distance_to_support", distance_to_support},
        {"iv_rank_favorable", iv_rank_favorable},
        {"wait_target", optional_number(wait_target)},
        {"reason", reason}
    };
}

nlohmann::json EntryDecision::to_json() const {
    return {
        {"action", to_string(action)},
        {"confidence", confidence.to_json()},
        {"timeframe", to_string(timeframe)},
        {"position_sizing", position_sizing.to_json()},
        {"recommended_spread", recommended_spread ? recommended_spread->to_json() : nlohmann::json(nullptr)},
        {"spread_score", spread_score ? spread_score->to_json() : nlohmann::json(nullptr)},
        {"timing", timing.to_json()},
        {"regime", to_string(regime)},
        {"reasoning", reasoning},
        {"entry_guidance", entry_guidance},
        {"risk_management", risk_management},
        {"warnings", warnings}
    };
}

std::string to_string(SignalCategory category) {
    return category == SignalCategory::Analyst ? "analyst" : "technical";
}

std::string to_string(SignalGroup group) {
    switch (group) {
        case SignalGroup::MovingAverage: return "moving_average";
        case SignalGroup::Momentum: return "momentum";
        case SignalGroup::PricePosition: return "price_position";
        case SignalGroup::Pullback: return "pullback";
        case SignalGroup::Trend: return "trend";
        case SignalGroup::Volume: return "volume";
    }
    return "trend";
}

std::string to_string(MarketRegime regime) {
    switch (regime) {
        case MarketRegime::Bull: return "bull";
        case MarketRegime::Neutral: return "neutral";
        case MarketRegime::Caution: return "caution";
        case MarketRegime::Bear: return "bear";
    }
    return "neutral";
}

std::string to_string(RegimeDirection direction) {
    switch (direction) {
        case RegimeDirection::Bullish: return "bullish";
        case RegimeDirection::Bearish: return "bearish";
        case RegimeDirection::Neutral: return "neutral";
    }
    return "neutral";
}

std::string to_string(SpreadStrategy strategy) {
    return strategy == SpreadStrategy::DebitSpread ? "debit" : "credit";
}

std::string to_string(SpreadRating rating) {
    switch (rating) {
        case SpreadRating::Excellent: return "excellent";
        case SpreadRating::Good: return "good";
        case SpreadRating::Fair: return "fair";
        case SpreadRating::Poor: return "poor";
    }
    return "poor";
}

std::string to_string(MomentumTrend trend) {
    switch (trend) {
        case MomentumTrend::Improving: return "improving";
        case MomentumTrend::Stable: return "stable";
        case MomentumTrend::Deteriorating: return "deteriorating";
    }
    return "stable";
}

std::string to_string(RelativeStrengthTrend trend) {
    switch (trend) {
        case RelativeStrengthTrend::Strong: return "strong";
        case RelativeStrengthTrend::Moderate: return "moderate";
        case RelativeStrengthTrend::Weak: return "weak";
        case RelativeStrengthTrend::Underperforming: return "underperforming";
    }
    return "moderate";
}

std::string to_string(ConfidenceLevel level) {
    switch (level) {
        case ConfidenceLevel::Insufficient: return "insufficient";
        case ConfidenceLevel::Low: return "low";
        case ConfidenceLevel::Moderate: return "moderate";
        case ConfidenceLevel::High: return "high";
        case ConfidenceLevel::VeryHigh: return "very_high";
    }
    return "insufficient";
}

std::string to_string(PositionSize size) {
    switch (size) {
        case PositionSize::Full: return "full";
        case PositionSize::ThreeQuarter: return "three_quarter";
        case PositionSize::Half: return "half";
        case PositionSize::Quarter: return "quarter";
        case PositionSize::Skip: return "skip";
    }
    return "skip";
}

std::string to_string(RsiZone zone) {
    switch (zone) {
        case RsiZone::Oversold: return "oversold";
        case RsiZone::Ideal: return "ideal";
        case RsiZone::Neutral: return "neutral";
        case RsiZone::Extended: return "extended";
        case RsiZone::Overbought: return "overbought";
    }
    return "neutral";
}

std::string to_string(PriceVsMa position) {
    switch (position) {
        case PriceVsMa::Above: return "above";
        case PriceVsMa::Below: return "below";
        case PriceVsMa::At: return "at";
    }
    return "at";
}

std::string to_string(TimingAction action) {
    return action == TimingAction::Wait ? "wait" : "enter";
}

std::string to_string(EntryAction action) {
    switch (action) {
        case EntryAction::EnterNow: return "enter_now";
        case EntryAction::ScaleIn: return "scale_in";
        case EntryAction::WaitForPullback: return "wait_for_pullback";
        case EntryAction::Pass: return "pass";
    }
    return "pass";
}

std::string to_string(Timeframe timeframe) {
    switch (timeframe) {
        case Timeframe::Immediate: return "immediate";
        case Timeframe::OneToThreeDays: return "1-3_days";
        case Timeframe::ThisWeek: return "this_week";
        case Timeframe::NextWeek: return "next_week";
    }
    return "this_week";
}

std::optional<MarketRegime> parse_market_regime(const std::string& value) {
    if (value == "bull") return MarketRegime::Bull;
    if (value == "neutral") return MarketRegime::Neutral;
    if (value == "caution") return MarketRegime::Caution;
    if (value == "bear") return MarketRegime::Bear;
    return std::nullopt;
}

std::optional<SpreadStrategy> parse_spread_strategy(const std::string& value) {
    if (value == "credit" || value == "pcs") return SpreadStrategy::CreditSpread;
    if (value == "debit" || value == "cds") return SpreadStrategy::DebitSpread;
    return std::nullopt;
}

std::optional<MomentumTrend> parse_momentum_trend(const std::string& value) {
    if (value == "improving") return MomentumTrend::Improving;
    if (value == "stable") return MomentumTrend::Stable;
    if (value == "deteriorating") return MomentumTrend::Deteriorating;
    return std::nullopt;
}

std::optional<RelativeStrengthTrend> parse_relative_strength(const std::string& value) {
    if (value == "strong") return RelativeStrengthTrend::Strong;
    if (value == "moderate") return RelativeStrengthTrend::Moderate;
    if (value == "weak") return RelativeStrengthTrend::Weak;
    if (value == "underperforming") return RelativeStrengthTrend::Underperforming;
    return std::nullopt;
}
