#include "position_sizing.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <fmt/format.h>

namespace {
    std::string display(ConfidenceLevel level) {
        auto text = to_string(level);
        std::replace(text.begin(), text.end(), '_', ' ');
        return text;
    }
}

PositionSizer::PositionSizer(const StrategyConfig& config) : config_(config) {}

PositionSizing PositionSizer::size(const ConfidenceScore& confidence,
                                   MarketRegime regime,
                                   double width,
                                   double premium,
                                   const AccountSettings& account) const {
    const auto& tier = config_.tier(confidence.level, regime);

    PositionSizing sizing;
    sizing.size = tier.size;
    sizing.percentage = tier.percentage;

    double account_size = std::isfinite(account.account_size) ? std::max(0.0, account.account_size) : 0.0;
    double max_risk_percent = std::isfinite(account.max_risk_percent) ? std::max(0.0, account.max_risk_percent) : 0.0;
    double adjusted_risk = account_size * (max_risk_percent / 100.0) * (tier.percentage / 100.0);
    sizing.max_risk_dollars = std::round(adjusted_risk);

    double max_loss = max_loss_per_contract(width, premium);
    if (tier.size != PositionSize::Skip && max_loss > 0.0) {
        double contracts = std::floor(adjusted_risk / max_loss);
        sizing.max_contracts = static_cast<int>(std::min(contracts, static_cast<double>(std::numeric_limits<int>::max())));
    }

    sizing.reasoning.push_back(fmt::format("Confidence: {} ({}/100)", display(confidence.level), confidence.total));
    sizing.reasoning.push_back(fmt::format("Market: {} regime", to_string(regime)));

    if (tier.size == PositionSize::Skip) {
        sizing.reasoning.push_back("Position size too small to trade");
    } else {
        sizing.reasoning.push_back(fmt::format("{}% of max position", tier.percentage));
    }

    if (confidence.breakdown.momentum < 10) {
        sizing.reasoning.push_back("Weak momentum reduces size");
    }
    if (confidence.breakdown.relative_strength < 8) {
        sizing.reasoning.push_back("Underperforming SPY");
    }
    if (regime == MarketRegime::Bear) {
        sizing.reasoning.push_back(fmt::format("Bear market - {} positions very risky", config_.timing.strategy_label));
    }

    return sizing;
}

double PositionSizer::max_loss_per_contract(double width, double premium) const {
    if (!std::isfinite(width) || !std::isfinite(premium)) {
        return 0.0;
    }
    double per_share = config_.strategy == SpreadStrategy::CreditSpread ? width - premium : premium;
    return std::max(0.0, per_share * config_.contract_multiplier);
}
