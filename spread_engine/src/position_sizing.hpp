#pragma once

#include "strategy_config.hpp"
#include "types.hpp"

struct AccountSettings {
    double account_size = 1500.0;
    double max_risk_percent = 20.0;
};

class PositionSizer {
public:
    explicit PositionSizer(const StrategyConfig& config);

    // `premium` is the credit received or the debit paid per share
    PositionSizing size(const ConfidenceScore& confidence,
                        MarketRegime regime,
                        double width,
                        double premium,
                        const AccountSettings& account = AccountSettings()) const;

    // Dollars at risk per contract, 0 when the inputs are unusable
    double max_loss_per_contract(double width, double premium) const;

private:
    StrategyConfig config_;
};
