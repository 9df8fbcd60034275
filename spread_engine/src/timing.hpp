#pragma once

#include "strategy_config.hpp"
#include "types.hpp"
#include <optional>

struct TimingInput {
    double current_price = 0.0;
    std::optional<double> rsi;
    std::optional<double> ma50;
    std::optional<double> support;
    std::optional<double> iv_rank;
};

// Stateless rule evaluator: counts enter and wait conditions and applies
// enter, then wait, then the default of entering.
class TimingAnalyzer {
public:
    explicit TimingAnalyzer(const StrategyConfig& config);

    TimingAnalysis analyze(const TimingInput& input) const;

    RsiZone classify_rsi(double rsi) const;
    PriceVsMa classify_price(double price, std::optional<double> ma50) const;
    bool iv_favorable(std::optional<double> iv_rank) const;

private:
    TimingConfig config_;
};
