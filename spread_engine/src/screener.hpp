#pragma once

#include "config.hpp"
#include "decision_engine.hpp"
#include "regime.hpp"
#include "signals.hpp"
#include "types.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// One ticker to screen: raw price history plus the caller-supplied
// fundamentals, checklist outcome and option chain candidates
struct ScreeningRequest {
    std::string ticker;
    std::vector<PriceBar> bars;
    std::vector<PriceBar> benchmark_bars;
    std::optional<MarketRegime> market_regime;  // skips regime detection when set
    std::optional<double> current_price;         // defaults to the last close
    int external_score = 0;                      // fundamental/analyst points added to the technical score
    int checklist_passed = 0;
    int checklist_total = 0;
    std::vector<std::string> checklist_fail_reasons;
    MomentumTrend momentum = MomentumTrend::Stable;
    std::vector<MomentumTrend> momentum_signals;
    RelativeStrengthTrend relative_strength = RelativeStrengthTrend::Moderate;
    std::optional<double> iv_rank;
    std::optional<int> days_to_earnings;
    std::vector<SpreadCandidate> spread_candidates;
    std::optional<std::chrono::system_clock::time_point> as_of;  // defaults to the last bar date
    std::optional<double> account_size;
    std::optional<double> max_risk_percent;

    static std::optional<ScreeningRequest> from_json(const nlohmann::json& j);
};

struct ScreeningResult {
    std::string ticker;
    std::optional<std::string> error;
    int stock_score = 0;
    TechnicalResult technical;
    RegimeResult regime;
    std::optional<EntryDecision> decision;
    std::vector<std::string> advisories;

    nlohmann::json to_json() const;
};

class Screener {
public:
    explicit Screener(const Config& config);

    // Throws std::runtime_error when no price can be determined
    ScreeningResult screen(const ScreeningRequest& request) const;

    // Derives the decision input (indicators, support, stock score) from a request
    DecisionEngineInput build_input(const ScreeningRequest& request,
                                    const TechnicalResult& technical,
                                    MarketRegime regime) const;

    const Config& config() const { return config_; }

private:
    RegimeResult resolve_regime(const ScreeningRequest& request) const;

    Config config_;
    std::unique_ptr<TechnicalSignalDetector> signal_detector_;
    std::unique_ptr<RegimeDetector> regime_detector_;
    std::unique_ptr<DecisionEngine> decision_engine_;
};

// Screens independent requests on a fixed number of worker threads. A
// failing request yields an error entry; results keep the input order.
class BatchScreener {
public:
    BatchScreener(const Screener& screener, int thread_pool_size);

    std::vector<ScreeningResult> screen_all(const std::vector<ScreeningRequest>& requests) const;

    // Decodes each element of a JSON array and screens it
    std::vector<ScreeningResult> screen_json(const nlohmann::json& requests) const;

private:
    void run_parallel(std::size_t count, const std::function<void(std::size_t)>& task) const;

    const Screener& screener_;
    int thread_pool_size_;
};
