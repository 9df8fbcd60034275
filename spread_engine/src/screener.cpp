#include "screener.hpp"
#include "indicators.hpp"
#include "support.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <cmath>
#include <stdexcept>
#include <thread>
#include <fmt/format.h>

namespace {
    // Wider than the 0-100 stock score so either extreme still saturates it
    constexpr double kMaxExternalScore = 1000.0;

    bool decode_bars(const nlohmann::json& j, const char* key, std::vector<PriceBar>& out) {
        if (!j.contains(key)) {
            return true;
        }
        const auto& items = j.at(key);
        if (!items.is_array()) {
            spdlog::warn("Screening request field '{}' must be an array", key);
            return false;
        }
        out.reserve(items.size());
        for (const auto& item : items) {
            auto bar = PriceBar::from_json(item);
            if (!bar) {
                spdlog::warn("Screening request field '{}' contains a malformed bar", key);
                return false;
            }
            out.push_back(*bar);
        }
        return true;
    }

    template <typename T>
    bool decode_enum(const nlohmann::json& j, const char* key, T& out,
                     std::optional<T> (*parse)(const std::string&)) {
        if (!j.contains(key) || j.at(key).is_null()) {
            return true;
        }
        auto value = parse(j.at(key).get<std::string>());
        if (!value) {
            spdlog::warn("Screening request field '{}' has unknown value {}", key, j.at(key).dump());
            return false;
        }
        out = *value;
        return true;
    }

    template <typename T>
    std::optional<T> optional_value(const nlohmann::json& j, const char* key) {
        if (!j.contains(key) || j.at(key).is_null()) {
            return std::nullopt;
        }
        return j.at(key).get<T>();
    }

    ScreeningResult error_result(const std::string& ticker, const std::string& message) {
        ScreeningResult result;
        result.ticker = ticker;
        result.error = message;
        return result;
    }
}

std::optional<ScreeningRequest> ScreeningRequest::from_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("ticker") || !j.at("ticker").is_string()) {
        spdlog::warn("Screening request must be an object with a ticker");
        return std::nullopt;
    }

    try {
        ScreeningRequest req;
        req.ticker = j.at("ticker").get<std::string>();

        if (!decode_bars(j, "bars", req.bars) || !decode_bars(j, "benchmark_bars", req.benchmark_bars)) {
            return std::nullopt;
        }

        if (j.contains("market_regime") && !j.at("market_regime").is_null()) {
            auto regime = parse_market_regime(j.at("market_regime").get<std::string>());
            if (!regime) {
                spdlog::warn("{}: unknown market_regime {}", req.ticker, j.at("market_regime").dump());
                return std::nullopt;
            }
            req.market_regime = regime;
        }

        if (!decode_enum(j, "momentum", req.momentum, &parse_momentum_trend) ||
            !decode_enum(j, "relative_strength", req.relative_strength, &parse_relative_strength)) {
            return std::nullopt;
        }

        if (j.contains("momentum_signals")) {
            for (const auto& item : j.at("momentum_signals")) {
                auto trend = parse_momentum_trend(item.get<std::string>());
                if (!trend) {
                    spdlog::warn("{}: unknown momentum signal {}", req.ticker, item.dump());
                    return std::nullopt;
                }
                req.momentum_signals.push_back(*trend);
            }
        }

        req.current_price = optional_value<double>(j, "current_price");
        double external_score = j.value("external_score", 0.0);
        req.external_score = static_cast<int>(std::max(-kMaxExternalScore, std::min(kMaxExternalScore, external_score)));
        req.checklist_passed = j.value("checklist_passed", 0);
        req.checklist_total = j.value("checklist_total", 0);
        req.checklist_fail_reasons = j.value("checklist_fail_reasons", std::vector<std::string>{});
        req.iv_rank = optional_value<double>(j, "iv_rank");
        req.days_to_earnings = optional_value<int>(j, "days_to_earnings");
        req.account_size = optional_value<double>(j, "account_size");
        req.max_risk_percent = optional_value<double>(j, "max_risk_percent");

        if (j.contains("spread_candidates")) {
            for (const auto& item : j.at("spread_candidates")) {
                // Malformed candidates are kept so the engine can report them
                req.spread_candidates.push_back(SpreadCandidate::from_json(item));
            }
        }

        if (auto as_of = optional_value<std::string>(j, "as_of")) {
            req.as_of = parse_iso8601(*as_of);
            if (!req.as_of) {
                spdlog::warn("{}: invalid as_of timestamp {}", req.ticker, *as_of);
                return std::nullopt;
            }
        }

        return req;
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Failed to decode screening request: {}", e.what());
        return std::nullopt;
    }
}

nlohmann::json ScreeningResult::to_json() const {
    nlohmann::json j;
    j["ticker"] = ticker;
    if (error) {
        j["error"] = *error;
        return j;
    }
    j["stock_score"] = stock_score;
    j["technical"] = technical.to_json();
    j["regime"] = regime.to_json();
    j["decision"] = decision ? decision->to_json() : nlohmann::json(nullptr);
    j["advisories"] = advisories;
    return j;
}

Screener::Screener(const Config& config) : config_(config) {
    auto strategy = StrategyConfig::for_strategy(config_.spread_strategy());
    AccountSettings account{config_.account_size, config_.max_risk_percent};

    signal_detector_ = std::make_unique<TechnicalSignalDetector>(strategy.signals);
    regime_detector_ = std::make_unique<RegimeDetector>();
    decision_engine_ = std::make_unique<DecisionEngine>(strategy, account, config_.earnings_warning_days);
}

ScreeningResult Screener::screen(const ScreeningRequest& request) const {
    ScreeningResult result;
    result.ticker = request.ticker;
    result.technical = signal_detector_->detect(request.bars);
    result.regime = resolve_regime(request);

    auto input = build_input(request, result.technical, result.regime.regime);
    result.stock_score = input.stock_score;
    result.decision = decision_engine_->evaluate_entry(input);

    const auto& adjustments = result.regime.adjustments;
    if (result.stock_score < adjustments.min_score) {
        result.advisories.push_back(fmt::format("Stock score {} below {} minimum for {} regime",
                                                result.stock_score, adjustments.min_score,
                                                to_string(result.regime.regime)));
    }
    if (adjustments.only_grade_a) {
        const auto& score = result.decision->spread_score;
        if (!score || score->rating != SpreadRating::Excellent) {
            result.advisories.push_back(fmt::format("{} regime accepts only grade-A setups",
                                                    to_string(result.regime.regime)));
        }
    }

    return result;
}

RegimeResult Screener::resolve_regime(const ScreeningRequest& request) const {
    if (request.market_regime) {
        RegimeResult result;
        result.regime = *request.market_regime;
        result.confidence = 1.0;
        result.recommendation = "Regime supplied by caller";
        result.adjustments = RegimeDetector::adjustments_for(result.regime);
        return result;
    }
    return regime_detector_->detect(request.benchmark_bars);
}

DecisionEngineInput Screener::build_input(const ScreeningRequest& request,
                                          const TechnicalResult& technical,
                                          MarketRegime regime) const {
    DecisionEngineInput input;
    input.ticker = request.ticker;

    if (request.current_price) {
        input.current_price = *request.current_price;
    } else if (!request.bars.empty()) {
        input.current_price = request.bars.back().close;
    }
    if (!is_finite_positive(input.current_price)) {
        throw std::runtime_error(fmt::format("{}: no usable current price", request.ticker));
    }

    std::vector<double> closes;
    closes.reserve(request.bars.size());
    for (const auto& bar : request.bars) {
        closes.push_back(bar.close);
    }

    double rsi = closes.empty() ? std::nan("") : rsi_series(closes, 14).back();
    if (std::isfinite(rsi)) {
        input.rsi = rsi;
    }
    input.ma50 = sma(closes, 50);
    if (auto nearest = find_nearest_support(input.current_price, request.bars)) {
        input.support = nearest->level.price;
    }

    long long combined = static_cast<long long>(technical.score) + request.external_score;
    input.stock_score = static_cast<int>(std::max(0LL, std::min(100LL, combined)));
    input.checklist_passed = request.checklist_passed;
    input.checklist_total = request.checklist_total;
    input.checklist_fail_reasons = request.checklist_fail_reasons;
    input.momentum_overall = request.momentum;
    input.momentum_signals = request.momentum_signals;
    input.relative_strength = request.relative_strength;
    input.market_regime = regime;
    input.iv_rank = request.iv_rank;
    input.days_to_earnings = request.days_to_earnings;
    input.spread_candidates = request.spread_candidates;
    input.account_size = request.account_size;
    input.max_risk_percent = request.max_risk_percent;

    if (request.as_of) {
        input.as_of = *request.as_of;
    } else if (!request.bars.empty()) {
        input.as_of = request.bars.back().date;
    }

    return input;
}

BatchScreener::BatchScreener(const Screener& screener, int thread_pool_size)
    : screener_(screener), thread_pool_size_(std::max(1, thread_pool_size)) {}

std::vector<ScreeningResult> BatchScreener::screen_all(const std::vector<ScreeningRequest>& requests) const {
    std::vector<ScreeningResult> results(requests.size());

    run_parallel(requests.size(), [&](std::size_t i) {
        const auto& request = requests[i];
        try {
            results[i] = screener_.screen(request);
        } catch (const std::exception& e) {
            spdlog::error("Screening {} failed: {}", request.ticker, e.what());
            results[i] = error_result(request.ticker, e.what());
        }
    });

    return results;
}

std::vector<ScreeningResult> BatchScreener::screen_json(const nlohmann::json& requests) const {
    if (!requests.is_array()) {
        throw std::runtime_error("batch input must be a JSON array");
    }

    std::vector<ScreeningResult> results(requests.size());

    run_parallel(requests.size(), [&](std::size_t i) {
        const auto& item = requests[i];
        std::string ticker = (item.is_object() && item.contains("ticker") && item.at("ticker").is_string())
            ? item.at("ticker").get<std::string>()
            : fmt::format("#{}", i);
        try {
            auto request = ScreeningRequest::from_json(item);
            if (!request) {
                results[i] = error_result(ticker, "malformed screening request");
                return;
            }
            results[i] = screener_.screen(*request);
        } catch (const std::exception& e) {
            spdlog::error("Screening {} failed: {}", ticker, e.what());
            results[i] = error_result(ticker, e.what());
        }
    });

    return results;
}

void BatchScreener::run_parallel(std::size_t count, const std::function<void(std::size_t)>& task) const {
    if (count == 0) {
        return;
    }

    std::atomic<std::size_t> next{0};
    auto worker = [&]() {
        for (std::size_t i = next.fetch_add(1); i < count; i = next.fetch_add(1)) {
            task(i);
        }
    };

    std::size_t workers = std::min(count, static_cast<std::size_t>(thread_pool_size_));
    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (std::size_t w = 0; w < workers; ++w) {
        threads.emplace_back(worker);
    }
    for (auto& thread : threads) {
        thread.join();
    }

    spdlog::info("Screened {} request(s) on {} worker(s)", count, workers);
}
