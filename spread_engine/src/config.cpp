#include "config.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace {
    std::string get_env(const char* name, const std::string& default_value) {
        const char* value = std::getenv(name);
        return value ? value : default_value;
    }

    int get_env_int(const char* name, int default_value) {
        const char* value = std::getenv(name);
        if (value) {
            try {
                return std::stoi(value);
            } catch (const std::exception&) {
                spdlog::warn("Invalid integer value for {}: {}", name, value);
            }
        }
        return default_value;
    }

    double get_env_double(const char* name, double default_value) {
        const char* value = std::getenv(name);
        if (value) {
            try {
                return std::stod(value);
            } catch (const std::exception&) {
                spdlog::warn("Invalid double value for {}: {}", name, value);
            }
        }
        return default_value;
    }
}

void Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("cannot open config file " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("invalid JSON in " + path + ": " + e.what());
    }
    if (!j.is_object()) {
        throw std::runtime_error("config file " + path + " must contain a JSON object");
    }

    try {
        service_name = j.value("service_name", service_name);
        log_level = j.value("log_level", log_level);
        strategy = j.value("strategy", strategy);
        account_size = j.value("account_size", account_size);
        max_risk_percent = j.value("max_risk_percent", max_risk_percent);
        earnings_warning_days = j.value("earnings_warning_days", earnings_warning_days);
        thread_pool_size = j.value("thread_pool_size", thread_pool_size);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("invalid value in " + path + ": " + e.what());
    }

    if (!parse_spread_strategy(strategy)) {
        throw std::runtime_error("unknown strategy '" + strategy + "' (expected credit or debit)");
    }
    if (thread_pool_size < 1) {
        throw std::runtime_error("thread_pool_size must be at least 1");
    }
}

void Config::load_from_env() {
    // Service configuration
    service_name = get_env("SERVICE_NAME", service_name);
    log_level = get_env("LOG_LEVEL", log_level);

    auto env_strategy = get_env("STRATEGY", strategy);
    if (parse_spread_strategy(env_strategy)) {
        strategy = env_strategy;
    } else {
        spdlog::warn("Invalid strategy value for STRATEGY: {}", env_strategy);
    }

    // Account defaults
    account_size = get_env_double("ACCOUNT_SIZE", account_size);
    max_risk_percent = get_env_double("MAX_RISK_PERCENT", max_risk_percent);
    earnings_warning_days = get_env_int("EARNINGS_WARNING_DAYS", earnings_warning_days);

    thread_pool_size = std::max(1, get_env_int("THREAD_POOL_SIZE", thread_pool_size));
}

SpreadStrategy Config::spread_strategy() const {
    return parse_spread_strategy(strategy).value_or(SpreadStrategy::CreditSpread);
}
