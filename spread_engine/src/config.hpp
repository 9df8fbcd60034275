#pragma once

#include "types.hpp"
#include <string>

struct Config {
    // Service configuration
    std::string service_name = "spread_engine";
    std::string log_level = "info";

    // Strategy variant: "credit" (put credit spreads) or "debit" (call debit spreads)
    std::string strategy = "credit";

    // Account defaults, overridable per request
    double account_size = 1500.0;
    double max_risk_percent = 20.0;

    // Warn when earnings fall inside this many days
    int earnings_warning_days = 14;

    // Batch screening
    int thread_pool_size = 4;

    // Load from a JSON file; throws std::runtime_error when unreadable or invalid
    void load(const std::string& path);

    // Load from environment variables
    void load_from_env();

    SpreadStrategy spread_strategy() const;
};
