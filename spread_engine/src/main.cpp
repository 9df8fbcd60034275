#include "config.hpp"
#include "screener.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>

namespace {
    nlohmann::json read_json_file(const std::string& path) {
        std::ifstream file(path);
        if (!file) {
            throw std::runtime_error("cannot open input file " + path);
        }
        try {
            nlohmann::json j;
            file >> j;
            return j;
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("invalid JSON in " + path + ": " + e.what());
        }
    }
}

int main(int argc, char* argv[]) {
    // Set up logger. Results go to stdout, so logs go to stderr.
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("spread_engine", console_sink);
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::info); // Default, will be overridden by config
    spdlog::flush_on(spdlog::level::info);

    if (argc < 2 || argc > 3) {
        spdlog::critical("Usage: {} [config.json] <request.json>", argv[0]);
        return 1;
    }

    std::string request_path = argv[argc - 1];

    Config config;
    try {
        if (argc == 3) {
            config.load(argv[1]);
            spdlog::info("Configuration loaded from {}", argv[1]);
        }
        config.load_from_env();
        spdlog::set_level(spdlog::level::from_str(config.log_level));
    } catch (const std::exception& e) {
        spdlog::critical("Failed to load configuration: {}", e.what());
        return 1;
    }

    spdlog::info("Starting {} ({} spreads)", config.service_name, config.strategy);

    try {
        auto input = read_json_file(request_path);
        auto screener = std::make_unique<Screener>(config);

        nlohmann::json output;
        if (input.is_array()) {
            BatchScreener batch(*screener, config.thread_pool_size);
            output = nlohmann::json::array();
            for (const auto& result : batch.screen_json(input)) {
                output.push_back(result.to_json());
            }
        } else {
            auto request = ScreeningRequest::from_json(input);
            if (!request) {
                spdlog::critical("Malformed screening request in {}", request_path);
                return 1;
            }
            output = screener->screen(*request).to_json();
        }

        std::cout << output.dump(2) << std::endl;
    } catch (const std::exception& e) {
        spdlog::critical("Screening failed: {}", e.what());
        return 1;
    }

    spdlog::shutdown();
    return 0;
}
