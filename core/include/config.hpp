#pragma once

#include <string>
#include <cstddef>

namespace core {

    struct SandboxSettings {
        std::string runner_path = "signal_runner";
        std::string scratch_root;              // Empty = system temp directory
        int timeout_seconds = 300;
        std::size_t memory_limit_mb = 1024;
        std::size_t max_output_bytes = 16 * 1024 * 1024;
    };

    struct MarketDataSettings {
        std::string source = "coingecko";     // coingecko | sqlite | synthetic
        std::string base_url = "https://api.coingecko.com/api/v3";
        std::string api_key;
        long request_timeout_ms = 30000;
        bool cache_in_database = true;
    };

    struct PipelineConfig {
        std::string database_path = "backtest_pipeline.db";
        std::string log_file = "backtest_pipeline";
        std::string log_level = "info";
        std::size_t worker_threads = 2;
        SandboxSettings sandbox;
        MarketDataSettings market_data;
    };

    // Defaults plus environment overrides (BACKTEST_DB_PATH, SIGNAL_RUNNER_PATH, COINGECKO_API_KEY)
    PipelineConfig defaultConfig();

    // Reads a JSON config file over the defaults, then applies environment overrides.
    // Throws ConfigException on unreadable files, parse errors and invalid values.
    PipelineConfig loadConfig(const std::string& path);

} // namespace core
