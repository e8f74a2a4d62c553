#include "config.hpp"
#include "exceptions.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>
#include <fstream>
#include <cstdlib>

namespace core {

    namespace {

        using json = nlohmann::json;

        std::string readEnvVar(const char* name) {
            const char* value = std::getenv(name);
            return value ? utils::trim(value) : "";
        }

        void applyEnvironment(PipelineConfig& config) {
            std::string db_path = readEnvVar("BACKTEST_DB_PATH");
            if (!db_path.empty()) config.database_path = db_path;

            std::string runner = readEnvVar("SIGNAL_RUNNER_PATH");
            if (!runner.empty()) config.sandbox.runner_path = runner;

            std::string api_key = readEnvVar("COINGECKO_API_KEY");
            if (!api_key.empty()) config.market_data.api_key = api_key;
        }

        void validate(const PipelineConfig& config) {
            if (config.worker_threads == 0) {
                throw ConfigException("worker_threads must be at least 1");
            }
            if (config.sandbox.timeout_seconds <= 0) {
                throw ConfigException("sandbox.timeout_seconds must be positive");
            }
            if (config.sandbox.runner_path.empty()) {
                throw ConfigException("sandbox.runner_path must not be empty");
            }
            const auto& source = config.market_data.source;
            if (source != "coingecko" && source != "sqlite" && source != "synthetic") {
                throw ConfigException("market_data.source must be one of coingecko, sqlite, synthetic (got '" + source + "')");
            }
        }

    } // namespace

    PipelineConfig defaultConfig() {
        PipelineConfig config;
        applyEnvironment(config);
        return config;
    }

    PipelineConfig loadConfig(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw ConfigException("Cannot open config file: " + path);
        }

        PipelineConfig config;
        try {
            json j = json::parse(file);

            config.database_path = j.value("database_path", config.database_path);
            config.log_file = j.value("log_file", config.log_file);
            config.log_level = j.value("log_level", config.log_level);
            config.worker_threads = j.value("worker_threads", config.worker_threads);

            if (j.contains("sandbox")) {
                const auto& s = j.at("sandbox");
                config.sandbox.runner_path = s.value("runner_path", config.sandbox.runner_path);
                config.sandbox.scratch_root = s.value("scratch_root", config.sandbox.scratch_root);
                config.sandbox.timeout_seconds = s.value("timeout_seconds", config.sandbox.timeout_seconds);
                config.sandbox.memory_limit_mb = s.value("memory_limit_mb", config.sandbox.memory_limit_mb);
                config.sandbox.max_output_bytes = s.value("max_output_bytes", config.sandbox.max_output_bytes);
            }

            if (j.contains("market_data")) {
                const auto& m = j.at("market_data");
                config.market_data.source = m.value("source", config.market_data.source);
                config.market_data.base_url = m.value("base_url", config.market_data.base_url);
                config.market_data.api_key = m.value("api_key", config.market_data.api_key);
                config.market_data.request_timeout_ms = m.value("request_timeout_ms", config.market_data.request_timeout_ms);
                config.market_data.cache_in_database = m.value("cache_in_database", config.market_data.cache_in_database);
            }
        } catch (const json::exception& e) {
            throw ConfigException("Invalid config file '" + path + "': " + e.what());
        }

        applyEnvironment(config);
        validate(config);
        return config;
    }

} // namespace core
