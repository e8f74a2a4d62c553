#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <memory>
#include <string>

namespace core {
namespace logging {

    // Call this once at the beginning of the application (e.g., in main()).
    // Logs go to the console and to a rotating file under logs/.
    void initialize(const std::string& log_file_base = "backtest_pipeline",
                    spdlog::level::level_enum console_level = spdlog::level::info,
                    spdlog::level::level_enum file_level = spdlog::level::debug);

    // Single stderr sink, no files. Used where stdout carries data
    // (the sandbox worker) and by the test runner.
    void initializeStderr(spdlog::level::level_enum level = spdlog::level::info);

    // Get the globally configured logger
    std::shared_ptr<spdlog::logger>& getLogger();

    // Helper function to set log level from string (useful for env vars/args)
    spdlog::level::level_enum level_from_string(const std::string& level_str);

} // namespace logging
} // namespace core
