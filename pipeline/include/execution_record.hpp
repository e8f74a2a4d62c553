#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "datatypes.hpp"
#include "exceptions.hpp"
#include "signal_spec.hpp"

namespace pipeline {

    using json = nlohmann::json;

    enum class Stage {
        Queued,
        Analyzing,
        GeneratingLogic,
        Validating,
        Running,
        Completed,
        Failed
    };

    std::string stageToString(Stage stage);
    // Throws std::invalid_argument
    Stage stageFromString(const std::string& stage);
    bool isTerminalStage(Stage stage);

    struct LogLine {
        core::Timestamp timestamp;
        std::string message;
    };

    struct ExecutionError {
        core::ErrorKind kind = core::ErrorKind::InternalError;
        Stage stage = Stage::Queued;  // Stage that was active when it failed
        std::string message;
    };

    // One submission moving through the pipeline. Only the orchestrator
    // mutates it; everyone else reads snapshots.
    struct ExecutionRecord {
        std::string id;
        std::string strategy_id;
        Stage stage = Stage::Queued;
        strategy_engine::BacktestParameters parameters;  // As submitted
        std::vector<LogLine> logs;
        std::optional<std::string> generated_logic;
        std::optional<std::string> result_id;
        std::optional<ExecutionError> error;
        core::Timestamp created_at;
        std::optional<core::Timestamp> started_at;
        std::optional<core::Timestamp> completed_at;

        // Timestamped with the current time
        void appendLog(const std::string& message);
        bool isTerminal() const { return isTerminalStage(stage); }

        json toJson() const;
        // Throws DataLoadException
        static ExecutionRecord fromJson(const json& j);
    };

} // namespace pipeline
