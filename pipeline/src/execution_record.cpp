#include "execution_record.hpp"
#include "utils.hpp"

#include <chrono>
#include <stdexcept>

namespace pipeline {

    namespace {

        json optionalTimestamp(const std::optional<core::Timestamp>& ts) {
            return ts ? json(core::utils::timestampToString(*ts)) : json();
        }

        std::optional<core::Timestamp> readOptionalTimestamp(const json& j, const char* key) {
            if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
            return core::utils::stringToTimestamp(j.at(key).get<std::string>());
        }

        std::optional<std::string> readOptionalString(const json& j, const char* key) {
            if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
            return j.at(key).get<std::string>();
        }

    } // namespace

    std::string stageToString(Stage stage) {
        switch (stage) {
            case Stage::Queued: return "Queued";
            case Stage::Analyzing: return "Analyzing";
            case Stage::GeneratingLogic: return "GeneratingLogic";
            case Stage::Validating: return "Validating";
            case Stage::Running: return "Running";
            case Stage::Completed: return "Completed";
            case Stage::Failed: return "Failed";
        }
        return "Queued";
    }

    Stage stageFromString(const std::string& stage) {
        for (Stage s : {Stage::Queued, Stage::Analyzing, Stage::GeneratingLogic, Stage::Validating,
                        Stage::Running, Stage::Completed, Stage::Failed}) {
            if (stageToString(s) == stage) return s;
        }
        throw std::invalid_argument("Unknown execution stage: " + stage);
    }

    bool isTerminalStage(Stage stage) {
        return stage == Stage::Completed || stage == Stage::Failed;
    }

    void ExecutionRecord::appendLog(const std::string& message) {
        logs.push_back({std::chrono::system_clock::now(), message});
    }

    json ExecutionRecord::toJson() const {
        json log_lines = json::array();
        for (const auto& line : logs) {
            log_lines.push_back({{"timestamp", core::utils::timestampToString(line.timestamp)},
                                 {"message", line.message}});
        }

        json j = {
            {"id", id},
            {"strategy_id", strategy_id},
            {"stage", stageToString(stage)},
            {"parameters", strategy_engine::parametersToJson(parameters)},
            {"logs", log_lines},
            {"generated_logic", generated_logic ? json(*generated_logic) : json()},
            {"result_id", result_id ? json(*result_id) : json()},
            {"error", json()},
            {"created_at", core::utils::timestampToString(created_at)},
            {"started_at", optionalTimestamp(started_at)},
            {"completed_at", optionalTimestamp(completed_at)}
        };
        if (error) {
            j["error"] = {{"kind", core::errorKindToString(error->kind)},
                          {"stage", stageToString(error->stage)},
                          {"message", error->message}};
        }
        return j;
    }

    ExecutionRecord ExecutionRecord::fromJson(const json& j) {
        ExecutionRecord record;
        try {
            record.id = j.at("id").get<std::string>();
            record.strategy_id = j.at("strategy_id").get<std::string>();
            record.stage = stageFromString(j.at("stage").get<std::string>());
            if (j.contains("parameters")) {
                record.parameters = strategy_engine::parametersFromJson(j.at("parameters"));
            }
            for (const auto& line : j.value("logs", json::array())) {
                record.logs.push_back({core::utils::stringToTimestamp(line.at("timestamp").get<std::string>()),
                                       line.at("message").get<std::string>()});
            }
            record.generated_logic = readOptionalString(j, "generated_logic");
            record.result_id = readOptionalString(j, "result_id");
            if (j.contains("error") && !j.at("error").is_null()) {
                const auto& e = j.at("error");
                record.error = ExecutionError{core::errorKindFromString(e.at("kind").get<std::string>()),
                                              stageFromString(e.at("stage").get<std::string>()),
                                              e.at("message").get<std::string>()};
            }
            record.created_at = core::utils::stringToTimestamp(j.at("created_at").get<std::string>());
            record.started_at = readOptionalTimestamp(j, "started_at");
            record.completed_at = readOptionalTimestamp(j, "completed_at");
        } catch (const std::exception& e) {
            // json, timestamp and enum parse errors alike
            throw core::DataLoadException(std::string("Malformed execution record: ") + e.what());
        }
        return record;
    }

} // namespace pipeline
