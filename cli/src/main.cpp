// cli/src/main.cpp

#include <iostream>
#include <string>
#include <vector>
#include <map>
#include <exception>
#include <chrono>
#include <fstream>
#include <memory>

#include "logging.hpp"
#include "exceptions.hpp"
#include "config.hpp"
#include "utils.hpp"
#include "database_manager.hpp"
#include "coingecko_client.hpp"
#include "sqlite_market_data_provider.hpp"
#include "synthetic_market_data_provider.hpp"
#include "sandboxed_runner.hpp"
#include "signal_compiler.hpp"
#include "execution_orchestrator.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <nlohmann/json.hpp>

namespace {

    using json = nlohmann::json;

    const char* const kUsage = R"(usage: backtest_pipeline [--config FILE] [--synthetic] COMMAND

commands:
  submit --graph FILE --strategy-id ID --start YYYY-MM-DD --end YYYY-MM-DD
         [--capital N] [--fee R] [--slippage R] [--exposure F]
         [--sizing initial_capital|current_equity] [--no-wait]
  status EXECUTION_ID
  logic EXECUTION_ID
  result EXECUTION_ID
  list STRATEGY_ID
)";

    struct CommandLine {
        std::string command;
        std::vector<std::string> positional;
        std::map<std::string, std::string> options;  // --name value
        bool synthetic = false;
        bool no_wait = false;
    };

    CommandLine parseCommandLine(int argc, char* argv[]) {
        CommandLine cl;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--synthetic") {
                cl.synthetic = true;
            } else if (arg == "--no-wait") {
                cl.no_wait = true;
            } else if (arg.rfind("--", 0) == 0) {
                if (i + 1 >= argc) {
                    throw std::invalid_argument("Option " + arg + " needs a value");
                }
                cl.options[arg.substr(2)] = argv[++i];
            } else if (cl.command.empty()) {
                cl.command = arg;
            } else {
                cl.positional.push_back(arg);
            }
        }
        return cl;
    }

    const std::string& requireOption(const CommandLine& cl, const std::string& name) {
        auto it = cl.options.find(name);
        if (it == cl.options.end()) {
            throw std::invalid_argument("Missing required option --" + name);
        }
        return it->second;
    }

    const std::string& requirePositional(const CommandLine& cl, const std::string& what) {
        if (cl.positional.empty()) {
            throw std::invalid_argument(cl.command + " needs " + what);
        }
        return cl.positional.front();
    }

    json readJsonFile(const std::string& path) {
        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw core::DataLoadException("Failed to open file: " + path);
        }
        try {
            return json::parse(ifs);
        } catch (const json::parse_error& e) {
            throw core::DataLoadException("Invalid JSON in " + path + ": " + e.what());
        }
    }

    strategy_engine::BacktestParameters parametersFromCommandLine(const CommandLine& cl) {
        json j = {
            {"start_date", requireOption(cl, "start")},
            {"end_date", requireOption(cl, "end")}
        };
        auto number = [&](const char* option, const char* key) {
            auto it = cl.options.find(option);
            if (it != cl.options.end()) {
                try {
                    j[key] = std::stod(it->second);
                } catch (const std::exception&) {
                    throw std::invalid_argument(std::string("--") + option + " expects a number, got '" + it->second + "'");
                }
            }
        };
        number("capital", "initial_capital");
        number("fee", "fee_rate");
        number("slippage", "slippage_rate");
        number("exposure", "exposure");
        auto sizing = cl.options.find("sizing");
        if (sizing != cl.options.end()) j["position_sizing"] = sizing->second;
        return strategy_engine::parametersFromJson(j);
    }

    std::shared_ptr<data::IMarketDataProvider> makeMarketData(const core::PipelineConfig& config, bool synthetic,
                                                              const std::shared_ptr<data::DatabaseManager>& db) {
        const auto& md = config.market_data;
        if (synthetic || md.source == "synthetic") {
            return std::make_shared<data::SyntheticMarketDataProvider>();
        }
        if (md.source == "sqlite") {
            return std::make_shared<data::SqliteMarketDataProvider>(db);
        }
        auto coingecko = std::make_shared<data::CoinGeckoClient>(md.base_url, md.api_key, md.request_timeout_ms);
        if (md.cache_in_database) {
            return std::make_shared<data::SqliteMarketDataProvider>(db, coingecko);
        }
        return coingecko;
    }

    void printRecord(const pipeline::ExecutionRecord& record) {
        json j = record.toJson();
        // Logic is large and has its own command
        if (!j["generated_logic"].is_null()) j["generated_logic"] = "<available: use 'logic'>";
        std::cout << j.dump(2) << std::endl;
    }

} // namespace

int main(int argc, char* argv[]) {
    std::shared_ptr<spdlog::logger> logger = nullptr;

    try {
        CommandLine cl = parseCommandLine(argc, argv);
        if (cl.command.empty() || cl.command == "help") {
            std::cout << kUsage;
            return cl.command.empty() ? 2 : 0;
        }

        auto config_it = cl.options.find("config");
        core::PipelineConfig config = config_it != cl.options.end()
            ? core::loadConfig(config_it->second)
            : core::defaultConfig();

        core::logging::initialize(config.log_file, core::logging::level_from_string(config.log_level), spdlog::level::debug);
        logger = core::logging::getLogger();
        logger->info("Backtest pipeline CLI starting ({})", cl.command);

        auto db = std::make_shared<data::DatabaseManager>(config.database_path);
        if (!db->connect()) {
            throw core::DatabaseException("Cannot open database " + config.database_path);
        }
        auto store = std::make_shared<pipeline::SqliteExecutionStore>(db);
        auto runner = std::make_shared<sandbox::SandboxedRunner>(config.sandbox);
        auto compiler = std::make_shared<strategy_engine::RuleSignalCompiler>();

        pipeline::ExecutionOrchestrator orchestrator(store, makeMarketData(config, cl.synthetic, db), runner,
                                                     compiler, config.worker_threads);

        if (cl.command == "submit") {
            json graph = readJsonFile(requireOption(cl, "graph"));
            const std::string& strategy_id = requireOption(cl, "strategy-id");
            auto params = parametersFromCommandLine(cl);

            std::string id = orchestrator.submit(strategy_id, params, graph);
            std::cout << "execution_id: " << id << std::endl;
            if (cl.no_wait) {
                // The orchestrator destructor still finishes the queued job
                return 0;
            }

            // Bounded by the sandbox limit plus data loading
            auto timeout = std::chrono::seconds(config.sandbox.timeout_seconds + 120);
            auto record = orchestrator.waitForCompletion(id, timeout);
            if (!record || !record->isTerminal()) {
                logger->error("Execution {} did not finish in time", id);
                return 1;
            }
            printRecord(*record);
            if (record->stage != pipeline::Stage::Completed) {
                return 1;
            }
            std::cout << backtester::metricsToJson(orchestrator.getResult(id).metrics).dump(2) << std::endl;
        } else if (cl.command == "status") {
            const std::string& id = requirePositional(cl, "an execution id");
            auto record = orchestrator.getExecution(id);
            if (!record) {
                throw core::NotFoundException("No execution with id " + id);
            }
            printRecord(*record);
        } else if (cl.command == "logic") {
            std::cout << orchestrator.getGeneratedLogic(requirePositional(cl, "an execution id")) << std::endl;
        } else if (cl.command == "result") {
            std::cout << orchestrator.getResult(requirePositional(cl, "an execution id")).toJson().dump(2) << std::endl;
        } else if (cl.command == "list") {
            json rows = json::array();
            for (const auto& record : orchestrator.getExecutionsForStrategy(requirePositional(cl, "a strategy id"))) {
                rows.push_back({
                    {"id", record.id},
                    {"stage", pipeline::stageToString(record.stage)},
                    {"created_at", core::utils::timestampToString(record.created_at)},
                    {"error", record.error ? json(core::errorKindToString(record.error->kind)) : json()}
                });
            }
            std::cout << rows.dump(2) << std::endl;
        } else {
            std::cerr << "Unknown command '" << cl.command << "'\n" << kUsage;
            return 2;
        }

        logger->info("Backtest pipeline CLI finished.");

    } catch (const std::invalid_argument& ex) {
        std::cerr << "Usage Error: " << ex.what() << "\n" << kUsage;
        return 2;
    } catch (const core::PipelineException& ex) {
        std::cerr << core::errorKindToString(ex.kind()) << ": " << ex.what() << std::endl;
        if (logger) logger->critical("Pipeline Error: {}", ex.what());
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Standard Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Standard Error: {}", ex.what());
        return 1;
    } catch (...) {
        std::cerr << "Unknown Error occurred." << std::endl;
        if (logger) logger->critical("Unknown Error occurred.");
        return 1;
    }

    return 0;
}
