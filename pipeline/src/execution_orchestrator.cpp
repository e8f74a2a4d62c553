#include "execution_orchestrator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "strategy_graph.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>

#include <thread>
#include <utility>

namespace pipeline {

    ExecutionOrchestrator::ExecutionOrchestrator(std::shared_ptr<IExecutionRecordStore> store,
                                                 std::shared_ptr<data::IMarketDataProvider> market_data,
                                                 std::shared_ptr<sandbox::ISandboxRunner> runner,
                                                 std::shared_ptr<const strategy_engine::ISignalCompiler> compiler,
                                                 std::size_t worker_threads)
        : store_(std::move(store)),
          market_data_(std::move(market_data)),
          runner_(std::move(runner)),
          compiler_(std::move(compiler)) {
        if (!store_ || !market_data_ || !runner_ || !compiler_) {
            throw core::ConfigException("ExecutionOrchestrator needs a store, a market data provider, a runner and a compiler");
        }
        pool_ = std::make_unique<WorkerPool>(worker_threads);
    }

    ExecutionOrchestrator::~ExecutionOrchestrator() {
        pool_.reset();
    }

    std::string ExecutionOrchestrator::submit(const std::string& strategy_id,
                                              const strategy_engine::BacktestParameters& params,
                                              const std::optional<nlohmann::json>& inline_graph) {
        ExecutionRecord record;
        record.id = core::utils::generateId();
        record.strategy_id = strategy_id;
        record.stage = Stage::Queued;
        record.parameters = params;
        record.created_at = std::chrono::system_clock::now();
        record.appendLog(fmt::format("Queued execution for strategy '{}' ({} .. {})",
                                     strategy_id, params.start_date, params.end_date));
        store_->create(record);

        core::logging::getLogger()->info("Execution {} queued for strategy '{}'", record.id, strategy_id);
        const std::string id = record.id;
        try {
            pool_->enqueue([this, record, inline_graph]() mutable {
                execute(std::move(record), std::move(inline_graph));
            });
        } catch (const core::PipelineException& e) {
            fail(record, core::ErrorKind::InternalError, std::string("Could not schedule execution: ") + e.what());
            throw;
        }
        return id;
    }

    void ExecutionOrchestrator::shutdown() {
        pool_->shutdown();
    }

    void ExecutionOrchestrator::advance(ExecutionRecord& record, Stage next, const std::string& message) {
        record.stage = next;
        record.appendLog(message);
        store_->update(record);
        core::logging::getLogger()->info("Execution {} -> {}: {}", record.id, stageToString(next), message);
    }

    void ExecutionOrchestrator::fail(ExecutionRecord& record, core::ErrorKind kind, const std::string& message) {
        auto logger = core::logging::getLogger();
        const Stage failed_stage = record.stage;
        record.error = ExecutionError{kind, failed_stage, message};
        record.stage = Stage::Failed;
        record.completed_at = std::chrono::system_clock::now();
        record.appendLog(fmt::format("Failed during {} with {}: {}", stageToString(failed_stage),
                                     core::errorKindToString(kind), message));
        logger->error("Execution {} failed during {} ({}): {}", record.id, stageToString(failed_stage),
                      core::errorKindToString(kind), message);
        try {
            store_->update(record);
        } catch (const std::exception& e) {
            // The store itself is broken; there is nowhere left to record this
            logger->critical("Could not persist failure of execution {}: {}", record.id, e.what());
        }
    }

    void ExecutionOrchestrator::execute(ExecutionRecord record, std::optional<nlohmann::json> inline_graph) {
        try {
            runStages(record, inline_graph);
        } catch (const core::PipelineException& e) {
            fail(record, e.kind(), e.what());
        } catch (const std::exception& e) {
            fail(record, core::ErrorKind::InternalError, e.what());
        } catch (...) {
            fail(record, core::ErrorKind::InternalError, "Unknown exception");
        }
    }

    void ExecutionOrchestrator::runStages(ExecutionRecord& record, const std::optional<nlohmann::json>& inline_graph) {
        auto logger = core::logging::getLogger();
        record.started_at = std::chrono::system_clock::now();

        // --- Analyzing ---
        advance(record, Stage::Analyzing, "Analyzing strategy graph");
        nlohmann::json raw_graph;
        if (inline_graph) {
            raw_graph = *inline_graph;
        } else {
            auto stored = store_->findStrategyGraph(record.strategy_id);
            if (!stored) {
                throw core::SchemaException("No strategy graph submitted or stored for strategy '" + record.strategy_id + "'");
            }
            raw_graph = std::move(*stored);
        }
        strategy_engine::NormalizedGraph graph = strategy_engine::StrategyGraphValidator::normalize(raw_graph);
        if (inline_graph) {
            store_->saveStrategyGraph(record.strategy_id, raw_graph);
        }
        record.appendLog(fmt::format("Graph '{}' trades {} with {} entry rule(s)",
                                     graph.name, graph.category, graph.entry_rules.size()));

        strategy_engine::SignalSpecification spec = compiler_->compile(graph, record.parameters);
        for (const auto& diagnostic : spec.diagnostics) {
            record.appendLog("Compiler: " + diagnostic);
        }
        if (spec.fallback_applied) {
            record.appendLog("Compiler applied the default SMA crossover");
        }

        // --- GeneratingLogic ---
        advance(record, Stage::GeneratingLogic, "Generating signal logic");
        record.generated_logic = spec.serialize();
        record.appendLog(fmt::format("Generated {} bytes of signal logic with {} indicator(s)",
                                     record.generated_logic->size(), spec.indicators.size()));
        store_->update(record);

        // --- Validating ---
        advance(record, Stage::Validating, "Validating generated logic against the sandbox policy");
        runner_->validate(*record.generated_logic);

        // --- Running ---
        advance(record, Stage::Running, fmt::format("Loading {} prices and starting the sandbox", spec.asset.symbol));
        core::TimeSeries<core::Candle> candles;
        try {
            candles = market_data_->fetchDailyCandles(spec.asset,
                                                      core::utils::dateToTimestamp(spec.parameters.start_date),
                                                      core::utils::dateToTimestamp(spec.parameters.end_date));
        } catch (const std::exception& e) {
            throw core::ExecutionException(fmt::format("Market data unavailable for {}: {}", spec.asset.symbol, e.what()));
        }
        if (candles.empty()) {
            throw core::ExecutionException("Market data provider returned no candles for " + spec.asset.symbol);
        }
        record.appendLog(fmt::format("Loaded {} daily candles", candles.size()));
        store_->update(record);

        sandbox::SandboxRunResult run = runner_->run(*record.generated_logic, candles);
        backtester::BacktestResult result;
        try {
            result = backtester::BacktestResult::fromJson(run.payload);
        } catch (const core::DataLoadException& e) {
            throw core::ExecutionException(std::string("Sandbox worker returned a malformed result: ") + e.what());
        }
        record.appendLog(fmt::format("Sandbox finished in {:.2f} s", run.elapsed_seconds));

        const std::string result_id = core::utils::generateId();
        store_->saveResult(result_id, record.id, result);
        record.result_id = result_id;
        record.completed_at = std::chrono::system_clock::now();
        advance(record, Stage::Completed,
                fmt::format("Backtest complete: {} trade(s), total return {:.2f}%, max drawdown {:.2f}%",
                            result.metrics.trade_count, result.metrics.total_return_pct,
                            result.metrics.max_drawdown_pct));
        logger->debug("Execution {} stored result {}", record.id, result_id);
    }

    ExecutionRecord ExecutionOrchestrator::requireExecution(const std::string& execution_id) {
        auto record = store_->get(execution_id);
        if (!record) {
            throw core::NotFoundException("No execution with id " + execution_id);
        }
        return *record;
    }

    std::optional<ExecutionRecord> ExecutionOrchestrator::getExecution(const std::string& execution_id) {
        return store_->get(execution_id);
    }

    std::string ExecutionOrchestrator::getGeneratedLogic(const std::string& execution_id) {
        ExecutionRecord record = requireExecution(execution_id);
        if (!record.generated_logic) {
            throw core::NotReadyException(fmt::format("Execution {} has no generated logic yet (stage {})",
                                                      execution_id, stageToString(record.stage)));
        }
        return *record.generated_logic;
    }

    backtester::BacktestResult ExecutionOrchestrator::getResult(const std::string& execution_id) {
        ExecutionRecord record = requireExecution(execution_id);
        if (record.stage != Stage::Completed || !record.result_id) {
            throw core::NotReadyException(fmt::format("Execution {} has no result (stage {})",
                                                      execution_id, stageToString(record.stage)));
        }
        auto result = store_->getResult(*record.result_id);
        if (!result) {
            throw core::NotFoundException("Result " + *record.result_id + " of execution " + execution_id + " is missing");
        }
        return *result;
    }

    std::vector<ExecutionRecord> ExecutionOrchestrator::getExecutionsForStrategy(const std::string& strategy_id) {
        return store_->listByStrategy(strategy_id);
    }

    std::optional<ExecutionRecord> ExecutionOrchestrator::waitForCompletion(const std::string& execution_id,
                                                                           std::chrono::milliseconds timeout,
                                                                           std::chrono::milliseconds poll_interval) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true) {
            auto record = store_->get(execution_id);
            if (!record || record->isTerminal() || std::chrono::steady_clock::now() >= deadline) {
                return record;
            }
            std::this_thread::sleep_for(poll_interval);
        }
    }

} // namespace pipeline
