#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "backtest_result.hpp"
#include "execution_record.hpp"
#include "execution_record_store.hpp"
#include "market_data_provider.hpp"
#include "sandboxed_runner.hpp"
#include "signal_compiler.hpp"
#include "worker_pool.hpp"

namespace pipeline {

    // Drives submissions through Analyzing -> GeneratingLogic -> Validating ->
    // Running -> Completed on a worker pool. Every transition is written to the
    // store before the next stage begins. A failing stage ends the execution as
    // Failed with exactly one tagged error; nothing is retried and no exception
    // leaves a worker.
    class ExecutionOrchestrator {
    public:
        ExecutionOrchestrator(std::shared_ptr<IExecutionRecordStore> store,
                              std::shared_ptr<data::IMarketDataProvider> market_data,
                              std::shared_ptr<sandbox::ISandboxRunner> runner,
                              std::shared_ptr<const strategy_engine::ISignalCompiler> compiler,
                              std::size_t worker_threads = 2);
        // Finishes queued executions, then stops the workers
        ~ExecutionOrchestrator();

        ExecutionOrchestrator(const ExecutionOrchestrator&) = delete;
        ExecutionOrchestrator& operator=(const ExecutionOrchestrator&) = delete;

        // Persists a Queued record and returns its id without waiting.
        // inline_graph is stored under strategy_id once it validates; without
        // it the graph stored earlier for strategy_id is used.
        // After shutdown() the record is stored as Failed (InternalError) and
        // InternalException is thrown.
        std::string submit(const std::string& strategy_id,
                           const strategy_engine::BacktestParameters& params,
                           const std::optional<nlohmann::json>& inline_graph = std::nullopt);

        // Finishes queued executions and refuses further submissions
        void shutdown();

        std::optional<ExecutionRecord> getExecution(const std::string& execution_id);

        // NotFoundException for unknown ids, NotReadyException before GeneratingLogic completes
        std::string getGeneratedLogic(const std::string& execution_id);

        // NotFoundException for unknown ids, NotReadyException unless Completed
        backtester::BacktestResult getResult(const std::string& execution_id);

        std::vector<ExecutionRecord> getExecutionsForStrategy(const std::string& strategy_id);

        // Polls until the execution is terminal or the timeout passes; returns
        // the last record seen (nullopt for unknown ids)
        std::optional<ExecutionRecord> waitForCompletion(
            const std::string& execution_id,
            std::chrono::milliseconds timeout,
            std::chrono::milliseconds poll_interval = std::chrono::milliseconds(20));

    private:
        std::shared_ptr<IExecutionRecordStore> store_;
        std::shared_ptr<data::IMarketDataProvider> market_data_;
        std::shared_ptr<sandbox::ISandboxRunner> runner_;
        std::shared_ptr<const strategy_engine::ISignalCompiler> compiler_;
        // Declared last: destroyed (drained and joined) before the collaborators
        std::unique_ptr<WorkerPool> pool_;

        void execute(ExecutionRecord record, std::optional<nlohmann::json> inline_graph);
        void runStages(ExecutionRecord& record, const std::optional<nlohmann::json>& inline_graph);
        void advance(ExecutionRecord& record, Stage next, const std::string& message);
        void fail(ExecutionRecord& record, core::ErrorKind kind, const std::string& message);
        ExecutionRecord requireExecution(const std::string& execution_id);
    };

} // namespace pipeline
