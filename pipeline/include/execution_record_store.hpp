#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "backtest_result.hpp"
#include "database_manager.hpp"
#include "execution_record.hpp"

namespace pipeline {

    // Durable home of execution records, backtest results and strategy graphs.
    // Implementations are shared by the worker threads and must be thread-safe.
    class IExecutionRecordStore {
    public:
        virtual ~IExecutionRecordStore() = default;

        // Throws DatabaseException if the id exists
        virtual void create(const ExecutionRecord& record) = 0;
        // Throws NotFoundException for an unknown id
        virtual void update(const ExecutionRecord& record) = 0;
        virtual std::optional<ExecutionRecord> get(const std::string& id) = 0;
        // Oldest first
        virtual std::vector<ExecutionRecord> listByStrategy(const std::string& strategy_id) = 0;

        virtual void saveResult(const std::string& result_id, const std::string& execution_id,
                                const backtester::BacktestResult& result) = 0;
        virtual std::optional<backtester::BacktestResult> getResult(const std::string& result_id) = 0;

        // Raw graph document as submitted; replaces an earlier one
        virtual void saveStrategyGraph(const std::string& strategy_id, const nlohmann::json& graph) = 0;
        virtual std::optional<nlohmann::json> findStrategyGraph(const std::string& strategy_id) = 0;
    };

    // JSON documents in the strategies, strategy_executions and backtest_runs tables
    class SqliteExecutionStore : public IExecutionRecordStore {
    public:
        // Connects and creates the schema. Throws DatabaseException.
        explicit SqliteExecutionStore(std::shared_ptr<data::DatabaseManager> db);

        void create(const ExecutionRecord& record) override;
        void update(const ExecutionRecord& record) override;
        std::optional<ExecutionRecord> get(const std::string& id) override;
        std::vector<ExecutionRecord> listByStrategy(const std::string& strategy_id) override;

        void saveResult(const std::string& result_id, const std::string& execution_id,
                        const backtester::BacktestResult& result) override;
        std::optional<backtester::BacktestResult> getResult(const std::string& result_id) override;

        void saveStrategyGraph(const std::string& strategy_id, const nlohmann::json& graph) override;
        std::optional<nlohmann::json> findStrategyGraph(const std::string& strategy_id) override;

    private:
        std::shared_ptr<data::DatabaseManager> db_;
        std::mutex mutex_;
    };

} // namespace pipeline
