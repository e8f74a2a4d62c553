#include "execution_record_store.hpp"
#include "exceptions.hpp"
#include "logging.hpp"

#include <utility>

namespace pipeline {

    namespace {

        json parseDocument(const std::string& body, const std::string& what) {
            json parsed = json::parse(body, nullptr, false);
            if (parsed.is_discarded()) {
                throw core::DataLoadException("Stored " + what + " is not valid JSON");
            }
            return parsed;
        }

    } // namespace

    SqliteExecutionStore::SqliteExecutionStore(std::shared_ptr<data::DatabaseManager> db)
        : db_(std::move(db)) {
        if (!db_) {
            throw core::DatabaseException("SqliteExecutionStore requires a database");
        }
        if (!db_->isConnected() && !db_->connect()) {
            throw core::DatabaseException("Cannot connect execution store database");
        }
        if (!db_->initializeSchema()) {
            throw core::DatabaseException("Cannot initialize execution store schema");
        }
    }

    void SqliteExecutionStore::create(const ExecutionRecord& record) {
        std::lock_guard<std::mutex> lock(mutex_);
        db_->insertDocument(data::DocumentTable::StrategyExecutions, record.id, record.strategy_id,
                            record.toJson().dump());
    }

    void SqliteExecutionStore::update(const ExecutionRecord& record) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!db_->updateDocument(data::DocumentTable::StrategyExecutions, record.id, record.toJson().dump())) {
            throw core::NotFoundException("No execution record with id " + record.id);
        }
    }

    std::optional<ExecutionRecord> SqliteExecutionStore::get(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto body = db_->getDocument(data::DocumentTable::StrategyExecutions, id);
        if (!body) return std::nullopt;
        return ExecutionRecord::fromJson(parseDocument(*body, "execution record " + id));
    }

    std::vector<ExecutionRecord> SqliteExecutionStore::listByStrategy(const std::string& strategy_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<ExecutionRecord> records;
        for (const auto& body : db_->listDocuments(data::DocumentTable::StrategyExecutions, strategy_id)) {
            records.push_back(ExecutionRecord::fromJson(parseDocument(body, "execution record")));
        }
        return records;
    }

    void SqliteExecutionStore::saveResult(const std::string& result_id, const std::string& execution_id,
                                          const backtester::BacktestResult& result) {
        std::lock_guard<std::mutex> lock(mutex_);
        json document = result.toJson();
        document["execution_id"] = execution_id;
        db_->upsertDocument(data::DocumentTable::BacktestRuns, result_id, execution_id, document.dump());
        core::logging::getLogger()->debug("Stored backtest result {} for execution {}", result_id, execution_id);
    }

    std::optional<backtester::BacktestResult> SqliteExecutionStore::getResult(const std::string& result_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto body = db_->getDocument(data::DocumentTable::BacktestRuns, result_id);
        if (!body) return std::nullopt;
        return backtester::BacktestResult::fromJson(parseDocument(*body, "backtest result " + result_id));
    }

    void SqliteExecutionStore::saveStrategyGraph(const std::string& strategy_id, const nlohmann::json& graph) {
        std::lock_guard<std::mutex> lock(mutex_);
        db_->upsertDocument(data::DocumentTable::Strategies, strategy_id, strategy_id, graph.dump());
    }

    std::optional<nlohmann::json> SqliteExecutionStore::findStrategyGraph(const std::string& strategy_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto body = db_->getDocument(data::DocumentTable::Strategies, strategy_id);
        if (!body) return std::nullopt;
        return parseDocument(*body, "strategy graph " + strategy_id);
    }

} // namespace pipeline
