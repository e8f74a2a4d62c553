#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <sqlite3.h> // Standard C header

#include "datatypes.hpp" // Keep core types

namespace data {

// JSON document tables. Each row: id, strategy_id, body, created_at, updated_at.
enum class DocumentTable {
    Strategies,          // "strategies": strategy graphs, keyed by strategy id
    StrategyExecutions,  // "strategy_executions": execution records
    BacktestRuns         // "backtest_runs": backtest results
};

std::string documentTableName(DocumentTable table);

class DatabaseManager {
public:
    // ":memory:" gives a private in-memory database
    explicit DatabaseManager(const std::string& db_path);
    ~DatabaseManager();

    // Delete copy constructor and assignment operator
    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    // Opened in serialized (FULLMUTEX) mode; safe to share across threads
    bool connect();
    void disconnect();
    bool isConnected() const;

    bool initializeSchema();

    bool executeSQL(const std::string& sql);

    bool saveCandles(const core::TimeSeries<core::Candle>& candles,
                     const std::string& instrument_key,
                     const std::string& interval);

    // Ascending by timestamp, both bounds inclusive. Throws DatabaseException.
    core::TimeSeries<core::Candle> queryCandles(
        const std::string& instrument_key,
        const std::string& interval,
        core::Timestamp start_time,
        core::Timestamp end_time);

    // --- JSON documents (all throw DatabaseException on SQLite errors) ---

    // Fails with DatabaseException if the id already exists
    void insertDocument(DocumentTable table, const std::string& id,
                        const std::string& strategy_id, const std::string& body);
    // Returns false when no row has this id
    bool updateDocument(DocumentTable table, const std::string& id, const std::string& body);
    void upsertDocument(DocumentTable table, const std::string& id,
                        const std::string& strategy_id, const std::string& body);
    std::optional<std::string> getDocument(DocumentTable table, const std::string& id);
    // Oldest first
    std::vector<std::string> listDocuments(DocumentTable table, const std::string& strategy_id);

private:
    std::string database_path_;
    sqlite3* db_ = nullptr; // SQLite database connection handle
    bool connected_ = false;
    // Multi-statement sequences (transactions, step + changes) stay together
    mutable std::recursive_mutex mutex_;

    void requireConnected(const char* operation) const;
    void throwSqliteError(const std::string& context, int rc) const;
};

} // namespace data
