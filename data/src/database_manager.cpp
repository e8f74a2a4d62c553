#include "database_manager.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp" // For timestampToString/stringToTimestamp
#include <spdlog/fmt/fmt.h>

#include <chrono>
#include <stdexcept>

namespace data
{

    namespace
    {
        // Finalizes a prepared statement on every exit path
        struct StatementGuard
        {
            sqlite3_stmt *stmt = nullptr;
            ~StatementGuard() { sqlite3_finalize(stmt); }
        };

        std::string nowString()
        {
            return core::utils::timestampToString(std::chrono::system_clock::now());
        }
    } // namespace

    std::string documentTableName(DocumentTable table)
    {
        switch (table)
        {
        case DocumentTable::Strategies:
            return "strategies";
        case DocumentTable::StrategyExecutions:
            return "strategy_executions";
        case DocumentTable::BacktestRuns:
            return "backtest_runs";
        }
        return "strategies";
    }

    DatabaseManager::DatabaseManager(const std::string &db_path)
        : database_path_(db_path), db_(nullptr), connected_(false)
    {
        core::logging::getLogger()->debug("DatabaseManager (SQLite) created for path: {}", db_path);
    }

    DatabaseManager::~DatabaseManager()
    {
        disconnect(); // Ensure disconnection
    }

    bool DatabaseManager::connect()
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (connected_)
        {
            core::logging::getLogger()->warn("Already connected to SQLite database {}.", database_path_);
            return true;
        }

        core::logging::getLogger()->info("Connecting to SQLite database: {}", database_path_);

        // FULLMUTEX: executions run on worker threads and share this connection
        int rc = sqlite3_open_v2(database_path_.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                 nullptr);

        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("Cannot open SQLite database '{}': {}", database_path_,
                                              db_ ? sqlite3_errmsg(db_) : "out of memory");
            sqlite3_close(db_); // Close handle even if open failed (as per docs)
            db_ = nullptr;
            return false;
        }

        connected_ = true;
        sqlite3_busy_timeout(db_, 5000);
        core::logging::getLogger()->info("Successfully connected to SQLite database: {}", database_path_);
        return true;
    }

    void DatabaseManager::disconnect()
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (connected_)
        {
            core::logging::getLogger()->info("Disconnecting from SQLite database: {}", database_path_);
            int rc = sqlite3_close(db_);
            if (rc != SQLITE_OK)
            {
                // This usually happens if prepared statements are not finalized
                core::logging::getLogger()->error("Error disconnecting from SQLite database: {}", sqlite3_errmsg(db_));
            }
            db_ = nullptr;
            connected_ = false;
        }
    }

    bool DatabaseManager::isConnected() const
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        return connected_ && (db_ != nullptr);
    }

    void DatabaseManager::requireConnected(const char *operation) const
    {
        if (!isConnected())
        {
            throw core::DatabaseException(fmt::format("Cannot {}: not connected to database {}", operation, database_path_));
        }
    }

    void DatabaseManager::throwSqliteError(const std::string &context, int rc) const
    {
        std::string message = fmt::format("{} [{}]: {}", context, rc, sqlite3_errmsg(db_));
        core::logging::getLogger()->error(message);
        throw core::DatabaseException(message);
    }

    bool DatabaseManager::executeSQL(const std::string &sql)
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot execute SQL: Not connected to database.");
            return false;
        }

        core::logging::getLogger()->trace("Executing SQL (SQLite): {}", sql);

        char *error_msg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("SQL error: {}", error_msg ? error_msg : "unknown");
            sqlite3_free(error_msg); // Must free error message memory
            return false;
        }
        return true;
    }

    bool DatabaseManager::initializeSchema()
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot initialize schema: Not connected to database.");
            return false;
        }
        core::logging::getLogger()->info("Initializing SQLite database schema if needed...");

        const std::string create_candles_sql = R"(
        CREATE TABLE IF NOT EXISTS historical_candles (
            instrument_key TEXT,
            interval TEXT,
            timestamp TEXT, -- ISO 8601 UTC, sorts lexically
            open REAL,
            high REAL,
            low REAL,
            close REAL,
            volume REAL,
            PRIMARY KEY (instrument_key, interval, timestamp)
        );
    )";

        bool success = executeSQL(create_candles_sql);
        for (DocumentTable table : {DocumentTable::Strategies, DocumentTable::StrategyExecutions, DocumentTable::BacktestRuns})
        {
            const std::string name = documentTableName(table);
            success &= executeSQL(fmt::format(R"(
        CREATE TABLE IF NOT EXISTS {0} (
            id TEXT PRIMARY KEY,
            strategy_id TEXT,
            body TEXT NOT NULL, -- JSON document
            created_at TEXT NOT NULL,
            updated_at TEXT NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_{0}_strategy ON {0} (strategy_id, created_at);
    )", name));
        }

        if (success)
        {
            core::logging::getLogger()->info("SQLite database schema initialization check complete.");
        }
        else
        {
            core::logging::getLogger()->error("SQLite database schema initialization failed for one or more statements.");
        }
        return success;
    }

    core::TimeSeries<core::Candle> DatabaseManager::queryCandles(
        const std::string &instrument_key,
        const std::string &interval,
        core::Timestamp start_time,
        core::Timestamp end_time)
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        requireConnected("query candles");
        core::TimeSeries<core::Candle> candles;
        auto logger = core::logging::getLogger();

        std::string start_str = core::utils::timestampToString(start_time);
        std::string end_str = core::utils::timestampToString(end_time);
        logger->debug("Querying candles for {} ({}) between '{}' and '{}'", instrument_key, interval, start_str, end_str);

        const char *sql = R"(
            SELECT timestamp, open, high, low, close, volume
            FROM historical_candles
            WHERE instrument_key = ?
              AND interval = ?
              AND timestamp >= ?
              AND timestamp <= ?
            ORDER BY timestamp ASC;
        )";

        StatementGuard guard;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            throwSqliteError("Failed to prepare candle query", rc);
        }

        // Index is 1-based
        sqlite3_bind_text(guard.stmt, 1, instrument_key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(guard.stmt, 2, interval.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(guard.stmt, 3, start_str.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(guard.stmt, 4, end_str.c_str(), -1, SQLITE_TRANSIENT);

        while ((rc = sqlite3_step(guard.stmt)) == SQLITE_ROW)
        {
            const unsigned char *ts_text = sqlite3_column_text(guard.stmt, 0);
            if (!ts_text)
            {
                logger->warn("NULL timestamp in historical_candles for {}, skipping row.", instrument_key);
                continue;
            }
            core::Candle candle;
            try
            {
                candle.timestamp = core::utils::stringToTimestamp(reinterpret_cast<const char *>(ts_text));
            }
            catch (const std::runtime_error &e)
            {
                throw core::DatabaseException(fmt::format("Corrupt candle timestamp for {}: {}", instrument_key, e.what()));
            }
            candle.open = sqlite3_column_double(guard.stmt, 1);
            candle.high = sqlite3_column_double(guard.stmt, 2);
            candle.low = sqlite3_column_double(guard.stmt, 3);
            candle.close = sqlite3_column_double(guard.stmt, 4);
            candle.volume = sqlite3_column_double(guard.stmt, 5);
            candles.push_back(candle);
        }

        if (rc != SQLITE_DONE)
        {
            throwSqliteError("Error stepping through candle query", rc);
        }
        logger->debug("Loaded {} candles for {} from the database.", candles.size(), instrument_key);
        return candles;
    }

    bool DatabaseManager::saveCandles(const core::TimeSeries<core::Candle> &candles,
                                      const std::string &instrument_key,
                                      const std::string &interval)
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot save candles: Not connected to database.");
            return false;
        }
        if (candles.empty())
        {
            core::logging::getLogger()->debug("No candles provided to save for {} ({}).", instrument_key, interval);
            return true; // Nothing to do, report success
        }

        // Duplicates on (instrument_key, interval, timestamp) are ignored
        const char *sql = R"(
INSERT OR IGNORE INTO historical_candles
(instrument_key, interval, timestamp, open, high, low, close, volume)
VALUES (?, ?, ?, ?, ?, ?, ?, ?);
)";

        StatementGuard guard;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("Failed to prepare INSERT statement [{}]: {}", rc, sqlite3_errmsg(db_));
            return false;
        }

        if (!executeSQL("BEGIN TRANSACTION;"))
        {
            core::logging::getLogger()->error("Failed to begin transaction for saving candles.");
            return false;
        }

        bool success = true;
        int saved_count = 0;
        for (const auto &candle : candles)
        {
            std::string timestamp_str = core::utils::timestampToString(candle.timestamp);
            sqlite3_bind_text(guard.stmt, 1, instrument_key.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(guard.stmt, 2, interval.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(guard.stmt, 3, timestamp_str.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_double(guard.stmt, 4, candle.open);
            sqlite3_bind_double(guard.stmt, 5, candle.high);
            sqlite3_bind_double(guard.stmt, 6, candle.low);
            sqlite3_bind_double(guard.stmt, 7, candle.close);
            sqlite3_bind_double(guard.stmt, 8, candle.volume);

            rc = sqlite3_step(guard.stmt);
            if (rc != SQLITE_DONE)
            {
                core::logging::getLogger()->error("Failed to execute insert step [{}]: {}", rc, sqlite3_errmsg(db_));
                success = false;
                break;
            }
            if (sqlite3_changes(db_) > 0)
            {
                saved_count++;
            }
            sqlite3_reset(guard.stmt);
        }

        const char *final_sql = success ? "COMMIT;" : "ROLLBACK;";
        if (!executeSQL(final_sql))
        {
            core::logging::getLogger()->error("Failed to {} transaction for saving candles.", success ? "COMMIT" : "ROLLBACK");
            if (success)
                executeSQL("ROLLBACK;");
            success = false;
        }
        else if (success)
        {
            core::logging::getLogger()->info("Saved {} new candles (duplicates ignored) for {} ({}).", saved_count, instrument_key, interval);
        }
        else
        {
            core::logging::getLogger()->warn("Transaction rolled back due to error during candle save for {} ({}).", instrument_key, interval);
        }
        return success;
    }

    void DatabaseManager::insertDocument(DocumentTable table, const std::string &id,
                                         const std::string &strategy_id, const std::string &body)
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        requireConnected("insert document");
        const std::string sql = fmt::format(
            "INSERT INTO {} (id, strategy_id, body, created_at, updated_at) VALUES (?, ?, ?, ?, ?);",
            documentTableName(table));

        StatementGuard guard;
        int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &guard.stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            throwSqliteError("Failed to prepare document insert", rc);
        }
        const std::string now = nowString();
        sqlite3_bind_text(guard.stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(guard.stmt, 2, strategy_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(guard.stmt, 3, body.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(guard.stmt, 4, now.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(guard.stmt, 5, now.c_str(), -1, SQLITE_TRANSIENT);

        rc = sqlite3_step(guard.stmt);
        if (rc != SQLITE_DONE)
        {
            throwSqliteError(fmt::format("Failed to insert {} '{}'", documentTableName(table), id), rc);
        }
    }

    bool DatabaseManager::updateDocument(DocumentTable table, const std::string &id, const std::string &body)
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        requireConnected("update document");
        const std::string sql = fmt::format("UPDATE {} SET body = ?, updated_at = ? WHERE id = ?;",
                                            documentTableName(table));

        StatementGuard guard;
        int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &guard.stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            throwSqliteError("Failed to prepare document update", rc);
        }
        const std::string now = nowString();
        sqlite3_bind_text(guard.stmt, 1, body.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(guard.stmt, 2, now.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(guard.stmt, 3, id.c_str(), -1, SQLITE_TRANSIENT);

        rc = sqlite3_step(guard.stmt);
        if (rc != SQLITE_DONE)
        {
            throwSqliteError(fmt::format("Failed to update {} '{}'", documentTableName(table), id), rc);
        }
        return sqlite3_changes(db_) > 0;
    }

    void DatabaseManager::upsertDocument(DocumentTable table, const std::string &id,
                                         const std::string &strategy_id, const std::string &body)
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!updateDocument(table, id, body))
        {
            insertDocument(table, id, strategy_id, body);
        }
    }

    std::optional<std::string> DatabaseManager::getDocument(DocumentTable table, const std::string &id)
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        requireConnected("read document");
        const std::string sql = fmt::format("SELECT body FROM {} WHERE id = ?;", documentTableName(table));

        StatementGuard guard;
        int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &guard.stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            throwSqliteError("Failed to prepare document read", rc);
        }
        sqlite3_bind_text(guard.stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);

        rc = sqlite3_step(guard.stmt);
        if (rc == SQLITE_DONE)
        {
            return std::nullopt;
        }
        if (rc != SQLITE_ROW)
        {
            throwSqliteError(fmt::format("Failed to read {} '{}'", documentTableName(table), id), rc);
        }
        const unsigned char *text = sqlite3_column_text(guard.stmt, 0);
        return std::string(text ? reinterpret_cast<const char *>(text) : "");
    }

    std::vector<std::string> DatabaseManager::listDocuments(DocumentTable table, const std::string &strategy_id)
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        requireConnected("list documents");
        const std::string sql = fmt::format(
            "SELECT body FROM {} WHERE strategy_id = ? ORDER BY created_at ASC, rowid ASC;", documentTableName(table));

        StatementGuard guard;
        int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &guard.stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            throwSqliteError("Failed to prepare document listing", rc);
        }
        sqlite3_bind_text(guard.stmt, 1, strategy_id.c_str(), -1, SQLITE_TRANSIENT);

        std::vector<std::string> bodies;
        while ((rc = sqlite3_step(guard.stmt)) == SQLITE_ROW)
        {
            const unsigned char *text = sqlite3_column_text(guard.stmt, 0);
            bodies.emplace_back(text ? reinterpret_cast<const char *>(text) : "");
        }
        if (rc != SQLITE_DONE)
        {
            throwSqliteError(fmt::format("Failed to list {}", documentTableName(table)), rc);
        }
        return bodies;
    }

} // namespace data
