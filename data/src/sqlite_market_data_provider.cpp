#include "sqlite_market_data_provider.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <utility>

namespace data {

SqliteMarketDataProvider::SqliteMarketDataProvider(std::shared_ptr<DatabaseManager> db,
                                                   std::shared_ptr<IMarketDataProvider> upstream)
    : db_(std::move(db)), upstream_(std::move(upstream))
{
    if (!db_) {
        throw core::DataLoadException("SqliteMarketDataProvider requires a database");
    }
}

core::TimeSeries<core::Candle> SqliteMarketDataProvider::loadCached(const std::string& key,
                                                                    core::Timestamp start,
                                                                    core::Timestamp end)
{
    try {
        return db_->queryCandles(key, kDailyInterval, start, end);
    } catch (const core::DatabaseException& e) {
        throw core::DataLoadException(std::string("Reading cached candles failed: ") + e.what());
    }
}

core::TimeSeries<core::Candle> SqliteMarketDataProvider::fetchDailyCandles(
    const strategy_engine::Asset& asset,
    core::Timestamp start,
    core::Timestamp end)
{
    auto logger = core::logging::getLogger();
    const std::string& key = asset.provider_id;
    const core::Timestamp first_day = core::utils::dateToTimestamp(core::utils::timestampToDate(start));
    const long long expected_days = core::utils::daysBetween(first_day, end) + 1;

    core::TimeSeries<core::Candle> candles = loadCached(key, first_day, end);
    if (static_cast<long long>(candles.size()) >= expected_days) {
        logger->debug("Cache hit: {} candles for {}.", candles.size(), key);
        return candles;
    }

    if (!upstream_) {
        if (candles.empty()) {
            throw core::DataLoadException("No cached candles for " + key + " between " +
                                          core::utils::timestampToDate(start) + " and " +
                                          core::utils::timestampToDate(end));
        }
        logger->warn("Cache covers {} of {} days for {}; serving what is stored.", candles.size(), expected_days, key);
        return candles;
    }

    logger->info("Cache covers {} of {} days for {}; fetching upstream.", candles.size(), expected_days, key);
    core::TimeSeries<core::Candle> fetched = upstream_->fetchDailyCandles(asset, start, end);
    if (!db_->saveCandles(fetched, key, kDailyInterval)) {
        // Still usable for this run, just not cached
        logger->warn("Could not cache {} candles for {}.", fetched.size(), key);
        return fetched;
    }
    return loadCached(key, first_day, end);
}

} // namespace data
