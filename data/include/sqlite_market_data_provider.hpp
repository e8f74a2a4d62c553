#pragma once

#include <memory>
#include <string>

#include "database_manager.hpp"
#include "market_data_provider.hpp"

namespace data {

// Serves candles from the historical_candles table. With an upstream provider
// it works as a read-through cache: a range the table does not fully cover is
// fetched upstream, stored, and served from the table.
class SqliteMarketDataProvider : public IMarketDataProvider {
public:
    static constexpr const char* kDailyInterval = "1day";

    SqliteMarketDataProvider(std::shared_ptr<DatabaseManager> db,
                             std::shared_ptr<IMarketDataProvider> upstream = nullptr);

    core::TimeSeries<core::Candle> fetchDailyCandles(
        const strategy_engine::Asset& asset,
        core::Timestamp start,
        core::Timestamp end) override;

private:
    std::shared_ptr<DatabaseManager> db_;
    std::shared_ptr<IMarketDataProvider> upstream_;

    core::TimeSeries<core::Candle> loadCached(const std::string& key, core::Timestamp start, core::Timestamp end);
};

} // namespace data
