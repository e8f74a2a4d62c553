#pragma once

#include "datatypes.hpp"
#include "asset_catalog.hpp"

namespace data {

// Source of daily price history. Candles come back in ascending order, one per
// day, covering [start, end] as far as the source has data.
// Throws DataLoadException or ApiRequestException on failure.
class IMarketDataProvider {
public:
    virtual ~IMarketDataProvider() = default;

    virtual core::TimeSeries<core::Candle> fetchDailyCandles(
        const strategy_engine::Asset& asset,
        core::Timestamp start,
        core::Timestamp end) = 0;
};

} // namespace data
