#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "market_data_provider.hpp"

namespace data {

// Daily price history from the CoinGecko REST API
// (/coins/{id}/market_chart/range, priced in USD).
class CoinGeckoClient : public IMarketDataProvider {
public:
    // An empty api_key uses the public tier; otherwise the key is sent
    // in the x-cg-pro-api-key header.
    CoinGeckoClient(std::string base_url,
                    std::string api_key = "",
                    long timeout_ms = 30000);

    core::TimeSeries<core::Candle> fetchDailyCandles(
        const strategy_engine::Asset& asset,
        core::Timestamp start,
        core::Timestamp end) override;

    // Buckets the "prices" (and optional "total_volumes") arrays of a
    // market_chart response into UTC days. CoinGecko returns hourly or
    // 5-minute points for short ranges. Throws DataLoadException.
    static core::TimeSeries<core::Candle> resampleToDaily(const nlohmann::json& market_chart);

private:
    std::string base_url_;
    std::string api_key_;
    long timeout_ms_;
};

} // namespace data
