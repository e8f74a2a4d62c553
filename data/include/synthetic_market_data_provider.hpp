#pragma once

#include "market_data_provider.hpp"
#include <cstdint>

namespace data {

// Deterministic geometric random walk for offline runs and tests.
// The same symbol and range always produce the same candles.
class SyntheticMarketDataProvider : public IMarketDataProvider {
public:
    static constexpr double kStartPrice = 30000.0;
    static constexpr double kDailyDrift = 0.001;
    static constexpr double kDailyVolatility = 0.03;

    SyntheticMarketDataProvider() = default;
    // Fixed seed instead of one derived from the symbol
    explicit SyntheticMarketDataProvider(std::uint64_t seed);

    core::TimeSeries<core::Candle> fetchDailyCandles(
        const strategy_engine::Asset& asset,
        core::Timestamp start,
        core::Timestamp end) override;

private:
    bool fixed_seed_ = false;
    std::uint64_t seed_ = 0;
};

} // namespace data
