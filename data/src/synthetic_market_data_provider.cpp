#include "synthetic_market_data_provider.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <random>

namespace data {

SyntheticMarketDataProvider::SyntheticMarketDataProvider(std::uint64_t seed)
    : fixed_seed_(true), seed_(seed)
{
}

core::TimeSeries<core::Candle> SyntheticMarketDataProvider::fetchDailyCandles(
    const strategy_engine::Asset& asset,
    core::Timestamp start,
    core::Timestamp end)
{
    if (end < start) {
        throw core::DataLoadException("Synthetic data range ends before it starts: " +
                                      core::utils::timestampToString(start) + " > " +
                                      core::utils::timestampToString(end));
    }

    const std::uint64_t seed = fixed_seed_ ? seed_ : core::utils::fnv1a(asset.symbol);
    std::mt19937_64 rng(seed);
    std::normal_distribution<double> daily_return(kDailyDrift, kDailyVolatility);
    std::uniform_real_distribution<double> wick(0.0, 0.01);

    // Bars are anchored at midnight UTC of the start date
    const core::Timestamp first_day = core::utils::dateToTimestamp(core::utils::timestampToDate(start));
    const long long days = core::utils::daysBetween(first_day, end) + 1;

    core::TimeSeries<core::Candle> candles;
    candles.reserve(static_cast<size_t>(days));

    double log_price = std::log(kStartPrice);
    double previous_close = kStartPrice;
    for (long long day = 0; day < days; ++day) {
        log_price += daily_return(rng);
        core::Candle candle;
        candle.timestamp = first_day + std::chrono::hours(24 * day);
        candle.open = previous_close;
        candle.close = std::exp(log_price);
        candle.high = std::max(candle.open, candle.close) * (1.0 + wick(rng));
        candle.low = std::min(candle.open, candle.close) * (1.0 - wick(rng));
        candle.volume = 1000.0 + 500.0 * wick(rng) * 100.0;
        previous_close = candle.close;
        candles.push_back(candle);
    }

    core::logging::getLogger()->debug("Generated {} synthetic daily candles for {} (seed {}).",
                                      candles.size(), asset.symbol, seed);
    return candles;
}

} // namespace data
