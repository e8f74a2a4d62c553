#include "coingecko_client.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp"

#include <cpr/cpr.h>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <chrono>
#include <map>
#include <utility>

namespace data {

namespace {

    long long toUnixSeconds(core::Timestamp ts)
    {
        return std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
    }

} // namespace

CoinGeckoClient::CoinGeckoClient(std::string base_url, std::string api_key, long timeout_ms)
    : base_url_(std::move(base_url)),
      api_key_(std::move(api_key)),
      timeout_ms_(timeout_ms)
{
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
    core::logging::getLogger()->debug("CoinGeckoClient created for {} ({}).", base_url_,
                                      api_key_.empty() ? "public tier" : "api key set");
}

core::TimeSeries<core::Candle> CoinGeckoClient::fetchDailyCandles(
    const strategy_engine::Asset& asset,
    core::Timestamp start,
    core::Timestamp end)
{
    auto logger = core::logging::getLogger();
    if (asset.provider_id.empty()) {
        throw core::DataLoadException("Asset '" + asset.symbol + "' has no CoinGecko id");
    }

    std::string full_url = fmt::format("{}/coins/{}/market_chart/range",
                                       base_url_, cpr::util::urlEncode(asset.provider_id));
    // The end date is inclusive: ask for everything up to the last second of that day
    const long long from = toUnixSeconds(start);
    const long long to = toUnixSeconds(end) + 24 * 3600 - 1;
    logger->info("Requesting CoinGecko prices for {} ({} .. {})", asset.provider_id,
                 core::utils::timestampToDate(start), core::utils::timestampToDate(end));

    cpr::Header headers = {{"Accept", "application/json"}};
    if (!api_key_.empty()) {
        headers["x-cg-pro-api-key"] = api_key_;
    }
    cpr::Parameters parameters = {
        {"vs_currency", "usd"},
        {"from", std::to_string(from)},
        {"to", std::to_string(to)}};

    cpr::Response response = cpr::Get(cpr::Url{full_url}, headers, parameters, cpr::Timeout{timeout_ms_});
    logger->debug("CoinGecko response status: {}, body size: {}", response.status_code, response.text.length());

    if (response.error) {
        throw core::ApiRequestException(fmt::format("CoinGecko request failed (transport error {}): {}",
                                                    static_cast<int>(response.error.code), response.error.message));
    }
    if (response.status_code != 200) {
        if (response.status_code == 429) {
            logger->warn("CoinGecko rate limit hit for {}.", asset.provider_id);
        }
        throw core::ApiRequestException(fmt::format("CoinGecko returned HTTP {} for {}: {}",
                                                    response.status_code, asset.provider_id,
                                                    response.text.substr(0, 500)));
    }

    nlohmann::json body;
    try {
        body = nlohmann::json::parse(response.text);
    } catch (const nlohmann::json::parse_error& e) {
        throw core::DataLoadException(std::string("Unparsable CoinGecko response: ") + e.what());
    }

    core::TimeSeries<core::Candle> all = resampleToDaily(body);

    // Drop partial buckets outside the requested days
    core::TimeSeries<core::Candle> candles;
    const core::Timestamp first_day = core::utils::dateToTimestamp(core::utils::timestampToDate(start));
    for (const auto& candle : all) {
        if (candle.timestamp >= first_day && candle.timestamp <= end) {
            candles.push_back(candle);
        }
    }
    if (candles.empty()) {
        throw core::DataLoadException("CoinGecko returned no prices for " + asset.provider_id + " in the requested range");
    }
    logger->info("Received {} daily candles for {} from CoinGecko.", candles.size(), asset.provider_id);
    return candles;
}

core::TimeSeries<core::Candle> CoinGeckoClient::resampleToDaily(const nlohmann::json& market_chart)
{
    if (!market_chart.is_object() || !market_chart.contains("prices") || !market_chart["prices"].is_array()) {
        throw core::DataLoadException("Unexpected CoinGecko JSON structure: 'prices' array not found");
    }

    // Day start (unix seconds) -> candle; std::map keeps days ordered
    std::map<long long, core::Candle> days;
    try {
        for (const auto& point : market_chart["prices"]) {
            if (!point.is_array() || point.size() < 2 || point[1].is_null()) {
                continue;
            }
            const long long seconds = static_cast<long long>(point[0].get<double>() / 1000.0);
            const long long day = seconds - (seconds % 86400);
            const double price = point[1].get<double>();

            auto it = days.find(day);
            if (it == days.end()) {
                core::Candle candle;
                candle.timestamp = core::Timestamp(std::chrono::seconds(day));
                candle.open = candle.high = candle.low = candle.close = price;
                days.emplace(day, candle);
            } else {
                core::Candle& candle = it->second;
                candle.high = std::max(candle.high, price);
                candle.low = std::min(candle.low, price);
                candle.close = price;  // Points arrive in time order; last one wins
            }
        }

        if (market_chart.contains("total_volumes") && market_chart["total_volumes"].is_array()) {
            for (const auto& point : market_chart["total_volumes"]) {
                if (!point.is_array() || point.size() < 2 || point[1].is_null()) {
                    continue;
                }
                const long long seconds = static_cast<long long>(point[0].get<double>() / 1000.0);
                auto it = days.find(seconds - (seconds % 86400));
                if (it != days.end()) {
                    it->second.volume = point[1].get<double>();  // 24h rolling volume
                }
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw core::DataLoadException(std::string("Malformed CoinGecko price point: ") + e.what());
    }

    core::TimeSeries<core::Candle> candles;
    candles.reserve(days.size());
    for (const auto& entry : days) {
        candles.push_back(entry.second);
    }
    return candles;
}

} // namespace data
