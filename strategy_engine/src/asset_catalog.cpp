#include "asset_catalog.hpp"
#include "utils.hpp"

#include <map>

namespace strategy_engine {

    namespace {

        const std::vector<Asset> kTopTokens = {
            {"Bitcoin", "BTC", "bitcoin"},
            {"Ethereum", "ETH", "ethereum"},
            {"Tether", "USDT", "tether"},
            {"BNB", "BNB", "binancecoin"},
            {"Solana", "SOL", "solana"},
            {"XRP", "XRP", "ripple"},
            {"Cardano", "ADA", "cardano"},
            {"Dogecoin", "DOGE", "dogecoin"},
            {"Avalanche", "AVAX", "avalanche-2"},
            {"Polkadot", "DOT", "polkadot"},
            {"TRON", "TRX", "tron"},
            {"Chainlink", "LINK", "chainlink"},
            {"Polygon", "MATIC", "matic-network"},
            {"Litecoin", "LTC", "litecoin"},
            {"Shiba Inu", "SHIB", "shiba-inu"},
            {"Uniswap", "UNI", "uniswap"},
            {"Dai", "DAI", "dai"},
            {"Wrapped Bitcoin", "WBTC", "wrapped-bitcoin"},
            {"Cosmos", "ATOM", "cosmos"},
            {"Ethereum Classic", "ETC", "ethereum-classic"},
        };

        // Group name -> ticker of the representative token
        const std::map<std::string, std::string> kGroupAliases = {
            {"defi", "UNI"},
            {"layer1", "ETH"},
        };

    } // namespace

    const std::vector<Asset>& AssetCatalog::all() {
        return kTopTokens;
    }

    std::optional<Asset> AssetCatalog::find(const std::string& category) {
        std::string key = core::utils::toLower(core::utils::trim(category));
        if (key.empty()) return std::nullopt;

        auto alias = kGroupAliases.find(key);
        if (alias != kGroupAliases.end()) {
            key = core::utils::toLower(alias->second);
        }
        for (const auto& asset : kTopTokens) {
            if (core::utils::toLower(asset.symbol) == key ||
                core::utils::toLower(asset.name) == key ||
                asset.provider_id == key) {
                return asset;
            }
        }
        return std::nullopt;
    }

} // namespace strategy_engine
