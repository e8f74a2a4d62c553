#pragma once

#include <optional>
#include <string>
#include <vector>

namespace strategy_engine {

    struct Asset {
        std::string name;         // "Bitcoin"
        std::string symbol;       // "BTC"
        std::string provider_id;  // CoinGecko coin id, "bitcoin"
    };

    // Assets the pipeline can price. Lookup is case-insensitive on the
    // display name, the ticker symbol or the provider id. Group aliases
    // ("DeFi", "Layer1") resolve to a representative token.
    class AssetCatalog {
    public:
        static std::optional<Asset> find(const std::string& category);
        static const std::vector<Asset>& all();
    };

} // namespace strategy_engine
