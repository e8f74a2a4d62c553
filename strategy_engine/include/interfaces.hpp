#pragma once

#include <vector>
#include <string>
#include <memory>
#include <map>

#include "datatypes.hpp"

namespace strategy_engine {

    // Market data for a single bar, plus the bar before it for cross/change checks.
    // Indicator values are keyed by output name (e.g. "SMA(10)", "MACD(12,26,9).hist");
    // a missing key means the indicator is still warming up.
    struct MarketDataSnapshot {
        core::Timestamp current_time;
        const core::Candle* current_candle = nullptr;
        const core::Candle* previous_candle = nullptr;
        std::map<std::string, double> indicator_values;
        std::map<std::string, double> indicator_values_prev;
    };

    // --- Condition Interface ---
    // A single logical condition (e.g., price > SMA, RSI < 30)
    class ICondition {
    public:
        virtual ~ICondition() = default;
        virtual bool evaluate(const MarketDataSnapshot& snapshot) const = 0;
        virtual std::string describe() const = 0;
    };

    // --- Rule Interface ---
    // An entry or exit rule built from a condition tree
    class IRule {
        public:
            virtual ~IRule() = default;
            // Returns the rule's action if triggered, None otherwise
            virtual core::SignalAction evaluate(const MarketDataSnapshot& snapshot) const = 0;
            virtual std::string describe() const = 0;
            virtual std::string getName() const = 0;
    };

} // namespace strategy_engine
