#pragma once

#include "interfaces.hpp"
#include "common_types.hpp"
#include <string>

namespace strategy_engine {

    // --- PriceIndicatorCondition Class ---
    // Compares a candle price field against a named indicator's value, optionally
    // shifted by a percentage: "Close <= SMA(20) * (1 + offset_pct / 100)".
    class PriceIndicatorCondition : public ICondition {
    public:
        PriceIndicatorCondition(PriceField price_field, ComparisonOp op, std::string indicator_name,
                                double offset_pct = 0.0);

        virtual ~PriceIndicatorCondition() override = default;

        bool evaluate(const MarketDataSnapshot& snapshot) const override;
        std::string describe() const override;

    private:
        PriceField price_field_;
        ComparisonOp op_;
        std::string indicator_name_;
        double offset_pct_;
    };

} // namespace strategy_engine
