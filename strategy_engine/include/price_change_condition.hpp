#pragma once

#include "interfaces.hpp"
#include "common_types.hpp"
#include <string>

namespace strategy_engine {

    // Bar-over-bar close change in percent compared against a threshold,
    // e.g. PriceChangeCondition(ComparisonOp::LTE, -5.0) -> "a drop of 5% or more"
    class PriceChangeCondition : public ICondition {
    public:
        PriceChangeCondition(ComparisonOp op, double change_pct);

        virtual ~PriceChangeCondition() override = default;

        bool evaluate(const MarketDataSnapshot& snapshot) const override;
        std::string describe() const override;

    private:
        ComparisonOp op_;
        double change_pct_;
    };

} // namespace strategy_engine
