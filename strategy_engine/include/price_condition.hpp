#pragma once

#include "interfaces.hpp"
#include "common_types.hpp"
#include <string>
#include <variant>

namespace strategy_engine {

    // A price field of the current bar against a fixed level or another
    // field of the same bar: "Close > 20000", "Close < Open".
    class PriceCondition : public ICondition {
    public:
        PriceCondition(PriceField field, ComparisonOp op, double level);
        PriceCondition(PriceField field, ComparisonOp op, PriceField other_field);

        bool evaluate(const MarketDataSnapshot& snapshot) const override;
        std::string describe() const override;

    private:
        PriceField field_;
        ComparisonOp op_;
        std::variant<double, PriceField> rhs_;
    };

} // namespace strategy_engine
