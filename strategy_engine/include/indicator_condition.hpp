#pragma once

#include "interfaces.hpp"
#include "common_types.hpp"
#include <optional>
#include <string>
#include <variant>

namespace strategy_engine {

    // "<indicator> <op> <level>" or "<indicator> <op> <indicator>" on the current bar.
    // False while either side is still warming up.
    class IndicatorCondition : public ICondition {
    public:
        using Operand = std::variant<double, std::string>;

        // RSI(14) < 30
        IndicatorCondition(const std::string& indicator, ComparisonOp op, double level);
        // SMA(10) > SMA(30)
        IndicatorCondition(const std::string& indicator, ComparisonOp op, const std::string& other_indicator);

        bool evaluate(const MarketDataSnapshot& snapshot) const override;
        std::string describe() const override;

    private:
        std::string indicator_;
        ComparisonOp op_;
        Operand rhs_;

        std::optional<double> rhsValue(const MarketDataSnapshot& snapshot) const;
    };

} // namespace strategy_engine
