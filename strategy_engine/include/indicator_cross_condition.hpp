#pragma once

#include "interfaces.hpp"
#include "common_types.hpp"
#include <optional>
#include <string>
#include <variant>

namespace strategy_engine {

    enum class CrossType {
        CrossesAbove,
        CrossesBelow
    };

    // --- IndicatorCrossCondition Class ---
    // True on the bar where operand1 crosses above/below operand2.
    // Operands are indicator output names or price fields ("Close"); operand2 may
    // also be a fixed level (e.g. RSI(14) crossing below 30).
    class IndicatorCrossCondition : public ICondition {
    public:
        // e.g., IndicatorCrossCondition("SMA(10)", CrossType::CrossesAbove, "SMA(30)")
        IndicatorCrossCondition(std::string operand1,
                                CrossType cross_type,
                                std::string operand2);

        // e.g., IndicatorCrossCondition("RSI(14)", CrossType::CrossesBelow, 30.0)
        IndicatorCrossCondition(std::string operand1,
                                CrossType cross_type,
                                double level);

        virtual ~IndicatorCrossCondition() override = default;

        bool evaluate(const MarketDataSnapshot& snapshot) const override;
        std::string describe() const override;

    private:
        std::string operand1_;
        CrossType cross_type_;
        std::variant<double, std::string> operand2_;

        // Value of a named operand on the current or previous bar
        std::optional<double> lookup(const MarketDataSnapshot& snapshot, const std::string& operand,
                                     bool previous) const;
    };

    std::string crossTypeToString(CrossType type);

} // namespace strategy_engine
