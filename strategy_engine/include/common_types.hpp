#pragma once
#include "datatypes.hpp"
#include <optional>
#include <string>

namespace strategy_engine {

    // Which candle price field to use
    enum class PriceField {
        Open,
        High,
        Low,
        Close
    };

    enum class ComparisonOp {
        GT,  // Greater Than (>)
        LT,  // Less Than (<)
        GTE, // Greater Than or Equal To (>=)
        LTE, // Less Than or Equal To (<=)
        EQ   // Equal To (==)
    };

    // How the engine sizes a new long position
    enum class SizingMethod {
        InitialCapital, // initial_capital x exposure, capped at available cash
        CurrentEquity   // cash x exposure (compounds gains and losses)
    };

    // --- Shared helpers for the condition classes ---
    double priceValue(const core::Candle& candle, PriceField field);
    bool compareValues(double lhs, ComparisonOp op, double rhs);

    std::string priceFieldToString(PriceField field);
    std::string comparisonOpToString(ComparisonOp op);
    std::string sizingMethodToString(SizingMethod method);

    // Case-insensitive; nullopt when the text is not a price field
    std::optional<PriceField> priceFieldFromString(const std::string& field_str);
    // Accepts symbols (">") and names ("GT"); throws std::invalid_argument
    ComparisonOp comparisonOpFromString(const std::string& op_str);
    // Throws std::invalid_argument
    SizingMethod sizingMethodFromString(const std::string& method_str);

} // namespace strategy_engine
