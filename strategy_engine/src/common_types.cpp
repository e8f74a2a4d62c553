#include "common_types.hpp"
#include "utils.hpp"
#include <cmath>
#include <stdexcept>

namespace strategy_engine {

    double priceValue(const core::Candle& candle, PriceField field) {
        switch (field) {
            case PriceField::Open:  return candle.open;
            case PriceField::High:  return candle.high;
            case PriceField::Low:   return candle.low;
            case PriceField::Close: return candle.close;
        }
        return candle.close;
    }

    bool compareValues(double lhs, ComparisonOp op, double rhs) {
        switch (op) {
            case ComparisonOp::GT:  return lhs > rhs;
            case ComparisonOp::LT:  return lhs < rhs;
            case ComparisonOp::GTE: return lhs >= rhs;
            case ComparisonOp::LTE: return lhs <= rhs;
            case ComparisonOp::EQ:
                // Tolerance for floating point equality
                return std::fabs(lhs - rhs) < 1e-9;
        }
        return false;
    }

    std::string priceFieldToString(PriceField field) {
        switch (field) {
            case PriceField::Open:  return "Open";
            case PriceField::High:  return "High";
            case PriceField::Low:   return "Low";
            case PriceField::Close: return "Close";
        }
        return "InvalidField";
    }

    std::string comparisonOpToString(ComparisonOp op) {
        switch (op) {
            case ComparisonOp::GT:  return ">";
            case ComparisonOp::LT:  return "<";
            case ComparisonOp::GTE: return ">=";
            case ComparisonOp::LTE: return "<=";
            case ComparisonOp::EQ:  return "==";
        }
        return "InvalidOp";
    }

    std::string sizingMethodToString(SizingMethod method) {
        return method == SizingMethod::CurrentEquity ? "current_equity" : "initial_capital";
    }

    std::optional<PriceField> priceFieldFromString(const std::string& field_str) {
        std::string lower_str = core::utils::toLower(field_str);
        if (lower_str == "open") return PriceField::Open;
        if (lower_str == "high") return PriceField::High;
        if (lower_str == "low") return PriceField::Low;
        if (lower_str == "close" || lower_str == "price") return PriceField::Close;
        return std::nullopt;
    }

    ComparisonOp comparisonOpFromString(const std::string& op_str) {
        if (op_str == ">" || op_str == "GT") return ComparisonOp::GT;
        if (op_str == "<" || op_str == "LT") return ComparisonOp::LT;
        if (op_str == ">=" || op_str == "GTE") return ComparisonOp::GTE;
        if (op_str == "<=" || op_str == "LTE") return ComparisonOp::LTE;
        if (op_str == "==" || op_str == "EQ") return ComparisonOp::EQ;
        throw std::invalid_argument("Unknown comparison operator string: " + op_str);
    }

    SizingMethod sizingMethodFromString(const std::string& method_str) {
        std::string lower_str = core::utils::toLower(method_str);
        if (lower_str == "initial_capital" || lower_str == "fixed") return SizingMethod::InitialCapital;
        if (lower_str == "current_equity" || lower_str == "compounding") return SizingMethod::CurrentEquity;
        throw std::invalid_argument("Unknown position sizing mode: " + method_str);
    }

} // namespace strategy_engine
