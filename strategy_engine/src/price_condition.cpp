#include "price_condition.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>

namespace strategy_engine {

PriceCondition::PriceCondition(PriceField field, ComparisonOp op, double level)
    : field_(field), op_(op), rhs_(level)
{}

PriceCondition::PriceCondition(PriceField field, ComparisonOp op, PriceField other_field)
    : field_(field), op_(op), rhs_(other_field)
{}

bool PriceCondition::evaluate(const MarketDataSnapshot& snapshot) const {
    if (!snapshot.current_candle) {
        core::logging::getLogger()->trace("{}: no current candle", describe());
        return false;
    }
    const core::Candle& bar = *snapshot.current_candle;
    const double rhs = std::holds_alternative<double>(rhs_) ? std::get<double>(rhs_)
                                                            : priceValue(bar, std::get<PriceField>(rhs_));
    return compareValues(priceValue(bar, field_), op_, rhs);
}

std::string PriceCondition::describe() const {
    const std::string rhs = std::holds_alternative<double>(rhs_) ? fmt::format("{}", std::get<double>(rhs_))
                                                                  : priceFieldToString(std::get<PriceField>(rhs_));
    return fmt::format("{} {} {}", priceFieldToString(field_), comparisonOpToString(op_), rhs);
}

} // namespace strategy_engine
