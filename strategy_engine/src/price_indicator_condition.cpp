#include "price_indicator_condition.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace strategy_engine {

PriceIndicatorCondition::PriceIndicatorCondition(PriceField price_field, ComparisonOp op,
                                                 std::string indicator_name, double offset_pct)
    : price_field_(price_field), op_(op), indicator_name_(std::move(indicator_name)), offset_pct_(offset_pct)
{
    if (indicator_name_.empty()) {
        throw std::invalid_argument("Indicator name cannot be empty for PriceIndicatorCondition.");
    }
    if (offset_pct_ <= -100.0) {
        throw std::invalid_argument("PriceIndicatorCondition offset must be greater than -100%.");
    }
}

bool PriceIndicatorCondition::evaluate(const MarketDataSnapshot& snapshot) const {
    if (!snapshot.current_candle) {
        return false;
    }
    auto it = snapshot.indicator_values.find(indicator_name_);
    if (it == snapshot.indicator_values.end()) {
        core::logging::getLogger()->trace("PriceIndicatorCondition evaluate failed: indicator '{}' not found in snapshot.",
                                          indicator_name_);
        return false;
    }

    double price = priceValue(*snapshot.current_candle, price_field_);
    double reference = it->second * (1.0 + offset_pct_ / 100.0);
    return compareValues(price, op_, reference);
}

std::string PriceIndicatorCondition::describe() const {
    if (offset_pct_ == 0.0) {
        return fmt::format("{} {} {}", priceFieldToString(price_field_), comparisonOpToString(op_), indicator_name_);
    }
    return fmt::format("{} {} {} {:+}%", priceFieldToString(price_field_), comparisonOpToString(op_),
                       indicator_name_, offset_pct_);
}

} // namespace strategy_engine
