#include "price_change_condition.hpp"
#include <spdlog/fmt/fmt.h>

namespace strategy_engine {

PriceChangeCondition::PriceChangeCondition(ComparisonOp op, double change_pct)
    : op_(op), change_pct_(change_pct)
{}

bool PriceChangeCondition::evaluate(const MarketDataSnapshot& snapshot) const {
    if (!snapshot.current_candle || !snapshot.previous_candle || snapshot.previous_candle->close <= 0.0) {
        return false;
    }
    double change = (snapshot.current_candle->close / snapshot.previous_candle->close - 1.0) * 100.0;
    return compareValues(change, op_, change_pct_);
}

std::string PriceChangeCondition::describe() const {
    return fmt::format("PriceChange% {} {}", comparisonOpToString(op_), change_pct_);
}

} // namespace strategy_engine
