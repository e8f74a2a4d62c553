#include "indicator_cross_condition.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace strategy_engine {

IndicatorCrossCondition::IndicatorCrossCondition(std::string operand1,
                                                 CrossType cross_type,
                                                 std::string operand2)
    : operand1_(std::move(operand1)),
      cross_type_(cross_type),
      operand2_(std::move(operand2))
{
    const std::string& second = std::get<std::string>(operand2_);
    if (operand1_.empty() || second.empty()) {
        throw std::invalid_argument("Operand names cannot be empty for IndicatorCrossCondition.");
    }
    if (operand1_ == second) {
        throw std::invalid_argument("Cannot check cross condition for the same operand.");
    }
}

IndicatorCrossCondition::IndicatorCrossCondition(std::string operand1,
                                                 CrossType cross_type,
                                                 double level)
    : operand1_(std::move(operand1)),
      cross_type_(cross_type),
      operand2_(level)
{
    if (operand1_.empty()) {
        throw std::invalid_argument("Operand name cannot be empty for IndicatorCrossCondition.");
    }
}

std::optional<double> IndicatorCrossCondition::lookup(const MarketDataSnapshot& snapshot,
                                                      const std::string& operand,
                                                      bool previous) const {
    if (auto field = priceFieldFromString(operand)) {
        const core::Candle* candle = previous ? snapshot.previous_candle : snapshot.current_candle;
        if (!candle) return std::nullopt;
        return priceValue(*candle, *field);
    }
    const auto& values = previous ? snapshot.indicator_values_prev : snapshot.indicator_values;
    auto it = values.find(operand);
    if (it == values.end()) return std::nullopt;
    return it->second;
}

bool IndicatorCrossCondition::evaluate(const MarketDataSnapshot& snapshot) const {
    auto val1_now = lookup(snapshot, operand1_, false);
    auto val1_prev = lookup(snapshot, operand1_, true);

    std::optional<double> val2_now;
    std::optional<double> val2_prev;
    if (const double* level = std::get_if<double>(&operand2_)) {
        val2_now = *level;
        val2_prev = *level;
    } else {
        const std::string& operand2 = std::get<std::string>(operand2_);
        val2_now = lookup(snapshot, operand2, false);
        val2_prev = lookup(snapshot, operand2, true);
    }

    if (!val1_now || !val1_prev || !val2_now || !val2_prev) {
        core::logging::getLogger()->trace("IndicatorCrossCondition '{}': missing current or previous values.", describe());
        return false;
    }

    if (cross_type_ == CrossType::CrossesAbove) {
        // Was below or equal previously, AND is above now
        return (*val1_prev <= *val2_prev) && (*val1_now > *val2_now);
    }
    // Was above or equal previously, AND is below now
    return (*val1_prev >= *val2_prev) && (*val1_now < *val2_now);
}

std::string crossTypeToString(CrossType type) {
    return (type == CrossType::CrossesAbove) ? "CrossesAbove" : "CrossesBelow";
}

std::string IndicatorCrossCondition::describe() const {
    if (const double* level = std::get_if<double>(&operand2_)) {
        return fmt::format("{} {} {}", operand1_, crossTypeToString(cross_type_), *level);
    }
    return fmt::format("{} {} {}", operand1_, crossTypeToString(cross_type_), std::get<std::string>(operand2_));
}

} // namespace strategy_engine
