#include "indicator_condition.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace strategy_engine {

namespace {

    std::optional<double> lookup(const std::map<std::string, double>& values, const std::string& name) {
        auto it = values.find(name);
        if (it == values.end()) return std::nullopt;
        return it->second;
    }

} // namespace

IndicatorCondition::IndicatorCondition(const std::string& indicator, ComparisonOp op, double level)
    : indicator_(indicator), op_(op), rhs_(level)
{
    if (indicator_.empty()) {
        throw std::invalid_argument("IndicatorCondition needs an indicator name");
    }
}

IndicatorCondition::IndicatorCondition(const std::string& indicator, ComparisonOp op, const std::string& other_indicator)
    : indicator_(indicator), op_(op), rhs_(other_indicator)
{
    if (indicator_.empty() || other_indicator.empty()) {
        throw std::invalid_argument("IndicatorCondition needs two indicator names");
    }
    if (indicator_ == other_indicator) {
        throw std::invalid_argument(fmt::format("IndicatorCondition compares {} with itself", indicator_));
    }
}

std::optional<double> IndicatorCondition::rhsValue(const MarketDataSnapshot& snapshot) const {
    if (const double* level = std::get_if<double>(&rhs_)) {
        return *level;
    }
    return lookup(snapshot.indicator_values, std::get<std::string>(rhs_));
}

bool IndicatorCondition::evaluate(const MarketDataSnapshot& snapshot) const {
    auto lhs = lookup(snapshot.indicator_values, indicator_);
    auto rhs = rhsValue(snapshot);
    if (!lhs || !rhs) {
        core::logging::getLogger()->trace("{}: warming up", describe());
        return false;
    }
    return compareValues(*lhs, op_, *rhs);
}

std::string IndicatorCondition::describe() const {
    const std::string rhs = std::holds_alternative<double>(rhs_) ? fmt::format("{}", std::get<double>(rhs_))
                                                                  : std::get<std::string>(rhs_);
    return fmt::format("{} {} {}", indicator_, comparisonOpToString(op_), rhs);
}

} // namespace strategy_engine
