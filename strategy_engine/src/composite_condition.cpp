#include "composite_condition.hpp"
#include <sstream>
#include <stdexcept>

namespace strategy_engine {

CompositeCondition::CompositeCondition(LogicalOp op, std::vector<std::unique_ptr<ICondition>> conditions)
    : op_(op), conditions_(std::move(conditions))
{
    if (conditions_.empty()) {
        throw std::invalid_argument(std::string(op_ == LogicalOp::And ? "AND" : "OR") +
                                    " condition must receive at least one condition.");
    }
    for (const auto& condition : conditions_) {
        if (!condition) {
            throw std::invalid_argument("Composite condition received a null child condition.");
        }
    }
}

bool CompositeCondition::evaluate(const MarketDataSnapshot& snapshot) const {
    if (op_ == LogicalOp::And) {
        for (const auto& condition : conditions_) {
            if (!condition->evaluate(snapshot)) return false;
        }
        return true;
    }
    for (const auto& condition : conditions_) {
        if (condition->evaluate(snapshot)) return true;
    }
    return false;
}

std::string CompositeCondition::describe() const {
    const char* joiner = (op_ == LogicalOp::And) ? " AND " : " OR ";
    std::stringstream ss;
    ss << "(";
    for (size_t i = 0; i < conditions_.size(); ++i) {
        if (i > 0) ss << joiner;
        ss << conditions_[i]->describe();
    }
    ss << ")";
    return ss.str();
}

} // namespace strategy_engine
