#pragma once

#include "interfaces.hpp"
#include <vector>
#include <memory>
#include <string>

namespace strategy_engine {

    enum class LogicalOp {
        And, // every child must hold
        Or   // at least one child must hold
    };

    // --- CompositeCondition Class ---
    // Combines child conditions with AND / OR. Children are evaluated in order
    // and evaluation short-circuits.
    class CompositeCondition : public ICondition {
    public:
        CompositeCondition(LogicalOp op, std::vector<std::unique_ptr<ICondition>> conditions);

        virtual ~CompositeCondition() override = default;

        bool evaluate(const MarketDataSnapshot& snapshot) const override;
        std::string describe() const override;

        LogicalOp getOp() const { return op_; }
        size_t size() const { return conditions_.size(); }

    private:
        LogicalOp op_;
        std::vector<std::unique_ptr<ICondition>> conditions_;
    };

} // namespace strategy_engine
