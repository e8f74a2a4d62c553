#pragma once

#include "interfaces.hpp"
#include <string>
#include <memory>

namespace strategy_engine {

    // --- Rule Class ---
    // An entry or exit rule: a condition tree plus the action returned when it holds.
    class Rule : public IRule {
    public:
        Rule(std::string rule_name,
             std::unique_ptr<ICondition> condition,
             core::SignalAction action_on_true);

        virtual ~Rule() override = default;

        core::SignalAction evaluate(const MarketDataSnapshot& snapshot) const override;
        std::string describe() const override;

        std::string getName() const override { return name_; }

    private:
        std::string name_;
        std::unique_ptr<ICondition> condition_;
        core::SignalAction action_;
    };

    std::string signalActionToString(core::SignalAction action);

} // namespace strategy_engine
