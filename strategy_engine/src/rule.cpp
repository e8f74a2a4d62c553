#include "rule.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace strategy_engine {

Rule::Rule(std::string rule_name,
           std::unique_ptr<ICondition> condition,
           core::SignalAction action_on_true)
    : name_(std::move(rule_name)),
      condition_(std::move(condition)),
      action_(action_on_true)
{
    if (name_.empty()) {
         throw std::invalid_argument("Rule name cannot be empty.");
    }
    if (!condition_) {
         throw std::invalid_argument(fmt::format("Condition cannot be null for Rule '{}'.", name_));
    }
    if (action_ == core::SignalAction::None) {
          throw std::invalid_argument(fmt::format("Action cannot be 'None' for Rule '{}'.", name_));
    }
}

core::SignalAction Rule::evaluate(const MarketDataSnapshot& snapshot) const {
    bool condition_result = condition_->evaluate(snapshot);

    core::logging::getLogger()->trace("Rule '{}' evaluated condition '{}' -> {}",
                                      name_, condition_->describe(), condition_result);

    return condition_result ? action_ : core::SignalAction::None;
}

std::string signalActionToString(core::SignalAction action) {
     switch (action) {
         case core::SignalAction::None:      return "None";
         case core::SignalAction::EnterLong: return "EnterLong";
         case core::SignalAction::ExitLong:  return "ExitLong";
     }
     return "UnknownAction";
}

std::string Rule::describe() const {
    return fmt::format("Rule('{}'): IF ({}) THEN {}",
                       name_, condition_->describe(), signalActionToString(action_));
}

} // namespace strategy_engine
