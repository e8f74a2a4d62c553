#pragma once

#include <map>
#include <string>
#include <vector>
#include <memory>
#include <nlohmann/json.hpp>

#include "interfaces.hpp"

namespace strategy_engine {

    using json = nlohmann::json;

    // Builds condition trees from their JSON form. Supported "type" values:
    //   Price          {field1, op, value | field2}
    //   Indicator      {indicator1, op, value | indicator2}
    //   PriceIndicator {field, op, indicator, offset_pct?}
    //   CrossesAbove / CrossesBelow {operand1, operand2 | value}
    //   PriceChange    {op, value}                     (percent, bar over bar)
    //   AND / OR       {conditions: [...]}
    class ConditionFactory {
    public:
        // Throws std::invalid_argument on any malformed node
        static std::unique_ptr<ICondition> parseCondition(const json& condition_config);

        static std::unique_ptr<IRule> createRule(const std::string& rule_name,
                                                 const json& condition_config,
                                                 core::SignalAction action);

        // Indicator outputs referenced by a condition tree, first-appearance order,
        // without duplicates. Price fields ("Close") are not indicators and are skipped.
        static void collectIndicatorNames(const json& condition_config, std::vector<std::string>& names);

        // Rewrites indicator references in place (old name -> new name); other strings are untouched
        static void renameIndicators(json& condition_config, const std::map<std::string, std::string>& renames);
    };

} // namespace strategy_engine
