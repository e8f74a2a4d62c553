#include "condition_factory.hpp"
#include "rule.hpp"
#include "price_condition.hpp"
#include "indicator_condition.hpp"
#include "price_indicator_condition.hpp"
#include "indicator_cross_condition.hpp"
#include "price_change_condition.hpp"
#include "composite_condition.hpp"
#include "common_types.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <stdexcept>

namespace strategy_engine {

    namespace {

        const json& requireString(const json& config, const char* key, const std::string& type) {
            if (!config.contains(key) || !config[key].is_string()) {
                throw std::invalid_argument(fmt::format("{} condition requires '{}' (string).", type, key));
            }
            return config[key];
        }

        PriceField requirePriceField(const std::string& field_str) {
            auto field = priceFieldFromString(field_str);
            if (!field) {
                throw std::invalid_argument("Unknown price field string: " + field_str);
            }
            return *field;
        }

        // Cross operands keep the legacy indicator1/indicator2 spelling as an alias
        std::string crossOperand(const json& config, const char* key, const char* legacy_key) {
            if (config.contains(key) && config[key].is_string()) return config[key].get<std::string>();
            if (config.contains(legacy_key) && config[legacy_key].is_string()) return config[legacy_key].get<std::string>();
            return "";
        }

        void addUnique(std::vector<std::string>& names, const std::string& name) {
            if (name.empty() || priceFieldFromString(name)) return;
            if (std::find(names.begin(), names.end(), name) == names.end()) {
                names.push_back(name);
            }
        }

    } // namespace

    std::unique_ptr<ICondition> ConditionFactory::parseCondition(const json& config) {
        if (!config.is_object() || !config.contains("type") || !config["type"].is_string()) {
            throw std::invalid_argument("Condition config must be an object with a 'type' (string).");
        }
        std::string type = config["type"].get<std::string>();
        core::logging::getLogger()->trace("Parsing condition of type: {}", type);

        try {
            if (type == "Price") {
                PriceField field1 = requirePriceField(requireString(config, "field1", type).get<std::string>());
                ComparisonOp op = comparisonOpFromString(requireString(config, "op", type).get<std::string>());
                if (config.contains("value") && config["value"].is_number()) {
                    return std::make_unique<PriceCondition>(field1, op, config["value"].get<double>());
                } else if (config.contains("field2") && config["field2"].is_string()) {
                    return std::make_unique<PriceCondition>(field1, op, requirePriceField(config["field2"].get<std::string>()));
                }
                throw std::invalid_argument("Price condition requires 'value' (number) or 'field2' (string).");

            } else if (type == "Indicator") {
                std::string indicator1 = requireString(config, "indicator1", type).get<std::string>();
                ComparisonOp op = comparisonOpFromString(requireString(config, "op", type).get<std::string>());
                if (config.contains("value") && config["value"].is_number()) {
                    return std::make_unique<IndicatorCondition>(indicator1, op, config["value"].get<double>());
                } else if (config.contains("indicator2") && config["indicator2"].is_string()) {
                    return std::make_unique<IndicatorCondition>(indicator1, op, config["indicator2"].get<std::string>());
                }
                throw std::invalid_argument("Indicator condition requires 'value' (number) or 'indicator2' (string).");

            } else if (type == "PriceIndicator") {
                PriceField field = requirePriceField(config.value("field", std::string("Close")));
                ComparisonOp op = comparisonOpFromString(requireString(config, "op", type).get<std::string>());
                std::string indicator = requireString(config, "indicator", type).get<std::string>();
                double offset_pct = 0.0;
                if (config.contains("offset_pct")) {
                    if (!config["offset_pct"].is_number()) {
                        throw std::invalid_argument("PriceIndicator 'offset_pct' must be a number.");
                    }
                    offset_pct = config["offset_pct"].get<double>();
                }
                return std::make_unique<PriceIndicatorCondition>(field, op, indicator, offset_pct);

            } else if (type == "CrossesAbove" || type == "CrossesBelow") {
                CrossType cross = (type == "CrossesAbove") ? CrossType::CrossesAbove : CrossType::CrossesBelow;
                std::string operand1 = crossOperand(config, "operand1", "indicator1");
                if (operand1.empty()) {
                    throw std::invalid_argument(fmt::format("{} condition requires 'operand1' (string).", type));
                }
                if (config.contains("value") && config["value"].is_number()) {
                    return std::make_unique<IndicatorCrossCondition>(operand1, cross, config["value"].get<double>());
                }
                std::string operand2 = crossOperand(config, "operand2", "indicator2");
                if (operand2.empty()) {
                    throw std::invalid_argument(fmt::format("{} condition requires 'operand2' (string) or 'value' (number).", type));
                }
                return std::make_unique<IndicatorCrossCondition>(operand1, cross, operand2);

            } else if (type == "PriceChange") {
                ComparisonOp op = comparisonOpFromString(requireString(config, "op", type).get<std::string>());
                if (!config.contains("value") || !config["value"].is_number()) {
                    throw std::invalid_argument("PriceChange condition requires 'value' (number, percent).");
                }
                return std::make_unique<PriceChangeCondition>(op, config["value"].get<double>());

            } else if (type == "AND" || type == "OR") {
                if (!config.contains("conditions") || !config["conditions"].is_array() || config["conditions"].empty()) {
                    throw std::invalid_argument(fmt::format("{} condition requires 'conditions' (non-empty array).", type));
                }
                std::vector<std::unique_ptr<ICondition>> sub_conditions;
                sub_conditions.reserve(config["conditions"].size());
                for (const auto& sub_conf : config["conditions"]) {
                    sub_conditions.push_back(parseCondition(sub_conf));
                }
                return std::make_unique<CompositeCondition>(type == "AND" ? LogicalOp::And : LogicalOp::Or,
                                                            std::move(sub_conditions));
            }
            throw std::invalid_argument(fmt::format("Unknown condition type '{}' in config.", type));

        } catch (const json::exception& e) {
            throw std::invalid_argument(fmt::format("Invalid JSON structure for condition type '{}': {}", type, e.what()));
        }
    }

    std::unique_ptr<IRule> ConditionFactory::createRule(const std::string& rule_name,
                                                        const json& condition_config,
                                                        core::SignalAction action) {
        auto condition = parseCondition(condition_config);
        return std::make_unique<Rule>(rule_name, std::move(condition), action);
    }

    void ConditionFactory::collectIndicatorNames(const json& config, std::vector<std::string>& names) {
        if (!config.is_object() || !config.contains("type") || !config["type"].is_string()) return;

        std::string type = config["type"].get<std::string>();
        if (type == "Indicator") {
            addUnique(names, config.value("indicator1", std::string()));
            addUnique(names, config.value("indicator2", std::string()));
        } else if (type == "PriceIndicator") {
            addUnique(names, config.value("indicator", std::string()));
        } else if (type == "CrossesAbove" || type == "CrossesBelow") {
            addUnique(names, crossOperand(config, "operand1", "indicator1"));
            addUnique(names, crossOperand(config, "operand2", "indicator2"));
        } else if (type == "AND" || type == "OR") {
            if (config.contains("conditions") && config["conditions"].is_array()) {
                for (const auto& sub_conf : config["conditions"]) {
                    collectIndicatorNames(sub_conf, names);
                }
            }
        }
    }

    void ConditionFactory::renameIndicators(json& config, const std::map<std::string, std::string>& renames) {
        if (renames.empty() || !config.is_object()) return;
        for (const char* key : {"indicator", "indicator1", "indicator2", "operand1", "operand2"}) {
            if (!config.contains(key) || !config[key].is_string()) continue;
            auto it = renames.find(config[key].get<std::string>());
            if (it != renames.end()) config[key] = it->second;
        }
        if (config.contains("conditions") && config["conditions"].is_array()) {
            for (auto& sub_conf : config["conditions"]) {
                renameIndicators(sub_conf, renames);
            }
        }
    }

} // namespace strategy_engine
