#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace strategy_engine {

    using json = nlohmann::json;

    enum class NodeType {
        Start,
        End,
        Category,
        EntryCondition,
        TakeProfit,
        StopLoss,
        Capital,
        RiskClass
    };

    enum class EntryMode {
        Manual,
        AiOptimized
    };

    enum class RiskClass {
        High,
        Medium,
        Low
    };

    struct StrategyNode {
        std::string id;
        NodeType type = NodeType::Start;
        std::string label;
        json meta = json::object();
    };

    // Canonical form of a validated strategy graph.
    // Percentages are positive magnitudes: stop_loss_pct is the distance below
    // the entry price, take_profit_pct the distance above it.
    struct NormalizedGraph {
        std::string name;
        std::string category;
        EntryMode entry_mode = EntryMode::Manual;
        std::vector<json> entry_rules;   // each a rule string or a structured condition object
        std::optional<double> take_profit_pct;
        std::optional<double> stop_loss_pct;
        std::optional<double> capital;
        std::optional<RiskClass> risk_class;
        std::vector<StrategyNode> path;  // start ... end in edge order
    };

    class StrategyGraphValidator {
    public:
        // Validates a raw graph document and resolves aliases to canonical types.
        // Throws core::SchemaException on any violation. No side effects.
        static NormalizedGraph normalize(const json& raw_graph);
    };

    std::string nodeTypeToString(NodeType type);
    std::string entryModeToString(EntryMode mode);
    std::string riskClassToString(RiskClass risk);

    // Node type name or alias ("exit_target", "crypto_category", ...) -> canonical type
    std::optional<NodeType> nodeTypeFromString(const std::string& type);

} // namespace strategy_engine
