#include "strategy_graph.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>

#include <cmath>
#include <map>
#include <set>

namespace strategy_engine {

    namespace {

        // Accepts JSON numbers and strings such as "5", "-5.5" or "7%"
        double parseNumeric(const json& value, const std::string& what) {
            if (value.is_number()) {
                double number = value.get<double>();
                if (!std::isfinite(number)) {
                    throw core::SchemaException(fmt::format("{} must be a finite number", what));
                }
                return number;
            }
            if (value.is_string()) {
                std::string text = core::utils::trim(value.get<std::string>());
                if (!text.empty() && text.back() == '%') {
                    text = core::utils::trim(text.substr(0, text.size() - 1));
                }
                if (!text.empty()) {
                    size_t consumed = 0;
                    try {
                        double number = std::stod(text, &consumed);
                        if (consumed == text.size() && std::isfinite(number)) {
                            return number;
                        }
                    } catch (const std::exception&) {
                        // fall through to the schema error below
                    }
                }
            }
            throw core::SchemaException(fmt::format("{} is not numeric: {}", what, value.dump()));
        }

        // First present key wins
        const json* findField(const json& meta, std::initializer_list<const char*> keys) {
            for (const char* key : keys) {
                if (meta.is_object() && meta.contains(key) && !meta[key].is_null()) {
                    return &meta[key];
                }
            }
            return nullptr;
        }

        StrategyNode parseNode(const json& raw, size_t index) {
            if (!raw.is_object()) {
                throw core::SchemaException(fmt::format("Node #{} is not an object", index));
            }
            if (!raw.contains("id") || !(raw["id"].is_string() || raw["id"].is_number_integer())) {
                throw core::SchemaException(fmt::format("Node #{} has no 'id'", index));
            }
            if (!raw.contains("type") || !raw["type"].is_string()) {
                throw core::SchemaException(fmt::format("Node #{} has no 'type'", index));
            }

            StrategyNode node;
            node.id = raw["id"].is_string() ? raw["id"].get<std::string>() : std::to_string(raw["id"].get<long long>());
            std::string type_str = raw["type"].get<std::string>();
            auto type = nodeTypeFromString(type_str);
            if (!type) {
                throw core::SchemaException(fmt::format("Node '{}' has unknown type '{}'", node.id, type_str));
            }
            node.type = *type;
            if (raw.contains("label") && raw["label"].is_string()) {
                node.label = raw["label"].get<std::string>();
            }
            if (raw.contains("meta") && raw["meta"].is_object()) {
                node.meta = raw["meta"];
            } else if (raw.contains("data") && raw["data"].is_object()) {
                node.meta = raw["data"];
            }
            return node;
        }

        std::vector<std::pair<std::string, std::string>> parseEdges(const json& raw_edges) {
            std::vector<std::pair<std::string, std::string>> edges;
            if (!raw_edges.is_array()) {
                throw core::SchemaException("'edges' must be an array");
            }
            for (const auto& edge : raw_edges) {
                if (edge.is_array() && edge.size() == 2 && edge[0].is_string() && edge[1].is_string()) {
                    edges.emplace_back(edge[0].get<std::string>(), edge[1].get<std::string>());
                } else if (edge.is_object() && edge.contains("source") && edge.contains("target") &&
                           edge["source"].is_string() && edge["target"].is_string()) {
                    edges.emplace_back(edge["source"].get<std::string>(), edge["target"].get<std::string>());
                } else {
                    throw core::SchemaException("Malformed edge: " + edge.dump());
                }
            }
            return edges;
        }

        // Walks start -> end and returns the nodes in order; every node must be on the walk
        std::vector<StrategyNode> orderedPath(const std::vector<StrategyNode>& nodes,
                                              const std::vector<std::pair<std::string, std::string>>& edges) {
            std::map<std::string, const StrategyNode*> by_id;
            const StrategyNode* start = nullptr;
            size_t start_count = 0;
            size_t end_count = 0;
            for (const auto& node : nodes) {
                if (!by_id.emplace(node.id, &node).second) {
                    throw core::SchemaException("Duplicate node id '" + node.id + "'");
                }
                if (node.type == NodeType::Start) { start = &node; ++start_count; }
                if (node.type == NodeType::End) ++end_count;
            }
            if (start_count != 1 || end_count != 1) {
                throw core::SchemaException(fmt::format(
                    "Graph must have exactly one start and one end node (found {} start, {} end)",
                    start_count, end_count));
            }

            std::map<std::string, std::string> next;
            std::map<std::string, int> in_degree;
            for (const auto& edge : edges) {
                if (!by_id.count(edge.first) || !by_id.count(edge.second)) {
                    throw core::SchemaException(fmt::format("Edge {} -> {} references an unknown node",
                                                            edge.first, edge.second));
                }
                if (edge.first == edge.second) {
                    throw core::SchemaException("Self loop on node '" + edge.first + "'");
                }
                if (!next.emplace(edge.first, edge.second).second) {
                    throw core::SchemaException("Node '" + edge.first + "' branches to more than one successor");
                }
                if (++in_degree[edge.second] > 1) {
                    throw core::SchemaException("Node '" + edge.second + "' has more than one predecessor");
                }
            }

            std::vector<StrategyNode> path;
            std::set<std::string> visited;
            const StrategyNode* current = start;
            while (current) {
                if (!visited.insert(current->id).second) {
                    throw core::SchemaException("Cycle detected at node '" + current->id + "'");
                }
                path.push_back(*current);
                if (current->type == NodeType::End) break;
                auto it = next.find(current->id);
                if (it == next.end()) {
                    throw core::SchemaException("Path from start stops at '" + current->id + "' before reaching end");
                }
                current = by_id[it->second];
            }
            if (next.count(path.back().id)) {
                throw core::SchemaException("End node must not have outgoing edges");
            }
            if (path.size() != nodes.size()) {
                throw core::SchemaException(fmt::format(
                    "{} node(s) are not on the start-to-end path", nodes.size() - path.size()));
            }
            return path;
        }

        std::string categoryOf(const StrategyNode& node) {
            const json* value = findField(node.meta, {"category", "symbol", "asset"});
            std::string category;
            if (value && value->is_string()) {
                category = core::utils::trim(value->get<std::string>());
            } else if (value) {
                throw core::SchemaException("Category node '" + node.id + "' has a non-string category");
            } else {
                category = core::utils::trim(node.label);
            }
            if (category.empty()) {
                throw core::SchemaException("Category node '" + node.id + "' does not name a category");
            }
            return category;
        }

        void readEntryCondition(const StrategyNode& node, NormalizedGraph& graph) {
            const json* mode = findField(node.meta, {"mode"});
            if (mode) {
                std::string mode_str = mode->is_string() ? core::utils::toLower(mode->get<std::string>()) : "";
                if (mode_str == "manual") {
                    graph.entry_mode = EntryMode::Manual;
                } else if (mode_str == "ai_optimized") {
                    graph.entry_mode = EntryMode::AiOptimized;
                } else {
                    throw core::SchemaException("Entry mode must be 'manual' or 'ai_optimized', got " + mode->dump());
                }
            }

            const json* rules = findField(node.meta, {"rules", "rule", "condition"});
            if (!rules) return; // empty rule list: the compiler applies its default
            if (rules->is_string()) {
                graph.entry_rules.push_back(*rules);
                return;
            }
            if (rules->is_object()) {
                graph.entry_rules.push_back(*rules);
                return;
            }
            if (!rules->is_array()) {
                throw core::SchemaException("Entry rules must be a string, an object or an array");
            }
            for (const auto& rule : *rules) {
                if (rule.is_string()) {
                    if (!core::utils::trim(rule.get<std::string>()).empty()) graph.entry_rules.push_back(rule);
                } else if (rule.is_object()) {
                    graph.entry_rules.push_back(rule);
                } else {
                    throw core::SchemaException("Entry rule must be a string or a condition object: " + rule.dump());
                }
            }
        }

        double requirePercent(const StrategyNode& node, std::initializer_list<const char*> keys,
                              const std::string& what, double upper_bound, bool upper_inclusive) {
            const json* value = findField(node.meta, keys);
            if (!value) {
                throw core::SchemaException(fmt::format("{} node '{}' carries no percentage", what, node.id));
            }
            double pct = parseNumeric(*value, what);
            if (pct <= 0.0) {
                throw core::SchemaException(fmt::format(
                    "{} must be a positive magnitude (got {}); it is measured from the entry price", what, pct));
            }
            if (upper_inclusive ? pct > upper_bound : pct >= upper_bound) {
                throw core::SchemaException(fmt::format("{} of {}% is out of range", what, pct));
            }
            return pct;
        }

    } // namespace

    std::string nodeTypeToString(NodeType type) {
        switch (type) {
            case NodeType::Start:          return "start";
            case NodeType::End:            return "end";
            case NodeType::Category:       return "category";
            case NodeType::EntryCondition: return "entry_condition";
            case NodeType::TakeProfit:     return "take_profit";
            case NodeType::StopLoss:       return "stop_loss";
            case NodeType::Capital:        return "capital";
            case NodeType::RiskClass:      return "risk_class";
        }
        return "unknown";
    }

    std::string entryModeToString(EntryMode mode) {
        return mode == EntryMode::AiOptimized ? "ai_optimized" : "manual";
    }

    std::string riskClassToString(RiskClass risk) {
        switch (risk) {
            case RiskClass::High:   return "High";
            case RiskClass::Medium: return "Medium";
            case RiskClass::Low:    return "Low";
        }
        return "Medium";
    }

    std::optional<NodeType> nodeTypeFromString(const std::string& type) {
        static const std::map<std::string, NodeType> kTypes = {
            {"start", NodeType::Start},
            {"end", NodeType::End},
            {"category", NodeType::Category},
            {"crypto_category", NodeType::Category},
            {"entry_condition", NodeType::EntryCondition},
            {"entry", NodeType::EntryCondition},
            {"take_profit", NodeType::TakeProfit},
            {"exit_target", NodeType::TakeProfit},
            {"profit_target", NodeType::TakeProfit},
            {"stop_loss", NodeType::StopLoss},
            {"capital", NodeType::Capital},
            {"manage_capital", NodeType::Capital},
            {"risk_class", NodeType::RiskClass},
            {"degen_class", NodeType::RiskClass},
        };
        auto it = kTypes.find(core::utils::toLower(core::utils::trim(type)));
        if (it == kTypes.end()) return std::nullopt;
        return it->second;
    }

    NormalizedGraph StrategyGraphValidator::normalize(const json& raw_graph) {
        const json& graph_doc = (raw_graph.is_object() && raw_graph.contains("flowchart")) ? raw_graph["flowchart"] : raw_graph;
        if (!graph_doc.is_object()) {
            throw core::SchemaException("Strategy graph must be a JSON object");
        }
        if (!graph_doc.contains("nodes") || !graph_doc["nodes"].is_array() || graph_doc["nodes"].empty()) {
            throw core::SchemaException("Strategy graph has no 'nodes' array");
        }
        if (!graph_doc.contains("edges")) {
            throw core::SchemaException("Strategy graph has no 'edges'");
        }

        std::vector<StrategyNode> nodes;
        for (size_t i = 0; i < graph_doc["nodes"].size(); ++i) {
            nodes.push_back(parseNode(graph_doc["nodes"][i], i));
        }

        std::map<NodeType, int> counts;
        for (const auto& node : nodes) ++counts[node.type];
        if (counts[NodeType::Category] != 1) {
            throw core::SchemaException(fmt::format("Graph needs exactly one category node (found {})",
                                                    counts[NodeType::Category]));
        }
        if (counts[NodeType::EntryCondition] != 1) {
            throw core::SchemaException(fmt::format("Graph needs exactly one entry_condition node (found {})",
                                                    counts[NodeType::EntryCondition]));
        }
        for (NodeType optional_type : {NodeType::TakeProfit, NodeType::StopLoss, NodeType::Capital, NodeType::RiskClass}) {
            if (counts[optional_type] > 1) {
                throw core::SchemaException(fmt::format("Graph allows at most one {} node (found {})",
                                                        nodeTypeToString(optional_type), counts[optional_type]));
            }
        }

        NormalizedGraph result;
        result.path = orderedPath(nodes, parseEdges(graph_doc["edges"]));
        for (const json* doc : {&graph_doc, &raw_graph}) {
            const json* name = findField(*doc, {"name", "strategy_name"});
            if (name && name->is_string()) {
                result.name = name->get<std::string>();
                break;
            }
        }

        for (const auto& node : result.path) {
            switch (node.type) {
                case NodeType::Start:
                case NodeType::End:
                    break;
                case NodeType::Category:
                    result.category = categoryOf(node);
                    break;
                case NodeType::EntryCondition:
                    readEntryCondition(node, result);
                    break;
                case NodeType::TakeProfit:
                    result.take_profit_pct = requirePercent(node, {"target_pct", "take_profit_pct", "pct"},
                                                            "Take-profit", 1000.0, true);
                    break;
                case NodeType::StopLoss:
                    result.stop_loss_pct = requirePercent(node, {"stop_pct", "stop_loss_pct", "pct"},
                                                          "Stop-loss", 100.0, false);
                    break;
                case NodeType::Capital: {
                    const json* value = findField(node.meta, {"amount", "capital", "usd"});
                    if (!value) {
                        throw core::SchemaException("Capital node '" + node.id + "' carries no amount");
                    }
                    double amount = parseNumeric(*value, "Capital");
                    if (amount <= 0.0) {
                        throw core::SchemaException(fmt::format("Capital must be positive (got {})", amount));
                    }
                    result.capital = amount;
                    break;
                }
                case NodeType::RiskClass: {
                    const json* value = findField(node.meta, {"class", "selected", "risk_class"});
                    std::string risk = (value && value->is_string()) ? core::utils::toLower(value->get<std::string>())
                                                                     : core::utils::toLower(node.label);
                    if (risk == "high") result.risk_class = RiskClass::High;
                    else if (risk == "medium") result.risk_class = RiskClass::Medium;
                    else if (risk == "low") result.risk_class = RiskClass::Low;
                    else throw core::SchemaException("Risk class must be High, Medium or Low (node '" + node.id + "')");
                    break;
                }
            }
        }

        core::logging::getLogger()->debug("Normalized strategy graph: category={}, {} entry rule(s), tp={}, sl={}",
                                          result.category, result.entry_rules.size(),
                                          result.take_profit_pct ? fmt::format("{}%", *result.take_profit_pct) : "none",
                                          result.stop_loss_pct ? fmt::format("{}%", *result.stop_loss_pct) : "none");
        return result;
    }

} // namespace strategy_engine
