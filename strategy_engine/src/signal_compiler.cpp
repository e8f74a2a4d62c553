#include "signal_compiler.hpp"
#include "condition_factory.hpp"
#include "rule_parser.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <map>
#include <stdexcept>

namespace strategy_engine {

    namespace {

        // "MACD(12,26,9).hist" -> "MACD(12,26,9)"
        std::string baseIndicatorName(const std::string& output_name) {
            auto close_paren = output_name.find(')');
            return close_paren == std::string::npos ? output_name : output_name.substr(0, close_paren + 1);
        }

        json combine(const char* op, const std::vector<json>& conditions) {
            if (conditions.empty()) return json();
            if (conditions.size() == 1) return conditions.front();
            return json{{"type", op}, {"conditions", conditions}};
        }

        // Shortest period each kind can be computed with
        int minimumPeriod(const std::string& kind) {
            return (kind == "SMA" || kind == "EMA") ? 1 : 2;
        }

        void checkOutput(const IndicatorDefinition& def, const std::string& output) {
            const std::string suffix = output.substr(def.name.size());
            if (suffix.empty()) return;
            if (def.kind == "MACD" && (suffix == ".macd" || suffix == ".signal" || suffix == ".hist")) return;
            if (def.kind == "BBANDS" && (suffix == ".upper" || suffix == ".middle" || suffix == ".lower")) return;
            throw core::CompileException(fmt::format("{} has no output named '{}'", def.name, output));
        }

        void checkIndicator(const IndicatorDefinition& def, long long span_days) {
            for (double param : def.params) {
                if (!(param > 0.0)) {
                    throw core::CompileException(fmt::format("{} has a non-positive parameter", def.name));
                }
            }
            const int min_period = minimumPeriod(def.kind);
            // MACD's signal smoothing may be a single bar; fast and slow may not
            const size_t checked = def.kind == "MACD" ? 2 : 1;
            for (size_t i = 0; i < checked; ++i) {
                if (def.params[i] < min_period) {
                    throw core::CompileException(fmt::format("{} needs periods of at least {} bars", def.name, min_period));
                }
            }
            if (def.kind == "MACD" && def.params[0] >= def.params[1]) {
                throw core::CompileException(fmt::format("{}: fast period must be shorter than slow period", def.name));
            }
            if (def.window >= span_days) {
                throw core::CompileException(fmt::format(
                    "{} needs {} bars of history but the requested range covers only {} day(s)",
                    def.name, def.window, span_days));
            }
        }

    } // namespace

    SignalSpecification RuleSignalCompiler::compile(const NormalizedGraph& graph,
                                                    const BacktestParameters& params) const {
        auto logger = core::logging::getLogger();
        validateParameters(params);

        SignalSpecification spec;
        spec.parameters = params;

        if (graph.category.empty()) {
            throw core::CompileException("Strategy graph names no category to trade");
        }
        auto asset = AssetCatalog::find(graph.category);
        if (!asset) {
            throw core::CompileException("Unsupported category '" + graph.category + "'");
        }
        spec.asset = *asset;
        if (!params.symbols.empty()) {
            auto requested = AssetCatalog::find(params.symbols.front());
            if (!requested || requested->provider_id != asset->provider_id) {
                spec.diagnostics.push_back(fmt::format("Category '{}' overrides requested symbol '{}'",
                                                       graph.category, params.symbols.front()));
            }
        }
        spec.parameters.symbols = {asset->symbol};

        // A capital node on the graph wins over the submitted amount
        if (graph.capital && *graph.capital != params.initial_capital) {
            spec.diagnostics.push_back(fmt::format("Capital node sets initial capital to {} (requested {})",
                                                   *graph.capital, params.initial_capital));
            spec.parameters.initial_capital = *graph.capital;
        }

        if (graph.entry_mode == EntryMode::AiOptimized) {
            spec.diagnostics.push_back("ai_optimized entry mode compiled with the deterministic rule parser");
        }

        std::vector<json> entries;
        std::vector<json> exits;
        for (const auto& rule : graph.entry_rules) {
            spec.source_rules.push_back(rule);
            if (rule.is_object()) {
                try {
                    ConditionFactory::parseCondition(rule);
                } catch (const std::invalid_argument& e) {
                    throw core::CompileException(std::string("Invalid structured rule: ") + e.what());
                }
                entries.push_back(rule);
                spec.diagnostics.push_back("Structured rule: " + rule.dump());
                continue;
            }

            const std::string text = rule.get<std::string>();
            for (const auto& clause : RuleParser::splitClauses(text)) {
                auto parsed = RuleParser::parseClause(clause);
                if (!parsed) {
                    logger->warn("Unrecognized rule text skipped: '{}'", clause);
                    spec.diagnostics.push_back("Unrecognized rule text: '" + clause + "'");
                    continue;
                }
                spec.diagnostics.push_back(fmt::format("Recognized {} in '{}'", parsed->pattern, clause));
                entries.push_back(parsed->entry);
                if (!parsed->exit.is_null()) exits.push_back(parsed->exit);
            }
        }

        if (entries.empty()) {
            std::string fast = fmt::format("SMA({})", kFallbackFastWindow);
            std::string slow = fmt::format("SMA({})", kFallbackSlowWindow);
            entries.push_back(json{{"type", "CrossesAbove"}, {"operand1", fast}, {"operand2", slow}});
            exits.push_back(json{{"type", "CrossesBelow"}, {"operand1", fast}, {"operand2", slow}});
            spec.fallback_applied = true;
            std::string note = fmt::format("No recognizable entry rule; applied default {}/{} crossover", fast, slow);
            logger->warn(note);
            spec.diagnostics.push_back(note);
        }

        spec.entry = combine("AND", entries);
        spec.exit = combine("OR", exits);

        std::vector<std::string> outputs;
        ConditionFactory::collectIndicatorNames(spec.entry, outputs);
        if (!spec.exit.is_null()) ConditionFactory::collectIndicatorNames(spec.exit, outputs);

        long long span_days = parameterSpanDays(params);
        std::map<std::string, std::string> renames;
        for (const auto& output : outputs) {
            std::string canonical;
            IndicatorDefinition def;
            try {
                canonical = canonicalIndicatorOutput(output);
                def = indicatorDefinitionFromName(baseIndicatorName(canonical));
            } catch (const std::invalid_argument& e) {
                throw core::CompileException(fmt::format("Unsupported indicator '{}': {}", output, e.what()));
            }
            checkOutput(def, canonical);
            if (canonical != output) {
                renames[output] = canonical;
                spec.diagnostics.push_back(fmt::format("Indicator '{}' written as '{}'", output, canonical));
            }
            if (std::find(spec.indicators.begin(), spec.indicators.end(), def) != spec.indicators.end()) continue;
            checkIndicator(def, span_days);
            spec.indicators.push_back(def);
        }
        ConditionFactory::renameIndicators(spec.entry, renames);
        ConditionFactory::renameIndicators(spec.exit, renames);

        spec.exit_thresholds.take_profit_pct = graph.take_profit_pct;
        spec.exit_thresholds.stop_loss_pct = graph.stop_loss_pct;
        if (graph.risk_class) spec.risk_class = riskClassToString(*graph.risk_class);

        logger->info("Compiled signal specification for {} ({}): {} indicator(s), fallback={}",
                     spec.asset.symbol, spec.asset.provider_id, spec.indicators.size(), spec.fallback_applied);
        return spec;
    }

} // namespace strategy_engine
