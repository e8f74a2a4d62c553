#pragma once

#include "asset_catalog.hpp"
#include "common_types.hpp"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace strategy_engine {

    using json = nlohmann::json;

    // One indicator the worker must compute, e.g. {SMA, 10, [], "SMA(10)"}
    struct IndicatorDefinition {
        std::string kind;            // SMA | EMA | RSI | MACD | BBANDS | MAX
        int window = 0;              // Primary window (MACD: slow period)
        std::vector<double> params;  // Full parameter list as written in the name
        std::string name;            // Canonical name, also the snapshot key

        bool operator==(const IndicatorDefinition& other) const {
            return name == other.name;
        }
    };

    // Upper bound for any indicator period
    constexpr int kMaxIndicatorWindow = 100000;

    // Parses "SMA(10)", "MACD(12,26,9)", "BBANDS(20,2)"... Spacing, leading zeros and
    // "2.0"-style widths are accepted; `name` comes back in canonical spelling.
    // Throws std::invalid_argument on unknown kinds and unusable parameters.
    IndicatorDefinition indicatorDefinitionFromName(const std::string& name);

    // "BBANDS(20, 2.0).lower" -> "BBANDS(20,2).lower"
    std::string canonicalIndicatorOutput(const std::string& output);

    struct BacktestParameters {
        std::vector<std::string> symbols;
        std::string timeframe = "1D";
        std::string start_date;              // YYYY-MM-DD
        std::string end_date;                // YYYY-MM-DD
        double initial_capital = 10000.0;
        double fee_rate = 0.001;
        double slippage_rate = 0.001;
        SizingMethod sizing = SizingMethod::InitialCapital;
        double exposure = 1.0;               // Fraction of capital per entry, (0, 1]
        std::string benchmark;               // Label only; the benchmark is buy-and-hold
    };

    // Reads parameters over the defaults. A "period" of 1M/3M/6M/1Y replaces a
    // missing start_date (counted back from end_date).
    // Throws CompileException on wrong types or unknown values.
    BacktestParameters parametersFromJson(const json& j);
    json parametersToJson(const BacktestParameters& params);

    // start < end, fee/slippage in [0, 1), capital > 0, exposure in (0, 1].
    // Throws CompileException.
    void validateParameters(const BacktestParameters& params);

    // Days covered by the parameters, both ends inclusive
    long long parameterSpanDays(const BacktestParameters& params);

    struct ExitThresholds {
        std::optional<double> take_profit_pct;  // Close >= entry * (1 + tp/100)
        std::optional<double> stop_loss_pct;    // Close <= entry * (1 - sl/100)
    };

    // Output of the signal compiler and input of the sandbox worker
    struct SignalSpecification {
        Asset asset;
        std::vector<IndicatorDefinition> indicators;
        json entry = json::object();           // Condition tree
        json exit;                             // Condition tree or null
        ExitThresholds exit_thresholds;
        BacktestParameters parameters;
        std::string risk_class;                // Informational, may be empty
        std::vector<json> source_rules;
        bool fallback_applied = false;
        std::vector<std::string> diagnostics;

        json toJson() const;
        // Throws CompileException on a malformed document
        static SignalSpecification fromJson(const json& j);

        // Stable text form (sorted keys): the persisted "generated logic"
        std::string serialize() const;
    };

} // namespace strategy_engine
