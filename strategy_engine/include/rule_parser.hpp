#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace strategy_engine {

    using json = nlohmann::json;

    // A rule clause recognized as one indicator pattern, in condition-tree form
    struct ParsedRule {
        std::string pattern;   // ma_crossover, ma_price, rsi_threshold, macd_cross,
                               // bollinger, drop_from_reference, price_change
        std::string clause;
        json entry;
        json exit;             // null when the pattern implies no exit of its own
    };

    // Deterministic matcher for the rule phrasings users type into entry
    // conditions ("10-day MA crosses above 30-day MA", "RSI(14) below 30",
    // "price drop of 5% from the 20-day high", ...). Matching is
    // case-insensitive; each clause yields at most one pattern.
    class RuleParser {
    public:
        // Splits on ',', ';', "and" and "then"; empty clauses are dropped
        static std::vector<std::string> splitClauses(const std::string& rule_text);

        // nullopt when no pattern matches. Throws CompileException when a
        // pattern matches but its numbers are unusable (e.g. a 0-day window).
        static std::optional<ParsedRule> parseClause(const std::string& clause);
    };

} // namespace strategy_engine
