#include "rule_parser.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <regex>
#include <stdexcept>

namespace strategy_engine {

    namespace {

        const char* kNumber = R"((\d+(?:\.\d+)?))";

        int parseWindow(const std::string& digits, const std::string& clause) {
            long window = 0;
            try {
                window = std::stol(digits);
            } catch (const std::out_of_range&) {
                throw core::CompileException(fmt::format("Window '{}' is out of range in rule '{}'", digits, clause));
            }
            if (window <= 0 || window > 100000) {
                throw core::CompileException(fmt::format("Window must be a positive number of bars, got {} in rule '{}'",
                                                         window, clause));
            }
            return static_cast<int>(window);
        }

        double parsePercent(const std::string& digits, const std::string& clause) {
            double value = std::stod(digits);
            if (value <= 0.0) {
                throw core::CompileException(fmt::format("Percentage must be positive, got {} in rule '{}'", value, clause));
            }
            return value;
        }

        json cross(const std::string& type, const std::string& operand1, const std::string& operand2) {
            return json{{"type", type}, {"operand1", operand1}, {"operand2", operand2}};
        }

        json crossLevel(const std::string& type, const std::string& operand1, double level) {
            return json{{"type", type}, {"operand1", operand1}, {"value", level}};
        }

        json priceVs(const std::string& op, const std::string& indicator, double offset_pct = 0.0) {
            json j{{"type", "PriceIndicator"}, {"field", "Close"}, {"op", op}, {"indicator", indicator}};
            if (offset_pct != 0.0) j["offset_pct"] = offset_pct;
            return j;
        }

        bool contains(const std::string& text, const std::regex& pattern) {
            return std::regex_search(text, pattern);
        }

        // --- "drop of 5% from the 20-day high" ---
        std::optional<ParsedRule> matchDropFromReference(const std::string& text) {
            static const std::regex kPattern(
                std::string(R"(\b(?:drop|dip|decline|fall|pullback|pull back)\w*\s+(?:of\s+|by\s+)?)") + kNumber +
                R"(\s*%\s+(?:from|below|off)\s+(?:the\s+|its\s+)?(\d+)\s*-?\s*(?:day|period|bar)s?\s+(moving average|sma|ema|ma|high)\b)");
            // "10% drop from the 20-day high"
            static const std::regex kPercentFirst(
                std::string(kNumber) +
                R"(\s*%\s+(?:drop|dip|decline|fall|pullback)\w*\s+(?:from|below|off)\s+(?:the\s+|its\s+)?(\d+)\s*-?\s*(?:day|period|bar)s?\s+(moving average|sma|ema|ma|high)\b)");
            std::smatch m;
            if (!std::regex_search(text, m, kPattern) && !std::regex_search(text, m, kPercentFirst)) return std::nullopt;

            double pct = parsePercent(m[1].str(), text);
            if (pct >= 100.0) {
                throw core::CompileException(fmt::format("A drop of {}% can never happen", pct));
            }
            int window = parseWindow(m[2].str(), text);
            std::string reference = m[3].str();

            ParsedRule rule;
            rule.pattern = "drop_from_reference";
            rule.clause = text;
            if (reference == "high") {
                std::string high = fmt::format("MAX({})", window);
                rule.entry = priceVs("<=", high, -pct);
            } else {
                std::string ma = fmt::format("{}({})", reference == "ema" ? "EMA" : "SMA", window);
                rule.entry = priceVs("<=", ma, -pct);
                rule.exit = priceVs(">=", ma);   // back at the average
            }
            return rule;
        }

        // --- RSI thresholds ---
        std::optional<ParsedRule> matchRsi(const std::string& text) {
            static const std::regex kRsi(R"(\brsi\b)");
            if (!contains(text, kRsi)) return std::nullopt;

            static const std::regex kPeriodParen(R"(\brsi\s*\(\s*(\d+)\s*\))");
            static const std::regex kPeriodDays(R"((\d+)\s*-?\s*(?:day|period|bar)s?\s+rsi\b)");
            static const std::regex kPeriodDash(R"(\brsi\s*-\s*(\d+)\b)");
            static const std::regex kPeriodBare(
                R"(\brsi\s+(\d+)\s+(?=(?:is\s+)?(?:below|under|above|over|less|greater|cross|drops|falls|rises|<|>)))");
            int period = 14;
            std::smatch m;
            if (std::regex_search(text, m, kPeriodParen) || std::regex_search(text, m, kPeriodDays) ||
                std::regex_search(text, m, kPeriodDash) || std::regex_search(text, m, kPeriodBare)) {
                period = parseWindow(m[1].str(), text);
            }

            static const std::regex kBelow(std::string(R"((?:below|under|less than|<)\s*)") + kNumber);
            static const std::regex kAbove(std::string(R"((?:above|over|greater than|>)\s*)") + kNumber);
            bool entry_below = true;
            double threshold = 30.0;
            std::smatch below_m;
            std::smatch above_m;
            bool has_below = std::regex_search(text, below_m, kBelow);
            bool has_above = std::regex_search(text, above_m, kAbove);
            if (has_below && (!has_above || below_m.position(0) < above_m.position(0))) {
                threshold = std::stod(below_m[1].str());
            } else if (has_above) {
                entry_below = false;
                threshold = std::stod(above_m[1].str());
            } else if (text.find("overbought") != std::string::npos) {
                entry_below = false;
                threshold = 70.0;
            }
            if (threshold <= 0.0 || threshold >= 100.0) {
                throw core::CompileException(fmt::format("RSI threshold must be between 0 and 100, got {}", threshold));
            }

            std::string rsi = fmt::format("RSI({})", period);
            double exit_level = 100.0 - threshold;
            ParsedRule rule;
            rule.pattern = "rsi_threshold";
            rule.clause = text;
            static const std::regex kCross(R"(\bcross)");
            if (contains(text, kCross)) {
                rule.entry = crossLevel(entry_below ? "CrossesBelow" : "CrossesAbove", rsi, threshold);
                rule.exit = crossLevel(entry_below ? "CrossesAbove" : "CrossesBelow", rsi, exit_level);
            } else {
                rule.entry = json{{"type", "Indicator"}, {"indicator1", rsi}, {"op", entry_below ? "<" : ">"}, {"value", threshold}};
                rule.exit = json{{"type", "Indicator"}, {"indicator1", rsi}, {"op", entry_below ? ">" : "<"}, {"value", exit_level}};
            }
            return rule;
        }

        // --- MACD histogram zero cross ---
        std::optional<ParsedRule> matchMacd(const std::string& text) {
            static const std::regex kMacd(R"(\bmacd\b)");
            if (!contains(text, kMacd)) return std::nullopt;

            static const std::regex kBearish(R"(\b(?:below|under|bearish)\b)");
            bool bearish = contains(text, kBearish);
            const std::string hist = "MACD(12,26,9).hist";

            ParsedRule rule;
            rule.pattern = "macd_cross";
            rule.clause = text;
            rule.entry = crossLevel(bearish ? "CrossesBelow" : "CrossesAbove", hist, 0.0);
            rule.exit = crossLevel(bearish ? "CrossesAbove" : "CrossesBelow", hist, 0.0);
            return rule;
        }

        // --- Bollinger bands ---
        std::optional<ParsedRule> matchBollinger(const std::string& text) {
            static const std::regex kBollinger(R"(\b(?:bollinger|bbands?)\b)");
            if (!contains(text, kBollinger)) return std::nullopt;

            static const std::regex kPeriodDays(R"((\d+)\s*-?\s*(?:day|period|bar)s?\s+(?:bollinger|bbands?)\b)");
            static const std::regex kPeriodParen(R"(\b(?:bollinger bands?|bbands?)\s*\(\s*(\d+))");
            static const std::regex kDeviation(std::string(kNumber) + R"(\s*(?:std|standard dev|sigma|sd)\b)");
            int period = 20;
            double deviation = 2.0;
            std::smatch m;
            if (std::regex_search(text, m, kPeriodDays) || std::regex_search(text, m, kPeriodParen)) {
                period = parseWindow(m[1].str(), text);
            }
            if (std::regex_search(text, m, kDeviation)) {
                deviation = parsePercent(m[1].str(), text);
            }

            std::string name = fmt::format("BBANDS({},{:g})", period, deviation);
            ParsedRule rule;
            rule.pattern = "bollinger";
            rule.clause = text;
            bool breakout = text.find("upper") != std::string::npos && text.find("lower") == std::string::npos;
            if (breakout) {
                rule.entry = priceVs(">=", name + ".upper");
                rule.exit = priceVs("<=", name + ".middle");
            } else {
                rule.entry = priceVs("<=", name + ".lower");
                rule.exit = priceVs(">=", name + ".upper");
            }
            return rule;
        }

        struct MaWindow {
            int window;
            bool exponential;
            std::ptrdiff_t position;
        };

        // --- Moving averages: crossovers and price vs. average ---
        std::optional<ParsedRule> matchMovingAverage(const std::string& text) {
            static const std::regex kDayForm(
                R"((\d+)\s*-?\s*(?:day|period|bar)s?\s+(exponential moving average|moving average|ema|sma|ma)\b)");
            static const std::regex kNameForm(R"(\b(sma|ema|ma)\s*\(?\s*(\d+))");
            static const std::regex kGoldenCross(R"(\bgolden cross\b)");

            std::vector<MaWindow> windows;
            auto addWindow = [&windows](int window, bool exponential, std::ptrdiff_t position) {
                for (const auto& existing : windows) {
                    if (existing.window == window && existing.exponential == exponential) return;
                }
                windows.push_back({window, exponential, position});
            };

            for (auto it = std::sregex_iterator(text.begin(), text.end(), kDayForm); it != std::sregex_iterator(); ++it) {
                const std::string kind = (*it)[2].str();
                addWindow(parseWindow((*it)[1].str(), text), kind == "ema" || kind == "exponential moving average",
                          it->position(0));
            }
            for (auto it = std::sregex_iterator(text.begin(), text.end(), kNameForm); it != std::sregex_iterator(); ++it) {
                addWindow(parseWindow((*it)[2].str(), text), (*it)[1].str() == "ema", it->position(0));
            }
            if (windows.empty() && contains(text, kGoldenCross)) {
                windows.push_back({50, false, 0});
                windows.push_back({200, false, 1});
            }
            if (windows.empty()) return std::nullopt;

            std::sort(windows.begin(), windows.end(),
                      [](const MaWindow& a, const MaWindow& b) { return a.position < b.position; });
            auto nameOf = [](const MaWindow& w) {
                return fmt::format("{}({})", w.exponential ? "EMA" : "SMA", w.window);
            };

            ParsedRule rule;
            rule.clause = text;
            if (windows.size() >= 2) {
                auto by_window = [](const MaWindow& a, const MaWindow& b) { return a.window < b.window; };
                const MaWindow& fast = *std::min_element(windows.begin(), windows.end(), by_window);
                const MaWindow& slow = *std::max_element(windows.begin(), windows.end(), by_window);
                if (fast.window == slow.window) {
                    throw core::CompileException("A moving-average crossover needs two different windows: " + text);
                }
                static const std::regex kCrossDown(R"(\bcross(?:es|ing)?\s+(?:below|under|down)\b)");
                bool reversed = contains(text, kCrossDown);
                rule.pattern = "ma_crossover";
                rule.entry = cross(reversed ? "CrossesBelow" : "CrossesAbove", nameOf(fast), nameOf(slow));
                rule.exit = cross(reversed ? "CrossesAbove" : "CrossesBelow", nameOf(fast), nameOf(slow));
                return rule;
            }

            std::string ma = nameOf(windows.front());
            static const std::regex kCrossWord(R"(\bcross)");
            static const std::regex kAbove(R"(\b(?:above|over)\b)");
            static const std::regex kBelow(R"(\b(?:below|under)\b)");
            rule.pattern = "ma_price";
            if (!contains(text, kCrossWord) && contains(text, kAbove)) {
                rule.entry = priceVs(">", ma);
                rule.exit = priceVs("<", ma);
            } else if (!contains(text, kCrossWord) && contains(text, kBelow)) {
                rule.entry = priceVs("<", ma);
                rule.exit = priceVs(">", ma);
            } else if (contains(text, kBelow)) {
                rule.entry = cross("CrossesBelow", "Close", ma);
                rule.exit = cross("CrossesAbove", "Close", ma);
            } else {
                rule.entry = cross("CrossesAbove", "Close", ma);
                rule.exit = cross("CrossesBelow", "Close", ma);
            }
            return rule;
        }

        // --- Bar-over-bar moves: "5% drop", "rises 3%" ---
        std::optional<ParsedRule> matchPriceChange(const std::string& text) {
            static const std::regex kDropAfter(std::string(kNumber) + R"(\s*%\s*(?:price\s+)?(?:drop|dip|decline|fall)\w*)");
            static const std::regex kDropBefore(std::string(R"(\b(?:drop|dip|decline|fall)\w*\s+(?:of\s+|by\s+)?)") + kNumber + R"(\s*%)");
            static const std::regex kRiseAfter(std::string(kNumber) + R"(\s*%\s*(?:price\s+)?(?:rise|gain|jump|rally|increase)\w*)");
            static const std::regex kRiseBefore(std::string(R"(\b(?:rise|rose|gain|jump|rall|increase)\w*\s+(?:of\s+|by\s+)?)") + kNumber + R"(\s*%)");

            std::smatch m;
            ParsedRule rule;
            rule.pattern = "price_change";
            rule.clause = text;
            if (std::regex_search(text, m, kDropAfter) || std::regex_search(text, m, kDropBefore)) {
                double pct = parsePercent(m[1].str(), text);
                if (pct >= 100.0) {
                    throw core::CompileException(fmt::format("A drop of {}% can never happen", pct));
                }
                rule.entry = json{{"type", "PriceChange"}, {"op", "<="}, {"value", -pct}};
                return rule;
            }
            if (std::regex_search(text, m, kRiseAfter) || std::regex_search(text, m, kRiseBefore)) {
                rule.entry = json{{"type", "PriceChange"}, {"op", ">="}, {"value", parsePercent(m[1].str(), text)}};
                return rule;
            }
            return std::nullopt;
        }

    } // namespace

    std::vector<std::string> RuleParser::splitClauses(const std::string& rule_text) {
        static const std::regex kSeparator(R"(\s*(?:[,;]|\bthen\b|\band\b)\s*)");
        std::string text = core::utils::toLower(rule_text);
        std::vector<std::string> clauses;
        for (std::sregex_token_iterator it(text.begin(), text.end(), kSeparator, -1), end; it != end; ++it) {
            std::string clause = core::utils::trim(it->str());
            if (!clause.empty()) clauses.push_back(clause);
        }
        return clauses;
    }

    std::optional<ParsedRule> RuleParser::parseClause(const std::string& clause) {
        std::string text = core::utils::toLower(core::utils::trim(clause));
        if (text.empty()) return std::nullopt;

        using Matcher = std::optional<ParsedRule> (*)(const std::string&);
        static const Matcher kMatchers[] = {
            matchDropFromReference,
            matchRsi,
            matchMacd,
            matchBollinger,
            matchMovingAverage,
            matchPriceChange,
        };
        for (Matcher matcher : kMatchers) {
            auto rule = matcher(text);
            if (rule) {
                core::logging::getLogger()->trace("Rule clause '{}' matched pattern {}", text, rule->pattern);
                return rule;
            }
        }
        return std::nullopt;
    }

} // namespace strategy_engine
