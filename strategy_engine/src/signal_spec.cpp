#include "signal_spec.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>

#include <chrono>
#include <cmath>
#include <map>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace strategy_engine {

    namespace {

        const std::map<std::string, int> kPeriodDays = {
            {"1M", 30},
            {"3M", 90},
            {"6M", 180},
            {"1Y", 365},
        };

        double requireFinite(const json& j, const char* key, double fallback) {
            if (!j.contains(key) || j[key].is_null()) return fallback;
            if (!j[key].is_number()) {
                throw core::CompileException(fmt::format("Backtest parameter '{}' must be a number", key));
            }
            double value = j[key].get<double>();
            if (!std::isfinite(value)) {
                throw core::CompileException(fmt::format("Backtest parameter '{}' must be finite", key));
            }
            return value;
        }

        std::string optionalString(const json& j, const char* key, const std::string& fallback) {
            if (!j.contains(key) || j[key].is_null()) return fallback;
            if (!j[key].is_string()) {
                throw core::CompileException(fmt::format("Backtest parameter '{}' must be a string", key));
            }
            return j[key].get<std::string>();
        }

        core::Timestamp parseDate(const std::string& date, const char* what) {
            try {
                return core::utils::dateToTimestamp(date);
            } catch (const std::runtime_error& e) {
                throw core::CompileException(fmt::format("Invalid {}: {}", what, e.what()));
            }
        }

        json indicatorToJson(const IndicatorDefinition& def) {
            return json{{"kind", def.kind}, {"window", def.window}, {"params", def.params}, {"name", def.name}};
        }

    } // namespace

    IndicatorDefinition indicatorDefinitionFromName(const std::string& name) {
        static const std::regex kPattern(R"(^\s*([A-Z]+)\s*\(([0-9.,\s]+)\)\s*$)");
        std::smatch match;
        if (!std::regex_match(name, match, kPattern)) {
            throw std::invalid_argument("Not an indicator name: " + name);
        }

        IndicatorDefinition def;
        def.kind = match[1].str();
        std::stringstream ss(match[2].str());
        std::string token;
        while (std::getline(ss, token, ',')) {
            token = core::utils::trim(token);
            if (token.empty()) throw std::invalid_argument("Empty parameter in indicator name: " + name);
            size_t used = 0;
            double value = 0.0;
            try {
                value = std::stod(token, &used);
            } catch (const std::logic_error&) {
                throw std::invalid_argument(fmt::format("Parameter '{}' of {} is not a usable number", token, name));
            }
            if (used != token.size() || !std::isfinite(value)) {
                throw std::invalid_argument(fmt::format("Parameter '{}' of {} is not a usable number", token, name));
            }
            def.params.push_back(value);
        }

        size_t expected = 1;
        if (def.kind == "MACD") expected = 3;
        else if (def.kind == "BBANDS") expected = 2;
        else if (def.kind != "SMA" && def.kind != "EMA" && def.kind != "RSI" && def.kind != "MAX") {
            throw std::invalid_argument("Unsupported indicator kind: " + def.kind);
        }
        if (def.params.size() != expected) {
            throw std::invalid_argument(fmt::format("{} takes {} parameter(s), got {}", def.kind, expected, def.params.size()));
        }

        // Every parameter is a bar count except the Bollinger width
        std::vector<int> periods;
        for (size_t i = 0; i < def.params.size(); ++i) {
            if (def.kind == "BBANDS" && i == 1) continue;
            double p = def.params[i];
            if (p != std::floor(p) || p < 1.0 || p > kMaxIndicatorWindow) {
                throw std::invalid_argument(fmt::format(
                    "{} needs whole-bar periods between 1 and {}, got {}", def.kind, kMaxIndicatorWindow, p));
            }
            periods.push_back(static_cast<int>(p));
        }

        // Same spelling the indicator classes use for their output keys
        if (def.kind == "MACD") {
            def.name = fmt::format("MACD({},{},{})", periods[0], periods[1], periods[2]);
            def.window = periods[1];
        } else if (def.kind == "BBANDS") {
            def.name = fmt::format("BBANDS({},{:g})", periods[0], def.params[1]);
            def.window = periods[0];
        } else {
            def.name = fmt::format("{}({})", def.kind, periods[0]);
            def.window = periods[0];
        }
        return def;
    }

    std::string canonicalIndicatorOutput(const std::string& output) {
        auto close_paren = output.find(')');
        if (close_paren == std::string::npos) {
            throw std::invalid_argument("Not an indicator name: " + output);
        }
        std::string suffix = core::utils::trim(output.substr(close_paren + 1));
        return indicatorDefinitionFromName(output.substr(0, close_paren + 1)).name + suffix;
    }

    BacktestParameters parametersFromJson(const json& j) {
        if (!j.is_object()) {
            throw core::CompileException("Backtest parameters must be a JSON object");
        }
        BacktestParameters params;

        if (j.contains("symbols") && !j["symbols"].is_null()) {
            if (j["symbols"].is_string()) {
                params.symbols.push_back(j["symbols"].get<std::string>());
            } else if (j["symbols"].is_array()) {
                for (const auto& symbol : j["symbols"]) {
                    if (!symbol.is_string()) throw core::CompileException("Backtest parameter 'symbols' must hold strings");
                    params.symbols.push_back(symbol.get<std::string>());
                }
            } else {
                throw core::CompileException("Backtest parameter 'symbols' must be a string or an array");
            }
        }

        params.timeframe = optionalString(j, "timeframe", params.timeframe);
        params.start_date = optionalString(j, "start_date", "");
        params.end_date = optionalString(j, "end_date", "");
        params.initial_capital = requireFinite(j, "initial_capital", params.initial_capital);
        params.fee_rate = requireFinite(j, "fee_rate", params.fee_rate);
        params.slippage_rate = requireFinite(j, "slippage_rate", params.slippage_rate);
        params.exposure = requireFinite(j, "exposure", params.exposure);
        params.benchmark = optionalString(j, "benchmark", "");

        std::string sizing = optionalString(j, "position_sizing", sizingMethodToString(params.sizing));
        try {
            params.sizing = sizingMethodFromString(sizing);
        } catch (const std::invalid_argument& e) {
            throw core::CompileException(e.what());
        }

        std::string period = optionalString(j, "period", "");
        if (!period.empty() && params.start_date.empty()) {
            auto it = kPeriodDays.find(period);
            if (it == kPeriodDays.end()) {
                throw core::CompileException("Unknown period '" + period + "' (expected 1M, 3M, 6M or 1Y)");
            }
            if (params.end_date.empty()) {
                throw core::CompileException("A period needs an end_date to count back from");
            }
            core::Timestamp end = parseDate(params.end_date, "end_date");
            params.start_date = core::utils::timestampToDate(end - std::chrono::hours(24 * it->second));
        }
        return params;
    }

    json parametersToJson(const BacktestParameters& params) {
        json j;
        j["symbols"] = params.symbols;
        j["timeframe"] = params.timeframe;
        j["start_date"] = params.start_date;
        j["end_date"] = params.end_date;
        j["initial_capital"] = params.initial_capital;
        j["fee_rate"] = params.fee_rate;
        j["slippage_rate"] = params.slippage_rate;
        j["position_sizing"] = sizingMethodToString(params.sizing);
        j["exposure"] = params.exposure;
        j["benchmark"] = params.benchmark;
        return j;
    }

    void validateParameters(const BacktestParameters& params) {
        if (params.timeframe != "1D") {
            throw core::CompileException("Unsupported timeframe '" + params.timeframe + "' (only 1D)");
        }
        if (params.start_date.empty() || params.end_date.empty()) {
            throw core::CompileException("Backtest parameters need start_date and end_date");
        }
        core::Timestamp start = parseDate(params.start_date, "start_date");
        core::Timestamp end = parseDate(params.end_date, "end_date");
        if (!(start < end)) {
            throw core::CompileException(fmt::format("start_date {} must be before end_date {}",
                                                     params.start_date, params.end_date));
        }
        if (!(params.initial_capital > 0.0)) {
            throw core::CompileException(fmt::format("initial_capital must be positive (got {})", params.initial_capital));
        }
        if (params.fee_rate < 0.0 || params.fee_rate >= 1.0) {
            throw core::CompileException(fmt::format("fee_rate must be in [0, 1) (got {})", params.fee_rate));
        }
        if (params.slippage_rate < 0.0 || params.slippage_rate >= 1.0) {
            throw core::CompileException(fmt::format("slippage_rate must be in [0, 1) (got {})", params.slippage_rate));
        }
        if (params.fee_rate + params.slippage_rate >= 1.0) {
            throw core::CompileException("fee_rate + slippage_rate must stay below 1");
        }
        if (!(params.exposure > 0.0) || params.exposure > 1.0) {
            throw core::CompileException(fmt::format("exposure must be in (0, 1] (got {})", params.exposure));
        }
    }

    long long parameterSpanDays(const BacktestParameters& params) {
        core::Timestamp start = parseDate(params.start_date, "start_date");
        core::Timestamp end = parseDate(params.end_date, "end_date");
        return core::utils::daysBetween(start, end) + 1;
    }

    json SignalSpecification::toJson() const {
        json j;
        j["asset"] = {{"name", asset.name}, {"symbol", asset.symbol}, {"provider_id", asset.provider_id}};
        j["indicators"] = json::array();
        for (const auto& def : indicators) {
            j["indicators"].push_back(indicatorToJson(def));
        }
        j["entry"] = entry;
        j["exit"] = exit;
        j["exit_thresholds"] = {
            {"take_profit_pct", exit_thresholds.take_profit_pct ? json(*exit_thresholds.take_profit_pct) : json(nullptr)},
            {"stop_loss_pct", exit_thresholds.stop_loss_pct ? json(*exit_thresholds.stop_loss_pct) : json(nullptr)},
        };
        j["parameters"] = parametersToJson(parameters);
        j["risk_class"] = risk_class;
        j["source_rules"] = source_rules;
        j["fallback_applied"] = fallback_applied;
        j["diagnostics"] = diagnostics;
        return j;
    }

    SignalSpecification SignalSpecification::fromJson(const json& j) {
        try {
            SignalSpecification spec;
            const auto& asset = j.at("asset");
            spec.asset.name = asset.at("name").get<std::string>();
            spec.asset.symbol = asset.at("symbol").get<std::string>();
            spec.asset.provider_id = asset.at("provider_id").get<std::string>();

            for (const auto& def : j.at("indicators")) {
                spec.indicators.push_back(indicatorDefinitionFromName(def.at("name").get<std::string>()));
            }
            spec.entry = j.at("entry");
            spec.exit = j.value("exit", json());

            const auto& thresholds = j.value("exit_thresholds", json::object());
            if (thresholds.contains("take_profit_pct") && thresholds["take_profit_pct"].is_number()) {
                spec.exit_thresholds.take_profit_pct = thresholds["take_profit_pct"].get<double>();
            }
            if (thresholds.contains("stop_loss_pct") && thresholds["stop_loss_pct"].is_number()) {
                spec.exit_thresholds.stop_loss_pct = thresholds["stop_loss_pct"].get<double>();
            }

            spec.parameters = parametersFromJson(j.at("parameters"));
            spec.risk_class = j.value("risk_class", std::string());
            if (j.contains("source_rules") && j["source_rules"].is_array()) {
                for (const auto& rule : j["source_rules"]) spec.source_rules.push_back(rule);
            }
            spec.fallback_applied = j.value("fallback_applied", false);
            spec.diagnostics = j.value("diagnostics", std::vector<std::string>{});
            return spec;
        } catch (const json::exception& e) {
            throw core::CompileException(std::string("Malformed signal specification: ") + e.what());
        } catch (const std::invalid_argument& e) {
            throw core::CompileException(std::string("Malformed signal specification: ") + e.what());
        }
    }

    std::string SignalSpecification::serialize() const {
        return toJson().dump(2);
    }

} // namespace strategy_engine
