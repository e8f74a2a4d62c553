#include <gtest/gtest.h>

#include <algorithm>

#include "signal_compiler.hpp"
#include "strategy_graph.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

using namespace strategy_engine;
using nlohmann::json;

namespace {

    BacktestParameters defaultParams() {
        return parametersFromJson({{"start_date", "2023-01-01"}, {"end_date", "2023-06-01"}});
    }

    SignalSpecification compileGraph(const json& raw, const BacktestParameters& params = defaultParams()) {
        return RuleSignalCompiler().compile(StrategyGraphValidator::normalize(raw), params);
    }

    bool hasDiagnostic(const SignalSpecification& spec, const std::string& fragment) {
        return std::any_of(spec.diagnostics.begin(), spec.diagnostics.end(),
                           [&](const std::string& d) { return d.find(fragment) != std::string::npos; });
    }

    std::vector<std::string> indicatorNames(const SignalSpecification& spec) {
        std::vector<std::string> names;
        for (const auto& def : spec.indicators) names.push_back(def.name);
        return names;
    }

} // namespace

TEST(SignalCompilerTest, CompilesCrossoverWithThresholds) {
    SignalSpecification spec = compileGraph(test_helpers::scenarioAGraph());

    EXPECT_EQ(spec.asset.symbol, "BTC");
    EXPECT_EQ(spec.asset.provider_id, "bitcoin");
    EXPECT_EQ(spec.entry, (json{{"type", "CrossesAbove"}, {"operand1", "SMA(10)"}, {"operand2", "SMA(30)"}}));
    EXPECT_EQ(spec.exit, (json{{"type", "CrossesBelow"}, {"operand1", "SMA(10)"}, {"operand2", "SMA(30)"}}));
    EXPECT_EQ(indicatorNames(spec), (std::vector<std::string>{"SMA(10)", "SMA(30)"}));
    ASSERT_TRUE(spec.exit_thresholds.take_profit_pct.has_value());
    EXPECT_DOUBLE_EQ(*spec.exit_thresholds.take_profit_pct, 7.0);
    ASSERT_TRUE(spec.exit_thresholds.stop_loss_pct.has_value());
    EXPECT_DOUBLE_EQ(*spec.exit_thresholds.stop_loss_pct, 5.0);
    EXPECT_FALSE(spec.fallback_applied);
    EXPECT_TRUE(hasDiagnostic(spec, "Recognized ma_crossover"));
    ASSERT_EQ(spec.source_rules.size(), 1u);
}

TEST(SignalCompilerTest, CompilationIsDeterministic) {
    json raw = test_helpers::makeGraph("ETH", json::array({"RSI(14) below 30 and MACD crosses above signal",
                                                          "price above 50-day EMA"}));
    std::string first = compileGraph(raw).serialize();
    std::string second = compileGraph(raw).serialize();
    EXPECT_EQ(first, second);
}

TEST(SignalCompilerTest, CombinesClausesAndDeduplicatesIndicators) {
    json raw = test_helpers::makeGraph("ETH", json::array({"RSI(14) below 30, RSI(14) crosses below 25",
                                                          "5% drop"}));
    SignalSpecification spec = compileGraph(raw);

    EXPECT_EQ(spec.entry["type"], "AND");
    EXPECT_EQ(spec.entry["conditions"].size(), 3u);
    EXPECT_EQ(spec.exit["type"], "OR");
    EXPECT_EQ(spec.exit["conditions"].size(), 2u);
    EXPECT_EQ(indicatorNames(spec), (std::vector<std::string>{"RSI(14)"}));
}

TEST(SignalCompilerTest, MultiOutputIndicatorsUseTheirBaseName) {
    json raw = test_helpers::makeGraph("BTC", json::array({"MACD crosses above signal",
                                                          "price touches the lower bollinger band"}));
    SignalSpecification spec = compileGraph(raw);
    EXPECT_EQ(indicatorNames(spec), (std::vector<std::string>{"MACD(12,26,9)", "BBANDS(20,2)"}));
}

TEST(SignalCompilerTest, FallsBackWhenNothingIsRecognized) {
    SignalSpecification spec = compileGraph(test_helpers::makeGraph("BTC", json::array({"buy when it feels right"})));

    EXPECT_TRUE(spec.fallback_applied);
    EXPECT_EQ(spec.entry["operand1"], "SMA(10)");
    EXPECT_EQ(spec.entry["operand2"], "SMA(30)");
    EXPECT_TRUE(hasDiagnostic(spec, "Unrecognized rule text: 'buy when it feels right'"));
    EXPECT_TRUE(hasDiagnostic(spec, "applied default SMA(10)/SMA(30) crossover"));

    SignalSpecification empty = compileGraph(test_helpers::makeGraph("BTC", json::array()));
    EXPECT_TRUE(empty.fallback_applied);
}

TEST(SignalCompilerTest, StructuredRulesPassThrough) {
    json structured = {{"type", "Indicator"}, {"indicator1", "RSI(7)"}, {"op", "<"}, {"value", 20}};
    SignalSpecification spec = compileGraph(test_helpers::makeGraph("SOL", json::array({structured})));

    EXPECT_EQ(spec.entry, structured);
    EXPECT_TRUE(spec.exit.is_null());
    EXPECT_EQ(indicatorNames(spec), (std::vector<std::string>{"RSI(7)"}));

    json broken = {{"type", "Indicator"}, {"op", "<"}};
    EXPECT_THROW(compileGraph(test_helpers::makeGraph("SOL", json::array({broken}))), core::CompileException);

    json unknown_indicator = {{"type", "Indicator"}, {"indicator1", "VWAP(5)"}, {"op", "<"}, {"value", 20}};
    EXPECT_THROW(compileGraph(test_helpers::makeGraph("SOL", json::array({unknown_indicator}))),
                 core::CompileException);
}

TEST(SignalCompilerTest, CapitalNodeOverridesSubmittedCapital) {
    std::vector<json> extras;
    extras.push_back({{"id", "cap"}, {"type", "capital"}, {"meta", {{"amount", 2500}}}});
    SignalSpecification spec = compileGraph(test_helpers::makeGraph("BTC", json::array({"golden cross"}), extras),
                                            parametersFromJson({{"start_date", "2022-01-01"},
                                                                {"end_date", "2023-06-01"},
                                                                {"initial_capital", 10000}}));
    EXPECT_DOUBLE_EQ(spec.parameters.initial_capital, 2500.0);
    EXPECT_TRUE(hasDiagnostic(spec, "Capital node sets initial capital to 2500"));
}

TEST(SignalCompilerTest, RejectsUnsupportedCategory) {
    EXPECT_THROW(compileGraph(test_helpers::makeGraph("Dogwifhat", json::array({"RSI below 30"}))),
                 core::CompileException);
}

TEST(SignalCompilerTest, RejectsWindowsLongerThanTheRange) {
    auto short_range = parametersFromJson({{"start_date", "2023-01-01"}, {"end_date", "2023-01-20"}});
    EXPECT_THROW(compileGraph(test_helpers::scenarioAGraph(), short_range), core::CompileException);

    // The 50/200 golden cross does not fit five months
    EXPECT_THROW(compileGraph(test_helpers::makeGraph("BTC", json::array({"golden cross"}))), core::CompileException);
}

TEST(SignalCompilerTest, RejectsInvalidParameters) {
    BacktestParameters reversed = defaultParams();
    std::swap(reversed.start_date, reversed.end_date);
    EXPECT_THROW(compileGraph(test_helpers::scenarioAGraph(), reversed), core::CompileException);

    BacktestParameters no_capital = defaultParams();
    no_capital.initial_capital = 0.0;
    EXPECT_THROW(compileGraph(test_helpers::scenarioAGraph(), no_capital), core::CompileException);

    BacktestParameters costly = defaultParams();
    costly.fee_rate = 0.6;
    costly.slippage_rate = 0.5;
    EXPECT_THROW(compileGraph(test_helpers::scenarioAGraph(), costly), core::CompileException);

    EXPECT_THROW(parametersFromJson({{"start_date", "2023-01-01"}, {"position_sizing", "martingale"}}),
                 core::CompileException);
}

TEST(SignalSpecificationTest, JsonFormIsReadBackByTheWorker) {
    SignalSpecification spec = compileGraph(test_helpers::scenarioAGraph());
    SignalSpecification restored = SignalSpecification::fromJson(json::parse(spec.serialize()));

    EXPECT_EQ(restored.asset.provider_id, spec.asset.provider_id);
    EXPECT_EQ(restored.entry, spec.entry);
    EXPECT_EQ(restored.exit, spec.exit);
    EXPECT_EQ(indicatorNames(restored), indicatorNames(spec));
    ASSERT_TRUE(restored.exit_thresholds.stop_loss_pct.has_value());
    EXPECT_DOUBLE_EQ(*restored.exit_thresholds.stop_loss_pct, 5.0);
    EXPECT_EQ(restored.parameters.start_date, "2023-01-01");

    EXPECT_THROW(SignalSpecification::fromJson({{"asset", "BTC"}}), core::CompileException);
}

TEST(SignalCompilerTest, IndicatorSpellingsAreRewrittenToTheWorkerKeys) {
    json bands = {{"type", "PriceIndicator"}, {"field", "Close"}, {"op", "<="}, {"indicator", "BBANDS(20,2.0).lower"}};
    SignalSpecification bands_spec = compileGraph(test_helpers::makeGraph("BTC", json::array({bands})));
    EXPECT_EQ(bands_spec.entry["indicator"], "BBANDS(20,2).lower");
    EXPECT_EQ(indicatorNames(bands_spec), (std::vector<std::string>{"BBANDS(20,2)"}));
    EXPECT_TRUE(hasDiagnostic(bands_spec, "'BBANDS(20,2.0).lower' written as 'BBANDS(20,2).lower'"));

    json cross = {{"type", "CrossesAbove"}, {"operand1", "SMA( 10)"}, {"operand2", "SMA(030)"}};
    SignalSpecification cross_spec = compileGraph(test_helpers::makeGraph("BTC", json::array({cross})));
    EXPECT_EQ(cross_spec.entry, (json{{"type", "CrossesAbove"}, {"operand1", "SMA(10)"}, {"operand2", "SMA(30)"}}));
    EXPECT_EQ(indicatorNames(cross_spec), (std::vector<std::string>{"SMA(10)", "SMA(30)"}));

    json macd = {{"type", "CrossesAbove"}, {"operand1", "MACD(12, 26, 9).hist"}, {"value", 0}};
    SignalSpecification macd_spec = compileGraph(test_helpers::makeGraph("BTC", json::array({macd})));
    EXPECT_EQ(macd_spec.entry["operand1"], "MACD(12,26,9).hist");

    // The rewritten document reads back with the same keys
    SignalSpecification restored = SignalSpecification::fromJson(json::parse(bands_spec.serialize()));
    EXPECT_EQ(restored.entry["indicator"], "BBANDS(20,2).lower");
    EXPECT_EQ(indicatorNames(restored), (std::vector<std::string>{"BBANDS(20,2)"}));
}

TEST(SignalCompilerTest, RejectsUnusableIndicatorParameters) {
    auto compileReference = [](const std::string& indicator) {
        json rule = {{"type", "PriceIndicator"}, {"field", "Close"}, {"op", "<="}, {"indicator", indicator}};
        return compileGraph(test_helpers::makeGraph("BTC", json::array({rule})));
    };
    EXPECT_THROW(compileReference("SMA(2.5)"), core::CompileException);
    EXPECT_THROW(compileReference("SMA(99999999999)"), core::CompileException);
    EXPECT_THROW(compileReference("SMA(" + std::string(400, '9') + ")"), core::CompileException);
    EXPECT_THROW(compileReference("SMA(1.2.3)"), core::CompileException);
    EXPECT_THROW(compileReference("BBANDS(20,2).sideways"), core::CompileException);
    EXPECT_THROW(compileReference("RSI(14).hist"), core::CompileException);
    EXPECT_NO_THROW(compileReference("SMA(1)"));
}

TEST(SignalCompilerTest, RejectsWindowsTooShortForTheIndicator) {
    auto compileRule = [](const json& rule) {
        return compileGraph(test_helpers::makeGraph("BTC", json::array({rule})));
    };
    EXPECT_THROW(compileRule("RSI(1) below 30"), core::CompileException);
    EXPECT_THROW(compileRule("price touches the lower 1-day bollinger band"), core::CompileException);
    EXPECT_THROW(compileRule("5% drop from the 1-day high"), core::CompileException);
    EXPECT_THROW(compileRule(json{{"type", "CrossesAbove"}, {"operand1", "MACD(1,26,9).hist"}, {"value", 0}}),
                 core::CompileException);

    EXPECT_NO_THROW(compileRule("RSI(2) below 30"));
    EXPECT_NO_THROW(compileRule("5% drop from the 2-day high"));
    EXPECT_NO_THROW(compileRule(json{{"type", "CrossesAbove"}, {"operand1", "MACD(12,26,1).hist"}, {"value", 0}}));
}

TEST(IndicatorDefinitionTest, NamesComeBackInCanonicalSpelling) {
    EXPECT_EQ(indicatorDefinitionFromName(" EMA ( 021 ) ").name, "EMA(21)");
    IndicatorDefinition macd = indicatorDefinitionFromName("MACD(12, 26, 9)");
    EXPECT_EQ(macd.name, "MACD(12,26,9)");
    EXPECT_EQ(macd.window, 26);
    EXPECT_EQ(indicatorDefinitionFromName("BBANDS(20,2.5)").name, "BBANDS(20,2.5)");
    EXPECT_EQ(canonicalIndicatorOutput("BBANDS(20, 2.0).upper"), "BBANDS(20,2).upper");

    EXPECT_THROW(indicatorDefinitionFromName("SMA(0)"), std::invalid_argument);
    EXPECT_THROW(indicatorDefinitionFromName("SMA(100001)"), std::invalid_argument);
    EXPECT_THROW(indicatorDefinitionFromName("MACD(12.5,26,9)"), std::invalid_argument);
    EXPECT_THROW(canonicalIndicatorOutput("Close"), std::invalid_argument);
}
