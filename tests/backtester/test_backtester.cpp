#include <gtest/gtest.h>

#include <algorithm>

#include "backtester.hpp"
#include "signal_compiler.hpp"
#include "strategy_graph.hpp"
#include "synthetic_market_data_provider.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

using backtester::Backtester;
using strategy_engine::SignalSpecification;
using nlohmann::json;

namespace {

    // 40 falling bars then 30 rising bars: one golden cross on the way up
    std::vector<double> valleyCloses() {
        std::vector<double> closes = test_helpers::ramp(200.0, -1.0, 40);
        std::vector<double> rise = test_helpers::ramp(163.0, 3.0, 30);
        closes.insert(closes.end(), rise.begin(), rise.end());
        return closes;
    }

    SignalSpecification compileScenario(const json& graph) {
        auto params = strategy_engine::parametersFromJson({{"start_date", "2023-01-01"}, {"end_date", "2023-03-11"}});
        return strategy_engine::RuleSignalCompiler().compile(
            strategy_engine::StrategyGraphValidator::normalize(graph), params);
    }

} // namespace

TEST(BacktesterTest, CrossoverEntryExitsAtTakeProfit) {
    Backtester backtester(compileScenario(test_helpers::scenarioAGraph()));
    EXPECT_EQ(backtester.getMaxLookback(), 29);

    auto candles = test_helpers::makeCandles(valleyCloses());
    auto result = backtester.run(candles);

    EXPECT_EQ(result.symbol, "BTC");
    ASSERT_EQ(result.equity_series.size(), candles.size());
    ASSERT_EQ(result.round_trips.size(), 1u);
    const core::Trade& trade = result.round_trips.front();
    EXPECT_EQ(trade.exit_reason, core::ExitReason::TakeProfit);
    EXPECT_GE(trade.exit_price, trade.entry_price * 1.07);
    EXPECT_GT(trade.pnl, 0.0);
    EXPECT_EQ(result.ledger.size(), 2u);
    EXPECT_EQ(result.metrics.trade_count, 1);
    EXPECT_GT(result.metrics.total_return_pct, 0.0);
}

TEST(BacktesterTest, NoSignalsKeepsCapitalIntact) {
    auto spec = compileScenario(test_helpers::scenarioAGraph());
    Backtester backtester(spec);
    auto result = backtester.run(test_helpers::makeCandles(test_helpers::ramp(100.0, 1.0, 70)));

    EXPECT_TRUE(result.round_trips.empty());
    EXPECT_DOUBLE_EQ(result.metrics.final_equity, spec.parameters.initial_capital);
    EXPECT_GT(result.metrics.benchmark_return_pct, 0.0);
}

TEST(BacktesterTest, TooLittleHistoryIsAnExecutionError) {
    Backtester backtester(compileScenario(test_helpers::scenarioAGraph()));
    EXPECT_THROW(backtester.run(test_helpers::makeCandles(test_helpers::ramp(100.0, 1.0, 25))),
                 core::ExecutionException);
}

TEST(BacktesterTest, UnorderedCandlesAreRejected) {
    Backtester backtester(compileScenario(test_helpers::scenarioAGraph()));
    auto candles = test_helpers::makeCandles(valleyCloses());
    std::swap(candles[10], candles[11]);
    EXPECT_THROW(backtester.run(candles), core::ExecutionException);
}

TEST(BacktesterTest, MalformedConditionTreeIsRejected) {
    SignalSpecification spec = compileScenario(test_helpers::scenarioAGraph());
    spec.entry = json{{"type", "CrossesAbove"}};
    EXPECT_THROW(Backtester{spec}, core::ExecutionException);

    SignalSpecification unknown = compileScenario(test_helpers::scenarioAGraph());
    unknown.indicators.push_back(strategy_engine::IndicatorDefinition{"VWAP", 5, {5.0}, "VWAP(5)"});
    EXPECT_THROW(Backtester{unknown}, core::ExecutionException);
}

TEST(BacktesterTest, ConditionSpellingsResolveToComputedIndicators) {
    auto candles = test_helpers::makeCandles(valleyCloses());
    auto reference = Backtester(compileScenario(test_helpers::scenarioAGraph())).run(candles);

    SignalSpecification spec = compileScenario(test_helpers::scenarioAGraph());
    spec.entry = json{{"type", "CrossesAbove"}, {"operand1", "SMA( 10)"}, {"operand2", "SMA(030)"}};
    spec.exit = json{{"type", "CrossesBelow"}, {"operand1", "SMA( 10)"}, {"operand2", "SMA(030)"}};
    auto result = Backtester(spec).run(candles);

    ASSERT_EQ(result.round_trips.size(), 1u);
    EXPECT_EQ(result.round_trips.front().entry_time, reference.round_trips.front().entry_time);
    EXPECT_DOUBLE_EQ(result.metrics.final_equity, reference.metrics.final_equity);
}

TEST(BacktesterTest, BandReferenceWithDecimalWidthTrades) {
    // Calm 100/102 chop, then a plunge through the lower band at bar 30
    std::vector<double> closes;
    for (int i = 0; i < 30; ++i) closes.push_back(i % 2 == 0 ? 100.0 : 102.0);
    for (double close : {80.0, 81.0, 82.0, 83.0, 84.0}) closes.push_back(close);
    auto candles = test_helpers::makeCandles(closes);

    SignalSpecification spec = compileScenario(test_helpers::scenarioAGraph());
    spec.indicators.clear();
    spec.entry = json{{"type", "PriceIndicator"}, {"field", "Close"}, {"op", "<="}, {"indicator", "BBANDS(20,2.0).lower"}};
    spec.exit = json();
    spec.exit_thresholds = strategy_engine::ExitThresholds{};

    auto result = Backtester(spec).run(candles);
    ASSERT_EQ(result.ledger.size(), 2u);
    EXPECT_EQ(result.ledger.front().side, core::TradeSide::Buy);
    EXPECT_EQ(result.ledger.front().timestamp, candles[30].timestamp);
}

TEST(BacktesterTest, LedgerAndEquitySeriesStayConsistentOverManyTrades) {
    SignalSpecification spec = compileScenario(test_helpers::makeGraph(
        "BTC", json::array({json{{"type", "PriceChange"}, {"op", ">"}, {"value", 0}}})));
    spec.exit = json{{"type", "PriceChange"}, {"op", "<"}, {"value", 0}};
    auto candles = data::SyntheticMarketDataProvider().fetchDailyCandles(
        spec.asset, core::utils::dateToTimestamp("2023-01-01"), core::utils::dateToTimestamp("2023-06-01"));

    auto result = Backtester(spec).run(candles);

    ASSERT_EQ(result.equity_series.size(), candles.size());
    for (size_t i = 1; i < result.equity_series.size(); ++i) {
        EXPECT_LT(result.equity_series[i - 1].timestamp, result.equity_series[i].timestamp) << "bar " << i;
    }

    ASSERT_GE(result.ledger.size(), 4u);
    EXPECT_EQ(result.ledger.size() % 2, 0u);
    for (size_t i = 0; i < result.ledger.size(); ++i) {
        // Buys and sells alternate, starting flat: no sell without an open buy
        EXPECT_EQ(result.ledger[i].side, i % 2 == 0 ? core::TradeSide::Buy : core::TradeSide::Sell) << "leg " << i;
        const auto& when = result.ledger[i].timestamp;
        EXPECT_TRUE(std::any_of(result.equity_series.begin(), result.equity_series.end(),
                                [&](const backtester::EquityPoint& p) { return p.timestamp == when; }))
            << "leg " << i << " has no equity point";
    }
    EXPECT_EQ(result.metrics.trade_count, static_cast<int>(result.ledger.size() / 2));
}

TEST(BacktesterTest, RepeatedRunsAgree) {
    SignalSpecification spec = compileScenario(test_helpers::scenarioAGraph());
    auto candles = data::SyntheticMarketDataProvider().fetchDailyCandles(
        spec.asset, core::utils::dateToTimestamp("2023-01-01"), core::utils::dateToTimestamp("2023-06-01"));

    auto first = Backtester(spec).run(candles);
    auto second = Backtester(spec).run(candles);
    EXPECT_EQ(first.ledger.size(), second.ledger.size());
    EXPECT_DOUBLE_EQ(first.metrics.total_return_pct, second.metrics.total_return_pct);
    EXPECT_DOUBLE_EQ(first.metrics.sharpe_ratio, second.metrics.sharpe_ratio);
    EXPECT_DOUBLE_EQ(first.metrics.max_drawdown_pct, second.metrics.max_drawdown_pct);
    EXPECT_EQ(first.toJson(), second.toJson());
}
