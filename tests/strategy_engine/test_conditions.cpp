#include <gtest/gtest.h>

#include <stdexcept>

#include "condition_factory.hpp"
#include "composite_condition.hpp"
#include "indicator_condition.hpp"
#include "indicator_cross_condition.hpp"
#include "price_change_condition.hpp"
#include "price_condition.hpp"
#include "price_indicator_condition.hpp"
#include "test_helpers.hpp"

using namespace strategy_engine;
using nlohmann::json;

namespace {

    class ConditionTest : public ::testing::Test {
    protected:
        void SetUp() override {
            candles_ = test_helpers::makeCandles({100.0, 94.0});
            snapshot_.current_time = candles_[1].timestamp;
            snapshot_.current_candle = &candles_[1];
            snapshot_.previous_candle = &candles_[0];
        }

        core::TimeSeries<core::Candle> candles_;
        MarketDataSnapshot snapshot_;
    };

} // namespace

TEST_F(ConditionTest, PriceConditionComparesFieldsAndValues) {
    EXPECT_TRUE(PriceCondition(PriceField::Close, ComparisonOp::LT, 95.0).evaluate(snapshot_));
    EXPECT_FALSE(PriceCondition(PriceField::Close, ComparisonOp::GT, 95.0).evaluate(snapshot_));
    // open is the previous close (100) in the helper candles
    EXPECT_TRUE(PriceCondition(PriceField::Close, ComparisonOp::LT, PriceField::Open).evaluate(snapshot_));
}

TEST_F(ConditionTest, IndicatorConditionNeedsWarmValues) {
    IndicatorCondition rsi_low("RSI(14)", ComparisonOp::LT, 30.0);
    EXPECT_FALSE(rsi_low.evaluate(snapshot_));

    snapshot_.indicator_values["RSI(14)"] = 25.0;
    EXPECT_TRUE(rsi_low.evaluate(snapshot_));

    IndicatorCondition fast_over_slow("SMA(10)", ComparisonOp::GT, std::string("SMA(30)"));
    snapshot_.indicator_values["SMA(10)"] = 105.0;
    EXPECT_FALSE(fast_over_slow.evaluate(snapshot_));
    snapshot_.indicator_values["SMA(30)"] = 101.0;
    EXPECT_TRUE(fast_over_slow.evaluate(snapshot_));

    EXPECT_THROW(IndicatorCondition("SMA(10)", ComparisonOp::GT, std::string("SMA(10)")), std::invalid_argument);
}

TEST_F(ConditionTest, CrossFiresOnlyOnTheCrossingBar) {
    IndicatorCrossCondition golden("SMA(10)", CrossType::CrossesAbove, std::string("SMA(30)"));

    snapshot_.indicator_values_prev = {{"SMA(10)", 99.0}, {"SMA(30)", 100.0}};
    snapshot_.indicator_values = {{"SMA(10)", 101.0}, {"SMA(30)", 100.0}};
    EXPECT_TRUE(golden.evaluate(snapshot_));

    // Already above on the previous bar
    snapshot_.indicator_values_prev = {{"SMA(10)", 100.5}, {"SMA(30)", 100.0}};
    EXPECT_FALSE(golden.evaluate(snapshot_));

    // No previous value yet
    snapshot_.indicator_values_prev.clear();
    EXPECT_FALSE(golden.evaluate(snapshot_));
}

TEST_F(ConditionTest, CrossAgainstLevelAndPriceField) {
    IndicatorCrossCondition rsi_down("RSI(14)", CrossType::CrossesBelow, 30.0);
    snapshot_.indicator_values_prev["RSI(14)"] = 32.0;
    snapshot_.indicator_values["RSI(14)"] = 28.0;
    EXPECT_TRUE(rsi_down.evaluate(snapshot_));
    EXPECT_EQ(rsi_down.describe(), "RSI(14) CrossesBelow 30");

    // Close went 100 -> 94 through a flat 97 average
    IndicatorCrossCondition close_down("Close", CrossType::CrossesBelow, std::string("SMA(5)"));
    snapshot_.indicator_values_prev["SMA(5)"] = 97.0;
    snapshot_.indicator_values["SMA(5)"] = 97.0;
    EXPECT_TRUE(close_down.evaluate(snapshot_));
}

TEST_F(ConditionTest, PriceIndicatorAppliesOffset) {
    snapshot_.indicator_values["MAX(20)"] = 105.0;
    // 94 <= 105 * 0.9 = 94.5
    EXPECT_TRUE(PriceIndicatorCondition(PriceField::Close, ComparisonOp::LTE, "MAX(20)", -10.0).evaluate(snapshot_));
    // 105 * 0.85 = 89.25
    EXPECT_FALSE(PriceIndicatorCondition(PriceField::Close, ComparisonOp::LTE, "MAX(20)", -15.0).evaluate(snapshot_));
    EXPECT_THROW(PriceIndicatorCondition(PriceField::Close, ComparisonOp::LTE, "MAX(20)", -100.0),
                 std::invalid_argument);
}

TEST_F(ConditionTest, PriceChangeMeasuresBarOverBar) {
    // 100 -> 94 is -6%
    EXPECT_TRUE(PriceChangeCondition(ComparisonOp::LTE, -5.0).evaluate(snapshot_));
    EXPECT_FALSE(PriceChangeCondition(ComparisonOp::LTE, -7.0).evaluate(snapshot_));

    snapshot_.previous_candle = nullptr;
    EXPECT_FALSE(PriceChangeCondition(ComparisonOp::LTE, -5.0).evaluate(snapshot_));
}

TEST_F(ConditionTest, CompositeCombinesChildren) {
    snapshot_.indicator_values["RSI(14)"] = 25.0;

    std::vector<std::unique_ptr<ICondition>> both;
    both.push_back(std::make_unique<IndicatorCondition>("RSI(14)", ComparisonOp::LT, 30.0));
    both.push_back(std::make_unique<PriceCondition>(PriceField::Close, ComparisonOp::GT, 95.0));
    CompositeCondition and_condition(LogicalOp::And, std::move(both));
    EXPECT_FALSE(and_condition.evaluate(snapshot_));

    std::vector<std::unique_ptr<ICondition>> either;
    either.push_back(std::make_unique<IndicatorCondition>("RSI(14)", ComparisonOp::LT, 30.0));
    either.push_back(std::make_unique<PriceCondition>(PriceField::Close, ComparisonOp::GT, 95.0));
    CompositeCondition or_condition(LogicalOp::Or, std::move(either));
    EXPECT_TRUE(or_condition.evaluate(snapshot_));
    EXPECT_EQ(or_condition.size(), 2u);
}

TEST_F(ConditionTest, FactoryBuildsTreesFromJson) {
    json config = {
        {"type", "OR"},
        {"conditions", json::array({
            {{"type", "Indicator"}, {"indicator1", "RSI(14)"}, {"op", "<"}, {"value", 30}},
            {{"type", "PriceChange"}, {"op", "<="}, {"value", -5}}
        })}
    };
    auto condition = ConditionFactory::parseCondition(config);
    ASSERT_NE(condition, nullptr);
    EXPECT_TRUE(condition->evaluate(snapshot_));  // the -6% move

    auto rule = ConditionFactory::createRule("entry", config, core::SignalAction::EnterLong);
    EXPECT_EQ(rule->getName(), "entry");
    EXPECT_EQ(rule->evaluate(snapshot_), core::SignalAction::EnterLong);

    auto quiet = ConditionFactory::createRule("entry", {{"type", "PriceChange"}, {"op", ">="}, {"value", 1}},
                                              core::SignalAction::EnterLong);
    EXPECT_EQ(quiet->evaluate(snapshot_), core::SignalAction::None);
}

TEST_F(ConditionTest, FactoryRejectsMalformedNodes) {
    EXPECT_THROW(ConditionFactory::parseCondition(json::array()), std::invalid_argument);
    EXPECT_THROW(ConditionFactory::parseCondition({{"type", "Teleport"}}), std::invalid_argument);
    EXPECT_THROW(ConditionFactory::parseCondition({{"type", "Indicator"}, {"op", "<"}, {"value", 30}}),
                 std::invalid_argument);
    EXPECT_THROW(ConditionFactory::parseCondition({{"type", "AND"}, {"conditions", json::array()}}),
                 std::invalid_argument);
    EXPECT_THROW(ConditionFactory::parseCondition({{"type", "CrossesAbove"}, {"operand1", "SMA(10)"}}),
                 std::invalid_argument);
    EXPECT_THROW(ConditionFactory::parseCondition(
                     {{"type", "Indicator"}, {"indicator1", "RSI(14)"}, {"op", "~"}, {"value", 30}}),
                 std::invalid_argument);
}

TEST(ConditionFactoryTest, CollectsIndicatorNamesWithoutDuplicates) {
    json config = {
        {"type", "AND"},
        {"conditions", json::array({
            {{"type", "CrossesAbove"}, {"operand1", "SMA(10)"}, {"operand2", "SMA(30)"}},
            {{"type", "PriceIndicator"}, {"op", ">"}, {"indicator", "SMA(30)"}},
            {{"type", "CrossesBelow"}, {"operand1", "Close"}, {"operand2", "EMA(50)"}},
            {{"type", "PriceChange"}, {"op", "<="}, {"value", -3}}
        })}
    };
    std::vector<std::string> names;
    ConditionFactory::collectIndicatorNames(config, names);
    ASSERT_EQ(names.size(), 3u);
    EXPECT_EQ(names[0], "SMA(10)");
    EXPECT_EQ(names[1], "SMA(30)");
    EXPECT_EQ(names[2], "EMA(50)");
}
