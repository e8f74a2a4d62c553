#include "backtester.hpp"
#include "condition_factory.hpp"
#include "indicator_factory.hpp"
#include "simulation_engine.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <stdexcept>

namespace backtester {

    Backtester::Backtester(strategy_engine::SignalSpecification spec)
        : spec_(std::move(spec))
    {
        resolveIndicatorReferences();
        try {
            entry_rule_ = strategy_engine::ConditionFactory::createRule("entry", spec_.entry,
                                                                        core::SignalAction::EnterLong);
            if (!spec_.exit.is_null()) {
                exit_rule_ = strategy_engine::ConditionFactory::createRule("exit", spec_.exit,
                                                                           core::SignalAction::ExitLong);
            }
        } catch (const std::invalid_argument& e) {
            throw core::ExecutionException(std::string("Signal specification has an invalid condition: ") + e.what());
        }
        createIndicators();
        core::logging::getLogger()->debug("Backtester ready: {}, {}", entry_rule_->describe(),
                                          exit_rule_ ? exit_rule_->describe() : "no exit rule");
    }

    // Condition trees may spell an indicator differently from the key its outputs
    // are stored under ("SMA( 10)" vs "SMA(10)"), or reference one the indicator
    // list does not declare. Both are settled here, before anything is evaluated.
    void Backtester::resolveIndicatorReferences() {
        std::vector<std::string> referenced;
        strategy_engine::ConditionFactory::collectIndicatorNames(spec_.entry, referenced);
        strategy_engine::ConditionFactory::collectIndicatorNames(spec_.exit, referenced);

        std::map<std::string, std::string> renames;
        for (const auto& output : referenced) {
            std::string canonical;
            strategy_engine::IndicatorDefinition def;
            try {
                canonical = strategy_engine::canonicalIndicatorOutput(output);
                def = strategy_engine::indicatorDefinitionFromName(canonical.substr(0, canonical.find(')') + 1));
            } catch (const std::invalid_argument& e) {
                throw core::ExecutionException(fmt::format("Signal specification references '{}': {}", output, e.what()));
            }
            if (canonical != output) renames[output] = canonical;
            if (std::find(spec_.indicators.begin(), spec_.indicators.end(), def) == spec_.indicators.end()) {
                spec_.indicators.push_back(def);
            }
        }
        strategy_engine::ConditionFactory::renameIndicators(spec_.entry, renames);
        strategy_engine::ConditionFactory::renameIndicators(spec_.exit, renames);
    }

    void Backtester::createIndicators() {
        auto logger = core::logging::getLogger();
        for (const auto& def : spec_.indicators) {
            if (indicators_.count(def.name)) continue;
            try {
                indicators_[def.name] = indicators::createIndicator(def.name);
            } catch (const core::IndicatorCalculationException& e) {
                throw core::ExecutionException(fmt::format("Cannot create indicator '{}': {}", def.name, e.what()));
            }
            logger->debug("Created indicator {} (lookback {})", def.name, indicators_[def.name]->getLookback());
        }
    }

    int Backtester::getMaxLookback() const {
        int max_lookback = 0;
        for (const auto& pair : indicators_) {
            max_lookback = std::max(max_lookback, pair.second->getLookback());
        }
        return max_lookback;
    }

    void Backtester::calculateIndicators(const core::TimeSeries<core::Candle>& candles) {
        auto logger = core::logging::getLogger();
        outputs_.clear();
        for (auto& pair : indicators_) {
            auto& indicator = pair.second;
            try {
                indicator->calculate(candles);
            } catch (const core::IndicatorCalculationException& e) {
                throw core::ExecutionException(fmt::format("Indicator {} failed: {}", pair.first, e.what()));
            }
            for (const auto& output_name : indicator->getOutputNames()) {
                const auto& series = indicator->getOutput(output_name);
                if (series.size() > candles.size()) {
                    throw core::ExecutionException(fmt::format("Indicator {} produced more values than bars", output_name));
                }
                outputs_[output_name] = OutputSeries{&series, candles.size() - series.size()};
            }
            logger->info(" -> Calculated {} result points for {}.", indicator->getResult().size(), pair.first);
        }
    }

    void Backtester::fillIndicatorValues(size_t bar, std::map<std::string, double>& values) const {
        for (const auto& pair : outputs_) {
            const OutputSeries& output = pair.second;
            if (bar >= output.first_bar) {
                values[pair.first] = (*output.values)[bar - output.first_bar];
            }
        }
    }

    BacktestResult Backtester::run(const core::TimeSeries<core::Candle>& candles) {
        auto logger = core::logging::getLogger();
        logger->info("Starting backtest of {} over {} candles", spec_.asset.symbol, candles.size());

        const int max_lookback = getMaxLookback();
        if (candles.size() < static_cast<size_t>(max_lookback) + 2) {
            throw core::ExecutionException(fmt::format(
                "Not enough price history: {} bars, indicators need at least {}", candles.size(), max_lookback + 2));
        }
        for (size_t i = 1; i < candles.size(); ++i) {
            if (!(candles[i - 1].timestamp < candles[i].timestamp)) {
                throw core::ExecutionException(fmt::format("Candles out of order at index {} ({})", i,
                                                           core::utils::timestampToString(candles[i].timestamp)));
            }
        }

        calculateIndicators(candles);

        // --- Evaluate entry/exit per bar ---
        const size_t n = candles.size();
        std::vector<core::Timestamp> timestamps(n);
        std::vector<double> closes(n);
        std::vector<bool> entries(n, false);
        std::vector<bool> exits(n, false);
        size_t entry_count = 0;
        size_t exit_count = 0;

        std::map<std::string, double> previous_values;
        for (size_t i = 0; i < n; ++i) {
            strategy_engine::MarketDataSnapshot snapshot;
            snapshot.current_time = candles[i].timestamp;
            snapshot.current_candle = &candles[i];
            snapshot.previous_candle = i > 0 ? &candles[i - 1] : nullptr;
            fillIndicatorValues(i, snapshot.indicator_values);
            snapshot.indicator_values_prev = previous_values;

            timestamps[i] = candles[i].timestamp;
            closes[i] = candles[i].close;
            entries[i] = entry_rule_->evaluate(snapshot) == core::SignalAction::EnterLong;
            exits[i] = exit_rule_ && exit_rule_->evaluate(snapshot) == core::SignalAction::ExitLong;
            if (entries[i]) ++entry_count;
            if (exits[i]) ++exit_count;

            previous_values = std::move(snapshot.indicator_values);
        }
        logger->info("Entry signals: {}, exit signals: {}", entry_count, exit_count);

        SimulationConfig config;
        config.symbol = spec_.asset.symbol;
        config.initial_capital = spec_.parameters.initial_capital;
        config.fee_rate = spec_.parameters.fee_rate;
        config.slippage_rate = spec_.parameters.slippage_rate;
        config.exposure = spec_.parameters.exposure;
        config.sizing = spec_.parameters.sizing;
        config.take_profit_pct = spec_.exit_thresholds.take_profit_pct;
        config.stop_loss_pct = spec_.exit_thresholds.stop_loss_pct;

        return SimulationEngine(config).run(timestamps, closes, entries, exits);
    }

} // namespace backtester
