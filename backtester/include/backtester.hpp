#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>

#include "datatypes.hpp"
#include "interfaces.hpp"       // Strategy engine interfaces
#include "indicators.hpp"       // Indicator interface
#include "signal_spec.hpp"
#include "backtest_result.hpp"

namespace backtester {

    // Runs a compiled Signal Specification over daily candles: computes the
    // indicators, evaluates the entry/exit condition trees bar by bar and feeds
    // the resulting flags to the SimulationEngine. This is what the sandbox
    // worker executes.
    class Backtester {
    public:
        explicit Backtester(strategy_engine::SignalSpecification spec);

        // Throws ExecutionException when the series is too short for the
        // indicators or the signal specification cannot be evaluated.
        BacktestResult run(const core::TimeSeries<core::Candle>& candles);

        // Bars needed before every indicator has a value
        int getMaxLookback() const;

    private:
        strategy_engine::SignalSpecification spec_;
        std::unique_ptr<strategy_engine::IRule> entry_rule_;
        std::unique_ptr<strategy_engine::IRule> exit_rule_;  // May be null

        // Store required indicators, mapped by name (e.g., "SMA(10)")
        std::map<std::string, std::unique_ptr<indicators::IIndicator>> indicators_;

        // Output name -> {series, index of the input bar its first value belongs to}
        struct OutputSeries {
            const core::TimeSeries<double>* values = nullptr;
            size_t first_bar = 0;
        };
        std::map<std::string, OutputSeries> outputs_;

        // --- Private Helper Methods ---
        void resolveIndicatorReferences();
        void createIndicators();
        void calculateIndicators(const core::TimeSeries<core::Candle>& candles);
        void fillIndicatorValues(size_t bar, std::map<std::string, double>& values) const;
    };

} // namespace backtester
