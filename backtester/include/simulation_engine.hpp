#pragma once

#include <optional>
#include <string>
#include <vector>

#include "datatypes.hpp"
#include "common_types.hpp"
#include "backtest_result.hpp"

namespace backtester {

    struct SimulationConfig {
        std::string symbol;
        double initial_capital = 10000.0;
        double fee_rate = 0.001;
        double slippage_rate = 0.001;
        double exposure = 1.0;
        strategy_engine::SizingMethod sizing = strategy_engine::SizingMethod::InitialCapital;
        std::optional<double> take_profit_pct;  // Positive magnitude above entry
        std::optional<double> stop_loss_pct;    // Positive magnitude below entry
    };

    // Single-asset, long-only portfolio simulation over aligned close prices and
    // entry/exit flags. Fills happen at the bar's close.
    class SimulationEngine {
    public:
        explicit SimulationEngine(SimulationConfig config);

        // All four series must have the same non-zero length, timestamps strictly
        // increasing and prices positive. Throws ExecutionException otherwise.
        BacktestResult run(const std::vector<core::Timestamp>& timestamps,
                           const std::vector<double>& closes,
                           const std::vector<bool>& entries,
                           const std::vector<bool>& exits) const;

        const SimulationConfig& getConfig() const { return config_; }

    private:
        SimulationConfig config_;

        core::ExitReason exitReason(double entry_price, double close, bool exit_signal, bool last_bar) const;
    };

} // namespace backtester
