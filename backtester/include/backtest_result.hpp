#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "datatypes.hpp"

namespace backtester {

    using json = nlohmann::json;

    struct EquityPoint {
        core::Timestamp timestamp;
        double value = 0.0;      // Strategy portfolio value
        double benchmark = 0.0;  // Buy-and-hold value of the same capital
        double price = 0.0;      // Close of the bar
    };

    struct DrawdownPoint {
        core::Timestamp timestamp;
        double drawdown_pct = 0.0;  // <= 0, relative to the running peak
    };

    // One execution leg in the trade ledger
    struct LedgerEntry {
        core::Timestamp timestamp;
        core::TradeSide side = core::TradeSide::Buy;
        double price = 0.0;
        double quantity = 0.0;
        double notional = 0.0;     // price * quantity
        double fees = 0.0;         // fee + slippage charged on this leg
        double return_pct = 0.0;   // SELL legs: return of the round trip
        core::ExitReason exit_reason = core::ExitReason::None;
    };

    struct MonthlyReturn {
        std::string month;  // "YYYY-MM"
        double return_pct = 0.0;
    };

    // --- Backtest Metrics Struct ---
    struct BacktestMetrics {
        double total_return_pct = 0.0;
        double cagr_pct = 0.0;
        double sharpe_ratio = 0.0;
        double max_drawdown_pct = 0.0;      // Positive magnitude
        int max_drawdown_duration = 0;      // Bars from peak to recovery (or to the end)
        double win_rate_pct = 0.0;
        int trade_count = 0;                // Closed round trips
        double benchmark_return_pct = 0.0;
        double vs_benchmark_pct = 0.0;      // total return - benchmark return
        double profit_factor = 0.0;         // Gross profit / gross loss, 0 without losses
        double total_invested = 0.0;
        double total_gain = 0.0;            // Sum of winning round-trip pnl
        double total_loss = 0.0;            // Magnitude of losing round-trip pnl
        double final_equity = 0.0;

        void logMetrics() const;
    };

    struct BacktestResult {
        std::string symbol;
        std::vector<EquityPoint> equity_series;
        std::vector<DrawdownPoint> drawdown_series;
        std::vector<LedgerEntry> ledger;
        std::vector<core::Trade> round_trips;
        std::vector<MonthlyReturn> monthly_returns;
        BacktestMetrics metrics;

        json toJson() const;
        // Throws DataLoadException on a malformed document
        static BacktestResult fromJson(const json& j);
    };

    json metricsToJson(const BacktestMetrics& metrics);

} // namespace backtester
