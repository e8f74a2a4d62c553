#pragma once

#include <optional>
#include <string>
#include <vector>

#include "datatypes.hpp"
#include "backtest_result.hpp"

namespace backtester {

    // --- Open Position Info Struct ---
    // Stores details needed to calculate PnL when the position is closed
    struct OpenPosition {
        core::Timestamp entry_time;
        double quantity = 0.0;
        double entry_price = 0.0;
        double entry_notional = 0.0;  // Cash taken out at entry, costs included
        double entry_costs = 0.0;     // Fee + slippage paid on entry
    };

    // --- Portfolio Class Definition ---
    // Cash plus at most one long position in a single asset. Fee and slippage are
    // both charged as a fraction of the traded notional on every leg.
    class Portfolio {
    public:
        Portfolio(std::string symbol, double initial_capital, double fee_rate, double slippage_rate);

        // --- Getters ---
        double getCash() const { return cash_; }
        bool hasPosition() const { return position_.has_value(); }
        const std::optional<OpenPosition>& getPosition() const { return position_; }
        // Cash plus the position marked at `price`
        double getEquity(double price) const;
        int getTotalExecutions() const { return static_cast<int>(ledger_.size()); }
        const std::vector<LedgerEntry>& getLedger() const { return ledger_; }
        const std::vector<core::Trade>& getRoundTrips() const { return round_trips_; }

        // --- Modifiers ---
        // Spends `allocation` (costs included) on a long position.
        // Returns false, leaving the portfolio untouched, when the resulting quantity is not positive.
        bool openLong(core::Timestamp timestamp, double price, double allocation);

        // Sells the entire position and records the completed round trip
        void closeLong(core::Timestamp timestamp, double price, core::ExitReason reason);

    private:
        std::string symbol_;
        double cash_;
        double cost_rate_;
        std::optional<OpenPosition> position_;
        std::vector<LedgerEntry> ledger_;
        std::vector<core::Trade> round_trips_;
    };

} // namespace backtester
