#pragma once

#include <string>
#include <vector>
#include <chrono> // For timestamps
#include <optional>

namespace core {

    // All timestamps are UTC instants
    using Timestamp = std::chrono::system_clock::time_point;


    struct Candle {
        Timestamp timestamp;
        double open = 0.0;
        double high = 0.0;
        double low = 0.0;
        double close = 0.0;
        double volume = 0.0; // Crypto volumes are fractional

        bool operator<(const Candle& other) const {
            return timestamp < other.timestamp;
        }
    };

    // Long-only pipeline: rules either open or close the single position
    enum class SignalAction {
        None,
        EnterLong,
        ExitLong
    };

    enum class TradeSide {
        Buy,
        Sell
    };

    // Why a position was closed
    enum class ExitReason {
        None,       // Entry legs carry no reason
        Signal,
        StopLoss,
        TakeProfit,
        EndOfData   // Forced close on the final bar
    };

    // One completed round trip (entry leg + exit leg)
    struct Trade {
        std::string symbol;
        core::Timestamp entry_time;
        core::Timestamp exit_time;
        double quantity = 0.0;
        double entry_price = 0.0;
        double exit_price = 0.0;
        double entry_notional = 0.0;  // Cash committed at entry, costs included
        double commission = 0.0;      // Total fee + slippage (entry + exit)
        double pnl = 0.0;             // Net profit or loss for this trade
        double return_pct = 0.0;      // pnl / entry_notional * 100
        ExitReason exit_reason = ExitReason::None;
    };

    template<typename T>
    using TimeSeries = std::vector<T>;

    std::string tradeSideToString(TradeSide side);
    TradeSide tradeSideFromString(const std::string& side);
    std::string exitReasonToString(ExitReason reason);
    ExitReason exitReasonFromString(const std::string& reason);

} // namespace core
