#include "portfolio.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <stdexcept>

namespace backtester {

    Portfolio::Portfolio(std::string symbol, double initial_capital, double fee_rate, double slippage_rate)
        : symbol_(std::move(symbol)), cash_(initial_capital), cost_rate_(fee_rate + slippage_rate) {
        if (initial_capital <= 0) {
            throw std::invalid_argument("Initial capital must be positive.");
        }
        if (fee_rate < 0 || slippage_rate < 0 || cost_rate_ >= 1.0) {
            throw std::invalid_argument("Fee and slippage rates must be non-negative and sum below 1.");
        }
    }

    double Portfolio::getEquity(double price) const {
        return position_ ? cash_ + position_->quantity * price : cash_;
    }

    bool Portfolio::openLong(core::Timestamp timestamp, double price, double allocation) {
        auto logger = core::logging::getLogger();
        if (position_) {
            logger->warn("Cannot open a position in {} while one is already open. Ignoring.", symbol_);
            return false;
        }
        if (allocation > cash_) allocation = cash_;

        double costs = allocation * cost_rate_;
        double quantity = price > 0.0 ? (allocation - costs) / price : 0.0;
        if (quantity <= 0.0) {
            logger->warn("Entry at {} skipped: allocation {:.2f} at price {:.4f} buys nothing.",
                         core::utils::timestampToString(timestamp), allocation, price);
            return false;
        }

        cash_ -= allocation;
        position_ = OpenPosition{timestamp, quantity, price, allocation, costs};

        LedgerEntry entry;
        entry.timestamp = timestamp;
        entry.side = core::TradeSide::Buy;
        entry.price = price;
        entry.quantity = quantity;
        entry.notional = quantity * price;
        entry.fees = costs;
        ledger_.push_back(entry);

        logger->debug("BUY {}: Time={}, Qty={:.8f}, Price={:.4f}, Costs={:.2f}, NewCash={:.2f}",
                      symbol_, core::utils::timestampToString(timestamp), quantity, price, costs, cash_);
        return true;
    }

    void Portfolio::closeLong(core::Timestamp timestamp, double price, core::ExitReason reason) {
        auto logger = core::logging::getLogger();
        if (!position_) {
            logger->warn("Cannot close {}: no open position. Ignoring.", symbol_);
            return;
        }

        const OpenPosition& open = *position_;
        double gross = open.quantity * price;
        double costs = gross * cost_rate_;
        double proceeds = gross - costs;
        cash_ += proceeds;

        core::Trade trade;
        trade.symbol = symbol_;
        trade.entry_time = open.entry_time;
        trade.exit_time = timestamp;
        trade.quantity = open.quantity;
        trade.entry_price = open.entry_price;
        trade.exit_price = price;
        trade.entry_notional = open.entry_notional;
        trade.commission = open.entry_costs + costs;
        trade.pnl = proceeds - open.entry_notional;
        trade.return_pct = open.entry_notional > 0.0 ? trade.pnl / open.entry_notional * 100.0 : 0.0;
        trade.exit_reason = reason;
        round_trips_.push_back(trade);

        LedgerEntry exit;
        exit.timestamp = timestamp;
        exit.side = core::TradeSide::Sell;
        exit.price = price;
        exit.quantity = open.quantity;
        exit.notional = gross;
        exit.fees = costs;
        exit.return_pct = trade.return_pct;
        exit.exit_reason = reason;
        ledger_.push_back(exit);

        logger->debug("SELL {} ({}): Time={}, Qty={:.8f}, Price={:.4f}, PnL={:.2f} ({:.2f}%), NewCash={:.2f}",
                      symbol_, core::exitReasonToString(reason), core::utils::timestampToString(timestamp),
                      open.quantity, price, trade.pnl, trade.return_pct, cash_);
        position_.reset();
    }

} // namespace backtester
