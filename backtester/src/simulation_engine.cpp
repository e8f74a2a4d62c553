#include "simulation_engine.hpp"
#include "performance_metrics.hpp"
#include "portfolio.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>

namespace backtester {

    SimulationEngine::SimulationEngine(SimulationConfig config)
        : config_(std::move(config)) {
        if (!(config_.initial_capital > 0.0)) {
            throw core::ExecutionException("Simulation needs positive initial capital");
        }
        if (!(config_.exposure > 0.0) || config_.exposure > 1.0) {
            throw core::ExecutionException(fmt::format("Exposure must be in (0, 1], got {}", config_.exposure));
        }
        if (config_.fee_rate < 0.0 || config_.slippage_rate < 0.0 || config_.fee_rate + config_.slippage_rate >= 1.0) {
            throw core::ExecutionException(fmt::format("Fee {} and slippage {} must be non-negative and sum below 1",
                                                       config_.fee_rate, config_.slippage_rate));
        }
        if (config_.stop_loss_pct && (*config_.stop_loss_pct <= 0.0 || *config_.stop_loss_pct >= 100.0)) {
            throw core::ExecutionException(fmt::format("Stop-loss must be in (0, 100), got {}", *config_.stop_loss_pct));
        }
        if (config_.take_profit_pct && *config_.take_profit_pct <= 0.0) {
            throw core::ExecutionException(fmt::format("Take-profit must be positive, got {}", *config_.take_profit_pct));
        }
    }

    core::ExitReason SimulationEngine::exitReason(double entry_price, double close, bool exit_signal, bool last_bar) const {
        if (config_.stop_loss_pct && close <= entry_price * (1.0 - *config_.stop_loss_pct / 100.0)) {
            return core::ExitReason::StopLoss;
        }
        if (config_.take_profit_pct && close >= entry_price * (1.0 + *config_.take_profit_pct / 100.0)) {
            return core::ExitReason::TakeProfit;
        }
        if (exit_signal) return core::ExitReason::Signal;
        if (last_bar) return core::ExitReason::EndOfData;
        return core::ExitReason::None;
    }

    BacktestResult SimulationEngine::run(const std::vector<core::Timestamp>& timestamps,
                                         const std::vector<double>& closes,
                                         const std::vector<bool>& entries,
                                         const std::vector<bool>& exits) const {
        auto logger = core::logging::getLogger();
        const size_t n = closes.size();
        if (n == 0) {
            throw core::ExecutionException("Cannot simulate an empty price series");
        }
        if (timestamps.size() != n || entries.size() != n || exits.size() != n) {
            throw core::ExecutionException(fmt::format(
                "Misaligned simulation inputs: {} prices, {} timestamps, {} entries, {} exits",
                n, timestamps.size(), entries.size(), exits.size()));
        }
        for (size_t i = 0; i < n; ++i) {
            if (!std::isfinite(closes[i]) || closes[i] <= 0.0) {
                throw core::ExecutionException(fmt::format("Invalid close {} at bar {}", closes[i], i));
            }
            if (i > 0 && !(timestamps[i - 1] < timestamps[i])) {
                throw core::ExecutionException(fmt::format("Timestamps not strictly increasing at bar {}", i));
            }
        }

        logger->info("Simulating {} over {} bars ({} to {}), capital {:.2f}",
                     config_.symbol, n, core::utils::timestampToDate(timestamps.front()),
                     core::utils::timestampToDate(timestamps.back()), config_.initial_capital);

        Portfolio portfolio(config_.symbol, config_.initial_capital, config_.fee_rate, config_.slippage_rate);
        BacktestResult result;
        result.symbol = config_.symbol;
        result.equity_series.reserve(n);
        const double first_close = closes.front();

        for (size_t i = 0; i < n; ++i) {
            const bool last_bar = (i + 1 == n);
            const double close = closes[i];

            if (portfolio.hasPosition()) {
                core::ExitReason reason = exitReason(portfolio.getPosition()->entry_price, close, exits[i], last_bar);
                if (reason != core::ExitReason::None) {
                    portfolio.closeLong(timestamps[i], close, reason);
                }
            } else if (entries[i] && !last_bar) {
                double base = config_.sizing == strategy_engine::SizingMethod::InitialCapital
                    ? config_.initial_capital * config_.exposure
                    : portfolio.getCash() * config_.exposure;
                portfolio.openLong(timestamps[i], close, std::min(base, portfolio.getCash()));
            }

            EquityPoint point;
            point.timestamp = timestamps[i];
            point.value = portfolio.getEquity(close);
            point.benchmark = config_.initial_capital * close / first_close;
            point.price = close;
            result.equity_series.push_back(point);
            logger->trace("Bar {} {}: close={:.4f}, equity={:.2f}", i,
                          core::utils::timestampToDate(timestamps[i]), close, point.value);
        }

        result.ledger = portfolio.getLedger();
        result.round_trips = portfolio.getRoundTrips();
        result.drawdown_series = calculateDrawdownSeries(result.equity_series);
        result.monthly_returns = calculateMonthlyReturns(result.equity_series, config_.initial_capital);
        result.metrics = calculateMetrics(result.equity_series, result.round_trips, config_.initial_capital);

        logger->info("Simulation finished: {} executions, {} round trips", portfolio.getTotalExecutions(),
                     result.round_trips.size());
        result.metrics.logMetrics();
        return result;
    }

} // namespace backtester
