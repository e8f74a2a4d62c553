#pragma once

#include "backtest_result.hpp"
#include <vector>

namespace backtester {

    // Annualization factor for daily bars
    constexpr double kTradingDaysPerYear = 252.0;

    // Summary statistics over an equity series and its closed round trips.
    // Never produces NaN or infinity: undefined ratios report as zero.
    BacktestMetrics calculateMetrics(const std::vector<EquityPoint>& equity,
                                     const std::vector<core::Trade>& round_trips,
                                     double initial_capital);

    // Percent below the running peak at every bar (values <= 0)
    std::vector<DrawdownPoint> calculateDrawdownSeries(const std::vector<EquityPoint>& equity);

    // Return per calendar month, chained from the previous month's last value
    // (the first month starts from initial_capital)
    std::vector<MonthlyReturn> calculateMonthlyReturns(const std::vector<EquityPoint>& equity,
                                                       double initial_capital);

    // Sample (n-1) Sharpe ratio of bar-over-bar returns, annualized by sqrt(252)
    double calculateSharpeRatio(const std::vector<EquityPoint>& equity);

} // namespace backtester
