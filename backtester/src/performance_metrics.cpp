#include "performance_metrics.hpp"
#include "utils.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <numeric>
#include <utility>

namespace backtester {

    namespace {

        constexpr double kEpsilon = 1e-12;

        double finiteOrZero(double value) {
            return std::isfinite(value) ? value : 0.0;
        }

        // Largest peak-to-trough decline (percent) and bars from that peak to recovery
        std::pair<double, int> maxDrawdown(const std::vector<EquityPoint>& equity) {
            if (equity.empty()) return {0.0, 0};

            double peak = equity.front().value;
            size_t peak_index = 0;
            double max_dd = 0.0;
            size_t max_dd_peak_index = 0;
            double max_dd_peak_value = peak;
            for (size_t i = 0; i < equity.size(); ++i) {
                if (equity[i].value >= peak) {
                    peak = equity[i].value;
                    peak_index = i;
                    continue;
                }
                double dd = peak > kEpsilon ? (peak - equity[i].value) / peak * 100.0 : 0.0;
                if (dd > max_dd) {
                    max_dd = dd;
                    max_dd_peak_index = peak_index;
                    max_dd_peak_value = peak;
                }
            }
            if (max_dd <= 0.0) return {0.0, 0};

            size_t end_index = equity.size() - 1;
            for (size_t i = max_dd_peak_index + 1; i < equity.size(); ++i) {
                if (equity[i].value >= max_dd_peak_value) {
                    end_index = i;
                    break;
                }
            }
            return {max_dd, static_cast<int>(end_index - max_dd_peak_index)};
        }

        std::string monthOf(const core::Timestamp& ts) {
            return core::utils::timestampToDate(ts).substr(0, 7);
        }

    } // namespace

    double calculateSharpeRatio(const std::vector<EquityPoint>& equity) {
        if (equity.size() < 3) return 0.0;

        std::vector<double> returns;
        returns.reserve(equity.size() - 1);
        for (size_t i = 1; i < equity.size(); ++i) {
            double previous = equity[i - 1].value;
            returns.push_back(previous > kEpsilon ? equity[i].value / previous - 1.0 : 0.0);
        }

        double mean = std::accumulate(returns.begin(), returns.end(), 0.0) / returns.size();
        double sq_sum = 0.0;
        for (double r : returns) sq_sum += (r - mean) * (r - mean);
        double std_dev = std::sqrt(sq_sum / (returns.size() - 1));
        if (std_dev < kEpsilon) return 0.0;
        return finiteOrZero(mean / std_dev * std::sqrt(kTradingDaysPerYear));
    }

    std::vector<DrawdownPoint> calculateDrawdownSeries(const std::vector<EquityPoint>& equity) {
        std::vector<DrawdownPoint> series;
        series.reserve(equity.size());
        double peak = 0.0;
        for (const auto& point : equity) {
            peak = std::max(peak, point.value);
            double dd = peak > kEpsilon ? (point.value - peak) / peak * 100.0 : 0.0;
            series.push_back({point.timestamp, std::min(0.0, dd)});
        }
        return series;
    }

    std::vector<MonthlyReturn> calculateMonthlyReturns(const std::vector<EquityPoint>& equity,
                                                       double initial_capital) {
        std::vector<MonthlyReturn> months;
        double base = initial_capital;
        for (size_t i = 0; i < equity.size(); ++i) {
            bool last_of_month = (i + 1 == equity.size()) || monthOf(equity[i + 1].timestamp) != monthOf(equity[i].timestamp);
            if (!last_of_month) continue;
            double ret = base > kEpsilon ? (equity[i].value / base - 1.0) * 100.0 : 0.0;
            months.push_back({monthOf(equity[i].timestamp), finiteOrZero(ret)});
            base = equity[i].value;
        }
        return months;
    }

    BacktestMetrics calculateMetrics(const std::vector<EquityPoint>& equity,
                                     const std::vector<core::Trade>& round_trips,
                                     double initial_capital) {
        BacktestMetrics metrics;
        metrics.total_invested = initial_capital;
        if (equity.empty() || initial_capital <= 0.0) {
            metrics.final_equity = initial_capital;
            return metrics;
        }

        // --- Returns ---
        const double final_value = equity.back().value;
        metrics.final_equity = final_value;
        metrics.total_return_pct = finiteOrZero((final_value / initial_capital - 1.0) * 100.0);
        metrics.benchmark_return_pct = finiteOrZero((equity.back().benchmark / initial_capital - 1.0) * 100.0);
        metrics.vs_benchmark_pct = metrics.total_return_pct - metrics.benchmark_return_pct;

        double days = std::chrono::duration_cast<std::chrono::seconds>(
                          equity.back().timestamp - equity.front().timestamp).count() / 86400.0;
        double years = days / 365.25;
        if (years > 0.0) {
            metrics.cagr_pct = final_value <= 0.0
                ? -100.0
                : finiteOrZero((std::pow(final_value / initial_capital, 1.0 / years) - 1.0) * 100.0);
        }

        // --- Risk ---
        metrics.sharpe_ratio = calculateSharpeRatio(equity);
        auto dd = maxDrawdown(equity);
        metrics.max_drawdown_pct = dd.first;
        metrics.max_drawdown_duration = dd.second;

        // --- Trade-Based Metrics ---
        metrics.trade_count = static_cast<int>(round_trips.size());
        int winning_trades = 0;
        for (const auto& trade : round_trips) {
            if (trade.pnl > 0.0) {
                ++winning_trades;
                metrics.total_gain += trade.pnl;
            } else if (trade.pnl < 0.0) {
                metrics.total_loss -= trade.pnl;
            }
        }
        if (metrics.trade_count > 0) {
            metrics.win_rate_pct = static_cast<double>(winning_trades) / metrics.trade_count * 100.0;
        }
        if (metrics.total_loss > kEpsilon) {
            metrics.profit_factor = metrics.total_gain / metrics.total_loss;
        }
        return metrics;
    }

} // namespace backtester
