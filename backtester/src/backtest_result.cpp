#include "backtest_result.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

namespace backtester {

    namespace {

        core::Timestamp readTimestamp(const json& j) {
            return core::utils::stringToTimestamp(j.at("timestamp").get<std::string>());
        }

    } // namespace

    void BacktestMetrics::logMetrics() const {
        auto logger = core::logging::getLogger();
        logger->info("--- Backtest Metrics ---");
        logger->info("Total Return: {:.2f}% (benchmark {:.2f}%, vs benchmark {:+.2f}%)",
                     total_return_pct, benchmark_return_pct, vs_benchmark_pct);
        logger->info("CAGR: {:.2f}%", cagr_pct);
        logger->info("Sharpe Ratio: {:.2f}", sharpe_ratio);
        logger->info("Max Drawdown: {:.2f}% over {} bars", max_drawdown_pct, max_drawdown_duration);
        logger->info("Round-Trip Trades: {}", trade_count);
        logger->info("Win Rate: {:.2f}%", win_rate_pct);
        logger->info("Profit Factor: {:.2f}", profit_factor);
        logger->info("Gain / Loss: {:.2f} / {:.2f}", total_gain, total_loss);
        logger->info("Final Equity: {:.2f}", final_equity);
        logger->info("------------------------");
    }

    json metricsToJson(const BacktestMetrics& m) {
        return json{
            {"total_return", m.total_return_pct},
            {"cagr", m.cagr_pct},
            {"sharpe_ratio", m.sharpe_ratio},
            {"max_drawdown", m.max_drawdown_pct},
            {"max_drawdown_duration", m.max_drawdown_duration},
            {"win_rate", m.win_rate_pct},
            {"trades", m.trade_count},
            {"benchmark_return", m.benchmark_return_pct},
            {"vs_benchmark", m.vs_benchmark_pct},
            {"profit_factor", m.profit_factor},
            {"total_amount_invested", m.total_invested},
            {"total_gain", m.total_gain},
            {"total_loss", m.total_loss},
            {"final_equity", m.final_equity},
        };
    }

    json BacktestResult::toJson() const {
        json j;
        j["symbol"] = symbol;
        j["metrics"] = metricsToJson(metrics);

        j["equity_series"] = json::array();
        for (const auto& point : equity_series) {
            j["equity_series"].push_back({{"timestamp", core::utils::timestampToString(point.timestamp)},
                                          {"value", point.value},
                                          {"benchmark", point.benchmark},
                                          {"price", point.price}});
        }

        j["drawdown_series"] = json::array();
        for (const auto& point : drawdown_series) {
            j["drawdown_series"].push_back({{"timestamp", core::utils::timestampToString(point.timestamp)},
                                            {"drawdown", point.drawdown_pct}});
        }

        j["trades"] = json::array();
        for (const auto& entry : ledger) {
            json leg = {{"timestamp", core::utils::timestampToString(entry.timestamp)},
                        {"side", core::tradeSideToString(entry.side)},
                        {"price", entry.price},
                        {"quantity", entry.quantity},
                        {"notional", entry.notional},
                        {"fees", entry.fees}};
            if (entry.side == core::TradeSide::Sell) {
                leg["return_pct"] = entry.return_pct;
                leg["exit_reason"] = core::exitReasonToString(entry.exit_reason);
            }
            j["trades"].push_back(leg);
        }

        j["round_trips"] = json::array();
        for (const auto& trade : round_trips) {
            j["round_trips"].push_back({{"entry_time", core::utils::timestampToString(trade.entry_time)},
                                        {"exit_time", core::utils::timestampToString(trade.exit_time)},
                                        {"quantity", trade.quantity},
                                        {"entry_price", trade.entry_price},
                                        {"exit_price", trade.exit_price},
                                        {"entry_notional", trade.entry_notional},
                                        {"commission", trade.commission},
                                        {"pnl", trade.pnl},
                                        {"return_pct", trade.return_pct},
                                        {"exit_reason", core::exitReasonToString(trade.exit_reason)}});
        }

        j["monthly_returns"] = json::array();
        for (const auto& month : monthly_returns) {
            j["monthly_returns"].push_back({{"month", month.month}, {"return", month.return_pct}});
        }
        return j;
    }

    BacktestResult BacktestResult::fromJson(const json& j) {
        try {
            BacktestResult result;
            result.symbol = j.value("symbol", std::string());

            const auto& m = j.at("metrics");
            result.metrics.total_return_pct = m.at("total_return").get<double>();
            result.metrics.cagr_pct = m.at("cagr").get<double>();
            result.metrics.sharpe_ratio = m.at("sharpe_ratio").get<double>();
            result.metrics.max_drawdown_pct = m.at("max_drawdown").get<double>();
            result.metrics.max_drawdown_duration = m.at("max_drawdown_duration").get<int>();
            result.metrics.win_rate_pct = m.at("win_rate").get<double>();
            result.metrics.trade_count = m.at("trades").get<int>();
            result.metrics.benchmark_return_pct = m.value("benchmark_return", 0.0);
            result.metrics.vs_benchmark_pct = m.at("vs_benchmark").get<double>();
            result.metrics.profit_factor = m.value("profit_factor", 0.0);
            result.metrics.total_invested = m.value("total_amount_invested", 0.0);
            result.metrics.total_gain = m.value("total_gain", 0.0);
            result.metrics.total_loss = m.value("total_loss", 0.0);
            result.metrics.final_equity = m.value("final_equity", 0.0);

            for (const auto& p : j.at("equity_series")) {
                result.equity_series.push_back({readTimestamp(p), p.at("value").get<double>(),
                                                p.value("benchmark", 0.0), p.value("price", 0.0)});
            }
            for (const auto& p : j.value("drawdown_series", json::array())) {
                result.drawdown_series.push_back({readTimestamp(p), p.at("drawdown").get<double>()});
            }
            for (const auto& t : j.value("trades", json::array())) {
                LedgerEntry entry;
                entry.timestamp = readTimestamp(t);
                entry.side = core::tradeSideFromString(t.at("side").get<std::string>());
                entry.price = t.at("price").get<double>();
                entry.quantity = t.at("quantity").get<double>();
                entry.notional = t.value("notional", entry.price * entry.quantity);
                entry.fees = t.value("fees", 0.0);
                entry.return_pct = t.value("return_pct", 0.0);
                entry.exit_reason = core::exitReasonFromString(t.value("exit_reason", std::string()));
                result.ledger.push_back(entry);
            }
            for (const auto& t : j.value("round_trips", json::array())) {
                core::Trade trade;
                trade.symbol = result.symbol;
                trade.entry_time = core::utils::stringToTimestamp(t.at("entry_time").get<std::string>());
                trade.exit_time = core::utils::stringToTimestamp(t.at("exit_time").get<std::string>());
                trade.quantity = t.at("quantity").get<double>();
                trade.entry_price = t.at("entry_price").get<double>();
                trade.exit_price = t.at("exit_price").get<double>();
                trade.entry_notional = t.value("entry_notional", 0.0);
                trade.commission = t.value("commission", 0.0);
                trade.pnl = t.at("pnl").get<double>();
                trade.return_pct = t.value("return_pct", 0.0);
                trade.exit_reason = core::exitReasonFromString(t.value("exit_reason", std::string()));
                result.round_trips.push_back(trade);
            }
            for (const auto& month : j.value("monthly_returns", json::array())) {
                result.monthly_returns.push_back({month.at("month").get<std::string>(), month.at("return").get<double>()});
            }
            return result;
        } catch (const json::exception& e) {
            throw core::DataLoadException(std::string("Malformed backtest result: ") + e.what());
        } catch (const std::runtime_error& e) {
            // Timestamp parse failures and unknown trade sides
            throw core::DataLoadException(std::string("Malformed backtest result: ") + e.what());
        }
    }

} // namespace backtester
