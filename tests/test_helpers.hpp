#pragma once

#include <chrono>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "datatypes.hpp"
#include "utils.hpp"

namespace test_helpers {

    // Midnight UTC, `day` days after start_date
    inline core::Timestamp day(int day, const std::string& start_date = "2023-01-01") {
        return core::utils::dateToTimestamp(start_date) + std::chrono::hours(24 * day);
    }

    inline core::TimeSeries<core::Candle> makeCandles(const std::vector<double>& closes,
                                                      const std::string& start_date = "2023-01-01") {
        core::TimeSeries<core::Candle> candles;
        for (size_t i = 0; i < closes.size(); ++i) {
            core::Candle c;
            c.timestamp = day(static_cast<int>(i), start_date);
            c.open = i > 0 ? closes[i - 1] : closes[i];
            c.high = closes[i] * 1.01;
            c.low = closes[i] * 0.99;
            c.close = closes[i];
            c.volume = 100.0;
            candles.push_back(c);
        }
        return candles;
    }

    // Linear path start -> start + bars * step
    inline std::vector<double> ramp(double start, double step, size_t bars) {
        std::vector<double> values;
        for (size_t i = 0; i < bars; ++i) values.push_back(start + step * static_cast<double>(i));
        return values;
    }

    // start -> category -> entry -> [extras...] -> end
    inline nlohmann::json makeGraph(const std::string& category,
                                    const nlohmann::json& rules,
                                    const std::vector<nlohmann::json>& extra_nodes = {}) {
        nlohmann::json nodes = nlohmann::json::array();
        nodes.push_back({{"id", "start"}, {"type", "start"}});
        nodes.push_back({{"id", "asset"}, {"type", "category"}, {"meta", {{"category", category}}}});
        nodes.push_back({{"id", "entry"}, {"type", "entry_condition"}, {"meta", {{"mode", "manual"}, {"rules", rules}}}});
        for (const auto& node : extra_nodes) nodes.push_back(node);
        nodes.push_back({{"id", "end"}, {"type", "end"}});

        nlohmann::json edges = nlohmann::json::array();
        for (size_t i = 0; i + 1 < nodes.size(); ++i) {
            edges.push_back({nodes[i]["id"], nodes[i + 1]["id"]});
        }
        return {{"name", "test strategy"}, {"nodes", nodes}, {"edges", edges}};
    }

    // The BTC 10/30 crossover with 7% target and 5% stop
    inline nlohmann::json scenarioAGraph() {
        std::vector<nlohmann::json> exits;
        exits.push_back({{"id", "tp"}, {"type", "take_profit"}, {"meta", {{"target_pct", 7}}}});
        exits.push_back({{"id", "sl"}, {"type", "stop_loss"}, {"meta", {{"stop_pct", 5}}}});
        return makeGraph("BTC", nlohmann::json::array({"10-day MA crosses above 30-day MA"}), exits);
    }

} // namespace test_helpers
