#include "indicator_factory.hpp"
#include "moving_average_indicator.hpp"
#include "rsi_indicator.hpp"
#include "macd_indicator.hpp"
#include "bollinger_bands_indicator.hpp"
#include "rolling_high_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"

#include <regex>
#include <sstream>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

    std::vector<double> extractCloses(const core::TimeSeries<core::Candle>& input) {
        std::vector<double> close_prices;
        close_prices.reserve(input.size());
        for (const auto& candle : input) {
            close_prices.push_back(candle.close);
        }
        return close_prices;
    }

    namespace {

        // "MACD(12,26,9)" -> {"MACD", {12, 26, 9}}
        std::pair<std::string, std::vector<double>> parseIndicatorString(const std::string& indicator_str) {
            static const std::regex indicator_regex(R"(([A-Z]+)\(([0-9.,\s]+)\))");
            std::smatch match;
            if (!std::regex_match(indicator_str, match, indicator_regex)) {
                throw core::IndicatorCalculationException("Malformed indicator name: '" + indicator_str + "'");
            }

            std::vector<double> params;
            std::stringstream ss(match[2].str());
            std::string item;
            while (std::getline(ss, item, ',')) {
                try {
                    params.push_back(std::stod(item));
                } catch (const std::exception&) {
                    throw core::IndicatorCalculationException(
                        fmt::format("Bad parameter '{}' in indicator name '{}'", item, indicator_str));
                }
            }
            return {match[1].str(), params};
        }

        void expectParams(const std::string& name, const std::vector<double>& params, size_t count) {
            if (params.size() != count) {
                throw core::IndicatorCalculationException(
                    fmt::format("Indicator '{}' expects {} parameter(s), got {}", name, count, params.size()));
            }
        }

    } // namespace

    std::unique_ptr<IIndicator> createIndicator(const std::string& name) {
        auto logger = core::logging::getLogger();
        logger->debug("Attempting to create indicator instance for: {}", name);

        auto parsed = parseIndicatorString(name);
        const std::string& base_name = parsed.first;
        const std::vector<double>& params = parsed.second;

        try {
            if (base_name == "SMA" || base_name == "EMA") {
                expectParams(name, params, 1);
                return std::make_unique<MovingAverageIndicator>(
                    static_cast<int>(params[0]),
                    base_name == "EMA" ? MovingAverageType::Exponential : MovingAverageType::Simple);
            } else if (base_name == "RSI") {
                expectParams(name, params, 1);
                return std::make_unique<RsiIndicator>(static_cast<int>(params[0]));
            } else if (base_name == "MACD") {
                expectParams(name, params, 3);
                return std::make_unique<MacdIndicator>(static_cast<int>(params[0]),
                                                       static_cast<int>(params[1]),
                                                       static_cast<int>(params[2]));
            } else if (base_name == "BBANDS") {
                expectParams(name, params, 2);
                return std::make_unique<BollingerBandsIndicator>(static_cast<int>(params[0]), params[1]);
            } else if (base_name == "MAX") {
                expectParams(name, params, 1);
                return std::make_unique<RollingHighIndicator>(static_cast<int>(params[0]));
            }
        } catch (const std::invalid_argument& e) {
            throw core::IndicatorCalculationException(fmt::format("Cannot create '{}': {}", name, e.what()));
        }

        throw core::IndicatorCalculationException("Unknown indicator requested: " + name);
    }

} // namespace indicators
