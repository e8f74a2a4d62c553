#pragma once

#include "datatypes.hpp" // Needs Candle, TimeSeries
#include "exceptions.hpp"
#include <string>
#include <vector>

namespace indicators {

class IIndicator {
public:
    virtual ~IIndicator() = default;

    // Canonical name, e.g. "SMA(10)" or "MACD(12,26,9)"
    virtual std::string getName() const = 0;

    // Number of leading input bars consumed before the first valid output
    virtual int getLookback() const = 0;

    // Calculate the indicator from candle data and store the result internally
    virtual void calculate(const core::TimeSeries<core::Candle>& input) = 0;

    // Primary output line. Its size is input size - lookback;
    // result[i] belongs to input bar i + lookback.
    virtual const core::TimeSeries<double>& getResult() const = 0;

    // Multi-line indicators expose every line as "<name>.<line>".
    // Single-line indicators expose just their name.
    virtual std::vector<std::string> getOutputNames() const {
        return {getName()};
    }

    virtual const core::TimeSeries<double>& getOutput(const std::string& output_name) const {
        if (output_name != getName()) {
            throw core::IndicatorCalculationException(
                "Indicator " + getName() + " has no output named " + output_name);
        }
        return getResult();
    }
};

// Close prices in input order (the series TA-Lib consumes)
std::vector<double> extractCloses(const core::TimeSeries<core::Candle>& input);

} // namespace indicators
