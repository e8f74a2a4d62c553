#pragma once

#include "indicators.hpp"
#include <vector>
#include <string>

namespace indicators {

// MACD line, signal line and histogram; the primary result is the MACD line
class MacdIndicator : public IIndicator {
public:
    MacdIndicator(int fast_period, int slow_period, int signal_period);

    virtual ~MacdIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Candle>& input) override;
    const core::TimeSeries<double>& getResult() const override;

    std::vector<std::string> getOutputNames() const override;
    const core::TimeSeries<double>& getOutput(const std::string& output_name) const override;

private:
    const int fast_period_;
    const int slow_period_;
    const int signal_period_;
    int lookback_;
    std::string name_;
    core::TimeSeries<double> macd_;
    core::TimeSeries<double> signal_;
    core::TimeSeries<double> hist_;
};

} // namespace indicators
