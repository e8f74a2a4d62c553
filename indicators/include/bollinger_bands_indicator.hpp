#pragma once

#include "indicators.hpp"
#include <vector>
#include <string>

namespace indicators {

// Upper/middle/lower bands around an SMA; the primary result is the middle band
class BollingerBandsIndicator : public IIndicator {
public:
    BollingerBandsIndicator(int period, double deviations);

    virtual ~BollingerBandsIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Candle>& input) override;
    const core::TimeSeries<double>& getResult() const override;

    std::vector<std::string> getOutputNames() const override;
    const core::TimeSeries<double>& getOutput(const std::string& output_name) const override;

private:
    const int period_;
    const double deviations_;
    int lookback_;
    std::string name_;
    core::TimeSeries<double> upper_;
    core::TimeSeries<double> middle_;
    core::TimeSeries<double> lower_;
};

} // namespace indicators
