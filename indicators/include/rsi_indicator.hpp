#pragma once

#include "indicators.hpp"
#include <string>

namespace indicators {

// Wilder RSI(n) of closes, 0..100. A window in which the close never moved has
// no momentum either way and reads as the neutral kFlatValue; TA-Lib itself
// reports 0 there, which would look deeply oversold.
class RsiIndicator : public IIndicator {
public:
    static constexpr double kFlatValue = 50.0;

    explicit RsiIndicator(int period);

    std::string getName() const override { return name_; }
    int getLookback() const override { return lookback_; }
    void calculate(const core::TimeSeries<core::Candle>& input) override;
    const core::TimeSeries<double>& getResult() const override { return results_; }

private:
    int period_;
    int lookback_;
    std::string name_;
    core::TimeSeries<double> results_;
};

} // namespace indicators
