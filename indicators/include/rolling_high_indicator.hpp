#pragma once

#include "indicators.hpp"
#include <vector>
#include <string>

namespace indicators {

// Highest high over the last n bars ("MAX(n)")
class RollingHighIndicator : public IIndicator {
public:
    explicit RollingHighIndicator(int period);

    virtual ~RollingHighIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Candle>& input) override;
    const core::TimeSeries<double>& getResult() const override;

private:
    const int period_;
    int lookback_;
    std::string name_;
    core::TimeSeries<double> results_;
};

} // namespace indicators
