#pragma once

#include "indicators.hpp"
#include <vector>
#include <string>

namespace indicators {

enum class MovingAverageType {
    Simple,
    Exponential
};

// SMA(n) / EMA(n) over close prices
class MovingAverageIndicator : public IIndicator {
public:
    MovingAverageIndicator(int period, MovingAverageType type = MovingAverageType::Simple);

    virtual ~MovingAverageIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Candle>& input) override;
    const core::TimeSeries<double>& getResult() const override;

private:
    const int period_;
    const MovingAverageType type_;
    int lookback_;              // Calculated TA-Lib lookback
    std::string name_;          // e.g. "SMA(50)"
    core::TimeSeries<double> results_;
};

} // namespace indicators
