#pragma once

#include "indicators.hpp"
#include <memory>
#include <string>

namespace indicators {

// Builds an indicator from its canonical name:
// SMA(n), EMA(n), RSI(n), MACD(f,s,sig), BBANDS(n,k), MAX(n).
// Throws IndicatorCalculationException for unknown names or bad parameters.
std::unique_ptr<IIndicator> createIndicator(const std::string& name);

} // namespace indicators
