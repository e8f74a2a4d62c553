#pragma once

#include <string>
#include "datatypes.hpp"

namespace data {

// Candle exchange format between the pipeline and the sandbox worker:
//   timestamp,open,high,low,close,volume
//   2023-01-01T00:00:00Z,16547.5,16630.4,16521.2,16625.1,9744.6
std::string formatPriceCsv(const core::TimeSeries<core::Candle>& candles);

// Throws DataLoadException naming the offending line
core::TimeSeries<core::Candle> parsePriceCsv(const std::string& text);

void writePriceCsv(const std::string& path, const core::TimeSeries<core::Candle>& candles);
core::TimeSeries<core::Candle> readPriceCsv(const std::string& path);

} // namespace data
