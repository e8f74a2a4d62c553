#include "rsi_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <stdexcept>
#include <vector>
#include <spdlog/fmt/fmt.h>

namespace indicators {

RsiIndicator::RsiIndicator(int period)
    : period_(period), lookback_(0), name_(fmt::format("RSI({})", period)) {
    if (period_ < 2) {
        throw std::invalid_argument("RSI period must be at least 2.");
    }
    lookback_ = TA_RSI_Lookback(period_);
}

void RsiIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    auto logger = core::logging::getLogger();
    results_.clear();
    if (input.size() <= static_cast<size_t>(lookback_)) {
        logger->debug("{}: {} bars do not cover the lookback of {}", name_, input.size(), lookback_);
        return;
    }

    const std::vector<double> closes = extractCloses(input);
    const int last = static_cast<int>(closes.size()) - 1;
    results_.resize(closes.size() - static_cast<size_t>(lookback_));

    int out_begin = 0;
    int out_count = 0;
    TA_RetCode rc = TA_RSI(0, last, closes.data(), period_, &out_begin, &out_count, results_.data());
    if (rc != TA_SUCCESS) {
        results_.clear();
        throw core::IndicatorCalculationException(fmt::format("TA_RSI failed for {} with code {}", name_, static_cast<int>(rc)));
    }
    if (out_begin != lookback_) {
        logger->warn("{}: TA_RSI started at bar {}, expected {}", name_, out_begin, lookback_);
    }
    results_.resize(static_cast<size_t>(out_count));

    // unchanged = closes equal to their predecessor, counted back from bar i
    int unchanged = 0;
    for (size_t bar = 1; bar < closes.size(); ++bar) {
        unchanged = closes[bar] == closes[bar - 1] ? unchanged + 1 : 0;
        if (bar < static_cast<size_t>(out_begin)) continue;
        const size_t out = bar - static_cast<size_t>(out_begin);
        if (out < results_.size() && unchanged >= period_ && results_[out] == 0.0) {
            results_[out] = kFlatValue;
        }
    }
    logger->trace("{}: {} values", name_, results_.size());
}

} // namespace indicators
