#include "rolling_high_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <vector>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

RollingHighIndicator::RollingHighIndicator(int period) : period_(period), lookback_(0) {
    if (period_ <= 1) {
        throw std::invalid_argument("Rolling high period must be at least 2.");
    }
    lookback_ = TA_MAX_Lookback(period_);
    name_ = fmt::format("MAX({})", period_);
    core::logging::getLogger()->debug("RollingHighIndicator created: Name='{}', Lookback={}", name_, lookback_);
}

std::string RollingHighIndicator::getName() const {
    return name_;
}

int RollingHighIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& RollingHighIndicator::getResult() const {
    return results_;
}

void RollingHighIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    auto logger = core::logging::getLogger();
    results_.clear();

    if (input.size() <= static_cast<size_t>(lookback_)) {
        logger->debug("Input size ({}) is less than or equal to lookback ({}) for {}. No results generated.",
                      input.size(), lookback_, name_);
        return;
    }

    std::vector<double> highs;
    highs.reserve(input.size());
    for (const auto& candle : input) {
        highs.push_back(candle.high);
    }

    int output_size = static_cast<int>(highs.size()) - lookback_;
    results_.resize(output_size);

    int out_begin_idx = 0;
    int out_nb_element = 0;
    TA_RetCode ret_code = TA_MAX(0, static_cast<int>(highs.size()) - 1, highs.data(), period_,
                                 &out_begin_idx, &out_nb_element, results_.data());
    if (ret_code != TA_SUCCESS) {
        results_.clear();
        throw core::IndicatorCalculationException(
            fmt::format("TA_MAX failed for {} with code {}", name_, static_cast<int>(ret_code)));
    }
    results_.resize(out_nb_element);
}

} // namespace indicators
