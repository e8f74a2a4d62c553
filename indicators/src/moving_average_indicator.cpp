#include "moving_average_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"            // TA-Lib C API header
#include <vector>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

namespace {
    TA_MAType toTaType(MovingAverageType type) {
        return type == MovingAverageType::Exponential ? TA_MAType_EMA : TA_MAType_SMA;
    }
}

MovingAverageIndicator::MovingAverageIndicator(int period, MovingAverageType type)
    : period_(period), type_(type), lookback_(0) {
    if (period_ <= 0) {
         throw std::invalid_argument("Moving average period must be positive.");
    }

    lookback_ = TA_MA_Lookback(period_, toTaType(type_));
    if (lookback_ < 0) {
         throw std::runtime_error(fmt::format("TA_MA_Lookback returned an unexpected value: {}", lookback_));
    }

    name_ = fmt::format("{}({})", type_ == MovingAverageType::Exponential ? "EMA" : "SMA", period_);
    core::logging::getLogger()->debug("MovingAverageIndicator created: Name='{}', Period={}, Lookback={}",
                                      name_, period_, lookback_);
}

std::string MovingAverageIndicator::getName() const {
    return name_;
}

int MovingAverageIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& MovingAverageIndicator::getResult() const {
    return results_;
}

void MovingAverageIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    auto logger = core::logging::getLogger();
    logger->trace("Calculating {}...", name_);
    results_.clear();

    if (input.size() <= static_cast<size_t>(lookback_)) {
        logger->debug("Input size ({}) is less than or equal to lookback ({}) for {}. No results generated.",
                      input.size(), lookback_, name_);
        return;
    }

    std::vector<double> close_prices = extractCloses(input);

    // TA-Lib output size = input size - lookback
    int output_size = static_cast<int>(close_prices.size()) - lookback_;
    results_.resize(output_size);

    int out_begin_idx = 0;  // Index of the first valid output element relative to input
    int out_nb_element = 0; // Number of elements calculated

    TA_RetCode ret_code = TA_MA(
        0,                                         // startIdx
        static_cast<int>(close_prices.size()) - 1, // endIdx
        close_prices.data(),
        period_,                                   // optInTimePeriod
        toTaType(type_),                           // optInMAType
        &out_begin_idx,
        &out_nb_element,
        results_.data()
    );

    if (ret_code != TA_SUCCESS) {
        results_.clear();
        throw core::IndicatorCalculationException(
            fmt::format("TA_MA failed for {} with code {}", name_, static_cast<int>(ret_code)));
    }

    if (out_begin_idx != lookback_) {
         logger->warn("TA_MA out_begin_idx ({}) does not match calculated lookback ({}) for {}. Results might be misaligned.",
                      out_begin_idx, lookback_, name_);
    }
    if (out_nb_element != output_size) {
         logger->warn("TA_MA out_nb_element ({}) does not match expected output size ({}) for {}. Resizing results vector.",
                      out_nb_element, output_size, name_);
         results_.resize(out_nb_element);
    }

    logger->trace("Successfully calculated {} results for {}", results_.size(), name_);
}

} // namespace indicators
