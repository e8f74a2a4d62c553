#include "bollinger_bands_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <vector>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

BollingerBandsIndicator::BollingerBandsIndicator(int period, double deviations)
    : period_(period), deviations_(deviations), lookback_(0) {
    if (period_ <= 1) {
        throw std::invalid_argument("Bollinger band period must be at least 2.");
    }
    if (deviations_ <= 0.0) {
        throw std::invalid_argument("Bollinger band width must be positive.");
    }

    lookback_ = TA_BBANDS_Lookback(period_, deviations_, deviations_, TA_MAType_SMA);
    if (lookback_ < 0) {
        throw std::runtime_error(fmt::format("TA_BBANDS_Lookback returned an unexpected value: {}", lookback_));
    }

    name_ = fmt::format("BBANDS({},{:g})", period_, deviations_);
    core::logging::getLogger()->debug("BollingerBandsIndicator created: Name='{}', Lookback={}", name_, lookback_);
}

std::string BollingerBandsIndicator::getName() const {
    return name_;
}

int BollingerBandsIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& BollingerBandsIndicator::getResult() const {
    return middle_;
}

std::vector<std::string> BollingerBandsIndicator::getOutputNames() const {
    return {name_ + ".upper", name_ + ".middle", name_ + ".lower"};
}

const core::TimeSeries<double>& BollingerBandsIndicator::getOutput(const std::string& output_name) const {
    if (output_name == name_ || output_name == name_ + ".middle") return middle_;
    if (output_name == name_ + ".upper") return upper_;
    if (output_name == name_ + ".lower") return lower_;
    throw core::IndicatorCalculationException("Indicator " + name_ + " has no output named " + output_name);
}

void BollingerBandsIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    auto logger = core::logging::getLogger();
    logger->trace("Calculating {}...", name_);
    upper_.clear();
    middle_.clear();
    lower_.clear();

    if (input.size() <= static_cast<size_t>(lookback_)) {
        logger->debug("Input size ({}) is less than or equal to lookback ({}) for {}. No results generated.",
                      input.size(), lookback_, name_);
        return;
    }

    std::vector<double> close_prices = extractCloses(input);
    int output_size = static_cast<int>(close_prices.size()) - lookback_;
    upper_.resize(output_size);
    middle_.resize(output_size);
    lower_.resize(output_size);

    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_BBANDS(
        0,
        static_cast<int>(close_prices.size()) - 1,
        close_prices.data(),
        period_,
        deviations_,   // optInNbDevUp
        deviations_,   // optInNbDevDn
        TA_MAType_SMA,
        &out_begin_idx,
        &out_nb_element,
        upper_.data(),
        middle_.data(),
        lower_.data()
    );

    if (ret_code != TA_SUCCESS) {
        upper_.clear();
        middle_.clear();
        lower_.clear();
        throw core::IndicatorCalculationException(
            fmt::format("TA_BBANDS failed for {} with code {}", name_, static_cast<int>(ret_code)));
    }

    if (out_nb_element != output_size) {
        upper_.resize(out_nb_element);
        middle_.resize(out_nb_element);
        lower_.resize(out_nb_element);
    }

    logger->trace("Successfully calculated {} results for {}", middle_.size(), name_);
}

} // namespace indicators
