#include "sma_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"            // TA-Lib C API header
#include <vector>
#include <cmath>
#include <algorithm>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

SmaIndicator::SmaIndicator(int period) : period_(period), lookback_(0) {
    if (period_ <= 0) {
        throw std::invalid_argument("SMA period must be positive.");
    }

    lookback_ = TA_MA_Lookback(period_, TA_MAType_SMA);
    if (lookback_ < 0) {
        // TA-Lib rejects periods outside [1, 100000]
        throw core::IndicatorCalculationException(fmt::format("TA_MA_Lookback rejected period {} (returned {})", period_, lookback_));
    }

    name_ = fmt::format("SMA({})", period_);
    core::logging::getLogger()->debug("SmaIndicator created: Name='{}', Period={}, Lookback={}", name_, period_, lookback_);
}

std::string SmaIndicator::getName() const {
    return name_;
}

int SmaIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& SmaIndicator::getResult() const {
    return results_;
}

void SmaIndicator::calculate(const core::TimeSeries<double>& input) {
    auto logger = core::logging::getLogger();
    logger->trace("Calculating {}...", name_);
    results_.assign(input.size(), core::kMissing);

    if (input.size() <= static_cast<size_t>(lookback_)) {
        logger->debug("Input size ({}) is less than or equal to lookback ({}) for {}. Result is all undefined.",
                      input.size(), lookback_, name_);
        return;
    }

    if (std::any_of(input.begin(), input.end(), [](double v) { return std::isnan(v); })) {
        throw core::IndicatorCalculationException(fmt::format("{} input contains missing values; fill the series first.", name_));
    }

    // TA-Lib output size = input size - lookback
    std::vector<double> ta_output(input.size() - static_cast<size_t>(lookback_));
    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_MA(
        0,                                     // startIdx
        static_cast<int>(input.size()) - 1,    // endIdx
        input.data(),
        period_,
        TA_MAType_SMA,
        &out_begin_idx,
        &out_nb_element,
        ta_output.data()
    );

    if (ret_code != TA_SUCCESS) {
        logger->error("TA-Lib TA_MA calculation failed for {} with error code: {}", name_, static_cast<int>(ret_code));
        results_.clear();
        throw core::IndicatorCalculationException(fmt::format("TA_MA failed for {} with code {}", name_, static_cast<int>(ret_code)));
    }

    if (out_begin_idx != lookback_ || out_nb_element != static_cast<int>(ta_output.size())) {
        results_.clear();
        throw core::IndicatorCalculationException(fmt::format(
            "TA_MA returned begin={} count={} for {}, expected begin={} count={}",
            out_begin_idx, out_nb_element, name_, lookback_, ta_output.size()));
    }

    // Re-align to the input: the first `lookback_` cells stay undefined
    std::copy(ta_output.begin(), ta_output.end(), results_.begin() + lookback_);

    logger->trace("Successfully calculated {} results for {}", out_nb_element, name_);
}

} // namespace indicators
