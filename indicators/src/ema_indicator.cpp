#include "ema_indicator.hpp"
#include "ewm.hpp"
#include "logging.hpp"
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

EmaIndicator::EmaIndicator(int span, bool adjust) : span_(span), adjust_(adjust), com_(0.0) {
    if (span_ <= 0) {
        throw std::invalid_argument("EMA lookback must be positive.");
    }
    com_ = ewm::comFromSpan(static_cast<double>(span_));
    name_ = adjust_ ? fmt::format("EMA({}, adjusted)", span_) : fmt::format("EMA({})", span_);
    core::logging::getLogger()->debug("EmaIndicator created: Name='{}', Span={}, Adjust={}", name_, span_, adjust_);
}

std::string EmaIndicator::getName() const {
    return name_;
}

// The recursion is defined from the first observation on
int EmaIndicator::getLookback() const {
    return 0;
}

const core::TimeSeries<double>& EmaIndicator::getResult() const {
    return results_;
}

void EmaIndicator::calculate(const core::TimeSeries<double>& input) {
    core::logging::getLogger()->trace("Calculating {} over {} values...", name_, input.size());
    results_ = ewm::mean(input, com_, adjust_);
}

} // namespace indicators
