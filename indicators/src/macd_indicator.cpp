#include "macd_indicator.hpp"
#include "logging.hpp"
#include <vector>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

MacdIndicator::MacdIndicator(int fast_period, int slow_period, int signal_period)
    : fast_ema_(fast_period), slow_ema_(slow_period), signal_ema_(signal_period) {
    name_ = fmt::format("MACD({},{},{})", fast_period, slow_period, signal_period);
    if (fast_period >= slow_period) {
        core::logging::getLogger()->warn("{}: fast period is not shorter than slow period", name_);
    }
    core::logging::getLogger()->debug("MacdIndicator created: Name='{}'", name_);
}

std::string MacdIndicator::getName() const {
    return name_;
}

int MacdIndicator::getLookback() const {
    return 0;
}

const core::TimeSeries<double>& MacdIndicator::getResult() const {
    return macd_line_;
}

const core::TimeSeries<double>& MacdIndicator::getSignalLine() const {
    return signal_line_;
}

const core::TimeSeries<double>& MacdIndicator::getHistogram() const {
    return histogram_;
}

void MacdIndicator::calculate(const core::TimeSeries<double>& input) {
    core::logging::getLogger()->trace("Calculating {} over {} values...", name_, input.size());

    fast_ema_.calculate(input);
    slow_ema_.calculate(input);
    const auto& fast = fast_ema_.getResult();
    const auto& slow = slow_ema_.getResult();

    const std::size_t n = input.size();
    macd_line_.assign(n, core::kMissing);
    for (std::size_t i = 0; i < n; ++i) {
        macd_line_[i] = fast[i] - slow[i];
    }

    signal_ema_.calculate(macd_line_);
    signal_line_ = signal_ema_.getResult();

    histogram_.assign(n, core::kMissing);
    for (std::size_t i = 0; i < n; ++i) {
        histogram_[i] = macd_line_[i] - signal_line_[i];
    }
}

} // namespace indicators
