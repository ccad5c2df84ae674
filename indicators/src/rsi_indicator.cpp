#include "rsi_indicator.hpp"
#include "ewm.hpp"
#include "logging.hpp"
#include <vector>
#include <cmath>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

RsiIndicator::RsiIndicator(int period) : period_(period), com_(0.0) {
    if (period_ <= 0) {
        throw std::invalid_argument("RSI period must be positive.");
    }
    com_ = ewm::comFromAlpha(1.0 / static_cast<double>(period_));
    name_ = fmt::format("RSI({})", period_);
    core::logging::getLogger()->debug("RsiIndicator created: Name='{}', Period={}", name_, period_);
}

std::string RsiIndicator::getName() const {
    return name_;
}

int RsiIndicator::getLookback() const {
    return 1;
}

const core::TimeSeries<double>& RsiIndicator::getResult() const {
    return results_;
}

const core::TimeSeries<double>& RsiIndicator::getAverageGain() const {
    return avg_gain_;
}

const core::TimeSeries<double>& RsiIndicator::getAverageLoss() const {
    return avg_loss_;
}

void RsiIndicator::calculate(const core::TimeSeries<double>& input) {
    auto logger = core::logging::getLogger();
    logger->trace("Calculating {} over {} values...", name_, input.size());

    const std::size_t n = input.size();
    core::TimeSeries<double> gains(n, core::kMissing);
    core::TimeSeries<double> losses(n, core::kMissing);
    for (std::size_t i = 1; i < n; ++i) {
        const double delta = input[i] - input[i - 1];
        if (std::isnan(delta)) {
            continue;
        }
        gains[i] = delta > 0.0 ? delta : 0.0;
        losses[i] = delta < 0.0 ? -delta : 0.0;
    }

    avg_gain_ = ewm::mean(gains, com_, false);
    avg_loss_ = ewm::mean(losses, com_, false);

    results_.assign(n, core::kMissing);
    std::size_t saturated = 0;
    for (std::size_t i = 0; i < n; ++i) {
        const double gain = avg_gain_[i];
        const double loss = avg_loss_[i];
        if (std::isnan(gain) || std::isnan(loss)) {
            continue;
        }
        if (loss == 0.0) {
            results_[i] = 100.0;
            ++saturated;
        } else {
            results_[i] = 100.0 - 100.0 / (1.0 + gain / loss);
        }
    }

    if (saturated > 0) {
        logger->trace("{}: {} cells with zero average loss set to 100", name_, saturated);
    }
}

} // namespace indicators
