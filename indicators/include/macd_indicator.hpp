#pragma once

#include "indicators.hpp"
#include "ema_indicator.hpp"
#include <vector>
#include <string>

namespace indicators {

// MACD line = EMA(fast) - EMA(slow), signal = EMA(macd, signal span),
// histogram = macd - signal. All EMAs use the recursive (unadjusted) form.
class MacdIndicator : public IIndicator {
public:
    MacdIndicator(int fast_period = 12, int slow_period = 26, int signal_period = 9);

    virtual ~MacdIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<double>& input) override;

    // MACD line
    const core::TimeSeries<double>& getResult() const override;
    const core::TimeSeries<double>& getSignalLine() const;
    const core::TimeSeries<double>& getHistogram() const;

private:
    EmaIndicator fast_ema_;
    EmaIndicator slow_ema_;
    EmaIndicator signal_ema_;
    std::string name_;
    core::TimeSeries<double> macd_line_;
    core::TimeSeries<double> signal_line_;
    core::TimeSeries<double> histogram_;
};

} // namespace indicators
