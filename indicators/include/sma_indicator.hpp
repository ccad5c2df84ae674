#pragma once

#include "indicators.hpp"
#include <vector>
#include <string>

namespace indicators {

// Trailing arithmetic mean over `period` cells, computed with TA-Lib.
// Input must be gap-free (simpleMovingAverage() fills it first).
class SmaIndicator : public IIndicator {
public:
    explicit SmaIndicator(int period);

    virtual ~SmaIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<double>& input) override;
    const core::TimeSeries<double>& getResult() const override;

private:
    const int period_;
    int lookback_;              // TA-Lib lookback, period - 1
    std::string name_;
    core::TimeSeries<double> results_;
};

} // namespace indicators
