#pragma once

#include "indicators.hpp"
#include <vector>
#include <string>

namespace indicators {

// Span-based exponential moving average, alpha = 2 / (span + 1).
// adjust == false is the recursive form seeded with the first value.
class EmaIndicator : public IIndicator {
public:
    explicit EmaIndicator(int span, bool adjust = false);

    virtual ~EmaIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<double>& input) override;
    const core::TimeSeries<double>& getResult() const override;

private:
    const int span_;
    const bool adjust_;
    double com_;
    std::string name_;
    core::TimeSeries<double> results_;
};

} // namespace indicators
