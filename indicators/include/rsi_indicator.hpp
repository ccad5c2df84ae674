#pragma once

#include "indicators.hpp"
#include <vector>
#include <string>

namespace indicators {

// Relative Strength Index with Wilder smoothing (alpha = 1 / period, recursive form).
// The first cell is undefined (no difference yet). Where the average loss is
// zero the value is exactly 100, including a flat series.
class RsiIndicator : public IIndicator {
public:
    explicit RsiIndicator(int period);

    virtual ~RsiIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<double>& input) override;
    const core::TimeSeries<double>& getResult() const override;

    // Smoothed averages from the last calculate(), aligned with getResult()
    const core::TimeSeries<double>& getAverageGain() const;
    const core::TimeSeries<double>& getAverageLoss() const;

private:
    const int period_;
    double com_;
    std::string name_;
    core::TimeSeries<double> avg_gain_;
    core::TimeSeries<double> avg_loss_;
    core::TimeSeries<double> results_;
};

} // namespace indicators
