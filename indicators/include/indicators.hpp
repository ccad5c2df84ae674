#pragma once

#include "datatypes.hpp" // TimeSeries
#include <string>
#include <vector>

namespace indicators {

class IIndicator {
public:
    virtual ~IIndicator() = default;

    // Get the name of the indicator (e.g., "SMA(20)", "RSI(14)")
    virtual std::string getName() const = 0;

    // Number of leading output cells left undefined (NaN) because the
    // look-back window is not yet populated.
    virtual int getLookback() const = 0;

    // Calculate the indicator over a value sequence and store the result internally.
    virtual void calculate(const core::TimeSeries<double>& input) = 0;

    // Result of the last calculate(): same length as its input, warm-up cells NaN.
    virtual const core::TimeSeries<double>& getResult() const = 0;
};

} // namespace indicators
