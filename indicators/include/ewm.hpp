#pragma once

#include "datatypes.hpp"

namespace indicators {
namespace ewm {

    // Decay parameterisations, all expressed as centre of mass (alpha = 1 / (1 + com)).
    // Throw std::invalid_argument outside their domain.
    double comFromSpan(double span);    // span >= 1, alpha = 2 / (span + 1)
    double comFromAlpha(double alpha);  // 0 < alpha <= 1

    // Exponentially weighted mean.
    //
    // adjust == false: recursive form y[0] = x[0], y[i] = (1 - a) y[i-1] + a x[i].
    // adjust == true:  bias-corrected weights (1 - a)^k normalised by their sum.
    //
    // Cells before the first observation are NaN. A missing cell repeats the
    // previous mean; unless ignore_na is set it still decays the old weight.
    core::TimeSeries<double> mean(const core::TimeSeries<double>& values, double com,
                                  bool adjust, bool ignore_na = false);

} // namespace ewm
} // namespace indicators
