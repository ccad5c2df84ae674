#pragma once

#include <vector>

namespace core {
namespace stats {

    // Sample statistics over a flat collection of reals.
    // Every function throws EmptySeriesException on empty input.

    double mean(const std::vector<double>& sample);

    // Sample variance (divides by n - 1). Throws NumericDegeneracyException for a single value.
    double variance(const std::vector<double>& sample);
    double standardDeviation(const std::vector<double>& sample);

    double sup(const std::vector<double>& sample);
    double inf(const std::vector<double>& sample);
    double sampleRange(const std::vector<double>& sample);

    // Most frequent defined value; the smallest one wins a tie
    double mode(const std::vector<double>& sample);

    // Copy of the sample without NaN cells, order preserved
    std::vector<double> definedValues(const std::vector<double>& sample);

} // namespace stats
} // namespace core
