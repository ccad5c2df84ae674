#include "stats.hpp"
#include "exceptions.hpp"
#include <numeric>
#include <algorithm>
#include <cmath>
#include <map>
#include <iterator>
#include <string>

namespace core {
namespace stats {

    namespace {
        void requireNonEmpty(const std::vector<double>& sample, const char* what) {
            if (sample.empty()) {
                throw EmptySeriesException(std::string(what) + " of an empty data set");
            }
        }
    } // namespace

    double mean(const std::vector<double>& sample) {
        requireNonEmpty(sample, "Mean");
        return std::accumulate(sample.begin(), sample.end(), 0.0) / static_cast<double>(sample.size());
    }

    double variance(const std::vector<double>& sample) {
        requireNonEmpty(sample, "Variance");
        if (sample.size() < 2) {
            throw NumericDegeneracyException("Sample variance needs at least two values");
        }
        const double m = mean(sample);
        double sum = 0.0;
        for (double value : sample) {
            sum += (value - m) * (value - m);
        }
        return sum / static_cast<double>(sample.size() - 1);
    }

    double standardDeviation(const std::vector<double>& sample) {
        return std::sqrt(variance(sample));
    }

    double sup(const std::vector<double>& sample) {
        requireNonEmpty(sample, "Maximum");
        return *std::max_element(sample.begin(), sample.end());
    }

    double inf(const std::vector<double>& sample) {
        requireNonEmpty(sample, "Minimum");
        return *std::min_element(sample.begin(), sample.end());
    }

    double sampleRange(const std::vector<double>& sample) {
        return sup(sample) - inf(sample);
    }

    double mode(const std::vector<double>& sample) {
        requireNonEmpty(sample, "Mode");
        std::map<double, std::size_t> counts; // ordered, so ties resolve to the smallest value
        for (double value : sample) {
            if (!std::isnan(value)) { // NaN has no ordering
                ++counts[value];
            }
        }
        if (counts.empty()) {
            throw EmptySeriesException("Mode of a data set without defined values");
        }
        auto best = counts.begin();
        for (auto it = counts.begin(); it != counts.end(); ++it) {
            if (it->second > best->second) {
                best = it;
            }
        }
        return best->first;
    }

    std::vector<double> definedValues(const std::vector<double>& sample) {
        std::vector<double> defined;
        defined.reserve(sample.size());
        std::copy_if(sample.begin(), sample.end(), std::back_inserter(defined),
                     [](double v) { return !std::isnan(v); });
        return defined;
    }

} // namespace stats
} // namespace core
