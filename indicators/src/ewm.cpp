#include "ewm.hpp"
#include <cmath>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {
namespace ewm {

    double comFromSpan(double span) {
        if (!(span >= 1.0)) {
            throw std::invalid_argument(fmt::format("EWM span must be >= 1, got {}", span));
        }
        return (span - 1.0) / 2.0;
    }

    double comFromAlpha(double alpha) {
        if (!(alpha > 0.0 && alpha <= 1.0)) {
            throw std::invalid_argument(fmt::format("EWM alpha must be in (0, 1], got {}", alpha));
        }
        return 1.0 / alpha - 1.0;
    }

    core::TimeSeries<double> mean(const core::TimeSeries<double>& values, double com,
                                  bool adjust, bool ignore_na) {
        const std::size_t n = values.size();
        core::TimeSeries<double> output(n, core::kMissing);
        if (n == 0) {
            return output;
        }

        const double alpha = 1.0 / (1.0 + com);
        const double old_wt_factor = 1.0 - alpha;
        const double new_wt = adjust ? 1.0 : alpha;

        double weighted = values[0];
        std::size_t nobs = std::isnan(weighted) ? 0 : 1;
        output[0] = nobs > 0 ? weighted : core::kMissing;
        double old_wt = 1.0;

        for (std::size_t i = 1; i < n; ++i) {
            const double cur = values[i];
            const bool is_observation = !std::isnan(cur);
            nobs += is_observation ? 1 : 0;

            if (!std::isnan(weighted)) {
                if (is_observation || !ignore_na) {
                    old_wt *= old_wt_factor;
                    if (is_observation) {
                        // An unchanged value keeps the mean bit-identical
                        if (weighted != cur) {
                            weighted = old_wt * weighted + new_wt * cur;
                            weighted /= (old_wt + new_wt);
                        }
                        if (adjust) {
                            old_wt += new_wt;
                        } else {
                            old_wt = 1.0;
                        }
                    }
                }
            } else if (is_observation) {
                weighted = cur;
            }
            output[i] = nobs > 0 ? weighted : core::kMissing;
        }
        return output;
    }

} // namespace ewm
} // namespace indicators
