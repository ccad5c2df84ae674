#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <limits>

namespace core {

    // Using system_clock for time points, all values are UTC
    using Timestamp = std::chrono::system_clock::time_point;

    // Marker for an undefined numeric cell (warm-up positions, gaps in quote data)
    inline constexpr double kMissing = std::numeric_limits<double>::quiet_NaN();

    // One row of provider quote history
    struct Candle {
        Timestamp timestamp;
        double open = kMissing;
        double high = kMissing;
        double low = kMissing;
        double close = kMissing;
        double volume = kMissing;    // double so a missing volume stays representable
        double dividends = 0.0;      // Cash dividend paid on this row, 0 if none
        double stock_splits = 0.0;   // Split ratio (numerator / denominator), 0 if none

        bool operator<(const Candle& other) const {
            return timestamp < other.timestamp;
        }
    };

    // Tabular OHLCV history for one symbol, ordered by timestamp as delivered
    struct QuoteFrame {
        std::string symbol;
        std::string currency;
        std::string exchange_timezone;
        std::vector<Candle> rows;

        bool empty() const { return rows.empty(); }
        std::size_t size() const { return rows.size(); }
    };

    // Flat value sequence used by the indicator kernels
    template<typename T>
    using TimeSeries = std::vector<T>;

} // namespace core
