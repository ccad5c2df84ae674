#pragma once

#include <string>
#include "datatypes.hpp"
#include "indexed_series.hpp"
#include "market_data_provider.hpp"

namespace data {

    // Canonical columns of a quote frame
    enum class PriceField {
        Open,
        High,
        Low,
        Close,
        Volume,
        Dividends,
        StockSplits
    };

    // Case-insensitive; accepts "stock splits", "stock_splits" and "splits". Throws std::invalid_argument.
    PriceField priceFieldFromString(const std::string& field_str);
    std::string toString(PriceField field);

    // One column of the frame as a series keyed by row timestamp, index named "Date"
    series::IndexedSeries<core::Timestamp> extractColumn(const core::QuoteFrame& frame, PriceField field);

    // Fetch history and extract one column
    series::IndexedSeries<core::Timestamp> getPriceSeries(IMarketDataProvider& provider,
                                                          const std::string& ticker,
                                                          PriceField field,
                                                          const QuoteRequest& request);

} // namespace data
