#include "price_fetching.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include <stdexcept>
#include <vector>
#include <utility>

namespace data {

    PriceField priceFieldFromString(const std::string& field_str) {
        const std::string lower_str = core::utils::toLower(field_str);
        if (lower_str == "open") return PriceField::Open;
        if (lower_str == "high") return PriceField::High;
        if (lower_str == "low") return PriceField::Low;
        if (lower_str == "close") return PriceField::Close;
        if (lower_str == "volume") return PriceField::Volume;
        if (lower_str == "dividends") return PriceField::Dividends;
        if (lower_str == "stock splits" || lower_str == "stock_splits" || lower_str == "splits") return PriceField::StockSplits;
        throw std::invalid_argument("Unknown price field string: " + field_str);
    }

    std::string toString(PriceField field) {
        switch (field) {
            case PriceField::Open: return "Open";
            case PriceField::High: return "High";
            case PriceField::Low: return "Low";
            case PriceField::Close: return "Close";
            case PriceField::Volume: return "Volume";
            case PriceField::Dividends: return "Dividends";
            case PriceField::StockSplits: return "Stock Splits";
        }
        return "Unknown";
    }

    namespace {
        double fieldValue(const core::Candle& candle, PriceField field) {
            switch (field) {
                case PriceField::Open: return candle.open;
                case PriceField::High: return candle.high;
                case PriceField::Low: return candle.low;
                case PriceField::Close: return candle.close;
                case PriceField::Volume: return candle.volume;
                case PriceField::Dividends: return candle.dividends;
                case PriceField::StockSplits: return candle.stock_splits;
            }
            return core::kMissing;
        }
    } // namespace

    series::IndexedSeries<core::Timestamp> extractColumn(const core::QuoteFrame& frame, PriceField field) {
        std::vector<core::Timestamp> index;
        std::vector<double> values;
        index.reserve(frame.size());
        values.reserve(frame.size());
        for (const auto& candle : frame.rows) {
            index.push_back(candle.timestamp);
            values.push_back(fieldValue(candle, field));
        }
        return series::IndexedSeries<core::Timestamp>(std::move(index), std::move(values), "Date");
    }

    series::IndexedSeries<core::Timestamp> getPriceSeries(IMarketDataProvider& provider,
                                                          const std::string& ticker,
                                                          PriceField field,
                                                          const QuoteRequest& request) {
        core::QuoteFrame frame = provider.getQuoteFrame(ticker, request);
        if (frame.empty()) {
            throw core::DataLoadException("No quote rows returned for " + ticker);
        }
        core::logging::getLogger()->debug("Extracting {} column ({} rows) for {}", toString(field), frame.size(), ticker);
        return extractColumn(frame, field);
    }

} // namespace data
