#pragma once

#include <string>
#include <optional>
#include <vector>
#include <cstdint>
#include "datatypes.hpp" // QuoteFrame

namespace data {

    // Date range or period keyword for a history request
    struct QuoteRequest {
        std::optional<std::string> start;     // YYYY-MM-DD, inclusive
        std::optional<std::string> end;       // YYYY-MM-DD, exclusive
        std::optional<std::string> period;    // 1d 5d 1mo 3mo 6mo 1y 2y 5y 10y ytd max
        std::optional<std::string> interval;  // 1m 2m 5m 15m 30m 60m 90m 1h 1d 5d 1wk 1mo 3mo; 1d if unset

        // Either start and end together, or period alone. Throws core::ConfigException.
        void validate() const;

        std::string effectiveInterval() const { return interval.value_or("1d"); }

        static QuoteRequest forPeriod(const std::string& period, std::optional<std::string> interval = std::nullopt);
        static QuoteRequest forRange(const std::string& start, const std::string& end,
                                     std::optional<std::string> interval = std::nullopt);
    };

    struct CompanyOfficer {
        std::string name;
        std::string title;
        std::optional<int> age;
        std::optional<double> total_pay;
    };

    // Snapshot of company and quote metadata. Unreported fields stay empty.
    struct CompanyProfile {
        std::string symbol;
        std::string long_name;
        std::string short_name;
        std::string exchange;
        std::string currency;
        std::string sector;
        std::string sector_key;
        std::string industry;
        std::string industry_key;
        std::string business_summary;
        std::optional<std::int64_t> employees;
        std::vector<CompanyOfficer> officers;   // Top officers as listed by the provider, at most four

        std::optional<double> current_price;
        std::optional<double> previous_close;
        std::optional<double> day_open;
        std::optional<double> day_high;
        std::optional<double> day_low;
        std::optional<double> day_volume;
        std::optional<double> regular_volume;
        std::optional<double> average_volume_10d;
        std::optional<double> year_high;
        std::optional<double> year_low;
        std::optional<double> beta;
        std::optional<double> overall_risk;
        std::optional<double> trailing_pe;
        std::optional<double> forward_pe;

        // False when either side has no classification
        bool sameIndustry(const CompanyProfile& other) const;
        bool sameSector(const CompanyProfile& other) const;
    };

    class IMarketDataProvider {
    public:
        virtual ~IMarketDataProvider() = default;

        // OHLCV history. Throws core::SymbolNotFoundException for an unknown ticker.
        virtual core::QuoteFrame getQuoteFrame(const std::string& ticker, const QuoteRequest& request) = 0;

        virtual CompanyProfile getCompanyProfile(const std::string& ticker) = 0;

        // First listed equity matching the company name, empty if none
        virtual std::optional<std::string> searchTicker(const std::string& company_name) = 0;
    };

} // namespace data
