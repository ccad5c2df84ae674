#include "market_data_provider.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include <set>
#include <utility>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace data {

    namespace {

        const std::set<std::string>& validPeriods() {
            static const std::set<std::string> periods = {
                "1d", "5d", "1mo", "3mo", "6mo", "1y", "2y", "5y", "10y", "ytd", "max"
            };
            return periods;
        }

        const std::set<std::string>& validIntervals() {
            static const std::set<std::string> intervals = {
                "1m", "2m", "5m", "15m", "30m", "60m", "90m", "1h", "1d", "5d", "1wk", "1mo", "3mo"
            };
            return intervals;
        }

        void requireDate(const std::string& key, const std::string& value) {
            try {
                core::utils::dateStringToTimestamp(value);
            } catch (const std::runtime_error& e) {
                throw core::ConfigException(fmt::format("Quote request '{}' must be a YYYY-MM-DD calendar date, got '{}': {}", key, value, e.what()));
            }
        }

    } // namespace

    void QuoteRequest::validate() const {
        const bool has_range = start.has_value() || end.has_value();
        if (has_range && period.has_value()) {
            throw core::ConfigException("Quote request takes either start/end or period, not both.");
        }
        if (has_range) {
            if (!start || !end) {
                throw core::ConfigException("Quote request needs both start and end dates.");
            }
            requireDate("start", *start);
            requireDate("end", *end);
            if (core::utils::dateStringToTimestamp(*start) >= core::utils::dateStringToTimestamp(*end)) {
                throw core::ConfigException(fmt::format("Quote request start {} is not before end {}", *start, *end));
            }
        } else if (!period) {
            throw core::ConfigException("Quote request needs a date range or a period.");
        } else if (validPeriods().count(*period) == 0) {
            throw core::ConfigException(fmt::format("Unsupported quote period '{}'", *period));
        }
        if (interval && validIntervals().count(*interval) == 0) {
            throw core::ConfigException(fmt::format("Unsupported quote interval '{}'", *interval));
        }
    }

    QuoteRequest QuoteRequest::forPeriod(const std::string& period, std::optional<std::string> interval) {
        QuoteRequest request;
        request.period = period;
        request.interval = std::move(interval);
        return request;
    }

    QuoteRequest QuoteRequest::forRange(const std::string& start, const std::string& end,
                                        std::optional<std::string> interval) {
        QuoteRequest request;
        request.start = start;
        request.end = end;
        request.interval = std::move(interval);
        return request;
    }

    bool CompanyProfile::sameIndustry(const CompanyProfile& other) const {
        return !industry.empty() && industry == other.industry;
    }

    bool CompanyProfile::sameSector(const CompanyProfile& other) const {
        return !sector.empty() && sector == other.sector;
    }

} // namespace data
