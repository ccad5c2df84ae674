#include "yahoo_finance_client.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <cstdint>
#include <cmath>
#include <map>

namespace data {

    using json = nlohmann::json;

    namespace {

        json parseBody(const std::string& body) {
            try {
                return json::parse(body);
            } catch (const json::parse_error& e) {
                throw core::DataLoadException(fmt::format("Failed to parse JSON response from Yahoo Finance: {}", e.what()));
            }
        }

        // chart.result[0], or the provider's lookup error
        const json& chartResult(const json& root) {
            if (!root.contains("chart") || !root["chart"].is_object()) {
                throw core::DataLoadException("Unexpected JSON structure: 'chart' not found.");
            }
            const json& chart = root["chart"];
            if (chart.contains("error") && !chart["error"].is_null()) {
                const json& error = chart["error"];
                throw core::SymbolNotFoundException(fmt::format("Yahoo Finance error: {} ({})",
                    error.value("code", "unknown"), error.value("description", "no description")));
            }
            if (!chart.contains("result") || !chart["result"].is_array() || chart["result"].empty()) {
                throw core::SymbolNotFoundException("Yahoo Finance returned no chart result.");
            }
            return chart["result"][0];
        }

        double numberOrMissing(const json& array, std::size_t i) {
            const json& cell = array.at(i);
            return cell.is_number() ? cell.get<double>() : core::kMissing;
        }

        std::optional<double> optionalNumber(const json& object, const char* key) {
            if (object.contains(key) && object[key].is_number()) {
                return object[key].get<double>();
            }
            return std::nullopt;
        }

        std::string stringOr(const json& object, const char* key, const std::string& fallback = "") {
            if (object.contains(key) && object[key].is_string()) {
                return object[key].get<std::string>();
            }
            return fallback;
        }

        // quoteSummary numbers come as {"raw": 1.2, "fmt": "1.20"}; accept plain numbers too
        std::optional<double> rawNumber(const json& object, const char* key) {
            if (!object.contains(key)) {
                return std::nullopt;
            }
            const json& cell = object[key];
            if (cell.is_number()) {
                return cell.get<double>();
            }
            if (cell.is_object() && cell.contains("raw") && cell["raw"].is_number()) {
                return cell["raw"].get<double>();
            }
            return std::nullopt;
        }

        void assignIfReported(std::optional<double>& field, const json& object, const char* key) {
            auto value = rawNumber(object, key);
            if (value) {
                field = value;
            }
        }

        void assignIfReported(std::string& field, const json& object, const char* key) {
            std::string value = stringOr(object, key);
            if (!value.empty()) {
                field = value;
            }
        }

        const json& moduleOrEmpty(const json& result, const char* name) {
            static const json empty_object = json::object();
            if (result.contains(name) && result[name].is_object()) {
                return result[name];
            }
            return empty_object;
        }

        const json& quoteColumn(const json& quote, const char* name, std::size_t expected) {
            if (!quote.contains(name) || !quote[name].is_array()) {
                throw core::DataLoadException(fmt::format("Unexpected JSON structure: quote column '{}' not found.", name));
            }
            if (quote[name].size() != expected) {
                throw core::DataLoadException(fmt::format("Quote column '{}' has {} entries for {} timestamps.",
                                                          name, quote[name].size(), expected));
            }
            return quote[name];
        }

        // events.<kind> is an object keyed by epoch seconds
        std::map<std::int64_t, double> eventValues(const json& result, const char* kind) {
            std::map<std::int64_t, double> values;
            if (!result.contains("events") || !result["events"].contains(kind)) {
                return values;
            }
            for (const auto& item : result["events"][kind].items()) {
                const json& event = item.value();
                const std::int64_t date = event.value("date", static_cast<std::int64_t>(0));
                if (event.contains("amount")) {
                    values[date] = event["amount"].get<double>();
                } else if (event.contains("numerator") && event.contains("denominator")) {
                    const double denominator = event["denominator"].get<double>();
                    if (denominator != 0.0) {
                        values[date] = event["numerator"].get<double>() / denominator;
                    }
                }
            }
            return values;
        }

    } // namespace

    YahooFinanceClient::YahooFinanceClient(const std::string& base_url, int timeout_ms)
        : base_url_(base_url), timeout_ms_(timeout_ms)
    {
        core::logging::getLogger()->debug("YahooFinanceClient created for {}", base_url_);
    }

    core::QuoteFrame YahooFinanceClient::getQuoteFrame(const std::string& ticker, const QuoteRequest& request) {
        request.validate();
        auto logger = core::logging::getLogger();

        std::vector<std::pair<std::string, std::string>> params;
        if (request.period) {
            params.emplace_back("range", *request.period);
        } else {
            params.emplace_back("period1", std::to_string(core::utils::toEpochSeconds(core::utils::dateStringToTimestamp(*request.start))));
            params.emplace_back("period2", std::to_string(core::utils::toEpochSeconds(core::utils::dateStringToTimestamp(*request.end))));
        }
        params.emplace_back("interval", request.effectiveInterval());
        params.emplace_back("events", "div,splits");
        params.emplace_back("includePrePost", "false");

        logger->info("Requesting quote history for {} ({} / {})", ticker,
                     request.period ? *request.period : *request.start + " -> " + *request.end,
                     request.effectiveInterval());

        std::string body = performGetRequest("/v8/finance/chart/" + cpr::util::urlEncode(ticker), params);
        core::QuoteFrame frame = parseChartResponse(body);
        logger->info("Received {} rows for {}", frame.size(), ticker);
        return frame;
    }

    CompanyProfile YahooFinanceClient::getCompanyProfile(const std::string& ticker) {
        const std::string encoded = cpr::util::urlEncode(ticker);
        std::string chart_body = performGetRequest("/v8/finance/chart/" + encoded,
                                                   {{"range", "5d"}, {"interval", "1d"}});
        CompanyProfile profile = parseChartMeta(chart_body);

        std::string summary_body = performGetRequest("/v10/finance/quoteSummary/" + encoded,
            {{"modules", "assetProfile,summaryDetail,defaultKeyStatistics,price"}});
        applyQuoteSummary(summary_body, profile);
        core::logging::getLogger()->info("Loaded company profile for {} ({}, {})",
                                         ticker, profile.sector, profile.industry);
        return profile;
    }

    std::optional<std::string> YahooFinanceClient::searchTicker(const std::string& company_name) {
        std::string body = performGetRequest("/v1/finance/search",
                                             {{"q", company_name}, {"quotesCount", "10"}, {"newsCount", "0"}});
        auto symbol = parseSearchResponse(body);
        if (symbol) {
            core::logging::getLogger()->info("Resolved '{}' to ticker {}", company_name, *symbol);
        } else {
            core::logging::getLogger()->warn("No listed equity found for '{}'", company_name);
        }
        return symbol;
    }

    core::QuoteFrame YahooFinanceClient::parseChartResponse(const std::string& body) {
        const json root = parseBody(body);
        const json& result = chartResult(root);
        core::QuoteFrame frame;

        try {
            const json& meta = result.contains("meta") ? result["meta"] : json::object();
            frame.symbol = stringOr(meta, "symbol");
            frame.currency = stringOr(meta, "currency");
            frame.exchange_timezone = stringOr(meta, "exchangeTimezoneName");

            // A known symbol with no trading in the range has no timestamp array
            if (!result.contains("timestamp") || !result["timestamp"].is_array()) {
                core::logging::getLogger()->warn("Chart result for '{}' has no rows.", frame.symbol);
                return frame;
            }
            const json& timestamps = result["timestamp"];
            const std::size_t n = timestamps.size();

            if (!result.contains("indicators") || !result["indicators"].contains("quote")
                || !result["indicators"]["quote"].is_array() || result["indicators"]["quote"].empty()) {
                throw core::DataLoadException("Unexpected JSON structure: 'indicators.quote' not found.");
            }
            const json& quote = result["indicators"]["quote"][0];
            const json& open = quoteColumn(quote, "open", n);
            const json& high = quoteColumn(quote, "high", n);
            const json& low = quoteColumn(quote, "low", n);
            const json& close = quoteColumn(quote, "close", n);
            const json& volume = quoteColumn(quote, "volume", n);

            const auto dividends = eventValues(result, "dividends");
            const auto splits = eventValues(result, "splits");

            frame.rows.reserve(n);
            for (std::size_t i = 0; i < n; ++i) {
                const std::int64_t epoch = timestamps[i].get<std::int64_t>();
                core::Candle candle;
                candle.timestamp = core::utils::fromEpochSeconds(epoch);
                candle.open = numberOrMissing(open, i);
                candle.high = numberOrMissing(high, i);
                candle.low = numberOrMissing(low, i);
                candle.close = numberOrMissing(close, i);
                candle.volume = numberOrMissing(volume, i);
                auto div_it = dividends.find(epoch);
                if (div_it != dividends.end()) {
                    candle.dividends = div_it->second;
                }
                auto split_it = splits.find(epoch);
                if (split_it != splits.end()) {
                    candle.stock_splits = split_it->second;
                }
                frame.rows.push_back(candle);
            }
        } catch (const json::exception& e) {
            throw core::DataLoadException(fmt::format("Malformed chart response: {}", e.what()));
        }

        core::logging::getLogger()->debug("Parsed {} rows for {}", frame.size(), frame.symbol);
        return frame;
    }

    CompanyProfile YahooFinanceClient::parseChartMeta(const std::string& body) {
        const json root = parseBody(body);
        const json& result = chartResult(root);
        if (!result.contains("meta") || !result["meta"].is_object()) {
            throw core::DataLoadException("Unexpected JSON structure: 'meta' not found.");
        }
        const json& meta = result["meta"];

        CompanyProfile profile;
        profile.symbol = stringOr(meta, "symbol");
        profile.long_name = stringOr(meta, "longName");
        profile.short_name = stringOr(meta, "shortName");
        profile.exchange = stringOr(meta, "fullExchangeName", stringOr(meta, "exchangeName"));
        profile.currency = stringOr(meta, "currency");
        profile.current_price = optionalNumber(meta, "regularMarketPrice");
        profile.previous_close = optionalNumber(meta, "previousClose");
        if (!profile.previous_close) {
            profile.previous_close = optionalNumber(meta, "chartPreviousClose");
        }
        profile.day_high = optionalNumber(meta, "regularMarketDayHigh");
        profile.day_low = optionalNumber(meta, "regularMarketDayLow");
        profile.day_volume = optionalNumber(meta, "regularMarketVolume");
        profile.year_high = optionalNumber(meta, "fiftyTwoWeekHigh");
        profile.year_low = optionalNumber(meta, "fiftyTwoWeekLow");

        const core::QuoteFrame frame = parseChartResponse(body);
        if (!frame.empty() && !std::isnan(frame.rows.back().open)) {
            profile.day_open = frame.rows.back().open;
        }
        return profile;
    }

    void YahooFinanceClient::applyQuoteSummary(const std::string& body, CompanyProfile& profile) {
        const json root = parseBody(body);
        if (!root.contains("quoteSummary") || !root["quoteSummary"].is_object()) {
            throw core::DataLoadException("Unexpected JSON structure: 'quoteSummary' not found.");
        }
        const json& summary = root["quoteSummary"];
        if (summary.contains("error") && !summary["error"].is_null()) {
            const json& error = summary["error"];
            throw core::SymbolNotFoundException(fmt::format("Yahoo Finance error: {} ({})",
                error.value("code", "unknown"), error.value("description", "no description")));
        }
        if (!summary.contains("result") || !summary["result"].is_array() || summary["result"].empty()) {
            throw core::SymbolNotFoundException("Yahoo Finance returned no quote summary.");
        }
        const json& result = summary["result"][0];

        try {
            const json& asset = moduleOrEmpty(result, "assetProfile");
            assignIfReported(profile.sector, asset, "sector");
            assignIfReported(profile.sector_key, asset, "sectorKey");
            assignIfReported(profile.industry, asset, "industry");
            assignIfReported(profile.industry_key, asset, "industryKey");
            assignIfReported(profile.business_summary, asset, "longBusinessSummary");
            assignIfReported(profile.overall_risk, asset, "overallRisk");
            if (auto employees = rawNumber(asset, "fullTimeEmployees")) {
                profile.employees = static_cast<std::int64_t>(*employees);
            }
            if (asset.contains("companyOfficers") && asset["companyOfficers"].is_array()) {
                profile.officers.clear();
                for (const auto& entry : asset["companyOfficers"]) {
                    if (profile.officers.size() == 4) {
                        break;
                    }
                    CompanyOfficer officer;
                    officer.name = stringOr(entry, "name");
                    officer.title = stringOr(entry, "title");
                    if (auto age = rawNumber(entry, "age")) {
                        officer.age = static_cast<int>(*age);
                    }
                    officer.total_pay = rawNumber(entry, "totalPay");
                    profile.officers.push_back(officer);
                }
            }

            const json& detail = moduleOrEmpty(result, "summaryDetail");
            assignIfReported(profile.previous_close, detail, "previousClose");
            assignIfReported(profile.day_open, detail, "open");
            assignIfReported(profile.day_low, detail, "dayLow");
            assignIfReported(profile.day_high, detail, "dayHigh");
            assignIfReported(profile.day_volume, detail, "volume");
            assignIfReported(profile.average_volume_10d, detail, "averageDailyVolume10Day");
            assignIfReported(profile.year_low, detail, "fiftyTwoWeekLow");
            assignIfReported(profile.year_high, detail, "fiftyTwoWeekHigh");
            assignIfReported(profile.beta, detail, "beta");
            assignIfReported(profile.trailing_pe, detail, "trailingPE");
            assignIfReported(profile.forward_pe, detail, "forwardPE");

            const json& stats = moduleOrEmpty(result, "defaultKeyStatistics");
            if (!profile.beta) {
                assignIfReported(profile.beta, stats, "beta");
            }
            if (!profile.forward_pe) {
                assignIfReported(profile.forward_pe, stats, "forwardPE");
            }

            const json& price = moduleOrEmpty(result, "price");
            assignIfReported(profile.regular_volume, price, "regularMarketVolume");
            assignIfReported(profile.current_price, price, "regularMarketPrice");
            assignIfReported(profile.long_name, price, "longName");
            assignIfReported(profile.short_name, price, "shortName");
            assignIfReported(profile.currency, price, "currency");
        } catch (const json::exception& e) {
            throw core::DataLoadException(fmt::format("Malformed quote summary: {}", e.what()));
        }
        core::logging::getLogger()->debug("Applied quote summary: sector '{}', industry '{}', {} officers",
                                          profile.sector, profile.industry, profile.officers.size());
    }

    std::optional<std::string> YahooFinanceClient::parseSearchResponse(const std::string& body) {
        const json root = parseBody(body);
        if (!root.contains("quotes") || !root["quotes"].is_array()) {
            return std::nullopt;
        }
        for (const auto& quote : root["quotes"]) {
            if (stringOr(quote, "quoteType") == "EQUITY") {
                std::string symbol = stringOr(quote, "symbol");
                if (!symbol.empty()) {
                    return symbol;
                }
            }
        }
        return std::nullopt;
    }

    std::string YahooFinanceClient::performGetRequest(const std::string& endpoint,
                                                      const std::vector<std::pair<std::string, std::string>>& params)
    {
        auto logger = core::logging::getLogger();
        const std::string full_url = base_url_ + endpoint;
        logger->debug("Requesting Yahoo Finance URL: {}", full_url);

        cpr::Parameters parameters;
        for (const auto& param : params) {
            parameters.Add({param.first, param.second});
        }
        cpr::Header headers = {
            {"Accept", "application/json"},
            {"User-Agent", "Mozilla/5.0 (X11; Linux x86_64) quantkit"}
        };

        cpr::Response response = cpr::Get(cpr::Url{full_url}, parameters, headers, cpr::Timeout{timeout_ms_});
        logger->debug("Yahoo Finance Response Status: {}, Body size: {}", response.status_code, response.text.length());

        if (response.error) {
            logger->error("Yahoo Finance request failed (CPR error): Code={}, Message='{}'",
                          static_cast<int>(response.error.code), response.error.message);
            throw core::ApiRequestException(fmt::format("Request to {} failed: {}", full_url, response.error.message));
        }
        if (response.status_code == 404) {
            logger->error("Yahoo Finance returned 404 for {}", full_url);
            throw core::SymbolNotFoundException(fmt::format("Symbol not found ({}).", endpoint));
        }
        if (response.status_code != 200) {
            logger->error("Yahoo Finance request failed: Status Code={}, Body='{}'",
                          response.status_code, response.text.substr(0, 500));
            throw core::ApiRequestException(fmt::format("Request to {} returned HTTP {}", full_url, response.status_code));
        }
        return response.text;
    }

} // namespace data
