#pragma once

#include <string>
#include <vector>
#include <optional>
#include <utility>
#include "market_data_provider.hpp"
#include "datatypes.hpp"

namespace data {

// Market data from the Yahoo Finance public chart and search endpoints
class YahooFinanceClient : public IMarketDataProvider {
public:
    explicit YahooFinanceClient(const std::string& base_url = "https://query1.finance.yahoo.com",
                                int timeout_ms = 15000);

    core::QuoteFrame getQuoteFrame(const std::string& ticker, const QuoteRequest& request) override;
    CompanyProfile getCompanyProfile(const std::string& ticker) override;
    std::optional<std::string> searchTicker(const std::string& company_name) override;

    // --- Response parsing, exposed for offline use ---

    // chart endpoint body -> rows. Throws core::SymbolNotFoundException when the
    // provider reports an error or returns no result, core::DataLoadException on malformed JSON.
    static core::QuoteFrame parseChartResponse(const std::string& body);

    // chart endpoint body -> company snapshot (meta block plus the last row's open)
    static CompanyProfile parseChartMeta(const std::string& body);

    // quoteSummary endpoint body (assetProfile, summaryDetail, defaultKeyStatistics
    // and price modules) merged into profile. Reported fields overwrite chart values.
    // Same exceptions as parseChartResponse.
    static void applyQuoteSummary(const std::string& body, CompanyProfile& profile);

    // search endpoint body -> symbol of the first EQUITY quote
    static std::optional<std::string> parseSearchResponse(const std::string& body);

private:
    std::string base_url_;
    int timeout_ms_;

    // GET base_url_ + endpoint. Returns the body on 200.
    // Throws core::SymbolNotFoundException on 404, core::ApiRequestException otherwise.
    std::string performGetRequest(const std::string& endpoint,
                                  const std::vector<std::pair<std::string, std::string>>& params);
};

} // namespace data
