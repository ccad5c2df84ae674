// cli/src/main.cpp

#include <iostream>
#include <string>
#include <vector>
#include <exception>
#include <memory>
#include <algorithm>
#include <cmath>
#include <utility>
#include <optional>

#include "logging.hpp"
#include "exceptions.hpp"
#include "config.hpp"
#include "utils.hpp"
#include "yahoo_finance_client.hpp"
#include "price_fetching.hpp"
#include "series_utils.hpp"
#include "technicals.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace {

    using DateSeries = series::IndexedSeries<core::Timestamp>;

    data::QuoteRequest toQuoteRequest(const core::AnalysisConfig& config) {
        data::QuoteRequest request;
        request.start = config.start;
        request.end = config.end;
        request.period = config.period;
        request.interval = config.interval;
        if (!request.start && !request.end && !request.period) {
            request.period = "6mo";
        }
        request.validate();
        return request;
    }

    std::string cell(double value) {
        return std::isnan(value) ? fmt::format("{:>12}", "NaN") : fmt::format("{:>12.4f}", value);
    }

    std::string optionalCell(const std::optional<double>& value) {
        return value ? fmt::format("{:.2f}", *value) : "n/a";
    }

    void printProfile(const data::CompanyProfile& profile) {
        std::cout << fmt::format("{} ({}) on {}, {}\n", profile.long_name, profile.symbol,
                                 profile.exchange, profile.currency);
        std::cout << fmt::format("Sector: {} | Industry: {} | Employees: {}\n", profile.sector, profile.industry,
                                 profile.employees ? std::to_string(*profile.employees) : "n/a");
        std::cout << fmt::format("Price: {} | Prev close: {} | Day: {} - {} | 52w: {} - {}\n",
                                 optionalCell(profile.current_price), optionalCell(profile.previous_close),
                                 optionalCell(profile.day_low), optionalCell(profile.day_high),
                                 optionalCell(profile.year_low), optionalCell(profile.year_high));
        std::cout << fmt::format("Beta: {} | Risk: {} | P/E trailing: {} forward: {} | Avg vol 10d: {}\n",
                                 optionalCell(profile.beta), optionalCell(profile.overall_risk),
                                 optionalCell(profile.trailing_pe), optionalCell(profile.forward_pe),
                                 optionalCell(profile.average_volume_10d));
        for (const auto& officer : profile.officers) {
            std::cout << fmt::format("  {} - {}\n", officer.name, officer.title);
        }
        std::cout << '\n';
    }

    void printTable(const std::vector<std::pair<std::string, DateSeries>>& columns, std::size_t rows) {
        const DateSeries& first = columns.front().second;
        const std::size_t n = first.size();
        const std::size_t begin = n > rows ? n - rows : 0;

        std::string header = fmt::format("{:<12}", "Date");
        for (const auto& column : columns) {
            header += fmt::format("{:>12}", column.first);
        }
        std::cout << header << '\n';

        for (std::size_t i = begin; i < n; ++i) {
            std::string line = fmt::format("{:<12}", core::utils::timestampToDateString(first.getIndex()[i]));
            for (const auto& column : columns) {
                line += cell(column.second[i]);
            }
            std::cout << line << '\n';
        }
        std::cout.flush();
    }

} // namespace

int main(int argc, char* argv[]) {
    std::shared_ptr<spdlog::logger> logger = nullptr;

    try {
        const std::string config_path = argc > 1 ? argv[1] : "config/analysis.json";
        core::AnalysisConfig config = core::AnalysisConfig::loadFromFile(config_path);

        // --- Initialize Logging ---
        core::logging::initialize(config.logging.file,
                                  core::logging::level_from_string(config.logging.console_level),
                                  core::logging::level_from_string(config.logging.file_level));
        logger = core::logging::getLogger();
        logger->info("quantkit CLI starting with config {}", config_path);

        data::YahooFinanceClient client;

        // --- Resolve Ticker ---
        std::string ticker;
        if (config.ticker) {
            ticker = *config.ticker;
        } else {
            auto found = client.searchTicker(*config.company);
            if (!found) {
                throw core::SymbolNotFoundException("No publicly traded ticker for '" + *config.company + "'");
            }
            ticker = *found;
        }

        if (config.show_profile) {
            printProfile(client.getCompanyProfile(ticker));
        }

        // --- Fetch Prices ---
        const data::QuoteRequest request = toQuoteRequest(config);
        const data::PriceField field = data::priceFieldFromString(config.price_field);
        DateSeries prices = data::getPriceSeries(client, ticker, field, request);
        logger->info("Fetched {} {} values for {}", prices.size(), data::toString(field), ticker);

        // --- Clean ---
        DateSeries cleaned = series::fill(prices, series::fillModeFromString(config.fill_mode));
        if (config.normalization) {
            const auto method = series::normalizationMethodFromString(*config.normalization);
            cleaned = series::normalize(cleaned, method);
            logger->info("Normalized prices ({})", series::toString(method));
        }

        // --- Indicators ---
        const core::IndicatorSettings& ind = config.indicators;
        auto macd = indicators::macdAllInfo(cleaned, ind.macd_fast, ind.macd_slow, ind.macd_signal);

        std::vector<std::pair<std::string, DateSeries>> columns;
        columns.emplace_back(data::toString(field), cleaned);
        columns.emplace_back(fmt::format("SMA({})", ind.sma_window),
                             indicators::simpleMovingAverage(cleaned, ind.sma_window));
        columns.emplace_back(fmt::format("EMA({})", ind.ema_lookback),
                             indicators::exponentialMovingAverage(cleaned, ind.ema_lookback, ind.ema_adjust));
        columns.emplace_back(fmt::format("RSI({})", ind.rsi_period), indicators::rsi(cleaned, ind.rsi_period));
        columns.emplace_back("MACD", std::move(macd.macd));
        columns.emplace_back("Signal", std::move(macd.signal));
        columns.emplace_back("Histogram", std::move(macd.histogram));

        printTable(columns, static_cast<std::size_t>(config.print_rows));
        logger->info("quantkit CLI finished.");

    } catch (const core::QuantKitException& ex) {
        std::cerr << "quantkit error: " << ex.what() << std::endl;
        if (logger) logger->critical("quantkit error: {}", ex.what());
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Standard Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Standard Error: {}", ex.what());
        return 1;
    }

    return 0;
}
