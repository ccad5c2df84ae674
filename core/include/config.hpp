#pragma once

#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace core {

    using json = nlohmann::json;

    // Period parameters for each indicator the analysis computes
    struct IndicatorSettings {
        int sma_window = 20;
        int ema_lookback = 20;
        bool ema_adjust = false;
        int rsi_period = 14;
        int macd_fast = 12;
        int macd_slow = 26;
        int macd_signal = 9;
    };

    struct LoggingSettings {
        std::string file = "quantkit";
        std::string console_level = "info";
        std::string file_level = "debug";
    };

    // One analysis run: which prices to fetch and how to process them
    struct AnalysisConfig {
        std::optional<std::string> ticker;
        std::optional<std::string> company;  // Resolved to a ticker through the provider's search
        std::optional<std::string> start;    // YYYY-MM-DD
        std::optional<std::string> end;      // YYYY-MM-DD
        std::optional<std::string> period;   // e.g. "6mo"; alternative to start/end
        std::optional<std::string> interval;
        std::string price_field = "Close";
        std::string fill_mode = "forward";
        std::optional<std::string> normalization;
        int print_rows = 10;
        bool show_profile = false;           // Print the company profile before the table
        IndicatorSettings indicators;
        LoggingSettings logging;

        // Throws ConfigException naming the offending key
        static AnalysisConfig fromJson(const json& config);
        static AnalysisConfig loadFromFile(const std::string& path);
    };

} // namespace core
