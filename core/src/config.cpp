#include "config.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <fstream>
#include <cstdint>
#include <limits>

namespace core {

    namespace {

        std::optional<std::string> optionalString(const json& config, const char* key) {
            if (!config.contains(key) || config[key].is_null()) {
                return std::nullopt;
            }
            if (!config[key].is_string()) {
                throw ConfigException(fmt::format("Config key '{}' must be a string.", key));
            }
            return config[key].get<std::string>();
        }

        std::string stringOr(const json& config, const char* key, const std::string& fallback) {
            auto value = optionalString(config, key);
            return value ? *value : fallback;
        }

        int positiveIntOr(const json& config, const char* key, int fallback) {
            if (!config.contains(key)) {
                return fallback;
            }
            if (!config[key].is_number_integer()) {
                throw ConfigException(fmt::format("Config key '{}' must be an integer.", key));
            }
            // Checked as 64-bit first so 3000000000 is rejected instead of wrapping
            if (config[key].is_number_unsigned()
                    && config[key].get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
                throw ConfigException(fmt::format("Config key '{}' is out of range: {}.", key, config[key].dump()));
            }
            const std::int64_t wide = config[key].get<std::int64_t>();
            if (wide > std::numeric_limits<int>::max() || wide < std::numeric_limits<int>::min()) {
                throw ConfigException(fmt::format("Config key '{}' is out of range: {}.", key, wide));
            }
            int value = static_cast<int>(wide);
            if (value <= 0) {
                throw ConfigException(fmt::format("Config key '{}' must be positive, got {}.", key, value));
            }
            return value;
        }

        bool boolOr(const json& config, const char* key, bool fallback) {
            if (!config.contains(key)) {
                return fallback;
            }
            if (!config[key].is_boolean()) {
                throw ConfigException(fmt::format("Config key '{}' must be a boolean.", key));
            }
            return config[key].get<bool>();
        }

        const json& objectOrEmpty(const json& config, const char* key) {
            static const json empty_object = json::object();
            if (!config.contains(key)) {
                return empty_object;
            }
            if (!config[key].is_object()) {
                throw ConfigException(fmt::format("Config key '{}' must be an object.", key));
            }
            return config[key];
        }

    } // namespace

    AnalysisConfig AnalysisConfig::fromJson(const json& config) {
        if (!config.is_object()) {
            throw ConfigException("Analysis config must be a JSON object.");
        }

        AnalysisConfig result;
        result.ticker = optionalString(config, "ticker");
        result.company = optionalString(config, "company");
        if (result.ticker.has_value() == result.company.has_value()) {
            throw ConfigException("Config requires exactly one of 'ticker' or 'company'.");
        }

        result.start = optionalString(config, "start");
        result.end = optionalString(config, "end");
        result.period = optionalString(config, "period");
        result.interval = optionalString(config, "interval");
        result.price_field = stringOr(config, "price_field", result.price_field);
        result.fill_mode = stringOr(config, "fill_mode", result.fill_mode);
        result.normalization = optionalString(config, "normalization");
        result.print_rows = positiveIntOr(config, "print_rows", result.print_rows);
        result.show_profile = boolOr(config, "show_profile", result.show_profile);

        const json& indicators = objectOrEmpty(config, "indicators");
        IndicatorSettings& ind = result.indicators;
        ind.sma_window = positiveIntOr(indicators, "sma_window", ind.sma_window);
        ind.ema_lookback = positiveIntOr(indicators, "ema_lookback", ind.ema_lookback);
        ind.ema_adjust = boolOr(indicators, "ema_adjust", ind.ema_adjust);
        ind.rsi_period = positiveIntOr(indicators, "rsi_period", ind.rsi_period);
        ind.macd_fast = positiveIntOr(indicators, "macd_fast", ind.macd_fast);
        ind.macd_slow = positiveIntOr(indicators, "macd_slow", ind.macd_slow);
        ind.macd_signal = positiveIntOr(indicators, "macd_signal", ind.macd_signal);

        const json& logging_conf = objectOrEmpty(config, "logging");
        result.logging.file = stringOr(logging_conf, "file", result.logging.file);
        result.logging.console_level = stringOr(logging_conf, "console_level", result.logging.console_level);
        result.logging.file_level = stringOr(logging_conf, "file_level", result.logging.file_level);

        return result;
    }

    AnalysisConfig AnalysisConfig::loadFromFile(const std::string& path) {
        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw ConfigException(fmt::format("Failed to open config file: {}", path));
        }
        json config;
        try {
            config = json::parse(ifs);
        } catch (const json::parse_error& e) {
            throw ConfigException(fmt::format("Failed to parse config file '{}': {}", path, e.what()));
        }
        logging::getLogger()->debug("Loaded analysis config from {}", path);
        return fromJson(config);
    }

} // namespace core
