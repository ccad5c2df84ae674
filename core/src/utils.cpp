#include "utils.hpp"
#include "exceptions.hpp"
#include <iomanip>    // For std::put_time, std::get_time
#include <sstream>
#include <string>
#include <stdexcept>
#include <cctype>
#include <cstdlib>    // For std::strtod
#include <cerrno>
#include <ctime>
#include <algorithm>

namespace core {
namespace utils {

    namespace {

        std::tm toUtcTm(const Timestamp& ts) {
            auto tt = std::chrono::system_clock::to_time_t(ts);
            std::tm time_tm;
            #ifdef _WIN32
                gmtime_s(&time_tm, &tt);
            #else
                gmtime_r(&tt, &time_tm);
            #endif
            return time_tm;
        }

        std::time_t utcTmToTimeT(std::tm& tm) {
            #ifdef _WIN32
                return _mkgmtime(&tm);
            #else
                return timegm(&tm);
            #endif
        }

    } // namespace

    std::string timestampToDateString(const Timestamp& ts) {
        std::tm time_tm = toUtcTm(ts);
        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%d");
        return oss.str();
    }

    Timestamp dateStringToTimestamp(const std::string& date_string) {
        std::tm tm = {};
        std::istringstream ss(date_string);
        if (date_string.size() != 10) {
            throw std::runtime_error("Date must be YYYY-MM-DD: " + date_string);
        }
        ss >> std::get_time(&tm, "%Y-%m-%d");
        if (ss.fail()) {
            throw std::runtime_error("Failed to parse date: " + date_string);
        }
        std::time_t tt = utcTmToTimeT(tm);
        if (tt == static_cast<std::time_t>(-1)) {
            throw std::runtime_error("Failed to convert parsed date to UTC epoch seconds: " + date_string);
        }
        Timestamp ts = std::chrono::system_clock::from_time_t(tt);
        // timegm rolls impossible days (2024-02-30) into the next month
        if (timestampToDateString(ts) != date_string) {
            throw std::runtime_error("Not a calendar date: " + date_string);
        }
        return ts;
    }

    Timestamp fromEpochSeconds(std::int64_t seconds) {
        return Timestamp(std::chrono::seconds(seconds));
    }

    std::int64_t toEpochSeconds(const Timestamp& ts) {
        return std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
    }

    std::string toLower(const std::string& value) {
        std::string lower_str = value;
        std::transform(lower_str.begin(), lower_str.end(), lower_str.begin(),
            [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
        return lower_str;
    }

    double parseDouble(const std::string& text) {
        const char* begin = text.c_str();
        while (*begin != '\0' && std::isspace(static_cast<unsigned char>(*begin))) {
            ++begin;
        }
        if (*begin == '\0') {
            throw NonNumericValueException("Cannot convert empty string to a number");
        }
        char* end = nullptr;
        errno = 0;
        double value = std::strtod(begin, &end);
        if (end == begin || errno == ERANGE) {
            throw NonNumericValueException("Cannot convert '" + text + "' to a number");
        }
        while (*end != '\0' && std::isspace(static_cast<unsigned char>(*end))) {
            ++end;
        }
        if (*end != '\0') {
            throw NonNumericValueException("Trailing characters after number in '" + text + "'");
        }
        return value;
    }

} // namespace utils
} // namespace core
