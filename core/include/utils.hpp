#pragma once

#include "datatypes.hpp"
#include <string>
#include <chrono>
#include <cstdint>

namespace core {
namespace utils {

    // Timestamp -> "YYYY-MM-DD" (UTC calendar date)
    std::string timestampToDateString(const Timestamp& ts);

    // "YYYY-MM-DD" -> midnight UTC. Throws std::runtime_error for any other
    // shape or a day the calendar does not have.
    Timestamp dateStringToTimestamp(const std::string& date_string);

    Timestamp fromEpochSeconds(std::int64_t seconds);
    std::int64_t toEpochSeconds(const Timestamp& ts);

    std::string toLower(const std::string& value);

    // Strict decimal parse: the whole string (ignoring surrounding blanks) must be a number.
    // Throws NonNumericValueException otherwise.
    double parseDouble(const std::string& text);

} // namespace utils
} // namespace core
