#pragma once

#include <stdexcept>
#include <string>

namespace core {

    class QuantKitException : public std::runtime_error {
    public:
        explicit QuantKitException(const std::string& message)
            : std::runtime_error(message) {}

        explicit QuantKitException(const char* message)
            : std::runtime_error(message) {}
    };

    // --- Structural errors ---
    class LengthMismatchException : public QuantKitException {
    public: using QuantKitException::QuantKitException; };

    class EmptySeriesException : public QuantKitException {
    public: using QuantKitException::QuantKitException; };

    class SeriesConversionException : public QuantKitException {
    public: using QuantKitException::QuantKitException; };

    class IndexOutOfRangeException : public QuantKitException {
    public: using QuantKitException::QuantKitException; };

    // --- Numeric errors ---
    class NumericDegeneracyException : public QuantKitException {
    public: using QuantKitException::QuantKitException; };

    class NonNumericValueException : public QuantKitException {
    public: using QuantKitException::QuantKitException; };

    class IndicatorCalculationException : public QuantKitException {
    public: using QuantKitException::QuantKitException; };

    // --- Configuration and data access ---
    class ConfigException : public QuantKitException {
    public: using QuantKitException::QuantKitException; };

    class DataLoadException : public QuantKitException {
    public: using QuantKitException::QuantKitException; };

    // Provider does not know the requested symbol
    class SymbolNotFoundException : public DataLoadException {
    public: using DataLoadException::DataLoadException; };

    class ApiRequestException : public QuantKitException {
    public: using QuantKitException::QuantKitException; };

} // namespace core
