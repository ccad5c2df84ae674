#include "series_utils.hpp"
#include "stats.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <cmath>
#include <stdexcept>

namespace series {

    FillMode fillModeFromString(const std::string& mode) {
        const std::string lower = core::utils::toLower(mode);
        if (lower == "forward" || lower == "ffill") return FillMode::Forward;
        if (lower == "backward" || lower == "bfill") return FillMode::Backward;
        throw std::invalid_argument("Unknown fill mode: " + mode);
    }

    std::string toString(FillMode mode) {
        return mode == FillMode::Forward ? "forward" : "backward";
    }

    NormalizationMethod normalizationMethodFromString(const std::string& method) {
        const std::string lower = core::utils::toLower(method);
        if (lower == "minmax" || lower == "mm" || lower == "m") return NormalizationMethod::MinMax;
        if (lower == "z" || lower == "zscore") return NormalizationMethod::ZScore;
        throw std::invalid_argument("Unknown normalization method: " + method);
    }

    std::string toString(NormalizationMethod method) {
        return method == NormalizationMethod::MinMax ? "minmax" : "z";
    }

    core::TimeSeries<double> fillValues(const core::TimeSeries<double>& values, FillMode mode) {
        if (values.empty()) {
            throw core::EmptySeriesException("Cannot fill an empty series.");
        }
        const auto defined = core::stats::definedValues(values);
        if (defined.empty()) {
            throw core::EmptySeriesException("Cannot fill a series without any defined value.");
        }
        // Seed comes from the input as given, before any propagation
        const double seed = core::stats::mean(defined);

        core::TimeSeries<double> filled(values);
        const std::size_t n = filled.size();
        const std::size_t gaps = n - defined.size();

        if (mode == FillMode::Forward) {
            if (std::isnan(filled.front())) {
                filled.front() = seed;
            }
            for (std::size_t i = 1; i < n; ++i) {
                if (std::isnan(filled[i])) {
                    filled[i] = filled[i - 1];
                }
            }
        } else {
            if (std::isnan(filled.back())) {
                filled.back() = seed;
            }
            for (std::size_t i = n - 1; i > 0; --i) {
                if (std::isnan(filled[i - 1])) {
                    filled[i - 1] = filled[i];
                }
            }
        }

        if (gaps > 0) {
            core::logging::getLogger()->debug("Filled {} of {} cells ({}), seed mean {}",
                                              gaps, n, toString(mode), seed);
        }
        return filled;
    }

    core::TimeSeries<double> normalizeValues(const core::TimeSeries<double>& values, NormalizationMethod method) {
        if (values.empty()) {
            throw core::EmptySeriesException("Cannot normalize an empty series.");
        }
        const auto defined = core::stats::definedValues(values);
        if (defined.empty()) {
            throw core::EmptySeriesException("Cannot normalize a series without any defined value.");
        }

        double offset = 0.0;
        double scale = 0.0;
        if (method == NormalizationMethod::MinMax) {
            offset = core::stats::inf(defined);
            scale = core::stats::sup(defined) - offset;
            if (scale == 0.0) {
                throw core::NumericDegeneracyException("Min-max normalization of a constant series (max == min); try filling or a different method.");
            }
        } else {
            offset = core::stats::mean(defined);
            scale = core::stats::standardDeviation(defined);
            if (scale == 0.0 || std::isnan(scale)) {
                throw core::NumericDegeneracyException("Z-score normalization with zero standard deviation.");
            }
        }

        core::TimeSeries<double> normalized;
        normalized.reserve(values.size());
        for (double v : values) {
            normalized.push_back(std::isnan(v) ? core::kMissing : (v - offset) / scale);
        }
        return normalized;
    }

} // namespace series
