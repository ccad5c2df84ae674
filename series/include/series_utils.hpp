#pragma once

#include "series_conversion.hpp"
#include "datatypes.hpp"
#include <string>
#include <vector>

namespace series {

    enum class FillMode {
        Forward,  // Gap takes the previous defined value; a missing first cell is seeded with the mean
        Backward  // Gap takes the next defined value; a missing last cell is seeded with the mean
    };

    enum class NormalizationMethod {
        MinMax,   // (v - min) / (max - min)
        ZScore    // (v - mean) / sample stddev
    };

    // "forward"/"ffill" and "backward"/"bfill", case-insensitive. Throws std::invalid_argument.
    FillMode fillModeFromString(const std::string& mode);
    std::string toString(FillMode mode);

    // "minmax"/"mm"/"m" and "z"/"zscore", case-insensitive. Throws std::invalid_argument.
    NormalizationMethod normalizationMethodFromString(const std::string& method);
    std::string toString(NormalizationMethod method);

    // --- Value kernels ---

    // Throws EmptySeriesException when values is empty or has no defined cell.
    core::TimeSeries<double> fillValues(const core::TimeSeries<double>& values, FillMode mode);

    // Missing cells stay missing. Throws EmptySeriesException when there is no defined cell,
    // NumericDegeneracyException for a zero (or undefined) denominator.
    core::TimeSeries<double> normalizeValues(const core::TimeSeries<double>& values, NormalizationMethod method);

    // --- Representation-preserving wrappers ---

    template<typename SeriesT>
    result_of_t<SeriesT> fill(const SeriesT& data, FillMode mode = FillMode::Forward) {
        using Adapter = SeriesAdapter<SeriesT>;
        const auto& native = Adapter::toNative(data);
        return withComputedValues<SeriesT>(native, fillValues(native.getValues(), mode));
    }

    template<typename SeriesT>
    result_of_t<SeriesT> normalize(const SeriesT& data, NormalizationMethod method = NormalizationMethod::MinMax) {
        using Adapter = SeriesAdapter<SeriesT>;
        const auto& native = Adapter::toNative(data);
        return withComputedValues<SeriesT>(native, normalizeValues(native.getValues(), method));
    }

} // namespace series
