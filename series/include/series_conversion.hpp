#pragma once

#include "indexed_series.hpp"
#include "paired_set.hpp"
#include "exceptions.hpp"
#include <string>
#include <utility>
#include <vector>
#include <spdlog/fmt/fmt.h>

namespace series {

    // IndexedSeries -> PairedSet. Index becomes the key array, values the value array.
    template<typename Key>
    PairedSet<Key, double> seriesToPairedSet(const IndexedSeries<Key>& input) {
        if (input.empty()) {
            throw core::EmptySeriesException("Cannot convert an empty series to a PairedSet.");
        }
        return PairedSet<Key, double>(input.getIndex(), input.getValues());
    }

    template<typename Key, typename Value>
    IndexedSeries<Key> pairedSetToSeries(const PairedSet<Key, Value>& input, const std::string& index_name = "") {
        if (input.empty()) {
            throw core::EmptySeriesException("Cannot convert an empty PairedSet to a series.");
        }
        return input.toSeries(index_name);
    }

    // --- Conversion boundary for representation-preserving computations ---
    // toNative() brings any supported input into IndexedSeries form,
    // fromNative() turns a result back into the caller's representation.
    template<typename SeriesT>
    struct SeriesAdapter;

    template<typename Key>
    struct SeriesAdapter<IndexedSeries<Key>> {
        using key_type = Key;
        using result_type = IndexedSeries<Key>;

        static const IndexedSeries<Key>& toNative(const IndexedSeries<Key>& input) { return input; }
        static result_type fromNative(IndexedSeries<Key> native) { return native; }
    };

    // Non-double PairedSets are coerced on the way in and come back as PairedSet<Key, double>
    template<typename Key, typename Value>
    struct SeriesAdapter<PairedSet<Key, Value>> {
        using key_type = Key;
        using result_type = PairedSet<Key, double>;

        static IndexedSeries<Key> toNative(const PairedSet<Key, Value>& input) {
            return pairedSetToSeries(input);
        }
        static result_type fromNative(const IndexedSeries<Key>& native) {
            return seriesToPairedSet(native);
        }
    };

    template<typename SeriesT>
    using result_of_t = typename SeriesAdapter<SeriesT>::result_type;

    // Puts computed values back on the keys of `native` and returns them in
    // the representation of SeriesT. Throws SeriesConversionException when the
    // value count does not match the key count.
    template<typename SeriesT, typename Key>
    result_of_t<SeriesT> withComputedValues(const IndexedSeries<Key>& native, std::vector<double> values) {
        if (values.size() != native.size()) {
            throw core::SeriesConversionException(fmt::format(
                "Index-value count mismatch: {} keys, {} values.", native.size(), values.size()));
        }
        return SeriesAdapter<SeriesT>::fromNative(native.withValues(std::move(values)));
    }

} // namespace series
