#pragma once

#include "indexed_series.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>
#include <spdlog/fmt/fmt.h>

namespace series {

    namespace detail {

        template<typename>
        inline constexpr bool always_false = false;

        template<typename Value>
        double toDouble(const Value& value) {
            if constexpr (std::is_arithmetic_v<Value>) {
                return static_cast<double>(value);
            } else if constexpr (std::is_convertible_v<Value, std::string>) {
                return core::utils::parseDouble(std::string(value));
            } else {
                static_assert(always_false<Value>, "PairedSet values must be arithmetic or numeric strings");
            }
        }

    } // namespace detail

    // Index/value pairs kept as two positionally aligned arrays.
    //
    // Both arrays always have the same length. Pairs stay in insertion order;
    // the only mutations are the two append operations, which either complete
    // or leave the set unchanged.
    template<typename Key = core::Timestamp, typename Value = double>
    class PairedSet {
    public:
        using key_type = Key;
        using value_type = Value;

        // 2 x N view: index row on top, value row below
        struct CombinedView {
            const std::vector<Key>& index_row;
            const std::vector<Value>& value_row;
        };

        PairedSet() = default;

        PairedSet(std::vector<Key> index_values, std::vector<Value> values)
            : index_values_(std::move(index_values)), values_(std::move(values)) {
            if (index_values_.size() != values_.size()) {
                throw core::LengthMismatchException(fmt::format(
                    "Arrays differ in length: {} index values, {} values.", index_values_.size(), values_.size()));
            }
        }

        std::size_t size() const { return values_.size(); }
        bool empty() const { return values_.empty(); }

        const std::vector<Key>& getIndexValues() const { return index_values_; }
        const std::vector<Value>& getValues() const { return values_; }
        CombinedView combined() const { return CombinedView{index_values_, values_}; }

        std::pair<Key, Value> getPairAt(std::ptrdiff_t position) const {
            if (position < 0 || static_cast<std::size_t>(position) >= values_.size()) {
                throw core::IndexOutOfRangeException(fmt::format(
                    "Position {} out of range for PairedSet of size {}.", position, values_.size()));
            }
            const auto pos = static_cast<std::size_t>(position);
            return {index_values_[pos], values_[pos]};
        }

        // Value paired with the first occurrence of key
        std::optional<Value> getCorrespondingValue(const Key& key) const {
            for (std::size_t i = 0; i < index_values_.size(); ++i) {
                if (index_values_[i] == key) {
                    return values_[i];
                }
            }
            return std::nullopt;
        }

        void appendPair(const Key& key, const Value& value) {
            index_values_.push_back(key);
            try {
                values_.push_back(value);
            } catch (...) {
                index_values_.pop_back();
                throw;
            }
        }

        // other's pairs go after ours, in other's order
        void appendPairedSet(const PairedSet& other) {
            // Copy first so appending a set to itself reads a stable source
            std::vector<Key> new_keys(other.index_values_);
            std::vector<Value> new_values(other.values_);

            index_values_.reserve(index_values_.size() + new_keys.size());
            values_.reserve(values_.size() + new_values.size());

            const std::size_t old_size = index_values_.size();
            index_values_.insert(index_values_.end(),
                                 std::make_move_iterator(new_keys.begin()),
                                 std::make_move_iterator(new_keys.end()));
            try {
                values_.insert(values_.end(),
                               std::make_move_iterator(new_values.begin()),
                               std::make_move_iterator(new_values.end()));
            } catch (...) {
                index_values_.erase(index_values_.begin() + static_cast<std::ptrdiff_t>(old_size),
                                    index_values_.end());
                throw;
            }
        }

        // New set with every value converted to double; this set is left untouched.
        // Throws NonNumericValueException for a value that is not a number.
        PairedSet<Key, double> toFloat() const {
            std::vector<double> converted;
            converted.reserve(values_.size());
            for (const auto& value : values_) {
                converted.push_back(detail::toDouble(value));
            }
            return PairedSet<Key, double>(index_values_, std::move(converted));
        }

        IndexedSeries<Key> toSeries(const std::string& index_name = "") const {
            if constexpr (std::is_same_v<Value, double>) {
                return IndexedSeries<Key>(index_values_, values_, index_name);
            } else {
                return toFloat().toSeries(index_name);
            }
        }

    private:
        std::vector<Key> index_values_;
        std::vector<Value> values_;
    };

} // namespace series
