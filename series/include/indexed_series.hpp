#pragma once

#include "datatypes.hpp"
#include "exceptions.hpp"
#include <string>
#include <vector>
#include <utility>
#include <spdlog/fmt/fmt.h>

namespace series {

    // Numeric values addressed by an ordered key sequence (the interchange form).
    // Keys are kept in the order given; duplicates are allowed.
    template<typename Key = core::Timestamp>
    class IndexedSeries {
    public:
        using key_type = Key;

        IndexedSeries() = default;

        IndexedSeries(std::vector<Key> index, std::vector<double> values, std::string index_name = "")
            : index_(std::move(index)), values_(std::move(values)), index_name_(std::move(index_name)) {
            if (index_.size() != values_.size()) {
                throw core::LengthMismatchException(fmt::format(
                    "Series index has {} keys but {} values.", index_.size(), values_.size()));
            }
        }

        std::size_t size() const { return values_.size(); }
        bool empty() const { return values_.empty(); }

        const std::vector<Key>& getIndex() const { return index_; }
        const std::vector<double>& getValues() const { return values_; }
        const std::string& getIndexName() const { return index_name_; }

        double operator[](std::size_t position) const { return values_[position]; }

        // Same keys and index name, new values
        IndexedSeries withValues(std::vector<double> values) const {
            return IndexedSeries(index_, std::move(values), index_name_);
        }

    private:
        std::vector<Key> index_;
        std::vector<double> values_;
        std::string index_name_;
    };

} // namespace series
