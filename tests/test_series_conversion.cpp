#include <catch2/catch.hpp>

#include "series_conversion.hpp"
#include "utils.hpp"
#include "exceptions.hpp"
#include <string>
#include <vector>

using series::IndexedSeries;
using series::PairedSet;

TEST_CASE("IndexedSeries - Construction requires equal lengths", "[IndexedSeries]") {
    REQUIRE_THROWS_AS((IndexedSeries<int>({1, 2, 3}, {1.0, 2.0})), core::LengthMismatchException);

    IndexedSeries<int> s({1, 2}, {3.0, 4.0}, "Date");
    REQUIRE(s.size() == 2);
    REQUIRE(s.getIndexName() == "Date");
    REQUIRE(s[1] == Approx(4.0));
}

TEST_CASE("IndexedSeries - withValues keeps keys and name", "[IndexedSeries]") {
    IndexedSeries<int> s({7, 8}, {1.0, 2.0}, "Date");
    auto replaced = s.withValues({5.0, 6.0});
    REQUIRE(replaced.getIndex() == s.getIndex());
    REQUIRE(replaced.getIndexName() == "Date");
    REQUIRE(replaced.getValues() == std::vector<double>{5.0, 6.0});
    REQUIRE_THROWS_AS(s.withValues({1.0}), core::LengthMismatchException);
}

TEST_CASE("Conversion - Series to PairedSet and back", "[Conversion]") {
    std::vector<core::Timestamp> dates = {
        core::utils::dateStringToTimestamp("2024-01-02"),
        core::utils::dateStringToTimestamp("2024-01-03"),
        core::utils::dateStringToTimestamp("2024-01-04")
    };
    IndexedSeries<core::Timestamp> s(dates, {1.0, 2.0, 3.0}, "Date");

    auto set = series::seriesToPairedSet(s);
    REQUIRE(set.getIndexValues() == dates);
    REQUIRE(set.getValues() == s.getValues());

    auto back = series::pairedSetToSeries(set, "Date");
    REQUIRE(back.getIndex() == dates);
    REQUIRE(back.getValues() == s.getValues());
    REQUIRE(back.getIndexName() == "Date");
}

TEST_CASE("Conversion - Empty inputs are rejected", "[Conversion]") {
    REQUIRE_THROWS_AS(series::seriesToPairedSet(IndexedSeries<int>()), core::EmptySeriesException);
    REQUIRE_THROWS_AS(series::pairedSetToSeries(PairedSet<int, double>()), core::EmptySeriesException);
}

TEST_CASE("Conversion - String PairedSet is coerced to numbers", "[Conversion]") {
    PairedSet<int, std::string> text({1, 2}, {"10", "20.5"});
    auto s = series::pairedSetToSeries(text);
    REQUIRE(s.getValues()[1] == Approx(20.5));
}

TEST_CASE("Conversion - Computed values must match the key count", "[Conversion]") {
    IndexedSeries<int> s({1, 2, 3}, {1.0, 2.0, 3.0}, "Date");

    REQUIRE_THROWS_AS(series::withComputedValues<IndexedSeries<int>>(s, {1.0, 2.0}),
                      core::SeriesConversionException);
    REQUIRE_THROWS_AS((series::withComputedValues<PairedSet<int, std::string>>(s, {1.0, 2.0, 3.0, 4.0})),
                      core::SeriesConversionException);

    PairedSet<int, double> set = series::withComputedValues<PairedSet<int, double>>(s, {4.0, 5.0, 6.0});
    REQUIRE(set.getIndexValues() == std::vector<int>{1, 2, 3});
    REQUIRE(set.getValues() == std::vector<double>{4.0, 5.0, 6.0});
}
