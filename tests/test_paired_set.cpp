#include <catch2/catch.hpp>

#include "paired_set.hpp"
#include "series_conversion.hpp"
#include "exceptions.hpp"
#include <string>
#include <vector>

using series::PairedSet;

TEST_CASE("PairedSet - Construction requires equal lengths", "[PairedSet]") {
    REQUIRE_NOTHROW(PairedSet<int, double>({1, 2, 3}, {10.0, 20.0, 30.0}));
    REQUIRE_THROWS_AS((PairedSet<int, double>({1, 2}, {10.0})), core::LengthMismatchException);
}

TEST_CASE("PairedSet - Lookup by position and key", "[PairedSet]") {
    PairedSet<int, double> set({1, 2, 2}, {10.0, 20.0, 30.0});

    auto pair = set.getPairAt(1);
    REQUIRE(pair.first == 2);
    REQUIRE(pair.second == Approx(20.0));

    REQUIRE_THROWS_AS(set.getPairAt(3), core::IndexOutOfRangeException);
    REQUIRE_THROWS_AS(set.getPairAt(-1), core::IndexOutOfRangeException);

    // First occurrence wins for duplicated keys
    REQUIRE(set.getCorrespondingValue(2).value() == Approx(20.0));
    REQUIRE_FALSE(set.getCorrespondingValue(7).has_value());
}

TEST_CASE("PairedSet - Combined view exposes both rows", "[PairedSet]") {
    PairedSet<int, double> set({5, 6}, {1.5, 2.5});
    auto view = set.combined();
    REQUIRE(view.index_row == std::vector<int>{5, 6});
    REQUIRE(view.value_row == std::vector<double>{1.5, 2.5});
}

TEST_CASE("PairedSet - Appending keeps insertion order", "[PairedSet]") {
    PairedSet<int, double> set({1}, {1.0});
    set.appendPair(2, 2.0);
    REQUIRE(set.size() == 2);

    PairedSet<int, double> tail({3, 4}, {3.0, 4.0});
    set.appendPairedSet(tail);
    REQUIRE(set.getIndexValues() == std::vector<int>{1, 2, 3, 4});
    REQUIRE(set.getValues() == std::vector<double>{1.0, 2.0, 3.0, 4.0});
    REQUIRE(tail.size() == 2);
}

TEST_CASE("PairedSet - Appending a set to itself doubles it", "[PairedSet]") {
    PairedSet<int, double> set({1, 2}, {1.0, 2.0});
    set.appendPairedSet(set);
    REQUIRE(set.getIndexValues() == std::vector<int>{1, 2, 1, 2});
    REQUIRE(set.getValues() == std::vector<double>{1.0, 2.0, 1.0, 2.0});
}

TEST_CASE("PairedSet - toFloat converts numeric strings", "[PairedSet]") {
    PairedSet<int, std::string> text({1, 2}, {"1.5", " 2 "});
    auto numeric = text.toFloat();
    REQUIRE(numeric.getValues()[0] == Approx(1.5));
    REQUIRE(numeric.getValues()[1] == Approx(2.0));
    REQUIRE(text.getValues()[0] == "1.5");

    PairedSet<int, std::string> bad({1}, {"abc"});
    REQUIRE_THROWS_AS(bad.toFloat(), core::NonNumericValueException);
}

TEST_CASE("PairedSet - toFloat widens integers", "[PairedSet]") {
    PairedSet<int, int> ints({1, 2}, {3, 4});
    auto numeric = ints.toFloat();
    REQUIRE(numeric.getValues() == std::vector<double>{3.0, 4.0});
}

TEST_CASE("PairedSet - Round trip through a series", "[PairedSet]") {
    PairedSet<int, double> set({1, 2, 3}, {2.0, 4.0, 6.0});
    auto pair = set.getPairAt(1);
    REQUIRE(pair.first == 2);
    REQUIRE(pair.second == 4.0);

    auto back = series::seriesToPairedSet(set.toSeries("Date"));
    REQUIRE(back.getIndexValues() == set.getIndexValues());
    REQUIRE(back.getValues() == set.getValues());
}
