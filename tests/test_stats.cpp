#include <catch2/catch.hpp>

#include "stats.hpp"
#include "exceptions.hpp"
#include <cmath>
#include <vector>

using namespace core;

TEST_CASE("Stats - Moments", "[Stats]") {
    std::vector<double> sample = {1.0, 2.0, 3.0, 4.0};
    REQUIRE(stats::mean(sample) == Approx(2.5));
    REQUIRE(stats::variance(sample) == Approx(5.0 / 3.0));
    REQUIRE(stats::standardDeviation(sample) == Approx(std::sqrt(5.0 / 3.0)));
}

TEST_CASE("Stats - Extremes and range", "[Stats]") {
    std::vector<double> sample = {3.0, -1.0, 7.5, 2.0};
    REQUIRE(stats::sup(sample) == Approx(7.5));
    REQUIRE(stats::inf(sample) == Approx(-1.0));
    REQUIRE(stats::sampleRange(sample) == Approx(8.5));
}

TEST_CASE("Stats - Mode prefers the smallest tied value", "[Stats]") {
    REQUIRE(stats::mode({1.0, 2.0, 2.0, 3.0}) == Approx(2.0));
    REQUIRE(stats::mode({3.0, 3.0, 1.0, 1.0, 2.0}) == Approx(1.0));
    REQUIRE(stats::mode({NAN, 4.0, NAN}) == Approx(4.0));
    REQUIRE_THROWS_AS(stats::mode({NAN}), EmptySeriesException);
}

TEST_CASE("Stats - Degenerate samples", "[Stats]") {
    REQUIRE_THROWS_AS(stats::mean({}), EmptySeriesException);
    REQUIRE_THROWS_AS(stats::sup({}), EmptySeriesException);
    REQUIRE_THROWS_AS(stats::variance({1.0}), NumericDegeneracyException);
}

TEST_CASE("Stats - definedValues drops missing cells", "[Stats]") {
    auto defined = stats::definedValues({NAN, 1.0, NAN, 2.0});
    REQUIRE(defined == std::vector<double>{1.0, 2.0});
}
