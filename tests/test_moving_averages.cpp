#include <catch2/catch.hpp>

#include "technicals.hpp"
#include "ewm.hpp"
#include "exceptions.hpp"
#include <cmath>
#include <stdexcept>
#include <vector>

using series::IndexedSeries;
using series::PairedSet;

namespace {
    IndexedSeries<int> makeSeries(std::vector<double> values) {
        std::vector<int> keys;
        for (int i = 0; i < static_cast<int>(values.size()); ++i) {
            keys.push_back(i);
        }
        return IndexedSeries<int>(std::move(keys), std::move(values), "Date");
    }
}

TEST_CASE("SMA - Trailing window average", "[SMA]") {
    auto sma = indicators::simpleMovingAverage(makeSeries({1.0, 2.0, 3.0, 4.0, 5.0}), 2);
    REQUIRE(sma.size() == 5);
    REQUIRE(std::isnan(sma[0]));
    REQUIRE(sma[1] == Approx(1.5));
    REQUIRE(sma[2] == Approx(2.5));
    REQUIRE(sma[3] == Approx(3.5));
    REQUIRE(sma[4] == Approx(4.5));
}

TEST_CASE("SMA - Window of one reproduces the input", "[SMA]") {
    auto sma = indicators::simpleMovingAverage(makeSeries({4.0, 8.0, 6.0}), 1);
    REQUIRE(sma[0] == Approx(4.0));
    REQUIRE(sma[1] == Approx(8.0));
    REQUIRE(sma[2] == Approx(6.0));
}

TEST_CASE("SMA - Window longer than the series is all undefined", "[SMA]") {
    auto sma = indicators::simpleMovingAverage(makeSeries({1.0, 2.0, 3.0}), 5);
    REQUIRE(sma.size() == 3);
    for (double v : sma.getValues()) {
        REQUIRE(std::isnan(v));
    }
}

TEST_CASE("SMA - Gaps are forward-filled first", "[SMA]") {
    auto sma = indicators::simpleMovingAverage(makeSeries({1.0, NAN, 3.0}), 2);
    REQUIRE(std::isnan(sma[0]));
    REQUIRE(sma[1] == Approx(1.0));
    REQUIRE(sma[2] == Approx(2.0));
}

TEST_CASE("SMA - Series without defined values is all undefined", "[SMA]") {
    auto sma = indicators::simpleMovingAverage(makeSeries({NAN, NAN, NAN}), 2);
    REQUIRE(sma.size() == 3);
    REQUIRE(sma.getIndexName() == "Date");
    for (double v : sma.getValues()) {
        REQUIRE(std::isnan(v));
    }

    PairedSet<int, double> set({4, 5}, {NAN, NAN});
    PairedSet<int, double> from_set = indicators::simpleMovingAverage(set, 1);
    REQUIRE(from_set.getIndexValues() == std::vector<int>{4, 5});
    REQUIRE(std::isnan(from_set.getValues()[0]));
    REQUIRE(std::isnan(from_set.getValues()[1]));
}

TEST_CASE("SMA - PairedSet in, PairedSet out", "[SMA]") {
    PairedSet<int, double> set({10, 20, 30, 40}, {2.0, 4.0, 6.0, 8.0});
    PairedSet<int, double> sma = indicators::simpleMovingAverage(set, 2);
    REQUIRE(sma.getIndexValues() == std::vector<int>{10, 20, 30, 40});
    REQUIRE(std::isnan(sma.getValues()[0]));
    REQUIRE(sma.getValues()[1] == Approx(3.0));
    REQUIRE(sma.getValues()[3] == Approx(7.0));
}

TEST_CASE("SMA - Invalid window", "[SMA]") {
    REQUIRE_THROWS_AS(indicators::SmaIndicator(0), std::invalid_argument);

    indicators::SmaIndicator sma(2);
    REQUIRE(sma.getLookback() == 1);
    REQUIRE(sma.getName() == "SMA(2)");
    REQUIRE_THROWS_AS(sma.calculate({1.0, NAN, 3.0}), core::IndicatorCalculationException);
}

TEST_CASE("EMA - Recursive form", "[EMA]") {
    // span 3 -> alpha 0.5
    auto ema = indicators::exponentialMovingAverage(makeSeries({1.0, 2.0, 3.0, 4.0}), 3);
    REQUIRE(ema[0] == Approx(1.0));
    REQUIRE(ema[1] == Approx(1.5));
    REQUIRE(ema[2] == Approx(2.25));
    REQUIRE(ema[3] == Approx(3.125));
}

TEST_CASE("EMA - Adjusted form", "[EMA]") {
    auto ema = indicators::exponentialMovingAverage(makeSeries({1.0, 2.0, 3.0}), 3, true);
    REQUIRE(ema[0] == Approx(1.0));
    REQUIRE(ema[1] == Approx(2.5 / 1.5));
    REQUIRE(ema[2] == Approx(4.25 / 1.75));
}

TEST_CASE("EMA - Constant series stays constant", "[EMA]") {
    auto ema = indicators::exponentialMovingAverage(makeSeries({7.0, 7.0, 7.0, 7.0}), 10);
    for (double v : ema.getValues()) {
        REQUIRE(v == 7.0);
    }
}

TEST_CASE("EMA - Missing cells", "[EMA]") {
    auto ema = indicators::exponentialMovingAverage(makeSeries({NAN, 2.0, NAN, 4.0}), 3);
    REQUIRE(std::isnan(ema[0]));
    REQUIRE(ema[1] == Approx(2.0));
    REQUIRE(ema[2] == Approx(2.0));
    // The gap decays the old weight: (0.25 * 2 + 0.5 * 4) / 0.75
    REQUIRE(ema[3] == Approx(2.5 / 0.75));
}

TEST_CASE("EMA - PairedSet in, PairedSet out", "[EMA]") {
    PairedSet<int, double> set({10, 20, 30}, {1.0, 2.0, 3.0});
    PairedSet<int, double> ema = indicators::exponentialMovingAverage(set, 3);
    REQUIRE(ema.getIndexValues() == std::vector<int>{10, 20, 30});
    REQUIRE(ema.getValues()[2] == Approx(2.25));
}

TEST_CASE("EWM - Decay parameter conversions", "[EWM]") {
    REQUIRE(indicators::ewm::comFromSpan(3.0) == Approx(1.0));
    REQUIRE(indicators::ewm::comFromAlpha(0.25) == Approx(3.0));
    REQUIRE_THROWS_AS(indicators::ewm::comFromSpan(0.5), std::invalid_argument);
    REQUIRE_THROWS_AS(indicators::ewm::comFromAlpha(0.0), std::invalid_argument);
    REQUIRE_THROWS_AS(indicators::EmaIndicator(0), std::invalid_argument);
}
