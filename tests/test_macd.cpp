#include <catch2/catch.hpp>

#include "technicals.hpp"
#include <cmath>
#include <vector>

using series::IndexedSeries;
using series::PairedSet;

namespace {
    std::vector<double> samplePrices() {
        return {10.0, 10.5, 10.2, 10.8, 11.4, 11.1, 11.9, 12.3, 12.0, 12.6,
                13.1, 12.7, 12.9, 13.5, 14.0, 13.6, 13.2, 13.9, 14.4, 14.1};
    }

    IndexedSeries<int> makeSeries(std::vector<double> values) {
        std::vector<int> keys(values.size());
        for (std::size_t i = 0; i < keys.size(); ++i) {
            keys[i] = static_cast<int>(i);
        }
        return IndexedSeries<int>(std::move(keys), std::move(values));
    }
}

TEST_CASE("MACD - Histogram is MACD minus signal", "[MACD]") {
    auto result = indicators::macdAllInfo(makeSeries(samplePrices()), 3, 6, 4);
    REQUIRE(result.macd.size() == 20);
    for (std::size_t i = 0; i < result.macd.size(); ++i) {
        REQUIRE(result.histogram[i] == result.macd[i] - result.signal[i]);
    }
}

TEST_CASE("MACD - Line is the difference of two EMAs", "[MACD]") {
    auto prices = makeSeries(samplePrices());
    auto fast = indicators::exponentialMovingAverage(prices, 3);
    auto slow = indicators::exponentialMovingAverage(prices, 6);
    auto line = indicators::macdLine(prices, 3, 6, 4);
    for (std::size_t i = 0; i < line.size(); ++i) {
        REQUIRE(line[i] == Approx(fast[i] - slow[i]).margin(1e-12));
    }
    auto signal = indicators::macdSignal(prices, 3, 6, 4);
    auto expected = indicators::exponentialMovingAverage(line, 4);
    for (std::size_t i = 0; i < signal.size(); ++i) {
        REQUIRE(signal[i] == Approx(expected[i]).margin(1e-12));
    }
}

TEST_CASE("MACD - Constant prices give a zero line", "[MACD]") {
    auto hist = indicators::macdHistogram(makeSeries(std::vector<double>(30, 50.0)));
    for (double v : hist.getValues()) {
        REQUIRE(v == 0.0);
    }
}

TEST_CASE("MACD - PairedSet keys are preserved", "[MACD]") {
    std::vector<int> keys;
    for (int i = 0; i < 20; ++i) {
        keys.push_back(100 + i);
    }
    PairedSet<int, double> set(keys, samplePrices());
    auto result = indicators::macdAllInfo(set);
    REQUIRE(result.macd.getIndexValues() == keys);
    REQUIRE(result.signal.getIndexValues() == keys);
    REQUIRE(result.histogram.getIndexValues() == keys);
}
