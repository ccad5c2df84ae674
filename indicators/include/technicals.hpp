#pragma once

// Indicator functions over either series representation.
//
// Each function accepts an IndexedSeries or a PairedSet and returns the same
// kind with the same keys and length. Values are computed by a fresh
// IIndicator instance per call, so calls never share state.

#include "series_conversion.hpp"
#include "series_utils.hpp"
#include "stats.hpp"
#include "sma_indicator.hpp"
#include "ema_indicator.hpp"
#include "rsi_indicator.hpp"
#include "macd_indicator.hpp"

namespace indicators {

    template<typename SeriesT>
    struct MacdResult {
        SeriesT macd;
        SeriesT signal;
        SeriesT histogram;
    };

    // Forward-fills the input, then averages `window` trailing cells.
    // The first window - 1 cells are NaN; a window longer than the series, or
    // a series without any defined cell, gives all NaN.
    template<typename SeriesT>
    series::result_of_t<SeriesT> simpleMovingAverage(const SeriesT& data, int window) {
        using Adapter = series::SeriesAdapter<SeriesT>;
        SmaIndicator sma(window);
        const auto& native = Adapter::toNative(data);
        if (core::stats::definedValues(native.getValues()).empty()) {
            return series::withComputedValues<SeriesT>(native, core::TimeSeries<double>(native.size(), core::kMissing));
        }
        sma.calculate(series::fillValues(native.getValues(), series::FillMode::Forward));
        return series::withComputedValues<SeriesT>(native, sma.getResult());
    }

    template<typename SeriesT>
    series::result_of_t<SeriesT> exponentialMovingAverage(const SeriesT& data, int lookback, bool adjust = false) {
        using Adapter = series::SeriesAdapter<SeriesT>;
        EmaIndicator ema(lookback, adjust);
        const auto& native = Adapter::toNative(data);
        ema.calculate(native.getValues());
        return series::withComputedValues<SeriesT>(native, ema.getResult());
    }

    template<typename SeriesT>
    series::result_of_t<SeriesT> rsi(const SeriesT& data, int period = 14) {
        using Adapter = series::SeriesAdapter<SeriesT>;
        RsiIndicator indicator(period);
        const auto& native = Adapter::toNative(data);
        indicator.calculate(native.getValues());
        return series::withComputedValues<SeriesT>(native, indicator.getResult());
    }

    template<typename SeriesT>
    MacdResult<series::result_of_t<SeriesT>> macdAllInfo(const SeriesT& data, int fast_period = 12,
                                                        int slow_period = 26, int signal_period = 9) {
        using Adapter = series::SeriesAdapter<SeriesT>;
        MacdIndicator macd(fast_period, slow_period, signal_period);
        const auto& native = Adapter::toNative(data);
        macd.calculate(native.getValues());
        return MacdResult<series::result_of_t<SeriesT>>{
            series::withComputedValues<SeriesT>(native, macd.getResult()),
            series::withComputedValues<SeriesT>(native, macd.getSignalLine()),
            series::withComputedValues<SeriesT>(native, macd.getHistogram())
        };
    }

    template<typename SeriesT>
    series::result_of_t<SeriesT> macdLine(const SeriesT& data, int fast_period = 12,
                                          int slow_period = 26, int signal_period = 9) {
        return macdAllInfo(data, fast_period, slow_period, signal_period).macd;
    }

    template<typename SeriesT>
    series::result_of_t<SeriesT> macdSignal(const SeriesT& data, int fast_period = 12,
                                            int slow_period = 26, int signal_period = 9) {
        return macdAllInfo(data, fast_period, slow_period, signal_period).signal;
    }

    template<typename SeriesT>
    series::result_of_t<SeriesT> macdHistogram(const SeriesT& data, int fast_period = 12,
                                               int slow_period = 26, int signal_period = 9) {
        return macdAllInfo(data, fast_period, slow_period, signal_period).histogram;
    }

} // namespace indicators
