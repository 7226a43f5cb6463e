#include "analytics/SeriesPreprocessor.h"
#include "analytics/StatisticalAnalysis.h"
#include "common/Types.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <vector>

using namespace regimepairs;
using regimepairs::analytics::DerivedSeries;
using regimepairs::analytics::SeriesPreprocessor;
using regimepairs::analytics::StatisticalAnalysis;

namespace {
PriceSeries makeTrendingPair(size_t n) {
    PriceSeries prices;
    for (size_t t = 0; t < n; ++t) {
        const double a = 100.0 + static_cast<double>(t) + static_cast<double>(t % 3);
        prices.a.push_back(a);
        prices.b.push_back(2.0 * a);
    }
    return prices;
}

template <typename Fn>
bool throwsInvalid(Fn fn) {
    try {
        fn();
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}
}

int main() {
    {
        assert(throwsInvalid([] { SeriesPreprocessor p(1); }));

        SeriesPreprocessor pre(10);
        bool threw = false;
        try {
            pre.compute(makeTrendingPair(10));
        } catch (const InsufficientDataError& e) {
            threw = true;
            assert(e.available() == 10);
            assert(e.required() == 10);
        }
        assert(threw);

        PriceSeries mismatched = makeTrendingPair(20);
        mismatched.b.pop_back();
        assert(throwsInvalid([&] { pre.compute(mismatched); }));

        PriceSeries negative = makeTrendingPair(20);
        negative.a[5] = -1.0;
        assert(throwsInvalid([&] { pre.compute(negative); }));
    }

    {
        // day d <-> raw index W + d
        SeriesPreprocessor pre(10);
        const PriceSeries prices = makeTrendingPair(15);
        const DerivedSeries d = pre.compute(prices);

        assert(d.start_index == 10);
        assert(d.days() == 5);
        assert(d.correlations.size() == 5);
        assert(d.spread.size() == 15);
        assert(d.returns_a.size() == 15 && d.returns_a[0] == 0.0);
        assert(d.rawIndex(4) == 14);

        for (size_t day = 0; day < d.days(); ++day) {
            const size_t t = d.rawIndex(day);
            std::vector<double> window(d.spread.begin() + (t - 9), d.spread.begin() + t + 1);
            const double expected = StatisticalAnalysis::zScore(
                d.spread[t], StatisticalAnalysis::mean(window), StatisticalAnalysis::standardDeviation(window));
            assert(std::abs(d.zscores[day] - expected) < 1e-9);

            // B = 2A -> identical returns
            assert(d.correlations[day].has_value());
            assert(*d.correlations[day] > 0.999);
        }
    }

    {
        // flat prices: zero-variance windows give z = 0 and undefined correlation
        PriceSeries flat;
        flat.a.assign(40, 100.0);
        flat.b.assign(40, 50.0);

        SeriesPreprocessor pre(10);
        const DerivedSeries d = pre.compute(flat);
        assert(d.hedge_ratio == 0.0);
        assert(d.days() == 30);
        for (size_t day = 0; day < d.days(); ++day) {
            assert(d.zscores[day] == 0.0);
            assert(!d.correlations[day].has_value());
        }
    }

    std::cout << "[TEST] SeriesPreprocessor PASSED\n";
    return 0;
}
