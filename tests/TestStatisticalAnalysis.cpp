#include "analytics/StatisticalAnalysis.h"
#include "analytics/CointegrationAnalyzer.h"
#include "common/Types.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <vector>

using regimepairs::InsufficientDataError;
using regimepairs::analytics::CointegrationAnalyzer;
using regimepairs::analytics::StatisticalAnalysis;

namespace {
bool near(double a, double b, double tol = 1e-9) {
    return std::abs(a - b) <= tol;
}
}

int main() {
    {
        assert(near(StatisticalAnalysis::mean({1.0, 2.0, 3.0}), 2.0));
        assert(StatisticalAnalysis::mean({}) == 0.0);
        assert(near(StatisticalAnalysis::standardDeviation({2, 4, 4, 4, 5, 5, 7, 9}), 2.0));
    }

    {
        auto r = StatisticalAnalysis::linearRegression({1, 2, 3, 4}, {3, 5, 7, 9});
        assert(near(r.slope, 2.0));
        assert(near(r.intercept, 1.0));
        assert(near(r.r_squared, 1.0));
        assert(r.residuals.size() == 4);

        // constant x: slope 0, intercept = mean(y)
        auto flat = StatisticalAnalysis::linearRegression({5, 5, 5}, {1, 2, 3});
        assert(flat.slope == 0.0);
        assert(near(flat.intercept, 2.0));
    }

    {
        auto c = StatisticalAnalysis::correlation({1, 2, 3}, {2, 4, 6});
        assert(c.has_value());
        assert(near(*c, 1.0));

        auto neg = StatisticalAnalysis::correlation({1, 2, 3}, {3, 2, 1});
        assert(neg.has_value() && near(*neg, -1.0));

        // zero variance -> undefined, never NaN
        assert(!StatisticalAnalysis::correlation({1, 2, 3}, {4, 4, 4}).has_value());
        assert(!StatisticalAnalysis::correlation({1, 2, 3}, {1, 2}).has_value());
        assert(!StatisticalAnalysis::correlation({1}, {1}).has_value());
    }

    {
        assert(near(StatisticalAnalysis::zScore(5.0, 3.0, 2.0), 1.0));
        assert(StatisticalAnalysis::zScore(5.0, 3.0, 0.0) == 0.0);
    }

    {
        // e[t] = 0.5 * e[t-1]: lambda = -0.5
        std::vector<double> e{1.0};
        for (int i = 1; i < 10; ++i) {
            e.push_back(e.back() * 0.5);
        }
        assert(near(StatisticalAnalysis::halfLife(e), std::log(2.0) / 0.5, 1e-6));

        // trending residuals never revert
        assert(std::isinf(StatisticalAnalysis::halfLife({0, 1, 2, 3, 4, 5})));
        assert(std::isinf(StatisticalAnalysis::halfLife({1, 2})));
    }

    {
        auto r = StatisticalAnalysis::simpleReturns({100.0, 110.0, 99.0});
        assert(r.size() == 2);
        assert(near(r[0], 0.1));
        assert(near(r[1], -0.1));
        assert(StatisticalAnalysis::simpleReturns({100.0}).empty());
    }

    {
        // B = 2A + 1 with alternating +-0.5 noise: strongly mean-reverting residuals
        std::vector<double> a;
        std::vector<double> b;
        for (int t = 0; t < 60; ++t) {
            const double pa = 10.0 + t;
            a.push_back(pa);
            b.push_back(2.0 * pa + 1.0 + ((t % 2 == 0) ? 0.5 : -0.5));
        }

        auto result = CointegrationAnalyzer::analyze(a, b);
        assert(std::abs(result.hedge_ratio - 2.0) < 0.05);
        assert(result.r_squared > 0.99);
        assert(result.adf_statistic < CointegrationAnalyzer::CRITICAL_1PCT);
        assert(result.is_cointegrated);
        assert(result.p_value == 0.01);
        assert(std::isfinite(result.half_life) && result.half_life > 0.0);
        assert(result.observations == 60);
        assert(result.returns_correlation.has_value());
    }

    {
        std::vector<double> a(20, 1.0);
        std::vector<double> b(20, 2.0);
        bool threw = false;
        try {
            CointegrationAnalyzer::analyze(a, b);
        } catch (const InsufficientDataError& e) {
            threw = true;
            assert(e.available() == 20);
        }
        assert(threw);

        threw = false;
        try {
            CointegrationAnalyzer::analyze(std::vector<double>(40, 1.0), std::vector<double>(41, 1.0));
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "[TEST] StatisticalAnalysis PASSED\n";
    return 0;
}
