#include "analytics/SeriesPreprocessor.h"
#include "analytics/StatisticalAnalysis.h"
#include "common/Logger.h"
#include <cmath>
#include <stdexcept>
#include <string>

namespace regimepairs {
namespace analytics {

namespace {
// Rounding noise on a flat spread window; treated as zero variance.
constexpr double MIN_SPREAD_STD = 1e-12;
}

SeriesPreprocessor::SeriesPreprocessor(int window)
    : window_(window)
{
    if (window_ < 2) {
        throw std::invalid_argument("rolling window must be >= 2, got " + std::to_string(window_));
    }
}

void SeriesPreprocessor::validatePrices(const PriceSeries& prices) {
    if (prices.a.size() != prices.b.size()) {
        throw std::invalid_argument("price series lengths differ: " +
                                    std::to_string(prices.a.size()) + " vs " +
                                    std::to_string(prices.b.size()));
    }
    for (size_t i = 0; i < prices.a.size(); ++i) {
        if (!std::isfinite(prices.a[i]) || prices.a[i] <= 0.0 ||
            !std::isfinite(prices.b[i]) || prices.b[i] <= 0.0) {
            throw std::invalid_argument("non-positive or non-finite price at index " + std::to_string(i));
        }
    }
}

DerivedSeries SeriesPreprocessor::compute(const PriceSeries& prices) const {
    validatePrices(prices);

    const size_t n = prices.a.size();
    const size_t w = static_cast<size_t>(window_);
    if (n <= w) {
        throw InsufficientDataError(n, w);
    }

    DerivedSeries out;
    out.start_index = w;

    // 1. 전체 구간 회귀로 헤지 비율 고정 (window별 재추정 없음)
    out.hedge_ratio = StatisticalAnalysis::linearRegression(prices.a, prices.b).slope;

    // 2. 로그 가격 / 스프레드 / 수익률
    out.log_price_a.reserve(n);
    out.log_price_b.reserve(n);
    out.spread.reserve(n);
    for (size_t t = 0; t < n; ++t) {
        const double la = std::log(prices.a[t]);
        const double lb = std::log(prices.b[t]);
        out.log_price_a.push_back(la);
        out.log_price_b.push_back(lb);
        out.spread.push_back(la - out.hedge_ratio * lb);
    }

    out.returns_a.assign(n, 0.0);
    out.returns_b.assign(n, 0.0);
    for (size_t t = 1; t < n; ++t) {
        out.returns_a[t] = (prices.a[t] - prices.a[t - 1]) / prices.a[t - 1];
        out.returns_b[t] = (prices.b[t] - prices.b[t - 1]) / prices.b[t - 1];
    }

    // 3. 롤링 z-score / 상관계수, 같은 raw index t 에 정렬
    out.zscores.reserve(n - w);
    out.correlations.reserve(n - w);
    for (size_t t = w; t < n; ++t) {
        const size_t first = t + 1 - w;

        std::vector<double> spread_window(out.spread.begin() + first, out.spread.begin() + t + 1);
        const double m = StatisticalAnalysis::mean(spread_window);
        double sd = StatisticalAnalysis::standardDeviation(spread_window);
        if (sd < MIN_SPREAD_STD) {
            sd = 0.0;
        }
        out.zscores.push_back(StatisticalAnalysis::zScore(out.spread[t], m, sd));

        std::vector<double> ra(out.returns_a.begin() + first, out.returns_a.begin() + t + 1);
        std::vector<double> rb(out.returns_b.begin() + first, out.returns_b.begin() + t + 1);
        out.correlations.push_back(StatisticalAnalysis::correlation(ra, rb));
    }

    LOG_INFO("Preprocessed {} observations: hedge ratio {:.4f}, {} simulation days (window {})",
             n, out.hedge_ratio, out.days(), window_);
    return out;
}

} // namespace analytics
} // namespace regimepairs
