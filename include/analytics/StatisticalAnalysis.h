#pragma once

#include <vector>
#include <optional>

namespace regimepairs {
namespace analytics {

// Statistical Analysis - 상태 없는 순수 통계 함수
class StatisticalAnalysis {
public:
    struct RegressionResult {
        double slope;
        double intercept;
        double r_squared;
        std::vector<double> residuals;

        RegressionResult() : slope(0), intercept(0), r_squared(0) {}
    };

    static double mean(const std::vector<double>& series);

    // Pearson correlation. nullopt when lengths differ, n < 2,
    // or either series has zero variance.
    static std::optional<double> correlation(const std::vector<double>& s1,
                                             const std::vector<double>& s2);

    // OLS of y on x. A constant x yields slope 0 and intercept mean(y).
    static RegressionResult linearRegression(const std::vector<double>& x,
                                             const std::vector<double>& y);

    // Population standard deviation (divides by N)
    static double standardDeviation(const std::vector<double>& series);

    static double zScore(double value, double mean, double std_dev);

    // 평균회귀 반감기: -ln(2) / slope of diff(e) on lag(e); +inf when slope >= 0
    static double halfLife(const std::vector<double>& residuals);

    // (p[t] - p[t-1]) / p[t-1], one element shorter than prices
    static std::vector<double> simpleReturns(const std::vector<double>& prices);
};

} // namespace analytics
} // namespace regimepairs
