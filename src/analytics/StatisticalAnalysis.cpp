#include "analytics/StatisticalAnalysis.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace regimepairs {
namespace analytics {

double StatisticalAnalysis::mean(const std::vector<double>& series) {
    if (series.empty()) {
        return 0.0;
    }
    return std::accumulate(series.begin(), series.end(), 0.0) / static_cast<double>(series.size());
}

std::optional<double> StatisticalAnalysis::correlation(const std::vector<double>& s1,
                                                       const std::vector<double>& s2) {
    const size_t n = s1.size();
    if (n < 2 || s2.size() != n) {
        return std::nullopt;
    }

    const double mean1 = mean(s1);
    const double mean2 = mean(s2);

    double covariance = 0.0;
    double variance1 = 0.0;
    double variance2 = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double diff1 = s1[i] - mean1;
        const double diff2 = s2[i] - mean2;
        covariance += diff1 * diff2;
        variance1 += diff1 * diff1;
        variance2 += diff2 * diff2;
    }

    if (variance1 == 0.0 || variance2 == 0.0) {
        return std::nullopt;
    }
    return covariance / std::sqrt(variance1 * variance2);
}

StatisticalAnalysis::RegressionResult StatisticalAnalysis::linearRegression(
    const std::vector<double>& x,
    const std::vector<double>& y
) {
    RegressionResult result;
    const size_t n = std::min(x.size(), y.size());
    if (n == 0) {
        return result;
    }

    double sum_x = 0.0, sum_y = 0.0, sum_xy = 0.0, sum_xx = 0.0;
    for (size_t i = 0; i < n; ++i) {
        sum_x += x[i];
        sum_y += y[i];
        sum_xy += x[i] * y[i];
        sum_xx += x[i] * x[i];
    }

    const double nd = static_cast<double>(n);
    const double denominator = nd * sum_xx - sum_x * sum_x;
    if (denominator != 0.0) {
        result.slope = (nd * sum_xy - sum_x * sum_y) / denominator;
    }
    result.intercept = (sum_y - result.slope * sum_x) / nd;

    const double y_mean = sum_y / nd;
    double total_ss = 0.0;
    double residual_ss = 0.0;
    result.residuals.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        const double residual = y[i] - (result.slope * x[i] + result.intercept);
        result.residuals.push_back(residual);
        residual_ss += residual * residual;
        total_ss += (y[i] - y_mean) * (y[i] - y_mean);
    }
    result.r_squared = (total_ss > 0.0) ? (1.0 - residual_ss / total_ss) : 0.0;

    return result;
}

double StatisticalAnalysis::standardDeviation(const std::vector<double>& series) {
    if (series.empty()) {
        return 0.0;
    }
    const double m = mean(series);
    double variance = 0.0;
    for (double v : series) {
        variance += (v - m) * (v - m);
    }
    variance /= static_cast<double>(series.size());
    return std::sqrt(variance);
}

double StatisticalAnalysis::zScore(double value, double mean, double std_dev) {
    if (std_dev == 0.0) {
        return 0.0;
    }
    return (value - mean) / std_dev;
}

double StatisticalAnalysis::halfLife(const std::vector<double>& residuals) {
    if (residuals.size() < 3) {
        return std::numeric_limits<double>::infinity();
    }

    std::vector<double> lagged(residuals.begin(), residuals.end() - 1);
    std::vector<double> diffs;
    diffs.reserve(lagged.size());
    for (size_t i = 1; i < residuals.size(); ++i) {
        diffs.push_back(residuals[i] - residuals[i - 1]);
    }

    const double lambda = linearRegression(lagged, diffs).slope;
    if (lambda >= 0.0) {
        return std::numeric_limits<double>::infinity();
    }
    return -std::log(2.0) / lambda;
}

std::vector<double> StatisticalAnalysis::simpleReturns(const std::vector<double>& prices) {
    std::vector<double> returns;
    if (prices.size() < 2) {
        return returns;
    }
    returns.reserve(prices.size() - 1);
    for (size_t i = 1; i < prices.size(); ++i) {
        returns.push_back((prices[i] - prices[i - 1]) / prices[i - 1]);
    }
    return returns;
}

} // namespace analytics
} // namespace regimepairs
