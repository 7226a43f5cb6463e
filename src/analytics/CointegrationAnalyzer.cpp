#include "analytics/CointegrationAnalyzer.h"
#include "analytics/StatisticalAnalysis.h"
#include "common/Logger.h"
#include "common/Types.h"
#include <cmath>
#include <stdexcept>

namespace regimepairs {
namespace analytics {

double CointegrationAnalyzer::adfStatistic(const std::vector<double>& series) {
    if (series.size() < 3) {
        return 0.0;
    }

    std::vector<double> lagged(series.begin(), series.end() - 1);
    std::vector<double> diffs;
    diffs.reserve(lagged.size());
    for (size_t i = 1; i < series.size(); ++i) {
        diffs.push_back(series[i] - series[i - 1]);
    }

    const auto regression = StatisticalAnalysis::linearRegression(lagged, diffs);
    const double dof = static_cast<double>(series.size()) - 2.0;
    if (regression.r_squared <= 0.0 || dof <= 0.0) {
        return 0.0;
    }
    return regression.slope / std::sqrt(regression.r_squared / dof);
}

CointegrationResult CointegrationAnalyzer::analyze(const std::vector<double>& price_a,
                                                   const std::vector<double>& price_b) {
    if (price_a.size() != price_b.size()) {
        throw std::invalid_argument("cointegration test needs equal-length series");
    }
    if (price_a.size() < MIN_OBSERVATIONS) {
        throw InsufficientDataError(price_a.size(), MIN_OBSERVATIONS - 1);
    }

    CointegrationResult result;
    result.observations = price_a.size();

    // 1단계: 공적분 관계 추정
    const auto regression = StatisticalAnalysis::linearRegression(price_a, price_b);
    result.hedge_ratio = regression.slope;
    result.intercept = regression.intercept;
    result.r_squared = regression.r_squared;

    // 2단계: 잔차 정상성 검정
    result.adf_statistic = adfStatistic(regression.residuals);
    result.half_life = StatisticalAnalysis::halfLife(regression.residuals);
    result.is_cointegrated = result.adf_statistic < CRITICAL_5PCT;

    if (result.adf_statistic < CRITICAL_1PCT) {
        result.p_value = 0.01;
    } else if (result.adf_statistic < CRITICAL_5PCT) {
        result.p_value = 0.05;
    } else if (result.adf_statistic < CRITICAL_10PCT) {
        result.p_value = 0.10;
    } else {
        result.p_value = 0.5;
    }

    result.returns_correlation = StatisticalAnalysis::correlation(
        StatisticalAnalysis::simpleReturns(price_a),
        StatisticalAnalysis::simpleReturns(price_b));

    LOG_INFO("Cointegration: hedge={:.4f}, R2={:.4f}, ADF={:.3f}, p={:.2f}, half-life={:.2f}, cointegrated={}",
             result.hedge_ratio, result.r_squared, result.adf_statistic, result.p_value,
             result.half_life, result.is_cointegrated);
    return result;
}

} // namespace analytics
} // namespace regimepairs
