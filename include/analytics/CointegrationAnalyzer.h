#pragma once

#include <optional>
#include <vector>

namespace regimepairs {
namespace analytics {

// Engle-Granger style diagnostics over the full sample
struct CointegrationResult {
    double hedge_ratio;
    double intercept;
    double r_squared;
    double adf_statistic;       // simplified ADF on the regression residuals
    double p_value;             // bucketed: 0.01 / 0.05 / 0.10 / 0.5
    double half_life;           // days, +inf when residuals do not revert
    bool is_cointegrated;       // adf_statistic below the 5% critical value
    std::optional<double> returns_correlation;
    size_t observations;

    CointegrationResult()
        : hedge_ratio(0), intercept(0), r_squared(0)
        , adf_statistic(0), p_value(0.5), half_life(0)
        , is_cointegrated(false), observations(0)
    {}
};

class CointegrationAnalyzer {
public:
    static constexpr size_t MIN_OBSERVATIONS = 30;
    static constexpr double CRITICAL_1PCT = -3.90;
    static constexpr double CRITICAL_5PCT = -3.34;
    static constexpr double CRITICAL_10PCT = -3.04;

    // Throws InsufficientDataError below MIN_OBSERVATIONS,
    // std::invalid_argument when lengths differ.
    static CointegrationResult analyze(const std::vector<double>& price_a,
                                       const std::vector<double>& price_b);

    static double adfStatistic(const std::vector<double>& series);
};

} // namespace analytics
} // namespace regimepairs
