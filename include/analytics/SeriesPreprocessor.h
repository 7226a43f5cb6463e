#pragma once

#include "common/Types.h"
#include <optional>
#include <vector>

namespace regimepairs {
namespace analytics {

// Per-day derived scalars. Full-length vectors are indexed by raw price index;
// zscores/correlations are indexed by simulation day d, which maps to raw
// index start_index + d.
struct DerivedSeries {
    double hedge_ratio = 0.0;
    size_t start_index = 0;

    std::vector<double> log_price_a;
    std::vector<double> log_price_b;
    std::vector<double> spread;
    std::vector<double> returns_a;      // [t] = return from t-1 to t, [0] = 0
    std::vector<double> returns_b;

    std::vector<double> zscores;
    std::vector<std::optional<double>> correlations;

    size_t days() const { return zscores.size(); }
    size_t rawIndex(size_t day) const { return start_index + day; }
};

class SeriesPreprocessor {
public:
    explicit SeriesPreprocessor(int window);

    // Throws InsufficientDataError when prices.size() <= window,
    // std::invalid_argument on mismatched lengths or non-positive prices.
    DerivedSeries compute(const PriceSeries& prices) const;

    int window() const { return window_; }

    static void validatePrices(const PriceSeries& prices);

private:
    int window_;
};

} // namespace analytics
} // namespace regimepairs
