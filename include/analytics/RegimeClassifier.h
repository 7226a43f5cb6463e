#pragma once

#include "common/Types.h"
#include <optional>

namespace regimepairs {
namespace analytics {

// Maps the rolling return correlation to a regime. Stateless, no hysteresis:
// thresholds are exclusive on the extreme side, and an undefined
// correlation (zero variance) is TRANSITION.
class RegimeClassifier {
public:
    RegimeClassifier(double high_threshold, double low_threshold);

    Regime classify(std::optional<double> correlation) const;

    double highThreshold() const { return high_threshold_; }
    double lowThreshold() const { return low_threshold_; }

private:
    double high_threshold_;
    double low_threshold_;
};

} // namespace analytics
} // namespace regimepairs
