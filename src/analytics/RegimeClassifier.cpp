#include "analytics/RegimeClassifier.h"
#include <cmath>
#include <stdexcept>

namespace regimepairs {
namespace analytics {

RegimeClassifier::RegimeClassifier(double high_threshold, double low_threshold)
    : high_threshold_(high_threshold)
    , low_threshold_(low_threshold)
{
    if (low_threshold_ > high_threshold_) {
        throw std::invalid_argument("low correlation threshold exceeds high threshold");
    }
}

Regime RegimeClassifier::classify(std::optional<double> correlation) const {
    if (!correlation || !std::isfinite(*correlation)) {
        return Regime::TRANSITION;
    }

    if (*correlation > high_threshold_) {
        return Regime::HIGH_CORRELATION;
    }
    if (*correlation < low_threshold_) {
        return Regime::LOW_CORRELATION;
    }
    return Regime::TRANSITION;
}

} // namespace analytics
} // namespace regimepairs
