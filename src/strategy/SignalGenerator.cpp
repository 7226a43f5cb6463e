#include "strategy/SignalGenerator.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace regimepairs {
namespace strategy {

SignalGenerator::SignalGenerator(double entry_threshold)
    : entry_threshold_(entry_threshold)
{
    if (!(entry_threshold_ > 0.0)) {
        throw std::invalid_argument("entry threshold must be > 0");
    }
}

Signal SignalGenerator::generate(double zscore, Regime regime) const {
    Signal signal;
    signal.zscore = zscore;

    if (!std::isfinite(zscore) || std::abs(zscore) <= entry_threshold_) {
        return signal;
    }

    switch (regime) {
        case Regime::HIGH_CORRELATION:
            signal.strategy = StrategyKind::MEAN_REVERSION;
            signal.direction = (zscore > 0.0) ? TradeDirection::SHORT_A_LONG_B
                                              : TradeDirection::LONG_A_SHORT_B;
            break;
        case Regime::LOW_CORRELATION:
            signal.strategy = StrategyKind::MOMENTUM;
            signal.direction = (zscore > 0.0) ? TradeDirection::LONG_A_SHORT_B
                                              : TradeDirection::SHORT_A_LONG_B;
            break;
        case Regime::TRANSITION:
            return signal;
    }

    signal.type = SignalType::ENTRY;
    signal.strength = std::min(std::abs(zscore) / entry_threshold_, MAX_STRENGTH);
    return signal;
}

} // namespace strategy
} // namespace regimepairs
