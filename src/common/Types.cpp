#include "common/Types.h"

namespace regimepairs {

const char* toString(Regime regime) {
    switch (regime) {
        case Regime::HIGH_CORRELATION: return "high-correlation";
        case Regime::LOW_CORRELATION:  return "low-correlation";
        case Regime::TRANSITION:       return "transition";
    }
    return "unknown";
}

const char* toString(TradeDirection direction) {
    switch (direction) {
        case TradeDirection::LONG_A_SHORT_B: return "long_A_short_B";
        case TradeDirection::SHORT_A_LONG_B: return "short_A_long_B";
    }
    return "unknown";
}

const char* toString(StrategyKind strategy) {
    switch (strategy) {
        case StrategyKind::MEAN_REVERSION: return "mean_reversion";
        case StrategyKind::MOMENTUM:       return "momentum";
    }
    return "unknown";
}

const char* toString(PositionStatus status) {
    switch (status) {
        case PositionStatus::PENDING: return "pending";
        case PositionStatus::OPEN:    return "open";
        case PositionStatus::CLOSED:  return "closed";
    }
    return "unknown";
}

const char* toString(ExitReason reason) {
    switch (reason) {
        case ExitReason::MAX_HOLDING_PERIOD:    return "max_holding_period";
        case ExitReason::STOP_LOSS:             return "stop_loss";
        case ExitReason::MEAN_REVERSION_TARGET: return "mean_reversion_target";
        case ExitReason::MOMENTUM_REVERSAL:     return "momentum_reversal";
        case ExitReason::BACKTEST_END:          return "backtest_end";
    }
    return "unknown";
}

} // namespace regimepairs
