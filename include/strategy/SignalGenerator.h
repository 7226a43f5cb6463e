#pragma once

#include "common/Types.h"

namespace regimepairs {
namespace strategy {

enum class SignalType {
    HOLD,
    ENTRY
};

struct Signal {
    SignalType type;
    TradeDirection direction;
    StrategyKind strategy;
    double strength;            // min(|z| / entry threshold, MAX_STRENGTH)
    double zscore;

    Signal()
        : type(SignalType::HOLD)
        , direction(TradeDirection::LONG_A_SHORT_B)
        , strategy(StrategyKind::MEAN_REVERSION)
        , strength(0.0)
        , zscore(0.0)
    {}

    bool isEntry() const { return type == SignalType::ENTRY; }
};

// (z-score, regime) -> entry signal
// - HIGH_CORRELATION: mean reversion, fade the spread
// - LOW_CORRELATION: momentum, follow the spread
// - TRANSITION: 신규 진입 없음
class SignalGenerator {
public:
    static constexpr double MAX_STRENGTH = 2.0;

    explicit SignalGenerator(double entry_threshold);

    Signal generate(double zscore, Regime regime) const;

    double entryThreshold() const { return entry_threshold_; }

private:
    double entry_threshold_;
};

} // namespace strategy
} // namespace regimepairs
