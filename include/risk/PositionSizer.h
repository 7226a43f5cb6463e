#pragma once

#include "common/Types.h"
#include "engine/BacktestConfig.h"

namespace regimepairs {
namespace risk {

struct SizingDecision {
    bool accepted;
    double capital_allocated;
    double leverage;

    SizingDecision() : accepted(false), capital_allocated(0.0), leverage(1.0) {}
};

// 레짐별 자본 배분 + 레버리지
class PositionSizer {
public:
    explicit PositionSizer(const engine::BacktestConfig& config);

    // Rejected (accepted == false) when the allocation is below the
    // minimum position size. Rejection is a normal outcome, not an error.
    SizingDecision size(Regime regime, double strength, double available_capital) const;

    static double baseFraction(Regime regime);
    double leverageFor(Regime regime) const;

private:
    double max_position_fraction_;
    double min_position_size_;
    double mean_reversion_leverage_;
    double momentum_leverage_;
    double transition_leverage_;
};

} // namespace risk
} // namespace regimepairs
