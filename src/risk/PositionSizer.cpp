#include "risk/PositionSizer.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>

namespace regimepairs {
namespace risk {

PositionSizer::PositionSizer(const engine::BacktestConfig& config)
    : max_position_fraction_(config.max_position_size)
    , min_position_size_(config.min_position_size)
    , mean_reversion_leverage_(config.mean_reversion_leverage)
    , momentum_leverage_(config.momentum_leverage)
    , transition_leverage_(config.transition_leverage)
{}

double PositionSizer::baseFraction(Regime regime) {
    switch (regime) {
        case Regime::HIGH_CORRELATION: return 0.4;
        case Regime::LOW_CORRELATION:  return 0.5;
        case Regime::TRANSITION:       return 0.2;
    }
    return 0.0;
}

double PositionSizer::leverageFor(Regime regime) const {
    switch (regime) {
        case Regime::HIGH_CORRELATION: return mean_reversion_leverage_;
        case Regime::LOW_CORRELATION:  return momentum_leverage_;
        case Regime::TRANSITION:       return transition_leverage_;
    }
    return 1.0;
}

SizingDecision PositionSizer::size(Regime regime, double strength, double available_capital) const {
    SizingDecision decision;
    decision.leverage = leverageFor(regime);

    if (!std::isfinite(available_capital) || available_capital <= 0.0 ||
        !std::isfinite(strength) || strength <= 0.0) {
        return decision;
    }

    const double allocation = baseFraction(regime) * strength * available_capital;
    const double max_allocation = max_position_fraction_ * available_capital;
    decision.capital_allocated = std::min(allocation, max_allocation);

    if (decision.capital_allocated < min_position_size_) {
        LOG_DEBUG("Sizing rejected: {:.2f} < min position {:.2f} ({})",
                  decision.capital_allocated, min_position_size_, toString(regime));
        return decision;
    }

    decision.accepted = true;
    return decision;
}

} // namespace risk
} // namespace regimepairs
