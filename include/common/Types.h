#pragma once

#include <string>
#include <vector>
#include <stdexcept>

namespace regimepairs {

using Price = double;
using Amount = double;

// 상관관계 레짐
enum class Regime {
    HIGH_CORRELATION,   // corr > high threshold -> mean reversion
    LOW_CORRELATION,    // corr < low threshold  -> momentum
    TRANSITION          // everything in between (and undefined correlation)
};

enum class TradeDirection { LONG_A_SHORT_B, SHORT_A_LONG_B };
enum class StrategyKind { MEAN_REVERSION, MOMENTUM };
enum class PositionStatus { PENDING, OPEN, CLOSED };

enum class ExitReason {
    MAX_HOLDING_PERIOD,
    STOP_LOSS,
    MEAN_REVERSION_TARGET,
    MOMENTUM_REVERSAL,
    BACKTEST_END
};

// Two aligned daily close series, indexed by raw day offset from 0.
struct PriceSeries {
    std::vector<Price> a;
    std::vector<Price> b;

    size_t size() const { return a.size() < b.size() ? a.size() : b.size(); }
    bool empty() const { return size() == 0; }
};

// Raised when a series is too short for the rolling window.
class InsufficientDataError : public std::runtime_error {
public:
    InsufficientDataError(size_t available, size_t required)
        : std::runtime_error("insufficient data: " + std::to_string(available) +
                             " observations, need more than " + std::to_string(required))
        , available_(available)
        , required_(required)
    {}

    size_t available() const { return available_; }
    size_t required() const { return required_; }

private:
    size_t available_;
    size_t required_;
};

const char* toString(Regime regime);
const char* toString(TradeDirection direction);
const char* toString(StrategyKind strategy);
const char* toString(PositionStatus status);
const char* toString(ExitReason reason);

} // namespace regimepairs
