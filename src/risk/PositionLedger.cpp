#include "risk/PositionLedger.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>
#include <utility>

namespace regimepairs {
namespace risk {

PositionLedger::PositionLedger(const engine::BacktestConfig& config)
    : cash_(config.initial_capital)
    , commission_(config.commission)
    , slippage_(config.slippage)
    , stop_loss_threshold_(config.stop_loss_threshold)
    , exit_threshold_(config.zscore_exit_threshold)
    , max_holding_days_(config.max_holding_days)
{
    LOG_INFO("PositionLedger initialized - initial capital {:.2f}", cash_);
}

// ===== Position Entry =====

std::optional<Position> PositionLedger::openPosition(
    int day,
    double price_a,
    double price_b,
    const strategy::Signal& signal,
    Regime regime,
    const SizingDecision& sizing
) {
    if (!signal.isEntry()) {
        return std::nullopt;
    }

    // 1) max concurrent positions
    if (!hasCapacity()) {
        LOG_WARN("day {}: max positions reached ({}/{})", day, open_positions_.size(), MAX_OPEN_POSITIONS);
        return std::nullopt;
    }

    // 2) sizing rejected (below minimum size)
    if (!sizing.accepted || sizing.capital_allocated <= 0.0) {
        LOG_INFO("day {}: {} signal dropped - allocation {:.2f} below minimum",
                 day, toString(signal.strategy), sizing.capital_allocated);
        return std::nullopt;
    }

    Position pos;
    pos.id = "trade_" + std::to_string(next_trade_id_);
    pos.status = PositionStatus::PENDING;
    pos.entry_day = day;
    pos.entry_price_a = price_a;
    pos.entry_price_b = price_b;
    pos.entry_zscore = signal.zscore;
    pos.direction = signal.direction;
    pos.strategy = signal.strategy;
    pos.regime = regime;
    pos.position_size = sizing.capital_allocated;
    pos.leverage = sizing.leverage;

    const double commission = pos.position_size * commission_;
    const double slippage = pos.position_size * slippage_;
    const double entry_costs = commission + slippage;

    // 3) cash must cover allocation + costs
    if (pos.position_size + entry_costs > cash_) {
        LOG_WARN("day {}: entry blocked - required {:.2f} > cash {:.2f}",
                 day, pos.position_size + entry_costs, cash_);
        return std::nullopt;
    }

    pos.transaction_costs = entry_costs;
    pos.status = PositionStatus::OPEN;

    cash_ -= (pos.position_size + entry_costs);
    ++next_trade_id_;
    open_positions_.push_back(pos);

    LOG_INFO("ENTRY {} | day {} | {} | {} | regime={} | size={:.2f} | lev={:.1f} | z={:.2f} | cost={:.2f} | cash={:.2f}",
             pos.id, day, toString(pos.strategy), toString(pos.direction), toString(regime),
             pos.position_size, pos.leverage, pos.entry_zscore, entry_costs, cash_);
    return pos;
}

// ===== Exit Evaluation =====

std::optional<ExitReason> PositionLedger::evaluateExit(
    const Position& position,
    int day,
    double zscore,
    double price_a,
    double price_b
) const {
    // 1. 최대 보유 기간
    if (day - position.entry_day > max_holding_days_) {
        return ExitReason::MAX_HOLDING_PERIOD;
    }

    // 2. 손절 (leverage-scaled PnL against position size)
    if (unrealizedPnl(position, price_a, price_b) < -stop_loss_threshold_ * position.position_size) {
        return ExitReason::STOP_LOSS;
    }

    // 3/4. 전략별 청산
    switch (position.strategy) {
        case StrategyKind::MEAN_REVERSION:
            if (std::abs(zscore) < exit_threshold_) {
                return ExitReason::MEAN_REVERSION_TARGET;
            }
            break;
        case StrategyKind::MOMENTUM:
            if ((position.entry_zscore > 0.0 && zscore < 0.0) ||
                (position.entry_zscore < 0.0 && zscore > 0.0)) {
                return ExitReason::MOMENTUM_REVERSAL;
            }
            break;
    }

    return std::nullopt;
}

std::vector<Position> PositionLedger::processExits(int day, double zscore, double price_a, double price_b) {
    std::vector<Position> closed;
    std::vector<Position> still_open;
    still_open.reserve(open_positions_.size());

    for (auto pos : open_positions_) {
        markExcursion(pos, price_a, price_b);
        const auto reason = evaluateExit(pos, day, zscore, price_a, price_b);
        if (reason) {
            const Settlement settlement = settle(pos, day, zscore, price_a, price_b, *reason);
            recordClose(settlement);
            closed.push_back(settlement.closed);
        } else {
            still_open.push_back(pos);
        }
    }

    open_positions_ = std::move(still_open);
    return closed;
}

std::vector<Position> PositionLedger::closeAll(int day, double zscore, double price_a, double price_b,
                                               ExitReason reason) {
    std::vector<Position> closed;
    for (auto pos : open_positions_) {
        markExcursion(pos, price_a, price_b);
        const Settlement settlement = settle(pos, day, zscore, price_a, price_b, reason);
        recordClose(settlement);
        closed.push_back(settlement.closed);
    }
    open_positions_.clear();
    return closed;
}

// ===== Valuation =====

double PositionLedger::spreadReturn(const Position& position, double price_a, double price_b) {
    const double return_a = (price_a - position.entry_price_a) / position.entry_price_a;
    const double return_b = (price_b - position.entry_price_b) / position.entry_price_b;

    switch (position.direction) {
        case TradeDirection::LONG_A_SHORT_B: return return_a - return_b;
        case TradeDirection::SHORT_A_LONG_B: return return_b - return_a;
    }
    return 0.0;
}

double PositionLedger::unrealizedPnl(const Position& position, double price_a, double price_b) {
    return spreadReturn(position, price_a, price_b) * position.position_size * position.leverage;
}

void PositionLedger::markExcursion(Position& position, double price_a, double price_b) {
    if (position.position_size <= 0.0) {
        return;
    }
    const double pct = unrealizedPnl(position, price_a, price_b) / position.position_size * 100.0;
    position.max_favorable_excursion = std::max(position.max_favorable_excursion, pct);
    position.max_adverse_excursion = std::min(position.max_adverse_excursion, pct);
}

Settlement PositionLedger::settle(const Position& position, int day, double zscore,
                                  double price_a, double price_b, ExitReason reason) const {
    Settlement settlement{position, 0.0};
    Position& closed = settlement.closed;

    const double exit_costs = position.position_size * (commission_ + slippage_);

    closed.gross_pnl = unrealizedPnl(position, price_a, price_b);
    closed.pnl = closed.gross_pnl - exit_costs;
    closed.pnl_pct = (position.position_size > 0.0)
        ? (closed.pnl / position.position_size) * 100.0
        : 0.0;
    closed.transaction_costs += exit_costs;
    closed.exit_day = day;
    closed.exit_price_a = price_a;
    closed.exit_price_b = price_b;
    closed.exit_zscore = zscore;
    closed.exit_reason = reason;
    closed.holding_period = day - position.entry_day;
    closed.status = PositionStatus::CLOSED;

    settlement.cash_delta = position.position_size + closed.pnl;
    return settlement;
}

double PositionLedger::totalUnrealizedPnl(double price_a, double price_b) const {
    double total = 0.0;
    for (const auto& pos : open_positions_) {
        total += unrealizedPnl(pos, price_a, price_b);
    }
    return total;
}

double PositionLedger::investedCapital() const {
    double total = 0.0;
    for (const auto& pos : open_positions_) {
        total += pos.position_size;
    }
    return total;
}

void PositionLedger::recordClose(const Settlement& settlement) {
    const Position& closed = settlement.closed;
    cash_ += settlement.cash_delta;
    trade_history_.push_back(closed);

    LOG_INFO("EXIT {} | day {} | {} | pnl {:.2f} ({:+.2f}%) | held {}d | reason={} | cash {:.2f}",
             closed.id, closed.exit_day, toString(closed.strategy), closed.pnl, closed.pnl_pct,
             closed.holding_period, toString(*closed.exit_reason), cash_);
    Logger::getInstance().logTrade(closed.id, toString(closed.strategy), toString(closed.direction),
                                   closed.entry_day, closed.exit_day, closed.pnl,
                                   toString(*closed.exit_reason));
}

} // namespace risk
} // namespace regimepairs
