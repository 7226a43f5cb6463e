#pragma once

#include "common/Types.h"
#include "engine/BacktestConfig.h"
#include "risk/PositionSizer.h"
#include "strategy/SignalGenerator.h"
#include <optional>
#include <string>
#include <vector>

namespace regimepairs {
namespace risk {

// 페어 포지션 (one long leg + one short leg)
struct Position {
    std::string id;
    PositionStatus status;

    // 진입 정보
    int entry_day;
    double entry_price_a;
    double entry_price_b;
    double entry_zscore;
    TradeDirection direction;
    StrategyKind strategy;
    Regime regime;
    double position_size;       // allocated capital
    double leverage;
    double transaction_costs;   // commission + slippage, both sides once closed

    // 보유 중 최대 유리/불리 변동 (unrealized pnl / position_size * 100, marked daily)
    double max_favorable_excursion;
    double max_adverse_excursion;

    // 청산 정보 (status == CLOSED)
    int exit_day;
    double exit_price_a;
    double exit_price_b;
    double exit_zscore;
    std::optional<ExitReason> exit_reason;
    double gross_pnl;
    double pnl;                 // net of exit costs
    double pnl_pct;             // pnl / position_size * 100
    int holding_period;

    Position()
        : status(PositionStatus::PENDING)
        , entry_day(0), entry_price_a(0), entry_price_b(0), entry_zscore(0)
        , direction(TradeDirection::LONG_A_SHORT_B)
        , strategy(StrategyKind::MEAN_REVERSION)
        , regime(Regime::TRANSITION)
        , position_size(0), leverage(1.0), transaction_costs(0)
        , max_favorable_excursion(0), max_adverse_excursion(0)
        , exit_day(-1), exit_price_a(0), exit_price_b(0), exit_zscore(0)
        , gross_pnl(0), pnl(0), pnl_pct(0), holding_period(0)
    {}
};

// Result of settling a position: the closed record plus the cash credit.
struct Settlement {
    Position closed;
    double cash_delta;
};

// Position Ledger - 포지션 상태 머신 (PENDING -> OPEN -> CLOSED)
// Owns cash, open positions and the immutable closed-trade history.
class PositionLedger {
public:
    static constexpr size_t MAX_OPEN_POSITIONS = 2;

    explicit PositionLedger(const engine::BacktestConfig& config);

    // ===== 진입 =====
    bool hasCapacity() const { return open_positions_.size() < MAX_OPEN_POSITIONS; }

    // Books a new position; nullopt when the ledger is full, the sizing was
    // rejected, or cash cannot cover allocation plus costs.
    std::optional<Position> openPosition(
        int day,
        double price_a,
        double price_b,
        const strategy::Signal& signal,
        Regime regime,
        const SizingDecision& sizing
    );

    // ===== 청산 =====

    // First matching rule wins: holding period, stop-loss,
    // mean-reversion target, momentum reversal.
    std::optional<ExitReason> evaluateExit(
        const Position& position,
        int day,
        double zscore,
        double price_a,
        double price_b
    ) const;

    // Evaluates every open position and closes the ones that hit a rule.
    std::vector<Position> processExits(int day, double zscore, double price_a, double price_b);

    // Closes every open position with the given reason (end of backtest).
    std::vector<Position> closeAll(int day, double zscore, double price_a, double price_b, ExitReason reason);

    // ===== 평가 =====
    static double spreadReturn(const Position& position, double price_a, double price_b);
    static double unrealizedPnl(const Position& position, double price_a, double price_b);

    // Folds today's mark into the position's excursion extremes.
    static void markExcursion(Position& position, double price_a, double price_b);

    // Pure close transition; does not touch ledger state.
    Settlement settle(const Position& position, int day, double zscore,
                      double price_a, double price_b, ExitReason reason) const;

    double cash() const { return cash_; }
    double totalUnrealizedPnl(double price_a, double price_b) const;
    double investedCapital() const;

    const std::vector<Position>& openPositions() const { return open_positions_; }
    const std::vector<Position>& tradeHistory() const { return trade_history_; }

private:
    double cash_;
    double commission_;
    double slippage_;
    double stop_loss_threshold_;
    double exit_threshold_;
    int max_holding_days_;

    int next_trade_id_ = 1;
    std::vector<Position> open_positions_;
    std::vector<Position> trade_history_;

    void recordClose(const Settlement& settlement);
};

} // namespace risk
} // namespace regimepairs
