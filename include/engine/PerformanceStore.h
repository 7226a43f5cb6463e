#pragma once

#include "common/Types.h"
#include "risk/PositionLedger.h"
#include <map>
#include <string>
#include <vector>

namespace regimepairs {
namespace engine {

struct TradePerformanceStats {
    int trades = 0;
    int wins = 0;
    int losses = 0;
    double gross_profit = 0.0;
    double gross_loss_abs = 0.0;
    double net_profit = 0.0;
    int total_holding_days = 0;

    double winRate() const {
        return (trades > 0) ? (static_cast<double>(wins) / static_cast<double>(trades)) : 0.0;
    }
    double averagePnl() const {
        return (trades > 0) ? (net_profit / static_cast<double>(trades)) : 0.0;
    }
    double averageWin() const {
        return (wins > 0) ? (gross_profit / static_cast<double>(wins)) : 0.0;
    }
    double averageLoss() const {
        return (losses > 0) ? (gross_loss_abs / static_cast<double>(losses)) : 0.0;
    }
    double averageHoldingPeriod() const {
        return (trades > 0) ? (static_cast<double>(total_holding_days) / static_cast<double>(trades)) : 0.0;
    }
    // win rate x avg win - loss rate x avg loss
    double expectancy() const;
    // +inf with wins and no losses, 0 with no trades at all
    double profitFactor() const;
};

// Risk statistics over an equity curve. Daily returns are equity changes
// relative to initial capital, annualized with 252 trading days.
struct EquityRiskStats {
    double volatility = 0.0;            // annualized, %
    double sharpe_ratio = 0.0;
    double sortino_ratio = 0.0;         // +inf when no excess return is negative
    int max_drawdown_duration = 0;      // samples spent below the prior peak
};

// Aggregates closed trades by entry regime, by strategy and by exit reason.
// A trade with net pnl <= 0 counts as a loss.
class PerformanceStore {
public:
    static constexpr double TRADING_DAYS_PER_YEAR = 252.0;
    static constexpr double RISK_FREE_RATE = 0.02;

    void rebuild(const std::vector<risk::Position>& history);

    static EquityRiskStats analyzeEquity(const std::vector<double>& equity, double initial_capital);

    const TradePerformanceStats& overall() const { return overall_; }
    const std::map<Regime, TradePerformanceStats>& byRegime() const { return by_regime_; }
    const std::map<StrategyKind, TradePerformanceStats>& byStrategy() const { return by_strategy_; }
    const std::map<std::string, int>& exitReasonCounts() const { return exit_reason_counts_; }

private:
    TradePerformanceStats overall_;
    std::map<Regime, TradePerformanceStats> by_regime_;
    std::map<StrategyKind, TradePerformanceStats> by_strategy_;
    std::map<std::string, int> exit_reason_counts_;
};

} // namespace engine
} // namespace regimepairs
