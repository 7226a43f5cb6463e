#include "engine/PerformanceStore.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace regimepairs {
namespace engine {
namespace {
void accumulateStats(TradePerformanceStats& s, const risk::Position& trade) {
    s.trades++;
    s.net_profit += trade.pnl;
    s.total_holding_days += trade.holding_period;
    if (trade.pnl > 0.0) {
        s.wins++;
        s.gross_profit += trade.pnl;
    } else {
        s.losses++;
        s.gross_loss_abs += std::abs(trade.pnl);
    }
}

// 표본 분산 (n - 1)
double sampleStdDev(const std::vector<double>& values) {
    if (values.size() < 2) {
        return 0.0;
    }
    const double mean = std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
    double variance = 0.0;
    for (double v : values) {
        variance += (v - mean) * (v - mean);
    }
    return std::sqrt(variance / static_cast<double>(values.size() - 1));
}

double meanOf(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}
}

double TradePerformanceStats::expectancy() const {
    if (trades == 0) {
        return 0.0;
    }
    const double loss_rate = static_cast<double>(losses) / static_cast<double>(trades);
    return winRate() * averageWin() - loss_rate * averageLoss();
}

double TradePerformanceStats::profitFactor() const {
    if (trades == 0) {
        return 0.0;
    }
    if (losses == 0 || gross_loss_abs <= 0.0) {
        return (gross_profit > 0.0) ? std::numeric_limits<double>::infinity() : 0.0;
    }
    return gross_profit / gross_loss_abs;
}

void PerformanceStore::rebuild(const std::vector<risk::Position>& history) {
    overall_ = TradePerformanceStats{};
    by_regime_.clear();
    by_strategy_.clear();
    exit_reason_counts_.clear();

    for (const auto& trade : history) {
        accumulateStats(overall_, trade);
        accumulateStats(by_regime_[trade.regime], trade);
        accumulateStats(by_strategy_[trade.strategy], trade);
        if (trade.exit_reason) {
            exit_reason_counts_[toString(*trade.exit_reason)]++;
        }
    }
}

EquityRiskStats PerformanceStore::analyzeEquity(const std::vector<double>& equity, double initial_capital) {
    EquityRiskStats stats;
    if (equity.size() < 2 || initial_capital <= 0.0) {
        return stats;
    }

    std::vector<double> daily_returns;
    daily_returns.reserve(equity.size() - 1);
    for (size_t i = 1; i < equity.size(); ++i) {
        daily_returns.push_back((equity[i] - equity[i - 1]) / initial_capital);
    }

    // 1. 변동성
    stats.volatility = sampleStdDev(daily_returns) * std::sqrt(TRADING_DAYS_PER_YEAR) * 100.0;

    // 2. Sharpe (annualized returns against a daily risk-free rate)
    std::vector<double> excess;
    excess.reserve(daily_returns.size());
    for (double r : daily_returns) {
        excess.push_back(r * TRADING_DAYS_PER_YEAR - RISK_FREE_RATE / TRADING_DAYS_PER_YEAR);
    }
    const double excess_std = sampleStdDev(excess);
    stats.sharpe_ratio = (excess_std > 0.0) ? meanOf(excess) / excess_std : 0.0;

    // 3. Sortino (downside deviation of annualized excess returns)
    std::vector<double> annual_excess;
    annual_excess.reserve(daily_returns.size());
    double downside_sum = 0.0;
    int downside_count = 0;
    for (double r : daily_returns) {
        const double e = r * TRADING_DAYS_PER_YEAR - RISK_FREE_RATE;
        annual_excess.push_back(e);
        if (e < 0.0) {
            downside_sum += e * e;
            ++downside_count;
        }
    }
    if (downside_count == 0) {
        stats.sortino_ratio = std::numeric_limits<double>::infinity();
    } else {
        const double downside = std::sqrt(downside_sum / static_cast<double>(downside_count));
        stats.sortino_ratio = (downside > 0.0) ? meanOf(annual_excess) / downside : 0.0;
    }

    // 4. 최장 낙폭 기간 (peak seeded with the first sample)
    double peak = equity.front();
    size_t drawdown_start = 0;
    bool in_drawdown = false;
    for (size_t i = 1; i < equity.size(); ++i) {
        if (equity[i] > peak) {
            peak = equity[i];
            if (in_drawdown) {
                stats.max_drawdown_duration = std::max(stats.max_drawdown_duration,
                                                       static_cast<int>(i - drawdown_start));
                in_drawdown = false;
            }
        } else if (!in_drawdown) {
            drawdown_start = i;
            in_drawdown = true;
        }
    }
    if (in_drawdown) {
        stats.max_drawdown_duration = std::max(stats.max_drawdown_duration,
                                               static_cast<int>(equity.size() - 1 - drawdown_start));
    }

    return stats;
}

} // namespace engine
} // namespace regimepairs
