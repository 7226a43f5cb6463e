#include "backtest/BacktestEngine.h"
#include "common/Logger.h"
#include "engine/PerformanceStore.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace regimepairs {
namespace backtest {

namespace {
const engine::BacktestConfig& validated(const engine::BacktestConfig& config) {
    config.validate();
    return config;
}

constexpr Regime ALL_REGIMES[] = {
    Regime::HIGH_CORRELATION,
    Regime::LOW_CORRELATION,
    Regime::TRANSITION
};

constexpr StrategyKind ALL_STRATEGIES[] = {
    StrategyKind::MEAN_REVERSION,
    StrategyKind::MOMENTUM
};
}

BacktestEngine::BacktestEngine(const engine::BacktestConfig& config)
    : config_(validated(config))
    , preprocessor_(config.correlation_window)
    , regime_classifier_(config.high_corr_threshold, config.low_corr_threshold)
    , signal_generator_(config.zscore_entry_threshold)
    , position_sizer_(config)
{
    LOG_INFO("BacktestEngine initialized: capital={:.0f}, window={}, corr=({:.2f}, {:.2f}), z entry/exit=({:.2f}, {:.2f})",
             config_.initial_capital, config_.correlation_window,
             config_.low_corr_threshold, config_.high_corr_threshold,
             config_.zscore_entry_threshold, config_.zscore_exit_threshold);
}

void BacktestEngine::run(const PriceSeries& prices) {
    const analytics::DerivedSeries derived = preprocessor_.compute(prices);

    std::optional<analytics::CointegrationResult> diagnostics;
    if (diagnostics_enabled_) {
        if (prices.size() >= analytics::CointegrationAnalyzer::MIN_OBSERVATIONS) {
            diagnostics = analytics::CointegrationAnalyzer::analyze(prices.a, prices.b);
        } else {
            LOG_WARN("Pair diagnostics skipped: {} observations < {}",
                     prices.size(), analytics::CointegrationAnalyzer::MIN_OBSERVATIONS);
        }
    }

    run(prices, derived);
    result_.diagnostics = diagnostics;
}

void BacktestEngine::run(const PriceSeries& prices, const analytics::DerivedSeries& derived) {
    analytics::SeriesPreprocessor::validatePrices(prices);
    if (derived.zscores.size() != derived.correlations.size()) {
        throw std::invalid_argument("derived series: z-score and correlation lengths differ");
    }
    if (derived.days() == 0) {
        throw InsufficientDataError(prices.size(), derived.start_index);
    }
    if (derived.start_index + derived.days() != prices.size()) {
        throw std::invalid_argument("derived series is not aligned with the price series");
    }

    reset();
    LOG_INFO("Starting backtest: {} simulation days from raw day {}", derived.days(), derived.start_index);

    for (size_t d = 0; d < derived.days(); ++d) {
        processDay(d, prices, derived);
    }

    // 잔여 포지션 강제 청산
    const size_t last = derived.rawIndex(derived.days() - 1);
    const auto forced = ledger_->closeAll(static_cast<int>(last), derived.zscores.back(),
                                          prices.a[last], prices.b[last], ExitReason::BACKTEST_END);
    if (!forced.empty()) {
        LOG_INFO("Force-closed {} position(s) at backtest end", forced.size());
    }

    buildResult(derived);
    LOG_INFO("Backtest completed: {} trades, final equity {:.2f} ({:+.2f}%), max drawdown {:.2f}%",
             result_.total_trades, result_.final_equity, result_.total_return, result_.max_drawdown);
}

void BacktestEngine::reset() {
    ledger_ = std::make_unique<risk::PositionLedger>(config_);
    equity_curve_.clear();
    regime_days_.clear();
    peak_equity_ = config_.initial_capital;
    result_ = Result{};
}

void BacktestEngine::processDay(size_t day_index, const PriceSeries& prices,
                                const analytics::DerivedSeries& derived) {
    const size_t t = derived.rawIndex(day_index);
    const int day = static_cast<int>(t);
    const double price_a = prices.a[t];
    const double price_b = prices.b[t];

    double zscore = derived.zscores[day_index];
    if (!std::isfinite(zscore)) {
        LOG_WARN("day {}: non-finite z-score treated as 0", day);
        zscore = 0.0;
    }

    // 1. 레짐 판별
    const Regime regime = regime_classifier_.classify(derived.correlations[day_index]);
    regime_days_[regime]++;

    // 2. 청산 먼저
    ledger_->processExits(day, zscore, price_a, price_b);

    // 3. 신규 진입 (최대 1건/일)
    if (ledger_->hasCapacity()) {
        const strategy::Signal signal = signal_generator_.generate(zscore, regime);
        if (signal.isEntry()) {
            const risk::SizingDecision sizing = position_sizer_.size(regime, signal.strength, ledger_->cash());
            ledger_->openPosition(day, price_a, price_b, signal, regime, sizing);
        }
    }

    // 4. 자산 곡선
    recordEquity(day, regime, price_a, price_b);
}

void BacktestEngine::recordEquity(int day, Regime regime, double price_a, double price_b) {
    EquityPoint point;
    point.day = day;
    point.regime = regime;
    point.cash = ledger_->cash();
    point.unrealized_pnl = ledger_->totalUnrealizedPnl(price_a, price_b);
    point.invested_capital = ledger_->investedCapital();
    point.equity = point.cash + point.unrealized_pnl;
    point.active_positions = static_cast<int>(ledger_->openPositions().size());

    if (point.equity > peak_equity_) {
        peak_equity_ = point.equity;
    }
    point.drawdown = (peak_equity_ > 0.0)
        ? ((peak_equity_ - point.equity) / peak_equity_) * 100.0
        : 0.0;

    equity_curve_.push_back(point);
}

void BacktestEngine::buildResult(const analytics::DerivedSeries& derived) {
    Result result;
    result.initial_capital = config_.initial_capital;
    result.final_equity = ledger_->cash();
    result.total_return = ((result.final_equity - config_.initial_capital) / config_.initial_capital) * 100.0;
    result.hedge_ratio = derived.hedge_ratio;
    result.simulated_days = static_cast<int>(derived.days());
    result.first_day = static_cast<int>(derived.start_index);

    engine::PerformanceStore store;
    store.rebuild(ledger_->tradeHistory());
    const auto& overall = store.overall();

    result.total_trades = overall.trades;
    result.winning_trades = overall.wins;
    result.losing_trades = overall.losses;
    result.win_rate = overall.winRate() * 100.0;
    result.avg_win = overall.averageWin();
    result.avg_loss = overall.averageLoss();
    result.profit_factor = overall.profitFactor();
    result.expectancy = overall.expectancy();
    result.avg_holding_period = overall.averageHoldingPeriod();

    std::vector<double> equity;
    equity.reserve(equity_curve_.size());
    for (const auto& point : equity_curve_) {
        result.max_drawdown = std::max(result.max_drawdown, point.drawdown);
        equity.push_back(point.equity);
    }

    const auto risk = engine::PerformanceStore::analyzeEquity(equity, config_.initial_capital);
    result.volatility = risk.volatility;
    result.sharpe_ratio = risk.sharpe_ratio;
    result.sortino_ratio = risk.sortino_ratio;
    result.max_drawdown_duration = risk.max_drawdown_duration;

    for (Regime regime : ALL_REGIMES) {
        Result::RegimeSummary rs;
        rs.regime = regime;
        const auto days_it = regime_days_.find(regime);
        rs.days = (days_it != regime_days_.end()) ? days_it->second : 0;
        rs.day_pct = (result.simulated_days > 0)
            ? (static_cast<double>(rs.days) / static_cast<double>(result.simulated_days)) * 100.0
            : 0.0;
        const auto stats_it = store.byRegime().find(regime);
        if (stats_it != store.byRegime().end()) {
            rs.trades = stats_it->second.trades;
            rs.total_pnl = stats_it->second.net_profit;
            rs.avg_pnl = stats_it->second.averagePnl();
        }
        result.regime_stats.push_back(rs);
    }

    for (StrategyKind strategy : ALL_STRATEGIES) {
        Result::StrategySummary ss;
        ss.strategy = strategy;
        const auto it = store.byStrategy().find(strategy);
        if (it != store.byStrategy().end()) {
            ss.total_trades = it->second.trades;
            ss.winning_trades = it->second.wins;
            ss.losing_trades = it->second.losses;
            ss.win_rate = it->second.winRate() * 100.0;
            ss.total_pnl = it->second.net_profit;
            ss.profit_factor = it->second.profitFactor();
        }
        result.strategy_summaries.push_back(ss);
    }

    result.exit_reason_counts = store.exitReasonCounts();
    result.equity_curve = equity_curve_;
    result.trades = ledger_->tradeHistory();

    result_ = std::move(result);
}

} // namespace backtest
} // namespace regimepairs
