#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "common/Types.h"
#include "engine/BacktestConfig.h"
#include "analytics/SeriesPreprocessor.h"
#include "analytics/RegimeClassifier.h"
#include "analytics/CointegrationAnalyzer.h"
#include "strategy/SignalGenerator.h"
#include "risk/PositionSizer.h"
#include "risk/PositionLedger.h"

namespace regimepairs {
namespace backtest {

// Drives the day-by-day simulation over one price path. Each instance owns
// its portfolio state; run() resets it, so repeated runs are independent.
class BacktestEngine {
public:
    explicit BacktestEngine(const engine::BacktestConfig& config);

    // Pair diagnostics (cointegration test) are computed by run(prices)
    // when enabled and the series is long enough.
    void setDiagnosticsEnabled(bool enabled) { diagnostics_enabled_ = enabled; }

    // Preprocesses the prices, then simulates.
    // Throws InsufficientDataError when the series is not longer than the window.
    void run(const PriceSeries& prices);

    // Simulates on caller-supplied derived series. derived.start_index + days
    // must equal the price length.
    void run(const PriceSeries& prices, const analytics::DerivedSeries& derived);

    struct EquityPoint {
        int day = 0;
        double equity = 0.0;            // cash + unrealized_pnl
        double cash = 0.0;
        double unrealized_pnl = 0.0;
        double invested_capital = 0.0;  // allocations held by open positions
        double drawdown = 0.0;          // % below running peak
        Regime regime = Regime::TRANSITION;
        int active_positions = 0;
    };

    struct Result {
        struct RegimeSummary {
            Regime regime = Regime::TRANSITION;
            int days = 0;
            double day_pct = 0.0;
            int trades = 0;
            double total_pnl = 0.0;
            double avg_pnl = 0.0;
        };
        struct StrategySummary {
            StrategyKind strategy = StrategyKind::MEAN_REVERSION;
            int total_trades = 0;
            int winning_trades = 0;
            int losing_trades = 0;
            double win_rate = 0.0;      // %
            double total_pnl = 0.0;
            double profit_factor = 0.0;
        };

        double initial_capital = 0.0;
        double final_equity = 0.0;
        double total_return = 0.0;      // %
        double max_drawdown = 0.0;      // %
        int total_trades = 0;
        int winning_trades = 0;
        int losing_trades = 0;
        double win_rate = 0.0;          // %
        double avg_win = 0.0;
        double avg_loss = 0.0;          // magnitude
        double profit_factor = 0.0;
        double expectancy = 0.0;        // per trade
        double avg_holding_period = 0.0;    // days

        // equity curve risk
        double volatility = 0.0;        // annualized %
        double sharpe_ratio = 0.0;
        double sortino_ratio = 0.0;
        int max_drawdown_duration = 0;  // days

        double hedge_ratio = 0.0;
        int simulated_days = 0;
        int first_day = 0;

        std::vector<RegimeSummary> regime_stats;
        std::vector<StrategySummary> strategy_summaries;
        std::map<std::string, int> exit_reason_counts;
        std::vector<EquityPoint> equity_curve;
        std::vector<risk::Position> trades;
        std::optional<analytics::CointegrationResult> diagnostics;
    };
    Result getResult() const { return result_; }

    const engine::BacktestConfig& config() const { return config_; }

private:
    engine::BacktestConfig config_;
    bool diagnostics_enabled_ = false;

    // Components
    analytics::SeriesPreprocessor preprocessor_;
    analytics::RegimeClassifier regime_classifier_;
    strategy::SignalGenerator signal_generator_;
    risk::PositionSizer position_sizer_;
    std::unique_ptr<risk::PositionLedger> ledger_;

    // Run state
    std::vector<EquityPoint> equity_curve_;
    std::map<Regime, int> regime_days_;
    double peak_equity_ = 0.0;
    Result result_;

    void reset();
    void processDay(size_t day_index, const PriceSeries& prices, const analytics::DerivedSeries& derived);
    void recordEquity(int day, Regime regime, double price_a, double price_b);
    void buildResult(const analytics::DerivedSeries& derived);
};

} // namespace backtest
} // namespace regimepairs
