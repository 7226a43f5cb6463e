#pragma once

namespace regimepairs {
namespace engine {

// 백테스트 설정 (one fixed parameter set per run)
struct BacktestConfig {
    double initial_capital = 100000.0;

    // 거래 비용 (fraction of allocated capital, per side)
    double commission = 0.001;              // 0.1%
    double slippage = 0.0005;               // 0.05%

    // 통계 윈도우 / 레짐 임계값
    int correlation_window = 30;
    double high_corr_threshold = 0.7;
    double low_corr_threshold = 0.3;

    // 신호 임계값
    double zscore_entry_threshold = 2.5;
    double zscore_exit_threshold = 1.0;

    // 리스크 설정
    double stop_loss_threshold = 0.05;      // fraction of position size
    double max_position_size = 0.5;         // fraction of available capital
    double min_position_size = 1000.0;      // absolute currency
    int max_holding_days = 30;

    // 레짐별 레버리지
    double mean_reversion_leverage = 2.5;
    double momentum_leverage = 4.0;
    double transition_leverage = 1.5;

    // Throws std::invalid_argument describing the first bad field.
    void validate() const;
};

} // namespace engine
} // namespace regimepairs
