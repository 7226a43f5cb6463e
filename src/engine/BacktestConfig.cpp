#include "engine/BacktestConfig.h"

#include <cmath>
#include <stdexcept>
#include <string>

namespace regimepairs {
namespace engine {

namespace {
void require(bool condition, const std::string& message) {
    if (!condition) {
        throw std::invalid_argument("invalid backtest config: " + message);
    }
}

bool finite(double v) {
    return std::isfinite(v);
}
}

void BacktestConfig::validate() const {
    require(finite(initial_capital) && initial_capital > 0.0, "initial_capital must be > 0");
    require(finite(commission) && commission >= 0.0, "commission must be >= 0");
    require(finite(slippage) && slippage >= 0.0, "slippage must be >= 0");
    require(correlation_window >= 2, "correlation_window must be >= 2");
    require(finite(high_corr_threshold) && finite(low_corr_threshold) &&
            low_corr_threshold <= high_corr_threshold,
            "low_corr_threshold must not exceed high_corr_threshold");
    require(finite(zscore_entry_threshold) && zscore_entry_threshold > 0.0,
            "zscore_entry_threshold must be > 0");
    require(finite(zscore_exit_threshold) && zscore_exit_threshold >= 0.0,
            "zscore_exit_threshold must be >= 0");
    require(finite(stop_loss_threshold) && stop_loss_threshold > 0.0,
            "stop_loss_threshold must be > 0");
    require(finite(max_position_size) && max_position_size > 0.0 && max_position_size <= 1.0,
            "max_position_size must be in (0, 1]");
    require(finite(min_position_size) && min_position_size >= 0.0,
            "min_position_size must be >= 0");
    require(max_holding_days >= 0, "max_holding_days must be >= 0");
    require(finite(mean_reversion_leverage) && mean_reversion_leverage > 0.0,
            "mean_reversion_leverage must be > 0");
    require(finite(momentum_leverage) && momentum_leverage > 0.0,
            "momentum_leverage must be > 0");
    require(finite(transition_leverage) && transition_leverage > 0.0,
            "transition_leverage must be > 0");
}

} // namespace engine
} // namespace regimepairs
