#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "engine/BacktestConfig.h"

namespace regimepairs {

class Config {
public:
    static Config& getInstance();

    // Missing file keeps defaults; returns false when nothing was loaded.
    bool load(const std::string& config_path);

    // Applies a parsed document. Keys absent from "backtest" fall back to defaults.
    void applyJson(const nlohmann::json& j);

    engine::BacktestConfig getBacktestConfig() const { return backtest_config_; }
    double getInitialCapital() const { return backtest_config_.initial_capital; }
    void setInitialCapital(double v) { backtest_config_.initial_capital = v; }
    void setCorrelationWindow(int w) { backtest_config_.correlation_window = w; }

    std::string getLogLevel() const { return log_level_; }
    std::string getLogDirectory() const { return log_directory_; }

private:
    Config() = default;

    engine::BacktestConfig backtest_config_;
    std::string log_level_ = "info";
    std::string log_directory_ = "logs";
};

} // namespace regimepairs
