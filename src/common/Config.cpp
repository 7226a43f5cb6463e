#include "common/Config.h"
#include "common/Logger.h"
#include "common/PathUtils.h"

#include <filesystem>
#include <fstream>

namespace regimepairs {

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

bool Config::load(const std::string& path) {
    std::filesystem::path config_path;
    if (std::filesystem::path(path).is_absolute()) {
        config_path = path;
    } else {
        config_path = utils::PathUtils::resolveRelativePath(path);
    }

    LOG_INFO("Config path: {}", config_path.string());

    if (!std::filesystem::exists(config_path)) {
        LOG_WARN("Config file not found: {} - using defaults", config_path.string());
        return false;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        LOG_WARN("Config file could not be opened: {} - using defaults", config_path.string());
        return false;
    }

    try {
        nlohmann::json j;
        file >> j;
        applyJson(j);
    } catch (const std::exception& e) {
        LOG_ERROR("Config load error: {}", e.what());
        return false;
    }

    LOG_INFO("Config loaded: capital={:.0f}, window={}, entry_z={:.2f}, exit_z={:.2f}",
             backtest_config_.initial_capital, backtest_config_.correlation_window,
             backtest_config_.zscore_entry_threshold, backtest_config_.zscore_exit_threshold);
    return true;
}

void Config::applyJson(const nlohmann::json& j) {
    const engine::BacktestConfig defaults;
    engine::BacktestConfig cfg;

    if (j.contains("backtest")) {
        const auto& b = j["backtest"];

        cfg.initial_capital = b.value("initial_capital", defaults.initial_capital);
        cfg.commission = b.value("commission", defaults.commission);
        cfg.slippage = b.value("slippage", defaults.slippage);

        cfg.correlation_window = b.value("correlation_window", defaults.correlation_window);
        cfg.high_corr_threshold = b.value("high_corr_threshold", defaults.high_corr_threshold);
        cfg.low_corr_threshold = b.value("low_corr_threshold", defaults.low_corr_threshold);

        cfg.zscore_entry_threshold = b.value("zscore_entry_threshold", defaults.zscore_entry_threshold);
        cfg.zscore_exit_threshold = b.value("zscore_exit_threshold", defaults.zscore_exit_threshold);

        cfg.stop_loss_threshold = b.value("stop_loss_threshold", defaults.stop_loss_threshold);
        cfg.max_position_size = b.value("max_position_size", defaults.max_position_size);
        cfg.min_position_size = b.value("min_position_size", defaults.min_position_size);
        cfg.max_holding_days = b.value("max_holding_days", defaults.max_holding_days);

        cfg.mean_reversion_leverage = b.value("mean_reversion_leverage", defaults.mean_reversion_leverage);
        cfg.momentum_leverage = b.value("momentum_leverage", defaults.momentum_leverage);
        cfg.transition_leverage = b.value("transition_leverage", defaults.transition_leverage);
    }

    std::string level = "info";
    std::string directory = "logs";
    if (j.contains("logging")) {
        const auto& l = j["logging"];
        level = l.value("level", level);
        directory = l.value("directory", directory);
    }

    // 전체 파싱 성공 후에만 반영
    backtest_config_ = cfg;
    log_level_ = level;
    log_directory_ = directory;
}

} // namespace regimepairs
