#include "common/Logger.h"
#include "common/Config.h"
#include "backtest/BacktestEngine.h"
#include "backtest/BacktestReport.h"
#include "backtest/DataHistory.h"

#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace regimepairs;

static void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " <priceA> <priceB>"
              << " [--config <path>] [--json] [--initial-capital <x>] [--window <w>] [--diagnostics]\n";
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        printUsage(argv[0]);
        return 1;
    }

    const std::string path_a = argv[1];
    const std::string path_b = argv[2];
    std::string config_path = "config/config.json";
    bool json_mode = false;
    bool diagnostics = false;
    std::optional<double> cli_initial_capital;
    std::optional<int> cli_window;

    for (int i = 3; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--json") {
            json_mode = true;
            continue;
        }
        if (arg == "--diagnostics") {
            diagnostics = true;
            continue;
        }
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
            continue;
        }
        if (arg == "--initial-capital" && i + 1 < argc) {
            try {
                cli_initial_capital = std::stod(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid --initial-capital value: " << argv[i] << "\n";
                return 1;
            }
            continue;
        }
        if (arg == "--window" && i + 1 < argc) {
            try {
                cli_window = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid --window value: " << argv[i] << "\n";
                return 1;
            }
            continue;
        }
        std::cerr << "Unknown argument: " << arg << "\n";
        printUsage(argv[0]);
        return 1;
    }

    try {
        auto& config = Config::getInstance();
        const bool loaded = config.load(config_path);

        Logger::getInstance().initialize(config.getLogDirectory(), config.getLogLevel());
        if (!loaded) {
            LOG_WARN("Config not loaded from {}; using defaults", config_path);
        }

        // CLI 값은 그대로 반영, 범위 검사는 validate()
        if (cli_initial_capital) {
            config.setInitialCapital(*cli_initial_capital);
        }
        if (cli_window) {
            config.setCorrelationWindow(*cli_window);
        }
        config.getBacktestConfig().validate();

        for (const auto& path : {path_a, path_b}) {
            if (!std::filesystem::exists(path)) {
                LOG_ERROR("Price file not found: {}", path);
                std::cerr << "가격 파일을 찾을 수 없습니다: " << path << "\n";
                return 1;
            }
        }

        const auto prices_a = backtest::DataHistory::loadPrices(path_a);
        const auto prices_b = backtest::DataHistory::loadPrices(path_b);
        if (prices_a.empty() || prices_b.empty()) {
            LOG_ERROR("No usable prices loaded (A={}, B={})", prices_a.size(), prices_b.size());
            return 1;
        }
        const PriceSeries prices = backtest::DataHistory::align(prices_a, prices_b);

        LOG_INFO("Starting pairs backtest: {} vs {} ({} aligned days)", path_a, path_b, prices.size());

        backtest::BacktestEngine bt_engine(config.getBacktestConfig());
        bt_engine.setDiagnosticsEnabled(diagnostics);
        bt_engine.run(prices);

        const auto result = bt_engine.getResult();
        if (json_mode) {
            std::cout << backtest::BacktestReport::toJson(result).dump() << "\n";
        } else {
            backtest::BacktestReport::printSummary(result, std::cout);
        }
        return 0;

    } catch (const InsufficientDataError& e) {
        LOG_ERROR("Insufficient data: {}", e.what());
        std::cerr << e.what() << "\n";
        return 1;
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("Invalid input: {}", e.what());
        std::cerr << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "오류가 발생했습니다: " << e.what() << "\n";
        return 1;
    }
}
