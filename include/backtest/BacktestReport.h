#pragma once

#include <ostream>
#include <nlohmann/json.hpp>
#include "backtest/BacktestEngine.h"

namespace regimepairs {
namespace backtest {

// Presentation of a finished run: machine-readable JSON (--json) and the
// console summary table.
class BacktestReport {
public:
    // Infinite values (profit factor without losses, non-reverting half-life)
    // are written as the string "Infinity"; undefined correlations as null.
    static nlohmann::json toJson(const BacktestEngine::Result& result);

    static void printSummary(const BacktestEngine::Result& result, std::ostream& out);
};

} // namespace backtest
} // namespace regimepairs
