#include "backtest/BacktestEngine.h"
#include "backtest/BacktestReport.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <sstream>
#include <string>

using namespace regimepairs;
using regimepairs::backtest::BacktestEngine;
using regimepairs::backtest::BacktestReport;

int main() {
    // one winning mean-reversion trade on a scripted path
    PriceSeries prices;
    prices.a.assign(8, 100.0);
    prices.b.assign(8, 50.0);
    prices.a[7] = 98.0;

    analytics::DerivedSeries derived;
    derived.hedge_ratio = 1.0;
    derived.start_index = 5;
    derived.zscores = {0.0, 3.75, 0.1};
    derived.correlations.assign(3, 0.9);

    BacktestEngine engine(engine::BacktestConfig{});
    engine.run(prices, derived);
    const auto result = engine.getResult();

    {
        const auto j = BacktestReport::toJson(result);
        assert(j["profit_factor"] == "Infinity");
        assert(j["total_trades"] == 1);
        assert(j["trades"].size() == 1);
        assert(j["trades"][0]["exit_reason"] == "mean_reversion_target");
        assert(j["trades"][0]["strategy"] == "mean_reversion");
        assert(j["trades"][0]["direction"] == "short_A_long_B");
        assert(j["exit_reasons"]["mean_reversion_target"] == 1);
        assert(j["equity_curve"].size() == 3);
        assert(j["regime_stats"]["high-correlation"]["days"] == 3);
        assert(j["strategy_stats"]["momentum"]["trades"] == 0);
        assert(j["diagnostics"].is_null());

        assert(std::abs(j["expectancy"].get<double>() - 2425.0) < 1e-6);
        assert(j["avg_holding_period"] == 1.0);
        assert(j["max_drawdown_duration"] == 1);
        assert(j["volatility"].is_number());
        assert(j["sharpe_ratio"].is_number());
        assert(j["sortino_ratio"].is_number());
        // marked at A=98 on the exit day: +2% spread x 2.5 leverage
        assert(std::abs(j["trades"][0]["max_favorable_excursion"].get<double>() - 5.0) < 1e-9);
        assert(j["trades"][0]["max_adverse_excursion"].get<double>() == 0.0);

        // serializable without NaN/inf surprises
        const auto parsed = nlohmann::json::parse(j.dump());
        assert(parsed["profit_factor"] == "Infinity");
    }

    {
        std::ostringstream out;
        BacktestReport::printSummary(result, out);
        const std::string text = out.str();
        assert(text.find("Profit Factor: inf") != std::string::npos);
        assert(text.find("mean_reversion_target: 1") != std::string::npos);
        assert(text.find("high-correlation") != std::string::npos);
        assert(text.find("Sharpe:") != std::string::npos);
        assert(text.find("Sortino:") != std::string::npos);
        assert(text.find("Expectancy:  2425.00") != std::string::npos);
    }

    std::cout << "[TEST] BacktestReport PASSED\n";
    return 0;
}
