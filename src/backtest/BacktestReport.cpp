#include "backtest/BacktestReport.h"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace regimepairs {
namespace backtest {

namespace {
nlohmann::json number(double value) {
    if (std::isinf(value)) {
        return value > 0.0 ? "Infinity" : "-Infinity";
    }
    if (std::isnan(value)) {
        return nullptr;
    }
    return value;
}

nlohmann::json tradeToJson(const risk::Position& t) {
    nlohmann::json j;
    j["id"] = t.id;
    j["status"] = toString(t.status);
    j["strategy"] = toString(t.strategy);
    j["direction"] = toString(t.direction);
    j["regime"] = toString(t.regime);
    j["entry_day"] = t.entry_day;
    j["entry_price_a"] = t.entry_price_a;
    j["entry_price_b"] = t.entry_price_b;
    j["entry_zscore"] = t.entry_zscore;
    j["position_size"] = t.position_size;
    j["leverage"] = t.leverage;
    j["transaction_costs"] = t.transaction_costs;
    j["max_favorable_excursion"] = t.max_favorable_excursion;
    j["max_adverse_excursion"] = t.max_adverse_excursion;
    j["exit_day"] = t.exit_day;
    j["exit_price_a"] = t.exit_price_a;
    j["exit_price_b"] = t.exit_price_b;
    j["exit_zscore"] = t.exit_zscore;
    j["exit_reason"] = t.exit_reason ? nlohmann::json(toString(*t.exit_reason)) : nlohmann::json(nullptr);
    j["gross_pnl"] = t.gross_pnl;
    j["pnl"] = t.pnl;
    j["pnl_pct"] = t.pnl_pct;
    j["holding_period"] = t.holding_period;
    return j;
}

std::string formatFactor(double value) {
    if (std::isinf(value)) {
        return "inf";
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << value;
    return oss.str();
}
}

nlohmann::json BacktestReport::toJson(const BacktestEngine::Result& result) {
    nlohmann::json j;
    j["initial_capital"] = result.initial_capital;
    j["final_equity"] = result.final_equity;
    j["total_return"] = result.total_return;
    j["win_rate"] = result.win_rate;
    j["max_drawdown"] = result.max_drawdown;
    j["profit_factor"] = number(result.profit_factor);
    j["total_trades"] = result.total_trades;
    j["winning_trades"] = result.winning_trades;
    j["losing_trades"] = result.losing_trades;
    j["avg_win"] = result.avg_win;
    j["avg_loss"] = result.avg_loss;
    j["expectancy"] = result.expectancy;
    j["avg_holding_period"] = result.avg_holding_period;
    j["volatility"] = result.volatility;
    j["sharpe_ratio"] = number(result.sharpe_ratio);
    j["sortino_ratio"] = number(result.sortino_ratio);
    j["max_drawdown_duration"] = result.max_drawdown_duration;
    j["hedge_ratio"] = result.hedge_ratio;
    j["simulated_days"] = result.simulated_days;
    j["first_day"] = result.first_day;

    j["regime_stats"] = nlohmann::json::object();
    for (const auto& r : result.regime_stats) {
        j["regime_stats"][toString(r.regime)] = {
            {"days", r.days},
            {"percentage", r.day_pct},
            {"trades", r.trades},
            {"total_pnl", r.total_pnl},
            {"avg_pnl", r.avg_pnl}
        };
    }

    j["strategy_stats"] = nlohmann::json::object();
    for (const auto& s : result.strategy_summaries) {
        j["strategy_stats"][toString(s.strategy)] = {
            {"trades", s.total_trades},
            {"wins", s.winning_trades},
            {"losses", s.losing_trades},
            {"win_rate", s.win_rate},
            {"total_pnl", s.total_pnl},
            {"profit_factor", number(s.profit_factor)}
        };
    }

    j["exit_reasons"] = result.exit_reason_counts;

    j["equity_curve"] = nlohmann::json::array();
    for (const auto& p : result.equity_curve) {
        j["equity_curve"].push_back({
            {"day", p.day},
            {"equity", p.equity},
            {"cash", p.cash},
            {"unrealized_pnl", p.unrealized_pnl},
            {"invested_capital", p.invested_capital},
            {"drawdown", p.drawdown},
            {"regime", toString(p.regime)},
            {"active_positions", p.active_positions}
        });
    }

    j["trades"] = nlohmann::json::array();
    for (const auto& t : result.trades) {
        j["trades"].push_back(tradeToJson(t));
    }

    if (result.diagnostics) {
        const auto& d = *result.diagnostics;
        j["diagnostics"] = {
            {"hedge_ratio", d.hedge_ratio},
            {"intercept", d.intercept},
            {"r_squared", d.r_squared},
            {"adf_statistic", d.adf_statistic},
            {"p_value", d.p_value},
            {"half_life", number(d.half_life)},
            {"is_cointegrated", d.is_cointegrated},
            {"returns_correlation", d.returns_correlation
                ? nlohmann::json(*d.returns_correlation) : nlohmann::json(nullptr)},
            {"observations", d.observations}
        };
    } else {
        j["diagnostics"] = nullptr;
    }
    return j;
}

void BacktestReport::printSummary(const BacktestEngine::Result& result, std::ostream& out) {
    const auto flags = out.flags();
    const auto precision = out.precision();

    out << "\n백테스트 결과 (pairs)\n";
    out << "---------------------------------------------\n";
    out << std::fixed << std::setprecision(2);
    out << "초기 자본:    " << result.initial_capital << "\n";
    out << "최종 자산:    " << result.final_equity << "\n";
    out << "총 수익률:    " << result.total_return << "%\n";
    out << "MDD:         " << result.max_drawdown << "% (" << result.max_drawdown_duration << "일)\n";
    out << "변동성:       " << result.volatility << "%\n";
    out << "Sharpe:      " << formatFactor(result.sharpe_ratio) << "\n";
    out << "Sortino:     " << formatFactor(result.sortino_ratio) << "\n";
    out << "Hedge ratio: " << std::setprecision(4) << result.hedge_ratio << std::setprecision(2) << "\n";
    out << "총 거래 수:   " << result.total_trades << "\n";
    out << "승리 거래:    " << result.winning_trades << "\n";
    out << "패배 거래:    " << result.losing_trades << "\n";
    out << "승률:         " << result.win_rate << "%\n";
    out << "평균 이익:    " << result.avg_win << "\n";
    out << "평균 손실:    " << result.avg_loss << "\n";
    out << "Profit Factor: " << formatFactor(result.profit_factor) << "\n";
    out << "Expectancy:  " << result.expectancy << " /trade\n";
    out << "평균 보유:    " << std::setprecision(1) << result.avg_holding_period << std::setprecision(2) << "일\n";

    out << "레짐별 요약:\n";
    for (const auto& r : result.regime_stats) {
        out << "  - " << toString(r.regime)
            << " | days=" << r.days << " (" << std::setprecision(1) << r.day_pct << "%)"
            << " | trades=" << r.trades
            << " | pnl=" << std::setprecision(2) << r.total_pnl
            << " | avg=" << r.avg_pnl << "\n";
    }

    out << "전략별 요약:\n";
    for (const auto& s : result.strategy_summaries) {
        out << "  - " << toString(s.strategy)
            << " | trades=" << s.total_trades
            << " | win=" << std::setprecision(1) << s.win_rate << "%"
            << " | pnl=" << std::setprecision(2) << s.total_pnl
            << " | pf=" << formatFactor(s.profit_factor) << "\n";
    }

    if (!result.exit_reason_counts.empty()) {
        out << "청산 사유:\n";
        for (const auto& entry : result.exit_reason_counts) {
            out << "  - " << entry.first << ": " << entry.second << "\n";
        }
    }

    if (result.diagnostics) {
        const auto& d = *result.diagnostics;
        out << "공적분 진단: ADF=" << std::setprecision(3) << d.adf_statistic
            << " p=" << d.p_value
            << " half-life=" << (std::isinf(d.half_life) ? std::string("inf") : std::to_string(d.half_life))
            << (d.is_cointegrated ? " (cointegrated)" : " (not cointegrated)") << "\n";
    }
    out << "---------------------------------------------\n";

    out.flags(flags);
    out.precision(precision);
}

} // namespace backtest
} // namespace regimepairs
