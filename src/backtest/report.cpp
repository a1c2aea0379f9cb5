// src/backtest/report.cpp

#include "barsim/backtest/report.hpp"
#include <iomanip>
#include <sstream>
#include "barsim/core/time_utils.hpp"

namespace barsim {
namespace backtest {

nlohmann::json trade_to_json(const TradeRecord& trade) {
    nlohmann::json j;
    j["side"] = position_side_to_string(trade.side);
    j["size"] = trade.size;
    j["entry_step"] = trade.entry_step;
    j["exit_step"] = trade.exit_step;
    j["entry_time"] = core::format_timestamp(trade.entry_time);
    j["exit_time"] = core::format_timestamp(trade.exit_time);
    j["entry_price"] = trade.entry_price;
    j["exit_price"] = trade.exit_price;
    j["gross_pnl"] = trade.gross_pnl;
    j["commission"] = trade.commission;
    j["pnl"] = trade.pnl;
    return j;
}

nlohmann::json BacktestReport::to_json() const {
    nlohmann::json j;
    j["strategy_name"] = strategy_name;
    j["start"] = core::format_timestamp(start);
    j["end"] = core::format_timestamp(end);
    j["duration_seconds"] = duration.count();
    j["initial_cash"] = initial_cash;
    j["final_equity"] = final_equity;
    j["peak_equity"] = peak_equity;
    j["return_pct"] = return_pct;
    j["max_drawdown"] = max_drawdown;
    j["sharpe_ratio"] = sharpe_ratio;
    j["exposure_pct"] = exposure_pct;
    j["valid"] = valid;
    j["trade_count"] = trade_count;
    j["win_rate"] = win_rate;
    j["profit_factor"] = profit_factor;
    j["avg_win"] = avg_win;
    j["avg_loss"] = avg_loss;
    j["max_win"] = max_win;
    j["max_loss"] = max_loss;
    j["realized_pnl"] = realized_pnl;
    j["total_commission"] = total_commission;

    nlohmann::json curve = nlohmann::json::array();
    for (const auto& [timestamp, equity] : equity_curve) {
        curve.push_back(
            nlohmann::json{{"timestamp", core::format_timestamp(timestamp)}, {"equity", equity}});
    }
    j["equity_curve"] = curve;

    nlohmann::json trades = nlohmann::json::array();
    for (const auto& trade : trade_log) {
        trades.push_back(trade_to_json(trade));
    }
    j["trade_log"] = trades;
    j["insufficient_capital_steps"] = insufficient_capital_steps;
    return j;
}

std::string format_report(const BacktestReport& report) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    oss << "Strategy:         " << report.strategy_name << "\n"
        << "Valid:            " << (report.valid ? "yes" : "no (increase initial cash)") << "\n"
        << "Start:            " << core::format_timestamp(report.start) << "\n"
        << "End:              " << core::format_timestamp(report.end) << "\n"
        << "Duration (days):  " << static_cast<double>(report.duration.count()) / 86400.0
        << "\n"
        << "Exposure %:       " << report.exposure_pct << "\n"
        << "Equity final:     " << report.final_equity << "\n"
        << "Equity peak:      " << report.peak_equity << "\n"
        << "Return %:         " << report.return_pct << "\n"
        << "Max drawdown %:   " << report.max_drawdown * 100.0 << "\n"
        << "Sharpe ratio:     " << report.sharpe_ratio << "\n"
        << "Trades:           " << report.trade_count << "\n"
        << "Win rate %:       " << report.win_rate * 100.0 << "\n"
        << "Profit factor:    " << report.profit_factor << "\n"
        << "Avg win / loss:   " << report.avg_win << " / " << report.avg_loss << "\n"
        << "Commission paid:  " << report.total_commission << "\n";
    return oss.str();
}

}  // namespace backtest
}  // namespace barsim
