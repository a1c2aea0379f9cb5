// include/barsim/backtest/report.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "barsim/core/types.hpp"

namespace barsim {
namespace backtest {

/**
 * @brief Summary of one completed run
 */
struct BacktestReport {
    std::string strategy_name;
    Timestamp start;
    Timestamp end;
    std::chrono::seconds duration{0};

    // Performance metrics
    double initial_cash{0.0};
    double final_equity{0.0};
    double peak_equity{0.0};
    double return_pct{0.0};    // Percent
    double max_drawdown{0.0};  // Fraction of the running peak
    double sharpe_ratio{0.0};
    double exposure_pct{0.0};  // Percent of simulated steps holding a position
    bool valid{true};          // False if any trade exceeded the equity of the previous step

    // Trading metrics
    std::size_t trade_count{0};
    double win_rate{0.0};  // Fraction
    double profit_factor{0.0};
    double avg_win{0.0};
    double avg_loss{0.0};
    double max_win{0.0};
    double max_loss{0.0};
    double realized_pnl{0.0};
    double total_commission{0.0};

    std::vector<EquityPoint> equity_curve;
    std::vector<TradeRecord> trade_log;
    std::vector<std::size_t> insufficient_capital_steps;

    nlohmann::json to_json() const;
};

/**
 * @brief Human readable multi-line summary, without the curves
 */
std::string format_report(const BacktestReport& report);

nlohmann::json trade_to_json(const TradeRecord& trade);

}  // namespace backtest
}  // namespace barsim
