// include/barsim/backtest/backtest_metrics_calculator.hpp
#pragma once

#include <cstddef>
#include <vector>
#include "barsim/core/types.hpp"

namespace barsim {
namespace backtest {

/**
 * @brief Stateless calculations over an equity curve and a trade log
 *
 * All methods are const and free of side effects; the caller logs.
 * Returns are per bar and annualised with 252 periods per year.
 */
class BacktestMetricsCalculator {
public:
    BacktestMetricsCalculator() = default;

    // ========== Return Calculations ==========

    /**
     * @brief Total return as a decimal (0.10 = 10%)
     */
    double calculate_total_return(double start_value, double end_value) const;

    /**
     * @brief Bar-to-bar returns of an equity curve
     */
    std::vector<double> calculate_returns_from_equity(
        const std::vector<EquityPoint>& equity_curve) const;

    // ========== Risk-Adjusted Return Metrics ==========

    /**
     * @brief Annualised Sharpe ratio of per-bar returns
     * @return 0 when there are no returns or no volatility
     */
    double calculate_sharpe_ratio(const std::vector<double>& returns,
                                  double risk_free_rate = 0.0) const;

    /**
     * @brief Annualised volatility of per-bar returns
     */
    double calculate_volatility(const std::vector<double>& returns) const;

    // ========== Drawdown Metrics ==========

    /**
     * @brief Drawdown from the running peak at every point, as a decimal
     * @param starting_peak Equity before the first point (initial cash);
     *        the running peak never starts below it
     */
    std::vector<EquityPoint> calculate_drawdowns(const std::vector<EquityPoint>& equity_curve,
                                                 double starting_peak = 0.0) const;

    double calculate_max_drawdown(const std::vector<EquityPoint>& equity_curve,
                                  double starting_peak = 0.0) const;

    double calculate_peak_equity(const std::vector<EquityPoint>& equity_curve) const;

    // ========== Trade Statistics ==========

    struct TradeStatistics {
        std::size_t total_trades = 0;
        std::size_t winning_trades = 0;
        double win_rate = 0.0;  // Fraction of trades with positive net P&L
        double profit_factor = 0.0;
        double total_profit = 0.0;
        double total_loss = 0.0;
        double avg_win = 0.0;
        double avg_loss = 0.0;
        double max_win = 0.0;
        double max_loss = 0.0;
        double avg_holding_period = 0.0;  // In bars
    };

    TradeStatistics calculate_trade_statistics(const std::vector<TradeRecord>& trades) const;

    /**
     * @brief Percentage of steps that ended with an open position
     */
    double calculate_exposure(std::size_t exposed_steps, std::size_t total_steps) const;

private:
    double calculate_mean(const std::vector<double>& values) const;
};

}  // namespace backtest
}  // namespace barsim
