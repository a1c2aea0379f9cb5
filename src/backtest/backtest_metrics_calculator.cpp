// src/backtest/backtest_metrics_calculator.cpp

#include "barsim/backtest/backtest_metrics_calculator.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace barsim {
namespace backtest {

namespace {
constexpr double PERIODS_PER_YEAR = 252.0;
}

// ========== Return Calculations ==========

double BacktestMetricsCalculator::calculate_total_return(double start_value,
                                                         double end_value) const {
    if (start_value <= 0.0) {
        return 0.0;
    }
    return (end_value - start_value) / start_value;
}

std::vector<double> BacktestMetricsCalculator::calculate_returns_from_equity(
    const std::vector<EquityPoint>& equity_curve) const {
    std::vector<double> returns;
    if (equity_curve.size() < 2) {
        return returns;
    }

    returns.reserve(equity_curve.size() - 1);
    for (std::size_t i = 1; i < equity_curve.size(); ++i) {
        if (equity_curve[i - 1].second > 0.0) {
            returns.push_back((equity_curve[i].second - equity_curve[i - 1].second) /
                              equity_curve[i - 1].second);
        }
    }
    return returns;
}

// ========== Risk-Adjusted Return Metrics ==========

double BacktestMetricsCalculator::calculate_sharpe_ratio(const std::vector<double>& returns,
                                                         double risk_free_rate) const {
    if (returns.empty()) {
        return 0.0;
    }

    const double volatility = calculate_volatility(returns);
    if (volatility <= 0.0) {
        return 0.0;
    }
    return (calculate_mean(returns) * PERIODS_PER_YEAR - risk_free_rate) / volatility;
}

double BacktestMetricsCalculator::calculate_volatility(const std::vector<double>& returns) const {
    if (returns.empty()) {
        return 0.0;
    }

    const double mean = calculate_mean(returns);
    double sq_sum = 0.0;
    for (double r : returns) {
        sq_sum += (r - mean) * (r - mean);
    }
    return std::sqrt(sq_sum / static_cast<double>(returns.size())) * std::sqrt(PERIODS_PER_YEAR);
}

// ========== Drawdown Metrics ==========

std::vector<EquityPoint> BacktestMetricsCalculator::calculate_drawdowns(
    const std::vector<EquityPoint>& equity_curve, double starting_peak) const {
    std::vector<EquityPoint> drawdowns;
    drawdowns.reserve(equity_curve.size());
    if (equity_curve.empty()) {
        return drawdowns;
    }

    double peak = std::max(starting_peak, equity_curve.front().second);
    for (const auto& [timestamp, equity] : equity_curve) {
        peak = std::max(peak, equity);
        const double drawdown = (equity < peak && peak > 0.0) ? (peak - equity) / peak : 0.0;
        drawdowns.emplace_back(timestamp, drawdown);
    }
    return drawdowns;
}

double BacktestMetricsCalculator::calculate_max_drawdown(
    const std::vector<EquityPoint>& equity_curve, double starting_peak) const {
    const auto drawdowns = calculate_drawdowns(equity_curve, starting_peak);
    if (drawdowns.empty()) {
        return 0.0;
    }

    auto max_it = std::max_element(
        drawdowns.begin(), drawdowns.end(),
        [](const auto& a, const auto& b) { return a.second < b.second; });
    return max_it->second;
}

double BacktestMetricsCalculator::calculate_peak_equity(
    const std::vector<EquityPoint>& equity_curve) const {
    if (equity_curve.empty()) {
        return 0.0;
    }
    auto max_it = std::max_element(
        equity_curve.begin(), equity_curve.end(),
        [](const auto& a, const auto& b) { return a.second < b.second; });
    return max_it->second;
}

// ========== Trade Statistics ==========

BacktestMetricsCalculator::TradeStatistics BacktestMetricsCalculator::calculate_trade_statistics(
    const std::vector<TradeRecord>& trades) const {
    TradeStatistics stats;
    stats.total_trades = trades.size();
    if (trades.empty()) {
        return stats;
    }

    std::size_t losing_trades = 0;
    double holding = 0.0;
    for (const auto& trade : trades) {
        if (trade.pnl > 0.0) {
            ++stats.winning_trades;
            stats.total_profit += trade.pnl;
            stats.max_win = std::max(stats.max_win, trade.pnl);
        } else if (trade.pnl < 0.0) {
            ++losing_trades;
            stats.total_loss += -trade.pnl;
            stats.max_loss = std::max(stats.max_loss, -trade.pnl);
        }
        holding += static_cast<double>(trade.exit_step - trade.entry_step);
    }

    stats.win_rate =
        static_cast<double>(stats.winning_trades) / static_cast<double>(stats.total_trades);
    stats.avg_win =
        stats.winning_trades > 0 ? stats.total_profit / static_cast<double>(stats.winning_trades)
                                 : 0.0;
    stats.avg_loss =
        losing_trades > 0 ? stats.total_loss / static_cast<double>(losing_trades) : 0.0;
    // No losing trade: cap instead of dividing by zero
    if (stats.total_loss > 0.0) {
        stats.profit_factor = stats.total_profit / stats.total_loss;
    } else {
        stats.profit_factor = stats.total_profit > 0.0 ? 999.0 : 0.0;
    }
    stats.avg_holding_period = holding / static_cast<double>(stats.total_trades);
    return stats;
}

double BacktestMetricsCalculator::calculate_exposure(std::size_t exposed_steps,
                                                     std::size_t total_steps) const {
    if (total_steps == 0) {
        return 0.0;
    }
    return 100.0 * static_cast<double>(exposed_steps) / static_cast<double>(total_steps);
}

double BacktestMetricsCalculator::calculate_mean(const std::vector<double>& values) const {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

}  // namespace backtest
}  // namespace barsim
