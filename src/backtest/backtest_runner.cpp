// src/backtest/backtest_runner.cpp

#include "barsim/backtest/backtest_runner.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include "barsim/core/logger.hpp"

namespace barsim {
namespace backtest {

Result<void> BacktestConfig::validate() const {
    auto invalid = [](const std::string& message) {
        return make_error<void>(ErrorCode::INVALID_CONFIG, message, "BacktestConfig");
    };

    if (!std::isfinite(initial_cash) || initial_cash <= 0.0) {
        return invalid("initial_cash must be positive and finite");
    }
    if (!std::isfinite(position_size) || position_size <= 0.0) {
        return invalid("position_size must be positive and finite");
    }
    if (!std::isfinite(commission_rate) || commission_rate < 0.0 || commission_rate >= 1.0) {
        return invalid("commission_rate must be in [0, 1)");
    }
    if (!std::isfinite(amount) || amount <= 0.0) {
        return invalid("amount must be positive and finite");
    }
    return Result<void>();
}

BacktestRunner::BacktestRunner(BacktestConfig config) : config_(std::move(config)) {
    Logger::register_component("BacktestRunner");
}

Result<BacktestReport> BacktestRunner::run(StrategyInterface& strategy,
                                           const std::atomic<bool>* cancel) const {
    auto valid = config_.validate();
    if (valid.is_error()) {
        ERROR("Invalid backtest configuration: " << valid.error()->what());
        return make_error<BacktestReport>(valid.error()->code(), valid.error()->what(),
                                          "BacktestRunner");
    }

    const auto data = strategy.data();
    if (!data) {
        return make_error<BacktestReport>(ErrorCode::NOT_INITIALIZED,
                                          "Strategy " + strategy.name() + " has no bar series",
                                          "BacktestRunner");
    }

    try {
        strategy.clear_indicators();
        auto setup = strategy.set_indicators();
        if (setup.is_error()) {
            ERROR("Indicator setup failed for " << strategy.name() << ": "
                                                << setup.error()->what());
            return make_error<BacktestReport>(
                ErrorCode::STRATEGY_EXECUTION_ERROR,
                "set_indicators failed: " + std::string(setup.error()->what()), "BacktestRunner");
        }
    } catch (const std::exception& e) {
        ERROR("Indicator setup threw for " << strategy.name() << ": " << e.what());
        return make_error<BacktestReport>(ErrorCode::STRATEGY_EXECUTION_ERROR,
                                          std::string("set_indicators threw: ") + e.what(),
                                          "BacktestRunner");
    } catch (...) {
        ERROR("Indicator setup threw a non-standard exception for " << strategy.name());
        return make_error<BacktestReport>(ErrorCode::STRATEGY_EXECUTION_ERROR,
                                          "set_indicators threw an unknown exception",
                                          "BacktestRunner");
    }

    const std::size_t warmup = strategy.warmup_period();
    if (data->size() < warmup) {
        return make_error<BacktestReport>(
            ErrorCode::EMPTY_SERIES,
            "Series has " + std::to_string(data->size()) + " bars, warm-up needs " +
                std::to_string(warmup),
            "BacktestRunner");
    }

    const std::size_t first_step = std::max<std::size_t>(warmup, 1) - 1;
    const std::size_t last_step = data->size() - 1;

    INFO("Running " << strategy.name() << " on " << data->size() << " bars from step "
                    << first_step);

    Ledger ledger(config_.ledger_params());

    for (std::size_t step = first_step; step <= last_step; ++step) {
        if (cancel && cancel->load()) {
            WARN("Run of " << strategy.name() << " cancelled at step " << step);
            return make_error<BacktestReport>(ErrorCode::CANCELLED,
                                              "Cancelled at step " + std::to_string(step),
                                              "BacktestRunner");
        }

        const Bar& bar = data->at(step);
        try {
            auto prepared = strategy.prepare(step);
            if (prepared.is_error()) {
                ERROR("Step " << step << ": " << prepared.error()->what());
                return make_step_error<BacktestReport>(step, prepared.error()->code(),
                                                       prepared.error()->what(),
                                                       "BacktestRunner");
            }

            auto decision = strategy.next(step);
            if (decision.is_error()) {
                ERROR("Step " << step << ": " << decision.error()->what());
                return make_step_error<BacktestReport>(step, decision.error()->code(),
                                                       decision.error()->what(),
                                                       "BacktestRunner");
            }

            const Decision d = decision.value();
            if (!is_valid_decision(d)) {
                ERROR("Step " << step << ": invalid decision " << decision_to_string(d));
                return make_step_error<BacktestReport>(
                    step, ErrorCode::INVALID_DECISION,
                    "Strategy returned " + decision_to_string(d), "BacktestRunner");
            }

            auto applied = ledger.apply(d, bar, step);
            if (applied.is_error()) {
                return make_step_error<BacktestReport>(step, applied.error()->code(),
                                                       applied.error()->what(),
                                                       "BacktestRunner");
            }
        } catch (const std::exception& e) {
            ERROR("Step " << step << ": strategy threw " << e.what());
            return make_step_error<BacktestReport>(step, ErrorCode::UNKNOWN_ERROR, e.what(),
                                                   "BacktestRunner");
        } catch (...) {
            ERROR("Step " << step << ": strategy threw a non-standard exception");
            return make_step_error<BacktestReport>(step, ErrorCode::UNKNOWN_ERROR,
                                                   "unknown exception", "BacktestRunner");
        }

        if (step == last_step && config_.close_on_finish) {
            ledger.close_open_position(bar, step);
        }
        ledger.mark_to_market(bar);
    }

    auto report = build_report(strategy.name(), *data, ledger, last_step - first_step + 1);
    INFO("Finished " << report.strategy_name << ": final equity " << report.final_equity << ", "
                     << report.trade_count << " trades");
    return report;
}

BacktestReport BacktestRunner::build_report(const std::string& strategy_name,
                                            const BarSeries& data, const Ledger& ledger,
                                            std::size_t simulated_steps) const {
    BacktestReport report;
    report.strategy_name = strategy_name;
    report.start = data.front().timestamp;
    report.end = data.back().timestamp;
    report.duration = std::chrono::duration_cast<std::chrono::seconds>(report.end - report.start);

    report.initial_cash = ledger.initial_cash();
    report.final_equity = ledger.equity();
    report.peak_equity =
        std::max(ledger.initial_cash(), calculator_.calculate_peak_equity(ledger.equity_curve()));
    report.return_pct =
        calculator_.calculate_total_return(ledger.initial_cash(), ledger.equity()) * 100.0;
    report.max_drawdown =
        calculator_.calculate_max_drawdown(ledger.equity_curve(), ledger.initial_cash());
    report.sharpe_ratio = calculator_.calculate_sharpe_ratio(
        calculator_.calculate_returns_from_equity(ledger.equity_curve()));
    report.exposure_pct = calculator_.calculate_exposure(ledger.exposed_steps(), simulated_steps);
    report.valid = ledger.insufficient_capital_steps().empty();

    const auto stats = calculator_.calculate_trade_statistics(ledger.trades());
    report.trade_count = stats.total_trades;
    report.win_rate = stats.win_rate;
    report.profit_factor = stats.profit_factor;
    report.avg_win = stats.avg_win;
    report.avg_loss = stats.avg_loss;
    report.max_win = stats.max_win;
    report.max_loss = stats.max_loss;
    report.realized_pnl = ledger.realized_pnl();
    report.total_commission = ledger.total_commission();

    report.equity_curve = ledger.equity_curve();
    report.trade_log = ledger.trades();
    report.insufficient_capital_steps = ledger.insufficient_capital_steps();
    return report;
}

}  // namespace backtest
}  // namespace barsim
