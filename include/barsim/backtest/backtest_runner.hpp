// include/barsim/backtest/backtest_runner.hpp
#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include "barsim/backtest/backtest_metrics_calculator.hpp"
#include "barsim/backtest/ledger.hpp"
#include "barsim/backtest/report.hpp"
#include "barsim/core/config_base.hpp"
#include "barsim/core/error.hpp"
#include "barsim/strategy/strategy_interface.hpp"

namespace barsim {
namespace backtest {

/**
 * @brief Account and run settings for a single backtest
 */
struct BacktestConfig : public ConfigBase {
    double initial_cash{50000.0};
    double position_size{100.0};  // Units traded per open
    double commission_rate{0.0};  // Fraction of notional, charged on open and on close
    double amount{1.0};           // Contract multiplier
    bool close_on_finish{false};  // Close any open position at the last bar

    // Configuration metadata
    std::string version{"1.0.0"};

    /**
     * @brief Check value ranges
     * @return INVALID_CONFIG naming the first offending field
     */
    Result<void> validate() const;

    LedgerParams ledger_params() const {
        return LedgerParams{initial_cash, position_size, commission_rate, amount};
    }

    // JSON serialization
    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["initial_cash"] = initial_cash;
        j["position_size"] = position_size;
        j["commission_rate"] = commission_rate;
        j["amount"] = amount;
        j["close_on_finish"] = close_on_finish;
        j["version"] = version;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("initial_cash"))
            initial_cash = j.at("initial_cash").get<double>();
        if (j.contains("position_size"))
            position_size = j.at("position_size").get<double>();
        if (j.contains("commission_rate"))
            commission_rate = j.at("commission_rate").get<double>();
        if (j.contains("amount"))
            amount = j.at("amount").get<double>();
        if (j.contains("close_on_finish"))
            close_on_finish = j.at("close_on_finish").get<bool>();
        if (j.contains("version"))
            version = j.at("version").get<std::string>();
    }
};

/**
 * @brief Drives one strategy bar by bar over its series
 *
 * A runner holds no state between runs; run() may be called concurrently
 * from several threads as long as each call gets its own strategy.
 */
class BacktestRunner {
public:
    explicit BacktestRunner(BacktestConfig config);

    /**
     * @brief Run the strategy over every bar past its warm-up period
     * @param strategy Strategy to drive, set_indicators() is called here
     * @param cancel Optional flag checked between steps
     * @return The report, or the first error. Step failures are
     *         StrategyExecutionError instances carrying the step index.
     */
    Result<BacktestReport> run(StrategyInterface& strategy,
                               const std::atomic<bool>* cancel = nullptr) const;

    const BacktestConfig& config() const {
        return config_;
    }

private:
    BacktestReport build_report(const std::string& strategy_name, const BarSeries& data,
                                const Ledger& ledger, std::size_t simulated_steps) const;

    BacktestConfig config_;
    BacktestMetricsCalculator calculator_;
};

}  // namespace backtest
}  // namespace barsim
