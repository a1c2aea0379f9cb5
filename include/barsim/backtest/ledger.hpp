// include/barsim/backtest/ledger.hpp
#pragma once

#include <cstddef>
#include <vector>
#include "barsim/core/error.hpp"
#include "barsim/core/types.hpp"

namespace barsim {
namespace backtest {

/**
 * @brief Sizing and cost parameters of the simulated account
 */
struct LedgerParams {
    double initial_cash{50000.0};
    double position_size{100.0};   // Units per open
    double commission_rate{0.0};   // Fraction of notional per transition
    double amount{1.0};            // Contract multiplier
};

/**
 * @brief Single-position cash and P&L ledger
 *
 * Fills happen at the close of the bar passed to apply(). Cash moves only
 * by commissions and by realized P&L; equity is cash plus the unrealized
 * P&L of the open position at the last marked close.
 */
class Ledger {
public:
    explicit Ledger(LedgerParams params);

    /**
     * @brief Apply a decision at the close of bar
     * @return INVALID_DECISION for a value outside the Decision enum
     */
    Result<void> apply(Decision decision, const Bar& bar, std::size_t step);

    /**
     * @brief Close any open position at the close of bar
     */
    void close_open_position(const Bar& bar, std::size_t step);

    /**
     * @brief Revalue the open position at the bar's close and append an
     *        equity point
     */
    void mark_to_market(const Bar& bar);

    double cash() const {
        return cash_;
    }
    double equity() const {
        return equity_;
    }
    double initial_cash() const {
        return params_.initial_cash;
    }
    double realized_pnl() const {
        return realized_pnl_;
    }
    double total_commission() const {
        return total_commission_;
    }
    double unrealized_pnl(double price) const;

    const Position& position() const {
        return position_;
    }
    const std::vector<TradeRecord>& trades() const {
        return trades_;
    }
    const std::vector<EquityPoint>& equity_curve() const {
        return equity_curve_;
    }

    /**
     * @brief Steps with a transition (open, close or reversal) where the
     *        equity marked at the previous step was at or below the notional
     *        at this close plus the commission charged in the step
     */
    const std::vector<std::size_t>& insufficient_capital_steps() const {
        return insufficient_capital_steps_;
    }

    /**
     * @brief Number of marked steps that ended with an open position
     */
    std::size_t exposed_steps() const {
        return exposed_steps_;
    }

private:
    double notional(double price) const;
    // Both return the commission charged
    double open(PositionSide side, const Bar& bar, std::size_t step);
    double close(const Bar& bar, std::size_t step);
    void check_capital(const Bar& bar, std::size_t step, double commission);

    LedgerParams params_;
    double cash_;
    double equity_;
    double realized_pnl_{0.0};
    double total_commission_{0.0};
    Position position_;
    std::vector<TradeRecord> trades_;
    std::vector<EquityPoint> equity_curve_;
    std::vector<std::size_t> insufficient_capital_steps_;
    std::size_t exposed_steps_{0};
};

}  // namespace backtest
}  // namespace barsim
