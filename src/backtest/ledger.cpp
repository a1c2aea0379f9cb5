// src/backtest/ledger.cpp

#include "barsim/backtest/ledger.hpp"
#include "barsim/core/logger.hpp"

namespace barsim {
namespace backtest {

Ledger::Ledger(LedgerParams params)
    : params_(params), cash_(params.initial_cash), equity_(params.initial_cash) {}

double Ledger::notional(double price) const {
    return price * params_.position_size * params_.amount;
}

double Ledger::unrealized_pnl(double price) const {
    if (!position_.has_position()) {
        return 0.0;
    }
    const double move = price - position_.entry_price;
    const double signed_move = position_.side == PositionSide::LONG ? move : -move;
    return signed_move * position_.size * params_.amount;
}

Result<void> Ledger::apply(Decision decision, const Bar& bar, std::size_t step) {
    bool traded = false;
    double commission = 0.0;
    switch (decision) {
        case Decision::HOLD:
            break;
        case Decision::CLOSE:
            if (position_.has_position()) {
                commission += close(bar, step);
                traded = true;
            }
            break;
        case Decision::LONG:
            if (position_.side == PositionSide::LONG) {
                break;
            }
            if (position_.side == PositionSide::SHORT) {
                commission += close(bar, step);
            }
            commission += open(PositionSide::LONG, bar, step);
            traded = true;
            break;
        case Decision::SHORT:
            if (position_.side == PositionSide::SHORT) {
                break;
            }
            if (position_.side == PositionSide::LONG) {
                commission += close(bar, step);
            }
            commission += open(PositionSide::SHORT, bar, step);
            traded = true;
            break;
        default:
            return make_error<void>(ErrorCode::INVALID_DECISION,
                                    "Unrecognised decision " + decision_to_string(decision),
                                    "Ledger");
    }

    if (traded) {
        check_capital(bar, step, commission);
    }
    return Result<void>();
}

void Ledger::close_open_position(const Bar& bar, std::size_t step) {
    if (position_.has_position()) {
        check_capital(bar, step, close(bar, step));
    }
}

void Ledger::check_capital(const Bar& bar, std::size_t step, double commission) {
    // equity_ still holds the mark of the previous step (initial cash before the first)
    const double required = notional(bar.close) + commission;
    if (equity_ > required) {
        return;
    }
    if (!insufficient_capital_steps_.empty() && insufficient_capital_steps_.back() == step) {
        return;
    }
    insufficient_capital_steps_.push_back(step);
    WARN("Step " << step << ": trading needs " << required << " but equity was " << equity_);
}

double Ledger::open(PositionSide side, const Bar& bar, std::size_t step) {
    const double commission = params_.commission_rate * notional(bar.close);

    cash_ -= commission;
    total_commission_ += commission;

    position_.side = side;
    position_.size = params_.position_size;
    position_.entry_price = bar.close;
    position_.entry_step = step;
    position_.entry_time = bar.timestamp;
    position_.entry_commission = commission;

    DEBUG("Step " << step << ": open " << position_side_to_string(side) << " "
                  << position_.size << " @ " << bar.close << ", commission " << commission);
    return commission;
}

double Ledger::close(const Bar& bar, std::size_t step) {
    const double commission = params_.commission_rate * notional(bar.close);
    const double gross = unrealized_pnl(bar.close);

    TradeRecord trade;
    trade.side = position_.side;
    trade.size = position_.size;
    trade.entry_step = position_.entry_step;
    trade.exit_step = step;
    trade.entry_time = position_.entry_time;
    trade.exit_time = bar.timestamp;
    trade.entry_price = position_.entry_price;
    trade.exit_price = bar.close;
    trade.gross_pnl = gross;
    trade.commission = position_.entry_commission + commission;
    trade.pnl = gross - trade.commission;

    cash_ += gross - commission;
    total_commission_ += commission;
    realized_pnl_ += trade.pnl;
    trades_.push_back(trade);

    DEBUG("Step " << step << ": close " << position_side_to_string(position_.side) << " @ "
                  << bar.close << ", pnl " << trade.pnl);

    position_ = Position();
    return commission;
}

void Ledger::mark_to_market(const Bar& bar) {
    equity_ = cash_ + unrealized_pnl(bar.close);
    equity_curve_.emplace_back(bar.timestamp, equity_);
    if (position_.has_position()) {
        ++exposed_steps_;
    }
}

}  // namespace backtest
}  // namespace barsim
