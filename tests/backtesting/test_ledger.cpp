#include <gtest/gtest.h>
#include "../core/test_base.hpp"
#include "barsim/backtest/ledger.hpp"

using namespace barsim;
using namespace barsim::backtest;
using namespace barsim::testing;

class LedgerTest : public TestBase {
protected:
    static Bar bar_at(double close, int day = 0) {
        return Bar(core::from_epoch_seconds(1641168000 + 86400 * day), close, close, close, close,
                   0.0);
    }

    static LedgerParams params(double commission_rate = 0.0) {
        LedgerParams p;
        p.initial_cash = 50000.0;
        p.position_size = 100.0;
        p.commission_rate = commission_rate;
        p.amount = 1.0;
        return p;
    }
};

TEST_F(LedgerTest, RoundTripWithCommission) {
    Ledger ledger(params(0.001));

    ASSERT_TRUE(ledger.apply(Decision::LONG, bar_at(50.0), 0).is_ok());
    EXPECT_EQ(ledger.position().side, PositionSide::LONG);
    EXPECT_NEAR(ledger.cash(), 50000.0 - 5.0, 1e-9);

    ASSERT_TRUE(ledger.apply(Decision::CLOSE, bar_at(55.0, 1), 1).is_ok());
    EXPECT_FALSE(ledger.position().has_position());

    ASSERT_EQ(ledger.trades().size(), 1u);
    const auto& trade = ledger.trades()[0];
    EXPECT_NEAR(trade.gross_pnl, 500.0, 1e-9);
    EXPECT_NEAR(trade.commission, 10.5, 1e-9);
    EXPECT_NEAR(trade.pnl, 489.5, 1e-9);
    EXPECT_NEAR(ledger.cash(), 50489.5, 1e-9);
    EXPECT_NEAR(ledger.realized_pnl(), 489.5, 1e-9);
    EXPECT_NEAR(ledger.total_commission(), 10.5, 1e-9);
}

TEST_F(LedgerTest, ShortProfitsWhenPriceFalls) {
    Ledger ledger(params());
    ASSERT_TRUE(ledger.apply(Decision::SHORT, bar_at(50.0), 0).is_ok());
    ASSERT_TRUE(ledger.apply(Decision::CLOSE, bar_at(45.0, 1), 1).is_ok());
    ASSERT_EQ(ledger.trades().size(), 1u);
    EXPECT_DOUBLE_EQ(ledger.trades()[0].pnl, 500.0);
    EXPECT_EQ(ledger.trades()[0].side, PositionSide::SHORT);
}

TEST_F(LedgerTest, ReversalClosesThenOpens) {
    Ledger ledger(params(0.001));
    ASSERT_TRUE(ledger.apply(Decision::LONG, bar_at(50.0), 0).is_ok());
    ASSERT_TRUE(ledger.apply(Decision::SHORT, bar_at(52.0, 1), 1).is_ok());

    EXPECT_EQ(ledger.position().side, PositionSide::SHORT);
    EXPECT_DOUBLE_EQ(ledger.position().entry_price, 52.0);
    EXPECT_EQ(ledger.position().entry_step, 1u);
    ASSERT_EQ(ledger.trades().size(), 1u);
    EXPECT_EQ(ledger.trades()[0].exit_step, 1u);
    // open 5.0, close 5.2, reopen 5.2
    EXPECT_NEAR(ledger.total_commission(), 15.4, 1e-9);
    EXPECT_NEAR(ledger.cash(), 50000.0 + 200.0 - 15.4, 1e-9);
}

TEST_F(LedgerTest, RepeatedSameSideIsNoOp) {
    Ledger ledger(params(0.001));
    ASSERT_TRUE(ledger.apply(Decision::LONG, bar_at(50.0), 0).is_ok());
    const double cash = ledger.cash();
    ASSERT_TRUE(ledger.apply(Decision::LONG, bar_at(60.0, 1), 1).is_ok());
    ASSERT_TRUE(ledger.apply(Decision::HOLD, bar_at(61.0, 2), 2).is_ok());

    EXPECT_DOUBLE_EQ(ledger.cash(), cash);
    EXPECT_DOUBLE_EQ(ledger.position().entry_price, 50.0);
    EXPECT_TRUE(ledger.trades().empty());
}

TEST_F(LedgerTest, CloseWhenFlatIsNoOp) {
    Ledger ledger(params(0.001));
    ASSERT_TRUE(ledger.apply(Decision::CLOSE, bar_at(50.0), 0).is_ok());
    EXPECT_DOUBLE_EQ(ledger.cash(), 50000.0);
    EXPECT_TRUE(ledger.trades().empty());
}

TEST_F(LedgerTest, EquityIsCashPlusUnrealized) {
    Ledger ledger(params(0.001));
    const std::vector<double> closes{50.0, 51.0, 49.0, 53.0};

    ASSERT_TRUE(ledger.apply(Decision::LONG, bar_at(closes[0]), 0).is_ok());
    for (std::size_t i = 0; i < closes.size(); ++i) {
        const Bar bar = bar_at(closes[i], static_cast<int>(i));
        ledger.mark_to_market(bar);
        EXPECT_DOUBLE_EQ(ledger.equity(), ledger.cash() + ledger.unrealized_pnl(bar.close));
    }
    EXPECT_EQ(ledger.equity_curve().size(), closes.size());
    EXPECT_EQ(ledger.exposed_steps(), closes.size());
}

TEST_F(LedgerTest, InvalidDecisionRejected) {
    Ledger ledger(params());
    auto result = ledger.apply(static_cast<Decision>(9), bar_at(50.0), 0);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_DECISION);
}

TEST_F(LedgerTest, CloseAgainstPreviousEquityIsFlagged) {
    LedgerParams p = params();
    p.initial_cash = 6000.0;
    Ledger ledger(p);

    ASSERT_TRUE(ledger.apply(Decision::LONG, bar_at(50.0), 0).is_ok());
    ledger.mark_to_market(bar_at(55.0));
    EXPECT_TRUE(ledger.insufficient_capital_steps().empty());

    ASSERT_TRUE(ledger.apply(Decision::HOLD, bar_at(70.0), 1).is_ok());
    EXPECT_TRUE(ledger.insufficient_capital_steps().empty());

    // Equity marked at 6500 is below the 7000 notional at the exit
    ASSERT_TRUE(ledger.apply(Decision::CLOSE, bar_at(70.0), 2).is_ok());
    EXPECT_EQ(ledger.insufficient_capital_steps(), (std::vector<std::size_t>{2}));
}

TEST_F(LedgerTest, InsufficientCapitalIsFlagged) {
    LedgerParams p = params();
    p.initial_cash = 1000.0;  // 100 units at 50 needs 5000
    Ledger ledger(p);

    ASSERT_TRUE(ledger.apply(Decision::LONG, bar_at(50.0), 3).is_ok());
    EXPECT_TRUE(ledger.position().has_position());
    ASSERT_EQ(ledger.insufficient_capital_steps().size(), 1u);
    EXPECT_EQ(ledger.insufficient_capital_steps()[0], 3u);
}

TEST_F(LedgerTest, AmountScalesPnlAndCommission) {
    LedgerParams p = params(0.001);
    p.amount = 2.0;
    Ledger ledger(p);

    ASSERT_TRUE(ledger.apply(Decision::LONG, bar_at(50.0), 0).is_ok());
    ASSERT_TRUE(ledger.apply(Decision::CLOSE, bar_at(55.0, 1), 1).is_ok());
    EXPECT_NEAR(ledger.trades()[0].gross_pnl, 1000.0, 1e-9);
    EXPECT_NEAR(ledger.trades()[0].commission, 21.0, 1e-9);
}
