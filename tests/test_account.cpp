#include <gtest/gtest.h>

#include "backtest/account.hpp"
#include "backtest/errors.hpp"

namespace {

double replayCash(double start, const std::vector<Trade>& ledger) {
    double cash = start;
    for (const auto& trade : ledger) {
        cash += trade.cashFlow();
    }
    return cash;
}

}  // namespace

TEST(AccountTest, BuyAllThenSellAll) {
    Account a(10000.0);

    a.buy(a.buyingPower(), 100.0);
    EXPECT_DOUBLE_EQ(a.position().quantity, 100.0);
    EXPECT_DOUBLE_EQ(a.cash(), 0.0);
    EXPECT_DOUBLE_EQ(a.position().averageEntryPrice, 100.0);

    a.sell(1.0, 110.0);
    EXPECT_DOUBLE_EQ(a.cash(), 11000.0);
    EXPECT_DOUBLE_EQ(a.position().quantity, 0.0);
    EXPECT_DOUBLE_EQ(a.position().averageEntryPrice, 0.0);
    EXPECT_FALSE(a.hasPosition());
    EXPECT_DOUBLE_EQ(a.markToMarket(110.0) - 10000.0, 1000.0);
    EXPECT_DOUBLE_EQ(a.realizedPnl(), 1000.0);
}

TEST(AccountTest, CommissionOnBuy) {
    Account a(10000.0, 0.001);

    a.buy(1000.0, 50.0);
    ASSERT_EQ(a.ledger().size(), 1u);
    EXPECT_DOUBLE_EQ(a.ledger().front().commissionPaid, 1.0);
    EXPECT_DOUBLE_EQ(a.position().quantity, 19.98);
    EXPECT_DOUBLE_EQ(a.cash(), 9000.0);
    EXPECT_DOUBLE_EQ(a.totalCommission(), 1.0);
}

TEST(AccountTest, SellWithoutPositionLeavesAccountUnchanged) {
    Account a(5000.0);

    EXPECT_THROW(a.sell(1.0, 10.0), NoPosition);
    EXPECT_DOUBLE_EQ(a.cash(), 5000.0);
    EXPECT_TRUE(a.ledger().empty());
    EXPECT_FALSE(a.hasPosition());
}

TEST(AccountTest, InvalidOrders) {
    Account a(1000.0);
    EXPECT_THROW(a.buy(2000.0, 10.0), InsufficientFunds);
    EXPECT_THROW(a.buy(-500.0, 10.0), InvalidOrder);
    EXPECT_THROW(a.buy(0.0, 10.0), InvalidOrder);
    EXPECT_THROW(a.buy(500.0, -10.0), InvalidOrder);
    EXPECT_THROW(a.buy(500.0, 0.0), InvalidOrder);

    // Enter valid position
    a.buy(250.0, 10.0);
    EXPECT_THROW(a.sell(0.5, -20.0), InvalidOrder);
    EXPECT_THROW(a.sell(1.01, 20.0), InvalidOrder);
    EXPECT_THROW(a.sell(-0.5, 20.0), InvalidOrder);
    EXPECT_THROW(a.sell(0.0, 20.0), InvalidOrder);

    EXPECT_EQ(a.ledger().size(), 1u);
    EXPECT_DOUBLE_EQ(a.cash(), 750.0);
    EXPECT_DOUBLE_EQ(a.position().quantity, 25.0);
}

TEST(AccountTest, OrderErrorsShareABaseClass) {
    Account a(100.0);
    EXPECT_THROW(a.buy(200.0, 1.0), OrderError);
    EXPECT_THROW(a.sell(1.0, 1.0), OrderError);
    EXPECT_THROW(a.buy(200.0, 1.0), BacktestError);
}

TEST(AccountTest, RejectsBadConstructorArguments) {
    EXPECT_THROW(Account(-1.0), InvalidOrder);
    EXPECT_THROW(Account(100.0, 1.0), InvalidOrder);
    EXPECT_THROW(Account(100.0, -0.1), InvalidOrder);
    EXPECT_NO_THROW(Account(0.0));
}

TEST(AccountTest, WinAndLoseOnALong) {
    Account a(1000.0);

    // Win on a long
    a.buy(500.0, 10.0);
    a.buy(500.0, 10.0);
    EXPECT_DOUBLE_EQ(a.buyingPower(), 0.0);
    EXPECT_DOUBLE_EQ(a.markToMarket(10.0), 1000.0);

    a.sell(0.5, 20.0);
    EXPECT_DOUBLE_EQ(a.buyingPower(), 1000.0);
    EXPECT_DOUBLE_EQ(a.markToMarket(20.0), 2000.0);

    a.sell(1.0, 20.0);
    EXPECT_DOUBLE_EQ(a.buyingPower(), 2000.0);

    // Lose on a long
    a.buy(1000.0, 50.0);
    a.sell(0.5, 25.0);
    EXPECT_DOUBLE_EQ(a.buyingPower(), 1250.0);
    EXPECT_DOUBLE_EQ(a.markToMarket(25.0), 1500.0);
}

TEST(AccountTest, TinyPrices) {
    Account a(2.0);
    a.buy(1.0, 0.00000001);
    EXPECT_NEAR(a.markToMarket(0.00000002), 3.0, 1e-9);
    a.sell(1.0, 0.00000002);
    EXPECT_NEAR(a.buyingPower(), 3.0, 1e-9);
    EXPECT_FALSE(a.hasPosition());
}

TEST(AccountTest, CommissionOnBothSides) {
    Account a(1000.0, 0.01);

    a.buy(100.0, 20.0);
    EXPECT_DOUBLE_EQ(a.buyingPower(), 900.0);
    EXPECT_NEAR(a.position().quantity, 4.95, 1e-12);
    EXPECT_NEAR(a.markToMarket(25.0), 1023.75, 1e-9);

    a.sell(0.5, 30.0);
    EXPECT_NEAR(a.buyingPower(), 973.5075, 1e-9);
    EXPECT_NEAR(a.ledger().back().commissionPaid, 0.7425, 1e-12);

    a.sell(1.0, 50.0);
    EXPECT_NEAR(a.buyingPower(), 973.5075 + 2.475 * 50.0 * 0.99, 1e-9);
    EXPECT_FALSE(a.hasPosition());
    EXPECT_NEAR(a.totalCommission(), 1.0 + 0.7425 + 1.2375, 1e-12);
}

TEST(AccountTest, AverageEntryPriceIsWeighted) {
    Account a(3000.0);
    a.buy(1000.0, 10.0);  // 100 units
    a.buy(2000.0, 20.0);  // 100 units
    EXPECT_DOUBLE_EQ(a.position().quantity, 200.0);
    EXPECT_DOUBLE_EQ(a.position().averageEntryPrice, 15.0);

    // A partial sell keeps the average.
    a.sell(0.25, 30.0);
    EXPECT_DOUBLE_EQ(a.position().averageEntryPrice, 15.0);
    EXPECT_DOUBLE_EQ(a.realizedPnl(), 50.0 * 15.0);
}

TEST(AccountTest, CashMatchesLedgerReplayExactly) {
    Account a(10000.0, 0.0025);
    a.buy(3333.33, 101.7);
    a.buy(1234.56, 99.1);
    a.sell(0.37, 104.2);
    a.buy(777.77, 98.3);
    a.sell(0.5, 97.0);
    a.sell(1.0, 110.9);

    // Same additions in the same order: bit-exact.
    EXPECT_EQ(replayCash(a.initialCapital(), a.ledger()), a.cash());
    EXPECT_GE(a.cash(), 0.0);
    EXPECT_GE(a.position().quantity, 0.0);
}

TEST(AccountTest, CashConservation) {
    Account a(10000.0, 0.001);
    a.buy(4000.0, 50.0);
    a.sell(0.3, 55.0);
    a.buy(2500.0, 52.5);
    a.sell(0.6, 48.0);

    const double held = a.position().quantity * a.position().averageEntryPrice;
    EXPECT_NEAR(a.cash() + held, a.initialCapital() - a.totalCommission() + a.realizedPnl(), 1e-9);
}

TEST(AccountTest, RealizedPnlExcludesCommission) {
    Account a(10000.0, 0.001);
    a.buy(1000.0, 50.0);  // 19.98 units, commission 1.0
    a.sell(1.0, 60.0);    // commission 19.98 * 60 * 0.001

    EXPECT_NEAR(a.realizedPnl(), 19.98 * 10.0, 1e-9);
    EXPECT_NEAR(a.totalCommission(), 1.0 + 1.1988, 1e-9);
    EXPECT_NEAR(a.cash(), a.initialCapital() - a.totalCommission() + a.realizedPnl(), 1e-9);
}

TEST(AccountTest, NeverSpendsMoreThanCash) {
    Account a(100.0);
    a.buy(100.0, 3.0);
    EXPECT_DOUBLE_EQ(a.cash(), 0.0);
    EXPECT_THROW(a.buy(0.01, 3.0), InsufficientFunds);
    EXPECT_DOUBLE_EQ(a.cash(), 0.0);
}

TEST(AccountTest, ClosedPositionsAreRecorded) {
    Account a(1000.0);
    a.buy(1000.0, 10.0);
    a.sell(0.5, 12.0);
    EXPECT_TRUE(a.closedPositions().empty());

    a.sell(1.0, 11.0);
    ASSERT_EQ(a.closedPositions().size(), 1u);
    EXPECT_DOUBLE_EQ(a.closedPositions().front().averageEntryPrice, 10.0);
}

TEST(AccountTest, TradeRecordsAreComplete) {
    Account a(1000.0, 0.01);
    a.buy(500.0, 25.0, 20.0);

    const auto& trade = a.ledger().front();
    EXPECT_EQ(trade.side, TradeSide::BUY);
    EXPECT_DOUBLE_EQ(trade.price, 25.0);
    EXPECT_DOUBLE_EQ(trade.quantity, 500.0 * 0.99 / 25.0);
    EXPECT_DOUBLE_EQ(trade.commissionPaid, 5.0);
    EXPECT_DOUBLE_EQ(trade.cashFlow(), -500.0);
    EXPECT_DOUBLE_EQ(trade.stopPrice, 20.0);
    EXPECT_EQ(toString(trade.side), "BUY");
}

TEST(AccountStopTest, StopPriceValidation) {
    Account a(1000.0);
    EXPECT_THROW(a.buy(100.0, 10.0, 10.0), InvalidOrder);
    EXPECT_THROW(a.buy(100.0, 10.0, 12.0), InvalidOrder);
    EXPECT_THROW(a.buy(100.0, 10.0, -1.0), InvalidOrder);
    EXPECT_TRUE(a.ledger().empty());
}

TEST(AccountStopTest, HighestStopWins) {
    Account a(1000.0);
    a.buy(100.0, 10.0, 9.0);
    a.buy(100.0, 10.0, 9.5);
    a.buy(100.0, 10.0);
    EXPECT_DOUBLE_EQ(a.position().stopPrice, 9.5);

    a.sell(1.0, 10.0);
    EXPECT_DOUBLE_EQ(a.position().stopPrice, 0.0);
}

TEST(AccountStopTest, StopFillPrice) {
    Account a(1000.0);
    EXPECT_FALSE(a.stopFillPrice(Bar{0, 10, 10, 1, 10, 0}).has_value());

    a.buy(1000.0, 100.0, 95.0);
    // Low stays above the stop.
    EXPECT_FALSE(a.stopFillPrice(Bar{0, 99, 101, 96, 100, 0}).has_value());
    // Touches the stop intrabar.
    EXPECT_EQ(a.stopFillPrice(Bar{0, 97, 98, 94, 96, 0}), std::optional<double>(95.0));
    // Gaps below the stop: fill at the open.
    EXPECT_EQ(a.stopFillPrice(Bar{0, 90, 92, 88, 91, 0}), std::optional<double>(90.0));
}
