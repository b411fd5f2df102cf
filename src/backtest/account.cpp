#include "backtest/account.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>

#include "backtest/errors.hpp"
#include "time_utils.hpp"

std::string toString(TradeSide side) {
    switch (side) {
    case TradeSide::BUY:
        return "BUY";
    case TradeSide::SELL:
        return "SELL";
    }
    return "UNKNOWN";
}

Account::Account(double initialCapital, double commission, bool verbose)
    : initialCapital_(initialCapital)
    , commission_(commission)
    , verbose_(verbose)
    , cash_(initialCapital) {
    if (!std::isfinite(initialCapital) || initialCapital < 0.0) {
        throw InvalidOrder("initial capital must be >= 0");
    }
    if (!std::isfinite(commission) || commission < 0.0 || commission >= 1.0) {
        throw InvalidOrder("commission rate must be in [0, 1)");
    }
}

void Account::buy(double entryCapital, double entryPrice, double stopPrice) {
    checkNotFrozen();

    if (!std::isfinite(entryCapital) || entryCapital <= 0.0) {
        throw InvalidOrder("entry capital must be positive");
    }
    if (!std::isfinite(entryPrice) || entryPrice <= 0.0) {
        throw InvalidOrder("entry price must be positive");
    }
    if (!std::isfinite(stopPrice) || stopPrice < 0.0 || (stopPrice > 0.0 && stopPrice >= entryPrice)) {
        throw InvalidOrder("stop price must be in (0, entry price) or 0 for none");
    }
    if (entryCapital > cash_) {
        throw InsufficientFunds("not enough buying power: requested " + std::to_string(entryCapital) + ", available "
                                + std::to_string(cash_));
    }

    Trade trade;
    trade.timestamp      = now_;
    trade.side           = TradeSide::BUY;
    trade.quantity       = entryCapital * (1.0 - commission_) / entryPrice;
    trade.price          = entryPrice;
    trade.commissionPaid = entryCapital * commission_;
    trade.cashAmount     = entryCapital;
    trade.stopPrice      = stopPrice;

    const double newQuantity = position_.quantity + trade.quantity;
    if (position_.flat()) {
        position_.entryTimestamp    = now_;
        position_.averageEntryPrice = entryPrice;
    } else {
        position_.averageEntryPrice =
            (position_.quantity * position_.averageEntryPrice + trade.quantity * entryPrice) / newQuantity;
    }
    position_.quantity  = newQuantity;
    position_.stopPrice = std::max(position_.stopPrice, stopPrice);

    cash_ += trade.cashFlow();
    totalCommission_ += trade.commissionPaid;

    ledger_.push_back(trade);
    logFill(trade);
}

void Account::sell(double percent, double currentPrice) {
    checkNotFrozen();

    if (!std::isfinite(percent) || percent <= 0.0 || percent > 1.0) {
        throw InvalidOrder("percent must be in (0, 1]");
    }
    if (!std::isfinite(currentPrice) || currentPrice <= 0.0) {
        throw InvalidOrder("current price must be positive");
    }
    if (position_.flat()) {
        throw NoPosition("no active position, cannot sell");
    }

    const double before   = position_.quantity;
    const double quantity = (percent == 1.0) ? before : before * percent;
    const double proceeds = quantity * currentPrice;

    Trade trade;
    trade.timestamp      = now_;
    trade.side           = TradeSide::SELL;
    trade.quantity       = quantity;
    trade.price          = currentPrice;
    trade.commissionPaid = proceeds * commission_;
    trade.cashAmount     = proceeds * (1.0 - commission_);

    realizedPnl_ += quantity * (currentPrice - position_.averageEntryPrice);
    totalCommission_ += trade.commissionPaid;
    cash_ += trade.cashFlow();

    const double remaining = before - quantity;
    if (remaining <= before * kDustFraction) {
        closedPositions_.push_back({position_.entryTimestamp, now_, position_.averageEntryPrice});
        position_ = Position{};
    } else {
        position_.quantity = remaining;
    }

    ledger_.push_back(trade);
    logFill(trade);
}

double Account::markToMarket(double currentPrice) const noexcept {
    return cash_ + position_.quantity * currentPrice;
}

std::optional<double> Account::stopFillPrice(const Bar& bar) const noexcept {
    if (position_.flat() || position_.stopPrice <= 0.0 || bar.low > position_.stopPrice) {
        return std::nullopt;
    }
    return std::min(position_.stopPrice, bar.open);
}

void Account::checkNotFrozen() const {
    if (frozen_) {
        throw InvalidOrder("account is frozen, the backtest has finished");
    }
}

void Account::logFill(const Trade& trade) const {
    if (!verbose_) {
        return;
    }

    // clang-format off
    std::clog << std::string(60, '-') << "\n"
        << formatTime(trade.timestamp, "%Y-%m-%d %H:%M:%S") << " | " << toString(trade.side) << " ORDER" << "\n"
        << std::fixed << std::setprecision(6)
        << "  units = " << trade.quantity
        << " | price = " << trade.price
        << " | commission = " << trade.commissionPaid << "\n"
        << std::string(60, '-')
        << std::endl;
    // clang-format on
}
