#include "sma_crossover.hpp"

#include <cmath>
#include <stdexcept>

#include "strategy/indicator_registrations.hpp"

SmaCrossover::SmaCrossover(std::size_t shortWindow, std::size_t longWindow, double stopLoss)
    : shortWindow_(shortWindow)
    , longWindow_(longWindow)
    , stopLoss_(stopLoss) {
    if (shortWindow_ == 0 || shortWindow_ >= longWindow_) {
        throw std::invalid_argument("SmaCrossover requires 0 < shortWindow < longWindow");
    }
    if (stopLoss_ < 0.0 || stopLoss_ >= 1.0) {
        throw std::invalid_argument("SmaCrossover stopLoss must be in [0, 1)");
    }
}

std::string SmaCrossover::name() const {
    return "SMA Crossover (" + std::to_string(shortWindow_) + "/" + std::to_string(longWindow_) + ")";
}

std::vector<IndicatorRegistration> SmaCrossover::setup() {
    return {
        registration::sma("sma_short", shortWindow_, "orange"),
        registration::sma("sma_long", longWindow_, "blue"),
    };
}

void SmaCrossover::logic(Account& account, const LookbackView<Bar>& lookback) {
    const auto shortSma = indicator("sma_short").lookback("sma", 2);
    const auto longSma  = indicator("sma_long").lookback("sma", 2);

    // Need at least 2 points for crossover detection
    if (shortSma.size() < 2 || std::isnan(longSma.ago(1))) {
        return;
    }

    const double prevShort = shortSma.ago(1);
    const double prevLong  = longSma.ago(1);
    const double currShort = shortSma.ago(0);
    const double currLong  = longSma.ago(0);

    const double close = lookback.back().close;

    // Golden cross: short SMA crosses above long SMA
    if (prevShort <= prevLong && currShort > currLong && !account.hasPosition() && account.buyingPower() > 0.0) {
        const double stop = (stopLoss_ > 0.0) ? close * (1.0 - stopLoss_) : 0.0;
        account.buy(account.buyingPower(), close, stop);
        return;
    }

    // Death cross: short SMA crosses below long SMA
    if (prevShort >= prevLong && currShort < currLong && account.hasPosition()) {
        account.sell(1.0, close);
    }
}
