#include "rsi_strategy.hpp"

#include <cmath>
#include <stdexcept>

#include "strategy/indicator_registrations.hpp"

RsiStrategy::RsiStrategy(std::size_t period, double oversold, double overbought, double allocation)
    : period_(period)
    , oversold_(oversold)
    , overbought_(overbought)
    , allocation_(allocation) {
    if (oversold_ >= overbought_) {
        throw std::invalid_argument("RsiStrategy requires oversold < overbought");
    }
    if (allocation_ <= 0.0 || allocation_ > 1.0) {
        throw std::invalid_argument("RsiStrategy allocation must be in (0, 1]");
    }
}

std::string RsiStrategy::name() const {
    return "RSI (" + std::to_string(period_) + ", " + std::to_string(static_cast<int>(oversold_)) + "/"
         + std::to_string(static_cast<int>(overbought_)) + ")";
}

std::vector<IndicatorRegistration> RsiStrategy::setup() {
    return {registration::rsi("rsi", period_, "purple")};
}

void RsiStrategy::logic(Account& account, const LookbackView<Bar>& lookback) {
    const double val = indicator("rsi").value();
    if (std::isnan(val)) {
        return;
    }

    const double close = lookback.back().close;

    // Oversold → BUY
    if (val <= oversold_ && !account.hasPosition()) {
        const double capital = account.buyingPower() * allocation_;
        if (capital > 0.0) {
            account.buy(capital, close);
        }
        return;
    }

    // Overbought → SELL
    if (val >= overbought_ && account.hasPosition()) {
        account.sell(1.0, close);
    }
}
