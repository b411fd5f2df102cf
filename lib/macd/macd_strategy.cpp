#include "macd_strategy.hpp"

#include <cmath>
#include <stdexcept>

#include "strategy/indicator_registrations.hpp"

MacdStrategy::MacdStrategy(std::size_t fast, std::size_t slow, std::size_t signal, std::size_t trend)
    : fast_(fast)
    , slow_(slow)
    , signal_(signal)
    , trend_(trend) {
    if (fast_ == 0 || fast_ >= slow_ || signal_ == 0 || trend_ == 0) {
        throw std::invalid_argument("MacdStrategy requires 0 < fast < slow, signal > 0 and trend > 0");
    }
}

std::string MacdStrategy::name() const {
    return "MACD (" + std::to_string(fast_) + "/" + std::to_string(slow_) + "/" + std::to_string(signal_) + ", trend "
         + std::to_string(trend_) + ")";
}

std::vector<IndicatorRegistration> MacdStrategy::setup() {
    return {
        registration::macd("macd", fast_, slow_, signal_, "teal"),
        registration::ema("trend", trend_, "gray"),
    };
}

void MacdStrategy::logic(Account& account, const LookbackView<Bar>& lookback) {
    const auto& macd = indicator("macd");

    const auto line   = macd.lookback("macd", 2);
    const auto signal = macd.lookback("signal", 2);
    if (signal.size() < 2 || std::isnan(signal.ago(1))) {
        return;
    }

    const bool crossedUp   = line.ago(1) <= signal.ago(1) && line.ago(0) > signal.ago(0);
    const bool crossedDown = line.ago(1) >= signal.ago(1) && line.ago(0) < signal.ago(0);

    const double close = lookback.back().close;
    const double trend = indicator("trend").value();

    if (crossedUp && !std::isnan(trend) && close > trend && !account.hasPosition() && account.buyingPower() > 0.0) {
        account.buy(account.buyingPower(), close);
        return;
    }

    if (crossedDown && account.hasPosition()) {
        // Scale out: half on the first bearish cross, everything on the next.
        const bool halfSold = !account.ledger().empty() && account.ledger().back().side == TradeSide::SELL;
        account.sell(halfSold ? 1.0 : 0.5, close);
    }
}
