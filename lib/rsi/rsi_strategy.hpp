#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "strategy/istrategy.hpp"

/**
 * @brief RSI (Relative Strength Index) strategy.
 *
 * Buys when RSI drops below the oversold threshold (default: 30) and sells
 * when RSI rises above the overbought threshold (default: 70).
 */
class RsiStrategy: public IStrategy {
   public:
    /**
     * @param period     RSI lookback period (default: 14 bars).
     * @param oversold   RSI threshold for BUY signal (default: 30).
     * @param overbought RSI threshold for SELL signal (default: 70).
     * @param allocation Fraction of buying power committed per entry (default: 1.0).
     */
    explicit RsiStrategy(std::size_t period = 14, double oversold = 30.0, double overbought = 70.0,
                         double allocation = 1.0);

    [[nodiscard]] std::string name() const override;

    [[nodiscard]] std::vector<IndicatorRegistration> setup() override;

    void logic(Account& account, const LookbackView<Bar>& lookback) override;

   private:
    std::size_t period_;
    double      oversold_;
    double      overbought_;
    double      allocation_;
};
