#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "strategy/istrategy.hpp"

/**
 * @brief SMA Crossover strategy.
 *
 * Buys with all buying power when the short SMA crosses above the long SMA
 * (golden cross) and sells the whole position when it crosses below (death cross).
 */
class SmaCrossover: public IStrategy {
   public:
    /**
     * @param shortWindow Short-term SMA window (default: 20 bars).
     * @param longWindow  Long-term SMA window (default: 50 bars).
     * @param stopLoss    Protective stop as a fraction below the entry price; 0 disables it.
     */
    explicit SmaCrossover(std::size_t shortWindow = 20, std::size_t longWindow = 50, double stopLoss = 0.0);

    [[nodiscard]] std::string name() const override;

    [[nodiscard]] std::vector<IndicatorRegistration> setup() override;

    void logic(Account& account, const LookbackView<Bar>& lookback) override;

   private:
    std::size_t shortWindow_;
    std::size_t longWindow_;
    double      stopLoss_;
};
