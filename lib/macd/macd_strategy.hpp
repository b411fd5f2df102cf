#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "strategy/istrategy.hpp"

/**
 * @brief MACD signal-line crossover.
 *
 * Buys when the MACD line crosses above its signal line while price is above
 * the slow EMA trend filter, sells half the position on the opposite cross
 * and the rest on the next one.
 */
class MacdStrategy: public IStrategy {
   public:
    explicit MacdStrategy(std::size_t fast = 12, std::size_t slow = 26, std::size_t signal = 9,
                          std::size_t trend = 100);

    [[nodiscard]] std::string name() const override;

    [[nodiscard]] std::vector<IndicatorRegistration> setup() override;

    void logic(Account& account, const LookbackView<Bar>& lookback) override;

   private:
    std::size_t fast_;
    std::size_t slow_;
    std::size_t signal_;
    std::size_t trend_;
};
