#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "backtest/bar.hpp"
#include "backtest/bar_series.hpp"
#include "strategy/istrategy.hpp"

namespace testing_util {

// 2021-01-01 00:00:00 UTC
inline constexpr int64_t kDay0 = 1609459200;
inline constexpr int64_t kDay  = 86400;

inline Bar flatBar(int64_t timestamp, double price) {
    return Bar{timestamp, price, price, price, price, 1000.0};
}

/**
 * @brief One daily bar per close, open = previous close, wicks 1% beyond the body.
 */
inline std::vector<Bar> makeBars(const std::vector<double>& closes, int64_t start = kDay0, int64_t step = kDay) {
    std::vector<Bar> bars;
    bars.reserve(closes.size());
    for (std::size_t i = 0; i < closes.size(); ++i) {
        const double open  = (i == 0) ? closes[0] : closes[i - 1];
        const double close = closes[i];
        Bar          bar;
        bar.timestamp = start + static_cast<int64_t>(i) * step;
        bar.open      = open;
        bar.close     = close;
        bar.high      = std::max(open, close) * 1.01;
        bar.low       = std::min(open, close) * 0.99;
        bar.volume    = 1000.0 + static_cast<double>(i);
        bars.push_back(bar);
    }
    return bars;
}

inline BarSeries makeSeries(const std::vector<double>& closes, const std::string& symbol = "TEST") {
    return BarSeries(makeBars(closes), symbol, kDay);
}

/**
 * @brief Strategy whose logic is a test-supplied callback.
 */
class ScriptedStrategy: public IStrategy {
   public:
    using Logic = std::function<void(ScriptedStrategy&, Account&, const LookbackView<Bar>&)>;

    explicit ScriptedStrategy(Logic logic, std::vector<IndicatorRegistration> registrations = {})
        : logic_(std::move(logic))
        , registrations_(std::move(registrations)) {}

    std::string name() const override { return "Scripted"; }

    std::vector<IndicatorRegistration> setup() override {
        ++setupCalls;
        return registrations_;
    }

    void logic(Account& account, const LookbackView<Bar>& lookback) override {
        ++logicCalls;
        logic_(*this, account, lookback);
    }

    const IndicatorAdapter& ind(const std::string& name) const { return indicator(name); }

    std::size_t setupCalls = 0;
    std::size_t logicCalls = 0;

   private:
    Logic                              logic_;
    std::vector<IndicatorRegistration> registrations_;
};

}  // namespace testing_util
