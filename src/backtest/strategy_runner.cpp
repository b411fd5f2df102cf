#include "backtest/strategy_runner.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>

#include "backtest/errors.hpp"
#include "chart/chart_sink.hpp"
#include "time_utils.hpp"

std::string toString(RunState state) {
    switch (state) {
    case RunState::NOT_STARTED:
        return "NOT_STARTED";
    case RunState::RUNNING:
        return "RUNNING";
    case RunState::COMPLETE:
        return "COMPLETE";
    case RunState::FAILED:
        return "FAILED";
    case RunState::CANCELLED:
        return "CANCELLED";
    }
    return "UNKNOWN";
}

StrategyRunner::StrategyRunner(const BarSeries& series, IStrategy& strategy)
    : series_(series)
    , strategy_(strategy) {}

Report StrategyRunner::backtest(int64_t startDate, std::optional<int64_t> endDate, double commission,
                                bool showTrades) {
    BacktestConfig config;
    config.startDate  = startDate;
    config.endDate    = endDate;
    config.commission = commission;
    config.showTrades = showTrades;
    return backtest(config);
}

Report StrategyRunner::backtest(const BacktestConfig& config) {
    if (state_ != RunState::NOT_STARTED) {
        throw std::logic_error("StrategyRunner performs a single run (state: " + toString(state_) + ")");
    }

    Window window;
    try {
        config.validate();
        window   = resolveWindow(config);
        account_ = std::make_unique<Account>(config.initialCapital, config.commission, config.verbose);
        registerIndicators();
    } catch (...) {
        state_ = RunState::FAILED;
        throw;
    }

    if (!config.quiet) {
        // clang-format off
        std::clog << "Performing backtest from "
                  << formatTime(series_.barAt(window.first).timestamp, "%Y-%m-%d %H:%M:%S") << " to "
                  << formatTime(series_.barAt(window.last).timestamp, "%Y-%m-%d %H:%M:%S")
                  << " (" << (window.last - window.first + 1) << " bars) with " << strategy_.name()
                  << std::endl;
        // clang-format on
    }

    strategy_.indicators_ = &indicators_;
    state_                = RunState::RUNNING;

    std::optional<std::size_t> lastProcessed;
    std::size_t                skipped = 0;
    for (std::size_t i = window.first; i <= window.last; ++i) {
        if (cancellation_ && cancellation_->cancelled()) {
            state_ = RunState::CANCELLED;
            if (!config.quiet) {
                std::clog << "[INFO] Backtest cancelled before bar " << i << " ("
                          << formatTime(series_.barAt(i).timestamp, "%Y-%m-%d %H:%M:%S") << ")" << std::endl;
            }
            break;
        }

        if (!step(i, config)) {
            ++skipped;
        }
        lastProcessed = i;
    }

    if (state_ == RunState::RUNNING) {
        state_ = RunState::COMPLETE;
    }
    account_->freeze();
    strategy_.indicators_ = nullptr;

    if (skipped > 0) {
        std::cerr << "[WARN] " << skipped << " bars skipped on order errors" << std::endl;
    }

    // A run cancelled before its first bar reports the untouched account over the first bar.
    const std::size_t reportEnd = lastProcessed.value_or(window.first);

    Report report = PerformanceReporter::compute(series_, account_->ledger(), config.initialCapital,
                                                 series_.barAt(window.first).timestamp,
                                                 series_.barAt(reportEnd).timestamp);
    report.strategyName = strategy_.name();
    report.cancelled    = (state_ == RunState::CANCELLED);

    if (config.showTrades && sink_ != nullptr) {
        sink_->render(series_, indicators_, *account_, report);
    }

    return report;
}

StrategyRunner::Window StrategyRunner::resolveWindow(const BacktestConfig& config) const {
    if (series_.empty()) {
        throw DateOutOfRange("bar series is empty");
    }

    const std::size_t n = series_.length();

    std::optional<std::size_t> first;
    if (config.startDate) {
        first = series_.indexAtOrAfter(*config.startDate);
        if (!first) {
            throw DateOutOfRange("no bar at or after " + formatTime(*config.startDate, "%Y-%m-%d %H:%M:%S"));
        }
    } else if (config.relativeLookbackSize > 0 && config.relativeLookbackSize < n) {
        first = n - config.relativeLookbackSize;
    } else {
        first = 0;
    }

    std::optional<std::size_t> last = n - 1;
    if (config.endDate) {
        last = series_.indexAtOrBefore(*config.endDate);
    }

    if (!last || *first > *last) {
        throw DateOutOfRange("backtest window is empty");
    }

    return {*first, *last};
}

void StrategyRunner::registerIndicators() {
    // Series attached before the run come first.
    for (const auto& attached : series_.indicators()) {
        indicators_.add(IndicatorAdapter(std::make_shared<const IndicatorSeries>(attached)));
    }

    auto registrations = strategy_.setup();
    if (registrations.empty()) {
        return;
    }

    const PriceColumns prices = series_.columns();
    for (auto& reg : registrations) {
        if (!reg.compute) {
            throw std::invalid_argument("indicator '" + reg.name + "' has no compute function");
        }

        IndicatorSeries computed(reg.name, reg.compute(prices, reg.params));
        series_.checkAlignment(computed);

        indicators_.add(IndicatorAdapter(std::make_shared<const IndicatorSeries>(std::move(computed)), reg.plotStyle,
                                         std::move(reg.color)));
    }
}

bool StrategyRunner::step(std::size_t i, const BacktestConfig& config) {
    cursor_        = i;
    const Bar& bar = series_.barAt(i);
    account_->setClock(bar.timestamp);

    // Protective stop fills before the strategy sees the bar.
    if (const auto fill = account_->stopFillPrice(bar); fill && *fill > 0.0) {
        if (config.verbose) {
            std::clog << "[INFO] Stop hit at " << *fill << " on "
                      << formatTime(bar.timestamp, "%Y-%m-%d %H:%M:%S") << std::endl;
        }
        account_->sell(1.0, *fill);
    }

    indicators_.syncTo(i);
    const auto lookback = series_.lookback(i, config.lookbackWindow);

    try {
        strategy_.logic(*account_, lookback);
    } catch (const OrderError& e) {
        if (config.orderErrorPolicy != OrderErrorPolicy::SKIP_BAR) {
            fail(i, e.what());
        }
        std::cerr << "[WARN] Skipping bar " << i << " ("
                  << formatTime(bar.timestamp, "%Y-%m-%d %H:%M:%S") << "): " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        fail(i, e.what());
    } catch (...) {
        fail(i, "unknown error");
    }

    return true;
}

void StrategyRunner::fail(std::size_t i, const std::string& what) {
    state_ = RunState::FAILED;
    account_->freeze();
    strategy_.indicators_ = nullptr;

    std::cerr << "[ERROR] " << strategy_.name() << " failed at bar " << i << ": " << what << std::endl;

    // Called from inside a handler; the active exception becomes the nested cause.
    std::throw_with_nested(StrategyLogicError(what, i, series_.barAt(i).timestamp));
}
