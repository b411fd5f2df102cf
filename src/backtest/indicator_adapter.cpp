#include "backtest/indicator_adapter.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "backtest/errors.hpp"

IndicatorAdapter::IndicatorAdapter(std::shared_ptr<const IndicatorSeries> series, PlotStyle style, std::string color)
    : series_(std::move(series))
    , style_(style)
    , color_(std::move(color)) {
    if (!series_) {
        throw std::invalid_argument("IndicatorAdapter requires a series");
    }
}

void IndicatorAdapter::syncTo(std::size_t cursor) {
    if (cursor >= series_->size()) {
        throw IndexOutOfRange(cursor, series_->size());
    }
    cursor_ = cursor;
    synced_ = true;
}

LookbackView<double> IndicatorAdapter::lookback(std::size_t window) const {
    return this->window(series_->column(std::size_t{0}), cursor_, window);
}

LookbackView<double> IndicatorAdapter::lookback(const std::string& column, std::size_t window) const {
    return this->window(series_->column(column), cursor_, window);
}

LookbackView<double> IndicatorAdapter::lookback(const std::string& column, std::size_t i, std::size_t window) const {
    if (!synced_ || i > cursor_) {
        throw IndexOutOfRange(i, synced_ ? cursor_ + 1 : 0);
    }
    return this->window(series_->column(column), i, window);
}

double IndicatorAdapter::value(const std::string& column, std::size_t ago) const {
    return lookback(column, 0).ago(ago);
}

double IndicatorAdapter::value(std::size_t ago) const {
    return lookback(0).ago(ago);
}

LookbackView<double> IndicatorAdapter::window(const std::vector<double>& values, std::size_t end,
                                              std::size_t window) const {
    // Nothing is visible before the first sync.
    if (!synced_) {
        return {};
    }

    const std::size_t available = end + 1;
    const std::size_t count     = (window == 0) ? available : std::min(window, available);
    return LookbackView<double>(values.data() + (available - count), count);
}

void IndicatorSet::add(IndicatorAdapter adapter) {
    if (contains(adapter.name())) {
        throw AlignmentError("indicator '" + adapter.name() + "' is registered twice");
    }
    adapters_.push_back(std::move(adapter));
}

const IndicatorAdapter& IndicatorSet::at(const std::string& name) const {
    for (const auto& adapter : adapters_) {
        if (adapter.name() == name) {
            return adapter;
        }
    }
    throw std::out_of_range("no indicator named '" + name + "'");
}

bool IndicatorSet::contains(const std::string& name) const {
    return std::any_of(adapters_.begin(), adapters_.end(),
                       [&name](const IndicatorAdapter& adapter) { return adapter.name() == name; });
}

void IndicatorSet::syncTo(std::size_t cursor) {
    for (auto& adapter : adapters_) {
        adapter.syncTo(cursor);
    }
}
