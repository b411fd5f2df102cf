#include "backtest/bar_series.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

#include "backtest/errors.hpp"

namespace {

void validateBar(const Bar& bar, std::size_t index) {
    if (!std::isfinite(bar.open) || !std::isfinite(bar.high) || !std::isfinite(bar.low) || !std::isfinite(bar.close)
        || !std::isfinite(bar.volume)) {
        throw InvalidBarData("non-finite price or volume", index);
    }
    if (bar.low > std::min(bar.open, bar.close) || std::max(bar.open, bar.close) > bar.high) {
        throw InvalidBarData("violates low <= min(open, close) <= max(open, close) <= high", index);
    }
    if (bar.volume < 0.0) {
        throw InvalidBarData("negative volume", index);
    }
}

}  // namespace

BarSeries::BarSeries(std::vector<Bar> bars, std::string symbol, int64_t interval)
    : bars_(std::move(bars))
    , symbol_(std::move(symbol))
    , interval_(interval) {
    if (interval_ < 0) {
        throw InvalidBarData("negative interval", 0);
    }

    for (std::size_t i = 0; i < bars_.size(); ++i) {
        validateBar(bars_[i], i);

        if (i == 0) {
            continue;
        }
        if (bars_[i].timestamp <= bars_[i - 1].timestamp) {
            throw InvalidBarData("timestamp " + std::to_string(bars_[i].timestamp) + " does not follow "
                                     + std::to_string(bars_[i - 1].timestamp),
                                 i);
        }
        if (interval_ > 0 && bars_[i].timestamp - bars_[i - 1].timestamp > interval_) {
            ++gapCount_;
        }
    }

    if (gapCount_ > 0) {
        std::clog << "[WARN] " << (symbol_.empty() ? "series" : symbol_) << ": " << gapCount_
                  << " gap(s) wider than " << interval_ << "s" << std::endl;
    }
}

const Bar& BarSeries::barAt(std::size_t i) const {
    if (i >= bars_.size()) {
        throw IndexOutOfRange(i, bars_.size());
    }
    return bars_[i];
}

LookbackView<Bar> BarSeries::lookback(std::size_t i, std::size_t window) const {
    if (i >= bars_.size()) {
        throw IndexOutOfRange(i, bars_.size());
    }

    const std::size_t available = i + 1;
    const std::size_t count     = (window == 0) ? available : std::min(window, available);
    return LookbackView<Bar>(bars_.data() + (available - count), count);
}

std::optional<std::size_t> BarSeries::indexAtOrAfter(int64_t timestamp) const {
    const auto it = std::lower_bound(bars_.begin(), bars_.end(), timestamp,
                                     [](const Bar& bar, int64_t ts) { return bar.timestamp < ts; });
    if (it == bars_.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(it - bars_.begin());
}

std::optional<std::size_t> BarSeries::indexAtOrBefore(int64_t timestamp) const {
    const auto it = std::upper_bound(bars_.begin(), bars_.end(), timestamp,
                                     [](int64_t ts, const Bar& bar) { return ts < bar.timestamp; });
    if (it == bars_.begin()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(it - bars_.begin()) - 1;
}

std::optional<std::size_t> BarSeries::indexOf(int64_t timestamp) const {
    const auto idx = indexAtOrAfter(timestamp);
    if (idx && bars_[*idx].timestamp == timestamp) {
        return idx;
    }
    return std::nullopt;
}

PriceColumns BarSeries::columns() const {
    PriceColumns cols;
    cols.timestamps.reserve(bars_.size());
    cols.open.reserve(bars_.size());
    cols.high.reserve(bars_.size());
    cols.low.reserve(bars_.size());
    cols.close.reserve(bars_.size());
    cols.volume.reserve(bars_.size());

    for (const auto& bar : bars_) {
        cols.timestamps.push_back(bar.timestamp);
        cols.open.push_back(bar.open);
        cols.high.push_back(bar.high);
        cols.low.push_back(bar.low);
        cols.close.push_back(bar.close);
        cols.volume.push_back(bar.volume);
    }
    return cols;
}

BarSeries BarSeries::resampled(int64_t interval) const {
    if (interval <= 0) {
        throw InvalidBarData("resample interval must be positive", 0);
    }

    std::vector<Bar> out;
    for (const auto& bar : bars_) {
        // floor division, valid for pre-epoch timestamps too
        int64_t bucket = bar.timestamp / interval;
        if (bar.timestamp % interval != 0 && bar.timestamp < 0) {
            --bucket;
        }
        const int64_t bucketStart = bucket * interval;

        if (out.empty() || out.back().timestamp != bucketStart) {
            Bar agg       = bar;
            agg.timestamp = bucketStart;
            out.push_back(agg);
            continue;
        }

        auto& agg  = out.back();
        agg.high   = std::max(agg.high, bar.high);
        agg.low    = std::min(agg.low, bar.low);
        agg.close  = bar.close;
        agg.volume += bar.volume;
    }

    return BarSeries(std::move(out), symbol_, interval);
}

void BarSeries::attach(IndicatorSeries series) {
    checkAlignment(series);
    if (findIndicator(series.name()) != nullptr) {
        throw AlignmentError("indicator '" + series.name() + "' is already attached");
    }
    indicators_.push_back(std::move(series));
}

void BarSeries::checkAlignment(const IndicatorSeries& series) const {
    if (series.size() != bars_.size()) {
        throw AlignmentError("indicator '" + series.name() + "' has " + std::to_string(series.size())
                             + " rows, bar series has " + std::to_string(bars_.size()));
    }
}

const IndicatorSeries* BarSeries::findIndicator(const std::string& name) const {
    for (const auto& series : indicators_) {
        if (series.name() == name) {
            return &series;
        }
    }
    return nullptr;
}
