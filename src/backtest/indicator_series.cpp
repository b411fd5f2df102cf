#include "backtest/indicator_series.hpp"

#include <stdexcept>
#include <utility>

#include "backtest/errors.hpp"

IndicatorSeries::IndicatorSeries(std::string name, IndicatorColumns columns)
    : name_(std::move(name))
    , columns_(std::move(columns)) {
    if (columns_.empty()) {
        throw AlignmentError("indicator '" + name_ + "' has no output columns");
    }

    size_ = columns_.front().second.size();
    for (const auto& [columnName, values] : columns_) {
        if (values.size() != size_) {
            throw AlignmentError("indicator '" + name_ + "' column '" + columnName + "' has "
                                 + std::to_string(values.size()) + " values, expected " + std::to_string(size_));
        }
    }
}

std::vector<std::string> IndicatorSeries::columnNames() const {
    std::vector<std::string> names;
    names.reserve(columns_.size());
    for (const auto& entry : columns_) {
        names.push_back(entry.first);
    }
    return names;
}

bool IndicatorSeries::hasColumn(const std::string& column) const {
    for (const auto& entry : columns_) {
        if (entry.first == column) {
            return true;
        }
    }
    return false;
}

const std::vector<double>& IndicatorSeries::column(const std::string& column) const {
    for (const auto& entry : columns_) {
        if (entry.first == column) {
            return entry.second;
        }
    }
    throw std::out_of_range("indicator '" + name_ + "' has no column '" + column + "'");
}

const std::vector<double>& IndicatorSeries::column(std::size_t index) const {
    if (index >= columns_.size()) {
        throw IndexOutOfRange(index, columns_.size());
    }
    return columns_[index].second;
}
