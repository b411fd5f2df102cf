#include "strategy/istrategy.hpp"

#include <stdexcept>

const IndicatorAdapter& IStrategy::indicator(const std::string& name) const {
    if (indicators_ == nullptr) {
        throw std::logic_error("indicator '" + name + "' requested outside of a backtest run");
    }
    return indicators_->at(name);
}
