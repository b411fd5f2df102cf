#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

#include "indicator.hpp"
#include "strategy/istrategy.hpp"

/**
 * @brief Ready-made registrations that route the indicator library through the
 *        registration interface. The parameters travel in the params map so the
 *        chart sink and reports can show them.
 */
namespace registration {

[[nodiscard]] inline std::size_t periodParam(const IndicatorParams& params, const std::string& key) {
    const auto it = params.find(key);
    if (it == params.end() || it->second < 1.0) {
        throw std::invalid_argument("indicator parameter '" + key + "' must be >= 1");
    }
    return static_cast<std::size_t>(it->second);
}

[[nodiscard]] inline IndicatorRegistration sma(const std::string& name, std::size_t period,
                                               const std::string& color = "") {
    IndicatorRegistration reg;
    reg.name    = name;
    reg.params  = {{"period", static_cast<double>(period)}};
    reg.compute = [](const PriceColumns& cols, const IndicatorParams& params) -> IndicatorColumns {
        return {{"sma", indicator::sma(cols.close, periodParam(params, "period"))}};
    };
    reg.plotStyle = PlotStyle::OVERLAY;
    reg.color     = color;
    return reg;
}

[[nodiscard]] inline IndicatorRegistration ema(const std::string& name, std::size_t period,
                                               const std::string& color = "") {
    IndicatorRegistration reg;
    reg.name    = name;
    reg.params  = {{"period", static_cast<double>(period)}};
    reg.compute = [](const PriceColumns& cols, const IndicatorParams& params) -> IndicatorColumns {
        return {{"ema", indicator::ema(cols.close, periodParam(params, "period"))}};
    };
    reg.plotStyle = PlotStyle::OVERLAY;
    reg.color     = color;
    return reg;
}

[[nodiscard]] inline IndicatorRegistration rsi(const std::string& name, std::size_t period,
                                               const std::string& color = "") {
    IndicatorRegistration reg;
    reg.name    = name;
    reg.params  = {{"period", static_cast<double>(period)}};
    reg.compute = [](const PriceColumns& cols, const IndicatorParams& params) -> IndicatorColumns {
        return {{"rsi", indicator::rsi(cols.close, periodParam(params, "period"))}};
    };
    reg.plotStyle = PlotStyle::SEPARATE_AXIS;
    reg.color     = color;
    return reg;
}

[[nodiscard]] inline IndicatorRegistration macd(const std::string& name, std::size_t fast, std::size_t slow,
                                                std::size_t signal, const std::string& color = "") {
    IndicatorRegistration reg;
    reg.name   = name;
    reg.params = {
        {"fast", static_cast<double>(fast)},
        {"slow", static_cast<double>(slow)},
        {"signal", static_cast<double>(signal)},
    };
    reg.compute = [](const PriceColumns& cols, const IndicatorParams& params) -> IndicatorColumns {
        auto out = indicator::macd(cols.close, periodParam(params, "fast"), periodParam(params, "slow"),
                                   periodParam(params, "signal"));
        return {
            {"macd", std::move(out.macd)},
            {"signal", std::move(out.signal)},
            {"histogram", std::move(out.histogram)},
        };
    };
    reg.plotStyle = PlotStyle::SEPARATE_AXIS;
    reg.color     = color;
    return reg;
}

[[nodiscard]] inline IndicatorRegistration bollinger(const std::string& name, std::size_t window, double k,
                                                     const std::string& color = "") {
    IndicatorRegistration reg;
    reg.name    = name;
    reg.params  = {{"window", static_cast<double>(window)}, {"k", k}};
    reg.compute = [](const PriceColumns& cols, const IndicatorParams& params) -> IndicatorColumns {
        auto out = indicator::bollinger(cols.close, periodParam(params, "window"), params.at("k"));
        return {
            {"upper", std::move(out.upper)},
            {"middle", std::move(out.middle)},
            {"lower", std::move(out.lower)},
        };
    };
    reg.plotStyle = PlotStyle::OVERLAY;
    reg.color     = color;
    return reg;
}

}  // namespace registration
