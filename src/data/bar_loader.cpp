#include "data/bar_loader.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <map>
#include <sstream>
#include <stdexcept>

#include "backtest/errors.hpp"
#include "time_utils.hpp"

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::vector<std::string> splitRow(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream        ss(line);
    std::string              field;
    while (std::getline(ss, field, ',')) {
        fields.push_back(trim(field));
    }
    return fields;
}

bool isInteger(const std::string& s) {
    if (s.empty()) {
        return false;
    }
    const std::size_t start = (s[0] == '-') ? 1 : 0;
    return start < s.size()
        && std::all_of(s.begin() + static_cast<long>(start), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

double parseNumber(const std::string& text, const char* column, std::size_t line) {
    try {
        std::size_t consumed = 0;
        const auto  value    = std::stod(text, &consumed);
        if (consumed != text.size()) {
            throw InvalidBarData("trailing characters in " + std::string(column) + ": '" + text + "'", line);
        }
        return value;
    } catch (const std::invalid_argument&) {
        throw InvalidBarData("invalid " + std::string(column) + ": '" + text + "'", line);
    } catch (const std::out_of_range&) {
        throw InvalidBarData(std::string(column) + " out of range: '" + text + "'", line);
    }
}

int64_t parseTimestampField(const std::string& text, std::size_t line) {
    if (isInteger(text)) {
        try {
            return std::stoll(text);
        } catch (const std::out_of_range&) {
            throw InvalidBarData("timestamp out of range: '" + text + "'", line);
        }
    }

    const auto parsed = parseTimestamp(text);
    if (!parsed) {
        throw InvalidBarData("invalid timestamp: '" + text + "'", line);
    }
    return *parsed;
}

}  // namespace

std::vector<Bar> BarLoader::fromChartJson(const nlohmann::json& document) {
    if (!document.is_object() || !document.contains("chart") || !document.at("chart").contains("result")) {
        throw InvalidBarData("chart document has no result", 0);
    }
    const auto& results = document.at("chart").at("result");
    if (!results.is_array() || results.empty() || !results.at(0).is_object()) {
        throw InvalidBarData("chart document has no result", 0);
    }

    const auto& result = results.at(0);
    if (!result.contains("timestamp") || !result.contains("indicators") || !result.at("indicators").contains("quote")) {
        // No trading activity in the requested range.
        return {};
    }

    const auto& timestamps = result.at("timestamp");
    const auto& quotes     = result.at("indicators").at("quote");
    if (!timestamps.is_array()) {
        throw InvalidBarData("chart timestamps are not an array", 0);
    }
    if (!quotes.is_array() || quotes.empty() || !quotes.at(0).is_object()) {
        throw InvalidBarData("chart document has no quote block", 0);
    }
    const auto& quote = quotes.at(0);

    for (const char* column : {"open", "high", "low", "close"}) {
        if (!quote.contains(column) || !quote.at(column).is_array() || quote.at(column).size() != timestamps.size()) {
            throw InvalidBarData(std::string("quote column '") + column + "' is missing or misaligned", 0);
        }
    }
    const bool hasVolume = quote.contains("volume") && quote.at("volume").is_array()
                           && quote.at("volume").size() == timestamps.size();

    const auto& open  = quote.at("open");
    const auto& high  = quote.at("high");
    const auto& low   = quote.at("low");
    const auto& close = quote.at("close");

    std::vector<Bar> bars;
    bars.reserve(timestamps.size());

    std::size_t skipped = 0;
    for (std::size_t i = 0; i < timestamps.size(); ++i) {
        if (timestamps[i].is_null() || open[i].is_null() || high[i].is_null() || low[i].is_null()
            || close[i].is_null()) {
            ++skipped;
            continue;
        }

        try {
            Bar bar;
            bar.timestamp = timestamps[i].get<int64_t>();
            bar.open      = open[i].get<double>();
            bar.high      = high[i].get<double>();
            bar.low       = low[i].get<double>();
            bar.close     = close[i].get<double>();
            if (hasVolume && !quote.at("volume")[i].is_null()) {
                bar.volume = quote.at("volume")[i].get<double>();
            }
            bars.push_back(bar);
        } catch (const nlohmann::json::type_error& e) {
            throw InvalidBarData(std::string("chart row has a non-numeric value: ") + e.what(), i);
        }
    }

    if (skipped > 0) {
        std::clog << "[WARN] Skipped " << skipped << " chart rows with missing values" << std::endl;
    }

    return bars;
}

std::optional<std::vector<Bar>> BarLoader::fromCsv(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "Error: Cannot open: " << path << std::endl;
        return std::nullopt;
    }

    std::string line;
    std::size_t lineNo = 0;

    // 1. Header
    std::map<std::string, std::size_t> columns;
    while (std::getline(f, line)) {
        ++lineNo;
        if (trim(line).empty()) {
            continue;
        }
        const auto header = splitRow(line);
        for (std::size_t i = 0; i < header.size(); ++i) {
            std::string name = header[i];
            std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return std::tolower(c); });
            columns[name] = i;
        }
        break;
    }

    if (columns.count("timestamp") == 0 && columns.count("date") != 0) {
        columns["timestamp"] = columns["date"];
    }
    for (const char* required : {"timestamp", "open", "high", "low", "close"}) {
        if (columns.count(required) == 0) {
            throw InvalidBarData(std::string("CSV header has no '") + required + "' column", lineNo);
        }
    }
    const bool hasVolume = columns.count("volume") != 0;

    // 2. Rows
    std::vector<Bar> bars;
    while (std::getline(f, line)) {
        ++lineNo;
        if (trim(line).empty()) {
            continue;
        }

        const auto fields = splitRow(line);
        const auto field  = [&](const char* column) -> const std::string& {
            const auto index = columns.at(column);
            if (index >= fields.size()) {
                throw InvalidBarData(std::string("missing ") + column + " field", lineNo);
            }
            return fields[index];
        };

        Bar bar;
        bar.timestamp = parseTimestampField(field("timestamp"), lineNo);
        bar.open      = parseNumber(field("open"), "open", lineNo);
        bar.high      = parseNumber(field("high"), "high", lineNo);
        bar.low       = parseNumber(field("low"), "low", lineNo);
        bar.close     = parseNumber(field("close"), "close", lineNo);
        bar.volume    = hasVolume ? parseNumber(field("volume"), "volume", lineNo) : 0.0;
        bars.push_back(bar);
    }

    return bars;
}

bool BarLoader::writeCsv(const std::string& path, const BarSeries& series) {
    std::ofstream f(path);
    if (!f.is_open()) {
        std::cerr << "Error: Cannot write: " << path << std::endl;
        return false;
    }

    f << "timestamp,open,high,low,close,volume\n";
    f << std::setprecision(std::numeric_limits<double>::max_digits10);
    for (const auto& bar : series.bars()) {
        // clang-format off
        f << bar.timestamp << ","
          << bar.open << ","
          << bar.high << ","
          << bar.low << ","
          << bar.close << ","
          << bar.volume << "\n";
        // clang-format on
    }

    f.flush();
    if (!f) {
        std::cerr << "Error: Failed writing: " << path << std::endl;
        return false;
    }
    return true;
}
