#include "time_utils.hpp"

#include <cctype>
#include <ctime>
#include <map>

std::string formatTime(int64_t timestamp, const char* format) {
    const std::time_t t = static_cast<std::time_t>(timestamp);
    struct tm         tm {};
    gmtime_r(&t, &tm);

    char mbstr[100];
    if (std::strftime(mbstr, sizeof(mbstr), format, &tm) == 0) {
        return "";
    }
    return mbstr;
}

std::optional<int64_t> parseTimestamp(const std::string& text) {
    for (const char* format : {"%Y-%m-%d %H:%M:%S", "%Y-%m-%dT%H:%M:%S", "%Y-%m-%d"}) {
        struct tm   tm {};
        const char* end = strptime(text.c_str(), format, &tm);
        if (end != nullptr && *end == '\0') {
            return static_cast<int64_t>(timegm(&tm));
        }
    }
    return std::nullopt;
}

std::optional<int64_t> timeframeToSeconds(const std::string& timeframe) {
    // clang-format off
    static const std::map<std::string, int64_t> units = {
        {"min", 60}, {"hour", 3600}, {"day", 86400}, {"week", 604800}, {"month", 2592000},
        {"m", 60},   {"h", 3600},    {"d", 86400},   {"wk", 604800},   {"mo", 2592000},
    };
    // clang-format on

    std::size_t pos = 0;
    while (pos < timeframe.size() && std::isdigit(static_cast<unsigned char>(timeframe[pos]))) {
        ++pos;
    }
    if (pos == 0 || pos > 9) {
        return std::nullopt;
    }

    const int64_t count = std::stoll(timeframe.substr(0, pos));
    std::string   unit  = timeframe.substr(pos);
    if (!unit.empty() && unit.front() == '-') {
        unit.erase(0, 1);
    }

    const auto it = units.find(unit);
    if (count <= 0 || it == units.end()) {
        return std::nullopt;
    }
    return count * it->second;
}
