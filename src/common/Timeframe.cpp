#include "common/Timeframe.h"
#include "common/Errors.h"

#include <algorithm>
#include <cctype>

namespace crosstrade {

namespace {
constexpr TimestampMs MINUTE_MS = 60LL * 1000LL;
constexpr double MINUTES_PER_YEAR = 365.0 * 24.0 * 60.0;

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}
}

Timeframe parseTimeframe(const std::string& text) {
    const std::string v = toLowerCopy(text);
    if (v == "1m") return Timeframe::M1;
    if (v == "5m") return Timeframe::M5;
    if (v == "15m") return Timeframe::M15;
    if (v == "30m") return Timeframe::M30;
    if (v == "1h" || v == "60m") return Timeframe::H1;
    if (v == "4h" || v == "240m") return Timeframe::H4;
    if (v == "1d") return Timeframe::D1;
    throw InvalidConfigError("unsupported timeframe: " + text);
}

std::string toString(Timeframe tf) {
    switch (tf) {
        case Timeframe::M1: return "1m";
        case Timeframe::M5: return "5m";
        case Timeframe::M15: return "15m";
        case Timeframe::M30: return "30m";
        case Timeframe::H1: return "1h";
        case Timeframe::H4: return "4h";
        case Timeframe::D1: return "1d";
    }
    return "1h";
}

TimestampMs durationMs(Timeframe tf) {
    switch (tf) {
        case Timeframe::M1: return MINUTE_MS;
        case Timeframe::M5: return 5 * MINUTE_MS;
        case Timeframe::M15: return 15 * MINUTE_MS;
        case Timeframe::M30: return 30 * MINUTE_MS;
        case Timeframe::H1: return 60 * MINUTE_MS;
        case Timeframe::H4: return 240 * MINUTE_MS;
        case Timeframe::D1: return 1440 * MINUTE_MS;
    }
    return 60 * MINUTE_MS;
}

double barsPerYear(Timeframe tf) {
    const double minutes = static_cast<double>(durationMs(tf) / MINUTE_MS);
    return MINUTES_PER_YEAR / minutes;
}

} // namespace crosstrade
