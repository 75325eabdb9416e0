#pragma once

#include <string>
#include "common/Types.h"

namespace crosstrade {

enum class Timeframe { M1, M5, M15, M30, H1, H4, D1 };

// "1m", "5m", "15m", "30m", "1h", "4h", "1d"; throws InvalidConfigError otherwise
Timeframe parseTimeframe(const std::string& text);
std::string toString(Timeframe tf);

TimestampMs durationMs(Timeframe tf);

// Markets trade around the clock, 365 days a year
double barsPerYear(Timeframe tf);

} // namespace crosstrade
