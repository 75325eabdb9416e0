#pragma once

#include <string>
#include <vector>
#include "common/Types.h"

namespace crosstrade {
namespace backtest {

class DataHistory {
public:
    // Load bars from a CSV file
    // Expected format: timestamp,open,high,low,close,volume (header optional)
    static std::vector<Bar> loadCSV(const std::string& file_path);

    // Load bars from a JSON array of objects (long or short keys: close / c, ...)
    // Objects missing a timestamp or an OHLC field are skipped
    static std::vector<Bar> loadJSON(const std::string& file_path);

    // Dispatch on extension (.json -> loadJSON, anything else -> loadCSV)
    static std::vector<Bar> load(const std::string& file_path);

    // Keep bars with start_ms <= timestamp <= end_ms
    static std::vector<Bar> filterByRange(const std::vector<Bar>& bars,
                                          TimestampMs start_ms,
                                          TimestampMs end_ms);

    // Second-resolution timestamps are scaled to milliseconds
    static TimestampMs toMsTimestamp(TimestampMs ts);
    static void normalizeTimestampsToMs(std::vector<Bar>& bars);

    // Throws InvalidRangeError on the first non-increasing timestamp
    static void ensureStrictlyIncreasing(const std::vector<Bar>& bars);
};

} // namespace backtest
} // namespace crosstrade
