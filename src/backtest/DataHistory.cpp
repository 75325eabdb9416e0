#include "backtest/DataHistory.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace crosstrade {
namespace backtest {

namespace {
// Anything below 1e12 cannot be epoch-ms after 2001, so treat it as seconds.
constexpr TimestampMs MS_THRESHOLD = 1000000000000LL;

std::string trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

std::string normalizeCell(std::string s) {
    s = trim(std::move(s));

    // Strip UTF-8 BOM if present at first cell.
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }

    // Accept quoted CSV cells.
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return trim(std::move(s));
}

template <typename T>
bool readField(const nlohmann::json& item, const char* long_key, const char* short_key, T& out) {
    if (item.contains(long_key)) {
        out = item.at(long_key).get<T>();
        return true;
    }
    if (item.contains(short_key)) {
        out = item.at(short_key).get<T>();
        return true;
    }
    return false;
}

bool byTimestamp(const Bar& a, const Bar& b) {
    return a.timestamp < b.timestamp;
}
}

std::vector<Bar> DataHistory::loadCSV(const std::string& file_path) {
    std::vector<Bar> bars;
    std::ifstream file(file_path);
    
    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        return bars;
    }

    std::string line;
    while (std::getline(file, line)) {
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.size() < 6) continue;
        if (row[0].empty()) continue;
        if (!std::isdigit(static_cast<unsigned char>(row[0][0])) && row[0][0] != '-') {
            // Header or malformed row.
            continue;
        }

        try {
            Bar bar;
            bar.timestamp = std::stoll(row[0]);
            bar.open = std::stod(row[1]);
            bar.high = std::stod(row[2]);
            bar.low = std::stod(row[3]);
            bar.close = std::stod(row[4]);
            bar.volume = std::stod(row[5]);
            bars.push_back(bar);
        } catch (const std::logic_error& e) {
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
        }
    }

    normalizeTimestampsToMs(bars);
    std::stable_sort(bars.begin(), bars.end(), byTimestamp);
    
    LOG_INFO("Loaded {} bars from {}", bars.size(), file_path);
    return bars;
}

std::vector<Bar> DataHistory::loadJSON(const std::string& file_path) {
    std::vector<Bar> bars;
    std::ifstream file(file_path);
    
    if (!file.is_open()) {
        LOG_ERROR("Failed to open JSON file: {}", file_path);
        return bars;
    }

    nlohmann::json j;
    try {
        file >> j;
        size_t index = 0;
        for (const auto& item : j) {
            Bar bar;
            const bool complete =
                readField(item, "timestamp", "t", bar.timestamp) &&
                readField(item, "open", "o", bar.open) &&
                readField(item, "high", "h", bar.high) &&
                readField(item, "low", "l", bar.low) &&
                readField(item, "close", "c", bar.close);
            if (!complete) {
                LOG_WARN("Skipping incomplete bar #{} in {}: {}", index, file_path, item.dump());
                ++index;
                continue;
            }
            // volume is optional
            readField(item, "volume", "v", bar.volume);
            bars.push_back(bar);
            ++index;
        }
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Error parsing JSON file: {} - {}", file_path, e.what());
        bars.clear();
        return bars;
    }

    normalizeTimestampsToMs(bars);
    std::stable_sort(bars.begin(), bars.end(), byTimestamp);

    LOG_INFO("Loaded {} bars from {}", bars.size(), file_path);
    return bars;
}

std::vector<Bar> DataHistory::load(const std::string& file_path) {
    if (file_path.size() >= 5 && file_path.compare(file_path.size() - 5, 5, ".json") == 0) {
        return loadJSON(file_path);
    }
    return loadCSV(file_path);
}

std::vector<Bar> DataHistory::filterByRange(const std::vector<Bar>& bars,
                                            TimestampMs start_ms,
                                            TimestampMs end_ms) {
    std::vector<Bar> out;
    out.reserve(bars.size());
    for (const auto& bar : bars) {
        if (bar.timestamp < start_ms || bar.timestamp > end_ms) continue;
        out.push_back(bar);
    }
    return out;
}

TimestampMs DataHistory::toMsTimestamp(TimestampMs ts) {
    if (ts > 0 && ts < MS_THRESHOLD) {
        return ts * 1000LL;
    }
    return ts;
}

void DataHistory::normalizeTimestampsToMs(std::vector<Bar>& bars) {
    for (auto& bar : bars) {
        bar.timestamp = toMsTimestamp(bar.timestamp);
    }
}

void DataHistory::ensureStrictlyIncreasing(const std::vector<Bar>& bars) {
    for (size_t i = 1; i < bars.size(); ++i) {
        if (bars[i].timestamp <= bars[i - 1].timestamp) {
            throw InvalidRangeError("bar timestamps must strictly increase: index " + std::to_string(i) +
                                    " has " + std::to_string(bars[i].timestamp) +
                                    " after " + std::to_string(bars[i - 1].timestamp));
        }
    }
}

} // namespace backtest
} // namespace crosstrade
