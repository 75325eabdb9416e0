#include "backtest/DataHistory.h"
#include "backtest/MarketDataProviders.h"
#include "common/Errors.h"
#include "TestSupport.h"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace crosstrade;
using backtest::DataHistory;

static const std::filesystem::path kDir = "test_data/market_data";

static std::string writeFile(const std::string& name, const std::string& body) {
    std::filesystem::create_directories(kDir);
    const auto path = kDir / name;
    std::ofstream out(path, std::ios::trunc);
    out << body;
    return path.string();
}

static void testCsvLoad() {
    // Header, seconds timestamps, out of order, one broken row
    const auto path = writeFile("btc_1h.csv",
        "timestamp,open,high,low,close,volume\n"
        "1704070800,101,103,100,102,5\n"
        "1704067200,100,102,99,101,4\n"
        "1704074400,102,104,abc,103,6\n"
        "1704078000,103,105,102,104,7\n");

    const auto bars = DataHistory::loadCSV(path);
    assert(bars.size() == 3);
    assert(bars[0].timestamp == 1704067200000LL);
    assert(bars[1].timestamp == 1704070800000LL);
    assert(bars[2].close == 104.0);
    DataHistory::ensureStrictlyIncreasing(bars);
    std::cout << "  CSV ok\n";
}

static void testJsonLoad() {
    const auto path = writeFile("btc_1h.json",
        "[{\"t\": 1704067200000, \"o\": 1, \"h\": 2, \"l\": 0.5, \"c\": 1.5, \"v\": 10},"
        " {\"timestamp\": 1704070800000, \"open\": 1.5, \"high\": 2.5, \"low\": 1.0, \"close\": 2.0, \"volume\": 11}]");

    const auto bars = DataHistory::load(path);
    assert(bars.size() == 2);
    assert(bars[0].close == 1.5);
    assert(bars[1].open == 1.5);
    assert(bars[1].volume == 11.0);

    // Incomplete records are dropped; volume may be missing
    const auto partial = writeFile("partial.json",
        "[{\"t\": 1704067200000, \"o\": 1, \"h\": 2, \"l\": 0.5, \"c\": 1.5},"
        " {\"t\": 1704070800000, \"o\": 1, \"h\": 2, \"l\": 0.5, \"v\": 3},"
        " {\"o\": 1, \"h\": 2, \"l\": 0.5, \"c\": 1.7, \"v\": 3},"
        " {\"t\": 1704074400000, \"o\": 1.5, \"h\": 2, \"l\": 1, \"c\": 1.8, \"v\": 4}]");
    const auto kept = DataHistory::loadJSON(partial);
    assert(kept.size() == 2);
    assert(kept[0].close == 1.5 && kept[0].volume == 0.0);
    assert(kept[1].timestamp == 1704074400000LL && kept[1].close == 1.8);
    std::cout << "  JSON ok\n";
}

static void testRangeAndOrdering() {
    const auto bars = testing::makeBars({1, 2, 3, 4, 5});
    const auto slice = DataHistory::filterByRange(bars, bars[1].timestamp, bars[3].timestamp);
    assert(slice.size() == 3);
    assert(slice.front().timestamp == bars[1].timestamp);
    assert(slice.back().timestamp == bars[3].timestamp);

    // The range is inclusive on both ends and never open ended
    assert(DataHistory::filterByRange(bars, 0, 0).empty());
    assert(DataHistory::filterByRange(bars, -10, -1).empty());
    assert(DataHistory::filterByRange(bars, bars[2].timestamp, bars[2].timestamp).size() == 1);

    auto duplicated = bars;
    duplicated[2].timestamp = duplicated[1].timestamp;
    bool thrown = false;
    try {
        DataHistory::ensureStrictlyIncreasing(duplicated);
    } catch (const InvalidRangeError&) {
        thrown = true;
    }
    assert(thrown);

    assert(DataHistory::toMsTimestamp(1704067200) == 1704067200000LL);
    assert(DataHistory::toMsTimestamp(1704067200000LL) == 1704067200000LL);
}

static void testProviders() {
    backtest::InMemoryMarketDataProvider memory;
    const auto bars = testing::makeBars({1, 2, 3, 4, 5});
    memory.setBars("ETH/USDT", bars);

    const auto got = memory.getBars("ETH/USDT", Timeframe::H1, bars[0].timestamp, bars[4].timestamp);
    assert(got.size() == 5);

    bool unknown = false;
    try {
        memory.getBars("XRP/USDT", Timeframe::H1, 0, bars[4].timestamp);
    } catch (const DataUnavailableError&) {
        unknown = true;
    }
    assert(unknown);

    bool non_positive_end = false;
    try {
        memory.getBars("ETH/USDT", Timeframe::H1, -100, -1);
    } catch (const DataUnavailableError&) {
        non_positive_end = true;
    }
    assert(non_positive_end);

    bool empty_range = false;
    try {
        memory.getBars("ETH/USDT", Timeframe::H1, bars[4].timestamp + 1, bars[4].timestamp + 10);
    } catch (const DataUnavailableError&) {
        empty_range = true;
    }
    assert(empty_range);

    backtest::FileMarketDataProvider files("BTC/USDT", (kDir / "missing.csv").string());
    bool missing = false;
    try {
        files.getBars("BTC/USDT", Timeframe::H1, 0, 1);
    } catch (const DataUnavailableError&) {
        missing = true;
    }
    assert(missing);

    files.addSource("BTC/USDT", (kDir / "btc_1h.csv").string());
    assert(files.getBars("BTC/USDT", Timeframe::H1, 0, 1704070800000LL).size() == 2);
    std::cout << "  providers ok\n";
}

int main() {
    std::cout << "[TEST] Starting MarketData Test..." << std::endl;

    testCsvLoad();
    testJsonLoad();
    testRangeAndOrdering();
    testProviders();

    std::filesystem::remove_all(kDir);
    std::cout << "[TEST] MarketData PASSED" << std::endl;
    return 0;
}
