#include "backtest/MarketDataProviders.h"
#include "backtest/DataHistory.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <filesystem>

namespace crosstrade {
namespace backtest {

namespace {
std::vector<Bar> sliceOrThrow(const std::vector<Bar>& bars,
                              const std::string& symbol,
                              Timeframe timeframe,
                              TimestampMs start_ms,
                              TimestampMs end_ms) {
    auto out = DataHistory::filterByRange(bars, start_ms, end_ms);
    if (out.empty()) {
        throw DataUnavailableError("no " + toString(timeframe) + " bars for " + symbol +
                                   " in [" + std::to_string(start_ms) + ", " + std::to_string(end_ms) + "]");
    }
    return out;
}
}

// ===== FileMarketDataProvider =====

FileMarketDataProvider::FileMarketDataProvider(const std::string& symbol, const std::string& file_path) {
    addSource(symbol, file_path);
}

void FileMarketDataProvider::addSource(const std::string& symbol, const std::string& file_path) {
    sources_[symbol] = file_path;
}

std::vector<Bar> FileMarketDataProvider::getBars(
    const std::string& symbol,
    Timeframe timeframe,
    TimestampMs start_ms,
    TimestampMs end_ms
) const {
    auto it = sources_.find(symbol);
    if (it == sources_.end()) {
        throw DataUnavailableError("no data source registered for " + symbol);
    }
    if (!std::filesystem::exists(it->second)) {
        throw DataUnavailableError("data file not found: " + it->second);
    }

    const auto bars = DataHistory::load(it->second);
    LOG_DEBUG("{} {}: {} bars in file {}", symbol, toString(timeframe), bars.size(), it->second);
    return sliceOrThrow(bars, symbol, timeframe, start_ms, end_ms);
}

// ===== InMemoryMarketDataProvider =====

void InMemoryMarketDataProvider::setBars(const std::string& symbol, std::vector<Bar> bars) {
    bars_by_symbol_[symbol] = std::move(bars);
}

std::vector<Bar> InMemoryMarketDataProvider::getBars(
    const std::string& symbol,
    Timeframe timeframe,
    TimestampMs start_ms,
    TimestampMs end_ms
) const {
    auto it = bars_by_symbol_.find(symbol);
    if (it == bars_by_symbol_.end()) {
        throw DataUnavailableError("no bars loaded for " + symbol);
    }
    return sliceOrThrow(it->second, symbol, timeframe, start_ms, end_ms);
}

} // namespace backtest
} // namespace crosstrade
