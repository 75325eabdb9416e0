#pragma once

#include <map>
#include <string>
#include <vector>

#include "core/contracts/IMarketDataProvider.h"

namespace crosstrade {
namespace backtest {

// Serves bars from CSV/JSON files, one file per symbol.
// Files are read on each call; the provider holds no mutable state.
class FileMarketDataProvider : public core::IMarketDataProvider {
public:
    FileMarketDataProvider() = default;
    FileMarketDataProvider(const std::string& symbol, const std::string& file_path);

    void addSource(const std::string& symbol, const std::string& file_path);

    std::vector<Bar> getBars(
        const std::string& symbol,
        Timeframe timeframe,
        TimestampMs start_ms,
        TimestampMs end_ms
    ) const override;

private:
    std::map<std::string, std::string> sources_;
};

// Bars held in memory, keyed by symbol. Populate before sharing across threads.
class InMemoryMarketDataProvider : public core::IMarketDataProvider {
public:
    void setBars(const std::string& symbol, std::vector<Bar> bars);

    std::vector<Bar> getBars(
        const std::string& symbol,
        Timeframe timeframe,
        TimestampMs start_ms,
        TimestampMs end_ms
    ) const override;

private:
    std::map<std::string, std::vector<Bar>> bars_by_symbol_;
};

} // namespace backtest
} // namespace crosstrade
