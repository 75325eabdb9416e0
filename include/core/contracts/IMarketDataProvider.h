#pragma once

#include <string>
#include <vector>

#include "common/Timeframe.h"
#include "common/Types.h"

namespace crosstrade {
namespace core {

// Historical bar source. Read-only during a backtest, so one instance may be
// shared by concurrent runs.
class IMarketDataProvider {
public:
    virtual ~IMarketDataProvider() = default;

    // Bars with start_ms <= timestamp <= end_ms, ordered by timestamp.
    // Throws DataUnavailableError when the range cannot be served.
    virtual std::vector<Bar> getBars(
        const std::string& symbol,
        Timeframe timeframe,
        TimestampMs start_ms,
        TimestampMs end_ms
    ) const = 0;
};

} // namespace core
} // namespace crosstrade
