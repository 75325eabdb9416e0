#pragma once

#include <optional>
#include <string>
#include <vector>
#include "backtest/BacktestEngine.h"

namespace crosstrade {
namespace backtest {

struct BacktestOutcome {
    BacktestRequest request;
    std::optional<BacktestResult> result;
    std::string error;          // empty on success

    bool ok() const { return result.has_value(); }
};

// Runs independent backtests on a small worker pool.
// Each request owns its own engine state; a failure is recorded in its outcome
// and never affects the other requests. Outcomes keep the order of requests.
class BacktestBatch {
public:
    static std::vector<BacktestOutcome> runParallel(
        const std::vector<BacktestRequest>& requests,
        const core::IMarketDataProvider& provider,
        unsigned int max_threads = 0        // 0 = hardware concurrency
    );
};

} // namespace backtest
} // namespace crosstrade
