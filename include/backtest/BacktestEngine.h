#pragma once

#include <atomic>
#include <string>
#include <variant>
#include <vector>
#include "analytics/PerformanceAnalyzer.h"
#include "common/Timeframe.h"
#include "common/Types.h"
#include "core/contracts/IMarketDataProvider.h"
#include "risk/RiskManager.h"
#include "strategy/StrategyConfig.h"

namespace crosstrade {
namespace backtest {

// Position state of one strategy instance. Only Flat can open, only InPosition can close.
struct Flat {};
struct InPosition {
    risk::Position position;
};
using PositionState = std::variant<Flat, InPosition>;

struct BacktestRequest {
    std::string symbol;
    Timeframe timeframe = Timeframe::H1;
    TimestampMs start_ms = 0;
    TimestampMs end_ms = 0;
    double initial_balance = 1000.0;
    strategy::StrategyConfig strategy_config;
    double fee_rate = 0.0;      // per side
};

struct BacktestResult {
    std::string symbol;
    Timeframe timeframe = Timeframe::H1;
    TimestampMs start_ms = 0;
    TimestampMs end_ms = 0;

    std::vector<risk::Trade> trades;
    std::vector<analytics::EquityPoint> equity_curve;     // one point per bar
    analytics::PerformanceStats stats;

    // Diagnostics
    int bars_processed = 0;
    int signals_generated = 0;
    risk::RejectionStats rejections;
};

// Backtest Runner - bar-by-bar replay of the EMA/RSI strategy.
//
// Per bar:
//   1. advance indicators (O(1))
//   2. IN_POSITION: stop-loss / take-profit against the bar's low/high
//      (stop-loss wins when both are crossed; a gap through the level fills at the open)
//   3. otherwise route the crossover signal, if any, through the RiskManager
//   4. record equity = cash + position marked at close
// An open position is closed at the last close with reason end_of_data.
class BacktestEngine {
public:
    BacktestEngine() = default;

    // Validates, fetches bars from the provider and replays them.
    // Throws InvalidConfigError / InvalidRangeError before any data is requested,
    // DataUnavailableError / InsufficientDataError for data problems,
    // CancelledError if cancel_flag is raised between bars.
    BacktestResult run(
        const BacktestRequest& request,
        const core::IMarketDataProvider& provider,
        const std::atomic<bool>* cancel_flag = nullptr
    ) const;

    BacktestResult replay(
        const std::vector<Bar>& bars,
        const strategy::StrategyConfig& config,
        double initial_balance,
        double fee_rate = 0.0,
        const std::string& symbol = std::string(),
        const std::atomic<bool>* cancel_flag = nullptr
    ) const;

    static void validateRequest(const BacktestRequest& request);

private:
    static void validateRunParameters(const strategy::StrategyConfig& config,
                                      double initial_balance,
                                      double fee_rate);
};

} // namespace backtest
} // namespace crosstrade
