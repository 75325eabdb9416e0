#pragma once

#include <string>
#include "common/Timeframe.h"

namespace crosstrade {
namespace engine {

enum class TradingMode {
    LIVE,           // orders go to the execution adapter
    PAPER,          // simulated fills, same code path as LIVE
    BACKTEST        // historical replay
};

// Run-level settings that sit around a StrategyConfig
struct EngineConfig {
    TradingMode mode;
    std::string symbol;
    Timeframe timeframe;
    double initial_balance;
    double fee_rate;                // per side, fraction of notional

    std::string data_path;          // CSV/JSON bar file for backtests
    std::string journal_path;       // live-session event journal (JSONL)

    // Backtest window (epoch ms); the CLI reads end_ms <= 0 as "to the last bar"
    long long start_ms;
    long long end_ms;

    EngineConfig()
        : mode(TradingMode::BACKTEST)
        , symbol("BTC/USDT")
        , timeframe(Timeframe::H1)
        , initial_balance(1000.0)
        , fee_rate(0.0)
        , journal_path("logs/live_events.jsonl")
        , start_ms(0)
        , end_ms(0)
    {}
};

} // namespace engine
} // namespace crosstrade
