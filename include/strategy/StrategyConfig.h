#pragma once

#include <optional>
#include "common/Timeframe.h"

namespace crosstrade {
namespace strategy {

// EMA crossover + RSI threshold strategy parameters.
// Passed by value into every engine call; validate() before use.
struct StrategyConfig {
    // Indicators
    int ema_short_period = 12;
    int ema_long_period = 26;
    int rsi_period = 14;

    // RSI Thresholds
    double rsi_overbought = 70.0;
    double rsi_oversold = 30.0;

    // Signal gate (0 ~ 100)
    double min_confidence = 60.0;

    // Position sizing / protective levels
    double trade_amount_percent = 10.0;         // % of balance per entry
    std::optional<double> max_trade_amount;     // absolute cap, quote currency
    double stop_loss_percent = 2.0;
    double take_profit_percent = 4.0;

    // Cooldown between accepted actions
    long long min_time_between_trades = 300;    // seconds

    // Used to annualize the Sharpe ratio
    Timeframe timeframe = Timeframe::H1;

    // Throws InvalidConfigError naming the first violated constraint.
    void validate() const;

    // Bars needed before the first IndicatorPoint exists
    int warmupBars() const;
};

} // namespace strategy
} // namespace crosstrade
