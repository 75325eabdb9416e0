#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "analytics/IndicatorPipeline.h"
#include "common/Types.h"
#include "strategy/SignalGenerator.h"

namespace crosstrade {
namespace testing {

constexpr TimestampMs kStartMs = 1704067200000LL;      // 2024-01-01 00:00 UTC
constexpr TimestampMs kHourMs = 3600000LL;

// Flat-bodied bars: open = previous close, high/low just around the body
inline std::vector<Bar> makeBars(const std::vector<double>& closes,
                                 TimestampMs start = kStartMs,
                                 TimestampMs step = kHourMs) {
    std::vector<Bar> bars;
    bars.reserve(closes.size());
    double prev = closes.empty() ? 0.0 : closes.front();
    for (std::size_t i = 0; i < closes.size(); ++i) {
        const double close = closes[i];
        const double open = prev;
        const double hi = (open > close ? open : close) * 1.001;
        const double lo = (open < close ? open : close) * 0.999;
        bars.emplace_back(start + static_cast<TimestampMs>(i) * step, open, hi, lo, close, 10.0);
        prev = close;
    }
    return bars;
}

// Falling leg, then rising leg: produces one golden cross on the way up
inline std::vector<double> valleyCloses(int down, int up, double top = 100.0,
                                        double down_step = 1.0, double up_step = 2.0) {
    std::vector<double> closes;
    double price = top;
    for (int i = 0; i < down; ++i) {
        closes.push_back(price);
        price -= down_step;
    }
    for (int i = 0; i < up; ++i) {
        closes.push_back(price);
        price += up_step;
    }
    return closes;
}

// Small, fast config so short synthetic series produce signals
inline strategy::StrategyConfig fastConfig() {
    strategy::StrategyConfig config;
    config.ema_short_period = 3;
    config.ema_long_period = 6;
    config.rsi_period = 3;
    config.min_confidence = 0.0;
    config.trade_amount_percent = 50.0;
    config.stop_loss_percent = 2.0;
    config.take_profit_percent = 4.0;
    config.min_time_between_trades = 0;
    return config;
}

// Index of the first bar whose indicator point triggers a signal of `direction`
inline std::optional<std::size_t> firstSignalIndex(const std::vector<Bar>& bars,
                                                   const strategy::StrategyConfig& config,
                                                   Direction direction) {
    analytics::IndicatorPipeline pipeline(config);
    strategy::SignalGenerator generator(config);
    for (std::size_t i = 0; i < bars.size(); ++i) {
        const auto point = pipeline.update(bars[i]);
        if (!point) {
            continue;
        }
        const auto signal = generator.onIndicatorPoint(*point, bars[i].close);
        if (signal && signal->direction() == direction) {
            return i;
        }
    }
    return std::nullopt;
}

} // namespace testing
} // namespace crosstrade
