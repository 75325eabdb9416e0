#pragma once

#include <optional>
#include <string>
#include "common/Types.h"
#include "strategy/Signal.h"
#include "strategy/StrategyConfig.h"

namespace crosstrade {
namespace strategy {

// Event-driven EMA crossover detector with RSI confirmation.
//
// Emits a Signal only on the bar where the short EMA crosses the long EMA:
//   buy  : short <= long on the previous point, short > long now
//   sell : short >= long on the previous point, short < long now
//
// Strength
//   strong   : RSI at/beyond its threshold (<= oversold for buy, >= overbought for sell)
//   moderate : RSI within 10 points of the threshold on the confirming side
//   weak     : no RSI confirmation
//
// Confidence = 50 + {30 strong | 15 moderate | 0} + min(200 * |short - long| / long, 20),
// clamped to [0, 100].
class SignalGenerator {
public:
    static constexpr double BASE_CONFIDENCE = 50.0;
    static constexpr double STRONG_BONUS = 30.0;
    static constexpr double MODERATE_BONUS = 15.0;
    static constexpr double MAGNITUDE_CAP = 20.0;
    static constexpr double MODERATE_BAND = 10.0;

    explicit SignalGenerator(const StrategyConfig& config, std::string symbol = std::string());

    std::optional<Signal> onIndicatorPoint(const IndicatorPoint& point, double reference_price);
    void reset();

    long long emittedCount() const { return emitted_count_; }

    static std::optional<Direction> detectCrossover(const IndicatorPoint& previous,
                                                    const IndicatorPoint& current);
    static SignalStrength classifyStrength(Direction direction, double rsi, const StrategyConfig& config);
    static double magnitudeScore(double ema_short, double ema_long);
    static double scoreConfidence(Direction direction, const IndicatorPoint& point, const StrategyConfig& config);
    static std::string describe(Direction direction, SignalStrength strength,
                                const IndicatorPoint& point, const StrategyConfig& config);

private:
    StrategyConfig config_;
    std::string symbol_;
    std::optional<IndicatorPoint> previous_;
    long long emitted_count_;
};

} // namespace strategy
} // namespace crosstrade
