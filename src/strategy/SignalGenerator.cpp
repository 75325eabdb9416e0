#include "strategy/SignalGenerator.h"
#include "common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace crosstrade {
namespace strategy {

SignalGenerator::SignalGenerator(const StrategyConfig& config, std::string symbol)
    : config_(config)
    , symbol_(std::move(symbol))
    , emitted_count_(0)
{}

std::optional<Signal> SignalGenerator::onIndicatorPoint(const IndicatorPoint& point, double reference_price) {
    const std::optional<IndicatorPoint> previous = previous_;
    previous_ = point;

    if (!previous) {
        return std::nullopt;
    }

    const auto direction = detectCrossover(*previous, point);
    if (!direction) {
        return std::nullopt;
    }

    const SignalStrength strength = classifyStrength(*direction, point.rsi, config_);
    const double confidence = scoreConfidence(*direction, point, config_);
    std::string message = describe(*direction, strength, point, config_);

    ++emitted_count_;
    LOG_DEBUG("{} signal {} {} conf={:.1f} @ {:.8f}: {}",
              symbol_, toString(*direction), toString(strength), confidence, reference_price, message);

    return Signal(point.timestamp, *direction, strength, confidence, reference_price,
                  point, std::move(message), symbol_);
}

void SignalGenerator::reset() {
    previous_.reset();
    emitted_count_ = 0;
}

std::optional<Direction> SignalGenerator::detectCrossover(const IndicatorPoint& previous,
                                                          const IndicatorPoint& current) {
    // Golden cross
    if (previous.ema_short <= previous.ema_long && current.ema_short > current.ema_long) {
        return Direction::BUY;
    }
    // Death cross
    if (previous.ema_short >= previous.ema_long && current.ema_short < current.ema_long) {
        return Direction::SELL;
    }
    return std::nullopt;
}

SignalStrength SignalGenerator::classifyStrength(Direction direction, double rsi, const StrategyConfig& config) {
    if (direction == Direction::BUY) {
        if (rsi <= config.rsi_oversold) return SignalStrength::STRONG;
        if (rsi <= config.rsi_oversold + MODERATE_BAND) return SignalStrength::MODERATE;
        return SignalStrength::WEAK;
    }

    if (rsi >= config.rsi_overbought) return SignalStrength::STRONG;
    if (rsi >= config.rsi_overbought - MODERATE_BAND) return SignalStrength::MODERATE;
    return SignalStrength::WEAK;
}

double SignalGenerator::magnitudeScore(double ema_short, double ema_long) {
    if (ema_long <= 0.0) {
        return 0.0;
    }
    // EMA distance in percent, doubled
    const double distance_pct = std::abs(ema_short - ema_long) / ema_long * 100.0;
    return std::min(distance_pct * 2.0, MAGNITUDE_CAP);
}

double SignalGenerator::scoreConfidence(Direction direction, const IndicatorPoint& point, const StrategyConfig& config) {
    double confidence = BASE_CONFIDENCE;

    switch (classifyStrength(direction, point.rsi, config)) {
        case SignalStrength::STRONG: confidence += STRONG_BONUS; break;
        case SignalStrength::MODERATE: confidence += MODERATE_BONUS; break;
        case SignalStrength::WEAK: break;
    }

    confidence += magnitudeScore(point.ema_short, point.ema_long);
    return std::clamp(confidence, 0.0, 100.0);
}

std::string SignalGenerator::describe(Direction direction, SignalStrength strength,
                                      const IndicatorPoint& point, const StrategyConfig& config) {
    const bool buy = (direction == Direction::BUY);

    std::string rsi_part;
    switch (strength) {
        case SignalStrength::STRONG:
            rsi_part = fmt::format("RSI {} ({:.1f} {} {:.1f})",
                                   buy ? "oversold" : "overbought", point.rsi,
                                   buy ? "<=" : ">=", buy ? config.rsi_oversold : config.rsi_overbought);
            break;
        case SignalStrength::MODERATE:
            rsi_part = fmt::format("RSI near {} ({:.1f})", buy ? "oversold" : "overbought", point.rsi);
            break;
        case SignalStrength::WEAK:
            rsi_part = fmt::format("RSI unconfirmed ({:.1f})", point.rsi);
            break;
    }

    std::string label = toString(strength);
    label[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(label[0])));

    return fmt::format("{} {}: EMA {} ({:.2f} {} {:.2f}) + {}",
                       label, toString(direction),
                       buy ? "golden cross" : "death cross",
                       point.ema_short, buy ? ">" : "<", point.ema_long,
                       rsi_part);
}

} // namespace strategy
} // namespace crosstrade
