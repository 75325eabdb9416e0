#pragma once

#include <string>
#include <utility>
#include "common/Types.h"

namespace crosstrade {
namespace strategy {

// Trade signal produced on an EMA crossover bar. Read-only after construction.
class Signal {
public:
    Signal(TimestampMs timestamp,
           Direction direction,
           SignalStrength strength,
           double confidence,
           double reference_price,
           const IndicatorPoint& indicators,
           std::string message,
           std::string symbol = std::string())
        : timestamp_(timestamp)
        , direction_(direction)
        , strength_(strength)
        , confidence_(confidence)
        , reference_price_(reference_price)
        , indicators_(indicators)
        , message_(std::move(message))
        , symbol_(std::move(symbol))
    {}

    TimestampMs timestamp() const { return timestamp_; }
    Direction direction() const { return direction_; }
    SignalStrength strength() const { return strength_; }
    double confidence() const { return confidence_; }         // 0 ~ 100
    double referencePrice() const { return reference_price_; }
    const IndicatorPoint& indicators() const { return indicators_; }
    const std::string& message() const { return message_; }
    const std::string& symbol() const { return symbol_; }

private:
    TimestampMs timestamp_;
    Direction direction_;
    SignalStrength strength_;
    double confidence_;
    double reference_price_;
    IndicatorPoint indicators_;
    std::string message_;
    std::string symbol_;
};

} // namespace strategy
} // namespace crosstrade
