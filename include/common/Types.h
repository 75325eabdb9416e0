#pragma once

namespace crosstrade {

// Epoch milliseconds
using TimestampMs = long long;

enum class Direction { BUY, SELL };
enum class SignalStrength { WEAK, MODERATE, STRONG };
enum class ExitReason { SIGNAL, STOP_LOSS, TAKE_PROFIT, END_OF_DATA };

struct Bar {
    TimestampMs timestamp;
    double open;
    double high;
    double low;
    double close;
    double volume;

    Bar() : timestamp(0), open(0), high(0), low(0), close(0), volume(0) {}

    Bar(TimestampMs t, double o, double h, double l, double c, double v)
        : timestamp(t), open(o), high(h), low(l), close(c), volume(v) {}
};

// One row per bar once all indicators are seeded
struct IndicatorPoint {
    TimestampMs timestamp = 0;
    double ema_short = 0.0;
    double ema_long = 0.0;
    double rsi = 0.0;
};

inline const char* toString(Direction d) {
    return d == Direction::BUY ? "buy" : "sell";
}

inline const char* toString(SignalStrength s) {
    switch (s) {
        case SignalStrength::WEAK: return "weak";
        case SignalStrength::MODERATE: return "moderate";
        case SignalStrength::STRONG: return "strong";
    }
    return "weak";
}

inline const char* toString(ExitReason r) {
    switch (r) {
        case ExitReason::SIGNAL: return "signal";
        case ExitReason::STOP_LOSS: return "stop_loss";
        case ExitReason::TAKE_PROFIT: return "take_profit";
        case ExitReason::END_OF_DATA: return "end_of_data";
    }
    return "signal";
}

} // namespace crosstrade
