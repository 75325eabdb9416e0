#pragma once

#include <optional>
#include <vector>
#include "common/Types.h"

namespace crosstrade {
namespace analytics {

struct IndicatorValue {
    TimestampMs timestamp;
    double value;
};

// EMA, one close at a time.
// Seed = SMA of the first `period` closes, then close * k + prev * (1 - k), k = 2 / (period + 1).
class EmaCalculator {
public:
    explicit EmaCalculator(int period);

    // Empty until `period` closes have been seen
    std::optional<double> update(double close);
    void reset();

    int period() const { return period_; }
    bool isReady() const { return count_ >= period_; }
    std::optional<double> current() const;

private:
    int period_;
    double k_;
    int count_;
    double seed_sum_;
    double value_;
};

// RSI with Wilder's smoothing, one close at a time.
class RsiCalculator {
public:
    explicit RsiCalculator(int period);

    // Empty until `period` price changes (period + 1 closes) have been seen
    std::optional<double> update(double close);
    void reset();

    int period() const { return period_; }
    bool isReady() const { return changes_ >= period_; }
    std::optional<double> current() const;

private:
    int period_;
    int changes_;
    bool has_prev_;
    double prev_close_;
    double sum_gain_;
    double sum_loss_;
    double avg_gain_;
    double avg_loss_;
};

class TechnicalIndicators {
public:
    // One value per bar from index period-1 onward (n - period + 1 values).
    // Throws InsufficientDataError when bars.size() < period.
    static std::vector<IndicatorValue> computeEMA(const std::vector<Bar>& bars, int period);

    // One value per bar from index period onward (n - period values), each in [0, 100].
    // Throws InsufficientDataError when bars.size() < period + 1.
    static std::vector<IndicatorValue> computeRSI(const std::vector<Bar>& bars, int period);

    // 100 when avg_loss == 0, 0 when avg_gain == 0
    static double rsiFromAverages(double avg_gain, double avg_loss);

    static double calculateSMA(const std::vector<double>& prices, int period);
    static std::vector<double> extractClosePrices(const std::vector<Bar>& bars);
};

} // namespace analytics
} // namespace crosstrade
