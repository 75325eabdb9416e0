#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"
#include <algorithm>
#include <numeric>
#include <string>

namespace crosstrade {
namespace analytics {

namespace {
void requirePeriod(int period, const char* name) {
    if (period < 1) {
        throw InvalidConfigError(std::string(name) + " period must be >= 1, got " + std::to_string(period));
    }
}

// 100 when there are no losses, 0 when there are no gains
double rsiValue(double avg_gain, double avg_loss) {
    if (avg_loss <= 0.0) return 100.0;
    if (avg_gain <= 0.0) return 0.0;

    const double rs = avg_gain / avg_loss;
    return std::clamp(100.0 - (100.0 / (1.0 + rs)), 0.0, 100.0);
}
}

// ===== EmaCalculator =====

EmaCalculator::EmaCalculator(int period)
    : period_(period)
    , k_(0.0)
    , count_(0)
    , seed_sum_(0.0)
    , value_(0.0)
{
    requirePeriod(period, "EMA");
    k_ = 2.0 / (static_cast<double>(period) + 1.0);
}

std::optional<double> EmaCalculator::update(double close) {
    if (count_ < period_) {
        seed_sum_ += close;
        ++count_;
        if (count_ < period_) {
            return std::nullopt;
        }
        value_ = seed_sum_ / period_;
        return value_;
    }

    value_ = close * k_ + value_ * (1.0 - k_);
    return value_;
}

void EmaCalculator::reset() {
    count_ = 0;
    seed_sum_ = 0.0;
    value_ = 0.0;
}

std::optional<double> EmaCalculator::current() const {
    if (!isReady()) return std::nullopt;
    return value_;
}

// ===== RsiCalculator (Wilder's Smoothing) =====

RsiCalculator::RsiCalculator(int period)
    : period_(period)
    , changes_(0)
    , has_prev_(false)
    , prev_close_(0.0)
    , sum_gain_(0.0)
    , sum_loss_(0.0)
    , avg_gain_(0.0)
    , avg_loss_(0.0)
{
    requirePeriod(period, "RSI");
}

std::optional<double> RsiCalculator::update(double close) {
    if (!has_prev_) {
        has_prev_ = true;
        prev_close_ = close;
        return std::nullopt;
    }

    const double change = close - prev_close_;
    prev_close_ = close;
    const double gain = (change > 0) ? change : 0.0;
    const double loss = (change < 0) ? -change : 0.0;

    if (changes_ < period_) {
        // 1. seed: simple mean of the first `period` gains/losses
        sum_gain_ += gain;
        sum_loss_ += loss;
        ++changes_;
        if (changes_ < period_) {
            return std::nullopt;
        }
        avg_gain_ = sum_gain_ / period_;
        avg_loss_ = sum_loss_ / period_;
        return rsiValue(avg_gain_, avg_loss_);
    }

    // 2. Wilder's smoothing
    avg_gain_ = ((avg_gain_ * (period_ - 1)) + gain) / period_;
    avg_loss_ = ((avg_loss_ * (period_ - 1)) + loss) / period_;
    return rsiValue(avg_gain_, avg_loss_);
}

void RsiCalculator::reset() {
    changes_ = 0;
    has_prev_ = false;
    prev_close_ = 0.0;
    sum_gain_ = 0.0;
    sum_loss_ = 0.0;
    avg_gain_ = 0.0;
    avg_loss_ = 0.0;
}

std::optional<double> RsiCalculator::current() const {
    if (!isReady()) return std::nullopt;
    return rsiValue(avg_gain_, avg_loss_);
}

// ===== Batch =====

double TechnicalIndicators::rsiFromAverages(double avg_gain, double avg_loss) {
    return rsiValue(avg_gain, avg_loss);
}

std::vector<IndicatorValue> TechnicalIndicators::computeEMA(const std::vector<Bar>& bars, int period) {
    requirePeriod(period, "EMA");
    if (bars.size() < static_cast<size_t>(period)) {
        throw InsufficientDataError("EMA(" + std::to_string(period) + ") needs " +
                                    std::to_string(period) + " bars, got " + std::to_string(bars.size()));
    }

    EmaCalculator ema(period);
    std::vector<IndicatorValue> out;
    out.reserve(bars.size() - period + 1);
    for (const auto& bar : bars) {
        if (auto v = ema.update(bar.close)) {
            out.push_back({bar.timestamp, *v});
        }
    }
    return out;
}

std::vector<IndicatorValue> TechnicalIndicators::computeRSI(const std::vector<Bar>& bars, int period) {
    requirePeriod(period, "RSI");
    if (bars.size() < static_cast<size_t>(period + 1)) {
        throw InsufficientDataError("RSI(" + std::to_string(period) + ") needs " +
                                    std::to_string(period + 1) + " bars, got " + std::to_string(bars.size()));
    }

    RsiCalculator rsi(period);
    std::vector<IndicatorValue> out;
    out.reserve(bars.size() - period);
    for (const auto& bar : bars) {
        if (auto v = rsi.update(bar.close)) {
            out.push_back({bar.timestamp, *v});
        }
    }
    return out;
}

double TechnicalIndicators::calculateSMA(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) {
        return 0.0;
    }
    
    double sum = std::accumulate(prices.end() - period, prices.end(), 0.0);
    return sum / period;
}

std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<Bar>& bars) {
    std::vector<double> prices;
    prices.reserve(bars.size());
    
    for (const auto& bar : bars) {
        prices.push_back(bar.close);
    }
    
    return prices;
}

} // namespace analytics
} // namespace crosstrade
