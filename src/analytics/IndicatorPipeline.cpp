#include "analytics/IndicatorPipeline.h"
#include "common/Errors.h"

#include <string>

namespace crosstrade {
namespace analytics {

IndicatorPipeline::IndicatorPipeline(const strategy::StrategyConfig& config)
    : ema_short_(config.ema_short_period)
    , ema_long_(config.ema_long_period)
    , rsi_(config.rsi_period)
    , bars_seen_(0)
{}

std::optional<IndicatorPoint> IndicatorPipeline::update(const Bar& bar) {
    if (last_timestamp_ && bar.timestamp <= *last_timestamp_) {
        throw InvalidRangeError("non-increasing bar timestamp " + std::to_string(bar.timestamp) +
                                " after " + std::to_string(*last_timestamp_));
    }
    last_timestamp_ = bar.timestamp;
    ++bars_seen_;

    // Every calculator sees every close, ready or not.
    const auto short_v = ema_short_.update(bar.close);
    const auto long_v = ema_long_.update(bar.close);
    const auto rsi_v = rsi_.update(bar.close);

    if (!short_v || !long_v || !rsi_v) {
        return std::nullopt;
    }

    IndicatorPoint point;
    point.timestamp = bar.timestamp;
    point.ema_short = *short_v;
    point.ema_long = *long_v;
    point.rsi = *rsi_v;
    return point;
}

void IndicatorPipeline::reset() {
    ema_short_.reset();
    ema_long_.reset();
    rsi_.reset();
    last_timestamp_.reset();
    bars_seen_ = 0;
}

bool IndicatorPipeline::isWarm() const {
    return ema_short_.isReady() && ema_long_.isReady() && rsi_.isReady();
}

std::vector<IndicatorPoint> computeIndicators(const std::vector<Bar>& bars,
                                              const strategy::StrategyConfig& config) {
    const int warmup = config.warmupBars();
    if (bars.size() < static_cast<std::size_t>(warmup)) {
        throw InsufficientDataError("indicator warm-up needs " + std::to_string(warmup) +
                                    " bars, got " + std::to_string(bars.size()));
    }

    IndicatorPipeline pipeline(config);
    std::vector<IndicatorPoint> out;
    out.reserve(bars.size() - warmup + 1);
    for (const auto& bar : bars) {
        if (auto point = pipeline.update(bar)) {
            out.push_back(*point);
        }
    }
    return out;
}

} // namespace analytics
} // namespace crosstrade
