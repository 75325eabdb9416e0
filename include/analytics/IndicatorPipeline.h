#pragma once

#include <cstddef>
#include <optional>
#include <vector>
#include "analytics/TechnicalIndicators.h"
#include "common/Types.h"
#include "strategy/StrategyConfig.h"

namespace crosstrade {
namespace analytics {

// Short EMA, long EMA and RSI advanced together, O(1) per bar.
// Feeding a prefix and then the rest gives the same points as one full pass.
class IndicatorPipeline {
public:
    explicit IndicatorPipeline(const strategy::StrategyConfig& config);

    // Empty during warm-up. Throws InvalidRangeError when the timestamp
    // does not increase.
    std::optional<IndicatorPoint> update(const Bar& bar);
    void reset();

    std::size_t barsSeen() const { return bars_seen_; }
    bool isWarm() const;

private:
    EmaCalculator ema_short_;
    EmaCalculator ema_long_;
    RsiCalculator rsi_;
    std::optional<TimestampMs> last_timestamp_;
    std::size_t bars_seen_;
};

// Batch form: one IndicatorPoint per bar after warm-up.
// Throws InsufficientDataError when bars.size() < config.warmupBars().
std::vector<IndicatorPoint> computeIndicators(const std::vector<Bar>& bars,
                                              const strategy::StrategyConfig& config);

} // namespace analytics
} // namespace crosstrade
