#include "strategy/StrategyConfig.h"
#include "common/Errors.h"

#include <algorithm>
#include <string>

namespace crosstrade {
namespace strategy {

namespace {
void require(bool ok, const std::string& message) {
    if (!ok) {
        throw InvalidConfigError(message);
    }
}
}

void StrategyConfig::validate() const {
    require(ema_short_period >= 2, "ema_short_period must be >= 2");
    require(ema_long_period >= 2, "ema_long_period must be >= 2");
    require(ema_short_period < ema_long_period,
            "ema_short_period (" + std::to_string(ema_short_period) +
            ") must be less than ema_long_period (" + std::to_string(ema_long_period) + ")");
    require(rsi_period >= 2, "rsi_period must be >= 2");

    require(rsi_oversold >= 0.0 && rsi_oversold <= 100.0, "rsi_oversold must be within [0, 100]");
    require(rsi_overbought >= 0.0 && rsi_overbought <= 100.0, "rsi_overbought must be within [0, 100]");
    require(rsi_overbought > rsi_oversold, "rsi_overbought must be greater than rsi_oversold");

    require(min_confidence >= 0.0 && min_confidence <= 100.0, "min_confidence must be within [0, 100]");
    require(trade_amount_percent > 0.0 && trade_amount_percent <= 100.0,
            "trade_amount_percent must be within (0, 100]");
    if (max_trade_amount) {
        require(*max_trade_amount > 0.0, "max_trade_amount must be positive when set");
    }
    require(stop_loss_percent >= 0.0 && stop_loss_percent < 100.0, "stop_loss_percent must be within [0, 100)");
    require(take_profit_percent >= 0.0, "take_profit_percent must be >= 0");
    require(min_time_between_trades >= 0, "min_time_between_trades must be >= 0");
}

int StrategyConfig::warmupBars() const {
    // RSI needs one extra close to form its first change.
    return std::max(ema_long_period, rsi_period + 1);
}

} // namespace strategy
} // namespace crosstrade
