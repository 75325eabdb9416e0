#pragma once

#include "common/Types.h"
#include "strategy/Signal.h"
#include "strategy/StrategyConfig.h"
#include <optional>
#include <string>

namespace crosstrade {
namespace risk {

// Open position (long-only engine: direction is always BUY today)
struct Position {
    std::string symbol;
    TimestampMs open_timestamp;
    double entry_price;
    double quantity;            // base units
    double invested_amount;     // quote notional at entry, before fees
    Direction direction;
    
    double stop_loss;
    double take_profit;

    double entry_fee;
    double signal_confidence;
    
    Position()
        : open_timestamp(0), entry_price(0), quantity(0)
        , invested_amount(0), direction(Direction::BUY)
        , stop_loss(0), take_profit(0)
        , entry_fee(0), signal_confidence(0)
    {}
};

// Closed position
struct Trade {
    std::string symbol;
    TimestampMs entry_timestamp;
    double entry_price;
    double quantity;
    Direction direction;
    double stop_loss;
    double take_profit;

    TimestampMs exit_timestamp;
    double exit_price;
    ExitReason exit_reason;

    double profit_loss;         // net of fees
    double profit_loss_pct;     // of invested amount
    double fee_paid;
    
    Trade()
        : entry_timestamp(0), entry_price(0), quantity(0)
        , direction(Direction::BUY), stop_loss(0), take_profit(0)
        , exit_timestamp(0), exit_price(0), exit_reason(ExitReason::SIGNAL)
        , profit_loss(0), profit_loss_pct(0), fee_paid(0)
    {}
};

struct ProtectiveLevels {
    double stop_loss;
    double take_profit;
};

enum class RiskAction {
    ENTER_LONG,
    EXIT_LONG
};

struct RiskDecision {
    RiskAction action;
    TimestampMs timestamp;
    double price;
    double quantity;            // base units to buy, or to sell on exit
    double notional;            // quote amount
    double stop_loss;           // entries only
    double take_profit;         // entries only

    RiskDecision()
        : action(RiskAction::ENTER_LONG), timestamp(0), price(0)
        , quantity(0), notional(0), stop_loss(0), take_profit(0)
    {}
};

enum class RejectReason {
    LOW_CONFIDENCE,
    COOLDOWN,
    POSITION_ALREADY_OPEN,
    NO_POSITION_TO_EXIT,
    INSUFFICIENT_BALANCE
};

const char* toString(RejectReason reason);
const char* toString(RiskAction action);

struct RejectionStats {
    int low_confidence = 0;
    int cooldown = 0;
    int position_already_open = 0;
    int no_position_to_exit = 0;
    int insufficient_balance = 0;

    int total() const {
        return low_confidence + cooldown + position_already_open +
               no_position_to_exit + insufficient_balance;
    }
};

// Risk Manager - gates and sizes signals for one strategy instance.
//
// Checks run in this order:
//   1) confidence below min_confidence
//   2) cooldown: signal.timestamp - last accepted action < min_time_between_trades
//   3) position state: buy needs FLAT, sell needs an open long (sell while FLAT is a no-op)
// The cooldown clock only moves on an accepted action (or noteTrade()).
class RiskManager {
public:
    RiskManager() = default;

    std::optional<RiskDecision> evaluate(
        const strategy::Signal& signal,
        const strategy::StrategyConfig& config,
        const Position* open_position,
        double balance
    );

    // Long: SL below / TP above entry. Short: mirrored.
    static ProtectiveLevels protectiveLevels(
        double entry_price,
        Direction direction,
        const strategy::StrategyConfig& config
    );

    // Quote amount for a new entry: trade_amount_percent of balance, capped by max_trade_amount
    static double entryNotional(double balance, const strategy::StrategyConfig& config);

    // Advance the cooldown clock for an exit the manager did not decide (stop-loss / take-profit).
    void noteTrade(TimestampMs timestamp);

    std::optional<TimestampMs> lastTradeTimestamp() const { return last_trade_timestamp_; }
    const RejectionStats& rejectionStats() const { return rejections_; }
    std::optional<RejectReason> lastRejectReason() const { return last_reject_reason_; }
    void reset();

private:
    std::optional<RiskDecision> reject(RejectReason reason, const strategy::Signal& signal);

    std::optional<TimestampMs> last_trade_timestamp_;
    std::optional<RejectReason> last_reject_reason_;
    RejectionStats rejections_;
};

} // namespace risk
} // namespace crosstrade
