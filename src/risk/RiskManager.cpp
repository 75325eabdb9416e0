#include "risk/RiskManager.h"
#include "common/Logger.h"
#include <algorithm>

namespace crosstrade {
namespace risk {

const char* toString(RejectReason reason) {
    switch (reason) {
        case RejectReason::LOW_CONFIDENCE: return "low_confidence";
        case RejectReason::COOLDOWN: return "cooldown";
        case RejectReason::POSITION_ALREADY_OPEN: return "position_already_open";
        case RejectReason::NO_POSITION_TO_EXIT: return "no_position_to_exit";
        case RejectReason::INSUFFICIENT_BALANCE: return "insufficient_balance";
    }
    return "unknown";
}

const char* toString(RiskAction action) {
    return action == RiskAction::ENTER_LONG ? "enter_long" : "exit_long";
}

// ===== Gate =====

std::optional<RiskDecision> RiskManager::evaluate(
    const strategy::Signal& signal,
    const strategy::StrategyConfig& config,
    const Position* open_position,
    double balance
) {
    // 1) confidence
    if (signal.confidence() < config.min_confidence) {
        return reject(RejectReason::LOW_CONFIDENCE, signal);
    }

    // 2) cooldown
    if (last_trade_timestamp_) {
        // Whole seconds elapsed
        const long long elapsed_ms = signal.timestamp() - *last_trade_timestamp_;
        if (elapsed_ms < 0 || elapsed_ms / 1000LL < config.min_time_between_trades) {
            return reject(RejectReason::COOLDOWN, signal);
        }
    }

    RiskDecision decision;
    decision.timestamp = signal.timestamp();
    decision.price = signal.referencePrice();

    // 3) position state
    if (signal.direction() == Direction::BUY) {
        if (open_position != nullptr) {
            return reject(RejectReason::POSITION_ALREADY_OPEN, signal);
        }

        const double notional = entryNotional(balance, config);
        if (notional <= 0.0 || decision.price <= 0.0) {
            return reject(RejectReason::INSUFFICIENT_BALANCE, signal);
        }

        const auto levels = protectiveLevels(decision.price, Direction::BUY, config);
        decision.action = RiskAction::ENTER_LONG;
        decision.notional = notional;
        decision.quantity = notional / decision.price;
        decision.stop_loss = levels.stop_loss;
        decision.take_profit = levels.take_profit;
    } else {
        // Sell while FLAT would be a short entry; long-only engine ignores it.
        if (open_position == nullptr) {
            return reject(RejectReason::NO_POSITION_TO_EXIT, signal);
        }

        decision.action = RiskAction::EXIT_LONG;
        decision.quantity = open_position->quantity;
        decision.notional = open_position->quantity * decision.price;
    }

    last_trade_timestamp_ = signal.timestamp();
    last_reject_reason_.reset();

    LOG_INFO("{} {} accepted: qty {:.8f} @ {:.8f} (conf {:.1f}, SL {:.8f}, TP {:.8f})",
             signal.symbol(), toString(decision.action), decision.quantity, decision.price,
             signal.confidence(), decision.stop_loss, decision.take_profit);
    return decision;
}

std::optional<RiskDecision> RiskManager::reject(RejectReason reason, const strategy::Signal& signal) {
    switch (reason) {
        case RejectReason::LOW_CONFIDENCE: rejections_.low_confidence++; break;
        case RejectReason::COOLDOWN: rejections_.cooldown++; break;
        case RejectReason::POSITION_ALREADY_OPEN: rejections_.position_already_open++; break;
        case RejectReason::NO_POSITION_TO_EXIT: rejections_.no_position_to_exit++; break;
        case RejectReason::INSUFFICIENT_BALANCE: rejections_.insufficient_balance++; break;
    }
    last_reject_reason_ = reason;

    LOG_DEBUG("{} {} signal rejected: {} (conf {:.1f})",
              signal.symbol(), toString(signal.direction()), toString(reason), signal.confidence());
    return std::nullopt;
}

// ===== Sizing / protective levels =====

ProtectiveLevels RiskManager::protectiveLevels(
    double entry_price,
    Direction direction,
    const strategy::StrategyConfig& config
) {
    const double sl = config.stop_loss_percent / 100.0;
    const double tp = config.take_profit_percent / 100.0;

    ProtectiveLevels levels;
    if (direction == Direction::BUY) {
        levels.stop_loss = entry_price * (1.0 - sl);
        levels.take_profit = entry_price * (1.0 + tp);
    } else {
        levels.stop_loss = entry_price * (1.0 + sl);
        levels.take_profit = entry_price * (1.0 - tp);
    }
    return levels;
}

double RiskManager::entryNotional(double balance, const strategy::StrategyConfig& config) {
    if (balance <= 0.0) {
        return 0.0;
    }
    double notional = balance * (config.trade_amount_percent / 100.0);
    if (config.max_trade_amount) {
        notional = std::min(notional, *config.max_trade_amount);
    }
    return notional;
}

void RiskManager::noteTrade(TimestampMs timestamp) {
    last_trade_timestamp_ = timestamp;
}

void RiskManager::reset() {
    last_trade_timestamp_.reset();
    last_reject_reason_.reset();
    rejections_ = RejectionStats();
}

} // namespace risk
} // namespace crosstrade
