#include "engine/LiveSession.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <spdlog/fmt/fmt.h>

namespace crosstrade {
namespace engine {

LiveSession::LiveSession(
    const EngineConfig& config,
    const strategy::StrategyConfig& strategy_config,
    core::IExecutionAdapter& execution,
    core::IEventJournal* journal
)
    : config_(config)
    , strategy_config_(strategy_config)
    , execution_(execution)
    , journal_(journal, config.symbol)
    , pipeline_(strategy_config)
    , generator_(strategy_config, config.symbol)
    , state_(backtest::Flat{})
    , cash_(config.initial_balance)
    , bars_processed_(0)
{
    strategy_config_.validate();
    if (!(config_.initial_balance > 0.0)) {
        throw InvalidConfigError("initial_balance must be positive");
    }
    if (config_.fee_rate < 0.0 || config_.fee_rate >= 1.0) {
        throw InvalidConfigError("fee_rate must be within [0, 1)");
    }
    LOG_INFO("Live session ready: {} {} (EMA {}/{}, RSI {}, balance {:.2f})",
             config_.symbol, toString(config_.timeframe),
             strategy_config_.ema_short_period, strategy_config_.ema_long_period,
             strategy_config_.rsi_period, cash_);
}

bool LiveSession::inPosition() const {
    return std::holds_alternative<backtest::InPosition>(state_);
}

double LiveSession::equity(double mark_price) const {
    if (const auto* held = std::get_if<backtest::InPosition>(&state_)) {
        return cash_ + held->position.quantity * mark_price;
    }
    return cash_;
}

LiveStepOutcome LiveSession::onBar(const Bar& bar) {
    LiveStepOutcome outcome;
    outcome.indicators = pipeline_.update(bar);
    ++bars_processed_;

    // 1. Protective exits against the bar's range
    bool exited_this_bar = false;
    if (const auto* held = std::get_if<backtest::InPosition>(&state_)) {
        const risk::Position& pos = held->position;
        if (bar.low <= pos.stop_loss) {
            const double fill_price = (bar.open <= pos.stop_loss) ? bar.open : pos.stop_loss;
            exited_this_bar = executeExit(fill_price, ExitReason::STOP_LOSS, bar, outcome);
        } else if (bar.high >= pos.take_profit) {
            const double fill_price = (bar.open >= pos.take_profit) ? bar.open : pos.take_profit;
            exited_this_bar = executeExit(fill_price, ExitReason::TAKE_PROFIT, bar, outcome);
        }
        if (exited_this_bar) {
            risk_manager_.noteTrade(bar.timestamp);
        }
    }

    if (!outcome.indicators) {
        return outcome;
    }

    // 2. Crossover signal
    outcome.signal = generator_.onIndicatorPoint(*outcome.indicators, bar.close);
    if (!outcome.signal) {
        return outcome;
    }
    const strategy::Signal& signal = *outcome.signal;
    journal_.recordSignal(signal);

    if (exited_this_bar || !outcome.ok()) {
        return outcome;
    }

    // 3. Risk gate
    const auto* held = std::get_if<backtest::InPosition>(&state_);
    outcome.decision = risk_manager_.evaluate(signal, strategy_config_,
                                              held ? &held->position : nullptr, cash_);
    if (!outcome.decision) {
        journal_.recordRejection(signal, risk_manager_.lastRejectReason());
        return outcome;
    }

    // 4. Execution
    if (outcome.decision->action == risk::RiskAction::ENTER_LONG) {
        executeEntry(*outcome.decision, signal, bar, outcome);
    } else {
        executeExit(outcome.decision->price, ExitReason::SIGNAL, bar, outcome);
    }
    return outcome;
}

bool LiveSession::executeEntry(const risk::RiskDecision& decision, const strategy::Signal& signal,
                               const Bar& bar, LiveStepOutcome& outcome) {
    const double notional = std::min(decision.notional, cash_ / (1.0 + config_.fee_rate));
    const double quantity = notional / decision.price;

    core::Fill fill;
    try {
        fill = execution_.placeOrder(Direction::BUY, quantity, decision.price);
    } catch (const ExecutionError& e) {
        outcome.error = e.what();
        LOG_ERROR("{} entry order failed: {}", config_.symbol, e.what());
        journal_.recordOrderFailure(bar.timestamp, SessionJournal::signalId(signal.timestamp()),
                                    Direction::BUY, quantity, decision.price, e.what());
        return false;
    }

    // Protective levels follow the actual fill, not the signal price
    const auto levels = risk::RiskManager::protectiveLevels(fill.price, Direction::BUY, strategy_config_);

    backtest::InPosition next;
    next.position.symbol = config_.symbol;
    next.position.open_timestamp = bar.timestamp;
    next.position.entry_price = fill.price;
    next.position.quantity = fill.quantity;
    next.position.invested_amount = fill.price * fill.quantity;
    next.position.direction = Direction::BUY;
    next.position.stop_loss = levels.stop_loss;
    next.position.take_profit = levels.take_profit;
    next.position.entry_fee = fill.fee;
    next.position.signal_confidence = signal.confidence();

    cash_ -= next.position.invested_amount + fill.fee;
    outcome.fill = fill;

    journal_.recordFill(bar.timestamp, fill);
    journal_.recordPositionOpened(next.position);

    state_ = std::move(next);
    return true;
}

bool LiveSession::executeExit(double price, ExitReason reason, const Bar& bar, LiveStepOutcome& outcome) {
    const auto* held = std::get_if<backtest::InPosition>(&state_);
    if (held == nullptr) {
        return false;
    }
    const risk::Position pos = held->position;

    core::Fill fill;
    try {
        fill = execution_.placeOrder(Direction::SELL, pos.quantity, price);
    } catch (const ExecutionError& e) {
        outcome.error = e.what();
        LOG_ERROR("{} exit order ({}) failed: {}", config_.symbol, toString(reason), e.what());
        journal_.recordOrderFailure(bar.timestamp, SessionJournal::positionId(pos.open_timestamp),
                                    Direction::SELL, pos.quantity, price,
                                    fmt::format("{} exit: {}", toString(reason), e.what()));
        return false;
    }

    const double proceeds = fill.price * fill.quantity;

    risk::Trade trade;
    trade.symbol = pos.symbol;
    trade.entry_timestamp = pos.open_timestamp;
    trade.entry_price = pos.entry_price;
    trade.quantity = fill.quantity;
    trade.direction = pos.direction;
    trade.stop_loss = pos.stop_loss;
    trade.take_profit = pos.take_profit;
    trade.exit_timestamp = bar.timestamp;
    trade.exit_price = fill.price;
    trade.exit_reason = reason;
    trade.fee_paid = pos.entry_fee + fill.fee;
    trade.profit_loss = proceeds - fill.fee - (pos.invested_amount + pos.entry_fee);
    trade.profit_loss_pct = pos.invested_amount > 0.0
        ? trade.profit_loss / pos.invested_amount * 100.0
        : 0.0;

    cash_ += proceeds - fill.fee;
    trades_.push_back(trade);
    outcome.fill = fill;
    outcome.closed_trade = trade;

    Logger::getInstance().logTrade(config_.symbol, toString(reason), pos.entry_price, fill.price,
                                   fill.quantity, trade.profit_loss);
    journal_.recordFill(bar.timestamp, fill);
    journal_.recordPositionClosed(trade);

    state_ = backtest::Flat{};
    return true;
}

} // namespace engine
} // namespace crosstrade
