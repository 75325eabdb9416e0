#include "engine/SessionJournal.h"
#include "common/Logger.h"

#include <spdlog/fmt/fmt.h>

namespace crosstrade {
namespace engine {

namespace {
ExitReason exitReasonFromString(const std::string& value) {
    if (value == "stop_loss") return ExitReason::STOP_LOSS;
    if (value == "take_profit") return ExitReason::TAKE_PROFIT;
    if (value == "end_of_data") return ExitReason::END_OF_DATA;
    return ExitReason::SIGNAL;
}
}

SessionJournal::SessionJournal(core::IEventJournal* sink, std::string symbol)
    : sink_(sink)
    , symbol_(std::move(symbol))
{}

std::string SessionJournal::signalId(TimestampMs signal_ts) {
    return fmt::format("sig-{}", signal_ts);
}

std::string SessionJournal::positionId(TimestampMs open_ts) {
    return fmt::format("pos-{}", open_ts);
}

void SessionJournal::recordSignal(const strategy::Signal& signal) {
    write(core::JournalEventType::SIGNAL_EMITTED, signal.timestamp(), signalId(signal.timestamp()), {
        {"direction", toString(signal.direction())},
        {"strength", toString(signal.strength())},
        {"confidence", signal.confidence()},
        {"price", signal.referencePrice()},
        {"ema_short", signal.indicators().ema_short},
        {"ema_long", signal.indicators().ema_long},
        {"rsi", signal.indicators().rsi},
        {"message", signal.message()}
    });
}

void SessionJournal::recordRejection(const strategy::Signal& signal,
                                     std::optional<risk::RejectReason> reason) {
    write(core::JournalEventType::SIGNAL_REJECTED, signal.timestamp(), signalId(signal.timestamp()), {
        {"direction", toString(signal.direction())},
        {"reason", reason ? risk::toString(*reason) : "unknown"}
    });
}

void SessionJournal::recordFill(TimestampMs ts, const core::Fill& fill) {
    write(core::JournalEventType::ORDER_FILLED, ts, fill.order_id, {
        {"direction", toString(fill.direction)},
        {"quantity", fill.quantity},
        {"price", fill.price},
        {"fee", fill.fee}
    });
}

void SessionJournal::recordOrderFailure(TimestampMs ts, const std::string& entity_id, Direction direction,
                                        double quantity, double price, const std::string& error) {
    write(core::JournalEventType::ORDER_FAILED, ts, entity_id, {
        {"direction", toString(direction)},
        {"quantity", quantity},
        {"price", price},
        {"error", error}
    });
}

void SessionJournal::recordPositionOpened(const risk::Position& position) {
    write(core::JournalEventType::POSITION_OPENED, position.open_timestamp,
          positionId(position.open_timestamp), {
              {"entry_price", position.entry_price},
              {"quantity", position.quantity},
              {"stop_loss", position.stop_loss},
              {"take_profit", position.take_profit},
              {"entry_fee", position.entry_fee}
          });
}

void SessionJournal::recordPositionClosed(const risk::Trade& trade) {
    write(core::JournalEventType::POSITION_CLOSED, trade.exit_timestamp,
          positionId(trade.entry_timestamp), {
              {"entry_ts", trade.entry_timestamp},
              {"entry_price", trade.entry_price},
              {"quantity", trade.quantity},
              {"stop_loss", trade.stop_loss},
              {"take_profit", trade.take_profit},
              {"exit_price", trade.exit_price},
              {"reason", toString(trade.exit_reason)},
              {"profit_loss", trade.profit_loss},
              {"profit_loss_pct", trade.profit_loss_pct},
              {"fee_paid", trade.fee_paid}
          });
}

std::vector<risk::Trade> SessionJournal::closedTrades(const std::vector<core::JournalEvent>& events,
                                                      const std::string& symbol) {
    std::vector<risk::Trade> trades;
    for (const auto& event : events) {
        if (event.type != core::JournalEventType::POSITION_CLOSED || event.symbol != symbol) {
            continue;
        }
        const auto& p = event.payload;

        risk::Trade trade;
        trade.symbol = event.symbol;
        trade.entry_timestamp = p.value("entry_ts", 0LL);
        trade.entry_price = p.value("entry_price", 0.0);
        trade.quantity = p.value("quantity", 0.0);
        trade.stop_loss = p.value("stop_loss", 0.0);
        trade.take_profit = p.value("take_profit", 0.0);
        trade.exit_timestamp = event.ts_ms;
        trade.exit_price = p.value("exit_price", 0.0);
        trade.exit_reason = exitReasonFromString(p.value("reason", std::string("signal")));
        trade.profit_loss = p.value("profit_loss", 0.0);
        trade.profit_loss_pct = p.value("profit_loss_pct", 0.0);
        trade.fee_paid = p.value("fee_paid", 0.0);
        trades.push_back(trade);
    }
    return trades;
}

void SessionJournal::write(core::JournalEventType type, TimestampMs ts,
                           const std::string& entity_id, nlohmann::json payload) {
    if (sink_ == nullptr) {
        return;
    }
    core::JournalEvent event;
    event.ts_ms = ts;
    event.type = type;
    event.symbol = symbol_;
    event.entity_id = entity_id;
    event.payload = std::move(payload);
    if (!sink_->append(event)) {
        LOG_WARN("Journal append failed for {} ({})", entity_id, symbol_);
    }
}

} // namespace engine
} // namespace crosstrade
