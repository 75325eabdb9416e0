#include "core/state/EventJournalJsonl.h"
#include "engine/SessionJournal.h"

#include <filesystem>
#include <fstream>
#include <iostream>

int main() {
    using namespace crosstrade::core;

    const auto path = std::filesystem::path("test_data/test_event_journal.jsonl");
    std::error_code ec;
    std::filesystem::remove(path, ec);

    {
        EventJournalJsonl journal(path);

        JournalEvent first;
        first.ts_ms = 1000;
        first.type = JournalEventType::SIGNAL_EMITTED;
        first.symbol = "BTC/USDT";
        first.entity_id = "sig-1000";
        first.payload["confidence"] = 82.0;

        JournalEvent second;
        second.ts_ms = 2000;
        second.type = JournalEventType::POSITION_OPENED;
        second.symbol = "BTC/USDT";
        second.entity_id = "pos-2000";
        second.payload["quantity"] = 0.01;

        if (!journal.append(first)) {
            std::cerr << "[TEST] append(first) failed\n";
            return 1;
        }
        if (!journal.append(second)) {
            std::cerr << "[TEST] append(second) failed\n";
            return 1;
        }
        if (journal.lastSeq() != 2) {
            std::cerr << "[TEST] lastSeq should be 2, got " << journal.lastSeq() << "\n";
            return 1;
        }
    }

    // A garbage line must not break reopening or reading
    {
        std::ofstream out(path, std::ios::app);
        out << "{not json\n";
    }

    EventJournalJsonl reopened(path);
    if (reopened.lastSeq() != 2) {
        std::cerr << "[TEST] reopened lastSeq should be 2, got " << reopened.lastSeq() << "\n";
        return 1;
    }

    const auto rows = reopened.readFrom(2);
    if (rows.size() != 1) {
        std::cerr << "[TEST] readFrom(2) should return one row, got " << rows.size() << "\n";
        return 1;
    }
    if (rows.front().type != JournalEventType::POSITION_OPENED || rows.front().symbol != "BTC/USDT") {
        std::cerr << "[TEST] unexpected row: " << EventJournalJsonl::toString(rows.front().type)
                  << " " << rows.front().symbol << "\n";
        return 1;
    }
    if (rows.front().payload.value("quantity", 0.0) != 0.01) {
        std::cerr << "[TEST] payload lost\n";
        return 1;
    }

    for (auto type : {JournalEventType::SIGNAL_EMITTED, JournalEventType::SIGNAL_REJECTED,
                      JournalEventType::ORDER_FILLED, JournalEventType::ORDER_FAILED,
                      JournalEventType::POSITION_OPENED, JournalEventType::POSITION_CLOSED}) {
        if (EventJournalJsonl::fromString(EventJournalJsonl::toString(type)) != type) {
            std::cerr << "[TEST] type name mismatch\n";
            return 1;
        }
    }

    // Typed session rows on top of the same file
    {
        using crosstrade::engine::SessionJournal;
        namespace risk = crosstrade::risk;

        SessionJournal detached(nullptr, "BTC/USDT");
        if (detached.enabled()) {
            std::cerr << "[TEST] null sink should disable the session journal\n";
            return 1;
        }

        crosstrade::IndicatorPoint point;
        point.timestamp = 3000;
        point.ema_short = 101.0;
        point.ema_long = 100.0;
        point.rsi = 55.0;
        const crosstrade::strategy::Signal signal(3000, crosstrade::Direction::BUY,
                                                  crosstrade::SignalStrength::MODERATE, 70.0, 101.5,
                                                  point, "ema cross up", "BTC/USDT");
        detached.recordSignal(signal);
        if (reopened.lastSeq() != 2) {
            std::cerr << "[TEST] detached journal wrote a row\n";
            return 1;
        }

        SessionJournal btc(&reopened, "BTC/USDT");
        SessionJournal eth(&reopened, "ETH/USDT");
        btc.recordSignal(signal);
        btc.recordRejection(signal, risk::RejectReason::COOLDOWN);

        risk::Trade trade;
        trade.symbol = "BTC/USDT";
        trade.entry_timestamp = 3000;
        trade.entry_price = 101.5;
        trade.quantity = 0.25;
        trade.exit_timestamp = 9000;
        trade.exit_price = 110.0;
        trade.exit_reason = crosstrade::ExitReason::TAKE_PROFIT;
        trade.profit_loss = 2.125;
        trade.profit_loss_pct = 8.374384236453203;
        btc.recordPositionClosed(trade);

        risk::Trade other = trade;
        other.symbol = "ETH/USDT";
        eth.recordPositionClosed(other);

        const auto rows = reopened.readFrom(3);
        if (rows.size() != 4 || reopened.lastSeq() != 6) {
            std::cerr << "[TEST] expected 4 session rows, got " << rows.size() << "\n";
            return 1;
        }
        if (rows[0].entity_id != SessionJournal::signalId(3000) || rows[1].entity_id != rows[0].entity_id) {
            std::cerr << "[TEST] signal rows should share one entity id\n";
            return 1;
        }
        if (rows[0].payload.value("rsi", 0.0) != 55.0 ||
            rows[1].payload.value("reason", std::string()) != "cooldown") {
            std::cerr << "[TEST] signal payloads lost\n";
            return 1;
        }
        if (rows[2].entity_id != SessionJournal::positionId(3000) || rows[2].ts_ms != 9000) {
            std::cerr << "[TEST] closed row keyed wrong: " << rows[2].entity_id << "\n";
            return 1;
        }

        const auto trades = SessionJournal::closedTrades(rows, "BTC/USDT");
        if (trades.size() != 1 || trades[0].exit_reason != crosstrade::ExitReason::TAKE_PROFIT ||
            trades[0].entry_timestamp != 3000 || trades[0].exit_price != 110.0 ||
            trades[0].profit_loss_pct != trade.profit_loss_pct) {
            std::cerr << "[TEST] closed trade not rebuilt from the journal\n";
            return 1;
        }
    }

    std::filesystem::remove(path, ec);
    std::cout << "[TEST] EventJournal PASSED\n";
    return 0;
}
