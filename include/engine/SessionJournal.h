#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/contracts/IEventJournal.h"
#include "core/contracts/IExecutionAdapter.h"
#include "risk/RiskManager.h"
#include "strategy/Signal.h"

namespace crosstrade {
namespace engine {

// Typed writer over an IEventJournal for one symbol's session events.
// A null sink turns every record* call into a no-op; append failures are
// logged and never thrown.
class SessionJournal {
public:
    SessionJournal(core::IEventJournal* sink, std::string symbol);

    bool enabled() const { return sink_ != nullptr; }

    void recordSignal(const strategy::Signal& signal);
    void recordRejection(const strategy::Signal& signal, std::optional<risk::RejectReason> reason);
    void recordFill(TimestampMs ts, const core::Fill& fill);
    void recordOrderFailure(TimestampMs ts, const std::string& entity_id, Direction direction,
                            double quantity, double price, const std::string& error);
    void recordPositionOpened(const risk::Position& position);
    void recordPositionClosed(const risk::Trade& trade);

    // Entity ids shared by the rows of one signal / one position
    static std::string signalId(TimestampMs signal_ts);
    static std::string positionId(TimestampMs open_ts);

    // Rebuild closed trades from POSITION_CLOSED rows, in journal order.
    // Rows for other symbols are skipped.
    static std::vector<risk::Trade> closedTrades(const std::vector<core::JournalEvent>& events,
                                                 const std::string& symbol);

private:
    void write(core::JournalEventType type, TimestampMs ts,
               const std::string& entity_id, nlohmann::json payload);

    core::IEventJournal* sink_;
    std::string symbol_;
};

} // namespace engine
} // namespace crosstrade
