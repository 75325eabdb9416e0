#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace crosstrade {
namespace core {

enum class JournalEventType {
    SIGNAL_EMITTED,
    SIGNAL_REJECTED,
    ORDER_FILLED,
    ORDER_FAILED,
    POSITION_OPENED,
    POSITION_CLOSED
};

struct JournalEvent {
    std::uint64_t seq = 0;
    long long ts_ms = 0;
    JournalEventType type = JournalEventType::SIGNAL_EMITTED;
    std::string symbol;
    std::string entity_id;
    nlohmann::json payload;
};

} // namespace core
} // namespace crosstrade
