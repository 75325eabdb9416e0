#include "core/state/EventJournalJsonl.h"
#include "common/Logger.h"

#include <algorithm>
#include <fstream>

namespace crosstrade {
namespace core {

namespace {
std::uint64_t parseSeq(const nlohmann::json& line) {
    return line.value("seq", static_cast<std::uint64_t>(0));
}
}

EventJournalJsonl::EventJournalJsonl(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        try {
            nlohmann::json line = nlohmann::json::parse(row);
            last_seq_ = (std::max)(last_seq_, parseSeq(line));
        } catch (const nlohmann::json::exception& e) {
            LOG_WARN("Skipping malformed journal line in {}: {}", file_path_.string(), e.what());
        }
    }
}

bool EventJournalJsonl::append(const JournalEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (file_path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(file_path_.parent_path(), ec);
    }
    std::ofstream out(file_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        LOG_WARN("Event journal open failed: {}", file_path_.string());
        return false;
    }

    const std::uint64_t next_seq = last_seq_ + 1;
    nlohmann::json line;
    line["seq"] = next_seq;
    line["ts_ms"] = event.ts_ms;
    line["type"] = toString(event.type);
    line["symbol"] = event.symbol;
    line["entity_id"] = event.entity_id;
    line["payload"] = event.payload.is_null() ? nlohmann::json::object() : event.payload;

    out << line.dump() << "\n";
    if (!out) {
        return false;
    }
    last_seq_ = next_seq;
    return true;
}

std::vector<JournalEvent> EventJournalJsonl::readFrom(std::uint64_t seq_inclusive) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<JournalEvent> out;
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return out;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }

        nlohmann::json line;
        try {
            line = nlohmann::json::parse(row);
        } catch (const nlohmann::json::exception&) {
            continue;
        }

        const auto seq = parseSeq(line);
        if (seq < seq_inclusive) {
            continue;
        }

        JournalEvent event;
        event.seq = seq;
        event.ts_ms = line.value("ts_ms", 0LL);
        event.type = fromString(line.value("type", std::string("SIGNAL_EMITTED")));
        event.symbol = line.value("symbol", std::string());
        event.entity_id = line.value("entity_id", std::string());
        event.payload = line.value("payload", nlohmann::json::object());
        out.push_back(std::move(event));
    }

    return out;
}

std::uint64_t EventJournalJsonl::lastSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_;
}

std::string EventJournalJsonl::toString(JournalEventType type) {
    switch (type) {
        case JournalEventType::SIGNAL_EMITTED: return "SIGNAL_EMITTED";
        case JournalEventType::SIGNAL_REJECTED: return "SIGNAL_REJECTED";
        case JournalEventType::ORDER_FILLED: return "ORDER_FILLED";
        case JournalEventType::ORDER_FAILED: return "ORDER_FAILED";
        case JournalEventType::POSITION_OPENED: return "POSITION_OPENED";
        case JournalEventType::POSITION_CLOSED: return "POSITION_CLOSED";
    }
    return "SIGNAL_EMITTED";
}

JournalEventType EventJournalJsonl::fromString(const std::string& value) {
    if (value == "SIGNAL_EMITTED") return JournalEventType::SIGNAL_EMITTED;
    if (value == "SIGNAL_REJECTED") return JournalEventType::SIGNAL_REJECTED;
    if (value == "ORDER_FILLED") return JournalEventType::ORDER_FILLED;
    if (value == "ORDER_FAILED") return JournalEventType::ORDER_FAILED;
    if (value == "POSITION_OPENED") return JournalEventType::POSITION_OPENED;
    if (value == "POSITION_CLOSED") return JournalEventType::POSITION_CLOSED;
    return JournalEventType::SIGNAL_EMITTED;
}

} // namespace core
} // namespace crosstrade
