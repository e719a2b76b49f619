#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace scalpengine {
namespace core {

enum class JournalEventType {
    SIGNAL_EMITTED,
    CONSENSUS_COMPUTED,
    ENTRY_REJECTED,
    ORDER_SUBMITTED,
    ORDER_FAILED,
    POSITION_STATE_CHANGED,
    TRADE_CLOSED,
    RECONCILIATION,
    DAILY_RESET,
    LOOP_HALTED
};

const char* toString(JournalEventType type);
JournalEventType journalEventTypeFromString(const std::string& value);

struct JournalEvent {
    std::uint64_t seq = 0;
    long long ts_ms = 0;
    JournalEventType type = JournalEventType::POSITION_STATE_CHANGED;
    std::string symbol;
    std::string entity_id;
    nlohmann::json payload = nlohmann::json::object();
};

} // namespace core
} // namespace scalpengine
