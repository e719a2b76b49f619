#include "core/state/EventJournalJsonl.h"
#include "common/Logger.h"

#include <algorithm>
#include <array>
#include <utility>

namespace scalpengine {
namespace core {

namespace {

constexpr std::array<std::pair<JournalEventType, const char*>, 10> kEventNames = {{
    {JournalEventType::SIGNAL_EMITTED, "SIGNAL_EMITTED"},
    {JournalEventType::CONSENSUS_COMPUTED, "CONSENSUS_COMPUTED"},
    {JournalEventType::ENTRY_REJECTED, "ENTRY_REJECTED"},
    {JournalEventType::ORDER_SUBMITTED, "ORDER_SUBMITTED"},
    {JournalEventType::ORDER_FAILED, "ORDER_FAILED"},
    {JournalEventType::POSITION_STATE_CHANGED, "POSITION_STATE_CHANGED"},
    {JournalEventType::TRADE_CLOSED, "TRADE_CLOSED"},
    {JournalEventType::RECONCILIATION, "RECONCILIATION"},
    {JournalEventType::DAILY_RESET, "DAILY_RESET"},
    {JournalEventType::LOOP_HALTED, "LOOP_HALTED"},
}};

} // namespace

const char* toString(JournalEventType type) {
    for (const auto& [value, name] : kEventNames) {
        if (value == type) {
            return name;
        }
    }
    return "POSITION_STATE_CHANGED";
}

JournalEventType journalEventTypeFromString(const std::string& value) {
    for (const auto& [type, name] : kEventNames) {
        if (value == name) {
            return type;
        }
    }
    return JournalEventType::POSITION_STATE_CHANGED;
}

nlohmann::json EventJournalJsonl::toJson(const JournalEvent& event) {
    return {
        {"seq", event.seq},
        {"ts_ms", event.ts_ms},
        {"type", toString(event.type)},
        {"symbol", event.symbol},
        {"entity_id", event.entity_id},
        {"payload", event.payload}
    };
}

bool EventJournalJsonl::fromJson(const nlohmann::json& line, JournalEvent& event) {
    if (!line.is_object() || !line.contains("seq") || !line["seq"].is_number_unsigned()) {
        return false;
    }
    event.seq = line["seq"].get<std::uint64_t>();
    event.ts_ms = line.value("ts_ms", 0LL);
    event.type = journalEventTypeFromString(line.value("type", std::string()));
    event.symbol = line.value("symbol", std::string());
    event.entity_id = line.value("entity_id", std::string());
    event.payload = line.value("payload", nlohmann::json::object());
    return true;
}

EventJournalJsonl::EventJournalJsonl(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return;
    }

    int skipped = 0;
    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        JournalEvent event;
        const auto parsed = nlohmann::json::parse(row, nullptr, false);
        if (parsed.is_discarded() || !fromJson(parsed, event)) {
            ++skipped;
            continue;
        }
        last_seq_ = std::max(last_seq_, event.seq);
    }
    if (skipped > 0) {
        LOG_WARN("저널 {} - 읽을 수 없는 줄 {}개 무시", file_path_.string(), skipped);
    }
}

bool EventJournalJsonl::ensureWriterLocked() {
    if (writer_.is_open()) {
        return true;
    }
    std::error_code ec;
    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path(), ec);
    }
    writer_.open(file_path_, std::ios::binary | std::ios::app);
    if (!writer_.is_open()) {
        LOG_WARN("저널 파일 열기 실패: {}", file_path_.string());
        return false;
    }
    return true;
}

bool EventJournalJsonl::append(const JournalEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ensureWriterLocked()) {
        return false;
    }

    JournalEvent stamped = event;
    stamped.seq = last_seq_ + 1;
    writer_ << toJson(stamped).dump() << '\n';
    writer_.flush();
    if (!writer_) {
        // 다음 append 에서 다시 열도록 닫음
        writer_.close();
        writer_.clear();
        return false;
    }
    last_seq_ = stamped.seq;
    return true;
}

std::vector<JournalEvent> EventJournalJsonl::readFrom(std::uint64_t seq_inclusive) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<JournalEvent> events;
    std::ifstream in(file_path_, std::ios::binary);
    std::string row;
    while (in && std::getline(in, row)) {
        const auto parsed = nlohmann::json::parse(row, nullptr, false);
        JournalEvent event;
        if (parsed.is_discarded() || !fromJson(parsed, event) || event.seq < seq_inclusive) {
            continue;
        }
        events.push_back(std::move(event));
    }
    return events;
}

std::uint64_t EventJournalJsonl::lastSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_;
}

} // namespace core
} // namespace scalpengine
