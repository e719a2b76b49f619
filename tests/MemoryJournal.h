#pragma once

#include "core/contracts/IEventJournal.h"

#include <mutex>
#include <string>
#include <vector>

namespace scalpengine {
namespace testing {

// 메모리 저널 - 기록된 이벤트 검사용
class MemoryJournal : public core::IEventJournal {
public:
    bool append(const core::JournalEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        core::JournalEvent copy = event;
        copy.seq = ++last_seq_;
        events_.push_back(copy);
        return true;
    }

    std::vector<core::JournalEvent> readFrom(std::uint64_t seq_inclusive) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<core::JournalEvent> out;
        for (const auto& e : events_) {
            if (e.seq >= seq_inclusive) {
                out.push_back(e);
            }
        }
        return out;
    }

    std::uint64_t lastSeq() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_seq_;
    }

    std::vector<core::JournalEvent> ofType(core::JournalEventType type) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<core::JournalEvent> out;
        for (const auto& e : events_) {
            if (e.type == type) {
                out.push_back(e);
            }
        }
        return out;
    }

    // POSITION_STATE_CHANGED 중 symbol 이 to 상태로 간 기록이 있는지
    bool sawTransition(const std::string& symbol, const std::string& to, const std::string& note = "") const {
        for (const auto& e : ofType(core::JournalEventType::POSITION_STATE_CHANGED)) {
            if (e.symbol != symbol || e.payload.value("to", std::string()) != to) {
                continue;
            }
            if (note.empty() || e.payload.value("note", std::string()) == note) {
                return true;
            }
        }
        return false;
    }

private:
    mutable std::mutex mutex_;
    std::uint64_t last_seq_ = 0;
    std::vector<core::JournalEvent> events_;
};

} // namespace testing
} // namespace scalpengine
