#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>

#include "core/contracts/IEventJournal.h"

namespace scalpengine {
namespace core {

// 한 줄에 이벤트 하나 (JSON Lines). 재시작 시 마지막 seq 부터 이어감
class EventJournalJsonl : public IEventJournal {
public:
    explicit EventJournalJsonl(std::filesystem::path file_path);

    bool append(const JournalEvent& event) override;
    std::vector<JournalEvent> readFrom(std::uint64_t seq_inclusive) override;
    std::uint64_t lastSeq() const override;

    const std::filesystem::path& path() const { return file_path_; }

    // 이벤트 <-> 저널 한 줄
    static nlohmann::json toJson(const JournalEvent& event);
    static bool fromJson(const nlohmann::json& line, JournalEvent& event);

private:
    std::filesystem::path file_path_;
    std::ofstream writer_;          // 첫 append 때 열림
    mutable std::mutex mutex_;
    std::uint64_t last_seq_ = 0;

    bool ensureWriterLocked();
};

} // namespace core
} // namespace scalpengine
