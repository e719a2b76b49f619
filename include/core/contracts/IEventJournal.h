#pragma once

#include <cstdint>
#include <vector>

#include "core/model/JournalTypes.h"

namespace scalpengine {
namespace core {

class IEventJournal {
public:
    virtual ~IEventJournal() = default;

    // seq 는 저널이 부여 (event.seq 는 무시)
    virtual bool append(const JournalEvent& event) = 0;
    virtual std::vector<JournalEvent> readFrom(std::uint64_t seq_inclusive) = 0;
    virtual std::uint64_t lastSeq() const = 0;
};

} // namespace core
} // namespace scalpengine
