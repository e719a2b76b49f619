#include "core/state/EventJournalJsonl.h"

#include <filesystem>
#include <fstream>
#include <iostream>

int main() {
    const auto path = std::filesystem::path("test_logs/test_event_journal.jsonl");
    std::error_code ec;
    std::filesystem::remove(path, ec);

    using scalpengine::core::EventJournalJsonl;
    using scalpengine::core::JournalEvent;
    using scalpengine::core::JournalEventType;

    {
        EventJournalJsonl journal(path);

        JournalEvent first;
        first.ts_ms = 1000;
        first.type = JournalEventType::ORDER_SUBMITTED;
        first.symbol = "AAPL";
        first.entity_id = "order-1";
        first.payload["price"] = 187.25;

        JournalEvent second;
        second.ts_ms = 2000;
        second.type = JournalEventType::TRADE_CLOSED;
        second.symbol = "AAPL";
        second.entity_id = "order-2";
        second.payload["pnl"] = -3.5;

        if (!journal.append(first) || !journal.append(second)) {
            std::cerr << "[TEST] append failed\n";
            return 1;
        }
        if (journal.lastSeq() != 2) {
            std::cerr << "[TEST] lastSeq should be 2, got " << journal.lastSeq() << "\n";
            return 1;
        }

        const auto rows = journal.readFrom(2);
        if (rows.size() != 1 || rows.front().type != JournalEventType::TRADE_CLOSED ||
            rows.front().symbol != "AAPL" || rows.front().payload.value("pnl", 0.0) != -3.5) {
            std::cerr << "[TEST] readFrom(2) should return only the trade\n";
            return 1;
        }
    }

    // 깨진 줄이 있어도 재시작 시 마지막 seq 부터 이어감
    {
        std::ofstream out(path, std::ios::app);
        out << "{not json\n";
    }
    {
        EventJournalJsonl reopened(path);
        if (reopened.lastSeq() != 2) {
            std::cerr << "[TEST] reopened journal should resume at seq 2\n";
            return 1;
        }

        JournalEvent halted;
        halted.ts_ms = 3000;
        halted.type = JournalEventType::LOOP_HALTED;
        halted.payload["loop"] = "ingest";
        if (!reopened.append(halted) || reopened.lastSeq() != 3) {
            std::cerr << "[TEST] append after reopen should get seq 3\n";
            return 1;
        }

        const auto all = reopened.readFrom(1);
        if (all.size() != 3 || all.back().type != JournalEventType::LOOP_HALTED) {
            std::cerr << "[TEST] corrupt line should be skipped when reading\n";
            return 1;
        }
    }

    std::cout << "[TEST] EventJournal PASSED\n";
    return 0;
}
