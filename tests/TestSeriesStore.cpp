#include "market/SeriesStore.h"

#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

using namespace scalpengine;

int main() {
    market::SeriesStore store(5);

    if (store.size("AAPL") != 0 || store.latest("AAPL").has_value()) {
        std::cerr << "[TEST] empty store should have no samples\n";
        return 1;
    }

    for (int i = 1; i <= 8; ++i) {
        store.record("AAPL", 100.0 + i, 1000.0 * i);
    }
    if (store.size("AAPL") != 5) {
        std::cerr << "[TEST] capacity should cap buffer at 5, got " << store.size("AAPL") << "\n";
        return 1;
    }

    const auto all = store.window("AAPL", 10);
    if (all.size() != 5 || all.front().price != 104.0 || all.back().price != 108.0) {
        std::cerr << "[TEST] oldest samples should be evicted first\n";
        return 1;
    }

    const auto tail = store.window("AAPL", 2);
    if (tail.size() != 2 || tail[0].volume != 7000.0 || tail[1].volume != 8000.0) {
        std::cerr << "[TEST] window(2) should return the newest two in time order\n";
        return 1;
    }

    // 바 적재: 이미 저장된 시각 이전 바는 무시
    market::SeriesStore bars_store(100);
    std::vector<Bar> bars;
    for (int i = 0; i < 3; ++i) {
        Bar bar;
        bar.timestamp = 60000LL * (i + 1);
        bar.close = 50.0 + i;
        bar.volume = 10.0;
        bars.push_back(bar);
    }
    if (bars_store.recordBars("MSFT", bars) != 3) {
        std::cerr << "[TEST] first recordBars should add 3\n";
        return 1;
    }
    Bar next;
    next.timestamp = 240000LL;
    next.close = 53.0;
    next.volume = 12.0;
    bars.push_back(next);
    if (bars_store.recordBars("MSFT", bars) != 1) {
        std::cerr << "[TEST] overlapping recordBars should add only the new bar\n";
        return 1;
    }
    if (bars_store.latest("MSFT")->price != 53.0) {
        std::cerr << "[TEST] latest price should be 53\n";
        return 1;
    }

    // 동시 기록/조회
    market::SeriesStore shared(1000);
    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&shared, t] {
            for (int i = 0; i < 200; ++i) {
                shared.record("SYM" + std::to_string(t), 10.0 + i, 1.0);
                shared.window("SYM" + std::to_string((t + 1) % 4), 20);
            }
        });
    }
    for (auto& w : writers) {
        w.join();
    }
    if (shared.symbols().size() != 4 || shared.size("SYM0") != 200) {
        std::cerr << "[TEST] concurrent writers lost samples\n";
        return 1;
    }

    std::cout << "[TEST] SeriesStore PASSED\n";
    return 0;
}
