#include "risk/RiskManager.h"

#include <atomic>
#include <chrono>
#include <cmath>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace scalpengine;

namespace {
bool nearly(double a, double b) { return std::abs(a - b) < 1e-6; }
}

int main() {
    risk::RiskConfig config;
    config.initial_capital = 100000.0;
    config.max_concurrent_positions = 3;

    // 사이징
    {
        risk::RiskManager risk(config);
        if (!nearly(risk.positionNotional(0.9), 5000.0) || !nearly(risk.positionNotional(0.3), 3000.0)) {
            std::cerr << "[TEST] notional should be min(5% cap, capital * conf * 0.1)\n";
            return 1;
        }
        if (!nearly(risk.getDailyLossLimit(), 2000.0)) {
            std::cerr << "[TEST] default daily loss limit should be 2% of capital\n";
            return 1;
        }
    }

    // 일일 손실 한도 도달 후에는 신뢰도와 무관하게 거부
    {
        risk::RiskManager risk(config);
        risk.recordRealizedPnl(1500.0);
        risk.recordRealizedPnl(-1200.0);
        if (risk.isDailyLossLimitReached()) {
            std::cerr << "[TEST] gains must not offset losses, but 1200 < 2000\n";
            return 1;
        }
        risk.recordRealizedPnl(-800.0);
        if (!nearly(risk.getCurrentDailyLoss(), 2000.0) || !risk.isDailyLossLimitReached()) {
            std::cerr << "[TEST] daily loss should reach the limit at 2000\n";
            return 1;
        }
        auto rejected = risk.tryAdmitAndReserve("AAPL");
        if (rejected.admitted || rejected.reason != "daily loss limit reached") {
            std::cerr << "[TEST] entry should be rejected at the loss limit\n";
            return 1;
        }

        risk.resetDaily();
        if (risk.getCurrentDailyLoss() != 0.0 || !risk.tryAdmitAndReserve("AAPL").admitted) {
            std::cerr << "[TEST] resetDaily should re-open admissions\n";
            return 1;
        }
        if (!nearly(risk.getRiskState().capital, 99500.0)) {
            std::cerr << "[TEST] capital should track realized pnl\n";
            return 1;
        }
    }

    // 예약/확정/해제와 동시 포지션 한도
    {
        risk::RiskManager risk(config);
        if (!risk.tryAdmitAndReserve("AAPL").admitted || !risk.tryAdmitAndReserve("MSFT").admitted) {
            std::cerr << "[TEST] first admissions should succeed\n";
            return 1;
        }
        if (risk.tryAdmitAndReserve("AAPL").admitted) {
            std::cerr << "[TEST] duplicate symbol should be rejected while reserved\n";
            return 1;
        }
        if (!risk.commitReservation("AAPL") || risk.commitReservation("TSLA")) {
            std::cerr << "[TEST] commit should require a reservation\n";
            return 1;
        }
        if (!risk.tryAdmitAndReserve("NVDA").admitted) {
            std::cerr << "[TEST] third slot should be admitted\n";
            return 1;
        }
        auto full = risk.tryAdmitAndReserve("AMD");
        if (full.admitted || full.reason != "max concurrent positions reached") {
            std::cerr << "[TEST] reserved slots should count against the limit\n";
            return 1;
        }
        risk.releaseReservation("MSFT");
        if (!risk.tryAdmitAndReserve("AMD").admitted) {
            std::cerr << "[TEST] released slot should be reusable\n";
            return 1;
        }
        risk.onPositionClosed("AAPL");
        auto state = risk.getRiskState();
        if (state.open_positions != 0 || state.reserved_positions != 2 || risk.hasSymbol("AAPL")) {
            std::cerr << "[TEST] unexpected slot state after close\n";
            return 1;
        }
    }

    // 동시 승인 경쟁: 한도 이상 승인되지 않음
    {
        risk::RiskManager risk(config);
        std::atomic<int> admitted{0};
        std::atomic<int> same_symbol{0};
        std::vector<std::thread> threads;
        for (int i = 0; i < 16; ++i) {
            threads.emplace_back([&, i] {
                if (risk.tryAdmitAndReserve("SYM" + std::to_string(i)).admitted) {
                    ++admitted;
                }
                if (risk.tryAdmitAndReserve("SAME").admitted) {
                    ++same_symbol;
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }
        if (admitted + same_symbol != 3 || same_symbol > 1) {
            std::cerr << "[TEST] concurrent admissions exceeded limits: " << admitted << " + " << same_symbol << "\n";
            return 1;
        }
    }

    // UTC 날짜 경계
    {
        risk::RiskManager risk(config);
        risk.recordRealizedPnl(-500.0);
        const auto now = std::chrono::system_clock::now();
        if (risk.rollDailyBoundaryIfNeeded(now) && risk.getCurrentDailyLoss() != 0.0) {
            std::cerr << "[TEST] roll on the same day must not happen\n";
            return 1;
        }
        const auto tomorrow = now + std::chrono::hours(24);
        if (!risk.rollDailyBoundaryIfNeeded(tomorrow) || risk.getCurrentDailyLoss() != 0.0) {
            std::cerr << "[TEST] next UTC day should reset daily loss\n";
            return 1;
        }
        if (risk.rollDailyBoundaryIfNeeded(tomorrow)) {
            std::cerr << "[TEST] roll should happen once per day\n";
            return 1;
        }
    }

    std::cout << "[TEST] RiskManager PASSED\n";
    return 0;
}
