#include "engine/PositionManager.h"
#include "FakeBroker.h"
#include "MemoryJournal.h"

#include <atomic>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

using namespace scalpengine;
using core::execution::PositionState;
using engine::ExitReason;
using testing::FakeBroker;
using testing::MemoryJournal;

namespace {
bool nearly(double a, double b, double eps = 1e-6) { return std::abs(a - b) < eps; }

struct Fixture {
    std::shared_ptr<FakeBroker> broker = std::make_shared<FakeBroker>();
    std::shared_ptr<market::SeriesStore> store = std::make_shared<market::SeriesStore>(1000);
    std::shared_ptr<risk::RiskManager> risk;
    std::shared_ptr<engine::SessionMetrics> metrics = std::make_shared<engine::SessionMetrics>();
    std::shared_ptr<MemoryJournal> journal = std::make_shared<MemoryJournal>();
    std::shared_ptr<engine::PositionManager> manager;

    explicit Fixture(engine::LifecycleConfig lifecycle = engine::LifecycleConfig()) {
        execution::ExecutionConfig exec;
        exec.max_attempts = 1;
        exec.base_backoff_ms = 1;
        exec.fill_timeout_ms = 50;
        exec.fill_poll_interval_ms = 5;
        auto executor = std::make_shared<execution::OrderExecutor>(broker, exec);
        risk = std::make_shared<risk::RiskManager>(risk::RiskConfig());
        manager = std::make_shared<engine::PositionManager>(
            executor, risk, store, nullptr, metrics, journal, lifecycle);
    }
};

Signal buySignal(const std::string& symbol, double price, double target, double stop) {
    Signal s;
    s.symbol = symbol;
    s.action = SignalAction::BUY;
    s.confidence = 0.8;
    s.price = price;
    s.volatility = 0.06;
    s.target_profit = target;
    s.stop_loss = stop;
    s.timestamp = std::chrono::system_clock::now();
    return s;
}
}

int main() {
    // 매수 100 진입, 목표 0.3% / 손절 0.2%
    {
        Fixture f;
        f.broker->setFillPrice("AAPL", 100.0);
        auto entry = f.manager->openPosition(buySignal("AAPL", 100.0, 0.003, 0.002));
        if (!entry.opened || !entry.position || entry.position->state != PositionState::OPEN) {
            std::cerr << "[TEST] entry should open: " << entry.reason << "\n";
            return 1;
        }
        // 자본 10만 * min(5%, 0.8 * 0.1) = 5000 -> 50주
        if (!nearly(entry.position->quantity, 50.0) || !nearly(entry.position->target_price, 100.3) ||
            !nearly(entry.position->stop_price, 99.8)) {
            std::cerr << "[TEST] unexpected sizing or levels\n";
            return 1;
        }
        if (!f.risk->hasSymbol("AAPL") || f.risk->getRiskState().open_positions != 1) {
            std::cerr << "[TEST] reservation should be committed\n";
            return 1;
        }

        f.store->record("AAPL", 100.2, 1000.0);
        if (!f.manager->evaluateExits(std::chrono::system_clock::now()).empty()) {
            std::cerr << "[TEST] 100.2 should not trigger an exit\n";
            return 1;
        }

        f.store->record("AAPL", 100.3, 1000.0);
        f.broker->setFillPrice("AAPL", 100.3);
        auto exits = f.manager->evaluateExits(std::chrono::system_clock::now());
        if (exits.size() != 1 || exits[0].reason != ExitReason::PROFIT_TARGET || !exits[0].closed) {
            std::cerr << "[TEST] 100.3 should close on PROFIT_TARGET\n";
            return 1;
        }
        if (!f.journal->sawTransition("AAPL", "EXIT_REQUESTED", "PROFIT_TARGET") ||
            !f.journal->sawTransition("AAPL", "CLOSED")) {
            std::cerr << "[TEST] journal should show EXIT_REQUESTED then CLOSED\n";
            return 1;
        }
        if (!nearly(exits[0].realized_pnl, 15.0) || f.manager->hasPosition("AAPL") || f.risk->hasSymbol("AAPL")) {
            std::cerr << "[TEST] closed position should free its slot, pnl " << exits[0].realized_pnl << "\n";
            return 1;
        }
        auto stats = f.manager->metrics();
        if (stats.total_trades != 1 || stats.wins != 1) {
            std::cerr << "[TEST] trade should be recorded as a win\n";
            return 1;
        }
    }

    // 손절
    {
        Fixture f;
        f.manager->openPosition(buySignal("MSFT", 100.0, 0.003, 0.002));
        f.store->record("MSFT", 99.8, 1000.0);
        f.broker->setFillPrice("MSFT", 99.8);
        auto exits = f.manager->evaluateExits(std::chrono::system_clock::now());
        if (exits.size() != 1 || exits[0].reason != ExitReason::STOP_LOSS || exits[0].realized_pnl >= 0.0) {
            std::cerr << "[TEST] 99.8 should close on STOP_LOSS\n";
            return 1;
        }
        if (!f.journal->sawTransition("MSFT", "EXIT_REQUESTED", "STOP_LOSS")) {
            std::cerr << "[TEST] journal should record STOP_LOSS exit request\n";
            return 1;
        }
        if (!nearly(f.risk->getCurrentDailyLoss(), 10.0)) {
            std::cerr << "[TEST] loss should feed the daily loss counter\n";
            return 1;
        }
    }

    // 순수 판정: 매도 방향, 보유 시간, 변동성 붕괴
    {
        Fixture f;
        engine::Position short_pos;
        short_pos.symbol = "TSLA";
        short_pos.side = OrderSide::SELL;
        short_pos.entry_price = 200.0;
        short_pos.target_price = engine::PositionManager::targetPriceFor(OrderSide::SELL, 200.0, 0.005);
        short_pos.stop_price = engine::PositionManager::stopPriceFor(OrderSide::SELL, 200.0, 0.003);
        short_pos.state = PositionState::OPEN;
        const auto now = std::chrono::system_clock::now();
        short_pos.entry_time = now;

        if (f.manager->checkExit(short_pos, 199.0, std::nullopt, now) != ExitReason::PROFIT_TARGET ||
            f.manager->checkExit(short_pos, 200.6, std::nullopt, now) != ExitReason::STOP_LOSS ||
            f.manager->checkExit(short_pos, 200.1, std::nullopt, now) != ExitReason::NONE) {
            std::cerr << "[TEST] sell-side levels are mirrored\n";
            return 1;
        }
        if (f.manager->checkExit(short_pos, 200.1, std::nullopt, now + std::chrono::seconds(901)) !=
            ExitReason::TIME_LIMIT) {
            std::cerr << "[TEST] holding past 900s should exit on TIME_LIMIT\n";
            return 1;
        }
        if (f.manager->checkExit(short_pos, 200.1, 0.005, now) != ExitReason::VOLATILITY_COLLAPSE) {
            std::cerr << "[TEST] losing position with collapsed volatility should exit\n";
            return 1;
        }
        if (f.manager->checkExit(short_pos, 199.9, 0.005, now) != ExitReason::NONE) {
            std::cerr << "[TEST] volatility collapse applies only when underwater\n";
            return 1;
        }
    }

    // 트레일링 스탑은 조이기만 함
    {
        Fixture f;
        f.manager->openPosition(buySignal("NVDA", 100.0, 0.05, 0.002));
        f.store->record("NVDA", 101.5, 1000.0);
        f.manager->evaluateExits(std::chrono::system_clock::now());
        auto raised = f.manager->position("NVDA");
        if (!raised || !nearly(raised->stop_price, 101.5 * 0.995)) {
            std::cerr << "[TEST] stop should trail to 0.5% below 101.5\n";
            return 1;
        }
        f.store->record("NVDA", 101.2, 1000.0);
        f.manager->evaluateExits(std::chrono::system_clock::now());
        if (!nearly(f.manager->position("NVDA")->stop_price, 101.5 * 0.995)) {
            std::cerr << "[TEST] trailing stop must never loosen\n";
            return 1;
        }
        f.store->record("NVDA", 100.9, 1000.0);
        f.broker->setFillPrice("NVDA", 100.9);
        auto exits = f.manager->evaluateExits(std::chrono::system_clock::now());
        if (exits.size() != 1 || exits[0].reason != ExitReason::STOP_LOSS || exits[0].realized_pnl <= 0.0) {
            std::cerr << "[TEST] trailed stop should lock in profit\n";
            return 1;
        }
    }

    // 동일 종목 동시 진입은 하나만
    {
        Fixture f;
        std::atomic<int> opened{0};
        std::vector<std::thread> threads;
        for (int i = 0; i < 8; ++i) {
            threads.emplace_back([&] {
                if (f.manager->openPosition(buySignal("AMD", 100.0, 0.003, 0.002)).opened) {
                    ++opened;
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }
        if (opened != 1 || f.broker->submit_calls != 1 || f.manager->openCount() != 1) {
            std::cerr << "[TEST] concurrent same-symbol entries opened " << opened << "\n";
            return 1;
        }
    }

    // 진입 실패 -> FAILED, 예약 해제
    {
        Fixture f;
        f.broker->submit_failures = {ErrorKind::InsufficientFunds};
        auto entry = f.manager->openPosition(buySignal("META", 100.0, 0.003, 0.002));
        if (entry.opened || entry.kind != ErrorKind::InsufficientFunds || f.manager->hasPosition("META")) {
            std::cerr << "[TEST] failed entry should not leave a position\n";
            return 1;
        }
        if (f.risk->hasSymbol("META") || !f.journal->sawTransition("META", "FAILED")) {
            std::cerr << "[TEST] failed entry should release its reservation\n";
            return 1;
        }
        if (f.journal->ofType(core::JournalEventType::ORDER_FAILED).size() != 1) {
            std::cerr << "[TEST] failed entry should be journaled\n";
            return 1;
        }
    }

    // 진입 타임아웃 + 취소 실패 -> 고아 보고, 슬롯 유지, 대사에서 인수
    {
        Fixture f;
        f.broker->fill_mode = FakeBroker::FillMode::NEVER_FILL;
        f.broker->cancel_failure = ErrorKind::ConnectionError;
        auto entry = f.manager->openPosition(buySignal("NFLX", 100.0, 0.003, 0.002));
        if (entry.opened || entry.kind != ErrorKind::OrderTimeout || f.manager->hasPosition("NFLX")) {
            std::cerr << "[TEST] unconfirmed entry should not open a position\n";
            return 1;
        }
        if (!f.risk->hasSymbol("NFLX")) {
            std::cerr << "[TEST] unconfirmed entry must keep its risk slot\n";
            return 1;
        }
        auto orphans = f.manager->takeOrphans();
        if (orphans.size() != 1 || orphans[0].state != PositionState::FAILED ||
            orphans[0].order_id != f.broker->submitted.at(0).order_id) {
            std::cerr << "[TEST] unconfirmed entry should be reported as an orphan\n";
            return 1;
        }
        auto retry = f.manager->openPosition(buySignal("NFLX", 100.0, 0.003, 0.002));
        if (retry.opened || retry.reason != "symbol busy" || f.broker->submit_calls != 1) {
            std::cerr << "[TEST] symbol with an unconfirmed entry must not be entered again\n";
            return 1;
        }

        // 브로커에서 늦게 체결됨
        BrokerPosition late;
        late.symbol = "NFLX";
        late.quantity = 50.0;
        late.avg_entry_price = 100.5;
        auto report = f.manager->reconcile({late});
        auto adopted = f.manager->position("NFLX");
        if (!adopted || adopted->state != PositionState::OPEN || !nearly(adopted->quantity, 50.0) ||
            !nearly(adopted->entry_price, 100.5) || !nearly(adopted->target_price, 100.5 * 1.003)) {
            std::cerr << "[TEST] late fill should be adopted as an open position\n";
            return 1;
        }
        if (!report.inSync() || f.risk->getRiskState().open_positions != 1 ||
            f.risk->getRiskState().reserved_positions != 0) {
            std::cerr << "[TEST] adopted position should hold a committed slot\n";
            return 1;
        }
    }

    // 미확인 진입인데 브로커 포지션 없음 -> 대사에서 슬롯 해제
    {
        Fixture f;
        f.broker->fill_mode = FakeBroker::FillMode::NEVER_FILL;
        f.broker->cancel_failure = ErrorKind::ConnectionError;
        f.manager->openPosition(buySignal("INTC", 30.0, 0.003, 0.002));
        if (!f.risk->hasSymbol("INTC")) {
            std::cerr << "[TEST] unconfirmed entry must keep its risk slot\n";
            return 1;
        }
        f.manager->reconcile({});
        if (f.risk->hasSymbol("INTC") || f.manager->hasPosition("INTC")) {
            std::cerr << "[TEST] reconciliation without a broker position should release the slot\n";
            return 1;
        }
        f.broker->fill_mode = FakeBroker::FillMode::FILL;
        f.broker->setFillPrice("INTC", 30.0);
        if (!f.manager->openPosition(buySignal("INTC", 30.0, 0.003, 0.002)).opened) {
            std::cerr << "[TEST] released symbol should be enterable again\n";
            return 1;
        }
    }

    // 청산 연속 실패 -> 고아 포지션
    {
        Fixture f;
        f.manager->openPosition(buySignal("AMZN", 100.0, 0.003, 0.002));
        f.broker->submit_failures = {ErrorKind::InvalidRequest, ErrorKind::InvalidRequest, ErrorKind::InvalidRequest};

        for (int attempt = 1; attempt <= 2; ++attempt) {
            auto out = f.manager->closePosition("AMZN", ExitReason::MANUAL);
            auto pos = f.manager->position("AMZN");
            if (out.closed || out.abandoned || !pos || pos->state != PositionState::OPEN ||
                pos->exit_failures != attempt) {
                std::cerr << "[TEST] failed exit should return to OPEN for retry\n";
                return 1;
            }
        }
        auto last = f.manager->closePosition("AMZN", ExitReason::MANUAL);
        if (!last.abandoned || f.manager->hasPosition("AMZN") || f.risk->hasSymbol("AMZN")) {
            std::cerr << "[TEST] third failure should abandon the position\n";
            return 1;
        }
        auto orphans = f.manager->takeOrphans();
        if (orphans.size() != 1 || orphans[0].state != PositionState::FAILED || !f.manager->takeOrphans().empty()) {
            std::cerr << "[TEST] abandoned position should be reported once as an orphan\n";
            return 1;
        }
    }

    // 정수 주 사이징
    {
        engine::LifecycleConfig whole;
        whole.allow_fractional = false;
        Fixture f(whole);
        auto entry = f.manager->openPosition(buySignal("SPY", 333.0, 0.003, 0.002));
        if (!entry.opened || !nearly(entry.position->quantity, 15.0)) {
            std::cerr << "[TEST] whole-share sizing should floor 5000/333 to 15\n";
            return 1;
        }
    }

    // 대사
    {
        Fixture f;
        f.manager->openPosition(buySignal("AAPL", 100.0, 0.003, 0.002));
        f.manager->openPosition(buySignal("QQQ", 100.0, 0.003, 0.002));

        BrokerPosition aapl;
        aapl.symbol = "AAPL";
        aapl.quantity = 50.0;
        BrokerPosition qqq;
        qqq.symbol = "QQQ";
        qqq.quantity = 40.0;
        BrokerPosition stray;
        stray.symbol = "GOOGL";
        stray.quantity = -3.0;

        auto report = f.manager->reconcile({aapl, qqq, stray});
        if (report.positions_checked != 3 || report.driftCount() != 2 || report.inSync()) {
            std::cerr << "[TEST] expected 2 drifts over 3 symbols, got " << report.driftCount() << "\n";
            return 1;
        }
        bool saw_mismatch = false;
        bool saw_missing_local = false;
        for (const auto& entry : report.entries) {
            if (entry.symbol == "QQQ" && entry.status == core::ReconciliationStatus::QUANTITY_MISMATCH) {
                saw_mismatch = true;
            }
            if (entry.symbol == "GOOGL" && entry.status == core::ReconciliationStatus::MISSING_LOCAL) {
                saw_missing_local = true;
            }
        }
        if (!saw_mismatch || !saw_missing_local ||
            f.journal->ofType(core::JournalEventType::RECONCILIATION).empty()) {
            std::cerr << "[TEST] reconcile should classify drifts and journal them\n";
            return 1;
        }
    }

    std::cout << "[TEST] PositionManager PASSED\n";
    return 0;
}
