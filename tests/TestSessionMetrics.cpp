#include "engine/SessionMetrics.h"

#include <cassert>
#include <cmath>
#include <iostream>

using scalpengine::engine::SessionMetrics;
using scalpengine::engine::TradeRecord;

namespace {
TradeRecord trade(double pnl) {
    TradeRecord t;
    t.symbol = "AAPL";
    t.pnl = pnl;
    return t;
}
}

int main() {
    SessionMetrics metrics(3);

    metrics.recordTrade(trade(10.0));
    metrics.recordTrade(trade(20.0));
    metrics.recordTrade(trade(-5.0));
    metrics.recordTrade(trade(-5.0));
    metrics.recordTrade(trade(-10.0));

    auto stats = metrics.snapshot();
    assert(stats.total_trades == 5);
    assert(stats.wins == 2);
    assert(stats.losses == 3);
    assert(stats.current_streak == -3);
    assert(stats.longest_win_streak == 2);
    assert(stats.longest_loss_streak == 3);
    assert(std::abs(stats.total_realized_pnl - 10.0) < 1e-9);
    assert(std::abs(stats.winRate() - 0.4) < 1e-9);
    assert(std::abs(stats.expectancy() - 2.0) < 1e-9);
    assert(std::abs(stats.profitFactor() - 1.5) < 1e-9);

    // 본전 거래는 연속 기록을 끊지만 승/패에는 포함되지 않음
    metrics.recordTrade(trade(0.0));
    stats = metrics.snapshot();
    assert(stats.current_streak == 0);
    assert(stats.total_trades == 6);
    assert(stats.wins + stats.losses == 5);

    // 최근 거래 기록은 용량만큼만 유지
    auto recent = metrics.recentTrades();
    assert(recent.size() == 3);
    assert(recent.back().pnl == 0.0);

    metrics.resetDaily();
    stats = metrics.snapshot();
    assert(stats.daily_realized_pnl == 0.0);
    assert(std::abs(stats.total_realized_pnl - 10.0) < 1e-9);

    std::cout << "[TEST] SessionMetrics PASSED\n";
    return 0;
}
