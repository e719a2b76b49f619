#include "engine/SessionMetrics.h"

#include <algorithm>
#include <cmath>

namespace scalpengine {
namespace engine {

SessionMetrics::SessionMetrics(size_t history_capacity)
    : history_capacity_(std::max<size_t>(1, history_capacity))
{
}

void SessionMetrics::recordTrade(const TradeRecord& trade) {
    std::lock_guard<std::mutex> lock(mutex_);

    stats_.total_trades++;
    stats_.total_realized_pnl += trade.pnl;
    stats_.daily_realized_pnl += trade.pnl;

    if (trade.pnl > 0.0) {
        stats_.wins++;
        stats_.gross_profit += trade.pnl;
        stats_.current_streak = stats_.current_streak > 0 ? stats_.current_streak + 1 : 1;
        stats_.longest_win_streak = std::max(stats_.longest_win_streak, stats_.current_streak);
    } else if (trade.pnl < 0.0) {
        stats_.losses++;
        stats_.gross_loss_abs += std::abs(trade.pnl);
        stats_.current_streak = stats_.current_streak < 0 ? stats_.current_streak - 1 : -1;
        stats_.longest_loss_streak = std::max(stats_.longest_loss_streak, -stats_.current_streak);
    } else {
        // 본전 거래는 연속 기록을 끊음
        stats_.current_streak = 0;
    }

    history_.push_back(trade);
    while (history_.size() > history_capacity_) {
        history_.pop_front();
    }
}

void SessionMetrics::resetDaily() {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.daily_realized_pnl = 0.0;
}

SessionStats SessionMetrics::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

std::vector<TradeRecord> SessionMetrics::recentTrades() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<TradeRecord>(history_.begin(), history_.end());
}

} // namespace engine
} // namespace scalpengine
