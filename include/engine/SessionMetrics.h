#pragma once

#include "common/Types.h"
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace scalpengine {
namespace engine {

struct TradeRecord {
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    double entry_price = 0.0;
    double exit_price = 0.0;
    double quantity = 0.0;
    double pnl = 0.0;
    std::string exit_reason;
    Timestamp entry_time{};
    Timestamp exit_time{};
};

struct SessionStats {
    int total_trades = 0;
    int wins = 0;
    int losses = 0;
    int current_streak = 0;        // 양수: 연승, 음수: 연패
    int longest_win_streak = 0;
    int longest_loss_streak = 0;
    double daily_realized_pnl = 0.0;
    double total_realized_pnl = 0.0;
    double gross_profit = 0.0;
    double gross_loss_abs = 0.0;

    double winRate() const {
        return (total_trades > 0) ? (static_cast<double>(wins) / static_cast<double>(total_trades)) : 0.0;
    }
    double expectancy() const {
        return (total_trades > 0) ? (total_realized_pnl / static_cast<double>(total_trades)) : 0.0;
    }
    double profitFactor() const {
        return (gross_loss_abs > 1e-12) ? (gross_profit / gross_loss_abs) : 0.0;
    }
};

// 세션 단위 청산 거래 통계
class SessionMetrics {
public:
    explicit SessionMetrics(size_t history_capacity = 500);

    void recordTrade(const TradeRecord& trade);
    void resetDaily();

    SessionStats snapshot() const;
    std::vector<TradeRecord> recentTrades() const;

private:
    SessionStats stats_;
    std::deque<TradeRecord> history_;
    size_t history_capacity_;
    mutable std::mutex mutex_;
};

} // namespace engine
} // namespace scalpengine
