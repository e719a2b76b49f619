#pragma once

#include "common/Types.h"
#include <map>
#include <mutex>
#include <set>
#include <string>

namespace scalpengine {
namespace risk {

struct RiskConfig {
    double initial_capital = 100000.0;
    int max_concurrent_positions = 10;
    double daily_loss_limit = 0.0;          // 절대값. 0 이면 daily_loss_limit_pct * 자본
    double daily_loss_limit_pct = 0.02;
    double max_position_pct = 0.05;         // 포지션당 최대 자본 비율
    double confidence_size_factor = 0.1;    // 자본 * 신뢰도 * factor
};

struct AdmissionResult {
    bool admitted = false;
    std::string reason;
};

// Risk Manager - 일일 손실/동시 포지션 한도 관리 및 진입 승인
class RiskManager {
public:
    explicit RiskManager(RiskConfig config);
    
    // ===== 진입 승인 =====
    
    // 한도 검사와 슬롯 예약을 한 번에 수행 (check-then-act 경쟁 방지)
    AdmissionResult tryAdmitAndReserve(const std::string& symbol);
    
    // 예약 -> 보유 전환 (진입 체결)
    bool commitReservation(const std::string& symbol);
    
    // 예약 해제 (진입 실패)
    void releaseReservation(const std::string& symbol);
    
    // 보유 슬롯 해제 (청산 완료 / 실패 제거)
    void onPositionClosed(const std::string& symbol);
    
    // ===== 손익 =====
    
    // 실현 손익 반영 - 손실이면 당일 손실 누적
    void recordRealizedPnl(double pnl);
    
    // 명시적 일일 초기화
    void resetDaily();
    
    // UTC 날짜가 바뀌었으면 resetDaily() 수행, 수행 여부 반환
    bool rollDailyBoundaryIfNeeded(Timestamp now);
    
    // ===== 포지션 사이징 =====
    
    double positionNotional(double confidence) const;
    
    // 계좌 동기화 시 자본 재설정
    void resetCapital(double actual_balance);
    
    // ===== 조회 =====
    
    struct RiskState {
        double current_daily_loss = 0.0;
        double daily_loss_limit = 0.0;
        int max_concurrent_positions = 0;
        int open_positions = 0;
        int reserved_positions = 0;
        double realized_pnl_today = 0.0;
        double capital = 0.0;
    };
    
    RiskState getRiskState() const;
    double getCurrentDailyLoss() const;
    double getDailyLossLimit() const;
    bool isDailyLossLimitReached() const;
    bool hasSymbol(const std::string& symbol) const;
    
private:
    RiskConfig config_;
    double capital_;
    double daily_loss_limit_;
    
    double current_daily_loss_ = 0.0;
    double realized_pnl_today_ = 0.0;
    long long current_day_index_;
    
    std::set<std::string> reserved_;
    std::set<std::string> open_;
    
    mutable std::recursive_mutex mutex_;
    
    static long long dayIndex(Timestamp ts);
    double computeDailyLossLimit() const;
};

} // namespace risk
} // namespace scalpengine
