#include "risk/RiskManager.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>

namespace scalpengine {
namespace risk {

RiskManager::RiskManager(RiskConfig config)
    : config_(config)
    , capital_(config.initial_capital)
    , daily_loss_limit_(0.0)
    , current_day_index_(dayIndex(std::chrono::system_clock::now()))
{
    daily_loss_limit_ = computeDailyLossLimit();
    LOG_INFO("RiskManager 초기화 - 자본: {:.2f}, 최대 포지션: {}, 일일 손실 한도: {:.2f}",
             capital_, config_.max_concurrent_positions, daily_loss_limit_);
}

AdmissionResult RiskManager::tryAdmitAndReserve(const std::string& symbol) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    
    AdmissionResult result;
    
    // 1) 일일 손실 한도
    if (current_daily_loss_ >= daily_loss_limit_) {
        result.reason = "daily loss limit reached";
        LOG_WARN("{} 진입 거부: 일일 손실 한도 도달 ({:.2f}/{:.2f})",
                 symbol, current_daily_loss_, daily_loss_limit_);
        return result;
    }
    
    // 2) 동일 종목 중복
    if (open_.count(symbol) > 0 || reserved_.count(symbol) > 0) {
        result.reason = "position already exists for symbol";
        LOG_WARN("{} 진입 거부: 이미 포지션(또는 진행 중 주문) 존재", symbol);
        return result;
    }
    
    // 3) 동시 포지션 수
    const int in_use = static_cast<int>(open_.size() + reserved_.size());
    if (in_use >= config_.max_concurrent_positions) {
        result.reason = "max concurrent positions reached";
        LOG_WARN("{} 진입 거부: 최대 포지션 도달 ({}/{})", symbol, in_use, config_.max_concurrent_positions);
        return result;
    }
    
    reserved_.insert(symbol);
    result.admitted = true;
    result.reason = "admitted";
    return result;
}

bool RiskManager::commitReservation(const std::string& symbol) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (reserved_.erase(symbol) == 0) {
        LOG_ERROR("{} 예약 없이 진입 확정 시도", symbol);
        return false;
    }
    open_.insert(symbol);
    return true;
}

void RiskManager::releaseReservation(const std::string& symbol) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    reserved_.erase(symbol);
}

void RiskManager::onPositionClosed(const std::string& symbol) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    open_.erase(symbol);
    reserved_.erase(symbol);
}

void RiskManager::recordRealizedPnl(double pnl) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    
    realized_pnl_today_ += pnl;
    capital_ += pnl;
    
    if (pnl < 0.0) {
        current_daily_loss_ += std::abs(pnl);
        if (current_daily_loss_ >= daily_loss_limit_) {
            LOG_ERROR("일일 손실 한도 도달: {:.2f}/{:.2f} - 신규 진입 차단",
                      current_daily_loss_, daily_loss_limit_);
        }
    }
}

void RiskManager::resetDaily() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    LOG_INFO("일일 리스크 초기화 (전일 손실 {:.2f}, 실현 손익 {:.2f})",
             current_daily_loss_, realized_pnl_today_);
    current_daily_loss_ = 0.0;
    realized_pnl_today_ = 0.0;
    daily_loss_limit_ = computeDailyLossLimit();
}

bool RiskManager::rollDailyBoundaryIfNeeded(Timestamp now) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const long long today = dayIndex(now);
    if (today == current_day_index_) {
        return false;
    }
    current_day_index_ = today;
    resetDaily();
    return true;
}

double RiskManager::positionNotional(double confidence) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const double clamped = std::max(0.0, std::min(1.0, confidence));
    const double cap = capital_ * config_.max_position_pct;
    return std::max(0.0, std::min(cap, capital_ * clamped * config_.confidence_size_factor));
}

void RiskManager::resetCapital(double actual_balance) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (actual_balance <= 0.0) {
        LOG_WARN("자본 동기화 무시: 잔고 {:.2f}", actual_balance);
        return;
    }
    capital_ = actual_balance;
    LOG_INFO("자산 동기화 완료: RiskManager 자본금 재설정 -> {:.2f}", actual_balance);
}

RiskManager::RiskState RiskManager::getRiskState() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    RiskState state;
    state.current_daily_loss = current_daily_loss_;
    state.daily_loss_limit = daily_loss_limit_;
    state.max_concurrent_positions = config_.max_concurrent_positions;
    state.open_positions = static_cast<int>(open_.size());
    state.reserved_positions = static_cast<int>(reserved_.size());
    state.realized_pnl_today = realized_pnl_today_;
    state.capital = capital_;
    return state;
}

double RiskManager::getCurrentDailyLoss() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return current_daily_loss_;
}

double RiskManager::getDailyLossLimit() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return daily_loss_limit_;
}

bool RiskManager::isDailyLossLimitReached() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return current_daily_loss_ >= daily_loss_limit_;
}

bool RiskManager::hasSymbol(const std::string& symbol) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return open_.count(symbol) > 0 || reserved_.count(symbol) > 0;
}

long long RiskManager::dayIndex(Timestamp ts) {
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
    // 음수 epoch 도 내림 처리
    return secs >= 0 ? secs / 86400 : (secs - 86399) / 86400;
}

double RiskManager::computeDailyLossLimit() const {
    if (config_.daily_loss_limit > 0.0) {
        return config_.daily_loss_limit;
    }
    return capital_ * config_.daily_loss_limit_pct;
}

} // namespace risk
} // namespace scalpengine
