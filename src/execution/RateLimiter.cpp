#include "execution/RateLimiter.h"
#include "common/Logger.h"
#include <algorithm>

namespace scalpengine {
namespace execution {

RateLimiter::RateLimiter(RateLimitConfig config)
    : config_(config)
    , stopped_(false)
    , is_blocked_(false)
    , total_requests_(0)
    , rejected_requests_(0)
    , forced_waits_(0)
    , total_wait_time_(std::chrono::milliseconds(0))
{
    if (config_.max_calls <= 0) {
        config_.max_calls = 1;
    }
    LOG_INFO("RateLimiter 초기화 - {}회 / {}ms 슬라이딩 윈도우",
             config_.max_calls, config_.window.count());
}

bool RateLimiter::tryAcquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    
    if (stopped_) {
        return false;
    }
    
    auto now = Clock::now();
    
    // 1. 차단 상태 확인
    if (is_blocked_) {
        if (now < block_end_time_) {
            rejected_requests_++;
            return false;
        }
        is_blocked_ = false;
        LOG_INFO("API 일시정지 해제 (TryAcquire)");
        cv_.notify_all();
    }
    
    // 2. 윈도우 정리 후 슬롯 확인
    pruneExpired(now);
    if (static_cast<int>(calls_.size()) < config_.max_calls) {
        calls_.push_back(now);
        total_requests_++;
        return true;
    }
    
    rejected_requests_++;
    return false;
}

bool RateLimiter::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    
    bool waited = false;
    auto wait_start = Clock::now();
    
    while (true) {
        if (stopped_) {
            return false;
        }
        
        auto now = Clock::now();
        
        // 1. 차단 상태면 풀릴 때까지 대기
        if (is_blocked_) {
            if (now < block_end_time_) {
                waited = true;
                cv_.wait_until(lock, block_end_time_);
                continue;
            }
            is_blocked_ = false;
        }
        
        // 2. 슬롯 확인
        pruneExpired(now);
        if (static_cast<int>(calls_.size()) < config_.max_calls) {
            calls_.push_back(now);
            total_requests_++;
            if (waited) {
                total_wait_time_ += std::chrono::duration_cast<std::chrono::milliseconds>(
                    Clock::now() - wait_start
                );
            }
            return true;
        }
        
        // 3. 가장 오래된 호출이 윈도우를 벗어나는 시점까지 대기
        if (!waited) {
            forced_waits_++;
            waited = true;
        }
        auto wake_time = calls_.front() + config_.window + std::chrono::milliseconds(1);
        cv_.wait_until(lock, wake_time);
    }
}

int RateLimiter::remaining() {
    std::unique_lock<std::mutex> lock(mutex_);
    pruneExpired(Clock::now());
    return std::max(0, config_.max_calls - static_cast<int>(calls_.size()));
}

void RateLimiter::handleRateLimitError(int retry_after_seconds) {
    std::unique_lock<std::mutex> lock(mutex_);
    
    const int pause = std::max(1, retry_after_seconds);
    LOG_WARN("429 Too Many Requests 발생! ({}초간 전체 일시정지)", pause);
    
    forced_waits_++;
    auto until = Clock::now() + std::chrono::seconds(pause);
    if (!is_blocked_ || until > block_end_time_) {
        block_end_time_ = until;
    }
    is_blocked_ = true;
    
    // acquire 대기자들이 새 종료 시각으로 다시 대기하도록
    cv_.notify_all();
}

void RateLimiter::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
    }
    cv_.notify_all();
}

bool RateLimiter::isStopped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stopped_;
}

RateLimiter::Stats RateLimiter::getStats() const {
    std::unique_lock<std::mutex> lock(mutex_);
    
    Stats stats;
    stats.total_requests = total_requests_;
    stats.rejected_requests = rejected_requests_;
    stats.forced_waits = forced_waits_;
    stats.total_wait_time = total_wait_time_;
    
    return stats;
}

void RateLimiter::pruneExpired(Clock::time_point now) {
    bool freed = false;
    while (!calls_.empty() && now - calls_.front() >= config_.window) {
        calls_.pop_front();
        freed = true;
    }
    if (freed) {
        cv_.notify_all();
    }
}

} // namespace execution
} // namespace scalpengine
